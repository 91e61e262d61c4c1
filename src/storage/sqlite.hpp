#ifndef BLOBDEX_SQLITE_HPP
#define BLOBDEX_SQLITE_HPP

#include "config.hpp"
#include "keyvalue.hpp"

#include <sqlite3.h>

#include <deque>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <string>
#include <utility>
#include <vector>

namespace blobdex {

// Bumped whenever the rows/meta layout changes.
static constexpr int SQLITE_SCHEMA_VERSION = 1;

// WAL appeared in SQLite 3.7.0.
inline bool sqlite_wal_capable() {
    return sqlite3_libversion_number() >= 3007000;
}

inline std::vector<std::string> sqlite_create_tables() {
    return {
        "CREATE TABLE IF NOT EXISTS rows ("
        "k VARCHAR(767) NOT NULL PRIMARY KEY,"
        "v VARCHAR(63000))",

        "CREATE TABLE IF NOT EXISTS meta ("
        "metakey VARCHAR(255) NOT NULL PRIMARY KEY,"
        "value VARCHAR(255) NOT NULL)",
    };
}

class SQLiteKeyValue : public KeyValue, public Wiper {
    // The connection and the mutex serializing its use. Iterators share it
    // with the store; once the store closes it they report an error.
    struct Connection {
        ~Connection() {
            if (db != nullptr) {
                sqlite3_close(db);
            }
        }

        sqlite3* db = nullptr;
        std::mutex mu;
    };

    // Finalizes the statement when it goes out of scope.
    class Statement {
    public:
        Statement(sqlite3* db, const std::string& sql) : db_(db) {
            int rc = sqlite3_prepare_v2(db_, sql.c_str(), -1, &stmt_, nullptr);
            if (rc != SQLITE_OK) {
                throw KeyValueError("SQLite: Failed to prepare statement \"" + sql +
                                    "\": " + sqlite3_errmsg(db_));
            }
        }

        ~Statement() {
            sqlite3_finalize(stmt_);
        }

        Statement(const Statement&) = delete;
        Statement& operator=(const Statement&) = delete;

        void bind(int idx, const std::string& s) {
            int rc = sqlite3_bind_text(stmt_, idx, s.data(), static_cast<int>(s.size()),
                                       SQLITE_TRANSIENT);
            if (rc != SQLITE_OK) {
                throw KeyValueError(std::string("SQLite: Failed to bind: ") + sqlite3_errmsg(db_));
            }
        }

        void bind(int idx, int64_t v) {
            int rc = sqlite3_bind_int64(stmt_, idx, v);
            if (rc != SQLITE_OK) {
                throw KeyValueError(std::string("SQLite: Failed to bind: ") + sqlite3_errmsg(db_));
            }
        }

        // True while a row is available.
        bool step() {
            int rc = sqlite3_step(stmt_);
            if (rc == SQLITE_ROW) {
                return true;
            }
            if (rc == SQLITE_DONE) {
                return false;
            }
            throw KeyValueError(std::string("SQLite: step failed: ") + sqlite3_errmsg(db_));
        }

        void reset() {
            sqlite3_reset(stmt_);
            sqlite3_clear_bindings(stmt_);
        }

        std::string column(int idx) {
            const unsigned char* text = sqlite3_column_text(stmt_, idx);
            int n = sqlite3_column_bytes(stmt_, idx);
            if (text == nullptr) {
                return std::string();
            }
            return std::string(reinterpret_cast<const char*>(text), static_cast<size_t>(n));
        }

    private:
        sqlite3* db_;
        sqlite3_stmt* stmt_ = nullptr;
    };

    // Reads the range one page at a time, resuming after the last key seen,
    // so no statement stays open on the shared connection between calls.
    class PagedIterator : public Iterator {
    public:
        PagedIterator(std::shared_ptr<Connection> conn, std::string path, std::string start,
                      std::string end)
            : conn_(std::move(conn)), path_(std::move(path)), start_(std::move(start)),
              end_(std::move(end)) {}

        bool next() override {
            if (closed_) {
                throw std::logic_error("SQLite: next called on a closed iterator");
            }
            if (!err_.empty()) {
                return false;
            }
            if (page_.empty() && !exhausted_) {
                try {
                    fill();
                } catch (const KeyValueError& e) {
                    err_ = e.what();
                    return false;
                }
            }
            if (page_.empty()) {
                return false;
            }
            current_ = std::move(page_.front());
            page_.pop_front();
            have_last_ = true;
            return true;
        }

        const std::string& key() const override { return current_.first; }
        const std::string& value() const override { return current_.second; }

        void close() override {
            if (closed_) {
                return;
            }
            closed_ = true;
            page_.clear();
            conn_.reset();
            if (!err_.empty()) {
                throw KeyValueError(err_);
            }
        }

    private:
        void fill() {
            std::string lower = have_last_ ? current_.first : start_;
            std::string sql = have_last_ ? "SELECT k, v FROM rows WHERE k > ?"
                                         : "SELECT k, v FROM rows WHERE k >= ?";
            if (!end_.empty()) {
                sql += " AND k < ?";
            }
            sql += " ORDER BY k LIMIT ?";

            std::lock_guard<std::mutex> lock(conn_->mu);
            if (conn_->db == nullptr) {
                throw KeyValueError("SQLite: DB closed during iteration: " + path_);
            }
            Statement stmt(conn_->db, sql);
            int idx = 1;
            stmt.bind(idx++, lower);
            if (!end_.empty()) {
                stmt.bind(idx++, end_);
            }
            stmt.bind(idx, static_cast<int64_t>(SQLITE_PAGE_ROWS));
            size_t n = 0;
            while (stmt.step()) {
                page_.emplace_back(stmt.column(0), stmt.column(1));
                n++;
            }
            if (n < SQLITE_PAGE_ROWS) {
                exhausted_ = true;
            }
        }

        std::shared_ptr<Connection> conn_;
        std::string path_;
        std::string start_;
        std::string end_;
        std::deque<std::pair<std::string, std::string>> page_;
        std::pair<std::string, std::string> current_;
        std::string err_;
        bool have_last_ = false;
        bool exhausted_ = false;
        bool closed_ = false;
    };

public:
    // Creates the tables, enables WAL when available and records the
    // schema version in a fresh file.
    static void init_db(const std::string& path) {
        sqlite3* db = nullptr;
        int rc = sqlite3_open_v2(path.c_str(), &db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE, nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = db ? sqlite3_errmsg(db) : sqlite3_errstr(rc);
            sqlite3_close(db);
            throw KeyValueError("SQLite: Failed to create " + path + ": " + msg);
        }
        try {
            for (const auto& sql : sqlite_create_tables()) {
                exec(db, sql);
            }
            enable_wal(db);
            exec(db, "REPLACE INTO meta VALUES ('version', '" +
                         std::to_string(SQLITE_SCHEMA_VERSION) + "')");
        } catch (...) {
            sqlite3_close(db);
            throw;
        }
        sqlite3_close(db);
    }

    explicit SQLiteKeyValue(const std::string& path)
        : path_(path), conn_(std::make_shared<Connection>()) {
        std::error_code ec;
        if (!std::filesystem::exists(path_, ec) || std::filesystem::file_size(path_, ec) == 0) {
            init_db(path_);
        }
        int rc = sqlite3_open_v2(path_.c_str(), &conn_->db, SQLITE_OPEN_READWRITE | SQLITE_OPEN_FULLMUTEX,
                                 nullptr);
        if (rc != SQLITE_OK) {
            std::string msg = conn_->db ? sqlite3_errmsg(conn_->db) : sqlite3_errstr(rc);
            throw KeyValueError("SQLite: Failed to open DB " + path_ + ": " + msg);
        }
        sqlite3_busy_timeout(conn_->db, 5000);
        enable_wal(conn_->db);
        check_schema_version();
    }

    static std::unique_ptr<KeyValue> from_config(Config& cfg) {
        std::string file = cfg.required_string("file");
        cfg.validate();
        return std::make_unique<SQLiteKeyValue>(file);
    }

    ~SQLiteKeyValue() override {
        close();
    }

    std::optional<std::string> get(const std::string& key) override {
        std::lock_guard<std::mutex> lock(conn_->mu);
        check_open();
        Statement stmt(conn_->db, "SELECT v FROM rows WHERE k = ?");
        stmt.bind(1, key);
        if (!stmt.step()) {
            return std::nullopt;
        }
        return stmt.column(0);
    }

    void set(const std::string& key, const std::string& value) override {
        check_sizes(key, value);
        std::lock_guard<std::mutex> lock(conn_->mu);
        check_open();
        Statement stmt(conn_->db, "REPLACE INTO rows (k, v) VALUES (?, ?)");
        stmt.bind(1, key);
        stmt.bind(2, value);
        stmt.step();
    }

    void remove(const std::string& key) override {
        std::lock_guard<std::mutex> lock(conn_->mu);
        check_open();
        Statement stmt(conn_->db, "DELETE FROM rows WHERE k = ?");
        stmt.bind(1, key);
        stmt.step();
    }

    std::unique_ptr<Iterator> find(const std::string& start, const std::string& end) override {
        return std::make_unique<PagedIterator>(conn_, path_, start, end);
    }

    void commit_batch(const BatchMutation& batch) override {
        batch.check_sizes();
        std::lock_guard<std::mutex> lock(conn_->mu);
        check_open();
        exec(conn_->db, "BEGIN IMMEDIATE TRANSACTION");
        try {
            Statement replace(conn_->db, "REPLACE INTO rows (k, v) VALUES (?, ?)");
            Statement del(conn_->db, "DELETE FROM rows WHERE k = ?");
            for (const auto& m : batch.mutations()) {
                if (m.is_delete) {
                    del.bind(1, m.key);
                    del.step();
                    del.reset();
                } else {
                    replace.bind(1, m.key);
                    replace.bind(2, m.value);
                    replace.step();
                    replace.reset();
                }
            }
        } catch (const KeyValueError& e) {
            rollback();
            throw KeyValueError(std::string("SQLite: Failed to apply batch, rolled back: ") + e.what());
        }
        try {
            exec(conn_->db, "COMMIT");
        } catch (const KeyValueError&) {
            rollback();
            throw;
        }
    }

    void close() override {
        std::lock_guard<std::mutex> lock(conn_->mu);
        if (conn_->db != nullptr) {
            sqlite3_close(conn_->db);
            conn_->db = nullptr;
        }
    }

    void wipe() override {
        std::lock_guard<std::mutex> lock(conn_->mu);
        check_open();
        exec(conn_->db, "DELETE FROM rows");
    }

    // Value of the journal_mode pragma, e.g. "wal".
    std::string journal_mode() {
        std::lock_guard<std::mutex> lock(conn_->mu);
        check_open();
        Statement stmt(conn_->db, "PRAGMA journal_mode");
        return stmt.step() ? stmt.column(0) : std::string();
    }

    const std::string& path() const { return path_; }

private:
    static void exec(sqlite3* db, const std::string& sql) {
        char* err_msg = nullptr;
        int rc = sqlite3_exec(db, sql.c_str(), nullptr, nullptr, &err_msg);
        if (rc != SQLITE_OK) {
            std::string msg = err_msg ? err_msg : sqlite3_errstr(rc);
            sqlite3_free(err_msg);
            throw KeyValueError("SQLite: \"" + sql + "\" failed: " + msg);
        }
    }

    static void enable_wal(sqlite3* db) {
        if (!sqlite_wal_capable()) {
            std::cerr << "SQLite: WARNING: SQLite " << sqlite3_libversion()
                      << " has no Write-Ahead Logging; an index on it will most likely fail under load"
                      << std::endl;
            return;
        }
        exec(db, "PRAGMA journal_mode = WAL");
    }

    void rollback() {
        char* err_msg = nullptr;
        if (sqlite3_exec(conn_->db, "ROLLBACK", nullptr, nullptr, &err_msg) != SQLITE_OK) {
            std::cerr << "SQLite: Failed to roll back: " << (err_msg ? err_msg : "unknown error") << std::endl;
        }
        sqlite3_free(err_msg);
    }

    void check_schema_version() {
        int version = 0;
        try {
            Statement stmt(conn_->db, "SELECT value FROM meta WHERE metakey = 'version'");
            if (stmt.step()) {
                version = std::atoi(stmt.column(0).c_str());
            }
        } catch (const KeyValueError& e) {
            throw SchemaVersionError("SQLite: " + path_ + " has no usable meta table (" + e.what() +
                                     "). Reinitialize it with 'blobdex-dbinit --wipe " + path_ +
                                     "' and reindex.");
        }
        if (version != SQLITE_SCHEMA_VERSION) {
            throw SchemaVersionError("SQLite: " + path_ + " is of schema version " +
                                     std::to_string(version) + "; version " +
                                     std::to_string(SQLITE_SCHEMA_VERSION) +
                                     " is required. Reinitialize it with 'blobdex-dbinit --wipe " +
                                     path_ + "' and reindex.");
        }
    }

    void check_open() const {
        if (conn_->db == nullptr) {
            throw KeyValueError("SQLite: DB not open: " + path_);
        }
    }

    std::string path_;
    std::shared_ptr<Connection> conn_;
};

} // namespace blobdex

#endif // BLOBDEX_SQLITE_HPP
