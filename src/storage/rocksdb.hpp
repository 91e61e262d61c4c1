#ifndef BLOBDEX_ROCKSDB_HPP
#define BLOBDEX_ROCKSDB_HPP

#include "config.hpp"
#include "keyvalue.hpp"

#include <rocksdb/db.h>
#include <rocksdb/filter_policy.h>
#include <rocksdb/iterator.h>
#include <rocksdb/options.h>
#include <rocksdb/slice.h>
#include <rocksdb/status.h>
#include <rocksdb/table.h>
#include <rocksdb/write_batch.h>

#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace blobdex {

// LSM-tree store in a directory. Writes are not synced: after a crash the
// index is detected as incomplete and rebuilt from the blobs.
class RocksDBKeyValue : public KeyValue, public Wiper, public ReadTxBeginner {
    // Closes the database once the store and every open reader let go of it.
    struct DBCloser {
        std::string path;

        void operator()(rocksdb::DB* db) const {
            rocksdb::Status status = db->Close();
            if (!status.ok()) {
                std::cerr << "RocksDB: error closing " << path << ": " << status.ToString() << std::endl;
            }
            delete db;
        }
    };

    using DBHandle = std::shared_ptr<rocksdb::DB>;

    // A snapshot released after the last transaction or iterator using it.
    class PinnedSnapshot {
    public:
        explicit PinnedSnapshot(DBHandle db) : db_(std::move(db)), snap_(db_->GetSnapshot()) {}

        ~PinnedSnapshot() { db_->ReleaseSnapshot(snap_); }

        PinnedSnapshot(const PinnedSnapshot&) = delete;
        PinnedSnapshot& operator=(const PinnedSnapshot&) = delete;

        const rocksdb::Snapshot* get() const { return snap_; }

    private:
        DBHandle db_;
        const rocksdb::Snapshot* snap_;
    };

    class RangeIterator : public Iterator {
    public:
        RangeIterator(DBHandle db, std::shared_ptr<PinnedSnapshot> snap, rocksdb::ReadOptions ro,
                      const std::string& start, const std::string& end)
            : db_(std::move(db)), snap_(std::move(snap)), start_(start), end_(end) {
            if (!end_.empty()) {
                upper_ = rocksdb::Slice(end_);
                ro.iterate_upper_bound = &upper_;
            }
            ro.snapshot = snap_ ? snap_->get() : nullptr;
            it_.reset(db_->NewIterator(ro));
        }

        bool next() override {
            if (!it_) {
                throw std::logic_error("RocksDB: next called on a closed iterator");
            }
            if (!started_) {
                started_ = true;
                it_->Seek(start_);
            } else if (it_->Valid()) {
                it_->Next();
            }
            if (!it_->Valid()) {
                return false;
            }
            key_ = it_->key().ToString();
            value_ = it_->value().ToString();
            return true;
        }

        const std::string& key() const override { return key_; }
        const std::string& value() const override { return value_; }

        void close() override {
            if (!it_) {
                return;
            }
            rocksdb::Status status = it_->status();
            it_.reset();
            snap_.reset();
            db_.reset();
            if (!status.ok()) {
                throw KeyValueError("RocksDB: iteration failed: " + status.ToString());
            }
        }

    private:
        DBHandle db_;
        std::shared_ptr<PinnedSnapshot> snap_;
        std::string start_;
        std::string end_;
        rocksdb::Slice upper_;
        std::unique_ptr<rocksdb::Iterator> it_;
        std::string key_;
        std::string value_;
        bool started_ = false;
    };

    class SnapshotTx : public ReadTransaction {
    public:
        SnapshotTx(DBHandle db, bool verify) : db_(db), pin_(std::make_shared<PinnedSnapshot>(db)) {
            ro_.verify_checksums = verify;
        }

        std::optional<std::string> get(const std::string& key) override {
            check_open();
            rocksdb::ReadOptions ro = ro_;
            ro.snapshot = pin_->get();
            std::string value;
            rocksdb::Status status = db_->Get(ro, key, &value);
            if (status.IsNotFound()) {
                return std::nullopt;
            }
            if (!status.ok()) {
                throw KeyValueError("RocksDB: snapshot get: " + status.ToString());
            }
            return value;
        }

        std::unique_ptr<Iterator> find(const std::string& start, const std::string& end) override {
            check_open();
            return std::make_unique<RangeIterator>(db_, pin_, ro_, start, end);
        }

        // Iterators from this transaction keep the snapshot until they close.
        void close() override {
            pin_.reset();
            db_.reset();
        }

    private:
        void check_open() const {
            if (!pin_) {
                throw std::logic_error("RocksDB: read transaction used after close");
            }
        }

        DBHandle db_;
        std::shared_ptr<PinnedSnapshot> pin_;
        rocksdb::ReadOptions ro_;
    };

public:
    explicit RocksDBKeyValue(const std::string& db_path, bool strict = dev_mode())
        : db_path_(db_path), strict_(strict) {
        options_.create_if_missing = true;
        options_.error_if_exists = false;
        options_.compression = rocksdb::kNoCompression;
        options_.max_background_jobs = 4;
        options_.paranoid_checks = strict_;

        rocksdb::BlockBasedTableOptions table_options;
        table_options.filter_policy.reset(rocksdb::NewBloomFilterPolicy(10));
        options_.table_factory.reset(rocksdb::NewBlockBasedTableFactory(table_options));

        write_options_.sync = false;
        read_options_.verify_checksums = strict_;

        std::error_code ec;
        std::filesystem::remove_all(wipe_path(), ec);
        open();
    }

    static std::unique_ptr<KeyValue> from_config(Config& cfg) {
        std::string file = cfg.required_string("file");
        bool strict = cfg.optional_bool("strict", dev_mode());
        cfg.validate();
        return std::make_unique<RocksDBKeyValue>(file, strict);
    }

    ~RocksDBKeyValue() override {
        close();
    }

    std::optional<std::string> get(const std::string& key) override {
        std::shared_lock<std::shared_mutex> lock(mu_);
        check_open();
        std::string value;
        rocksdb::Status status = db_->Get(read_options_, key, &value);
        if (status.IsNotFound()) {
            return std::nullopt;
        }
        if (!status.ok()) {
            throw KeyValueError("RocksDB: Failed to get " + db_path_ + ": " + status.ToString());
        }
        return value;
    }

    void set(const std::string& key, const std::string& value) override {
        check_sizes(key, value);
        std::shared_lock<std::shared_mutex> lock(mu_);
        check_open();
        rocksdb::Status status = db_->Put(write_options_, key, value);
        if (!status.ok()) {
            throw KeyValueError("RocksDB: Failed to put " + db_path_ + ": " + status.ToString());
        }
    }

    void remove(const std::string& key) override {
        std::shared_lock<std::shared_mutex> lock(mu_);
        check_open();
        rocksdb::Status status = db_->Delete(write_options_, key);
        if (!status.ok()) {
            throw KeyValueError("RocksDB: Failed to delete " + db_path_ + ": " + status.ToString());
        }
    }

    std::unique_ptr<Iterator> find(const std::string& start, const std::string& end) override {
        std::shared_lock<std::shared_mutex> lock(mu_);
        if (!db_) {
            return std::make_unique<ErrorIterator>("RocksDB: DB not open: " + db_path_);
        }
        return std::make_unique<RangeIterator>(db_, nullptr, read_options_, start, end);
    }

    void commit_batch(const BatchMutation& batch) override {
        batch.check_sizes();
        rocksdb::WriteBatch wb;
        for (const auto& m : batch.mutations()) {
            if (m.is_delete) {
                wb.Delete(m.key);
            } else {
                wb.Put(m.key, m.value);
            }
        }
        std::shared_lock<std::shared_mutex> lock(mu_);
        check_open();
        rocksdb::Status status = db_->Write(write_options_, &wb);
        if (!status.ok()) {
            throw KeyValueError("RocksDB: Failed to write batch " + db_path_ + ": " + status.ToString());
        }
    }

    void close() override {
        std::unique_lock<std::shared_mutex> lock(mu_);
        close_locked();
    }

    // Renames the directory aside before deleting it so a process killed
    // mid-wipe never leaves a half-deleted database behind. While iterators
    // or read transactions are open the database cannot be closed, so the
    // rows are deleted in place and the readers keep their view.
    void wipe() override {
        std::unique_lock<std::shared_mutex> lock(mu_);
        if (db_ && db_.use_count() > 1) {
            delete_all_rows();
            return;
        }
        close_locked();
        std::error_code ec;
        std::filesystem::remove_all(wipe_path(), ec);
        if (std::filesystem::exists(db_path_)) {
            std::filesystem::rename(db_path_, wipe_path(), ec);
            if (ec) {
                throw KeyValueError("RocksDB: Failed to move " + db_path_ + " aside: " + ec.message());
            }
            std::filesystem::remove_all(wipe_path(), ec);
            if (ec) {
                throw KeyValueError("RocksDB: Failed to remove " + wipe_path() + ": " + ec.message());
            }
        }
        open();
    }

    std::unique_ptr<ReadTransaction> begin_read_tx() override {
        std::shared_lock<std::shared_mutex> lock(mu_);
        check_open();
        return std::make_unique<SnapshotTx>(db_, strict_);
    }

    const std::string& path() const { return db_path_; }

    bool strict() const { return strict_; }

private:
    void open() {
        rocksdb::DB* db = nullptr;
        rocksdb::Status status = rocksdb::DB::Open(options_, db_path_, &db);
        if (!status.ok()) {
            throw KeyValueError("RocksDB: Failed to open DB " + db_path_ + ": " + status.ToString());
        }
        db_ = DBHandle(db, DBCloser{db_path_});
    }

    // The database itself closes when the last open reader releases it.
    void close_locked() {
        db_.reset();
    }

    void delete_all_rows() {
        // Sorts after every key of at most MAX_KEY_SIZE bytes.
        std::string past_last(MAX_KEY_SIZE + 1, '\xff');
        rocksdb::Status status =
            db_->DeleteRange(write_options_, db_->DefaultColumnFamily(), rocksdb::Slice(), past_last);
        if (!status.ok()) {
            throw KeyValueError("RocksDB: Failed to wipe " + db_path_ + ": " + status.ToString());
        }
    }

    void check_open() const {
        if (!db_) {
            throw KeyValueError("RocksDB: DB not open: " + db_path_);
        }
    }

    std::string wipe_path() const { return db_path_ + ".wiping"; }

    std::string db_path_;
    bool strict_;
    rocksdb::Options options_;
    rocksdb::WriteOptions write_options_;
    rocksdb::ReadOptions read_options_;
    std::shared_mutex mu_;
    DBHandle db_;
};

} // namespace blobdex

#endif // BLOBDEX_ROCKSDB_HPP
