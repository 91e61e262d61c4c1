#pragma once

#include "config.hpp"
#include "keyvalue.hpp"

#include <lmdb.h>

#include <algorithm>
#include <cstdint>
#include <filesystem>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>
#include <utility>
#include <vector>

namespace blobdex {

// Transactional B+tree store kept in a single file (plus LMDB's lock file).
class KVFileKeyValue : public KeyValue, public Wiper {
    static MDB_val make_val(const std::string& s) {
        return MDB_val{s.size(), const_cast<char*>(s.data())};
    }

    static std::string to_string(const MDB_val& v) {
        return std::string(static_cast<const char*>(v.mv_data), v.mv_size);
    }

    static std::string errstr(int rc) { return mdb_strerror(rc); }

    // LMDB keys are limited to 511 bytes, so rows are grouped in buckets: the
    // LMDB key is a tag byte plus the first KVFILE_BUCKET_PREFIX bytes of the
    // row key, and the LMDB value lists (suffix, value) pairs sorted by
    // suffix. Rows sharing a bucket prefix are adjacent in key order, so a
    // cursor over buckets still yields rows in ascending order.
    using Bucket = std::vector<std::pair<std::string, std::string>>;

    static std::string bucket_key(const std::string& key) {
        return "k" + key.substr(0, KVFILE_BUCKET_PREFIX);
    }

    static std::string bucket_suffix(const std::string& key) {
        return key.size() > KVFILE_BUCKET_PREFIX ? key.substr(KVFILE_BUCKET_PREFIX) : std::string();
    }

    static void put_u32(std::string& out, uint32_t n) {
        for (int i = 0; i < 4; i++) {
            out.push_back(static_cast<char>((n >> (8 * i)) & 0xff));
        }
    }

    static bool get_u32(const char*& p, const char* end, uint32_t& n) {
        if (end - p < 4) {
            return false;
        }
        n = 0;
        for (int i = 0; i < 4; i++) {
            n |= static_cast<uint32_t>(static_cast<unsigned char>(p[i])) << (8 * i);
        }
        p += 4;
        return true;
    }

    static std::string encode_bucket(const Bucket& b) {
        std::string out;
        for (const auto& [suffix, value] : b) {
            put_u32(out, static_cast<uint32_t>(suffix.size()));
            out += suffix;
            put_u32(out, static_cast<uint32_t>(value.size()));
            out += value;
        }
        return out;
    }

    static Bucket decode_bucket(const MDB_val& v) {
        Bucket b;
        const char* p = static_cast<const char*>(v.mv_data);
        const char* end = p + v.mv_size;
        while (p < end) {
            uint32_t n = 0;
            if (!get_u32(p, end, n) || static_cast<size_t>(end - p) < n) {
                throw KeyValueError("kvfile: corrupt bucket");
            }
            std::string suffix(p, n);
            p += n;
            if (!get_u32(p, end, n) || static_cast<size_t>(end - p) < n) {
                throw KeyValueError("kvfile: corrupt bucket");
            }
            b.emplace_back(std::move(suffix), std::string(p, n));
            p += n;
        }
        return b;
    }

    // Owns the LMDB environment. The store and every open iterator share
    // it, so the file is closed only once all of them are done.
    struct Env {
        Env() = default;

        ~Env() {
            if (env != nullptr) {
                mdb_env_close(env);
            }
        }

        Env(const Env&) = delete;
        Env& operator=(const Env&) = delete;

        MDB_env* env = nullptr;
        MDB_dbi dbi = 0;
    };

    // Holds a read-only transaction and cursor until closed, so it sees one
    // consistent version of the file.
    class CursorIterator : public Iterator {
    public:
        CursorIterator(std::shared_ptr<Env> env, std::string start, std::string end)
            : env_(std::move(env)), start_(std::move(start)), end_(std::move(end)) {
            int rc = mdb_txn_begin(env_->env, nullptr, MDB_RDONLY, &txn_);
            if (rc != MDB_SUCCESS) {
                txn_ = nullptr;
                err_ = "kvfile: Failed to begin read transaction: " + errstr(rc);
                return;
            }
            rc = mdb_cursor_open(txn_, env_->dbi, &cursor_);
            if (rc != MDB_SUCCESS) {
                cursor_ = nullptr;
                err_ = "kvfile: Failed to open cursor: " + errstr(rc);
            }
        }

        ~CursorIterator() override { release(); }

        bool next() override {
            if (closed_) {
                throw std::logic_error("kvfile: next called on a closed iterator");
            }
            if (!err_.empty()) {
                return false;
            }
            while (!done_) {
                while (pos_ < bucket_.size()) {
                    auto& [suffix, value] = bucket_[pos_++];
                    std::string key = bucket_prefix_ + suffix;
                    if (key.compare(start_) < 0) {
                        continue;
                    }
                    if (!end_.empty() && key.compare(end_) >= 0) {
                        done_ = true;
                        return false;
                    }
                    key_ = std::move(key);
                    value_ = std::move(value);
                    return true;
                }
                if (!load_bucket()) {
                    done_ = true;
                }
            }
            return false;
        }

        const std::string& key() const override { return key_; }
        const std::string& value() const override { return value_; }

        void close() override {
            if (closed_) {
                return;
            }
            closed_ = true;
            release();
            if (!err_.empty()) {
                throw KeyValueError(err_);
            }
        }

    private:
        // Moves the cursor to the next bucket. False at the end or on error.
        bool load_bucket() {
            MDB_val k{0, nullptr};
            MDB_val v{0, nullptr};
            int rc;
            if (!started_) {
                started_ = true;
                std::string seek = bucket_key(start_);
                k = make_val(seek);
                rc = mdb_cursor_get(cursor_, &k, &v, MDB_SET_RANGE);
            } else {
                rc = mdb_cursor_get(cursor_, &k, &v, MDB_NEXT);
            }
            if (rc == MDB_NOTFOUND) {
                return false;
            }
            if (rc != MDB_SUCCESS) {
                err_ = "kvfile: cursor failed: " + errstr(rc);
                return false;
            }
            std::string lmdb_key = to_string(k);
            if (lmdb_key.empty() || lmdb_key[0] != 'k') {
                err_ = "kvfile: unexpected record in file";
                return false;
            }
            bucket_prefix_ = lmdb_key.substr(1);
            if (!end_.empty() && bucket_prefix_.compare(end_) >= 0) {
                return false;
            }
            try {
                bucket_ = decode_bucket(v);
            } catch (const KeyValueError& e) {
                err_ = e.what();
                return false;
            }
            pos_ = 0;
            return true;
        }

        void release() {
            if (cursor_ != nullptr) {
                mdb_cursor_close(cursor_);
                cursor_ = nullptr;
            }
            if (txn_ != nullptr) {
                mdb_txn_abort(txn_);
                txn_ = nullptr;
            }
            env_.reset();
        }

        std::shared_ptr<Env> env_;
        std::string start_;
        std::string end_;
        MDB_txn* txn_ = nullptr;
        MDB_cursor* cursor_ = nullptr;
        std::string bucket_prefix_;
        Bucket bucket_;
        size_t pos_ = 0;
        std::string key_;
        std::string value_;
        std::string err_;
        bool started_ = false;
        bool done_ = false;
        bool closed_ = false;
    };

    // Aborts the write transaction unless it was committed.
    class WriteTxn {
    public:
        explicit WriteTxn(MDB_env* env) {
            int rc = mdb_txn_begin(env, nullptr, 0, &txn_);
            if (rc != MDB_SUCCESS) {
                txn_ = nullptr;
                throw KeyValueError("kvfile: Failed to begin write transaction: " + errstr(rc));
            }
        }

        ~WriteTxn() {
            if (txn_ != nullptr) {
                mdb_txn_abort(txn_);
            }
        }

        WriteTxn(const WriteTxn&) = delete;
        WriteTxn& operator=(const WriteTxn&) = delete;

        MDB_txn* get() const { return txn_; }

        // The transaction is gone afterwards whatever the result.
        int commit() {
            int rc = mdb_txn_commit(txn_);
            txn_ = nullptr;
            return rc;
        }

    private:
        MDB_txn* txn_ = nullptr;
    };

public:
    explicit KVFileKeyValue(const std::string& path,
                            uint64_t map_size_mb = KVFILE_DEFAULT_MAP_SIZE_MB)
        : path_(path), map_size_(map_size_mb << 20) {
        std::error_code ec;
        std::filesystem::remove(wipe_path(), ec);
        open();
    }

    static std::unique_ptr<KeyValue> from_config(Config& cfg) {
        std::string file = cfg.required_string("file");
        int64_t map_size_mb = cfg.optional_int("map_size_mb", KVFILE_DEFAULT_MAP_SIZE_MB);
        cfg.validate();
        if (map_size_mb <= 0) {
            throw ConfigError("kvfile: map_size_mb must be positive");
        }
        return std::make_unique<KVFileKeyValue>(file, static_cast<uint64_t>(map_size_mb));
    }

    ~KVFileKeyValue() override {
        close();
    }

    std::optional<std::string> get(const std::string& key) override {
        std::shared_lock<std::shared_mutex> lock(env_mu_);
        check_open();
        MDB_txn* txn = nullptr;
        int rc = mdb_txn_begin(env_->env, nullptr, MDB_RDONLY, &txn);
        if (rc != MDB_SUCCESS) {
            throw KeyValueError("kvfile: Failed to begin read transaction: " + errstr(rc));
        }
        std::string bk = bucket_key(key);
        MDB_val k = make_val(bk);
        MDB_val v{0, nullptr};
        rc = mdb_get(txn, env_->dbi, &k, &v);
        Bucket bucket;
        if (rc == MDB_SUCCESS) {
            try {
                bucket = decode_bucket(v);
            } catch (const KeyValueError&) {
                mdb_txn_abort(txn);
                throw;
            }
        }
        mdb_txn_abort(txn);
        if (rc != MDB_SUCCESS && rc != MDB_NOTFOUND) {
            throw KeyValueError("kvfile: Failed to get " + path_ + ": " + errstr(rc));
        }
        std::string suffix = bucket_suffix(key);
        for (auto& [sfx, value] : bucket) {
            if (sfx == suffix) {
                return std::move(value);
            }
        }
        return std::nullopt;
    }

    void set(const std::string& key, const std::string& value) override {
        BatchMutation batch;
        batch.set(key, value);
        commit_batch(batch);
    }

    void remove(const std::string& key) override {
        BatchMutation batch;
        batch.remove(key);
        commit_batch(batch);
    }

    std::unique_ptr<Iterator> find(const std::string& start, const std::string& end) override {
        std::shared_lock<std::shared_mutex> lock(env_mu_);
        if (!env_) {
            return std::make_unique<ErrorIterator>("kvfile: DB not open: " + path_);
        }
        return std::make_unique<CursorIterator>(env_, start, end);
    }

    // All mutations run in one write transaction; any failure aborts the
    // whole transaction. A batch that does not fit grows the map and runs
    // again.
    void commit_batch(const BatchMutation& batch) override {
        batch.check_sizes();
        std::lock_guard<std::mutex> commit_lock(commit_mu_);
        for (;;) {
            {
                std::shared_lock<std::shared_mutex> lock(env_mu_);
                check_open();
                if (apply(batch)) {
                    return;
                }
            }
            grow_map();
        }
    }

    void close() override {
        std::unique_lock<std::shared_mutex> lock(env_mu_);
        env_.reset();
    }

    // Recreates an empty file with the same options. The file is renamed
    // aside first so a kill mid-wipe leaves either the old file or none.
    // With iterators open the rows are dropped in one write transaction
    // instead, and the iterators keep reading their version.
    void wipe() override {
        std::lock_guard<std::mutex> commit_lock(commit_mu_);
        std::unique_lock<std::shared_mutex> lock(env_mu_);
        if (env_ && env_.use_count() > 1) {
            WriteTxn txn(env_->env);
            int rc = mdb_drop(txn.get(), env_->dbi, 0);
            if (rc == MDB_SUCCESS) {
                rc = txn.commit();
            }
            if (rc != MDB_SUCCESS) {
                throw KeyValueError("kvfile: Failed to wipe " + path_ + ": " + errstr(rc));
            }
            return;
        }
        env_.reset();
        std::error_code ec;
        if (std::filesystem::exists(path_)) {
            std::filesystem::rename(path_, wipe_path(), ec);
            if (ec) {
                throw KeyValueError("kvfile: Failed to move " + path_ + " aside: " + ec.message());
            }
        }
        std::filesystem::remove(wipe_path(), ec);
        std::filesystem::remove(lock_path(), ec);
        open();
    }

    const std::string& path() const { return path_; }

    size_t map_size() {
        std::shared_lock<std::shared_mutex> lock(env_mu_);
        return map_size_;
    }

private:
    void open() {
        auto env = std::make_shared<Env>();
        int rc = mdb_env_create(&env->env);
        if (rc != MDB_SUCCESS) {
            env->env = nullptr;
            throw KeyValueError("kvfile: Failed to create environment: " + errstr(rc));
        }
        rc = mdb_env_set_mapsize(env->env, map_size_);
        if (rc == MDB_SUCCESS) {
            rc = mdb_env_open(env->env, path_.c_str(), MDB_NOSUBDIR | MDB_NOTLS, 0644);
        }
        if (rc != MDB_SUCCESS) {
            throw KeyValueError("kvfile: Failed to open " + path_ + ": " + errstr(rc));
        }
        int dead = 0;
        mdb_reader_check(env->env, &dead);
        if (dead > 0) {
            std::cerr << "kvfile: cleared " << dead << " stale reader slots in " << path_ << std::endl;
        }

        MDB_txn* txn = nullptr;
        rc = mdb_txn_begin(env->env, nullptr, 0, &txn);
        if (rc == MDB_SUCCESS) {
            rc = mdb_dbi_open(txn, nullptr, 0, &env->dbi);
            if (rc == MDB_SUCCESS) {
                rc = mdb_txn_commit(txn);
            } else {
                mdb_txn_abort(txn);
            }
        }
        if (rc != MDB_SUCCESS) {
            throw KeyValueError("kvfile: Failed to open main database in " + path_ + ": " + errstr(rc));
        }
        env_ = std::move(env);
    }

    // False when the map filled up; the transaction is aborted and nothing
    // was applied.
    bool apply(const BatchMutation& batch) {
        WriteTxn txn(env_->env);
        for (const auto& m : batch.mutations()) {
            std::string bk = bucket_key(m.key);
            std::string suffix = bucket_suffix(m.key);
            MDB_val k = make_val(bk);
            MDB_val v{0, nullptr};
            int rc = mdb_get(txn.get(), env_->dbi, &k, &v);
            if (rc != MDB_SUCCESS && rc != MDB_NOTFOUND) {
                throw KeyValueError("kvfile: batch aborted on key \"" + m.key.substr(0, 64) +
                                    "\": " + errstr(rc));
            }
            Bucket bucket;
            if (rc == MDB_SUCCESS) {
                bucket = decode_bucket(v);
            }
            auto pos = std::lower_bound(bucket.begin(), bucket.end(), suffix,
                                        [](const std::pair<std::string, std::string>& e,
                                           const std::string& s) { return e.first.compare(s) < 0; });
            bool found = pos != bucket.end() && pos->first == suffix;
            if (m.is_delete) {
                if (!found) {
                    continue;
                }
                bucket.erase(pos);
            } else if (found) {
                pos->second = m.value;
            } else {
                bucket.insert(pos, std::make_pair(suffix, m.value));
            }
            k = make_val(bk);
            if (bucket.empty()) {
                rc = mdb_del(txn.get(), env_->dbi, &k, nullptr);
            } else {
                std::string encoded = encode_bucket(bucket);
                MDB_val nv = make_val(encoded);
                rc = mdb_put(txn.get(), env_->dbi, &k, &nv, 0);
            }
            if (rc == MDB_MAP_FULL) {
                return false;
            }
            if (rc != MDB_SUCCESS) {
                throw KeyValueError("kvfile: batch aborted on key \"" + m.key.substr(0, 64) +
                                    "\": " + errstr(rc));
            }
        }
        int rc = txn.commit();
        if (rc == MDB_MAP_FULL) {
            return false;
        }
        if (rc != MDB_SUCCESS) {
            throw KeyValueError("kvfile: Failed to commit: " + errstr(rc));
        }
        return true;
    }

    // LMDB only resizes a map no transaction in this process is using.
    void grow_map() {
        std::unique_lock<std::shared_mutex> lock(env_mu_);
        check_open();
        if (env_.use_count() > 1) {
            throw KeyValueError("kvfile: " + path_ + " is full (" + std::to_string(map_size_ >> 20) +
                                " MB) and cannot grow while iterators are open");
        }
        size_t grown = map_size_ * 2;
        int rc = mdb_env_set_mapsize(env_->env, grown);
        if (rc != MDB_SUCCESS) {
            throw KeyValueError("kvfile: Failed to grow " + path_ + ": " + errstr(rc));
        }
        map_size_ = grown;
        std::cerr << "kvfile: grew " << path_ << " to " << (map_size_ >> 20) << " MB" << std::endl;
    }

    void check_open() const {
        if (!env_) {
            throw KeyValueError("kvfile: DB not open: " + path_);
        }
    }

    std::string lock_path() const { return path_ + "-lock"; }
    std::string wipe_path() const { return path_ + ".wiping"; }

    std::string path_;
    size_t map_size_;
    std::shared_ptr<Env> env_;
    std::shared_mutex env_mu_;
    std::mutex commit_mu_;
};

} // namespace blobdex
