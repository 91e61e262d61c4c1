#pragma once

#include "config.hpp"
#include "keyvalue.hpp"

#include <map>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace blobdex {

// Sorted in-memory store. Iterators walk a copy of the requested range so
// concurrent writers never invalidate them.
class MemoryKeyValue : public KeyValue, public Wiper, public ReadTxBeginner {
    using Map = std::map<std::string, std::string>;

    class MapIterator : public Iterator {
    public:
        explicit MapIterator(std::shared_ptr<const Map> rows) : rows_(std::move(rows)) {}

        bool next() override {
            if (closed_) {
                throw std::logic_error("MemoryKeyValue: next called on a closed iterator");
            }
            if (!started_) {
                started_ = true;
                pos_ = rows_->begin();
            } else if (pos_ != rows_->end()) {
                ++pos_;
            }
            return pos_ != rows_->end();
        }

        const std::string& key() const override { return pos_->first; }
        const std::string& value() const override { return pos_->second; }

        void close() override {
            closed_ = true;
            rows_.reset();
        }

    private:
        std::shared_ptr<const Map> rows_;
        Map::const_iterator pos_;
        bool started_ = false;
        bool closed_ = false;
    };

    class Snapshot : public ReadTransaction {
    public:
        explicit Snapshot(std::shared_ptr<const Map> rows) : rows_(std::move(rows)) {}

        std::optional<std::string> get(const std::string& key) override {
            auto it = rows_->find(key);
            if (it == rows_->end()) {
                return std::nullopt;
            }
            return it->second;
        }

        std::unique_ptr<Iterator> find(const std::string& start, const std::string& end) override {
            return std::make_unique<MapIterator>(slice(*rows_, start, end));
        }

        void close() override {}

    private:
        std::shared_ptr<const Map> rows_;
    };

public:
    MemoryKeyValue() = default;

    static std::unique_ptr<KeyValue> from_config(Config& cfg) {
        cfg.validate();
        return std::make_unique<MemoryKeyValue>();
    }

    std::optional<std::string> get(const std::string& key) override {
        std::shared_lock<std::shared_mutex> lock(mu_);
        auto it = rows_.find(key);
        if (it == rows_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    void set(const std::string& key, const std::string& value) override {
        check_sizes(key, value);
        std::unique_lock<std::shared_mutex> lock(mu_);
        rows_[key] = value;
    }

    void remove(const std::string& key) override {
        std::unique_lock<std::shared_mutex> lock(mu_);
        rows_.erase(key);
    }

    std::unique_ptr<Iterator> find(const std::string& start, const std::string& end) override {
        std::shared_lock<std::shared_mutex> lock(mu_);
        return std::make_unique<MapIterator>(slice(rows_, start, end));
    }

    void commit_batch(const BatchMutation& batch) override {
        batch.check_sizes();
        std::unique_lock<std::shared_mutex> lock(mu_);
        for (const auto& m : batch.mutations()) {
            if (m.is_delete) {
                rows_.erase(m.key);
            } else {
                rows_[m.key] = m.value;
            }
        }
    }

    void close() override {}

    void wipe() override {
        std::unique_lock<std::shared_mutex> lock(mu_);
        rows_.clear();
    }

    std::unique_ptr<ReadTransaction> begin_read_tx() override {
        std::shared_lock<std::shared_mutex> lock(mu_);
        return std::make_unique<Snapshot>(std::make_shared<const Map>(rows_));
    }

    size_t size() {
        std::shared_lock<std::shared_mutex> lock(mu_);
        return rows_.size();
    }

private:
    static std::shared_ptr<const Map> slice(const Map& rows, const std::string& start,
                                            const std::string& end) {
        auto first = rows.lower_bound(start);
        auto last = end.empty() ? rows.end() : rows.lower_bound(end);
        if (!end.empty() && end.compare(start) <= 0) {
            last = first;
        }
        return std::make_shared<const Map>(first, last);
    }

    std::shared_mutex mu_;
    Map rows_;
};

} // namespace blobdex
