#pragma once

#include "config.hpp"
#include "keyvalue.hpp"

#include <atomic>
#include <iostream>
#include <memory>
#include <mutex>
#include <shared_mutex>
#include <string>

namespace blobdex {

// Puts one store in front of another. Writes land in the buffer and reach
// the backing store on flush(), or once more than max_buffer_bytes have been
// written since the last flush. A max_buffer_bytes <= 0 disables automatic
// flushing.
class BufferKeyValue : public KeyValue {
    // Walks two sorted iterators as one. On equal keys the buffer wins and
    // both sides advance.
    class MergedIterator : public Iterator {
        struct Side {
            std::unique_ptr<Iterator> it;
            bool valid = false;

            void advance() { valid = it->next(); }
        };

    public:
        MergedIterator(std::unique_ptr<Iterator> buf, std::unique_ptr<Iterator> back) {
            buf_.it = std::move(buf);
            back_.it = std::move(back);
        }

        bool next() override {
            if (closed_) {
                throw std::logic_error("BufferKeyValue: next called on a closed iterator");
            }
            if (!started_) {
                started_ = true;
                buf_.advance();
                back_.advance();
            } else if (cur_ == &buf_) {
                if (back_.valid && back_.it->key() == buf_.it->key()) {
                    back_.advance();
                }
                buf_.advance();
            } else if (cur_ == &back_) {
                back_.advance();
            }
            cur_ = pick();
            return cur_ != nullptr;
        }

        const std::string& key() const override { return cur_->it->key(); }
        const std::string& value() const override { return cur_->it->value(); }

        // Closes both sides; the buffer's error takes precedence.
        void close() override {
            if (closed_) {
                return;
            }
            closed_ = true;
            std::string err;
            try {
                buf_.it->close();
            } catch (const KeyValueError& e) {
                err = e.what();
            }
            try {
                back_.it->close();
            } catch (const KeyValueError& e) {
                if (err.empty()) {
                    err = e.what();
                }
            }
            if (!err.empty()) {
                throw KeyValueError(err);
            }
        }

    private:
        Side* pick() {
            if (!buf_.valid && !back_.valid) {
                return nullptr;
            }
            if (!back_.valid) {
                return &buf_;
            }
            if (!buf_.valid) {
                return &back_;
            }
            return buf_.it->key().compare(back_.it->key()) <= 0 ? &buf_ : &back_;
        }

        Side buf_;
        Side back_;
        Side* cur_ = nullptr;
        bool started_ = false;
        bool closed_ = false;
    };

public:
    BufferKeyValue(std::shared_ptr<KeyValue> buffer, std::shared_ptr<KeyValue> backing,
                   int64_t max_buffer_bytes = DEFAULT_BUFFER_BYTES)
        : buf_(std::move(buffer)), back_(std::move(backing)), max_buffer_(max_buffer_bytes) {}

    ~BufferKeyValue() override {
        try {
            close();
        } catch (const KeyValueError& e) {
            std::cerr << "BufferKeyValue: flush on close failed: " << e.what() << std::endl;
        }
    }

    // Moves every buffered row to the backing store in one batch, then
    // clears them from the buffer.
    void flush() {
        std::unique_lock<std::shared_mutex> lock(mu_);
        BatchMutation to_back;
        BatchMutation from_buf;
        auto it = buf_->find("", "");
        while (it->next()) {
            to_back.set(it->key(), it->value());
            from_buf.remove(it->key());
        }
        it->close();
        if (to_back.empty()) {
            return;
        }
        back_->commit_batch(to_back);
        buf_->commit_batch(from_buf);
        buffered_ = 0;
    }

    std::optional<std::string> get(const std::string& key) override {
        std::shared_lock<std::shared_mutex> lock(mu_);
        auto v = buf_->get(key);
        if (v) {
            return v;
        }
        return back_->get(key);
    }

    void set(const std::string& key, const std::string& value) override {
        check_sizes(key, value);
        {
            std::shared_lock<std::shared_mutex> lock(mu_);
            buf_->set(key, value);
        }
        note_written(static_cast<int64_t>(key.size() + value.size()));
    }

    // Deletes from both stores right away.
    void remove(const std::string& key) override {
        std::shared_lock<std::shared_mutex> lock(mu_);
        buf_->remove(key);
        back_->remove(key);
    }

    std::unique_ptr<Iterator> find(const std::string& start, const std::string& end) override {
        std::shared_lock<std::shared_mutex> lock(mu_);
        return std::make_unique<MergedIterator>(buf_->find(start, end), back_->find(start, end));
    }

    void commit_batch(const BatchMutation& batch) override {
        batch.check_sizes();
        int64_t written = 0;
        {
            std::shared_lock<std::shared_mutex> lock(mu_);
            BatchMutation to_buf;
            BatchMutation back_deletes;
            for (const auto& m : batch.mutations()) {
                if (m.is_delete) {
                    to_buf.remove(m.key);
                    back_deletes.remove(m.key);
                } else {
                    to_buf.set(m.key, m.value);
                    written += static_cast<int64_t>(m.key.size() + m.value.size());
                }
            }
            buf_->commit_batch(to_buf);
            if (!back_deletes.empty()) {
                back_->commit_batch(back_deletes);
            }
        }
        note_written(written);
    }

    // Flushes, then closes the backing store.
    void close() override {
        if (closed_.exchange(true)) {
            return;
        }
        flush();
        back_->close();
    }

    int64_t buffered_bytes() const { return buffered_.load(); }

private:
    void note_written(int64_t n) {
        if (n == 0) {
            return;
        }
        int64_t total = buffered_.fetch_add(n) + n;
        if (max_buffer_ > 0 && total > max_buffer_) {
            flush();
        }
    }

    std::shared_ptr<KeyValue> buf_;
    std::shared_ptr<KeyValue> back_;
    int64_t max_buffer_;
    std::atomic<int64_t> buffered_{0};
    std::atomic<bool> closed_{false};
    std::shared_mutex mu_;
};

} // namespace blobdex
