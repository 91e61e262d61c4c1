#ifndef BLOBDEX_KEYVALUE_HPP
#define BLOBDEX_KEYVALUE_HPP

#include "errors.hpp"

#include <cstddef>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace blobdex {

// Bounds chosen so that a row still fits in a MySQL InnoDB index.
static constexpr size_t MAX_KEY_SIZE = 767;
static constexpr size_t MAX_VALUE_SIZE = 63000;

inline void check_sizes(const std::string& key, const std::string& value) {
    if (key.size() > MAX_KEY_SIZE) {
        throw KeyTooLargeError("key too large: " + std::to_string(key.size()) +
                               " bytes (max " + std::to_string(MAX_KEY_SIZE) + "): " +
                               key.substr(0, 64));
    }
    if (value.size() > MAX_VALUE_SIZE) {
        throw ValueTooLargeError("value too large: " + std::to_string(value.size()) +
                                 " bytes (max " + std::to_string(MAX_VALUE_SIZE) +
                                 ") for key " + key.substr(0, 64));
    }
}

struct Mutation {
    bool is_delete = false;
    std::string key;
    std::string value;
};

// An ordered list of sets and deletes. Building one never touches a store;
// only KeyValue::commit_batch does, all or nothing.
class BatchMutation {
public:
    void set(std::string key, std::string value) {
        mutations_.push_back(Mutation{false, std::move(key), std::move(value)});
    }

    void remove(std::string key) {
        mutations_.push_back(Mutation{true, std::move(key), std::string()});
    }

    const std::vector<Mutation>& mutations() const { return mutations_; }
    size_t size() const { return mutations_.size(); }
    bool empty() const { return mutations_.empty(); }

    // Validates every mutation before a backend applies any of them.
    void check_sizes() const {
        for (const auto& m : mutations_) {
            blobdex::check_sizes(m.key, m.is_delete ? std::string() : m.value);
        }
    }

private:
    std::vector<Mutation> mutations_;
};

// Cursor over a key range. key() and value() are valid between a next()
// returning true and the following next() or close().
class Iterator {
public:
    virtual ~Iterator() {}

    virtual bool next() = 0;

    virtual const std::string& key() const = 0;

    virtual const std::string& value() const = 0;

    // Releases backend resources. Throws KeyValueError if the iteration
    // stopped because of an error.
    virtual void close() = 0;
};

// A sorted map from byte strings to byte strings.
class KeyValue {
public:
    virtual ~KeyValue() {}

    // std::nullopt when the key is absent.
    virtual std::optional<std::string> get(const std::string& key) = 0;

    virtual void set(const std::string& key, const std::string& value) = 0;

    // Removing an absent key is not an error.
    virtual void remove(const std::string& key) = 0;

    // Keys in [start, end) in ascending byte order. An empty end is
    // unbounded. Errors are reported by the iterator's close().
    virtual std::unique_ptr<Iterator> find(const std::string& start, const std::string& end) = 0;

    virtual BatchMutation begin_batch() { return BatchMutation(); }

    virtual void commit_batch(const BatchMutation& batch) = 0;

    // Later calls are no-ops.
    virtual void close() = 0;
};

// Optional capability: erase every row and leave the store usable.
class Wiper {
public:
    virtual ~Wiper() {}
    virtual void wipe() = 0;
};

// A consistent point-in-time view of a store.
class ReadTransaction {
public:
    virtual ~ReadTransaction() {}
    virtual std::optional<std::string> get(const std::string& key) = 0;
    virtual std::unique_ptr<Iterator> find(const std::string& start, const std::string& end) = 0;
    virtual void close() = 0;
};

class ReadTxBeginner {
public:
    virtual ~ReadTxBeginner() {}
    virtual std::unique_ptr<ReadTransaction> begin_read_tx() = 0;
};

// Smallest string greater than every string starting with prefix, or ""
// when no such bound exists.
inline std::string prefix_end(const std::string& prefix) {
    std::string end = prefix;
    while (!end.empty()) {
        unsigned char last = static_cast<unsigned char>(end.back());
        if (last != 0xff) {
            end.back() = static_cast<char>(last + 1);
            return end;
        }
        end.pop_back();
    }
    return end;
}

inline std::unique_ptr<Iterator> query_prefix(KeyValue& kv, const std::string& prefix) {
    if (prefix.empty()) {
        return kv.find("", "");
    }
    return kv.find(prefix, prefix_end(prefix));
}

// An iterator that has already failed; used when a find cannot even start.
class ErrorIterator : public Iterator {
public:
    explicit ErrorIterator(std::string err) : err_(std::move(err)) {}

    bool next() override {
        if (closed_) {
            throw std::logic_error("next called on a closed iterator");
        }
        return false;
    }

    const std::string& key() const override { return empty_; }
    const std::string& value() const override { return empty_; }

    void close() override {
        if (closed_) {
            return;
        }
        closed_ = true;
        throw KeyValueError(err_);
    }

private:
    std::string err_;
    std::string empty_;
    bool closed_ = false;
};

} // namespace blobdex

#endif // BLOBDEX_KEYVALUE_HPP
