#pragma once

#include "storage/buffer.hpp"
#include "storage/kvfile.hpp"
#include "storage/memory.hpp"
#include "storage/rocksdb.hpp"
#include "storage/sqlite.hpp"

#include <unistd.h>

#include <filesystem>
#include <memory>
#include <random>
#include <stdexcept>
#include <string>
#include <vector>

namespace blobdex::test {

// A fresh directory under the system temp dir, removed on destruction.
class TempDir {
public:
    explicit TempDir(const std::string& tag) {
        std::random_device r;
        path_ = (std::filesystem::temp_directory_path() /
                 ("blobdex-" + tag + "-" + std::to_string(getpid()) + "-" + std::to_string(r())))
                    .string();
        std::filesystem::remove_all(path_);
        std::filesystem::create_directories(path_);
    }

    ~TempDir() {
        std::error_code ec;
        std::filesystem::remove_all(path_, ec);
    }

    TempDir(const TempDir&) = delete;
    TempDir& operator=(const TempDir&) = delete;

    const std::string& path() const { return path_; }

    std::string file(const std::string& name) const { return path_ + "/" + name; }

private:
    std::string path_;
};

inline const std::vector<std::string>& persistent_backends() {
    static const std::vector<std::string> names = {"rocksdb", "sqlite", "kvfile"};
    return names;
}

inline const std::vector<std::string>& all_backends() {
    static const std::vector<std::string> names = {"memory", "rocksdb", "sqlite", "kvfile", "buffer"};
    return names;
}

// Opens (or reopens) the named backend on a file inside dir. "buffer" puts
// an in-memory store in front of another in-memory store.
inline std::shared_ptr<KeyValue> open_backend(const std::string& name, const std::string& dir) {
    if (name == "memory") {
        return std::make_shared<MemoryKeyValue>();
    }
    if (name == "rocksdb") {
        return std::make_shared<RocksDBKeyValue>(dir + "/rocksdb", true);
    }
    if (name == "sqlite") {
        return std::make_shared<SQLiteKeyValue>(dir + "/index.sqlite");
    }
    if (name == "kvfile") {
        return std::make_shared<KVFileKeyValue>(dir + "/index.kv", 64);
    }
    if (name == "buffer") {
        return std::make_shared<BufferKeyValue>(std::make_shared<MemoryKeyValue>(),
                                                std::make_shared<MemoryKeyValue>(), 1 << 10);
    }
    throw std::invalid_argument("unknown backend " + name);
}

inline std::vector<std::pair<std::string, std::string>> all_rows(KeyValue& kv,
                                                                 const std::string& start = "",
                                                                 const std::string& end = "") {
    std::vector<std::pair<std::string, std::string>> rows;
    auto it = kv.find(start, end);
    while (it->next()) {
        rows.emplace_back(it->key(), it->value());
    }
    it->close();
    return rows;
}

} // namespace blobdex::test
