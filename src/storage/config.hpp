#pragma once

#include "errors.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <cstdlib>
#include <set>
#include <string>

namespace blobdex {

static constexpr size_t SQLITE_PAGE_ROWS = 256;
static constexpr uint64_t KVFILE_DEFAULT_MAP_SIZE_MB = 1024;
static constexpr size_t KVFILE_BUCKET_PREFIX = 480;
static constexpr int DEFAULT_REINDEX_MAX_PROCS = 4;
static constexpr int64_t DEFAULT_BUFFER_BYTES = 4 << 20;

// Development mode turns on stricter integrity checks in the backends.
inline bool dev_mode() {
    const char* v = getenv("BLOBDEX_DEV");
    return v != nullptr && (std::string(v) == "1" || std::string(v) == "true");
}

// Typed accessors over a JSON configuration object. Every key read through
// an accessor is remembered so validate() can reject the others.
class Config {
public:
    explicit Config(nlohmann::json obj) : obj_(std::move(obj)) {
        if (!obj_.is_object()) {
            throw ConfigError("configuration must be a JSON object, got " + obj_.dump());
        }
    }

    std::string required_string(const std::string& key) {
        known_.insert(key);
        auto it = obj_.find(key);
        if (it == obj_.end()) {
            throw ConfigError("missing required config key \"" + key + "\"");
        }
        if (!it->is_string()) {
            throw ConfigError("config key \"" + key + "\" must be a string");
        }
        std::string v = it->get<std::string>();
        if (v.empty()) {
            throw ConfigError("config key \"" + key + "\" must not be empty");
        }
        return v;
    }

    std::string optional_string(const std::string& key, const std::string& def) {
        known_.insert(key);
        auto it = obj_.find(key);
        if (it == obj_.end()) {
            return def;
        }
        if (!it->is_string()) {
            throw ConfigError("config key \"" + key + "\" must be a string");
        }
        return it->get<std::string>();
    }

    bool optional_bool(const std::string& key, bool def) {
        known_.insert(key);
        auto it = obj_.find(key);
        if (it == obj_.end()) {
            return def;
        }
        if (!it->is_boolean()) {
            throw ConfigError("config key \"" + key + "\" must be a boolean");
        }
        return it->get<bool>();
    }

    int64_t optional_int(const std::string& key, int64_t def) {
        known_.insert(key);
        auto it = obj_.find(key);
        if (it == obj_.end()) {
            return def;
        }
        if (!it->is_number_integer()) {
            throw ConfigError("config key \"" + key + "\" must be an integer");
        }
        return it->get<int64_t>();
    }

    // Throws ConfigError naming the first key no accessor asked for.
    void validate() const {
        for (auto it = obj_.begin(); it != obj_.end(); ++it) {
            if (known_.count(it.key()) == 0) {
                throw ConfigError("unknown config key \"" + it.key() + "\"");
            }
        }
    }

    const nlohmann::json& json() const { return obj_; }

private:
    nlohmann::json obj_;
    std::set<std::string> known_;
};

} // namespace blobdex
