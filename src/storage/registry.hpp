#pragma once

#include "config.hpp"
#include "kvfile.hpp"
#include "keyvalue.hpp"
#include "memory.hpp"
#include "rocksdb.hpp"
#include "sqlite.hpp"

#include <nlohmann/json.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace blobdex {

using KeyValueCtor = std::function<std::unique_ptr<KeyValue>(Config&)>;

// Maps a configuration "type" to the constructor of a backend.
class KeyValueRegistry {
public:
    // Registering the same name twice is a programming error.
    void register_type(const std::string& name, KeyValueCtor ctor) {
        std::lock_guard<std::mutex> lock(mu_);
        if (name.empty()) {
            throw std::logic_error("KeyValueRegistry: empty type name");
        }
        if (!ctors_.emplace(name, std::move(ctor)).second) {
            throw std::logic_error("KeyValueRegistry: duplicate registration of type \"" + name + "\"");
        }
    }

    std::unique_ptr<KeyValue> create(const nlohmann::json& obj) const {
        Config cfg(obj);
        std::string type = cfg.required_string("type");
        KeyValueCtor ctor;
        {
            std::lock_guard<std::mutex> lock(mu_);
            auto it = ctors_.find(type);
            if (it == ctors_.end()) {
                throw ConfigError("unknown KeyValue type \"" + type + "\"");
            }
            ctor = it->second;
        }
        // Backend and configuration errors keep their type; anything else
        // a constructor throws is reported as a KeyValueError.
        try {
            return ctor(cfg);
        } catch (const KeyValueError&) {
            throw;
        } catch (const ConfigError& e) {
            throw ConfigError(type + ": " + e.what());
        } catch (const std::runtime_error& e) {
            throw KeyValueError(type + ": " + e.what());
        }
    }

    bool has_type(const std::string& name) const {
        std::lock_guard<std::mutex> lock(mu_);
        return ctors_.count(name) != 0;
    }

    std::vector<std::string> types() const {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<std::string> names;
        for (const auto& [name, ctor] : ctors_) {
            names.push_back(name);
        }
        return names;
    }

private:
    mutable std::mutex mu_;
    std::map<std::string, KeyValueCtor> ctors_;
};

inline std::unique_ptr<KeyValueRegistry> new_default_registry() {
    auto reg = std::make_unique<KeyValueRegistry>();
    reg->register_type("memory", &MemoryKeyValue::from_config);
    reg->register_type("rocksdb", &RocksDBKeyValue::from_config);
    reg->register_type("sqlite", &SQLiteKeyValue::from_config);
    reg->register_type("kvfile", &KVFileKeyValue::from_config);
    return reg;
}

} // namespace blobdex
