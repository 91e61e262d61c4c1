#pragma once

#include <stdexcept>
#include <string>

namespace blobdex {

// Base for every failure reported by a KeyValue backend.
class KeyValueError : public std::runtime_error {
public:
    explicit KeyValueError(const std::string& msg) : std::runtime_error(msg) {}
};

class KeyTooLargeError : public KeyValueError {
public:
    explicit KeyTooLargeError(const std::string& msg) : KeyValueError(msg) {}
};

class ValueTooLargeError : public KeyValueError {
public:
    explicit ValueTooLargeError(const std::string& msg) : KeyValueError(msg) {}
};

// Persisted schema version differs from the compiled-in one.
class SchemaVersionError : public KeyValueError {
public:
    explicit SchemaVersionError(const std::string& msg) : KeyValueError(msg) {}
};

class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& msg) : std::runtime_error(msg) {}
};

class IndexError : public std::runtime_error {
public:
    explicit IndexError(const std::string& msg) : std::runtime_error(msg) {}
};

} // namespace blobdex
