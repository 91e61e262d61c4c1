#pragma once

#include <openssl/evp.h>

#include <cstdint>
#include <functional>
#include <optional>
#include <stdexcept>
#include <string>

namespace blobdex {

// Incremental SHA-1 over a byte stream, for blobs assembled from parts.
class Sha1Hasher {
public:
    Sha1Hasher() : ctx_(EVP_MD_CTX_new()) {
        if (ctx_ == nullptr || EVP_DigestInit_ex(ctx_, EVP_sha1(), nullptr) != 1) {
            EVP_MD_CTX_free(ctx_);
            throw std::runtime_error("sha1: EVP_DigestInit_ex failed");
        }
    }

    ~Sha1Hasher() { EVP_MD_CTX_free(ctx_); }

    Sha1Hasher(const Sha1Hasher&) = delete;
    Sha1Hasher& operator=(const Sha1Hasher&) = delete;

    void update(const std::string& data) {
        if (EVP_DigestUpdate(ctx_, data.data(), data.size()) != 1) {
            throw std::runtime_error("sha1: EVP_DigestUpdate failed");
        }
    }

    // Lowercase hex digest. The hasher cannot be reused afterwards.
    std::string hex_digest() {
        unsigned char md[EVP_MAX_MD_SIZE];
        unsigned int len = 0;
        if (EVP_DigestFinal_ex(ctx_, md, &len) != 1) {
            throw std::runtime_error("sha1: EVP_DigestFinal_ex failed");
        }
        static const char digits[] = "0123456789abcdef";
        std::string out;
        out.reserve(len * 2);
        for (unsigned int i = 0; i < len; i++) {
            out.push_back(digits[md[i] >> 4]);
            out.push_back(digits[md[i] & 0xf]);
        }
        return out;
    }

private:
    EVP_MD_CTX* ctx_;
};

// Content address of a blob: "sha1-" followed by 40 lowercase hex digits.
// A default-constructed BlobRef is invalid and prints as "".
class BlobRef {
public:
    static constexpr const char* PREFIX = "sha1-";
    static constexpr size_t HEX_LEN = 40;

    BlobRef() = default;

    static std::optional<BlobRef> parse(const std::string& s) {
        if (s.size() != 5 + HEX_LEN || s.compare(0, 5, PREFIX) != 0) {
            return std::nullopt;
        }
        for (size_t i = 5; i < s.size(); i++) {
            char c = s[i];
            if (!((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f'))) {
                return std::nullopt;
            }
        }
        return BlobRef(s.substr(5));
    }

    static BlobRef must_parse(const std::string& s) {
        auto ref = parse(s);
        if (!ref) {
            throw std::invalid_argument("invalid blobref \"" + s + "\"");
        }
        return *ref;
    }

    static BlobRef from_hex(const std::string& hex) {
        return must_parse(PREFIX + hex);
    }

    static BlobRef of(const std::string& data) {
        Sha1Hasher h;
        h.update(data);
        return BlobRef(h.hex_digest());
    }

    bool valid() const { return !hex_.empty(); }

    const std::string& hex() const { return hex_; }

    std::string str() const { return valid() ? PREFIX + hex_ : std::string(); }

    bool hash_matches(const std::string& data) const { return of(data) == *this; }

    bool operator==(const BlobRef& o) const { return hex_ == o.hex_; }
    bool operator!=(const BlobRef& o) const { return hex_ != o.hex_; }
    bool operator<(const BlobRef& o) const { return hex_ < o.hex_; }

private:
    explicit BlobRef(std::string hex) : hex_(std::move(hex)) {}

    std::string hex_;
};

struct SizedRef {
    BlobRef ref;
    uint64_t size = 0;

    bool operator==(const SizedRef& o) const { return ref == o.ref && size == o.size; }
};

} // namespace blobdex

namespace std {
template <>
struct hash<blobdex::BlobRef> {
    size_t operator()(const blobdex::BlobRef& r) const { return hash<string>()(r.hex()); }
};
} // namespace std
