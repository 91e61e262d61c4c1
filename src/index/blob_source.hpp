#pragma once

#include "blobref.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

namespace blobdex {

// Where the index reads blobs from. The blob source is the durable source
// of truth; the index is rebuilt from it.
class BlobSource {
public:
    virtual ~BlobSource() {}

    // Calls fn for every blob in ascending ref order.
    virtual void enumerate(const std::function<void(const SizedRef&)>& fn) = 0;

    // std::nullopt when the blob is not stored.
    virtual std::optional<std::string> fetch(const BlobRef& ref) = 0;

    virtual SizedRef receive(const std::string& data) = 0;
};

class MemoryBlobSource : public BlobSource {
public:
    void enumerate(const std::function<void(const SizedRef&)>& fn) override {
        std::map<BlobRef, std::string> blobs;
        {
            std::lock_guard<std::mutex> lock(mu_);
            blobs = blobs_;
        }
        for (const auto& [ref, data] : blobs) {
            fn(SizedRef{ref, data.size()});
        }
    }

    std::optional<std::string> fetch(const BlobRef& ref) override {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = blobs_.find(ref);
        if (it == blobs_.end()) {
            return std::nullopt;
        }
        return it->second;
    }

    SizedRef receive(const std::string& data) override {
        BlobRef ref = BlobRef::of(data);
        std::lock_guard<std::mutex> lock(mu_);
        blobs_.emplace(ref, data);
        return SizedRef{ref, data.size()};
    }

    void remove(const BlobRef& ref) {
        std::lock_guard<std::mutex> lock(mu_);
        blobs_.erase(ref);
    }

    size_t size() {
        std::lock_guard<std::mutex> lock(mu_);
        return blobs_.size();
    }

private:
    std::mutex mu_;
    std::map<BlobRef, std::string> blobs_;
};

} // namespace blobdex
