#pragma once

#include "blob_source.hpp"

#include <unistd.h>

#include <algorithm>
#include <cerrno>
#include <cstdlib>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace blobdex {

// Blobs stored one per file under <root>/sha1/<h0h1>/<h2h3>/sha1-<hex>.dat.
// Files are written to a temporary name and renamed into place, so a
// reader never sees a partial blob.
class LocalDiskBlobSource : public BlobSource {
public:
    explicit LocalDiskBlobSource(std::string root) : root_(std::move(root)) {
        std::error_code ec;
        std::filesystem::create_directories(std::filesystem::path(root_) / "sha1", ec);
        if (ec) {
            throw std::runtime_error("localdisk: cannot create " + root_ + ": " + ec.message());
        }
    }

    void enumerate(const std::function<void(const SizedRef&)>& fn) override {
        std::vector<SizedRef> refs;
        std::filesystem::path base = std::filesystem::path(root_) / "sha1";
        for (const auto& entry : std::filesystem::recursive_directory_iterator(base)) {
            if (!entry.is_regular_file()) {
                continue;
            }
            std::string name = entry.path().filename().string();
            if (name.size() < 4 || name.compare(name.size() - 4, 4, ".dat") != 0) {
                continue;
            }
            auto ref = BlobRef::parse(name.substr(0, name.size() - 4));
            if (!ref) {
                continue;
            }
            refs.push_back(SizedRef{*ref, static_cast<uint64_t>(entry.file_size())});
        }
        std::sort(refs.begin(), refs.end(),
                  [](const SizedRef& a, const SizedRef& b) { return a.ref < b.ref; });
        for (const auto& sr : refs) {
            fn(sr);
        }
    }

    std::optional<std::string> fetch(const BlobRef& ref) override {
        std::ifstream in(blob_path(ref), std::ios::binary);
        if (!in) {
            return std::nullopt;
        }
        std::ostringstream ss;
        ss << in.rdbuf();
        return ss.str();
    }

    SizedRef receive(const std::string& data) override {
        BlobRef ref = BlobRef::of(data);
        std::filesystem::path dst = blob_path(ref);
        if (std::filesystem::exists(dst)) {
            return SizedRef{ref, data.size()};
        }
        std::filesystem::create_directories(dst.parent_path());
        // Each write gets its own temporary file, so concurrent receives of
        // the same blob never share one.
        std::string tmp = dst.string() + ".tmp.XXXXXX";
        int fd = mkstemp(tmp.data());
        if (fd < 0) {
            throw std::runtime_error("localdisk: cannot create temporary file for " + dst.string() + ": " +
                                     std::strerror(errno));
        }
        size_t off = 0;
        while (off < data.size()) {
            ssize_t n = ::write(fd, data.data() + off, data.size() - off);
            if (n < 0) {
                if (errno == EINTR) {
                    continue;
                }
                int err = errno;
                ::close(fd);
                ::unlink(tmp.c_str());
                throw std::runtime_error("localdisk: failed writing " + tmp + ": " + std::strerror(err));
            }
            off += static_cast<size_t>(n);
        }
        if (::close(fd) != 0) {
            int err = errno;
            ::unlink(tmp.c_str());
            throw std::runtime_error("localdisk: failed closing " + tmp + ": " + std::strerror(err));
        }
        std::error_code ec;
        std::filesystem::rename(tmp, dst, ec);
        if (ec) {
            ::unlink(tmp.c_str());
            throw std::runtime_error("localdisk: cannot move " + tmp + " into place: " + ec.message());
        }
        return SizedRef{ref, data.size()};
    }

    std::filesystem::path blob_path(const BlobRef& ref) const {
        const std::string& hex = ref.hex();
        return std::filesystem::path(root_) / "sha1" / hex.substr(0, 2) / hex.substr(2, 2) /
               (ref.str() + ".dat");
    }

    const std::string& root() const { return root_; }

private:
    std::string root_;
};

} // namespace blobdex
