#pragma once

#include "blobref.hpp"

#include <cstddef>
#include <cstdint>
#include <string>

namespace blobdex {

// Times are RFC 3339 strings as written in the schema blobs.

struct BlobMeta {
    BlobRef ref;
    uint32_t size = 0;
    std::string camli_type; // empty for non-schema blobs
};

struct Claim {
    BlobRef blob_ref;
    BlobRef signer;
    BlobRef permanode;
    BlobRef target; // delete claims only
    std::string date;
    std::string type;
    std::string attr;
    std::string value;
};

struct FileInfo {
    int64_t size = 0;
    std::string file_name;
    std::string mime_type;
    BlobRef whole_ref;
    std::string time;
    std::string mod_time;
};

struct Path {
    BlobRef claim;
    BlobRef base;
    BlobRef target;
    std::string claim_date;
    std::string suffix;
};

struct Edge {
    BlobRef from;
    std::string from_type; // "permanode", "file" or "directory"
    std::string from_title;
    BlobRef to;
    BlobRef blob_ref;
};

struct PermanodeByAttrRequest {
    BlobRef signer;
    std::string attribute;
    std::string query;     // exact value; empty matches any value
    size_t max_results = 0; // 0 is unlimited
};

struct RecentPermanode {
    BlobRef permanode;
    BlobRef signer;
    std::string last_mod_time;
};

} // namespace blobdex
