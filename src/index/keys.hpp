#pragma once

#include "blobref.hpp"

#include <compare>
#include <cstdint>
#include <ctime>
#include <initializer_list>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace blobdex {

static constexpr int REQUIRED_SCHEMA_VERSION = 1;

static constexpr const char* KEY_SCHEMA_VERSION = "schemaversion";
static constexpr const char* KEY_REINDEX_STATE = "reindexstate";
static constexpr const char* REINDEX_RUNNING = "running";

static constexpr const char* PFX_HAVE = "have:";
static constexpr const char* PFX_META = "meta:";
static constexpr const char* PFX_SIGNER_KEY_ID = "signerkeyid:";
static constexpr const char* PFX_CLAIM = "claim";
static constexpr const char* PFX_RECENT_PERMANODE = "recpn";
static constexpr const char* PFX_SIGNER_ATTR_VALUE = "signerattrvalue";
static constexpr const char* PFX_PATH_BACKWARD = "signertargetpath";
static constexpr const char* PFX_PATH_FORWARD = "path";
static constexpr const char* PFX_EDGE_BACKWARD = "edgeback";
static constexpr const char* PFX_DELETED = "deleted";
static constexpr const char* PFX_FILE_INFO = "fileinfo";
static constexpr const char* PFX_WHOLE_TO_FILE = "wholetofile";
static constexpr const char* PFX_FILE_TIMES = "filetimes";
static constexpr const char* PFX_DIR_CHILD = "dirchild";
static constexpr const char* PFX_MISSING = "missing";

static constexpr const char* CAMLI_TYPE_MIME_PREFIX = "application/json; camliType=";

// Query-string escaping: unreserved bytes pass through, space becomes '+',
// everything else (including '|') becomes %XX.
inline std::string urle(const std::string& s) {
    static const char hex[] = "0123456789ABCDEF";
    std::string out;
    out.reserve(s.size());
    for (unsigned char c : s) {
        if ((c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') || (c >= '0' && c <= '9') ||
            c == '-' || c == '_' || c == '.' || c == '~') {
            out.push_back(static_cast<char>(c));
        } else if (c == ' ') {
            out.push_back('+');
        } else {
            out.push_back('%');
            out.push_back(hex[c >> 4]);
            out.push_back(hex[c & 0xf]);
        }
    }
    return out;
}

// Inverse of urle. Malformed escapes are kept literally.
inline std::string urld(const std::string& s) {
    auto unhex = [](char c) -> int {
        if (c >= '0' && c <= '9') return c - '0';
        if (c >= 'a' && c <= 'f') return c - 'a' + 10;
        if (c >= 'A' && c <= 'F') return c - 'A' + 10;
        return -1;
    };
    std::string out;
    out.reserve(s.size());
    for (size_t i = 0; i < s.size(); i++) {
        if (s[i] == '+') {
            out.push_back(' ');
        } else if (s[i] == '%' && i + 2 < s.size() && unhex(s[i + 1]) >= 0 && unhex(s[i + 2]) >= 0) {
            out.push_back(static_cast<char>(unhex(s[i + 1]) * 16 + unhex(s[i + 2])));
            i += 2;
        } else {
            out.push_back(s[i]);
        }
    }
    return out;
}

inline bool looks_like_time(const std::string& s) {
    return s.size() >= 19 && s[4] == '-' && s[10] == 'T';
}

// "rt" followed by the time with every digit d replaced by 9-d, so newer
// times sort first.
inline std::string reverse_time(const std::string& t) {
    if (!looks_like_time(t)) {
        throw std::invalid_argument("doesn't look like a time: " + t);
    }
    std::string out = "rt";
    for (char c : t) {
        out.push_back(c >= '0' && c <= '9' ? static_cast<char>('9' - (c - '0')) : c);
    }
    return out;
}

inline std::string unreverse_time(const std::string& rt) {
    if (rt.compare(0, 2, "rt") != 0) {
        return std::string();
    }
    std::string out;
    for (size_t i = 2; i < rt.size(); i++) {
        char c = rt[i];
        out.push_back(c >= '0' && c <= '9' ? static_cast<char>('9' - (c - '0')) : c);
    }
    return out;
}

// An instant parsed from an RFC 3339 time.
struct Timestamp {
    int64_t sec = 0;
    int32_t nsec = 0;

    auto operator<=>(const Timestamp&) const = default;
};

// Accepts "YYYY-MM-DDTHH:MM:SS", an optional fraction, then "Z" or a
// "+HH:MM"/"-HH:MM" offset.
inline std::optional<Timestamp> parse_time(const std::string& s) {
    auto digits = [&](size_t pos, size_t n, int& out) {
        if (pos + n > s.size()) {
            return false;
        }
        out = 0;
        for (size_t i = pos; i < pos + n; i++) {
            if (s[i] < '0' || s[i] > '9') {
                return false;
            }
            out = out * 10 + (s[i] - '0');
        }
        return true;
    };
    int year, month, day, hour, min, sec;
    if (!looks_like_time(s) || !digits(0, 4, year) || !digits(5, 2, month) || s[7] != '-' ||
        !digits(8, 2, day) || !digits(11, 2, hour) || s[13] != ':' || !digits(14, 2, min) ||
        s[16] != ':' || !digits(17, 2, sec)) {
        return std::nullopt;
    }
    size_t i = 19;
    int32_t nsec = 0;
    if (i < s.size() && s[i] == '.') {
        i++;
        int n = 0;
        while (i < s.size() && s[i] >= '0' && s[i] <= '9') {
            if (n < 9) {
                nsec = nsec * 10 + (s[i] - '0');
                n++;
            }
            i++;
        }
        if (n == 0) {
            return std::nullopt;
        }
        for (; n < 9; n++) {
            nsec *= 10;
        }
    }
    int64_t offset = 0;
    if (i + 1 == s.size() && (s[i] == 'Z' || s[i] == 'z')) {
        i++;
    } else if (i + 6 == s.size() && (s[i] == '+' || s[i] == '-') && s[i + 3] == ':') {
        int oh, om;
        if (!digits(i + 1, 2, oh) || !digits(i + 4, 2, om)) {
            return std::nullopt;
        }
        offset = (s[i] == '-' ? -1 : 1) * (oh * 3600 + om * 60);
        i += 6;
    }
    if (i != s.size() || month < 1 || month > 12 || day < 1 || day > 31 || hour > 23 || min > 59 ||
        sec > 60) {
        return std::nullopt;
    }
    struct tm tm = {};
    tm.tm_year = year - 1900;
    tm.tm_mon = month - 1;
    tm.tm_mday = day;
    tm.tm_hour = hour;
    tm.tm_min = min;
    tm.tm_sec = sec;
    return Timestamp{static_cast<int64_t>(timegm(&tm)) - offset, nsec};
}

// Orders two times by instant. Falls back to byte order when either one
// does not parse.
inline int compare_times(const std::string& a, const std::string& b) {
    auto ta = parse_time(a);
    auto tb = parse_time(b);
    if (!ta || !tb) {
        int c = a.compare(b);
        return c < 0 ? -1 : (c > 0 ? 1 : 0);
    }
    if (*ta < *tb) {
        return -1;
    }
    return *tb < *ta ? 1 : 0;
}

inline std::string pipes(std::initializer_list<std::string> parts) {
    std::string out;
    bool first = true;
    for (const auto& p : parts) {
        if (!first) {
            out.push_back('|');
        }
        out += p;
        first = false;
    }
    return out;
}

// Prefix for a range scan: the parts joined with '|' plus a trailing '|'.
inline std::string key_prefix(std::initializer_list<std::string> parts) {
    return pipes(parts) + "|";
}

inline std::vector<std::string> split_pipes(const std::string& s) {
    std::vector<std::string> out;
    size_t start = 0;
    while (true) {
        size_t p = s.find('|', start);
        if (p == std::string::npos) {
            out.push_back(s.substr(start));
            return out;
        }
        out.push_back(s.substr(start, p - start));
        start = p + 1;
    }
}

// "application/json; camliType=file" => "file"; "image/gif" => "".
inline std::string camli_type_from_mime(const std::string& mime) {
    const std::string pfx = CAMLI_TYPE_MIME_PREFIX;
    if (mime.compare(0, pfx.size(), pfx) == 0) {
        return mime.substr(pfx.size());
    }
    return std::string();
}

// Attributes with a signer/attr/value lookup row.
inline bool is_indexed_attribute(const std::string& attr) {
    return attr == "camliRoot" || attr == "camliImportRoot" || attr == "tag" || attr == "title";
}

// Attributes whose value is a blobref, kept as reverse edges.
inline bool is_blob_reference_attribute(const std::string& attr) {
    return attr == "camliMember" || attr == "camliContent";
}

inline std::string sniff_mime(const std::string& data) {
    auto starts = [&](const std::string& magic) { return data.compare(0, magic.size(), magic) == 0; };
    if (starts("\x89PNG\r\n\x1a\n")) return "image/png";
    if (starts("\xff\xd8\xff")) return "image/jpeg";
    if (starts("GIF87a") || starts("GIF89a")) return "image/gif";
    if (starts("%PDF-")) return "application/pdf";
    if (starts("PK\x03\x04")) return "application/zip";
    if (starts(std::string("\x1f\x8b", 2))) return "application/x-gzip";
    return std::string();
}

} // namespace blobdex
