#pragma once

#include "blobref.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace blobdex {

// A JSON blob with "camliVersion" and "camliType" members.
class SchemaBlob {
public:
    // std::nullopt for anything that is not a well-formed schema blob.
    static std::optional<SchemaBlob> parse(const BlobRef& ref, const std::string& data) {
        size_t i = data.find_first_not_of(" \t\r\n");
        if (i == std::string::npos || data[i] != '{') {
            return std::nullopt;
        }
        nlohmann::json j = nlohmann::json::parse(data, nullptr, false);
        if (j.is_discarded() || !j.is_object()) {
            return std::nullopt;
        }
        auto ver = j.find("camliVersion");
        auto type = j.find("camliType");
        if (ver == j.end() || !ver->is_number_integer() || type == j.end() || !type->is_string()) {
            return std::nullopt;
        }
        return SchemaBlob(ref, std::move(j));
    }

    const BlobRef& ref() const { return ref_; }
    const std::string& type() const { return type_; }
    const nlohmann::json& json() const { return json_; }

    // Empty when the member is missing or not a string.
    std::string str(const std::string& key) const {
        auto it = json_.find(key);
        if (it == json_.end() || !it->is_string()) {
            return std::string();
        }
        return it->get<std::string>();
    }

    BlobRef ref_field(const std::string& key) const {
        auto r = BlobRef::parse(str(key));
        return r ? *r : BlobRef();
    }

    std::string claim_type() const { return str("claimType"); }
    std::string claim_date() const { return str("claimDate"); }
    BlobRef signer() const { return ref_field("camliSigner"); }
    BlobRef permanode() const { return ref_field("permaNode"); }
    BlobRef target() const { return ref_field("target"); }
    std::string attribute() const { return str("attribute"); }
    std::string value() const { return str("value"); }
    std::string file_name() const { return str("fileName"); }
    std::string unix_mtime() const { return str("unixMtime"); }

    // Parts of a "file" blob. Entries without a valid blobRef are dropped.
    std::vector<SizedRef> parts() const {
        std::vector<SizedRef> out;
        auto it = json_.find("parts");
        if (it == json_.end() || !it->is_array()) {
            return out;
        }
        for (const auto& p : *it) {
            if (!p.is_object() || !p.contains("blobRef") || !p["blobRef"].is_string()) {
                continue;
            }
            auto r = BlobRef::parse(p["blobRef"].get<std::string>());
            if (!r) {
                continue;
            }
            uint64_t size = 0;
            if (p.contains("size") && p["size"].is_number_unsigned()) {
                size = p["size"].get<uint64_t>();
            }
            out.push_back(SizedRef{*r, size});
        }
        return out;
    }

    // Members of a "static-set" blob.
    std::vector<BlobRef> members() const {
        std::vector<BlobRef> out;
        auto it = json_.find("members");
        if (it == json_.end() || !it->is_array()) {
            return out;
        }
        for (const auto& m : *it) {
            if (!m.is_string()) {
                continue;
            }
            if (auto r = BlobRef::parse(m.get<std::string>())) {
                out.push_back(*r);
            }
        }
        return out;
    }

private:
    SchemaBlob(const BlobRef& ref, nlohmann::json j)
        : ref_(ref), type_(j["camliType"].get<std::string>()), json_(std::move(j)) {}

    BlobRef ref_;
    std::string type_;
    nlohmann::json json_;
};

namespace schema {

inline nlohmann::json base(const std::string& type) {
    return nlohmann::json{{"camliVersion", 1}, {"camliType", type}};
}

inline std::string to_blob(const nlohmann::json& j) {
    return j.dump(2) + "\n";
}

inline std::string permanode(const BlobRef& signer, const std::string& random) {
    nlohmann::json j = base("permanode");
    j["camliSigner"] = signer.str();
    j["random"] = random;
    return to_blob(j);
}

// claim_type is "set-attribute", "add-attribute" or "del-attribute".
inline std::string attribute_claim(const BlobRef& signer, const BlobRef& permanode,
                                   const std::string& claim_type, const std::string& attr,
                                   const std::string& value, const std::string& date) {
    nlohmann::json j = base("claim");
    j["camliSigner"] = signer.str();
    j["claimDate"] = date;
    j["claimType"] = claim_type;
    j["permaNode"] = permanode.str();
    j["attribute"] = attr;
    if (claim_type != "del-attribute" || !value.empty()) {
        j["value"] = value;
    }
    return to_blob(j);
}

inline std::string set_attribute(const BlobRef& signer, const BlobRef& permanode,
                                 const std::string& attr, const std::string& value,
                                 const std::string& date) {
    return attribute_claim(signer, permanode, "set-attribute", attr, value, date);
}

inline std::string add_attribute(const BlobRef& signer, const BlobRef& permanode,
                                 const std::string& attr, const std::string& value,
                                 const std::string& date) {
    return attribute_claim(signer, permanode, "add-attribute", attr, value, date);
}

inline std::string del_attribute(const BlobRef& signer, const BlobRef& permanode,
                                 const std::string& attr, const std::string& value,
                                 const std::string& date) {
    return attribute_claim(signer, permanode, "del-attribute", attr, value, date);
}

inline std::string delete_claim(const BlobRef& signer, const BlobRef& target, const std::string& date) {
    nlohmann::json j = base("claim");
    j["camliSigner"] = signer.str();
    j["claimDate"] = date;
    j["claimType"] = "delete";
    j["target"] = target.str();
    return to_blob(j);
}

inline std::string file(const std::string& file_name, const std::vector<SizedRef>& parts,
                        const std::string& unix_mtime = std::string()) {
    nlohmann::json j = base("file");
    j["fileName"] = file_name;
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& p : parts) {
        arr.push_back(nlohmann::json{{"blobRef", p.ref.str()}, {"size", p.size}});
    }
    j["parts"] = arr;
    if (!unix_mtime.empty()) {
        j["unixMtime"] = unix_mtime;
    }
    return to_blob(j);
}

inline std::string static_set(const std::vector<BlobRef>& members) {
    nlohmann::json j = base("static-set");
    nlohmann::json arr = nlohmann::json::array();
    for (const auto& m : members) {
        arr.push_back(m.str());
    }
    j["members"] = arr;
    return to_blob(j);
}

inline std::string directory(const std::string& file_name, const BlobRef& entries) {
    nlohmann::json j = base("directory");
    j["fileName"] = file_name;
    j["entries"] = entries.str();
    return to_blob(j);
}

} // namespace schema

} // namespace blobdex
