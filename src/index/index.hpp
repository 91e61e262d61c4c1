#pragma once

#include "blob_source.hpp"
#include "blobref.hpp"
#include "keys.hpp"
#include "schema.hpp"
#include "types.hpp"

#include "../storage/config.hpp"
#include "../storage/keyvalue.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdlib>
#include <functional>
#include <iostream>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <shared_mutex>
#include <string>
#include <thread>
#include <unordered_map>
#include <vector>

namespace blobdex {

struct IndexOptions {
    // Skip the schema version check; the caller is about to reindex.
    bool about_to_reindex = false;
    int reindex_max_procs = DEFAULT_REINDEX_MAX_PROCS;
};

// Derived rows over a blob source, kept in a KeyValue store. Every blob is
// indexed by exactly one batch, so an interrupted reindex leaves whole
// per-blob row sets behind.
class Index {
    struct Deletion {
        BlobRef deleter;
        std::string when;
    };

public:
    static std::unique_ptr<Index> open(std::shared_ptr<KeyValue> s, IndexOptions opts = IndexOptions()) {
        std::unique_ptr<Index> ix(new Index(std::move(s), opts));
        if (opts.about_to_reindex) {
            return ix;
        }
        int version = ix->schema_version();
        if (version == 0 && ix->is_empty()) {
            ix->s_->set(KEY_SCHEMA_VERSION, std::to_string(REQUIRED_SCHEMA_VERSION));
        } else if (version != REQUIRED_SCHEMA_VERSION) {
            throw SchemaVersionError("index schema version is " + std::to_string(version) +
                                     "; required one is " + std::to_string(REQUIRED_SCHEMA_VERSION) +
                                     ". You need to reindex.");
        }
        if (ix->reindex_incomplete()) {
            std::cerr << "index: previous reindex did not finish; reindex to complete the index"
                      << std::endl;
        }
        ix->init_deletes_cache();
        ix->init_needed_maps();
        return ix;
    }

    ~Index() {}

    void init_blob_source(std::shared_ptr<BlobSource> src) {
        std::lock_guard<std::mutex> lock(mu_);
        if (blob_source_) {
            throw std::logic_error("index: blob source already set");
        }
        blob_source_ = std::move(src);
    }

    // Indexes one blob in a single batch. Blobs whose dependencies are not in
    // the blob source get "missing" rows instead, and are indexed again once
    // the last dependency is received.
    SizedRef receive_blob(const BlobRef& ref, const std::string& data) {
        if (!ref.hash_matches(data)) {
            throw IndexError("index: corrupt blob " + ref.str());
        }
        BatchMutation bm;
        std::vector<BlobRef> missing;
        std::vector<Deletion> new_deletes;
        std::vector<BlobRef> delete_targets;
        populate_mutation(ref, data, bm, missing, new_deletes, delete_targets);

        if (!missing.empty()) {
            BatchMutation mbm;
            for (const auto& m : missing) {
                mbm.set(pipes({PFX_MISSING, ref.str(), m.str()}), "1");
            }
            s_->commit_batch(mbm);
            note_needed_memory(ref, missing);
            return SizedRef{ref, data.size()};
        }

        // Rows left by an earlier attempt that lacked dependencies.
        auto it = query_prefix(*s_, key_prefix({PFX_MISSING, ref.str()}));
        while (it->next()) {
            bm.remove(it->key());
        }
        it->close();

        s_->commit_batch(bm);

        if (!new_deletes.empty()) {
            std::unique_lock<std::shared_mutex> lock(deletes_mu_);
            for (size_t i = 0; i < new_deletes.size(); i++) {
                add_deletion(delete_targets[i], new_deletes[i]);
            }
        }

        for (const auto& waiter : blobs_ready_after(ref)) {
            reindex_one(waiter);
        }
        return SizedRef{ref, data.size()};
    }

    // Wipes the store and rebuilds every row from the blob source.
    void reindex() {
        std::shared_ptr<BlobSource> src = blob_source();
        if (!src) {
            throw IndexError("index: reindex requires a blob source");
        }
        Wiper* wiper = dynamic_cast<Wiper*>(s_.get());
        if (wiper == nullptr) {
            throw KeyValueError("index: storage doesn't support wiping");
        }
        std::cerr << "index: wiping storage ..." << std::endl;
        wiper->wipe();
        std::cerr << "index: wiped. Rebuilding..." << std::endl;

        BatchMutation start;
        start.set(KEY_SCHEMA_VERSION, std::to_string(REQUIRED_SCHEMA_VERSION));
        start.set(KEY_REINDEX_STATE, REINDEX_RUNNING);
        s_->commit_batch(start);

        {
            std::lock_guard<std::mutex> lock(mu_);
            needs_.clear();
            needed_by_.clear();
        }
        {
            std::unique_lock<std::shared_mutex> lock(deletes_mu_);
            deletes_.clear();
        }

        std::optional<BlobRef> reindex_start;
        if (const char* env = getenv("BLOBDEX_REINDEX_START")) {
            reindex_start = BlobRef::parse(env);
        }

        std::vector<BlobRef> refs;
        src->enumerate([&](const SizedRef& sr) {
            if (reindex_start && sr.ref < *reindex_start) {
                return;
            }
            refs.push_back(sr.ref);
        });

        std::atomic<size_t> next{0};
        std::atomic<size_t> nerr{0};
        std::mutex tick_mu;
        auto last_tick = std::chrono::steady_clock::now();

        auto worker = [&]() {
            while (true) {
                size_t i = next.fetch_add(1);
                if (i >= refs.size()) {
                    return;
                }
                const BlobRef& br = refs[i];
                {
                    std::lock_guard<std::mutex> lock(tick_mu);
                    auto now = std::chrono::steady_clock::now();
                    if (now - last_tick >= std::chrono::seconds(1)) {
                        std::cerr << "index: reindexing at " << br.str() << " (" << i << "/"
                                  << refs.size() << ")" << std::endl;
                        last_tick = now;
                    }
                }
                try {
                    index_from_source(*src, br);
                } catch (const std::exception& e) {
                    std::cerr << "index: error reindexing " << br.str() << ": " << e.what() << std::endl;
                    nerr++;
                }
            }
        };

        int nprocs = std::max(1, opts_.reindex_max_procs);
        std::vector<std::thread> workers;
        for (int i = 0; i < nprocs; i++) {
            workers.emplace_back(worker);
        }
        for (auto& t : workers) {
            t.join();
        }

        if (nerr > 0) {
            throw IndexError(std::to_string(nerr.load()) + " blobs failed to re-index");
        }
        s_->remove(KEY_REINDEX_STATE);
        init_deletes_cache();
        std::cerr << "index: rebuild complete, " << refs.size() << " blobs" << std::endl;
    }

    // Stops at the first error; a throwing fn stops the walk.
    void enumerate_blob_meta(const std::function<void(const BlobMeta&)>& fn) {
        auto it = query_prefix(*s_, PFX_META);
        while (it->next()) {
            auto bm = kv_blob_meta(it->key(), it->value());
            if (bm) {
                fn(*bm);
            }
        }
        it->close();
    }

    std::optional<BlobMeta> get_blob_meta(const BlobRef& ref) {
        std::string key = PFX_META + ref.str();
        auto v = s_->get(key);
        if (!v) {
            return std::nullopt;
        }
        auto bm = kv_blob_meta(key, *v);
        if (!bm) {
            throw IndexError("index: bogus row " + key + " = " + *v);
        }
        return bm;
    }

    std::optional<FileInfo> get_file_info(const BlobRef& file) {
        std::string ikey = pipes({PFX_FILE_INFO, file.str()});
        auto iv = s_->get(ikey);
        if (!iv) {
            return std::nullopt;
        }
        auto parts = split_pipes(*iv);
        if (parts.size() < 3) {
            std::cerr << "index: bogus key " << ikey << " = " << *iv << std::endl;
            return std::nullopt;
        }
        FileInfo fi;
        try {
            fi.size = std::stoll(parts[0]);
        } catch (const std::logic_error&) {
            std::cerr << "index: bogus integer at position 0 in key " << ikey << " = " << *iv << std::endl;
            return std::nullopt;
        }
        fi.file_name = urld(parts[1]);
        fi.mime_type = urld(parts[2]);
        if (parts.size() >= 4) {
            if (auto w = BlobRef::parse(parts[3])) {
                fi.whole_ref = *w;
            }
        }
        if (auto tv = s_->get(pipes({PFX_FILE_TIMES, file.str()}))) {
            std::string times = urld(*tv);
            size_t comma = times.find(',');
            fi.time = times.substr(0, comma);
            if (comma != std::string::npos) {
                fi.mod_time = times.substr(comma + 1);
            }
        }
        return fi;
    }

    std::vector<BlobRef> existing_file_schemas(const BlobRef& whole) {
        std::vector<BlobRef> out;
        auto it = query_prefix(*s_, key_prefix({PFX_WHOLE_TO_FILE, whole.str()}));
        while (it->next()) {
            auto parts = split_pipes(it->key());
            if (parts.size() != 3) {
                continue;
            }
            if (auto r = BlobRef::parse(parts[2])) {
                out.push_back(*r);
            }
        }
        it->close();
        return out;
    }

    // Appends the live claims on permanode to dst, oldest first. An invalid
    // signer_filter or empty attr_filter matches everything.
    void append_claims(std::vector<Claim>& dst, const BlobRef& permanode,
                       const BlobRef& signer_filter = BlobRef(),
                       const std::string& attr_filter = std::string()) {
        std::string prefix;
        if (signer_filter.valid()) {
            auto key_id = signer_key_id(signer_filter);
            if (!key_id) {
                return;
            }
            prefix = key_prefix({PFX_CLAIM, permanode.str(), *key_id});
        } else {
            prefix = key_prefix({PFX_CLAIM, permanode.str()});
        }
        auto it = query_prefix(*s_, prefix);
        while (it->next()) {
            auto cl = kv_claim(it->key(), it->value());
            if (!cl || is_deleted(cl->blob_ref)) {
                continue;
            }
            if (!attr_filter.empty() && cl->attr != attr_filter) {
                continue;
            }
            if (signer_filter.valid() && cl->signer != signer_filter) {
                continue;
            }
            dst.push_back(*cl);
        }
        it->close();
    }

    // Most recently modified permanodes of owner, newest first, modified
    // strictly before `before` (RFC 3339; empty means no bound).
    std::vector<RecentPermanode> get_recent_permanodes(const BlobRef& owner, size_t limit,
                                                       const std::string& before = std::string()) {
        std::vector<RecentPermanode> out;
        auto key_id = signer_key_id(owner);
        if (!key_id) {
            std::cerr << "index: no recent permanodes because keyId for owner " << owner.str()
                      << " not found" << std::endl;
            return out;
        }
        std::set<std::string> seen;
        auto it = query_prefix(*s_, key_prefix({PFX_RECENT_PERMANODE, *key_id}));
        while (it->next()) {
            auto parts = split_pipes(it->key());
            if (parts.size() != 4) {
                continue;
            }
            auto pn = BlobRef::parse(it->value());
            if (!pn || is_deleted(*pn) || !seen.insert(it->value()).second) {
                continue;
            }
            std::string mtime = unreverse_time(parts[2]);
            if (!before.empty() && compare_times(mtime, before) >= 0) {
                continue;
            }
            out.push_back(RecentPermanode{*pn, owner, mtime});
            if (out.size() == limit) {
                break;
            }
        }
        it->close();
        return out;
    }

    std::optional<BlobRef> permanode_of_signer_attr_value(const BlobRef& signer, const std::string& attr,
                                                          const std::string& value) {
        auto key_id = signer_key_id(signer);
        if (!key_id) {
            return std::nullopt;
        }
        std::optional<BlobRef> found;
        auto it = query_prefix(*s_, key_prefix({PFX_SIGNER_ATTR_VALUE, *key_id, urle(attr), urle(value)}));
        while (it->next()) {
            auto pn = BlobRef::parse(it->value());
            if (pn && !is_deleted(*pn)) {
                found = *pn;
                break;
            }
        }
        it->close();
        return found;
    }

    // Active paths pointing at target, one per base and suffix.
    std::vector<Path> paths_of_signer_target(const BlobRef& signer, const BlobRef& target) {
        std::vector<Path> out;
        auto key_id = signer_key_id(signer);
        if (!key_id) {
            return out;
        }
        std::map<std::string, Path> most_recent;
        std::map<std::string, std::string> max_dates;
        auto it = query_prefix(*s_, key_prefix({PFX_PATH_BACKWARD, *key_id, target.str()}));
        while (it->next()) {
            auto kp = split_pipes(it->key());
            auto vp = split_pipes(it->value());
            if (kp.size() != 4 || vp.size() != 4) {
                std::cerr << "index: bogus path row " << it->key() << " = " << it->value() << std::endl;
                continue;
            }
            auto claim = BlobRef::parse(kp[3]);
            auto base = BlobRef::parse(vp[1]);
            if (!claim || !base || is_deleted(*claim) || is_deleted(*base)) {
                continue;
            }
            Path p{*claim, *base, target, vp[0], urld(vp[3])};
            std::string k = base->str() + "/" + p.suffix;
            auto md = max_dates.find(k);
            if (md == max_dates.end() || compare_times(p.claim_date, md->second) > 0) {
                max_dates[k] = p.claim_date;
                if (vp[2] == "Y") {
                    most_recent[k] = p;
                } else {
                    most_recent.erase(k);
                }
            }
        }
        it->close();
        for (const auto& [k, p] : most_recent) {
            out.push_back(p);
        }
        return out;
    }

    // Paths from base with the given suffix, newest claim first.
    std::vector<Path> paths_lookup(const BlobRef& signer, const BlobRef& base, const std::string& suffix) {
        std::vector<Path> out;
        auto key_id = signer_key_id(signer);
        if (!key_id) {
            return out;
        }
        auto it = query_prefix(*s_, key_prefix({PFX_PATH_FORWARD, *key_id, base.str(), urle(suffix)}));
        while (it->next()) {
            auto kp = split_pipes(it->key());
            auto vp = split_pipes(it->value());
            if (kp.size() != 6 || vp.size() != 2) {
                std::cerr << "index: bogus path row " << it->key() << " = " << it->value() << std::endl;
                continue;
            }
            auto claim = BlobRef::parse(kp[5]);
            auto target = BlobRef::parse(vp[1]);
            if (!claim || !target || is_deleted(*claim) || is_deleted(*target)) {
                continue;
            }
            out.push_back(Path{*claim, base, *target, unreverse_time(kp[4]), urld(kp[3])});
        }
        it->close();
        return out;
    }

    // The newest path from base with the given suffix whose claim is not
    // newer than at (empty means now).
    std::optional<Path> path_lookup(const BlobRef& signer, const BlobRef& base, const std::string& suffix,
                                    const std::string& at = std::string()) {
        std::optional<Path> best;
        for (auto& p : paths_lookup(signer, base, suffix)) {
            if (!at.empty() && compare_times(p.claim_date, at) > 0) {
                continue;
            }
            if (best && compare_times(p.claim_date, best->claim_date) < 0) {
                continue;
            }
            best = std::move(p);
        }
        return best;
    }

    // Permanodes of the signer with attribute set to query (any value when
    // query is empty), newest claim first, each once.
    std::vector<BlobRef> search_permanodes_with_attr(const PermanodeByAttrRequest& req) {
        std::vector<BlobRef> out;
        if (req.attribute.empty()) {
            throw IndexError("index: missing attribute in permanode search");
        }
        auto key_id = signer_key_id(req.signer);
        if (!key_id) {
            return out;
        }
        std::string prefix = req.query.empty()
                                  ? key_prefix({PFX_SIGNER_ATTR_VALUE, *key_id, urle(req.attribute)})
                                  : key_prefix({PFX_SIGNER_ATTR_VALUE, *key_id, urle(req.attribute), urle(req.query)});
        std::set<std::string> seen;
        auto it = query_prefix(*s_, prefix);
        while (it->next()) {
            auto kp = split_pipes(it->key());
            if (kp.size() != 6) {
                std::cerr << "index: bogus signerattrvalue row " << it->key() << " = " << it->value() << std::endl;
                continue;
            }
            auto claim = BlobRef::parse(kp[5]);
            auto pn = BlobRef::parse(it->value());
            if (!claim || !pn || is_deleted(*claim) || is_deleted(*pn)) {
                continue;
            }
            if (!seen.insert(pn->str()).second) {
                continue;
            }
            out.push_back(*pn);
            if (req.max_results > 0 && out.size() == req.max_results) {
                break;
            }
        }
        it->close();
        return out;
    }

    // Parents of ref. Permanode parents appear once each.
    std::vector<Edge> edges_to(const BlobRef& ref) {
        std::vector<Edge> out;
        std::map<std::string, Edge> permanode_parents;
        auto it = query_prefix(*s_, key_prefix({PFX_EDGE_BACKWARD, ref.str()}));
        while (it->next()) {
            auto kp = split_pipes(it->key());
            auto vp = split_pipes(it->value());
            if (kp.size() != 4 || vp.size() != 2) {
                std::cerr << "index: bogus edge row " << it->key() << " = " << it->value() << std::endl;
                continue;
            }
            auto from = BlobRef::parse(kp[2]);
            auto br = BlobRef::parse(kp[3]);
            if (!from || !br || is_deleted(*from) || is_deleted(*br)) {
                continue;
            }
            Edge e{*from, vp[0], urld(vp[1]), ref, *br};
            if (e.from_type == "permanode") {
                permanode_parents[from->str()] = e;
            } else {
                out.push_back(e);
            }
        }
        it->close();
        for (const auto& [k, e] : permanode_parents) {
            out.push_back(e);
        }
        return out;
    }

    // Children of a directory blob; limit 0 means no limit.
    std::vector<BlobRef> get_dir_members(const BlobRef& dir, size_t limit = 0) {
        std::vector<BlobRef> out;
        auto it = query_prefix(*s_, key_prefix({PFX_DIR_CHILD, dir.str()}));
        while (it->next()) {
            auto kp = split_pipes(it->key());
            if (kp.size() != 3) {
                it->close();
                throw IndexError("index: bogus dirchild key " + it->key());
            }
            if (auto child = BlobRef::parse(kp[2])) {
                out.push_back(*child);
                if (out.size() == limit) {
                    break;
                }
            }
        }
        it->close();
        return out;
    }

    // A permanode or claim is deleted when a delete claim targets it and that
    // delete claim is not itself deleted.
    bool is_deleted(const BlobRef& ref) {
        std::shared_lock<std::shared_mutex> lock(deletes_mu_);
        return is_deleted_locked(ref, 0);
    }

    // Dependencies that kept have from being indexed.
    std::vector<BlobRef> missing_blobs(const BlobRef& have) {
        std::lock_guard<std::mutex> lock(mu_);
        auto it = needs_.find(have);
        if (it == needs_.end()) {
            return {};
        }
        return std::vector<BlobRef>(it->second.begin(), it->second.end());
    }

    // 0 when no version row exists.
    int schema_version() {
        auto v = s_->get(KEY_SCHEMA_VERSION);
        if (!v) {
            return 0;
        }
        try {
            return std::stoi(*v);
        } catch (const std::logic_error&) {
            throw IndexError("index: bogus schema version \"" + *v + "\"");
        }
    }

    // True while the marker written at the start of reindex() is present.
    bool reindex_incomplete() {
        return s_->get(KEY_REINDEX_STATE).has_value();
    }

    KeyValue& storage() { return *s_; }

    void close() { s_->close(); }

private:
    Index(std::shared_ptr<KeyValue> s, IndexOptions opts) : s_(std::move(s)), opts_(opts) {}

    std::shared_ptr<BlobSource> blob_source() {
        std::lock_guard<std::mutex> lock(mu_);
        return blob_source_;
    }

    bool is_empty() {
        auto it = s_->find("", "");
        bool empty = !it->next();
        it->close();
        return empty;
    }

    std::optional<std::string> signer_key_id(const BlobRef& signer) {
        return s_->get(PFX_SIGNER_KEY_ID + signer.str());
    }

    void index_from_source(BlobSource& src, const BlobRef& br) {
        auto data = src.fetch(br);
        if (!data) {
            throw IndexError("index: blob " + br.str() + " vanished from the blob source");
        }
        receive_blob(br, *data);
    }

    void reindex_one(const BlobRef& br) {
        std::shared_ptr<BlobSource> src = blob_source();
        if (!src) {
            std::cerr << "index: can't re-index " << br.str() << ": no blob source" << std::endl;
            return;
        }
        index_from_source(*src, br);
    }

    void populate_mutation(const BlobRef& ref, const std::string& data, BatchMutation& bm,
                           std::vector<BlobRef>& missing, std::vector<Deletion>& deletes,
                           std::vector<BlobRef>& delete_targets) {
        std::string size = std::to_string(data.size());
        bm.set(PFX_HAVE + ref.str(), size);

        auto sb = SchemaBlob::parse(ref, data);
        if (!sb) {
            std::string mime = sniff_mime(data);
            bm.set(PFX_META + ref.str(), size + "|" + (mime.empty() ? "application/octet-stream" : mime));
            return;
        }
        bm.set(PFX_META + ref.str(), size + "|" + CAMLI_TYPE_MIME_PREFIX + sb->type());
        if (sb->type() == "claim") {
            populate_claim(*sb, bm, deletes, delete_targets);
        } else if (sb->type() == "file") {
            populate_file(*sb, bm, missing);
        } else if (sb->type() == "directory") {
            populate_dir(*sb, bm, missing);
        }
    }

    void populate_claim(const SchemaBlob& sb, BatchMutation& bm, std::vector<Deletion>& deletes,
                        std::vector<BlobRef>& delete_targets) {
        const BlobRef& br = sb.ref();
        BlobRef signer = sb.signer();
        std::string date = sb.claim_date();
        if (!signer.valid() || !looks_like_time(date)) {
            std::cerr << "index: skipping malformed claim " << br.str() << std::endl;
            return;
        }
        std::string key_id = signer.str();
        std::string claim_type = sb.claim_type();

        if (claim_type == "delete") {
            BlobRef target = sb.target();
            if (!target.valid()) {
                std::cerr << "index: skipping delete claim " << br.str() << " without target" << std::endl;
                return;
            }
            bm.set(PFX_SIGNER_KEY_ID + signer.str(), key_id);
            bm.set(pipes({PFX_DELETED, target.str(), reverse_time(date), br.str()}), "");
            deletes.push_back(Deletion{br, date});
            delete_targets.push_back(target);
            return;
        }

        BlobRef pn = sb.permanode();
        if (!pn.valid()) {
            // Not a claim on a permanode.
            return;
        }
        std::string attr = sb.attribute();
        std::string value = sb.value();

        bm.set(PFX_SIGNER_KEY_ID + signer.str(), key_id);
        bm.set(pipes({PFX_RECENT_PERMANODE, key_id, reverse_time(date), br.str()}), pn.str());
        bm.set(pipes({PFX_CLAIM, pn.str(), key_id, date, br.str()}),
               pipes({urle(claim_type), urle(attr), urle(value), signer.str()}));

        const std::string path_attr = "camliPath:";
        if (attr.compare(0, path_attr.size(), path_attr) == 0) {
            if (auto target = BlobRef::parse(value)) {
                std::string suffix = attr.substr(path_attr.size());
                std::string active = claim_type == "del-attribute" ? "N" : "Y";
                bm.set(pipes({PFX_PATH_BACKWARD, key_id, target->str(), br.str()}),
                       pipes({date, pn.str(), active, urle(suffix)}));
                bm.set(pipes({PFX_PATH_FORWARD, key_id, pn.str(), urle(suffix), reverse_time(date), br.str()}),
                       pipes({active, target->str()}));
            }
        }

        if (is_indexed_attribute(attr)) {
            bm.set(pipes({PFX_SIGNER_ATTR_VALUE, key_id, urle(attr), urle(value), reverse_time(date), br.str()}),
                   pn.str());
        }

        if (is_blob_reference_attribute(attr)) {
            if (auto target = BlobRef::parse(value)) {
                bm.set(pipes({PFX_EDGE_BACKWARD, target->str(), pn.str(), br.str()}), "permanode|");
            }
        }
    }

    void populate_file(const SchemaBlob& sb, BatchMutation& bm, std::vector<BlobRef>& missing) {
        std::shared_ptr<BlobSource> src = blob_source();
        const BlobRef& br = sb.ref();
        std::vector<SizedRef> parts = sb.parts();

        Sha1Hasher whole;
        int64_t size = 0;
        std::string head;
        for (const auto& p : parts) {
            std::optional<std::string> data;
            if (src) {
                data = src->fetch(p.ref);
            }
            if (!data) {
                missing.push_back(p.ref);
                continue;
            }
            if (!missing.empty()) {
                continue;
            }
            whole.update(*data);
            size += static_cast<int64_t>(data->size());
            if (head.size() < 512) {
                head += data->substr(0, 512 - head.size());
            }
        }
        if (!missing.empty()) {
            return;
        }
        BlobRef whole_ref = BlobRef::from_hex(whole.hex_digest());
        std::string name = sb.file_name();

        bm.set(pipes({PFX_WHOLE_TO_FILE, whole_ref.str(), br.str()}), "1");
        bm.set(pipes({PFX_FILE_INFO, br.str()}),
               pipes({std::to_string(size), urle(name), urle(sniff_mime(head)), whole_ref.str()}));
        std::string mtime = sb.unix_mtime();
        if (!mtime.empty()) {
            bm.set(pipes({PFX_FILE_TIMES, br.str()}), urle(mtime));
        }
        std::set<BlobRef> seen;
        for (const auto& p : parts) {
            if (seen.insert(p.ref).second) {
                bm.set(pipes({PFX_EDGE_BACKWARD, p.ref.str(), br.str(), br.str()}), "file|" + urle(name));
            }
        }
    }

    void populate_dir(const SchemaBlob& sb, BatchMutation& bm, std::vector<BlobRef>& missing) {
        std::shared_ptr<BlobSource> src = blob_source();
        const BlobRef& br = sb.ref();
        BlobRef entries = sb.ref_field("entries");
        if (!entries.valid()) {
            std::cerr << "index: directory " << br.str() << " has no entries" << std::endl;
            return;
        }
        std::optional<std::string> data;
        if (src) {
            data = src->fetch(entries);
        }
        if (!data) {
            missing.push_back(entries);
            return;
        }
        auto set = SchemaBlob::parse(entries, *data);
        if (!set || set->type() != "static-set") {
            std::cerr << "index: directory " << br.str() << " entries " << entries.str()
                      << " is not a static-set" << std::endl;
            return;
        }
        std::vector<BlobRef> members = set->members();
        std::string name = sb.file_name();
        bm.set(pipes({PFX_FILE_INFO, br.str()}), pipes({std::to_string(members.size()), urle(name), "", ""}));
        for (const auto& child : members) {
            bm.set(pipes({PFX_DIR_CHILD, br.str(), child.str()}), "1");
            bm.set(pipes({PFX_EDGE_BACKWARD, child.str(), br.str(), br.str()}), "directory|" + urle(name));
        }
    }

    static std::optional<BlobMeta> kv_blob_meta(const std::string& k, const std::string& v) {
        const size_t plen = std::string(PFX_META).size();
        if (k.size() <= plen) {
            return std::nullopt;
        }
        auto ref = BlobRef::parse(k.substr(plen));
        size_t pipe = v.find('|');
        if (!ref || pipe == std::string::npos || pipe == 0) {
            return std::nullopt;
        }
        uint64_t size = 0;
        for (size_t i = 0; i < pipe; i++) {
            if (v[i] < '0' || v[i] > '9') {
                return std::nullopt;
            }
            size = size * 10 + static_cast<uint64_t>(v[i] - '0');
            if (size > UINT32_MAX) {
                return std::nullopt;
            }
        }
        return BlobMeta{*ref, static_cast<uint32_t>(size), camli_type_from_mime(v.substr(pipe + 1))};
    }

    static std::optional<Claim> kv_claim(const std::string& k, const std::string& v) {
        auto kp = split_pipes(k);
        auto vp = split_pipes(v);
        if (kp.size() < 5 || vp.size() < 4) {
            return std::nullopt;
        }
        auto signer = BlobRef::parse(vp[3]);
        auto pn = BlobRef::parse(kp[1]);
        auto claim = BlobRef::parse(kp[4]);
        if (!signer || !pn || !claim || !looks_like_time(kp[3])) {
            return std::nullopt;
        }
        Claim c;
        c.blob_ref = *claim;
        c.signer = *signer;
        c.permanode = *pn;
        c.date = kp[3];
        c.type = urld(vp[0]);
        c.attr = urld(vp[1]);
        c.value = urld(vp[2]);
        return c;
    }

    void init_deletes_cache() {
        std::map<BlobRef, std::vector<Deletion>> fresh;
        auto it = query_prefix(*s_, key_prefix({PFX_DELETED}));
        while (it->next()) {
            auto kp = split_pipes(it->key());
            std::optional<BlobRef> target;
            std::optional<BlobRef> deleter;
            if (kp.size() == 4) {
                target = BlobRef::parse(kp[1]);
                deleter = BlobRef::parse(kp[3]);
            }
            if (!target || !deleter) {
                it->close();
                throw IndexError("index: bogus deleted row " + it->key());
            }
            fresh[*target].push_back(Deletion{*deleter, unreverse_time(kp[2])});
        }
        it->close();
        std::unique_lock<std::shared_mutex> lock(deletes_mu_);
        deletes_.clear();
        for (auto& [target, list] : fresh) {
            for (auto& d : list) {
                add_deletion(target, d);
            }
        }
    }

    // Caller holds deletes_mu_ for writing. Keeps each list newest first.
    void add_deletion(const BlobRef& target, const Deletion& d) {
        auto& list = deletes_[target];
        for (const auto& existing : list) {
            if (existing.deleter == d.deleter) {
                return;
            }
        }
        list.push_back(d);
        std::sort(list.begin(), list.end(),
                  [](const Deletion& a, const Deletion& b) { return a.when > b.when; });
    }

    // Caller holds deletes_mu_. Depth bounds cycles in hostile input.
    bool is_deleted_locked(const BlobRef& ref, int depth) const {
        if (depth > 64) {
            return false;
        }
        auto it = deletes_.find(ref);
        if (it == deletes_.end()) {
            return false;
        }
        for (const auto& d : it->second) {
            if (!is_deleted_locked(d.deleter, depth + 1)) {
                return true;
            }
        }
        return false;
    }

    void init_needed_maps() {
        std::vector<std::pair<BlobRef, BlobRef>> pairs;
        auto it = query_prefix(*s_, key_prefix({PFX_MISSING}));
        while (it->next()) {
            auto kp = split_pipes(it->key());
            std::optional<BlobRef> have;
            std::optional<BlobRef> needed;
            if (kp.size() == 3) {
                have = BlobRef::parse(kp[1]);
                needed = BlobRef::parse(kp[2]);
            }
            if (!have || !needed) {
                it->close();
                throw IndexError("index: bogus missing key " + it->key());
            }
            pairs.emplace_back(*have, *needed);
        }
        it->close();
        for (const auto& [have, needed] : pairs) {
            note_needed_memory(have, {needed});
        }
    }

    void note_needed_memory(const BlobRef& have, const std::vector<BlobRef>& missing) {
        std::lock_guard<std::mutex> lock(mu_);
        for (const auto& m : missing) {
            needs_[have].insert(m);
            needed_by_[m].insert(have);
        }
    }

    // Drops arrived from the needs of its waiters and returns the waiters
    // that no longer need anything.
    std::vector<BlobRef> blobs_ready_after(const BlobRef& arrived) {
        std::lock_guard<std::mutex> lock(mu_);
        std::vector<BlobRef> ready;
        auto nb = needed_by_.find(arrived);
        if (nb == needed_by_.end()) {
            needs_.erase(arrived);
            return ready;
        }
        for (const auto& waiter : nb->second) {
            auto n = needs_.find(waiter);
            if (n == needs_.end()) {
                continue;
            }
            n->second.erase(arrived);
            if (n->second.empty()) {
                needs_.erase(n);
                ready.push_back(waiter);
            }
        }
        needed_by_.erase(nb);
        needs_.erase(arrived);
        return ready;
    }

    std::shared_ptr<KeyValue> s_;
    IndexOptions opts_;

    std::mutex mu_;
    std::shared_ptr<BlobSource> blob_source_;
    std::unordered_map<BlobRef, std::set<BlobRef>> needs_;
    std::unordered_map<BlobRef, std::set<BlobRef>> needed_by_;

    std::shared_mutex deletes_mu_;
    std::map<BlobRef, std::vector<Deletion>> deletes_;
};

} // namespace blobdex
