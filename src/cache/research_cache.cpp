#include "vtm/research_cache.hpp"
#include "vtm/platform.hpp"

#include <spdlog/spdlog.h>
#include <openssl/evp.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace vtm {

// ============================================================================
// SHA-256 (OpenSSL EVP)
// ============================================================================

namespace {

class EvpMdCtx {
public:
    EvpMdCtx() : ctx_(EVP_MD_CTX_new()) {}
    ~EvpMdCtx() { if (ctx_) EVP_MD_CTX_free(ctx_); }

    EvpMdCtx(const EvpMdCtx&) = delete;
    EvpMdCtx& operator=(const EvpMdCtx&) = delete;

    EVP_MD_CTX* get() { return ctx_; }
    explicit operator bool() const { return ctx_ != nullptr; }

private:
    EVP_MD_CTX* ctx_;
};

std::string to_hex(const unsigned char* data, size_t len) {
    static const char digits[] = "0123456789abcdef";
    std::string out;
    out.reserve(len * 2);
    for (size_t i = 0; i < len; ++i) {
        out += digits[(data[i] >> 4) & 0x0F];
        out += digits[data[i] & 0x0F];
    }
    return out;
}

const char* kStatsFile = "stats.json";
const char* kEntrySuffix = ".json";

bool ends_with(const std::string& s, const std::string& suffix) {
    return s.size() >= suffix.size() &&
           s.compare(s.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

Sha256Result compute_sha256(const std::string& data) {
    Sha256Result result;

    EvpMdCtx ctx;
    if (!ctx) {
        result.error = "EVP_MD_CTX_new failed";
        return result;
    }
    if (EVP_DigestInit_ex(ctx.get(), EVP_sha256(), nullptr) != 1) {
        result.error = "EVP_DigestInit_ex failed";
        return result;
    }
    if (EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1) {
        result.error = "EVP_DigestUpdate failed";
        return result;
    }

    unsigned char hash[EVP_MAX_MD_SIZE];
    unsigned int hash_len = 0;
    if (EVP_DigestFinal_ex(ctx.get(), hash, &hash_len) != 1) {
        result.error = "EVP_DigestFinal_ex failed";
        return result;
    }

    result.hex_digest = to_hex(hash, hash_len);
    result.ok = true;
    return result;
}

std::string normalize_query(const std::string& query) {
    std::string out;
    out.reserve(query.size());
    bool pending_space = false;
    for (char c : query) {
        auto uc = static_cast<unsigned char>(c);
        if (std::isspace(uc)) {
            pending_space = !out.empty();
            continue;
        }
        if (pending_space) {
            out += ' ';
            pending_space = false;
        }
        out += static_cast<char>(std::tolower(uc));
    }
    return out;
}

std::string cache_key(const std::string& query) {
    auto digest = compute_sha256(normalize_query(query));
    if (!digest.ok) {
        spdlog::warn("cache: cannot hash query: {}", digest.error);
        return "";
    }
    return digest.hex_digest;
}

// ============================================================================
// Entry (de)serialization
// ============================================================================

nlohmann::json cache_entry_to_json(const CacheEntry& entry) {
    nlohmann::json j;
    j["key"] = entry.key;
    j["query"] = entry.query;
    j["result"] = entry.result;
    j["tags"] = entry.tags;
    j["created_at"] = entry.created_at;
    j["ttl_seconds"] = entry.ttl_seconds;
    return j;
}

std::optional<CacheEntry> parse_cache_entry(const nlohmann::json& j) {
    if (!j.is_object()) return std::nullopt;
    if (!j.contains("key") || !j["key"].is_string()) return std::nullopt;
    if (!j.contains("result") || !j["result"].is_string()) return std::nullopt;
    if (!j.contains("created_at") || !j["created_at"].is_string()) return std::nullopt;

    CacheEntry entry;
    entry.key = j["key"].get<std::string>();
    entry.result = j["result"].get<std::string>();
    entry.created_at = j["created_at"].get<std::string>();
    if (j.contains("query") && j["query"].is_string()) {
        entry.query = j["query"].get<std::string>();
    }
    if (j.contains("ttl_seconds") && j["ttl_seconds"].is_number_integer()) {
        entry.ttl_seconds = j["ttl_seconds"].get<int64_t>();
    }
    if (j.contains("tags") && j["tags"].is_array()) {
        for (const auto& tag : j["tags"]) {
            if (tag.is_string()) entry.tags.push_back(tag.get<std::string>());
        }
    }
    return entry;
}

// ============================================================================
// ResearchCache
// ============================================================================

ResearchCache::ResearchCache(std::string dir, int64_t default_ttl_seconds, Clock clock)
    : dir_(std::move(dir)),
      stats_path_(join_path(dir_, kStatsFile)),
      default_ttl_(default_ttl_seconds),
      clock_(std::move(clock)) {}

std::vector<std::string> ResearchCache::entry_files() const {
    std::vector<std::string> files;
    for (const auto& name : list_directory(dir_)) {
        std::string sub = join_path(dir_, name);
        if (!is_directory(sub)) continue;
        for (const auto& file : list_directory(sub)) {
            if (ends_with(file, kEntrySuffix)) {
                files.push_back(join_path(sub, file));
            }
        }
    }
    std::sort(files.begin(), files.end());
    return files;
}

std::optional<ResearchCache::StoredEntry> ResearchCache::read_entry(const std::string& path) const {
    auto content = read_file(path);
    if (!content) {
        spdlog::warn("cache: cannot read {}", path);
        return std::nullopt;
    }
    try {
        auto entry = parse_cache_entry(nlohmann::json::parse(*content));
        if (!entry) {
            spdlog::warn("cache: malformed entry {}", path);
            return std::nullopt;
        }
        return StoredEntry{path, std::move(*entry)};
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("cache: corrupt entry {}: {}", path, e.what());
        return std::nullopt;
    }
}

std::vector<ResearchCache::StoredEntry> ResearchCache::entries() const {
    std::vector<StoredEntry> out;
    for (const auto& path : entry_files()) {
        if (auto stored = read_entry(path)) {
            out.push_back(std::move(*stored));
        }
    }
    return out;
}

std::optional<ResearchCache::StoredEntry> ResearchCache::locate(const std::string& key) const {
    if (key.empty()) return std::nullopt;
    const std::string file = key + kEntrySuffix;
    for (const auto& path : entry_files()) {
        if (ends_with(path, "/" + file)) {
            return read_entry(path);
        }
    }
    return std::nullopt;
}

std::optional<int64_t> ResearchCache::age_seconds(const CacheEntry& entry) const {
    auto created = parse_timestamp(entry.created_at);
    if (!created) return std::nullopt;
    return std::chrono::duration_cast<std::chrono::seconds>(clock_() - *created).count();
}

bool ResearchCache::expired(const CacheEntry& entry) const {
    if (entry.ttl_seconds <= 0) return true;
    auto age = age_seconds(entry);
    if (!age) return true;
    return *age >= entry.ttl_seconds;
}

bool ResearchCache::remove_entry(const std::string& path) const {
    if (!remove_file(path)) {
        spdlog::warn("cache: cannot remove {}", path);
        return false;
    }
    remove_empty_directory(get_parent_directory(path));
    return true;
}

void ResearchCache::count(bool hit) {
    Counters counters = read_counters();
    if (hit) {
        ++counters.hits;
    } else {
        ++counters.misses;
    }

    if (!is_directory(dir_)) {
        auto created = atomic_create_directory(dir_);
        if (!created.ok) {
            spdlog::warn("cache: cannot create {}: {}", dir_, created.error);
            return;
        }
    }
    nlohmann::json j = {{"hits", counters.hits}, {"misses", counters.misses}};
    auto written = atomic_write_file(stats_path_, j.dump(2) + "\n");
    if (!written.ok) {
        spdlog::warn("cache: cannot write {}: {}", stats_path_, written.error);
    }
}

ResearchCache::Counters ResearchCache::read_counters() const {
    Counters counters;
    auto content = read_file(stats_path_);
    if (!content) return counters;

    try {
        auto j = nlohmann::json::parse(*content);
        if (!j.is_object()) {
            spdlog::warn("cache: ignoring malformed {}", stats_path_);
            return counters;
        }
        for (auto* field : {"hits", "misses"}) {
            if (!j.contains(field)) continue;
            if (!j[field].is_number_unsigned()) {
                spdlog::warn("cache: ignoring non-numeric {} in {}", field, stats_path_);
                continue;
            }
            uint64_t value = j[field].get<uint64_t>();
            if (std::string(field) == "hits") {
                counters.hits = value;
            } else {
                counters.misses = value;
            }
        }
    } catch (const nlohmann::json::exception& e) {
        spdlog::warn("cache: ignoring corrupt {}: {}", stats_path_, e.what());
    }
    return counters;
}

std::optional<std::string> ResearchCache::get(const std::string& query) {
    auto stored = locate(cache_key(query));
    if (!stored) {
        count(false);
        return std::nullopt;
    }
    if (expired(stored->entry)) {
        spdlog::debug("cache: expired entry {}", stored->path);
        remove_entry(stored->path);
        count(false);
        return std::nullopt;
    }
    count(true);
    return stored->entry.result;
}

bool ResearchCache::put(const std::string& query, const std::string& result,
                        const std::vector<std::string>& tags, std::optional<int64_t> ttl_seconds) {
    std::string key = cache_key(query);
    if (key.empty()) return false;

    auto now = clock_();
    CacheEntry entry;
    entry.key = key;
    entry.query = query;
    entry.result = result;
    entry.tags = tags;
    entry.created_at = format_timestamp(now);
    entry.ttl_seconds = ttl_seconds.value_or(default_ttl_);

    std::string encoded;
    try {
        encoded = cache_entry_to_json(entry).dump(2) + "\n";
    } catch (const nlohmann::json::type_error& e) {
        spdlog::warn("cache: cannot encode entry for {}: {}", key, e.what());
        return false;
    }

    if (auto existing = locate(key)) {
        remove_entry(existing->path);
    }

    std::string day_dir = join_path(dir_, format_date(now));
    if (!is_directory(day_dir)) {
        auto created = atomic_create_directory(day_dir);
        if (!created.ok) {
            spdlog::warn("cache: cannot create {}: {}", day_dir, created.error);
            return false;
        }
    }

    std::string path = join_path(day_dir, key + kEntrySuffix);
    auto written = atomic_write_file(path, encoded);
    if (!written.ok) {
        spdlog::warn("cache: cannot write {}: {}", path, written.error);
        return false;
    }

    spdlog::debug("cache: stored {}", path);
    return true;
}

bool ResearchCache::has(const std::string& query) const {
    auto stored = locate(cache_key(query));
    return stored && !expired(stored->entry);
}

std::optional<CacheEntry> ResearchCache::info(const std::string& query) const {
    auto stored = locate(cache_key(query));
    if (!stored) return std::nullopt;
    return stored->entry;
}

size_t ResearchCache::clear(std::optional<int> older_than_days) {
    size_t removed = 0;

    if (!older_than_days) {
        for (const auto& path : entry_files()) {
            if (remove_entry(path)) ++removed;
        }
        return removed;
    }

    const int64_t threshold = static_cast<int64_t>(*older_than_days) * 24 * 60 * 60;
    for (const auto& stored : entries()) {
        auto age = age_seconds(stored.entry);
        if (age && *age >= threshold && remove_entry(stored.path)) {
            ++removed;
        }
    }
    return removed;
}

size_t ResearchCache::clear_expired() {
    size_t removed = 0;
    for (const auto& stored : entries()) {
        if (expired(stored.entry) && remove_entry(stored.path)) {
            ++removed;
        }
    }
    return removed;
}

size_t ResearchCache::clear_by_tag(const std::string& tag) {
    size_t removed = 0;
    for (const auto& stored : entries()) {
        const auto& tags = stored.entry.tags;
        if (std::find(tags.begin(), tags.end(), tag) != tags.end() && remove_entry(stored.path)) {
            ++removed;
        }
    }
    return removed;
}

std::vector<CacheEntry> ResearchCache::search(const std::vector<std::string>& tags) const {
    std::vector<CacheEntry> out;
    for (auto& stored : entries()) {
        const auto& have = stored.entry.tags;
        bool all = std::all_of(tags.begin(), tags.end(), [&have](const std::string& t) {
            return std::find(have.begin(), have.end(), t) != have.end();
        });
        if (all) out.push_back(std::move(stored.entry));
    }
    return out;
}

CacheStats ResearchCache::stats() const {
    CacheStats stats;
    Counters counters = read_counters();
    stats.hits = counters.hits;
    stats.misses = counters.misses;

    uint64_t total = stats.hits + stats.misses;
    if (total > 0) {
        double rate = static_cast<double>(stats.hits) * 100.0 / static_cast<double>(total);
        stats.hit_rate = std::round(rate * 100.0) / 100.0;
    }

    for (const auto& path : entry_files()) {
        ++stats.entries;
        stats.total_bytes += file_size(path).value_or(0);
    }
    return stats;
}

} // namespace vtm
