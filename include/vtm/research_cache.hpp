#pragma once

/**
 * @file research_cache.hpp
 * @brief Content-addressed cache for research results
 *
 * Entries are keyed by the SHA-256 of the normalized query and stored as
 * <cache-dir>/<YYYY-MM-DD>/<key>.json, where the date is the UTC creation
 * date. Hit/miss counters persist in <cache-dir>/stats.json.
 *
 * The cache is an optimization: every failure is logged at warn level and
 * treated as a miss or a no-op. No method throws or returns an Error.
 */

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vtm {

// ============================================================================
// Hashing
// ============================================================================

struct Sha256Result {
    bool ok = false;
    std::string hex_digest;
    std::string error;
};

Sha256Result compute_sha256(const std::string& data);

/// Trim, lowercase and collapse internal whitespace to single spaces
std::string normalize_query(const std::string& query);

/// sha256 hex of the normalized query; empty if hashing failed
std::string cache_key(const std::string& query);

// ============================================================================
// Entries
// ============================================================================

struct CacheEntry {
    std::string key;
    std::string query;
    std::string result;
    std::vector<std::string> tags;
    std::string created_at;       // RFC3339 UTC
    int64_t ttl_seconds = 0;
};

nlohmann::json cache_entry_to_json(const CacheEntry& entry);

std::optional<CacheEntry> parse_cache_entry(const nlohmann::json& j);

struct CacheStats {
    uint64_t hits = 0;
    uint64_t misses = 0;
    double hit_rate = 0.0;        // percent, two decimals
    size_t entries = 0;
    std::uintmax_t total_bytes = 0;
};

// ============================================================================
// ResearchCache
// ============================================================================

class ResearchCache {
public:
    using Clock = std::function<std::chrono::system_clock::time_point()>;

    static constexpr int64_t kDefaultTtlSeconds = 30LL * 24 * 60 * 60;

    explicit ResearchCache(std::string dir, int64_t default_ttl_seconds = kDefaultTtlSeconds,
                           Clock clock = [] { return std::chrono::system_clock::now(); });

    /// Result if a live entry exists; counts a hit or a miss. Expired
    /// entries are deleted on the way.
    std::optional<std::string> get(const std::string& query);

    /// Store (or replace) the entry for this query; false if it could not be written
    bool put(const std::string& query, const std::string& result,
             const std::vector<std::string>& tags = {},
             std::optional<int64_t> ttl_seconds = std::nullopt);

    /// Live entry exists; does not touch the counters
    bool has(const std::string& query) const;

    /// Raw entry, expired or not
    std::optional<CacheEntry> info(const std::string& query) const;

    /// Remove every entry, or only those at least `older_than_days` old
    size_t clear(std::optional<int> older_than_days = std::nullopt);

    size_t clear_expired();

    size_t clear_by_tag(const std::string& tag);

    /// Entries carrying every one of `tags`
    std::vector<CacheEntry> search(const std::vector<std::string>& tags) const;

    CacheStats stats() const;

    const std::string& directory() const { return dir_; }
    int64_t default_ttl_seconds() const { return default_ttl_; }

private:
    struct StoredEntry {
        std::string path;
        CacheEntry entry;
    };

    std::vector<std::string> entry_files() const;
    std::optional<StoredEntry> read_entry(const std::string& path) const;
    std::vector<StoredEntry> entries() const;
    std::optional<StoredEntry> locate(const std::string& key) const;

    bool expired(const CacheEntry& entry) const;
    std::optional<int64_t> age_seconds(const CacheEntry& entry) const;
    bool remove_entry(const std::string& path) const;

    struct Counters {
        uint64_t hits = 0;
        uint64_t misses = 0;
    };

    Counters read_counters() const;
    void count(bool hit);

    std::string dir_;
    std::string stats_path_;
    int64_t default_ttl_;
    Clock clock_;
};

} // namespace vtm
