/**
 * VTM CLI - research cache commands
 *
 * cache-stats, cache-clear, cache-refresh, cache-info, cache-get, cache-put,
 * cache-search
 */

#include "../common.hpp"
#include <vtm/platform.hpp>
#include <vtm/research_cache.hpp>
#include <CLI/CLI.hpp>

#include <iomanip>
#include <iterator>

namespace vtm::cli::commands {

namespace {

struct CacheClearOptions {
    bool confirm = false;
    bool expired = false;
    std::string tag;
    int older_than_days = -1;
};

struct CacheRefreshOptions {
    int age_days = 30;
};

struct CacheQueryOptions {
    std::string query;
};

struct CacheSearchOptions {
    std::vector<std::string> tags;
};

struct CachePutOptions {
    std::string query;
    std::string result_file;
    std::vector<std::string> tags;
    int ttl_days = -1;
};

ResearchCache open_cache(const Config& config) {
    return ResearchCache(config.cache_dir,
                         static_cast<int64_t>(config.cache_ttl_days) * 24 * 60 * 60);
}

std::string format_bytes(std::uintmax_t bytes) {
    std::ostringstream out;
    if (bytes < 1024) {
        out << bytes << " B";
    } else if (bytes < 1024 * 1024) {
        out << std::fixed << std::setprecision(1) << bytes / 1024.0 << " KB";
    } else {
        out << std::fixed << std::setprecision(1) << bytes / (1024.0 * 1024.0) << " MB";
    }
    return out.str();
}

int cmd_cache_stats(const GlobalOptions& opts) {
    auto config = load_config(opts);
    auto cache = open_cache(config);
    auto stats = cache.stats();

    if (opts.json) {
        output_json({{"location", cache.directory()},
                     {"ttl_days", config.cache_ttl_days},
                     {"hits", stats.hits},
                     {"misses", stats.misses},
                     {"hit_rate", stats.hit_rate},
                     {"entries", stats.entries},
                     {"total_bytes", stats.total_bytes}});
        return 0;
    }

    std::cout << "Research Cache Statistics" << std::endl << std::endl;
    std::cout << "Cache Location: " << cache.directory() << std::endl;
    std::cout << "TTL: " << config.cache_ttl_days << " days" << std::endl << std::endl;

    std::cout << "Performance:" << std::endl;
    std::cout << "  Cache hits:   " << stats.hits << std::endl;
    std::cout << "  Cache misses: " << stats.misses << std::endl;
    std::cout << "  Hit rate:     " << std::fixed << std::setprecision(2) << stats.hit_rate
              << "%" << std::endl << std::endl;

    if (stats.entries == 0) {
        std::cout << "Cache is empty" << std::endl;
        return 0;
    }

    std::cout << "Storage:" << std::endl;
    std::cout << "  Total entries: " << stats.entries << std::endl;
    std::cout << "  Total size:    " << format_bytes(stats.total_bytes) << std::endl;
    return 0;
}

int cmd_cache_clear(const GlobalOptions& opts, const CacheClearOptions& clear_opts) {
    auto config = load_config(opts);
    auto cache = open_cache(config);

    size_t removed = 0;
    std::string what;

    if (clear_opts.expired) {
        removed = cache.clear_expired();
        what = "expired";
    } else if (!clear_opts.tag.empty()) {
        removed = cache.clear_by_tag(clear_opts.tag);
        what = "tagged '" + clear_opts.tag + "'";
    } else if (clear_opts.older_than_days >= 0) {
        removed = cache.clear(clear_opts.older_than_days);
        what = "older than " + std::to_string(clear_opts.older_than_days) + " days";
    } else {
        if (!clear_opts.confirm) {
            return usage_error("clearing the whole cache (" +
                               std::to_string(cache.stats().entries) +
                               " entries) requires --confirm", opts.json);
        }
        removed = cache.clear();
        what = "all";
    }

    if (opts.json) {
        output_json({{"ok", true}, {"cleared", removed}, {"selection", what}});
    } else {
        std::cout << "Cleared " << removed << " entries (" << what << ")" << std::endl;
    }
    return 0;
}

int cmd_cache_refresh(const GlobalOptions& opts, const CacheRefreshOptions& refresh_opts) {
    auto config = load_config(opts);
    auto cache = open_cache(config);

    if (refresh_opts.age_days < 0) {
        return usage_error("--age-days must not be negative", opts.json);
    }

    size_t expired = cache.clear_expired();
    size_t aged = cache.clear(refresh_opts.age_days);

    if (opts.json) {
        output_json({{"ok", true}, {"expired", expired}, {"aged", aged}});
    } else {
        std::cout << "Removed " << expired << " expired and " << aged << " entries at least "
                  << refresh_opts.age_days << " days old" << std::endl;
    }
    return 0;
}

int cmd_cache_info(const GlobalOptions& opts, const CacheQueryOptions& q) {
    auto config = load_config(opts);
    auto cache = open_cache(config);

    auto entry = cache.info(q.query);
    bool live = entry && cache.has(q.query);

    if (opts.json) {
        nlohmann::json j;
        j["key"] = cache_key(q.query);
        j["cached"] = entry.has_value();
        j["live"] = live;
        if (entry) {
            j["entry"] = cache_entry_to_json(*entry);
        }
        output_json(j);
        return 0;
    }

    std::cout << "Key: " << cache_key(q.query) << std::endl;
    if (!entry) {
        std::cout << "Not cached" << std::endl;
        return 0;
    }
    std::cout << "Created: " << entry->created_at << std::endl;
    std::cout << "TTL: " << entry->ttl_seconds << "s" << (live ? "" : " (expired)") << std::endl;
    if (!entry->tags.empty()) {
        std::cout << "Tags: " << join(entry->tags, ", ") << std::endl;
    }
    std::cout << "Size: " << entry->result.size() << " chars" << std::endl;
    return 0;
}

int cmd_cache_get(const GlobalOptions& opts, const CacheQueryOptions& q) {
    auto config = load_config(opts);
    auto cache = open_cache(config);

    auto result = cache.get(q.query);

    if (opts.json) {
        nlohmann::json j;
        j["hit"] = result.has_value();
        if (result) {
            j["result"] = *result;
        }
        output_json(j);
        return 0;
    }

    // A miss is not an error; callers test for empty output
    if (result) {
        std::cout << *result;
        if (!result->empty() && result->back() != '\n') std::cout << std::endl;
    }
    return 0;
}

int cmd_cache_put(const GlobalOptions& opts, const CachePutOptions& put_opts) {
    auto config = load_config(opts);
    auto cache = open_cache(config);

    std::optional<std::string> content;
    if (put_opts.result_file.empty() || put_opts.result_file == "-") {
        content = std::string(std::istreambuf_iterator<char>(std::cin),
                              std::istreambuf_iterator<char>());
    } else {
        content = read_file(put_opts.result_file);
    }
    if (!content) {
        return report_error(Error(ErrorCode::IO_ERROR, "cannot read " + put_opts.result_file),
                            opts.json);
    }

    std::optional<int64_t> ttl;
    if (put_opts.ttl_days >= 0) {
        ttl = static_cast<int64_t>(put_opts.ttl_days) * 24 * 60 * 60;
    }

    bool stored = cache.put(put_opts.query, *content, put_opts.tags, ttl);

    if (opts.json) {
        output_json({{"ok", true}, {"stored", stored}, {"key", cache_key(put_opts.query)}});
    } else if (stored) {
        std::cout << "Cached " << cache_key(put_opts.query) << std::endl;
    } else {
        print_warning("result was not cached");
    }
    return 0;
}

int cmd_cache_search(const GlobalOptions& opts, const CacheSearchOptions& search_opts) {
    auto config = load_config(opts);
    auto cache = open_cache(config);

    auto found = cache.search(search_opts.tags);

    if (opts.json) {
        nlohmann::json j;
        j["entries"] = nlohmann::json::array();
        for (const auto& entry : found) {
            nlohmann::json e = cache_entry_to_json(entry);
            e.erase("result");
            j["entries"].push_back(e);
        }
        output_json(j);
        return 0;
    }

    if (found.empty()) {
        std::cout << "No matching entries" << std::endl;
        return 0;
    }
    for (const auto& entry : found) {
        std::cout << entry.created_at.substr(0, 10) << "  " << entry.query;
        if (!entry.tags.empty()) {
            std::cout << "  [" << join(entry.tags, ", ") << "]";
        }
        std::cout << std::endl;
    }
    return 0;
}

} // namespace

void register_cache_commands(CLI::App& app, GlobalOptions& opts) {
    static CacheClearOptions clear_opts;
    static CacheRefreshOptions refresh_opts;
    static CacheQueryOptions info_opts;
    static CacheQueryOptions get_opts;
    static CachePutOptions put_opts;
    static CacheSearchOptions search_opts;

    auto* stats_cmd = app.add_subcommand("cache-stats", "Show research cache statistics");
    stats_cmd->callback([&opts]() {
        std::exit(cmd_cache_stats(opts));
    });

    auto* clear_cmd = app.add_subcommand("cache-clear", "Remove research cache entries");
    clear_cmd->add_flag("--confirm", clear_opts.confirm, "Required to clear everything");
    clear_cmd->add_flag("--expired", clear_opts.expired, "Only entries past their TTL");
    clear_cmd->add_option("--tag", clear_opts.tag, "Only entries with this tag");
    clear_cmd->add_option("--older-than-days", clear_opts.older_than_days,
                          "Only entries at least N days old");
    clear_cmd->callback([&opts]() {
        std::exit(cmd_cache_clear(opts, clear_opts));
    });

    auto* refresh_cmd = app.add_subcommand("cache-refresh",
                                           "Remove expired and aged research cache entries");
    refresh_cmd->add_option("--age-days", refresh_opts.age_days,
                            "Also remove entries at least N days old (default 30)");
    refresh_cmd->callback([&opts]() {
        std::exit(cmd_cache_refresh(opts, refresh_opts));
    });

    auto* info_cmd = app.add_subcommand("cache-info", "Show the cache entry for a query");
    info_cmd->add_option("query", info_opts.query, "Research query")->required();
    info_cmd->callback([&opts]() {
        std::exit(cmd_cache_info(opts, info_opts));
    });

    auto* get_cmd = app.add_subcommand("cache-get", "Print a cached result");
    get_cmd->add_option("query", get_opts.query, "Research query")->required();
    get_cmd->callback([&opts]() {
        std::exit(cmd_cache_get(opts, get_opts));
    });

    auto* put_cmd = app.add_subcommand("cache-put", "Store a research result");
    put_cmd->add_option("query", put_opts.query, "Research query")->required();
    put_cmd->add_option("--result-file", put_opts.result_file, "Result file ('-' or unset: stdin)");
    put_cmd->add_option("--tag", put_opts.tags, "Tag (repeatable)");
    put_cmd->add_option("--ttl-days", put_opts.ttl_days, "Override the default TTL");
    put_cmd->callback([&opts]() {
        std::exit(cmd_cache_put(opts, put_opts));
    });

    auto* search_cmd = app.add_subcommand("cache-search", "List entries carrying every tag");
    search_cmd->add_option("--tag", search_opts.tags, "Tag (repeatable)");
    search_cmd->callback([&opts]() {
        std::exit(cmd_cache_search(opts, search_opts));
    });
}

} // namespace vtm::cli::commands
