/**
 * VTM CLI - Common utilities and types
 */

#pragma once

#include <vtm/config.hpp>
#include <vtm/ledger.hpp>
#include <vtm/log.hpp>
#include <vtm/manifest_store.hpp>
#include <vtm/research_cache.hpp>
#include <vtm/result.hpp>
#include <vtm/types.hpp>

#include <nlohmann/json.hpp>

#include <iostream>
#include <optional>
#include <sstream>
#include <string>
#include <vector>

namespace vtm::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string manifest;          // --manifest
    std::string history_dir;       // --history-dir
    std::string cache_dir;         // --cache-dir
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are printed immediately to stderr.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;
    bool quiet = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else if (!quiet) {
            std::cerr << "Warning: " << msg << std::endl;
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode,
                        const std::string& code = "") {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        if (!code.empty()) {
            j["code"] = code;
        }
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

/// Print an engine error and return the exit code for it
inline int report_error(const vtm::Error& error, bool json_mode) {
    print_error(error.message(), json_mode, error_code_to_string(error.code()));
    return exit_code_for(error);
}

/// Usage errors detected by the CLI itself
inline int usage_error(const std::string& msg, bool json_mode) {
    print_error(msg, json_mode, error_code_to_string(ErrorCode::INVALID_ARGUMENT));
    return 1;
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && j.is_object() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline void init_warning_collector(bool json_mode, bool quiet) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
    collector.quiet = quiet;
}

inline std::optional<std::string> non_empty(const std::string& s) {
    if (s.empty()) return std::nullopt;
    return s;
}

/**
 * Resolve configuration and set up logging for one command.
 * Priority per setting: flag > environment > .vtmrc > default.
 */
inline Config load_config(const GlobalOptions& opts) {
    init_warning_collector(opts.json, opts.quiet);

    ConfigOverrides overrides;
    overrides.config_path = non_empty(opts.config);
    overrides.manifest_path = non_empty(opts.manifest);
    overrides.history_dir = non_empty(opts.history_dir);
    overrides.cache_dir = non_empty(opts.cache_dir);
    if (opts.verbose) {
        overrides.log_level = "debug";
    } else if (opts.quiet) {
        overrides.log_level = "error";
    }

    auto resolved = resolve_config(overrides);
    log::init(log::parse_level(resolved.config.log_level).value_or(spdlog::level::warn));

    for (const auto& w : resolved.warnings) {
        print_warning(w);
    }
    return resolved.config;
}

/**
 * Split "a,b,c" into trimmed non-empty items.
 */
inline std::vector<std::string> split_list(const std::string& value) {
    std::vector<std::string> out;
    std::stringstream ss(value);
    std::string item;
    while (std::getline(ss, item, ',')) {
        size_t start = item.find_first_not_of(" \t");
        if (start == std::string::npos) continue;
        size_t end = item.find_last_not_of(" \t");
        out.push_back(item.substr(start, end - start + 1));
    }
    return out;
}

inline std::string join(const std::vector<std::string>& items, const std::string& sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

/**
 * One-line task description used by listings.
 */
inline std::string format_task_line(const Task& task) {
    std::ostringstream out;
    out << task.id << "  [" << task_status_to_string(task.status) << "]  " << task.title;
    if (task.estimated_hours > 0) {
        out << "  (" << task.estimated_hours << "h, " << task.risk << " risk)";
    }
    return out.str();
}

inline nlohmann::json stats_to_json(const ManifestStats& stats) {
    return {{"total_tasks", stats.total_tasks},
            {"completed", stats.completed},
            {"in_progress", stats.in_progress},
            {"pending", stats.pending},
            {"blocked", stats.blocked}};
}

} // namespace vtm::cli
