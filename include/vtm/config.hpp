#pragma once

/**
 * @file config.hpp
 * @brief Path and logging settings from .vtmrc, environment and flags
 *
 * Each setting resolves independently:
 *   CLI flag > environment variable > .vtmrc > built-in default
 *
 * Environment variables: VTM_MANIFEST, VTM_HISTORY_DIR, CACHE_DIR,
 * VTM_LOG_LEVEL.
 */

#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace vtm {

struct Config {
    std::string manifest_path = "vtm.json";
    std::string history_dir = ".vtm-history";
    std::string cache_dir = ".claude/cache/research";
    int cache_ttl_days = 30;
    std::string log_level = "warn";
};

struct ConfigParseResult {
    bool ok = false;
    std::string error;
    Config config;
    std::vector<std::string> warnings;
};

/// Parse a .vtmrc document on top of the defaults. Relative paths are
/// resolved against `base_dir`.
ConfigParseResult parse_config(const std::string& json_str, const std::string& base_dir = "");

struct ConfigOverrides {
    std::optional<std::string> config_path;   // --config, else ./.vtmrc
    std::optional<std::string> manifest_path;
    std::optional<std::string> history_dir;
    std::optional<std::string> cache_dir;
    std::optional<std::string> log_level;
};

struct ResolvedConfig {
    Config config;
    std::string config_file;             // .vtmrc actually read, empty if none
    std::vector<std::string> warnings;   // malformed .vtmrc and similar
};

using EnvLookup = std::function<std::optional<std::string>(const std::string&)>;

/// Never fails; problems with .vtmrc become warnings and defaults
ResolvedConfig resolve_config(const ConfigOverrides& overrides, const EnvLookup& env);

ResolvedConfig resolve_config(const ConfigOverrides& overrides);

} // namespace vtm
