#include "vtm/config.hpp"
#include "vtm/log.hpp"
#include "vtm/platform.hpp"

#include <nlohmann/json.hpp>

namespace vtm {

namespace {

const char* kDefaultConfigFile = ".vtmrc";

void read_path(const nlohmann::json& section, const char* key, const std::string& base_dir,
               std::string& out, std::vector<std::string>& warnings) {
    if (!section.contains(key)) return;
    const auto& v = section[key];
    if (!v.is_string() || v.get<std::string>().empty()) {
        warnings.push_back(std::string("paths.") + key + " must be a non-empty string, ignored");
        return;
    }
    out = join_path(base_dir, v.get<std::string>());
}

// First non-empty of flag, env
std::optional<std::string> pick(const std::optional<std::string>& flag, const EnvLookup& env,
                                const char* env_name) {
    if (flag && !flag->empty()) return flag;
    auto value = env(env_name);
    if (value && !value->empty()) return value;
    return std::nullopt;
}

} // namespace

ConfigParseResult parse_config(const std::string& json_str, const std::string& base_dir) {
    ConfigParseResult result;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("JSON parse error: ") + e.what();
        return result;
    }
    if (!j.is_object()) {
        result.error = "config must be a JSON object";
        return result;
    }

    Config& config = result.config;

    if (j.contains("paths")) {
        if (j["paths"].is_object()) {
            const auto& paths = j["paths"];
            read_path(paths, "manifest", base_dir, config.manifest_path, result.warnings);
            read_path(paths, "history_dir", base_dir, config.history_dir, result.warnings);
            read_path(paths, "cache_dir", base_dir, config.cache_dir, result.warnings);
        } else {
            result.warnings.push_back("paths must be an object, ignored");
        }
    }

    if (j.contains("cache") && j["cache"].is_object()) {
        const auto& cache = j["cache"];
        if (cache.contains("ttl_days")) {
            if (cache["ttl_days"].is_number_integer() && cache["ttl_days"].get<int>() >= 0) {
                config.cache_ttl_days = cache["ttl_days"].get<int>();
            } else {
                result.warnings.push_back("cache.ttl_days must be a non-negative integer, ignored");
            }
        }
    }

    if (j.contains("log") && j["log"].is_object() && j["log"].contains("level")) {
        const auto& level = j["log"]["level"];
        if (level.is_string() && log::parse_level(level.get<std::string>())) {
            config.log_level = level.get<std::string>();
        } else {
            result.warnings.push_back("log.level is not a known level, ignored");
        }
    }

    result.ok = true;
    return result;
}

ResolvedConfig resolve_config(const ConfigOverrides& overrides, const EnvLookup& env) {
    ResolvedConfig resolved;

    std::string path = overrides.config_path.value_or(kDefaultConfigFile);
    if (path_exists(path)) {
        auto content = read_file(path);
        if (!content) {
            resolved.warnings.push_back("cannot read " + path + ", using defaults");
        } else {
            std::string base = get_parent_directory(path);
            auto parsed = parse_config(*content, base == "." ? "" : base);
            if (parsed.ok) {
                resolved.config = parsed.config;
                resolved.config_file = path;
                for (const auto& w : parsed.warnings) {
                    resolved.warnings.push_back(path + ": " + w);
                }
            } else {
                resolved.warnings.push_back(path + ": " + parsed.error + ", using defaults");
            }
        }
    } else if (overrides.config_path) {
        resolved.warnings.push_back("config file " + path + " not found, using defaults");
    }

    Config& c = resolved.config;
    if (auto v = pick(overrides.manifest_path, env, "VTM_MANIFEST")) c.manifest_path = *v;
    if (auto v = pick(overrides.history_dir, env, "VTM_HISTORY_DIR")) c.history_dir = *v;
    if (auto v = pick(overrides.cache_dir, env, "CACHE_DIR")) c.cache_dir = *v;

    if (auto v = pick(overrides.log_level, env, "VTM_LOG_LEVEL")) {
        if (log::parse_level(*v)) {
            c.log_level = *v;
        } else {
            resolved.warnings.push_back("unknown log level '" + *v + "', keeping " + c.log_level);
        }
    }

    return resolved;
}

ResolvedConfig resolve_config(const ConfigOverrides& overrides) {
    return resolve_config(overrides, [](const std::string& name) { return get_env(name); });
}

} // namespace vtm
