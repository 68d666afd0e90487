#include "vtm/log.hpp"

#include <spdlog/sinks/stdout_color_sinks.h>

#include <algorithm>
#include <cctype>

namespace vtm::log {

std::optional<spdlog::level::level_enum> parse_level(const std::string& name) {
    std::string lower = name;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (lower == "trace") return spdlog::level::trace;
    if (lower == "debug") return spdlog::level::debug;
    if (lower == "info") return spdlog::level::info;
    if (lower == "warn" || lower == "warning") return spdlog::level::warn;
    if (lower == "error" || lower == "err") return spdlog::level::err;
    if (lower == "critical") return spdlog::level::critical;
    if (lower == "off") return spdlog::level::off;
    return std::nullopt;
}

void init(spdlog::level::level_enum level) {
    auto logger = spdlog::get("vtm");
    if (!logger) {
        logger = spdlog::stderr_color_mt("vtm");
        logger->set_pattern("%^[%l]%$ %v");
    }
    logger->set_level(level);
    spdlog::set_default_logger(logger);
    spdlog::set_level(level);
}

} // namespace vtm::log
