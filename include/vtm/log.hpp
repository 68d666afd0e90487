#pragma once

#include <spdlog/spdlog.h>

#include <optional>
#include <string>

namespace vtm::log {

/// Parse "trace", "debug", "info", "warn", "error", "critical" or "off"
std::optional<spdlog::level::level_enum> parse_level(const std::string& name);

/// Install the "vtm" stderr logger as spdlog's default and set its level.
/// Safe to call more than once.
void init(spdlog::level::level_enum level = spdlog::level::warn);

} // namespace vtm::log
