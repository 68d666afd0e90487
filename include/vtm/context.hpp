#pragma once

#include "vtm/result.hpp"
#include "vtm/types.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace vtm {

// ============================================================================
// Task Context
// ============================================================================
//
// Read-only projection of one task together with what an implementer needs
// from its neighbours: the completed dependencies and what they produced.

enum class ContextMode {
    Minimal,  // full markdown brief, description capped at 1000 chars
    Compact,  // a few lines, description capped at 160 chars
    Full      // everything, no truncation
};

const char* context_mode_to_string(ContextMode mode);

std::optional<ContextMode> parse_context_mode(const std::string& s);

struct DependencySummary {
    std::string id;
    std::string title;
    std::vector<std::string> files_created;
};

struct ContextPayload {
    ContextMode mode = ContextMode::Minimal;
    Task task;                                       // description already truncated
    std::vector<DependencySummary> completed_dependencies;
    std::vector<std::string> pending_dependencies;   // ids not yet completed
    std::vector<DependencySummary> blocked_tasks;    // pending tasks waiting on this one
};

/// TASK_NOT_FOUND if the id is absent; never mutates the manifest
Result<ContextPayload> extract_context(const Manifest& manifest, const std::string& id,
                                       ContextMode mode = ContextMode::Minimal);

std::string render_context(const ContextPayload& payload);

nlohmann::json context_to_json(const ContextPayload& payload);

/// Rough token count of rendered text (about four characters per token)
size_t estimate_tokens(const std::string& text);

} // namespace vtm
