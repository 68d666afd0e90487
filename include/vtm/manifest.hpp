#pragma once

#include "vtm/result.hpp"
#include "vtm/types.hpp"

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace vtm {

// ============================================================================
// Task (de)serialization
// ============================================================================

struct TaskParseResult {
    bool ok = false;
    std::string error;
    Task task;
    std::vector<std::string> warnings;
};

// Parse one task object. Requires a non-empty string "id", a string "title"
// and a valid "status"; every other field defaults when absent.
TaskParseResult parse_task(const nlohmann::json& j);

nlohmann::json task_to_json(const Task& task);

// ============================================================================
// Manifest (de)serialization
// ============================================================================

struct ManifestParseResult {
    bool ok = false;
    std::string error;
    Manifest manifest;
    std::vector<std::string> warnings;
};

// Parse a manifest document and run schema checks (required fields,
// duplicate ids). Dependency-graph integrity is the resolver's job.
ManifestParseResult parse_manifest(const std::string& json_str);

// Serialize exactly what is in the struct; callers that persist should use
// encode_manifest() so derived fields are recomputed first. Throws
// nlohmann::json::type_error when a string is not valid UTF-8.
std::string serialize_manifest(const Manifest& manifest);

// ============================================================================
// Derived fields
// ============================================================================

ManifestStats compute_stats(const std::vector<Task>& tasks);

// Rebuild every task's "blocks" list as the inverse of "dependencies",
// in manifest order
void rebuild_blocks(std::vector<Task>& tasks);

// Recompute stats and blocks in place
void normalize_manifest(Manifest& manifest);

// Fails with DUPLICATE_TASK_ID naming the first repeated id
Result<void> check_unique_ids(const std::vector<Task>& tasks);

// normalize + uniqueness check + serialize; text that is not valid UTF-8
// fails with INVALID_ARGUMENT
Result<std::string> encode_manifest(Manifest manifest);

} // namespace vtm
