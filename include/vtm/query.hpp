#pragma once

#include "vtm/result.hpp"
#include "vtm/types.hpp"

#include <nlohmann/json.hpp>

#include <map>
#include <string>
#include <vector>

namespace vtm {

// ============================================================================
// Filtering & Sorting
// ============================================================================

enum class FilterField {
    Status,
    Source,        // substring of adr_source
    Spec,          // substring of spec_source
    Risk,
    TestStrategy,
    Id
};

struct TaskFilter {
    FilterField field = FilterField::Status;
    std::string value;
    TaskStatus status = TaskStatus::Pending;  // parsed value when field == Status

    bool matches(const Task& task) const;
};

/// Parse "field=value"; INVALID_FILTER on an unknown field or bad expression
Result<TaskFilter> parse_filter(const std::string& expr);

/// Tasks matching every filter, manifest order
std::vector<Task> filter_tasks(const std::vector<Task>& tasks,
                               const std::vector<TaskFilter>& filters);

/// Stable sort by id, title, status, risk, hours or source; INVALID_SORT otherwise
Result<std::vector<Task>> sort_tasks(std::vector<Task> tasks, const std::string& field);

// ============================================================================
// Aggregates
// ============================================================================

struct SourceStats {
    int total = 0;
    int completed = 0;
};

/// Per adr_source counts; tasks without a source are grouped under ""
std::map<std::string, SourceStats> stats_by_source(const Manifest& manifest);

struct ManifestSummary {
    std::vector<Task> incomplete_tasks;
    std::vector<std::string> completed_capabilities;  // titles of completed tasks
};

ManifestSummary summarize(const Manifest& manifest);

nlohmann::json summary_to_json(const ManifestSummary& summary);

} // namespace vtm
