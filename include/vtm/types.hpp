#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace vtm {

// ============================================================================
// Task Status
// ============================================================================

enum class TaskStatus {
    Pending,
    InProgress,
    Completed,
    Blocked
};

inline const char* task_status_to_string(TaskStatus s) {
    switch (s) {
        case TaskStatus::Pending: return "pending";
        case TaskStatus::InProgress: return "in-progress";
        case TaskStatus::Completed: return "completed";
        case TaskStatus::Blocked: return "blocked";
        default: return "pending";
    }
}

// Accepts "in-progress" and "in_progress"
std::optional<TaskStatus> parse_task_status(const std::string& s);

// ============================================================================
// Task
// ============================================================================

struct TaskFiles {
    std::vector<std::string> create;
    std::vector<std::string> modify;
    std::vector<std::string> remove;  // serialized as "delete"
};

struct TaskValidation {
    bool tests_pass = false;
    std::vector<bool> ac_verified;
};

struct Task {
    std::string id;
    std::string title;
    std::string description;
    std::string adr_source;   // provenance document, used for grouping
    std::string spec_source;

    std::vector<std::string> acceptance_criteria;
    std::vector<std::string> dependencies;
    std::vector<std::string> blocks;  // derived, rebuilt on save

    std::string test_strategy = "TDD";
    std::string test_strategy_rationale;
    double estimated_hours = 0.0;
    std::string risk = "medium";

    TaskFiles files;
    TaskStatus status = TaskStatus::Pending;
    std::optional<std::string> started_at;
    std::optional<std::string> completed_at;
    std::vector<std::string> commits;
    TaskValidation validation;

    // Keys this version does not model, carried through load/save untouched
    nlohmann::json extra = nlohmann::json::object();

    const std::string& source() const { return adr_source; }
};

// ============================================================================
// Manifest
// ============================================================================

struct ManifestStats {
    int total_tasks = 0;
    int completed = 0;
    int in_progress = 0;
    int pending = 0;
    int blocked = 0;
};

struct Manifest {
    std::string version = "1.0.0";
    struct {
        std::string name;
        std::string description;
    } project;
    ManifestStats stats;
    std::vector<Task> tasks;

    const Task* find_task(const std::string& id) const;
    Task* find_task(const std::string& id);
};

} // namespace vtm
