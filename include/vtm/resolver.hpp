#pragma once

#include "vtm/result.hpp"
#include "vtm/types.hpp"

#include <string>
#include <vector>

namespace vtm {

// ============================================================================
// Dependency Resolution
// ============================================================================
//
// Pure functions over a task list. The dependency relation must be acyclic
// and every dependency id must name a task in the list; violations are
// data-integrity errors, never folded into "blocked".

struct ReadySet {
    // pending tasks whose dependencies are all completed, manifest order
    std::vector<Task> ready;
    // pending tasks with an unmet dependency, plus tasks with status blocked
    std::vector<Task> blocked;
};

/// DANGLING_DEPENDENCY or CYCLE_DETECTED, naming the offending ids
Result<void> validate_graph(const std::vector<Task>& tasks);

/// Validate, then partition into ready and blocked sets
Result<ReadySet> resolve_ready(const std::vector<Task>& tasks);

/// True if every dependency of `task` is completed (ignores missing ids)
bool dependencies_met(const Task& task, const std::vector<Task>& tasks);

/// Ids of tasks that transitively depend on any of `roots`, excluding the
/// roots themselves, in manifest order
std::vector<std::string> transitive_dependents(const std::vector<Task>& tasks,
                                               const std::vector<std::string>& roots);

} // namespace vtm
