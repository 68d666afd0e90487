#include "vtm/resolver.hpp"

#include <algorithm>
#include <cstdint>
#include <stack>
#include <unordered_map>
#include <unordered_set>

namespace vtm {

namespace {

using IndexMap = std::unordered_map<std::string, size_t>;

IndexMap build_index(const std::vector<Task>& tasks) {
    IndexMap index;
    index.reserve(tasks.size());
    for (size_t i = 0; i < tasks.size(); ++i) {
        index.emplace(tasks[i].id, i);
    }
    return index;
}

std::string join_ids(const std::vector<std::string>& ids, const char* sep) {
    std::string out;
    for (size_t i = 0; i < ids.size(); ++i) {
        if (i > 0) out += sep;
        out += ids[i];
    }
    return out;
}

Result<void> check_dangling(const std::vector<Task>& tasks, const IndexMap& index) {
    for (const auto& task : tasks) {
        for (const auto& dep : task.dependencies) {
            if (index.find(dep) == index.end()) {
                return Result<void>::err(Error(
                    ErrorCode::DANGLING_DEPENDENCY,
                    "task " + task.id + " depends on missing task " + dep));
            }
        }
    }
    return Result<void>::ok();
}

// Iterative DFS over id -> dependencies with a recursion stack. On a back
// edge the stack slice from the target to the top is the cycle.
Result<void> check_cycles(const std::vector<Task>& tasks, const IndexMap& index) {
    enum class Color : uint8_t { White, Gray, Black };
    std::vector<Color> color(tasks.size(), Color::White);

    struct Frame {
        size_t node;
        size_t dep_idx;
    };

    for (size_t start = 0; start < tasks.size(); ++start) {
        if (color[start] != Color::White) continue;

        std::vector<Frame> dfs_stack;
        dfs_stack.push_back({start, 0});
        color[start] = Color::Gray;

        while (!dfs_stack.empty()) {
            auto& frame = dfs_stack.back();
            const auto& deps = tasks[frame.node].dependencies;

            if (frame.dep_idx >= deps.size()) {
                color[frame.node] = Color::Black;
                dfs_stack.pop_back();
                continue;
            }

            auto it = index.find(deps[frame.dep_idx]);
            ++frame.dep_idx;
            if (it == index.end()) continue;

            size_t next = it->second;
            if (color[next] == Color::Gray) {
                std::vector<std::string> cycle;
                auto pos = std::find_if(dfs_stack.begin(), dfs_stack.end(),
                                        [next](const Frame& f) { return f.node == next; });
                for (; pos != dfs_stack.end(); ++pos) {
                    cycle.push_back(tasks[pos->node].id);
                }
                cycle.push_back(tasks[next].id);
                return Result<void>::err(Error(
                    ErrorCode::CYCLE_DETECTED,
                    "dependency cycle: " + join_ids(cycle, " -> ")));
            }
            if (color[next] == Color::White) {
                color[next] = Color::Gray;
                dfs_stack.push_back({next, 0});
            }
        }
    }

    return Result<void>::ok();
}

} // namespace

Result<void> validate_graph(const std::vector<Task>& tasks) {
    auto index = build_index(tasks);

    auto dangling = check_dangling(tasks, index);
    if (dangling.isErr()) return dangling;

    return check_cycles(tasks, index);
}

bool dependencies_met(const Task& task, const std::vector<Task>& tasks) {
    for (const auto& dep : task.dependencies) {
        auto it = std::find_if(tasks.begin(), tasks.end(),
                               [&dep](const Task& t) { return t.id == dep; });
        if (it != tasks.end() && it->status != TaskStatus::Completed) {
            return false;
        }
    }
    return true;
}

Result<ReadySet> resolve_ready(const std::vector<Task>& tasks) {
    auto valid = validate_graph(tasks);
    if (valid.isErr()) {
        return Result<ReadySet>::err(valid.error());
    }

    auto index = build_index(tasks);
    ReadySet result;

    for (const auto& task : tasks) {
        if (task.status == TaskStatus::Blocked) {
            result.blocked.push_back(task);
            continue;
        }
        if (task.status != TaskStatus::Pending) continue;

        bool met = std::all_of(task.dependencies.begin(), task.dependencies.end(),
                               [&](const std::string& dep) {
                                   return tasks[index.at(dep)].status == TaskStatus::Completed;
                               });
        if (met) {
            result.ready.push_back(task);
        } else {
            result.blocked.push_back(task);
        }
    }

    return Result<ReadySet>::ok(std::move(result));
}

std::vector<std::string> transitive_dependents(const std::vector<Task>& tasks,
                                               const std::vector<std::string>& roots) {
    std::unordered_map<std::string, std::vector<std::string>> dependents;
    for (const auto& task : tasks) {
        for (const auto& dep : task.dependencies) {
            dependents[dep].push_back(task.id);
        }
    }

    std::unordered_set<std::string> root_set(roots.begin(), roots.end());
    std::unordered_set<std::string> reached;
    std::stack<std::string> pending;
    for (const auto& root : roots) {
        pending.push(root);
    }

    while (!pending.empty()) {
        auto current = pending.top();
        pending.pop();

        auto it = dependents.find(current);
        if (it == dependents.end()) continue;
        for (const auto& dependent : it->second) {
            if (root_set.count(dependent) || !reached.insert(dependent).second) continue;
            pending.push(dependent);
        }
    }

    std::vector<std::string> ordered;
    for (const auto& task : tasks) {
        if (reached.count(task.id)) {
            ordered.push_back(task.id);
        }
    }
    return ordered;
}

} // namespace vtm
