#include "vtm/types.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

namespace vtm {

namespace {

std::string to_lower(const std::string& s) {
    std::string result = s;
    std::transform(result.begin(), result.end(), result.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return result;
}

} // namespace

std::optional<TaskStatus> parse_task_status(const std::string& s) {
    std::string lower = to_lower(s);

    if (lower == "pending") return TaskStatus::Pending;
    if (lower == "in-progress" || lower == "in_progress") return TaskStatus::InProgress;
    if (lower == "completed") return TaskStatus::Completed;
    if (lower == "blocked") return TaskStatus::Blocked;

    return std::nullopt;
}

const Task* Manifest::find_task(const std::string& id) const {
    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [&id](const Task& t) { return t.id == id; });
    return it == tasks.end() ? nullptr : &*it;
}

Task* Manifest::find_task(const std::string& id) {
    auto it = std::find_if(tasks.begin(), tasks.end(),
                           [&id](const Task& t) { return t.id == id; });
    return it == tasks.end() ? nullptr : &*it;
}

} // namespace vtm
