#include "vtm/query.hpp"

#include <algorithm>
#include <cctype>

namespace vtm {

namespace {

std::string to_lower(std::string s) {
    std::transform(s.begin(), s.end(), s.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return s;
}

std::string trim(const std::string& s) {
    size_t start = s.find_first_not_of(" \t");
    if (start == std::string::npos) return "";
    size_t end = s.find_last_not_of(" \t");
    return s.substr(start, end - start + 1);
}

// highest risk first, unknown values last
int risk_rank(const std::string& risk) {
    std::string r = to_lower(risk);
    if (r == "high") return 0;
    if (r == "medium") return 1;
    if (r == "low") return 2;
    return 3;
}

int status_rank(TaskStatus s) {
    switch (s) {
        case TaskStatus::InProgress: return 0;
        case TaskStatus::Pending: return 1;
        case TaskStatus::Blocked: return 2;
        case TaskStatus::Completed: return 3;
        default: return 4;
    }
}

// "TASK-002" sorts before "TASK-010"
bool id_less(const std::string& a, const std::string& b) {
    size_t i = 0;
    size_t j = 0;
    while (i < a.size() && j < b.size()) {
        if (std::isdigit(static_cast<unsigned char>(a[i])) &&
            std::isdigit(static_cast<unsigned char>(b[j]))) {
            size_t ei = i;
            size_t ej = j;
            while (ei < a.size() && std::isdigit(static_cast<unsigned char>(a[ei]))) ++ei;
            while (ej < b.size() && std::isdigit(static_cast<unsigned char>(b[ej]))) ++ej;
            std::string na = a.substr(i, ei - i);
            std::string nb = b.substr(j, ej - j);
            na.erase(0, std::min(na.find_first_not_of('0'), na.size()));
            nb.erase(0, std::min(nb.find_first_not_of('0'), nb.size()));
            if (na.size() != nb.size()) return na.size() < nb.size();
            if (na != nb) return na < nb;
            i = ei;
            j = ej;
            continue;
        }
        if (a[i] != b[j]) return a[i] < b[j];
        ++i;
        ++j;
    }
    return (a.size() - i) < (b.size() - j);
}

} // namespace

bool TaskFilter::matches(const Task& task) const {
    switch (field) {
        case FilterField::Status:
            return task.status == status;
        case FilterField::Source:
            return task.adr_source.find(value) != std::string::npos;
        case FilterField::Spec:
            return task.spec_source.find(value) != std::string::npos;
        case FilterField::Risk:
            return to_lower(task.risk) == to_lower(value);
        case FilterField::TestStrategy:
            return to_lower(task.test_strategy) == to_lower(value);
        case FilterField::Id:
            return task.id == value;
    }
    return false;
}

Result<TaskFilter> parse_filter(const std::string& expr) {
    auto eq = expr.find('=');
    if (eq == std::string::npos) {
        return Result<TaskFilter>::err(Error(ErrorCode::INVALID_FILTER,
                                             "expected field=value, got '" + expr + "'"));
    }

    std::string field = to_lower(trim(expr.substr(0, eq)));
    std::string value = trim(expr.substr(eq + 1));
    if (field.empty() || value.empty()) {
        return Result<TaskFilter>::err(Error(ErrorCode::INVALID_FILTER,
                                             "expected field=value, got '" + expr + "'"));
    }

    TaskFilter filter;
    filter.value = value;

    if (field == "status") {
        auto status = parse_task_status(value);
        if (!status) {
            return Result<TaskFilter>::err(Error(ErrorCode::INVALID_FILTER,
                                                 "unknown status '" + value + "'"));
        }
        filter.field = FilterField::Status;
        filter.status = *status;
    } else if (field == "source" || field == "adr" || field == "adr_source") {
        filter.field = FilterField::Source;
    } else if (field == "spec" || field == "spec_source") {
        filter.field = FilterField::Spec;
    } else if (field == "risk") {
        filter.field = FilterField::Risk;
    } else if (field == "test_strategy" || field == "strategy") {
        filter.field = FilterField::TestStrategy;
    } else if (field == "id") {
        filter.field = FilterField::Id;
    } else {
        return Result<TaskFilter>::err(Error(
            ErrorCode::INVALID_FILTER,
            "unknown filter field '" + field +
            "' (expected status, source, spec, risk, test_strategy or id)"));
    }

    return Result<TaskFilter>::ok(filter);
}

std::vector<Task> filter_tasks(const std::vector<Task>& tasks,
                               const std::vector<TaskFilter>& filters) {
    std::vector<Task> out;
    for (const auto& task : tasks) {
        bool keep = std::all_of(filters.begin(), filters.end(),
                                [&task](const TaskFilter& f) { return f.matches(task); });
        if (keep) out.push_back(task);
    }
    return out;
}

Result<std::vector<Task>> sort_tasks(std::vector<Task> tasks, const std::string& field) {
    std::string key = to_lower(field);

    if (key == "id") {
        std::stable_sort(tasks.begin(), tasks.end(),
                         [](const Task& a, const Task& b) { return id_less(a.id, b.id); });
    } else if (key == "title") {
        std::stable_sort(tasks.begin(), tasks.end(),
                         [](const Task& a, const Task& b) { return a.title < b.title; });
    } else if (key == "status") {
        std::stable_sort(tasks.begin(), tasks.end(), [](const Task& a, const Task& b) {
            return status_rank(a.status) < status_rank(b.status);
        });
    } else if (key == "risk") {
        std::stable_sort(tasks.begin(), tasks.end(), [](const Task& a, const Task& b) {
            return risk_rank(a.risk) < risk_rank(b.risk);
        });
    } else if (key == "hours" || key == "estimated_hours") {
        std::stable_sort(tasks.begin(), tasks.end(), [](const Task& a, const Task& b) {
            return a.estimated_hours < b.estimated_hours;
        });
    } else if (key == "source") {
        std::stable_sort(tasks.begin(), tasks.end(),
                         [](const Task& a, const Task& b) { return a.adr_source < b.adr_source; });
    } else {
        return Result<std::vector<Task>>::err(Error(
            ErrorCode::INVALID_SORT,
            "unknown sort field '" + field + "' (expected id, title, status, risk, hours or source)"));
    }

    return Result<std::vector<Task>>::ok(std::move(tasks));
}

std::map<std::string, SourceStats> stats_by_source(const Manifest& manifest) {
    std::map<std::string, SourceStats> out;
    for (const auto& task : manifest.tasks) {
        auto& s = out[task.adr_source];
        ++s.total;
        if (task.status == TaskStatus::Completed) ++s.completed;
    }
    return out;
}

ManifestSummary summarize(const Manifest& manifest) {
    ManifestSummary summary;
    for (const auto& task : manifest.tasks) {
        if (task.status == TaskStatus::Completed) {
            summary.completed_capabilities.push_back(task.title);
        } else {
            summary.incomplete_tasks.push_back(task);
        }
    }
    return summary;
}

nlohmann::json summary_to_json(const ManifestSummary& summary) {
    nlohmann::json j;
    j["incomplete_tasks"] = nlohmann::json::array();
    for (const auto& task : summary.incomplete_tasks) {
        nlohmann::json t;
        t["id"] = task.id;
        t["title"] = task.title;
        t["description"] = task.description;
        t["status"] = task_status_to_string(task.status);
        t["estimated_hours"] = task.estimated_hours;
        t["risk"] = task.risk;
        t["test_strategy"] = task.test_strategy;
        if (!task.dependencies.empty()) {
            t["dependencies"] = task.dependencies;
        }
        j["incomplete_tasks"].push_back(t);
    }
    j["completed_capabilities"] = summary.completed_capabilities;
    return j;
}

} // namespace vtm
