#include "vtm/context.hpp"
#include "vtm/manifest.hpp"

#include <algorithm>
#include <cctype>
#include <sstream>

namespace vtm {

namespace {

constexpr size_t kCompactDescriptionLimit = 160;
constexpr size_t kMinimalDescriptionLimit = 1000;

// Cut at `limit` bytes, backing off to the start of a UTF-8 sequence
std::string truncate(const std::string& text, size_t limit) {
    if (text.size() <= limit) return text;
    size_t cut = limit;
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut) + "...";
}

std::string join(const std::vector<std::string>& items, const char* sep) {
    std::string out;
    for (size_t i = 0; i < items.size(); ++i) {
        if (i > 0) out += sep;
        out += items[i];
    }
    return out;
}

std::string format_hours(double hours) {
    std::ostringstream ss;
    ss << hours;
    return ss.str();
}

void render_file_list(std::ostringstream& out, const char* heading,
                      const std::vector<std::string>& files, bool show_empty) {
    if (files.empty() && !show_empty) return;
    out << "\n## " << heading << "\n";
    if (files.empty()) {
        out << "- (none)\n";
        return;
    }
    for (const auto& f : files) {
        out << "- " << f << "\n";
    }
}

std::string render_compact(const ContextPayload& p) {
    const Task& t = p.task;
    std::ostringstream out;
    out << "Task " << t.id << ": " << t.title << "\n";
    out << "Status: " << task_status_to_string(t.status) << "\n";
    if (!t.description.empty()) {
        out << "Description: " << t.description << "\n";
    }
    out << "Test: " << t.test_strategy << "\n";
    out << "ACs: " << join(t.acceptance_criteria, " | ") << "\n";
    out << "Files: " << join(t.files.create, ", ") << "\n";
    if (!p.completed_dependencies.empty()) {
        std::vector<std::string> ids;
        for (const auto& d : p.completed_dependencies) ids.push_back(d.id);
        out << "Done deps: " << join(ids, ", ") << "\n";
    }
    if (!p.pending_dependencies.empty()) {
        out << "Waiting on: " << join(p.pending_dependencies, ", ") << "\n";
    }
    return out.str();
}

std::string render_brief(const ContextPayload& p) {
    const Task& t = p.task;
    std::ostringstream out;

    out << "# Task Context: " << t.id << "\n\n";
    out << "## Task Details\n";
    out << "**Title**: " << t.title << "\n";
    out << "**Status**: " << task_status_to_string(t.status) << "\n";
    out << "**Test Strategy**: " << t.test_strategy << "\n";
    out << "**Risk**: " << t.risk << "\n";
    out << "**Estimated**: " << format_hours(t.estimated_hours) << "h\n\n";
    out << "**Description**:\n" << t.description << "\n\n";

    out << "## Acceptance Criteria\n";
    for (size_t i = 0; i < t.acceptance_criteria.size(); ++i) {
        out << "- AC" << (i + 1) << ": " << t.acceptance_criteria[i] << "\n";
    }

    if (!p.completed_dependencies.empty()) {
        out << "\n## Dependencies (" << p.completed_dependencies.size() << " completed)\n";
        for (const auto& dep : p.completed_dependencies) {
            out << "- [x] " << dep.id << ": " << dep.title << "\n";
            if (!dep.files_created.empty()) {
                out << "  Files created: " << join(dep.files_created, ", ") << "\n";
            }
        }
    }
    if (!p.pending_dependencies.empty()) {
        out << "\n## Unfinished Dependencies\n";
        for (const auto& id : p.pending_dependencies) {
            out << "- [ ] " << id << "\n";
        }
    }

    render_file_list(out, "Files to Create", t.files.create, true);
    render_file_list(out, "Files to Modify", t.files.modify, false);
    render_file_list(out, "Files to Delete", t.files.remove, false);

    out << "\n## Source Documents\n";
    out << "- ADR: " << t.adr_source << "\n";
    out << "- Spec: " << t.spec_source << "\n";

    if (!t.test_strategy_rationale.empty()) {
        out << "\n## Test Strategy Rationale\n" << t.test_strategy_rationale << "\n";
    }

    if (p.mode == ContextMode::Full) {
        if (!t.commits.empty()) {
            out << "\n## Commits\n";
            for (const auto& c : t.commits) out << "- " << c << "\n";
        }
        if (t.started_at) out << "\nStarted: " << *t.started_at << "\n";
        if (t.completed_at) out << "Completed: " << *t.completed_at << "\n";
    }

    if (!p.blocked_tasks.empty()) {
        out << "\n## Tasks Blocked by This\n";
        for (const auto& b : p.blocked_tasks) {
            out << "- " << b.id << ": " << b.title << "\n";
        }
    }

    return out.str();
}

nlohmann::json dependency_to_json(const DependencySummary& s) {
    return {{"id", s.id}, {"title", s.title}, {"files_created", s.files_created}};
}

} // namespace

const char* context_mode_to_string(ContextMode mode) {
    switch (mode) {
        case ContextMode::Minimal: return "minimal";
        case ContextMode::Compact: return "compact";
        case ContextMode::Full: return "full";
        default: return "minimal";
    }
}

std::optional<ContextMode> parse_context_mode(const std::string& s) {
    std::string lower = s;
    std::transform(lower.begin(), lower.end(), lower.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (lower == "minimal") return ContextMode::Minimal;
    if (lower == "compact") return ContextMode::Compact;
    if (lower == "full") return ContextMode::Full;
    return std::nullopt;
}

Result<ContextPayload> extract_context(const Manifest& manifest, const std::string& id,
                                       ContextMode mode) {
    const Task* task = manifest.find_task(id);
    if (!task) {
        return Result<ContextPayload>::err(
            Error(ErrorCode::TASK_NOT_FOUND, "task " + id + " not found"));
    }

    ContextPayload payload;
    payload.mode = mode;
    payload.task = *task;

    switch (mode) {
        case ContextMode::Compact:
            payload.task.description = truncate(task->description, kCompactDescriptionLimit);
            break;
        case ContextMode::Minimal:
            payload.task.description = truncate(task->description, kMinimalDescriptionLimit);
            break;
        case ContextMode::Full:
            break;
    }

    for (const auto& dep_id : task->dependencies) {
        const Task* dep = manifest.find_task(dep_id);
        if (dep && dep->status == TaskStatus::Completed) {
            payload.completed_dependencies.push_back({dep->id, dep->title, dep->files.create});
        } else {
            payload.pending_dependencies.push_back(dep_id);
        }
    }

    for (const auto& other : manifest.tasks) {
        if (other.status != TaskStatus::Pending) continue;
        if (std::find(other.dependencies.begin(), other.dependencies.end(), id) !=
            other.dependencies.end()) {
            payload.blocked_tasks.push_back({other.id, other.title, other.files.create});
        }
    }

    return Result<ContextPayload>::ok(std::move(payload));
}

std::string render_context(const ContextPayload& payload) {
    if (payload.mode == ContextMode::Compact) {
        return render_compact(payload);
    }
    return render_brief(payload);
}

nlohmann::json context_to_json(const ContextPayload& payload) {
    nlohmann::json j;
    j["mode"] = context_mode_to_string(payload.mode);
    j["task"] = task_to_json(payload.task);

    j["completed_dependencies"] = nlohmann::json::array();
    for (const auto& d : payload.completed_dependencies) {
        j["completed_dependencies"].push_back(dependency_to_json(d));
    }
    j["pending_dependencies"] = payload.pending_dependencies;
    j["blocked_tasks"] = nlohmann::json::array();
    for (const auto& b : payload.blocked_tasks) {
        j["blocked_tasks"].push_back(dependency_to_json(b));
    }
    return j;
}

size_t estimate_tokens(const std::string& text) {
    return (text.size() + 3) / 4;
}

} // namespace vtm
