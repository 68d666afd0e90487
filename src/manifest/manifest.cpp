#include "vtm/manifest.hpp"

#include <cctype>
#include <optional>
#include <unordered_map>
#include <unordered_set>

namespace vtm {

namespace {

// Keys modeled by Task; anything else is preserved in Task::extra
const std::unordered_set<std::string>& known_task_keys() {
    static const std::unordered_set<std::string> keys = {
        "id", "title", "description", "adr_source", "spec_source",
        "acceptance_criteria", "dependencies", "blocks", "test_strategy",
        "test_strategy_rationale", "estimated_hours", "risk", "files",
        "status", "started_at", "completed_at", "commits", "validation",
    };
    return keys;
}

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Missing or null is fine; anything else must be a string array
bool get_string_array(const nlohmann::json& j, const std::string& key,
                      std::vector<std::string>& out, std::string& error) {
    out.clear();
    if (!j.contains(key) || j[key].is_null()) return true;
    if (!j[key].is_array()) {
        error = key + " must be an array";
        return false;
    }
    for (const auto& elem : j[key]) {
        if (!elem.is_string()) {
            error = key + " must contain only strings";
            return false;
        }
        out.push_back(elem.get<std::string>());
    }
    return true;
}

std::optional<std::string> get_nullable_timestamp(const nlohmann::json& j, const std::string& key) {
    if (auto s = get_string(j, key)) {
        if (!trim(*s).empty()) return s;
    }
    return std::nullopt;
}

nlohmann::json nullable(const std::optional<std::string>& value) {
    if (value) return *value;
    return nullptr;
}

} // namespace

TaskParseResult parse_task(const nlohmann::json& j) {
    TaskParseResult result;

    if (!j.is_object()) {
        result.error = "task entry must be an object";
        return result;
    }

    auto id = get_string(j, "id");
    if (!id || trim(*id).empty()) {
        result.error = "task id missing or empty";
        return result;
    }
    result.task.id = *id;
    const std::string where = "task " + *id + ": ";

    if (auto title = get_string(j, "title")) {
        result.task.title = *title;
    } else {
        result.error = where + "title missing";
        return result;
    }

    if (auto status = get_string(j, "status")) {
        auto parsed = parse_task_status(*status);
        if (!parsed) {
            result.error = where + "invalid status '" + *status + "'";
            return result;
        }
        result.task.status = *parsed;
    } else {
        result.error = where + "status missing";
        return result;
    }

    if (auto v = get_string(j, "description")) result.task.description = *v;
    if (auto v = get_string(j, "adr_source")) result.task.adr_source = *v;
    if (auto v = get_string(j, "spec_source")) result.task.spec_source = *v;
    if (auto v = get_string(j, "test_strategy")) result.task.test_strategy = *v;
    if (auto v = get_string(j, "test_strategy_rationale")) result.task.test_strategy_rationale = *v;
    if (auto v = get_string(j, "risk")) result.task.risk = *v;

    if (j.contains("estimated_hours")) {
        if (j["estimated_hours"].is_number()) {
            result.task.estimated_hours = j["estimated_hours"].get<double>();
        } else if (!j["estimated_hours"].is_null()) {
            result.warnings.push_back(where + "estimated_hours is not a number, using 0");
        }
    }

    std::string field_error;
    if (!get_string_array(j, "acceptance_criteria", result.task.acceptance_criteria, field_error) ||
        !get_string_array(j, "dependencies", result.task.dependencies, field_error) ||
        !get_string_array(j, "commits", result.task.commits, field_error)) {
        result.error = where + field_error;
        return result;
    }

    // "blocks" is derived; read leniently so the value round-trips until
    // the next save rebuilds it
    std::vector<std::string> blocks;
    if (get_string_array(j, "blocks", blocks, field_error)) {
        result.task.blocks = std::move(blocks);
    }

    if (j.contains("files") && j["files"].is_object()) {
        const auto& files = j["files"];
        if (!get_string_array(files, "create", result.task.files.create, field_error) ||
            !get_string_array(files, "modify", result.task.files.modify, field_error) ||
            !get_string_array(files, "delete", result.task.files.remove, field_error)) {
            result.error = where + "files." + field_error;
            return result;
        }
    }

    result.task.started_at = get_nullable_timestamp(j, "started_at");
    result.task.completed_at = get_nullable_timestamp(j, "completed_at");

    if (j.contains("validation") && j["validation"].is_object()) {
        const auto& validation = j["validation"];
        if (validation.contains("tests_pass") && validation["tests_pass"].is_boolean()) {
            result.task.validation.tests_pass = validation["tests_pass"].get<bool>();
        }
        if (validation.contains("ac_verified") && validation["ac_verified"].is_array()) {
            for (const auto& elem : validation["ac_verified"]) {
                if (elem.is_boolean()) {
                    result.task.validation.ac_verified.push_back(elem.get<bool>());
                } else {
                    // Older manifests listed the verified criterion text
                    result.task.validation.ac_verified.push_back(true);
                }
            }
        }
    }

    for (auto& [key, val] : j.items()) {
        if (known_task_keys().count(key) == 0) {
            result.task.extra[key] = val;
        }
    }

    result.ok = true;
    return result;
}

nlohmann::json task_to_json(const Task& task) {
    nlohmann::json j = task.extra.is_object() ? task.extra : nlohmann::json::object();

    j["id"] = task.id;
    j["title"] = task.title;
    j["description"] = task.description;
    j["adr_source"] = task.adr_source;
    j["spec_source"] = task.spec_source;
    j["acceptance_criteria"] = task.acceptance_criteria;
    j["dependencies"] = task.dependencies;
    j["blocks"] = task.blocks;
    j["test_strategy"] = task.test_strategy;
    j["test_strategy_rationale"] = task.test_strategy_rationale;
    j["estimated_hours"] = task.estimated_hours;
    j["risk"] = task.risk;
    j["files"] = {
        {"create", task.files.create},
        {"modify", task.files.modify},
        {"delete", task.files.remove},
    };
    j["status"] = task_status_to_string(task.status);
    j["started_at"] = nullable(task.started_at);
    j["completed_at"] = nullable(task.completed_at);
    j["commits"] = task.commits;
    j["validation"] = {
        {"tests_pass", task.validation.tests_pass},
        {"ac_verified", task.validation.ac_verified},
    };

    return j;
}

ManifestParseResult parse_manifest(const std::string& json_str) {
    ManifestParseResult result;

    try {
        auto j = nlohmann::json::parse(json_str);

        if (!j.is_object()) {
            result.error = "manifest must be a JSON object";
            return result;
        }

        if (auto version = get_string(j, "version")) {
            result.manifest.version = *version;
        } else {
            result.error = "version missing";
            return result;
        }

        if (j.contains("project") && j["project"].is_object()) {
            const auto& project = j["project"];
            if (auto name = get_string(project, "name")) {
                result.manifest.project.name = *name;
            }
            if (auto desc = get_string(project, "description")) {
                result.manifest.project.description = *desc;
            }
        }

        if (!j.contains("tasks") || !j["tasks"].is_array()) {
            result.error = "tasks missing or not an array";
            return result;
        }

        std::unordered_set<std::string> seen;
        for (const auto& entry : j["tasks"]) {
            auto parsed = parse_task(entry);
            if (!parsed.ok) {
                result.error = parsed.error;
                return result;
            }
            if (!seen.insert(parsed.task.id).second) {
                result.error = "duplicate task id " + parsed.task.id;
                return result;
            }
            for (auto& w : parsed.warnings) {
                result.warnings.push_back(std::move(w));
            }
            result.manifest.tasks.push_back(std::move(parsed.task));
        }

        // Stored stats are informational only; the in-memory copy is
        // always derived
        result.manifest.stats = compute_stats(result.manifest.tasks);

        result.ok = true;
        return result;

    } catch (const nlohmann::json::parse_error& e) {
        result.error = std::string("parse error: ") + e.what();
        return result;
    } catch (const nlohmann::json::exception& e) {
        result.error = std::string("JSON error: ") + e.what();
        return result;
    }
}

std::string serialize_manifest(const Manifest& manifest) {
    nlohmann::json j;
    j["version"] = manifest.version;
    j["project"] = {
        {"name", manifest.project.name},
        {"description", manifest.project.description},
    };
    j["stats"] = {
        {"total_tasks", manifest.stats.total_tasks},
        {"completed", manifest.stats.completed},
        {"in_progress", manifest.stats.in_progress},
        {"pending", manifest.stats.pending},
        {"blocked", manifest.stats.blocked},
    };

    nlohmann::json tasks = nlohmann::json::array();
    for (const auto& task : manifest.tasks) {
        tasks.push_back(task_to_json(task));
    }
    j["tasks"] = std::move(tasks);

    return j.dump(2) + "\n";
}

ManifestStats compute_stats(const std::vector<Task>& tasks) {
    ManifestStats stats;
    stats.total_tasks = static_cast<int>(tasks.size());
    for (const auto& task : tasks) {
        switch (task.status) {
            case TaskStatus::Pending: ++stats.pending; break;
            case TaskStatus::InProgress: ++stats.in_progress; break;
            case TaskStatus::Completed: ++stats.completed; break;
            case TaskStatus::Blocked: ++stats.blocked; break;
        }
    }
    return stats;
}

void rebuild_blocks(std::vector<Task>& tasks) {
    std::unordered_map<std::string, size_t> index;
    for (size_t i = 0; i < tasks.size(); ++i) {
        tasks[i].blocks.clear();
        index.emplace(tasks[i].id, i);
    }

    for (const auto& task : tasks) {
        for (const auto& dep : task.dependencies) {
            auto it = index.find(dep);
            if (it == index.end()) continue;
            auto& blocks = tasks[it->second].blocks;
            if (blocks.empty() || blocks.back() != task.id) {
                blocks.push_back(task.id);
            }
        }
    }
}

void normalize_manifest(Manifest& manifest) {
    rebuild_blocks(manifest.tasks);
    manifest.stats = compute_stats(manifest.tasks);
}

Result<void> check_unique_ids(const std::vector<Task>& tasks) {
    std::unordered_set<std::string> seen;
    for (const auto& task : tasks) {
        if (!seen.insert(task.id).second) {
            return Result<void>::err(Error(ErrorCode::DUPLICATE_TASK_ID,
                                           "duplicate task id " + task.id));
        }
    }
    return Result<void>::ok();
}

Result<std::string> encode_manifest(Manifest manifest) {
    auto unique = check_unique_ids(manifest.tasks);
    if (unique.isErr()) {
        return Result<std::string>::err(unique.error());
    }
    normalize_manifest(manifest);
    try {
        return Result<std::string>::ok(serialize_manifest(manifest));
    } catch (const nlohmann::json::type_error& e) {
        return Result<std::string>::err(
            Error(ErrorCode::INVALID_ARGUMENT,
                  std::string("manifest text is not valid UTF-8: ") + e.what()));
    }
}

} // namespace vtm
