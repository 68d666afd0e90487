#include "vtm/ingest.hpp"
#include "vtm/manifest.hpp"
#include "vtm/resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <unordered_set>

namespace vtm {

namespace {

// Fields only the mutator may set; a fresh task never carries them
const char* kLifecycleKeys[] = {"started_at", "completed_at", "commits", "validation", "blocks"};

Error batch_error(size_t index, const std::string& msg) {
    return Error(ErrorCode::INVALID_BATCH, "draft #" + std::to_string(index) + ": " + msg);
}

const char* const kTestStrategies[] = {"TDD", "Unit", "Integration", "Direct"};
const char* const kRisks[] = {"low", "medium", "high"};

template <size_t N>
std::string join_choices(const char* const (&choices)[N]) {
    std::string out;
    for (const char* choice : choices) {
        if (!out.empty()) out += ", ";
        out += choice;
    }
    return out;
}

// Absent keeps the task default; present must be one of `choices` exactly
template <size_t N>
bool check_choice(const nlohmann::json& draft, const char* field,
                  const char* const (&choices)[N], std::string& error) {
    if (!draft.contains(field) || draft[field].is_null()) return true;
    const auto& value = draft[field];
    if (value.is_string()) {
        for (const char* choice : choices) {
            if (value.get<std::string>() == choice) return true;
        }
    }
    error = std::string("invalid ") + field + " " + value.dump() + ", expected one of " +
            join_choices(choices);
    return false;
}

// Field checks the manifest schema leaves optional but a generated draft
// must satisfy
bool check_draft(const nlohmann::json& draft, std::string& error) {
    if (!draft.contains("description") || !draft["description"].is_string() ||
        draft["description"].get<std::string>().empty()) {
        error = "description required";
        return false;
    }
    return check_choice(draft, "test_strategy", kTestStrategies, error) &&
           check_choice(draft, "risk", kRisks, error);
}

} // namespace

Result<nlohmann::json> parse_drafts(const std::string& content) {
    try {
        auto j = nlohmann::json::parse(content);
        if (j.is_object() && j.contains("tasks")) {
            j = j["tasks"];
        }
        if (!j.is_array()) {
            return Result<nlohmann::json>::err(Error(
                ErrorCode::INVALID_BATCH, "expected an array of tasks or {\"tasks\": [...]}"));
        }
        return Result<nlohmann::json>::ok(std::move(j));
    } catch (const nlohmann::json::parse_error& e) {
        return Result<nlohmann::json>::err(
            Error(ErrorCode::INVALID_BATCH, std::string("JSON parse error: ") + e.what()));
    }
}

int highest_task_number(const std::vector<Task>& tasks) {
    int highest = 0;
    for (const auto& task : tasks) {
        const std::string& id = task.id;
        if (id.size() <= 5 || id.compare(0, 5, "TASK-") != 0) continue;
        std::string digits = id.substr(5);
        if (digits.empty() || digits.size() > 9 ||
            !std::all_of(digits.begin(), digits.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            continue;
        }
        highest = std::max(highest, std::stoi(digits));
    }
    return highest;
}

std::string format_task_id(int number) {
    char buf[32];
    std::snprintf(buf, sizeof(buf), "TASK-%03d", number);
    return buf;
}

Result<std::vector<Task>> prepare_batch(const Manifest& manifest, const nlohmann::json& drafts,
                                        bool assign_ids) {
    using R = Result<std::vector<Task>>;

    if (!drafts.is_array() || drafts.empty()) {
        return R::err(Error(ErrorCode::INVALID_BATCH, "batch contains no tasks"));
    }

    // Pass 1: decide every id so index dependencies can point forward too
    std::vector<std::string> ids;
    std::unordered_set<std::string> taken;
    for (const auto& task : manifest.tasks) taken.insert(task.id);

    int next = highest_task_number(manifest.tasks) + 1;
    for (size_t i = 0; i < drafts.size(); ++i) {
        const auto& draft = drafts[i];
        if (!draft.is_object()) {
            return R::err(batch_error(i, "must be an object"));
        }
        std::string id;
        if (assign_ids) {
            id = format_task_id(next++);
        } else {
            if (!draft.contains("id") || !draft["id"].is_string() ||
                draft["id"].get<std::string>().empty()) {
                return R::err(batch_error(i, "id required when ids are kept"));
            }
            id = draft["id"].get<std::string>();
        }
        if (!taken.insert(id).second) {
            return R::err(Error(ErrorCode::DUPLICATE_TASK_ID,
                                "draft #" + std::to_string(i) + ": task id " + id +
                                " already exists"));
        }
        ids.push_back(id);
    }

    std::unordered_set<std::string> batch_ids(ids.begin(), ids.end());

    // Pass 2: resolve dependencies and build tasks
    std::vector<Task> out;
    for (size_t i = 0; i < drafts.size(); ++i) {
        nlohmann::json draft = drafts[i];

        std::string invalid;
        if (!check_draft(draft, invalid)) {
            return R::err(batch_error(i, invalid));
        }

        nlohmann::json deps = nlohmann::json::array();
        if (draft.contains("dependencies") && !draft["dependencies"].is_null()) {
            if (!draft["dependencies"].is_array()) {
                return R::err(batch_error(i, "dependencies must be an array"));
            }
            for (const auto& dep : draft["dependencies"]) {
                if (dep.is_number_integer()) {
                    auto index = dep.get<long long>();
                    if (index < 0 || static_cast<size_t>(index) >= ids.size()) {
                        return R::err(batch_error(
                            i, "dependency index " + std::to_string(index) + " is out of range"));
                    }
                    deps.push_back(ids[static_cast<size_t>(index)]);
                } else if (dep.is_string()) {
                    auto name = dep.get<std::string>();
                    if (!batch_ids.count(name) && !manifest.find_task(name)) {
                        return R::err(batch_error(i, "dependency " + name + " does not exist"));
                    }
                    deps.push_back(name);
                } else {
                    return R::err(batch_error(i, "dependency must be an index or a task id"));
                }
            }
        }

        for (const char* key : kLifecycleKeys) {
            draft.erase(std::string(key));
        }
        draft["id"] = ids[i];
        draft["status"] = "pending";
        draft["dependencies"] = deps;

        auto parsed = parse_task(draft);
        if (!parsed.ok) {
            return R::err(batch_error(i, parsed.error));
        }
        for (const auto& warning : parsed.warnings) {
            spdlog::warn("draft #{}: {}", i, warning);
        }
        out.push_back(std::move(parsed.task));
    }

    return R::ok(std::move(out));
}

Result<IngestResult> ingest(ManifestStore& store, Ledger& ledger, const nlohmann::json& drafts,
                            const IngestOptions& options) {
    auto loaded = store.load();
    if (loaded.isErr()) {
        return Result<IngestResult>::err(loaded.error());
    }
    Manifest& manifest = loaded.value();

    auto prepared = prepare_batch(manifest, drafts, options.assign_ids);
    if (prepared.isErr()) {
        return Result<IngestResult>::err(prepared.error());
    }

    std::vector<Task> combined = manifest.tasks;
    combined.insert(combined.end(), prepared.value().begin(), prepared.value().end());
    auto valid = validate_graph(combined);
    if (valid.isErr()) {
        return Result<IngestResult>::err(valid.error());
    }

    IngestResult result;
    result.tasks = prepared.value();
    // report derived blocks as they will be saved
    rebuild_blocks(combined);
    for (auto& task : result.tasks) {
        auto it = std::find_if(combined.begin(), combined.end(),
                               [&task](const Task& t) { return t.id == task.id; });
        task.blocks = it->blocks;
    }

    if (options.dry_run) {
        spdlog::info("dry run: {} task(s) would be added", result.tasks.size());
        return Result<IngestResult>::ok(std::move(result));
    }

    std::vector<std::string> sources = options.sources;
    std::vector<std::string> task_ids;
    for (const auto& task : result.tasks) {
        task_ids.push_back(task.id);
        if (options.sources.empty() && !task.adr_source.empty() &&
            std::find(sources.begin(), sources.end(), task.adr_source) == sources.end()) {
            sources.push_back(task.adr_source);
        }
    }
    if (sources.empty()) {
        sources.push_back("manual");
    }

    manifest.tasks = std::move(combined);
    auto saved = store.save(manifest);
    if (saved.isErr()) {
        return Result<IngestResult>::err(saved.error());
    }

    std::string description = options.description;
    if (description.empty()) {
        description = "Ingested " + std::to_string(task_ids.size()) + " task(s)";
    }

    auto recorded = ledger.record(sources, task_ids, description);
    if (recorded.isErr()) {
        spdlog::error("tasks were added to {} but the transaction was not recorded",
                      store.location());
        return Result<IngestResult>::err(recorded.error());
    }

    result.transaction = recorded.value();
    spdlog::info("ingested {} task(s) as {}", task_ids.size(), recorded.value().id);
    return Result<IngestResult>::ok(std::move(result));
}

} // namespace vtm
