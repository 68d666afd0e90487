#include "vtm/task_mutator.hpp"
#include "vtm/platform.hpp"
#include "vtm/resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <sstream>
#include <stdexcept>
#include <unordered_set>

namespace vtm {

namespace {

const std::string kBlockedReasonKey = "blocked_reason";

// Load, check graph integrity, and make sure the task exists
Result<Manifest> load_for_mutation(ManifestStore& store, const std::string& id) {
    auto loaded = store.load();
    if (loaded.isErr()) {
        return loaded;
    }

    auto valid = validate_graph(loaded.value().tasks);
    if (valid.isErr()) {
        return Result<Manifest>::err(valid.error());
    }

    if (!loaded.value().find_task(id)) {
        return Result<Manifest>::err(Error(ErrorCode::TASK_NOT_FOUND, "task " + id + " not found"));
    }
    return loaded;
}

Result<MutationOutcome> persist(ManifestStore& store, Manifest& manifest, const std::string& id,
                                std::vector<Task> newly_ready = {}) {
    normalize_manifest(manifest);

    auto saved = store.save(manifest);
    if (saved.isErr()) {
        return Result<MutationOutcome>::err(saved.error());
    }

    MutationOutcome outcome;
    outcome.task = *manifest.find_task(id);
    outcome.stats = manifest.stats;
    outcome.newly_ready = std::move(newly_ready);
    return Result<MutationOutcome>::ok(std::move(outcome));
}

std::unordered_set<std::string> ready_ids(const std::vector<Task>& tasks) {
    std::unordered_set<std::string> ids;
    auto ready = resolve_ready(tasks);
    if (ready.isOk()) {
        for (const auto& t : ready.value().ready) {
            ids.insert(t.id);
        }
    }
    return ids;
}

std::string unmet_dependencies(const Task& task, const Manifest& manifest) {
    std::string out;
    for (const auto& dep : task.dependencies) {
        const Task* d = manifest.find_task(dep);
        if (d && d->status != TaskStatus::Completed) {
            if (!out.empty()) out += ", ";
            out += dep + " (" + task_status_to_string(d->status) + ")";
        }
    }
    return out;
}

void append_unique(std::vector<std::string>& target, const std::vector<std::string>& values) {
    for (const auto& v : values) {
        if (std::find(target.begin(), target.end(), v) == target.end()) {
            target.push_back(v);
        }
    }
}

Error transition_error(const Task& task, const std::string& action) {
    return Error(ErrorCode::INVALID_TRANSITION,
                 "cannot " + action + " task " + task.id + ": status is " +
                 task_status_to_string(task.status));
}

} // namespace

Result<MutationOutcome> start_task(ManifestStore& store, const std::string& id,
                                   const StartOptions& options) {
    auto loaded = load_for_mutation(store, id);
    if (loaded.isErr()) {
        return Result<MutationOutcome>::err(loaded.error());
    }
    auto& manifest = loaded.value();
    Task& task = *manifest.find_task(id);

    if (task.status == TaskStatus::InProgress || task.status == TaskStatus::Completed) {
        return Result<MutationOutcome>::err(transition_error(task, "start"));
    }
    if (task.status == TaskStatus::Blocked && !options.force) {
        return Result<MutationOutcome>::err(Error(
            ErrorCode::NOT_READY,
            "task " + id + " is blocked; reset it or use --force"));
    }

    std::string unmet = unmet_dependencies(task, manifest);
    if (!unmet.empty()) {
        if (!options.force) {
            return Result<MutationOutcome>::err(Error(
                ErrorCode::NOT_READY,
                "task " + id + " has unfinished dependencies: " + unmet));
        }
        spdlog::warn("starting {} with unfinished dependencies: {}", id, unmet);
    }

    task.status = TaskStatus::InProgress;
    task.started_at = get_current_timestamp();
    task.extra.erase(kBlockedReasonKey);

    spdlog::info("task {} started", id);
    return persist(store, manifest, id);
}

Result<MutationOutcome> complete_task(ManifestStore& store, const std::string& id,
                                      const CompletionEvidence& evidence,
                                      const CompleteOptions& options) {
    auto loaded = load_for_mutation(store, id);
    if (loaded.isErr()) {
        return Result<MutationOutcome>::err(loaded.error());
    }
    auto& manifest = loaded.value();
    Task& task = *manifest.find_task(id);

    if (task.status == TaskStatus::Completed) {
        return Result<MutationOutcome>::err(transition_error(task, "complete"));
    }
    if (task.status != TaskStatus::InProgress && !options.force) {
        return Result<MutationOutcome>::err(Error(
            ErrorCode::INVALID_TRANSITION,
            "task " + id + " is " + task_status_to_string(task.status) +
            "; start it before completing or use --force"));
    }

    const size_t criteria = task.acceptance_criteria.size();
    std::vector<bool> verified(criteria, evidence.all_ac_verified);
    for (size_t n : evidence.verified_criteria) {
        if (n == 0 || n > criteria) {
            return Result<MutationOutcome>::err(Error(
                ErrorCode::INVALID_ARGUMENT,
                "task " + id + " has no acceptance criterion " + std::to_string(n)));
        }
        verified[n - 1] = true;
    }

    if (!options.force) {
        if (!evidence.tests_pass) {
            return Result<MutationOutcome>::err(Error(
                ErrorCode::VALIDATION_INCOMPLETE,
                "task " + id + ": tests not reported passing"));
        }
        std::string missing;
        for (size_t i = 0; i < criteria; ++i) {
            if (!verified[i]) {
                if (!missing.empty()) missing += ", ";
                missing += "AC" + std::to_string(i + 1);
            }
        }
        if (!missing.empty()) {
            return Result<MutationOutcome>::err(Error(
                ErrorCode::VALIDATION_INCOMPLETE,
                "task " + id + ": acceptance criteria not verified: " + missing));
        }
    } else {
        spdlog::warn("force-completing {} without full validation", id);
    }

    auto ready_before = ready_ids(manifest.tasks);

    task.status = TaskStatus::Completed;
    task.completed_at = get_current_timestamp();
    if (!task.started_at) {
        task.started_at = task.completed_at;
    }
    task.validation.tests_pass = evidence.tests_pass;
    task.validation.ac_verified = verified;
    append_unique(task.commits, evidence.commits);
    append_unique(task.files.create, evidence.files_created);
    task.extra.erase(kBlockedReasonKey);

    auto ready_after = resolve_ready(manifest.tasks);
    std::vector<Task> newly_ready;
    if (ready_after.isOk()) {
        for (const auto& t : ready_after.value().ready) {
            if (!ready_before.count(t.id)) {
                newly_ready.push_back(t);
            }
        }
    }

    spdlog::info("task {} completed, {} task(s) unblocked", id, newly_ready.size());
    return persist(store, manifest, id, std::move(newly_ready));
}

Result<MutationOutcome> block_task(ManifestStore& store, const std::string& id,
                                   const std::string& reason) {
    auto loaded = load_for_mutation(store, id);
    if (loaded.isErr()) {
        return Result<MutationOutcome>::err(loaded.error());
    }
    auto& manifest = loaded.value();
    Task& task = *manifest.find_task(id);

    if (task.status != TaskStatus::Pending) {
        return Result<MutationOutcome>::err(transition_error(task, "block"));
    }

    task.status = TaskStatus::Blocked;
    if (!reason.empty()) {
        task.extra[kBlockedReasonKey] = reason;
    }

    spdlog::info("task {} blocked{}{}", id, reason.empty() ? "" : ": ", reason);
    return persist(store, manifest, id);
}

Result<MutationOutcome> reset_task(ManifestStore& store, const std::string& id,
                                   const ResetOptions& options) {
    auto loaded = load_for_mutation(store, id);
    if (loaded.isErr()) {
        return Result<MutationOutcome>::err(loaded.error());
    }
    auto& manifest = loaded.value();
    Task& task = *manifest.find_task(id);

    switch (task.status) {
        case TaskStatus::Pending:
            return Result<MutationOutcome>::err(transition_error(task, "reset"));
        case TaskStatus::Completed:
            if (!options.reopen) {
                return Result<MutationOutcome>::err(Error(
                    ErrorCode::INVALID_TRANSITION,
                    "task " + id + " is completed; use --reopen to reopen it"));
            }
            spdlog::warn("reopening completed task {}", id);
            task.completed_at.reset();
            task.validation = TaskValidation{};
            break;
        case TaskStatus::InProgress:
        case TaskStatus::Blocked:
            break;
    }

    task.status = TaskStatus::Pending;
    task.started_at.reset();
    task.extra.erase(kBlockedReasonKey);

    spdlog::info("task {} reset to pending", id);
    return persist(store, manifest, id);
}

Result<void> parse_ac_selection(const std::string& selection, CompletionEvidence& evidence) {
    std::string trimmed;
    for (char c : selection) {
        if (!std::isspace(static_cast<unsigned char>(c))) trimmed += c;
    }

    if (trimmed == "all") {
        evidence.all_ac_verified = true;
        return Result<void>::ok();
    }

    std::stringstream ss(trimmed);
    std::string item;
    while (std::getline(ss, item, ',')) {
        if (item.empty()) continue;
        if (!std::all_of(item.begin(), item.end(),
                         [](unsigned char c) { return std::isdigit(c); })) {
            return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                           "invalid acceptance criterion number: " + item));
        }
        unsigned long number = 0;
        try {
            number = std::stoul(item);
        } catch (const std::out_of_range&) {
            return Result<void>::err(Error(ErrorCode::INVALID_ARGUMENT,
                                           "acceptance criterion number out of range: " + item));
        }
        evidence.verified_criteria.push_back(static_cast<size_t>(number));
    }
    return Result<void>::ok();
}

} // namespace vtm
