#include "vtm/ledger.hpp"
#include "vtm/manifest.hpp"
#include "vtm/platform.hpp"
#include "vtm/resolver.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <cctype>
#include <cstdio>
#include <unordered_set>

namespace vtm {

namespace {

// Sequence number of "YYYY-MM-DD-NNN" if it belongs to `date`, else 0
int sequence_for_date(const std::string& id, const std::string& date) {
    if (id.size() <= date.size() + 1 || id.compare(0, date.size(), date) != 0 ||
        id[date.size()] != '-') {
        return 0;
    }
    try {
        return std::stoi(id.substr(date.size() + 1));
    } catch (const std::exception&) {
        return 0;
    }
}

std::string format_transaction_id(const std::string& date, int seq) {
    char buf[16];
    std::snprintf(buf, sizeof(buf), "%03d", seq);
    return date + "-" + buf;
}

// "YYYY-MM-DD-NNN" ordering where NNN may outgrow its padding; ids that
// do not end in a number compare as plain strings
bool id_newer(const std::string& a, const std::string& b) {
    auto split = [](const std::string& id, std::string& prefix, long long& seq) {
        auto dash = id.rfind('-');
        if (dash == std::string::npos || dash + 1 == id.size() || id.size() - dash > 19) return false;
        for (size_t i = dash + 1; i < id.size(); ++i) {
            if (!std::isdigit(static_cast<unsigned char>(id[i]))) return false;
        }
        prefix = id.substr(0, dash);
        seq = std::stoll(id.substr(dash + 1));
        return true;
    };

    std::string prefix_a, prefix_b;
    long long seq_a = 0, seq_b = 0;
    if (!split(a, prefix_a, seq_a) || !split(b, prefix_b, seq_b)) return a > b;
    if (prefix_a != prefix_b) return prefix_a > prefix_b;
    return seq_a > seq_b;
}

std::vector<std::string> distinct(const std::vector<std::string>& values) {
    std::vector<std::string> out;
    for (const auto& v : values) {
        if (v.empty()) continue;
        if (std::find(out.begin(), out.end(), v) == out.end()) out.push_back(v);
    }
    return out;
}

const Transaction* find_in(const std::vector<Transaction>& txs, const std::string& id) {
    for (const auto& tx : txs) {
        if (tx.id == id) return &tx;
    }
    return nullptr;
}

} // namespace

Ledger::Ledger(ManifestStore& manifest, HistoryStore& history, Clock clock)
    : manifest_(manifest), history_(history), clock_(std::move(clock)) {}

Result<Transaction> Ledger::record(const std::vector<std::string>& sources,
                                   const std::vector<std::string>& task_ids,
                                   const std::string& description) {
    auto loaded = history_.load();
    if (loaded.isErr()) {
        return Result<Transaction>::err(loaded.error());
    }
    auto& txs = loaded.value();

    auto now = clock_();
    std::string date = format_date(now);

    int seq = 0;
    for (const auto& tx : txs) {
        seq = std::max(seq, sequence_for_date(tx.id, date));
    }
    std::string id = format_transaction_id(date, ++seq);
    while (find_in(txs, id)) {
        id = format_transaction_id(date, ++seq);
    }

    Transaction tx;
    tx.id = id;
    tx.action = "ingest";
    tx.sources = distinct(sources);
    tx.timestamp = format_timestamp(now);
    tx.description = description;
    tx.tasks_added = task_ids;

    txs.push_back(tx);
    auto saved = history_.save(txs);
    if (saved.isErr()) {
        return Result<Transaction>::err(saved.error());
    }

    spdlog::info("recorded transaction {} ({} tasks)", tx.id, tx.tasks_added.size());
    return Result<Transaction>::ok(std::move(tx));
}

Result<std::vector<Transaction>> Ledger::history(size_t limit) {
    auto loaded = history_.load();
    if (loaded.isErr()) {
        return loaded;
    }
    auto txs = std::move(loaded.value());

    std::stable_sort(txs.begin(), txs.end(), [](const Transaction& a, const Transaction& b) {
        if (a.timestamp != b.timestamp) return a.timestamp > b.timestamp;
        return id_newer(a.id, b.id);
    });
    if (limit > 0 && txs.size() > limit) {
        txs.resize(limit);
    }
    return Result<std::vector<Transaction>>::ok(std::move(txs));
}

Result<Transaction> Ledger::find(const std::string& id) {
    auto loaded = history_.load();
    if (loaded.isErr()) {
        return Result<Transaction>::err(loaded.error());
    }
    const Transaction* tx = find_in(loaded.value(), id);
    if (!tx) {
        return Result<Transaction>::err(
            Error(ErrorCode::TRANSACTION_NOT_FOUND, "transaction " + id + " not found"));
    }
    return Result<Transaction>::ok(*tx);
}

Result<HistoryStats> Ledger::history_stats() {
    auto loaded = history_.load();
    if (loaded.isErr()) {
        return Result<HistoryStats>::err(loaded.error());
    }

    HistoryStats stats;
    for (const auto& tx : loaded.value()) {
        ++stats.total_entries;
        if (tx.reverted) ++stats.reverted_entries;
        stats.tasks_added += static_cast<int>(tx.tasks_added.size());
        if (!stats.oldest || tx.timestamp < *stats.oldest) stats.oldest = tx.timestamp;
        if (!stats.newest || tx.timestamp > *stats.newest) stats.newest = tx.timestamp;
    }
    return Result<HistoryStats>::ok(stats);
}

Result<RollbackPreview> Ledger::plan(const Manifest& manifest, const Transaction& tx,
                                     const RollbackOptions& options) const {
    RollbackPreview preview;
    preview.transaction = tx;

    for (const auto& id : tx.tasks_added) {
        if (manifest.find_task(id)) {
            preview.tasks_to_remove.push_back(id);
        }
    }

    std::unordered_set<std::string> removal(preview.tasks_to_remove.begin(),
                                            preview.tasks_to_remove.end());
    for (const auto& task : manifest.tasks) {
        if (removal.count(task.id)) continue;
        for (const auto& dep : task.dependencies) {
            if (removal.count(dep)) {
                preview.blocking_dependents.push_back({task.id, dep});
            }
        }
    }

    if (options.cascade) {
        preview.cascaded = transitive_dependents(manifest.tasks, preview.tasks_to_remove);
        preview.tasks_to_remove.insert(preview.tasks_to_remove.end(),
                                       preview.cascaded.begin(), preview.cascaded.end());
    }

    return Result<RollbackPreview>::ok(std::move(preview));
}

Result<RollbackPreview> Ledger::preview(const std::string& id, const RollbackOptions& options) {
    auto tx = find(id);
    if (tx.isErr()) {
        return Result<RollbackPreview>::err(tx.error());
    }

    auto manifest = manifest_.load();
    if (manifest.isErr()) {
        return Result<RollbackPreview>::err(manifest.error());
    }
    return plan(manifest.value(), tx.value(), options);
}

Result<RollbackOutcome> Ledger::rollback(const std::string& id, const RollbackOptions& options) {
    auto loaded = history_.load();
    if (loaded.isErr()) {
        return Result<RollbackOutcome>::err(loaded.error());
    }
    auto& txs = loaded.value();

    auto it = std::find_if(txs.begin(), txs.end(),
                           [&id](const Transaction& t) { return t.id == id; });
    if (it == txs.end()) {
        return Result<RollbackOutcome>::err(
            Error(ErrorCode::TRANSACTION_NOT_FOUND, "transaction " + id + " not found"));
    }
    if (it->reverted) {
        return Result<RollbackOutcome>::err(Error(
            ErrorCode::ALREADY_REVERTED,
            "transaction " + id + " was already reverted at " + it->reverted_at.value_or("?")));
    }

    auto manifest = manifest_.load();
    if (manifest.isErr()) {
        return Result<RollbackOutcome>::err(manifest.error());
    }

    auto planned = plan(manifest.value(), *it, options);
    if (planned.isErr()) {
        return Result<RollbackOutcome>::err(planned.error());
    }
    const auto& preview = planned.value();

    if (!preview.blocking_dependents.empty() && !options.cascade) {
        if (!options.force) {
            std::string msg = "cannot roll back " + id + ": ";
            for (size_t i = 0; i < preview.blocking_dependents.size(); ++i) {
                if (i > 0) msg += ", ";
                msg += preview.blocking_dependents[i].task_id + " depends on " +
                       preview.blocking_dependents[i].depends_on;
            }
            msg += " (use --cascade or --force)";
            return Result<RollbackOutcome>::err(Error(ErrorCode::BLOCKED_BY_DEPENDENTS, msg));
        }
        spdlog::warn("forcing rollback of {}; {} task(s) keep dangling dependencies", id,
                     preview.blocking_dependents.size());
    }

    if (!preview.tasks_to_remove.empty()) {
        std::unordered_set<std::string> removal(preview.tasks_to_remove.begin(),
                                                preview.tasks_to_remove.end());
        auto& tasks = manifest.value().tasks;
        tasks.erase(std::remove_if(tasks.begin(), tasks.end(),
                                   [&removal](const Task& t) { return removal.count(t.id) > 0; }),
                    tasks.end());

        auto saved = manifest_.save(manifest.value());
        if (saved.isErr()) {
            return Result<RollbackOutcome>::err(saved.error());
        }
    } else {
        spdlog::info("tasks of {} are already gone from the manifest", id);
    }

    it->reverted = true;
    it->reverted_at = format_timestamp(clock_());
    auto saved = history_.save(txs);
    if (saved.isErr()) {
        return Result<RollbackOutcome>::err(saved.error());
    }

    spdlog::info("rolled back {} ({} task(s) removed)", id, preview.tasks_to_remove.size());

    RollbackOutcome outcome;
    outcome.transaction = *it;
    outcome.removed = preview.tasks_to_remove;
    outcome.cascaded = preview.cascaded;
    return Result<RollbackOutcome>::ok(std::move(outcome));
}

} // namespace vtm
