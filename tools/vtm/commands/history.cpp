/**
 * VTM CLI - history, history-detail and rollback commands
 */

#include "../common.hpp"
#include <vtm/ledger.hpp>
#include <CLI/CLI.hpp>

namespace vtm::cli::commands {

namespace {

struct HistoryOptions {
    size_t limit = 10;
};

struct HistoryDetailOptions {
    std::string transaction_id;
};

struct RollbackCmdOptions {
    std::string transaction_id;
    bool dry_run = false;
    bool force = false;
    bool cascade = false;
};

std::string status_label(const Transaction& tx) {
    return tx.reverted ? "reverted" : "active";
}

nlohmann::json preview_to_json(const RollbackPreview& preview) {
    nlohmann::json j;
    j["transaction"] = transaction_to_json(preview.transaction);
    j["tasks_to_remove"] = preview.tasks_to_remove;
    j["cascaded"] = preview.cascaded;
    j["blocking_dependents"] = nlohmann::json::array();
    for (const auto& b : preview.blocking_dependents) {
        j["blocking_dependents"].push_back(
            nlohmann::json{{"task_id", b.task_id}, {"depends_on", b.depends_on}});
    }
    return j;
}

int cmd_history(const GlobalOptions& opts, const HistoryOptions& history_opts) {
    auto config = load_config(opts);
    FileManifestStore store(config.manifest_path);
    FileHistoryStore history(config.history_dir);
    Ledger ledger(store, history);

    auto entries = ledger.history(history_opts.limit);
    if (entries.isErr()) {
        return report_error(entries.error(), opts.json);
    }

    if (opts.json) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& tx : entries.value()) {
            out.push_back(transaction_to_json(tx));
        }
        auto stats = ledger.history_stats();
        nlohmann::json j{{"transactions", out}};
        if (stats.isOk()) {
            j["total_entries"] = stats.value().total_entries;
            j["reverted_entries"] = stats.value().reverted_entries;
        }
        output_json(j);
        return 0;
    }

    if (entries.value().empty()) {
        std::cout << "No transactions recorded." << std::endl;
        return 0;
    }

    for (const auto& tx : entries.value()) {
        std::cout << tx.id << "  " << tx.timestamp << "  [" << status_label(tx) << "]  "
                  << tx.tasks_added.size() << " task(s)";
        if (!tx.sources.empty()) {
            std::cout << "  from " << join(tx.sources, ", ");
        }
        std::cout << std::endl;
    }
    return 0;
}

int cmd_history_detail(const GlobalOptions& opts, const HistoryDetailOptions& detail_opts) {
    auto config = load_config(opts);
    FileManifestStore store(config.manifest_path);
    FileHistoryStore history(config.history_dir);
    Ledger ledger(store, history);

    auto tx = ledger.find(detail_opts.transaction_id);
    if (tx.isErr()) {
        return report_error(tx.error(), opts.json);
    }

    // Dependents are informational here; a missing manifest does not hide the entry
    auto preview = ledger.preview(detail_opts.transaction_id);

    if (opts.json) {
        nlohmann::json j = transaction_to_json(tx.value());
        if (preview.isOk()) {
            j["rollback"] = preview_to_json(preview.value());
        }
        output_json(j);
        return 0;
    }

    const auto& t = tx.value();
    std::cout << "Transaction: " << t.id << std::endl;
    std::cout << "Action:      " << t.action << std::endl;
    std::cout << "Timestamp:   " << t.timestamp << std::endl;
    std::cout << "Status:      " << status_label(t);
    if (t.reverted_at) std::cout << " at " << *t.reverted_at;
    std::cout << std::endl;
    if (!t.sources.empty()) std::cout << "Sources:     " << join(t.sources, ", ") << std::endl;
    if (!t.description.empty()) std::cout << "Description: " << t.description << std::endl;
    std::cout << "Tasks added: " << join(t.tasks_added, ", ") << std::endl;

    if (preview.isOk() && !t.reverted && !preview.value().blocking_dependents.empty()) {
        std::cout << std::endl << "Depended on by:" << std::endl;
        for (const auto& b : preview.value().blocking_dependents) {
            std::cout << "  " << b.task_id << " -> " << b.depends_on << std::endl;
        }
    }
    return 0;
}

int cmd_rollback(const GlobalOptions& opts, const RollbackCmdOptions& rb_opts) {
    auto config = load_config(opts);
    FileManifestStore store(config.manifest_path);
    FileHistoryStore history(config.history_dir);
    Ledger ledger(store, history);

    RollbackOptions options;
    options.cascade = rb_opts.cascade;
    options.force = rb_opts.force;

    if (rb_opts.dry_run) {
        auto preview = ledger.preview(rb_opts.transaction_id, options);
        if (preview.isErr()) {
            return report_error(preview.error(), opts.json);
        }
        const auto& p = preview.value();
        if (opts.json) {
            auto j = preview_to_json(p);
            j["dry_run"] = true;
            output_json(j);
            return 0;
        }

        if (p.transaction.reverted) {
            std::cout << "Transaction " << p.transaction.id << " is already reverted."
                      << std::endl;
        }
        std::cout << "Would remove " << p.tasks_to_remove.size() << " task(s): "
                  << join(p.tasks_to_remove, ", ") << std::endl;
        if (!p.cascaded.empty()) {
            std::cout << "Including dependents: " << join(p.cascaded, ", ") << std::endl;
        }
        if (!p.blocking_dependents.empty() && !rb_opts.cascade) {
            std::cout << "Blocked by dependents:" << std::endl;
            for (const auto& b : p.blocking_dependents) {
                std::cout << "  " << b.task_id << " depends on " << b.depends_on << std::endl;
            }
            std::cout << "Use --cascade to remove them too, or --force to leave them dangling."
                      << std::endl;
        }
        return 0;
    }

    auto outcome = ledger.rollback(rb_opts.transaction_id, options);
    if (outcome.isErr()) {
        return report_error(outcome.error(), opts.json);
    }

    const auto& o = outcome.value();
    if (opts.json) {
        output_json({{"ok", true},
                     {"transaction", transaction_to_json(o.transaction)},
                     {"removed", o.removed},
                     {"cascaded", o.cascaded}});
        return 0;
    }

    std::cout << "Rolled back " << o.transaction.id << ": removed " << o.removed.size()
              << " task(s)" << std::endl;
    if (!o.cascaded.empty()) {
        std::cout << "Cascaded: " << join(o.cascaded, ", ") << std::endl;
    }
    return 0;
}

} // namespace

void setup_history(CLI::App* app, GlobalOptions& opts) {
    static HistoryOptions history_opts;

    app->add_option("-n,--limit", history_opts.limit, "Show the N newest (0 for all)");

    app->callback([&opts]() {
        std::exit(cmd_history(opts, history_opts));
    });
}

void setup_history_detail(CLI::App* app, GlobalOptions& opts) {
    static HistoryDetailOptions detail_opts;

    app->add_option("id", detail_opts.transaction_id, "Transaction id (YYYY-MM-DD-NNN)")
        ->required();

    app->callback([&opts]() {
        std::exit(cmd_history_detail(opts, detail_opts));
    });
}

void setup_rollback(CLI::App* app, GlobalOptions& opts) {
    static RollbackCmdOptions rb_opts;

    app->add_option("id", rb_opts.transaction_id, "Transaction id (YYYY-MM-DD-NNN)")
        ->required();
    auto* dry = app->add_flag("--dry-run", rb_opts.dry_run, "Preview without changing anything");
    auto* force = app->add_flag("--force", rb_opts.force,
                                "Skip the dependents check (may leave dangling dependencies)");
    dry->excludes(force);
    app->add_flag("--cascade", rb_opts.cascade, "Also remove tasks that depend on the batch");

    app->callback([&opts]() {
        std::exit(cmd_rollback(opts, rb_opts));
    });
}

} // namespace vtm::cli::commands
