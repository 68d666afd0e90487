/**
 * VTM CLI - start, complete, block and reset commands
 *
 * Task state transitions. Each command is one load, mutate and save cycle.
 */

#include "../common.hpp"
#include <vtm/manifest.hpp>
#include <vtm/task_mutator.hpp>
#include <CLI/CLI.hpp>

namespace vtm::cli::commands {

namespace {

struct StartCmdOptions {
    std::string task_id;
    bool force = false;
};

struct CompleteCmdOptions {
    std::string task_id;
    bool force = false;
    bool tests_pass = false;
    std::string ac;
    std::string commits;
    std::string files_created;
};

struct BlockCmdOptions {
    std::string task_id;
    std::string reason;
};

struct ResetCmdOptions {
    std::string task_id;
    bool reopen = false;
};

nlohmann::json outcome_to_json(const MutationOutcome& outcome) {
    nlohmann::json j;
    j["ok"] = true;
    j["task"] = task_to_json(outcome.task);
    j["stats"] = stats_to_json(outcome.stats);
    return j;
}

void print_transition(const MutationOutcome& outcome) {
    std::cout << outcome.task.id << " -> " << task_status_to_string(outcome.task.status)
              << std::endl;
}

int cmd_start(const GlobalOptions& opts, const StartCmdOptions& start_opts) {
    auto config = load_config(opts);
    FileManifestStore store(config.manifest_path);

    StartOptions options;
    options.force = start_opts.force;

    auto outcome = start_task(store, start_opts.task_id, options);
    if (outcome.isErr()) {
        return report_error(outcome.error(), opts.json);
    }

    if (opts.json) {
        output_json(outcome_to_json(outcome.value()));
    } else {
        print_transition(outcome.value());
    }
    return 0;
}

int cmd_complete(const GlobalOptions& opts, const CompleteCmdOptions& complete_opts) {
    auto config = load_config(opts);
    FileManifestStore store(config.manifest_path);

    CompletionEvidence evidence;
    evidence.tests_pass = complete_opts.tests_pass;
    if (!complete_opts.ac.empty()) {
        auto parsed = parse_ac_selection(complete_opts.ac, evidence);
        if (parsed.isErr()) {
            return report_error(parsed.error(), opts.json);
        }
    }
    evidence.commits = split_list(complete_opts.commits);
    evidence.files_created = split_list(complete_opts.files_created);

    CompleteOptions options;
    options.force = complete_opts.force;

    auto outcome = complete_task(store, complete_opts.task_id, evidence, options);
    if (outcome.isErr()) {
        return report_error(outcome.error(), opts.json);
    }

    const auto& newly_ready = outcome.value().newly_ready;
    if (opts.json) {
        auto j = outcome_to_json(outcome.value());
        j["newly_ready"] = nlohmann::json::array();
        for (const auto& task : newly_ready) {
            j["newly_ready"].push_back(task.id);
        }
        output_json(j);
        return 0;
    }

    print_transition(outcome.value());
    const auto& stats = outcome.value().stats;
    std::cout << "Progress: " << stats.completed << "/" << stats.total_tasks << " completed"
              << std::endl;
    if (!newly_ready.empty()) {
        std::cout << std::endl << "Now ready:" << std::endl;
        for (const auto& task : newly_ready) {
            std::cout << "  " << format_task_line(task) << std::endl;
        }
    }
    return 0;
}

int cmd_block(const GlobalOptions& opts, const BlockCmdOptions& block_opts) {
    auto config = load_config(opts);
    FileManifestStore store(config.manifest_path);

    auto outcome = block_task(store, block_opts.task_id, block_opts.reason);
    if (outcome.isErr()) {
        return report_error(outcome.error(), opts.json);
    }

    if (opts.json) {
        output_json(outcome_to_json(outcome.value()));
    } else {
        print_transition(outcome.value());
    }
    return 0;
}

int cmd_reset(const GlobalOptions& opts, const ResetCmdOptions& reset_opts) {
    auto config = load_config(opts);
    FileManifestStore store(config.manifest_path);

    ResetOptions options;
    options.reopen = reset_opts.reopen;

    auto outcome = reset_task(store, reset_opts.task_id, options);
    if (outcome.isErr()) {
        return report_error(outcome.error(), opts.json);
    }

    if (opts.json) {
        output_json(outcome_to_json(outcome.value()));
    } else {
        print_transition(outcome.value());
    }
    return 0;
}

} // namespace

void setup_start(CLI::App* app, GlobalOptions& opts) {
    static StartCmdOptions start_opts;

    app->add_option("id", start_opts.task_id, "Task id")->required();
    app->add_flag("--force", start_opts.force, "Start even if dependencies are unfinished");

    app->callback([&opts]() {
        std::exit(cmd_start(opts, start_opts));
    });
}

void setup_complete(CLI::App* app, GlobalOptions& opts) {
    static CompleteCmdOptions complete_opts;

    app->add_option("id", complete_opts.task_id, "Task id")->required();
    app->add_flag("--tests-pass", complete_opts.tests_pass, "Tests for this task pass");
    app->add_option("--ac", complete_opts.ac, "Verified criteria: 'all' or '1,2,3'");
    app->add_option("--commits", complete_opts.commits, "Comma-separated commit references");
    app->add_option("--files-created", complete_opts.files_created,
                    "Comma-separated files created");
    app->add_flag("--force", complete_opts.force, "Skip state and evidence checks");

    app->callback([&opts]() {
        std::exit(cmd_complete(opts, complete_opts));
    });
}

void setup_block(CLI::App* app, GlobalOptions& opts) {
    static BlockCmdOptions block_opts;

    app->add_option("id", block_opts.task_id, "Task id")->required();
    app->add_option("-r,--reason", block_opts.reason, "Why the task is blocked");

    app->callback([&opts]() {
        std::exit(cmd_block(opts, block_opts));
    });
}

void setup_reset(CLI::App* app, GlobalOptions& opts) {
    static ResetCmdOptions reset_opts;

    app->add_option("id", reset_opts.task_id, "Task id")->required();
    app->add_flag("--reopen", reset_opts.reopen, "Allow resetting a completed task");

    app->callback([&opts]() {
        std::exit(cmd_reset(opts, reset_opts));
    });
}

} // namespace vtm::cli::commands
