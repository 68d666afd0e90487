/**
 * VTM CLI - Entry Point
 *
 * Task manifest command-line interface.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

#ifndef VTM_VERSION
#define VTM_VERSION "0.0.0"
#endif

// Forward declarations for commands
namespace vtm::cli::commands {
    void setup_init(CLI::App* app, GlobalOptions& opts);
    void setup_next(CLI::App* app, GlobalOptions& opts);
    void setup_context(CLI::App* app, GlobalOptions& opts);
    void setup_task(CLI::App* app, GlobalOptions& opts);
    void setup_start(CLI::App* app, GlobalOptions& opts);
    void setup_complete(CLI::App* app, GlobalOptions& opts);
    void setup_block(CLI::App* app, GlobalOptions& opts);
    void setup_reset(CLI::App* app, GlobalOptions& opts);
    void setup_stats(CLI::App* app, GlobalOptions& opts);
    void setup_list(CLI::App* app, GlobalOptions& opts);
    void setup_summary(CLI::App* app, GlobalOptions& opts);
    void setup_ingest(CLI::App* app, GlobalOptions& opts);
    void setup_history(CLI::App* app, GlobalOptions& opts);
    void setup_history_detail(CLI::App* app, GlobalOptions& opts);
    void setup_rollback(CLI::App* app, GlobalOptions& opts);
    void register_cache_commands(CLI::App& app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace vtm::cli;

    CLI::App app{"vtm - task manifest manager"};
    app.set_version_flag("-V,--version", VTM_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--manifest", opts.manifest, "Manifest file (default vtm.json)");
    app.add_option("--history-dir", opts.history_dir, "Transaction history directory");
    app.add_option("--cache-dir", opts.cache_dir, "Research cache directory");
    app.add_option("--config", opts.config, "Config file (default .vtmrc)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Debug logging");
    app.add_flag("-q,--quiet", opts.quiet, "Errors only");

    // Manifest
    commands::setup_init(app.add_subcommand("init", "Create an empty manifest"), opts);
    commands::setup_next(app.add_subcommand("next", "Show tasks ready to start"), opts);
    commands::setup_context(app.add_subcommand("context", "Generate context for a task"), opts);
    commands::setup_task(app.add_subcommand("task", "Show a single task"), opts);

    // Lifecycle
    commands::setup_start(app.add_subcommand("start", "Mark a task in progress"), opts);
    commands::setup_complete(app.add_subcommand("complete", "Mark a task completed"), opts);
    commands::setup_block(app.add_subcommand("block", "Mark a pending task blocked"), opts);
    commands::setup_reset(app.add_subcommand("reset", "Return a task to pending"), opts);

    // Reports
    commands::setup_stats(app.add_subcommand("stats", "Show manifest statistics"), opts);
    commands::setup_list(app.add_subcommand("list", "List tasks"), opts);
    commands::setup_summary(
        app.add_subcommand("summary", "Incomplete tasks and completed capabilities"), opts);

    // Ingest & history
    commands::setup_ingest(app.add_subcommand("ingest", "Add a batch of tasks"), opts);
    commands::setup_history(app.add_subcommand("history", "Show ingestion transactions"), opts);
    commands::setup_history_detail(
        app.add_subcommand("history-detail", "Show one transaction"), opts);
    commands::setup_rollback(app.add_subcommand("rollback", "Roll back a transaction"), opts);

    // Research cache
    commands::register_cache_commands(app, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
