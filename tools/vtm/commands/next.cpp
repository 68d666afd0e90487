/**
 * VTM CLI - next command
 *
 * Show pending tasks whose dependencies are all completed.
 */

#include "../common.hpp"
#include <vtm/manifest.hpp>
#include <vtm/resolver.hpp>
#include <CLI/CLI.hpp>

namespace vtm::cli::commands {

namespace {

struct NextOptions {
    size_t limit = 0;
};

int cmd_next(const GlobalOptions& opts, const NextOptions& next_opts) {
    auto config = load_config(opts);
    FileManifestStore store(config.manifest_path);

    auto loaded = store.load();
    if (loaded.isErr()) {
        return report_error(loaded.error(), opts.json);
    }

    auto resolved = resolve_ready(loaded.value().tasks);
    if (resolved.isErr()) {
        return report_error(resolved.error(), opts.json);
    }

    auto ready = resolved.value().ready;
    if (next_opts.limit > 0 && ready.size() > next_opts.limit) {
        ready.resize(next_opts.limit);
    }

    if (opts.json) {
        nlohmann::json tasks = nlohmann::json::array();
        for (const auto& task : ready) {
            tasks.push_back(task_to_json(task));
        }
        output_json({{"ready", tasks}, {"blocked_count", resolved.value().blocked.size()}});
        return 0;
    }

    if (ready.empty()) {
        std::cout << "No ready tasks." << std::endl;
        return 0;
    }

    std::cout << "Ready Tasks:" << std::endl << std::endl;
    for (const auto& task : ready) {
        std::cout << "  " << format_task_line(task) << std::endl;
        if (!task.dependencies.empty()) {
            std::cout << "    depends on: " << join(task.dependencies, ", ") << std::endl;
        }
    }
    return 0;
}

} // namespace

void setup_next(CLI::App* app, GlobalOptions& opts) {
    static NextOptions next_opts;

    app->add_option("-n,--limit", next_opts.limit, "Show at most N tasks");

    app->callback([&opts]() {
        std::exit(cmd_next(opts, next_opts));
    });
}

} // namespace vtm::cli::commands
