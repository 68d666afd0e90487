/**
 * VTM CLI - list, stats and summary commands
 *
 * Read-only reports over the manifest.
 */

#include "../common.hpp"
#include <vtm/manifest.hpp>
#include <vtm/query.hpp>
#include <vtm/resolver.hpp>
#include <CLI/CLI.hpp>

#include <iomanip>

namespace vtm::cli::commands {

namespace {

struct ListOptions {
    std::vector<std::string> filters;
    std::string sort;
};

int cmd_list(const GlobalOptions& opts, const ListOptions& list_opts) {
    auto config = load_config(opts);

    std::vector<TaskFilter> filters;
    for (const auto& expr : list_opts.filters) {
        auto filter = parse_filter(expr);
        if (filter.isErr()) {
            return report_error(filter.error(), opts.json);
        }
        filters.push_back(filter.value());
    }

    FileManifestStore store(config.manifest_path);
    auto loaded = store.load();
    if (loaded.isErr()) {
        return report_error(loaded.error(), opts.json);
    }

    auto tasks = filter_tasks(loaded.value().tasks, filters);
    if (!list_opts.sort.empty()) {
        auto sorted = sort_tasks(std::move(tasks), list_opts.sort);
        if (sorted.isErr()) {
            return report_error(sorted.error(), opts.json);
        }
        tasks = std::move(sorted.value());
    }

    if (opts.json) {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& task : tasks) {
            out.push_back(task_to_json(task));
        }
        output_json({{"tasks", out}, {"count", tasks.size()}});
        return 0;
    }

    if (tasks.empty()) {
        std::cout << "No matching tasks." << std::endl;
        return 0;
    }
    for (const auto& task : tasks) {
        std::cout << format_task_line(task) << std::endl;
    }
    std::cout << std::endl << tasks.size() << " task(s)" << std::endl;
    return 0;
}

int cmd_stats(const GlobalOptions& opts) {
    auto config = load_config(opts);
    FileManifestStore store(config.manifest_path);

    auto loaded = store.load();
    if (loaded.isErr()) {
        return report_error(loaded.error(), opts.json);
    }
    const Manifest& manifest = loaded.value();

    auto resolved = resolve_ready(manifest.tasks);
    if (resolved.isErr()) {
        return report_error(resolved.error(), opts.json);
    }

    const auto& stats = manifest.stats;
    auto by_source = stats_by_source(manifest);

    if (opts.json) {
        nlohmann::json sources = nlohmann::json::object();
        for (const auto& [source, s] : by_source) {
            sources[source.empty() ? "(none)" : source] = {{"total", s.total},
                                                            {"completed", s.completed}};
        }
        output_json({{"project", manifest.project.name},
                     {"stats", stats_to_json(stats)},
                     {"ready", resolved.value().ready.size()},
                     {"by_source", sources}});
        return 0;
    }

    double pct = stats.total_tasks > 0 ? 100.0 * stats.completed / stats.total_tasks : 0.0;

    std::cout << "Project: " << manifest.project.name << std::endl << std::endl;
    std::cout << "Total:        " << stats.total_tasks << std::endl;
    std::cout << "Completed:    " << stats.completed << " (" << std::fixed
              << std::setprecision(1) << pct << "%)" << std::endl;
    std::cout << "In progress:  " << stats.in_progress << std::endl;
    std::cout << "Pending:      " << stats.pending << std::endl;
    std::cout << "Blocked:      " << stats.blocked << std::endl;
    std::cout << "Ready:        " << resolved.value().ready.size() << std::endl;

    if (!by_source.empty()) {
        std::cout << std::endl << "By source:" << std::endl;
        for (const auto& [source, s] : by_source) {
            std::cout << "  " << (source.empty() ? "(none)" : source) << ": " << s.completed
                      << "/" << s.total << std::endl;
        }
    }
    return 0;
}

int cmd_summary(const GlobalOptions& opts) {
    auto config = load_config(opts);
    FileManifestStore store(config.manifest_path);

    auto loaded = store.load();
    if (loaded.isErr()) {
        return report_error(loaded.error(), opts.json);
    }

    // Always JSON: the summary is meant for tooling
    output_json(summary_to_json(summarize(loaded.value())));
    return 0;
}

} // namespace

void setup_list(CLI::App* app, GlobalOptions& opts) {
    static ListOptions list_opts;

    app->add_option("-f,--filter", list_opts.filters,
                    "field=value (status, source, spec, risk, test_strategy, id)");
    app->add_option("-s,--sort", list_opts.sort, "id, title, status, risk, hours or source");

    app->callback([&opts]() {
        std::exit(cmd_list(opts, list_opts));
    });
}

void setup_stats(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_stats(opts));
    });
}

void setup_summary(CLI::App* app, GlobalOptions& opts) {
    app->callback([&opts]() {
        std::exit(cmd_summary(opts));
    });
}

} // namespace vtm::cli::commands
