/**
 * VTM CLI - task command
 *
 * Show a single task.
 */

#include "../common.hpp"
#include <vtm/manifest.hpp>
#include <CLI/CLI.hpp>

namespace vtm::cli::commands {

namespace {

struct TaskOptions {
    std::string task_id;
};

void print_section(const char* heading, const std::vector<std::string>& items) {
    if (items.empty()) return;
    std::cout << heading << ":" << std::endl;
    for (const auto& item : items) {
        std::cout << "  - " << item << std::endl;
    }
}

int cmd_task(const GlobalOptions& opts, const TaskOptions& task_opts) {
    auto config = load_config(opts);
    FileManifestStore store(config.manifest_path);

    auto loaded = store.load();
    if (loaded.isErr()) {
        return report_error(loaded.error(), opts.json);
    }

    const Task* task = loaded.value().find_task(task_opts.task_id);
    if (!task) {
        return report_error(Error(ErrorCode::TASK_NOT_FOUND,
                                  "task " + task_opts.task_id + " not found"),
                            opts.json);
    }

    if (opts.json) {
        output_json(task_to_json(*task));
        return 0;
    }

    std::cout << task->id << ": " << task->title << std::endl;
    std::cout << "Status: " << task_status_to_string(task->status) << std::endl;
    std::cout << "Risk: " << task->risk << "  Estimate: " << task->estimated_hours << "h"
              << "  Test: " << task->test_strategy << std::endl;
    if (!task->adr_source.empty()) std::cout << "ADR: " << task->adr_source << std::endl;
    if (!task->spec_source.empty()) std::cout << "Spec: " << task->spec_source << std::endl;
    if (task->started_at) std::cout << "Started: " << *task->started_at << std::endl;
    if (task->completed_at) std::cout << "Completed: " << *task->completed_at << std::endl;
    if (!task->description.empty()) {
        std::cout << std::endl << task->description << std::endl;
    }
    std::cout << std::endl;

    std::vector<std::string> criteria;
    for (size_t i = 0; i < task->acceptance_criteria.size(); ++i) {
        bool verified = i < task->validation.ac_verified.size() && task->validation.ac_verified[i];
        criteria.push_back(std::string(verified ? "[x] " : "[ ] ") + task->acceptance_criteria[i]);
    }
    print_section("Acceptance criteria", criteria);
    print_section("Dependencies", task->dependencies);
    print_section("Blocks", task->blocks);
    print_section("Files to create", task->files.create);
    print_section("Files to modify", task->files.modify);
    print_section("Files to delete", task->files.remove);
    print_section("Commits", task->commits);
    return 0;
}

} // namespace

void setup_task(CLI::App* app, GlobalOptions& opts) {
    static TaskOptions task_opts;

    app->add_option("id", task_opts.task_id, "Task id")->required();

    app->callback([&opts]() {
        std::exit(cmd_task(opts, task_opts));
    });
}

} // namespace vtm::cli::commands
