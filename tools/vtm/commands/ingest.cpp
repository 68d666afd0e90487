/**
 * VTM CLI - ingest command
 *
 * Add a batch of task drafts to the manifest and record a transaction.
 */

#include "../common.hpp"
#include <vtm/ingest.hpp>
#include <vtm/manifest.hpp>
#include <vtm/platform.hpp>
#include <CLI/CLI.hpp>

#include <iterator>

namespace vtm::cli::commands {

namespace {

struct IngestCmdOptions {
    std::string file;
    std::vector<std::string> sources;
    std::string description;
    bool keep_ids = false;
    bool dry_run = false;
};

int cmd_ingest(const GlobalOptions& opts, const IngestCmdOptions& ingest_opts) {
    auto config = load_config(opts);

    std::optional<std::string> content;
    if (ingest_opts.file == "-") {
        content = std::string(std::istreambuf_iterator<char>(std::cin),
                              std::istreambuf_iterator<char>());
    } else {
        content = read_file(ingest_opts.file);
    }
    if (!content) {
        return report_error(Error(ErrorCode::IO_ERROR, "cannot read " + ingest_opts.file),
                            opts.json);
    }

    auto drafts = parse_drafts(*content);
    if (drafts.isErr()) {
        return report_error(drafts.error().withContext(ingest_opts.file), opts.json);
    }

    FileManifestStore store(config.manifest_path);
    FileHistoryStore history(config.history_dir);
    Ledger ledger(store, history);

    IngestOptions options;
    options.sources = ingest_opts.sources;
    options.assign_ids = !ingest_opts.keep_ids;
    options.dry_run = ingest_opts.dry_run;
    options.description = ingest_opts.description;

    auto result = ingest(store, ledger, drafts.value(), options);
    if (result.isErr()) {
        return report_error(result.error(), opts.json);
    }

    const auto& added = result.value();
    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["dry_run"] = ingest_opts.dry_run;
        j["tasks"] = nlohmann::json::array();
        for (const auto& task : added.tasks) {
            j["tasks"].push_back(task_to_json(task));
        }
        if (added.transaction) {
            j["transaction"] = transaction_to_json(*added.transaction);
        }
        output_json(j);
        return 0;
    }

    std::cout << (ingest_opts.dry_run ? "Would add " : "Added ") << added.tasks.size()
              << " task(s):" << std::endl;
    for (const auto& task : added.tasks) {
        std::cout << "  " << task.id << ": " << task.title;
        if (!task.dependencies.empty()) {
            std::cout << " (after " << join(task.dependencies, ", ") << ")";
        }
        std::cout << std::endl;
    }
    if (added.transaction) {
        std::cout << std::endl << "Transaction: " << added.transaction->id << std::endl;
    }
    return 0;
}

} // namespace

void setup_ingest(CLI::App* app, GlobalOptions& opts) {
    static IngestCmdOptions ingest_opts;

    app->add_option("file", ingest_opts.file, "JSON batch of task drafts ('-' for stdin)")
        ->required();
    app->add_option("--source", ingest_opts.sources, "Source document to record (repeatable)");
    app->add_option("--description", ingest_opts.description, "Transaction description");
    app->add_flag("--keep-ids", ingest_opts.keep_ids, "Use the ids in the batch");
    app->add_flag("--dry-run", ingest_opts.dry_run, "Validate and show, write nothing");

    app->callback([&opts]() {
        std::exit(cmd_ingest(opts, ingest_opts));
    });
}

} // namespace vtm::cli::commands
