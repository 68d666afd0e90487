/**
 * VTM CLI - context command
 *
 * Print the implementation context for one task.
 */

#include "../common.hpp"
#include <vtm/context.hpp>
#include <CLI/CLI.hpp>

namespace vtm::cli::commands {

namespace {

struct ContextOptions {
    std::string task_id;
    std::string mode = "minimal";
};

int cmd_context(const GlobalOptions& opts, const ContextOptions& ctx_opts) {
    auto config = load_config(opts);

    auto mode = parse_context_mode(ctx_opts.mode);
    if (!mode) {
        return usage_error("unknown mode '" + ctx_opts.mode + "' (minimal, compact or full)",
                           opts.json);
    }

    FileManifestStore store(config.manifest_path);
    auto loaded = store.load();
    if (loaded.isErr()) {
        return report_error(loaded.error(), opts.json);
    }

    auto payload = extract_context(loaded.value(), ctx_opts.task_id, *mode);
    if (payload.isErr()) {
        return report_error(payload.error(), opts.json);
    }

    std::string text = render_context(payload.value());
    if (opts.json) {
        auto j = context_to_json(payload.value());
        j["markdown"] = text;
        j["estimated_tokens"] = estimate_tokens(text);
        output_json(j);
    } else {
        std::cout << text;
        if (opts.verbose) {
            std::cerr << "~" << estimate_tokens(text) << " tokens" << std::endl;
        }
    }
    return 0;
}

} // namespace

void setup_context(CLI::App* app, GlobalOptions& opts) {
    static ContextOptions ctx_opts;

    app->add_option("id", ctx_opts.task_id, "Task id")->required();
    app->add_option("-m,--mode", ctx_opts.mode, "minimal, compact or full");

    app->callback([&opts]() {
        std::exit(cmd_context(opts, ctx_opts));
    });
}

} // namespace vtm::cli::commands
