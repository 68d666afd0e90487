/**
 * VTM CLI - init command
 *
 * Create an empty manifest.
 */

#include "../common.hpp"
#include <vtm/platform.hpp>
#include <CLI/CLI.hpp>

namespace vtm::cli::commands {

namespace {

struct InitOptions {
    std::string name;
    std::string description;
};

int cmd_init(const GlobalOptions& opts, const InitOptions& init_opts) {
    auto config = load_config(opts);
    FileManifestStore store(config.manifest_path);

    if (store.exists()) {
        print_error("manifest already exists at " + config.manifest_path, opts.json,
                    error_code_to_string(ErrorCode::INVALID_ARGUMENT));
        return 1;
    }

    Manifest manifest;
    manifest.project.name = init_opts.name;
    if (manifest.project.name.empty()) {
        manifest.project.name = "project";
    }
    manifest.project.description = init_opts.description;

    auto saved = store.save(manifest);
    if (saved.isErr()) {
        return report_error(saved.error(), opts.json);
    }

    if (opts.json) {
        output_json({{"ok", true}, {"manifest", config.manifest_path}});
    } else {
        print_success("Created " + config.manifest_path, opts.json);
    }
    return 0;
}

} // namespace

void setup_init(CLI::App* app, GlobalOptions& opts) {
    static InitOptions init_opts;

    app->add_option("--name", init_opts.name, "Project name");
    app->add_option("--description", init_opts.description, "Project description");

    app->callback([&opts]() {
        std::exit(cmd_init(opts, init_opts));
    });
}

} // namespace vtm::cli::commands
