/**
 * ctxstage CLI - stage command
 *
 * Stage a manifest into a directory and print the tree digest, without
 * running the build engine.
 */

#include "../common.hpp"
#include <ctxstage/platform.hpp>
#include <ctxstage/stager.hpp>
#include <CLI/CLI.hpp>

namespace ctxstage::cli::commands {

namespace {

struct StageOptions {
    std::string manifest;
    std::string output_dir;
    std::vector<std::string> files;
    std::vector<std::string> exec_files;
};

int cmd_stage(const GlobalOptions& opts, const StageOptions& stage_opts) {
    init_warning_collector(opts.json);

    Manifest manifest;
    if (!load_manifest(opts, stage_opts.manifest, stage_opts.files, stage_opts.exec_files,
                       manifest)) {
        return 1;
    }

    if (manifest.empty()) {
        print_error("Manifest has no entries", opts.json);
        return 1;
    }

    std::string root = expand_user_path(stage_opts.output_dir);

    auto staged = stage_context(manifest, root);
    if (!staged.ok) {
        print_error(staged.error, opts.json);
        return 1;
    }

    auto digest = compute_tree_digest(root);
    if (!digest.ok) {
        print_error(digest.error, opts.json);
        return 1;
    }

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = true;
        j["root"] = root;
        j["entries"] = staged.staged;
        j["digest"] = "sha256:" + digest.hex_digest;
        j["object_count"] = digest.entry_count;
        output_json(j);
    } else {
        print_success("Staged " + std::to_string(staged.staged.size()) + " entries into " + root,
                      false);
        std::cout << "Digest: sha256:" << digest.hex_digest << std::endl;
    }

    return 0;
}

} // namespace

void setup_stage(CLI::App* app, GlobalOptions& opts) {
    static StageOptions stage_opts;

    app->add_option("-m,--manifest", stage_opts.manifest, "Manifest file (ctxstage.manifest.v1)");
    app->add_option("output_dir", stage_opts.output_dir,
                    "Target directory (must be empty or absent)")->required();
    app->add_option("--file", stage_opts.files, "Add or replace a data file DEST=PATH");
    app->add_option("--exec-file", stage_opts.exec_files,
                    "Add or replace an executable file DEST=PATH");

    app->callback([&opts]() {
        std::exit(cmd_stage(opts, stage_opts));
    });
}

} // namespace ctxstage::cli::commands
