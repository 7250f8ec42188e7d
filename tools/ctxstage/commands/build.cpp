/**
 * ctxstage CLI - build command
 *
 * Stage the manifest into a fresh context directory, run the build engine
 * against it and post-process the build log.
 */

#include "../common.hpp"
#include <ctxstage/platform.hpp>
#include <ctxstage/session.hpp>
#include <CLI/CLI.hpp>

namespace ctxstage::cli::commands {

namespace {

struct BuildOptions {
    std::string manifest;
    std::string tag;
    std::string base_image;
    bool pull = false;
    bool use_cache = false;
    std::vector<std::string> build_args;
    std::vector<std::string> labels;
    std::vector<std::string> files;
    std::vector<std::string> exec_files;
    std::string meta_title;
    std::string meta_desc;
    std::string meta_authors;
    bool no_meta = false;
    std::string engine;
    std::string log_dir;
    std::string tmp_dir;
};

nlohmann::json outcome_to_json(const BuildOutcome& outcome) {
    nlohmann::json j;
    j["ok"] = outcome.exit_code == 0;
    j["exit_code"] = outcome.exit_code;
    j["command"] = outcome.command;

    nlohmann::json errors = nlohmann::json::array();
    for (const auto& e : outcome.errors) {
        errors.push_back({{"kind", error_kind_to_string(e.kind)}, {"message", e.message}});
    }
    j["errors"] = errors;

    if (!outcome.artifact.complete_log_path.empty()) {
        j["complete_log"] = path_exists(outcome.artifact.complete_log_path)
                                ? nlohmann::json(outcome.artifact.complete_log_path)
                                : nlohmann::json(nullptr);
        j["specific_log"] = path_exists(outcome.artifact.specific_log_path)
                                ? nlohmann::json(outcome.artifact.specific_log_path)
                                : nlohmann::json(nullptr);
    }
    return j;
}

int cmd_build(const GlobalOptions& opts, const BuildOptions& build_opts) {
    init_warning_collector(opts.json);

    // Bad references are rejected before the config or any manifest file is read
    auto ref_errors = validate_references(build_opts.tag, build_opts.base_image);
    if (!ref_errors.empty()) {
        BuildOutcome rejected;
        rejected.exit_code = 1;
        rejected.errors = ref_errors;
        if (opts.json) {
            output_json(outcome_to_json(rejected));
        } else {
            for (const auto& e : ref_errors) {
                print_error(e.message, false);
            }
        }
        return 1;
    }

    ConfigOverrides overrides;
    overrides.engine = optional_flag(build_opts.engine);
    overrides.log_dir = optional_flag(build_opts.log_dir);
    overrides.temp_dir = optional_flag(build_opts.tmp_dir);

    ToolConfig config;
    if (!load_config(opts, overrides, config)) {
        return 1;
    }

    BuildRequest request;
    if (!load_manifest(opts, build_opts.manifest, build_opts.files, build_opts.exec_files,
                       request.manifest)) {
        return 1;
    }
    if (!parse_key_values(opts, "--build-arg", build_opts.build_args, request.build_args) ||
        !parse_key_values(opts, "--label", build_opts.labels, request.labels)) {
        return 1;
    }

    request.tag = build_opts.tag;
    request.base_image = build_opts.base_image;
    request.pull = build_opts.pull;
    request.use_cache = build_opts.use_cache;
    request.metadata_labels = !build_opts.no_meta;
    request.meta_title = build_opts.meta_title;
    request.meta_description = build_opts.meta_desc;
    request.meta_authors = build_opts.meta_authors;

    // In JSON mode stdout carries only the result document
    std::ostream& console = opts.json ? std::cerr : std::cout;

    ProcessBuildEngine engine;
    BuildSession session(config, engine, console);
    BuildOutcome outcome = session.run(request);

    // Errors were already logged as they happened
    if (opts.json) {
        output_json(outcome_to_json(outcome));
    }

    return outcome.exit_code;
}

} // namespace

void setup_build(CLI::App* app, GlobalOptions& opts) {
    static BuildOptions build_opts;

    app->add_option("-m,--manifest", build_opts.manifest, "Manifest file (ctxstage.manifest.v1)");
    app->add_option("-t,--tag", build_opts.tag, "Image tag")->required();
    app->add_option("--base-img", build_opts.base_image,
                    "Base image, passed as build argument BASE_IMG");
    app->add_flag("--pull", build_opts.pull, "Always pull the base image");
    app->add_flag("--cache", build_opts.use_cache, "Allow the engine's layer cache");
    app->add_option("--build-arg", build_opts.build_args, "Build argument KEY=VALUE");
    app->add_option("--label", build_opts.labels, "Image label KEY=VALUE");
    app->add_option("--file", build_opts.files, "Add or replace a data file DEST=PATH");
    app->add_option("--exec-file", build_opts.exec_files,
                    "Add or replace an executable file DEST=PATH");
    app->add_option("--meta-title", build_opts.meta_title, "org.opencontainers.image.title");
    app->add_option("--meta-desc", build_opts.meta_desc, "org.opencontainers.image.description");
    app->add_option("--meta-authors", build_opts.meta_authors,
                    "org.opencontainers.image.authors (default: current user)");
    app->add_flag("--no-meta", build_opts.no_meta, "Do not add OCI metadata labels");
    app->add_option("--engine", build_opts.engine, "Build engine executable");
    app->add_option("--log-dir", build_opts.log_dir, "Directory for build logs");
    app->add_option("--tmp-dir", build_opts.tmp_dir, "Parent directory of the build context");

    app->callback([&opts]() {
        std::exit(cmd_build(opts, build_opts));
    });
}

} // namespace ctxstage::cli::commands
