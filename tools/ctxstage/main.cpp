/**
 * ctxstage CLI - Entry Point
 *
 * Stages a manifest into a build context and runs the image build engine.
 */

#include <CLI/CLI.hpp>
#include "common.hpp"

// Forward declarations for commands
namespace ctxstage::cli::commands {
    void setup_build(CLI::App* app, GlobalOptions& opts);
    void setup_stage(CLI::App* app, GlobalOptions& opts);
    void setup_check_ref(CLI::App* app, GlobalOptions& opts);
    void setup_filter_log(CLI::App* app, GlobalOptions& opts);
}

int main(int argc, char** argv) {
    using namespace ctxstage::cli;

    CLI::App app{"ctxstage - build context stager and image build runner"};
    app.set_version_flag("-V,--version", CTXSTAGE_VERSION);
    app.require_subcommand(0, 1);

    GlobalOptions opts;

    // Global options
    app.add_option("--config", opts.config, "Tool config file (ctxstage.config.v1)");
    app.add_flag("--json", opts.json, "Machine-readable output");
    app.add_flag("-v,--verbose", opts.verbose, "Detailed progress");
    app.add_flag("-q,--quiet", opts.quiet, "Minimal output");

    // Runs after parsing, before the selected subcommand's callback
    app.parse_complete_callback([&opts]() { configure_logging(opts); });

    // Commands
    auto* build_cmd = app.add_subcommand("build", "Stage a context and build an image");
    commands::setup_build(build_cmd, opts);

    auto* stage_cmd = app.add_subcommand("stage", "Stage a context into a directory");
    commands::setup_stage(stage_cmd, opts);

    auto* check_cmd = app.add_subcommand("check-ref", "Validate image references");
    commands::setup_check_ref(check_cmd, opts);

    auto* filter_cmd = app.add_subcommand("filter-log", "Extract marker lines from a build log");
    commands::setup_filter_log(filter_cmd, opts);

    CLI11_PARSE(app, argc, argv);

    // If no subcommand, show help
    if (app.get_subcommands().empty()) {
        std::cout << app.help() << std::endl;
    }

    return 0;
}
