/**
 * ctxstage CLI - filter-log command
 *
 * Run the marker-line filter on an existing complete build log.
 */

#include "../common.hpp"
#include <ctxstage/logs.hpp>
#include <ctxstage/platform.hpp>
#include <CLI/CLI.hpp>

namespace ctxstage::cli::commands {

namespace {

struct FilterLogOptions {
    std::string complete_log;
    std::string output;
};

// build_img_x_..._complete.log -> build_img_x_..._specific.log
std::string default_specific_path(const std::string& complete) {
    const std::string suffix = "_complete.log";
    if (complete.size() > suffix.size() &&
        complete.compare(complete.size() - suffix.size(), suffix.size(), suffix) == 0) {
        return complete.substr(0, complete.size() - suffix.size()) + "_specific.log";
    }
    return complete + ".specific";
}

int cmd_filter_log(const GlobalOptions& opts, const FilterLogOptions& filter_opts) {
    init_warning_collector(opts.json);

    LogArtifact artifact;
    artifact.complete_log_path = expand_user_path(filter_opts.complete_log);
    artifact.specific_log_path = filter_opts.output.empty()
                                     ? default_specific_path(artifact.complete_log_path)
                                     : expand_user_path(filter_opts.output);

    if (!is_regular_file(artifact.complete_log_path)) {
        print_error("Log file '" + artifact.complete_log_path + "' does not exist", opts.json);
        return 1;
    }

    if (log_paths_collide(artifact)) {
        print_error("Output '" + artifact.specific_log_path + "' is the input log itself",
                    opts.json);
        return 1;
    }

    auto result = finalize_logs(artifact, 0);

    if (opts.json) {
        nlohmann::json j;
        j["ok"] = result.exit_code == 0;
        j["complete_log"] = result.complete_log_kept ? nlohmann::json(artifact.complete_log_path)
                                                     : nlohmann::json(nullptr);
        j["specific_log"] = result.specific_log_kept ? nlohmann::json(artifact.specific_log_path)
                                                     : nlohmann::json(nullptr);
        nlohmann::json errors = nlohmann::json::array();
        for (const auto& e : result.errors) {
            errors.push_back(e.message);
        }
        j["errors"] = errors;
        output_json(j);
    } else {
        for (const auto& notice : result.notices) {
            print_success(notice, false);
        }
    }

    return result.exit_code;
}

} // namespace

void setup_filter_log(CLI::App* app, GlobalOptions& opts) {
    static FilterLogOptions filter_opts;

    app->add_option("complete_log", filter_opts.complete_log, "Complete build log")->required();
    app->add_option("-o,--output", filter_opts.output,
                    "Specific log path (default: *_specific.log beside the input)");

    app->callback([&opts]() {
        std::exit(cmd_filter_log(opts, filter_opts));
    });
}

} // namespace ctxstage::cli::commands
