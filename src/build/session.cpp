#include "ctxstage/session.hpp"
#include "ctxstage/image_ref.hpp"
#include "ctxstage/interrupt.hpp"
#include "ctxstage/logs.hpp"
#include "ctxstage/platform.hpp"
#include "ctxstage/stager.hpp"

#include <spdlog/spdlog.h>

namespace ctxstage {

namespace {

void fail(BuildOutcome& outcome, ErrorKind kind, const std::string& message) {
    spdlog::error("{}", message);
    outcome.errors.push_back({kind, message});
    if (outcome.exit_code == 0) {
        outcome.exit_code = 1;
    }
}

// Interrupted runs end with 130 unless the engine already failed
void mark_interrupted(BuildOutcome& outcome) {
    outcome.errors.push_back({ErrorKind::Interrupted, "Aborted by user (Ctrl-C)"});
    if (outcome.exit_code == 0) {
        outcome.exit_code = EXIT_INTERRUPTED;
    }
}

// Early exits still report a pending interrupt
bool check_interrupt(BuildOutcome& outcome, std::ostream& console) {
    if (!interrupt_requested()) {
        return false;
    }
    mark_interrupted(outcome);
    console << "Aborted by user (Ctrl-C)" << std::endl;
    return true;
}

} // namespace

std::vector<ErrorReport> validate_references(const std::string& tag,
                                             const std::string& base_image) {
    std::vector<ErrorReport> errors;

    if (tag.empty()) {
        errors.push_back({ErrorKind::Validation, "Image tag is required"});
    } else if (!is_valid_image_reference(tag)) {
        errors.push_back({ErrorKind::Validation, "Invalid image tag '" + tag + "'"});
    }

    if (!base_image.empty() && !is_valid_image_reference(base_image)) {
        errors.push_back({ErrorKind::Validation, "Invalid base image '" + base_image + "'"});
    }

    return errors;
}

std::vector<ErrorReport> validate_request(const BuildRequest& request) {
    auto errors = validate_references(request.tag, request.base_image);

    if (request.manifest.empty()) {
        errors.push_back({ErrorKind::Validation, "Manifest has no entries"});
    } else if (!request.manifest.contains(request.manifest.build_file())) {
        errors.push_back({ErrorKind::Validation, "Build file '" + request.manifest.build_file() +
                                                     "' is not part of the manifest"});
    }

    return errors;
}

BuildInvocation make_invocation(const BuildRequest& request, const ToolConfig& config,
                                const std::string& context_dir) {
    BuildInvocation invocation;
    invocation.executable = config.engine;
    invocation.context_dir = context_dir;
    invocation.build_file = request.manifest.build_file();
    invocation.build_args = request.build_args;
    invocation.labels = request.labels;
    invocation.tag = request.tag;
    invocation.use_cache = request.use_cache;
    invocation.pull = request.pull;
    invocation.base_image = request.base_image;
    invocation.progress = config.progress;

    if (!request.base_image.empty()) {
        invocation.build_args.push_back({"BASE_IMG", request.base_image});
    }

    if (request.metadata_labels) {
        std::string authors = request.meta_authors.empty() ? get_current_user()
                                                           : request.meta_authors;
        invocation.labels.push_back({"org.opencontainers.image.created", get_current_timestamp()});
        if (!request.meta_title.empty()) {
            invocation.labels.push_back({"org.opencontainers.image.title", request.meta_title});
        }
        if (!request.meta_description.empty()) {
            invocation.labels.push_back(
                {"org.opencontainers.image.description", request.meta_description});
        }
        if (!authors.empty()) {
            invocation.labels.push_back({"org.opencontainers.image.authors", authors});
        }
    }

    if (config.buildkit) {
        invocation.environment["DOCKER_BUILDKIT"] = "1";
    }

    return invocation;
}

BuildOutcome BuildSession::run(const BuildRequest& request) {
    BuildOutcome outcome;

    // ------------------------------------------------------------------------
    // Validation
    // ------------------------------------------------------------------------
    auto validation = validate_request(request);
    if (!validation.empty()) {
        for (const auto& e : validation) {
            fail(outcome, e.kind, e.message);
        }
        return outcome;
    }

    InterruptGuard guard;
    clear_interrupt();

    // ------------------------------------------------------------------------
    // Staging
    // ------------------------------------------------------------------------
    std::string error;
    auto context = BuildContext::create(config_.temp_dir, config_.context_prefix, &error);
    if (!context) {
        fail(outcome, ErrorKind::Staging, "Could not create context directory: " + error);
        check_interrupt(outcome, console_);
        return outcome;
    }
    outcome.context_dir = context->path();
    spdlog::debug("Context directory: {}", context->path());

    auto staged = stage_context(request.manifest, context->path());
    if (!staged.ok) {
        fail(outcome, ErrorKind::Staging, staged.error);
        check_interrupt(outcome, console_);
        return outcome;
    }

    if (check_interrupt(outcome, console_)) {
        return outcome;
    }

    // ------------------------------------------------------------------------
    // Invocation
    // ------------------------------------------------------------------------
    BuildInvocation invocation = make_invocation(request, config_, context->path());

    bool add_pull_flag = false;
    if (!invocation.base_image.empty()) {
        BaseImageState state = BaseImageState::NoLocalCopy;
        if (!invocation.pull) {
            state = engine_.inspect_image(invocation, invocation.base_image);
        }
        PullDecision decision = decide_pull(invocation.pull, state, invocation.base_image);
        add_pull_flag = decision.add_pull_flag;
        if (!decision.notice.empty()) {
            spdlog::info("{}", decision.notice);
        }
    }

    // image inspect can take a while; do not start the engine after Ctrl-C
    if (check_interrupt(outcome, console_)) {
        return outcome;
    }

    outcome.command = build_command(invocation, add_pull_flag);
    console_ << "Executing command:\n" << exec::format_command_line(outcome.command) << std::endl;

    // ------------------------------------------------------------------------
    // Build with live log capture
    // ------------------------------------------------------------------------
    outcome.artifact = make_log_artifact(config_.log_dir, request.tag, get_log_timestamp());

    if (!create_directories(config_.log_dir)) {
        fail(outcome, ErrorKind::BuildEngine, "Could not create log directory '" +
                                                  config_.log_dir + "'");
        check_interrupt(outcome, console_);
        return outcome;
    }

    LogMultiplexer mux(console_);
    if (!mux.open(outcome.artifact.complete_log_path)) {
        fail(outcome, ErrorKind::BuildEngine, mux.error());
        check_interrupt(outcome, console_);
        return outcome;
    }

    auto result = engine_.run_build(invocation, outcome.command, mux.handler());
    mux.close();

    if (!result.ok) {
        fail(outcome, ErrorKind::BuildEngine, result.error);
    } else {
        outcome.exit_code = result.exit_code;
    }

    if (!mux.ok()) {
        fail(outcome, ErrorKind::BuildEngine, mux.error());
    }

    if (outcome.exit_code == 0) {
        console_ << "SUCCESS: image '" << request.tag << "' built" << std::endl;
    } else {
        if (result.ok) {
            outcome.errors.push_back({ErrorKind::BuildEngine,
                                      "Build engine exited with code " +
                                          std::to_string(outcome.exit_code)});
        }
        console_ << "FAILURE: image '" << request.tag << "' (exit code " << outcome.exit_code
                 << ")" << std::endl;
    }

    // ------------------------------------------------------------------------
    // Log post-processing
    // ------------------------------------------------------------------------
    auto finalized = finalize_logs(outcome.artifact, outcome.exit_code);
    outcome.exit_code = finalized.exit_code;
    for (const auto& e : finalized.errors) {
        outcome.errors.push_back(e);
    }
    for (const auto& notice : finalized.notices) {
        spdlog::info("{}", notice);
    }

    if (result.interrupted || interrupt_requested()) {
        mark_interrupted(outcome);
        console_ << "Aborted by user (Ctrl-C)" << std::endl;
    }

    return outcome;
}

} // namespace ctxstage
