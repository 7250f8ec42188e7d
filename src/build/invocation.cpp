#include "ctxstage/invocation.hpp"
#include "ctxstage/platform.hpp"

#include <algorithm>

#include <spdlog/spdlog.h>

namespace ctxstage {

std::vector<KeyValue> sorted_by_key(std::vector<KeyValue> pairs) {
    std::stable_sort(pairs.begin(), pairs.end(),
                     [](const KeyValue& a, const KeyValue& b) { return a.key < b.key; });
    return pairs;
}

PullDecision decide_pull(bool pull_requested, BaseImageState state,
                         const std::string& base_image) {
    PullDecision decision;

    if (pull_requested) {
        decision.add_pull_flag = true;
        decision.notice = "--pull specified. Build engine will attempt to pull/update base image '" +
                          base_image + "'";
    } else if (state == BaseImageState::NoLocalCopy) {
        decision.notice = "Base image '" + base_image +
                          "' not found locally. Build engine will attempt to pull it";
    } else {
        decision.notice = "Using local base image '" + base_image + "'";
    }

    return decision;
}

std::vector<std::string> build_command(const BuildInvocation& invocation, bool add_pull_flag) {
    std::vector<std::string> argv = {
        invocation.executable,
        "build",
        "--file",
        join_path(invocation.context_dir, invocation.build_file),
        "--progress=" + invocation.progress,
    };

    if (add_pull_flag) {
        argv.push_back("--pull");
    }

    if (!invocation.use_cache) {
        argv.push_back("--no-cache");
    }

    for (const auto& arg : sorted_by_key(invocation.build_args)) {
        argv.push_back("--build-arg");
        argv.push_back(arg.key + "=" + arg.value);
    }

    for (const auto& label : sorted_by_key(invocation.labels)) {
        argv.push_back("--label");
        argv.push_back(label.key + "=" + label.value);
    }

    argv.push_back("--tag");
    argv.push_back(invocation.tag);
    argv.push_back(invocation.context_dir);

    return argv;
}

// ============================================================================
// Process-backed engine
// ============================================================================

BaseImageState ProcessBuildEngine::inspect_image(const BuildInvocation& invocation,
                                                 const std::string& image) {
    exec::Command command;
    command.argv = {invocation.executable, "image", "inspect", image};
    command.environment = invocation.environment;

    auto result = exec::run_quiet(command);
    if (!result.ok) {
        spdlog::debug("Image inspect for '{}' failed: {}", image, result.error);
        return BaseImageState::NoLocalCopy;
    }
    return result.exit_code == 0 ? BaseImageState::LocalCopyPresent
                                 : BaseImageState::NoLocalCopy;
}

exec::ExecResult ProcessBuildEngine::run_build(const BuildInvocation& invocation,
                                               const std::vector<std::string>& argv,
                                               const exec::LineHandler& on_line) {
    exec::Command command;
    command.argv = argv;
    command.environment = invocation.environment;
    return exec::run_streaming(command, on_line);
}

} // namespace ctxstage
