#pragma once

#include "ctxstage/exec.hpp"
#include "ctxstage/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace ctxstage {

// ============================================================================
// Build Invocation
// ============================================================================

struct BuildInvocation {
    std::string executable = "docker";
    std::string context_dir;
    std::string build_file = "Dockerfile";      // relative to context_dir
    std::vector<KeyValue> build_args;           // emitted sorted by key
    std::vector<KeyValue> labels;               // emitted sorted by key
    std::string tag;
    bool use_cache = false;
    bool pull = false;
    std::string base_image;                     // empty: no image inspect for the pull policy
    std::map<std::string, std::string> environment;   // e.g. DOCKER_BUILDKIT=1
    std::string progress = "plain";
};

// Sort key/value pairs by key; stable for equal keys
std::vector<KeyValue> sorted_by_key(std::vector<KeyValue> pairs);

// ============================================================================
// Pull Policy
// ============================================================================

enum class BaseImageState {
    NoLocalCopy,
    LocalCopyPresent,
};

struct PullDecision {
    bool add_pull_flag = false;
    std::string notice;     // empty when nothing needs to be said
};

PullDecision decide_pull(bool pull_requested, BaseImageState state,
                         const std::string& base_image);

// ============================================================================
// Build Engine
// ============================================================================

// The external image builder. The process-backed implementation runs the
// docker-compatible CLI; tests substitute their own.
class BuildEngine {
public:
    virtual ~BuildEngine() = default;

    // Whether a local copy of image exists. Failures of the query itself
    // count as "absent".
    virtual BaseImageState inspect_image(const BuildInvocation& invocation,
                                         const std::string& image) = 0;

    // Run the build; every output line goes to on_line in production order.
    virtual exec::ExecResult run_build(const BuildInvocation& invocation,
                                       const std::vector<std::string>& argv,
                                       const exec::LineHandler& on_line) = 0;
};

class ProcessBuildEngine : public BuildEngine {
public:
    BaseImageState inspect_image(const BuildInvocation& invocation,
                                 const std::string& image) override;

    exec::ExecResult run_build(const BuildInvocation& invocation,
                               const std::vector<std::string>& argv,
                               const exec::LineHandler& on_line) override;
};

// Full argv for the build, given the pull decision already taken:
//   <exe> build --file <ctx>/<file> --progress=<p> [--pull] [--no-cache]
//   (--build-arg K=V)* (--label K=V)* --tag <tag> <ctx>
std::vector<std::string> build_command(const BuildInvocation& invocation, bool add_pull_flag);

} // namespace ctxstage
