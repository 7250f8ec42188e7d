#pragma once

#include "ctxstage/invocation.hpp"
#include "ctxstage/manifest.hpp"
#include "ctxstage/tool_config.hpp"
#include "ctxstage/types.hpp"

#include <ostream>
#include <string>
#include <utility>
#include <vector>

namespace ctxstage {

// ============================================================================
// Build Session
// ============================================================================

constexpr int EXIT_INTERRUPTED = 130;

struct BuildRequest {
    Manifest manifest;
    std::string tag;
    std::string base_image;                 // empty: no BASE_IMG, no image inspect
    bool pull = false;
    bool use_cache = false;
    std::vector<KeyValue> build_args;
    std::vector<KeyValue> labels;

    // OCI metadata labels (org.opencontainers.image.*)
    bool metadata_labels = true;
    std::string meta_title;
    std::string meta_description;
    std::string meta_authors;               // empty: current user
};

struct BuildOutcome {
    int exit_code = 0;
    std::vector<ErrorReport> errors;        // every reported error, in order
    LogArtifact artifact;                   // empty until the build was started
    std::vector<std::string> command;       // argv handed to the engine
    std::string context_dir;                // already removed when run() returns
};

// Check the tag and base image; needs nothing but the two strings, so callers
// run it before reading any input file
std::vector<ErrorReport> validate_references(const std::string& tag,
                                             const std::string& base_image);

// validate_references plus the manifest checks
std::vector<ErrorReport> validate_request(const BuildRequest& request);

// Invocation for a staged context: BASE_IMG, OCI labels and the builder
// feature flag are added here
BuildInvocation make_invocation(const BuildRequest& request, const ToolConfig& config,
                                const std::string& context_dir);

/**
 * Validation, staging, build and log post-processing under one scoped
 * cleanup. The context directory never outlives run(), whether it returns
 * after success, failure or a user interrupt.
 */
class BuildSession {
public:
    BuildSession(ToolConfig config, BuildEngine& engine, std::ostream& console)
        : config_(std::move(config)), engine_(engine), console_(console) {}

    BuildOutcome run(const BuildRequest& request);

private:
    ToolConfig config_;
    BuildEngine& engine_;
    std::ostream& console_;
};

} // namespace ctxstage
