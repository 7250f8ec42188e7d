#pragma once

#include "ctxstage/exec.hpp"
#include "ctxstage/types.hpp"

#include <fstream>
#include <ostream>
#include <string>
#include <vector>

namespace ctxstage {

// ============================================================================
// Log Artifacts
// ============================================================================

// <log_dir>/build_img_<sanitized tag>_<timestamp>_complete.log / _specific.log
LogArtifact make_log_artifact(const std::string& log_dir, const std::string& tag,
                              const std::string& timestamp);

// ============================================================================
// Log Multiplexer
// ============================================================================

// Duplicates each line to the console and to the complete log. Both sinks are
// flushed before write_line returns, so the two stay in the same order as the
// producer.
class LogMultiplexer {
public:
    explicit LogMultiplexer(std::ostream& console) : console_(console) {}

    // Create (truncate) the complete log
    bool open(const std::string& complete_log_path);

    void write_line(const std::string& line);

    // Handler suitable for exec::run_streaming
    exec::LineHandler handler();

    void close();

    bool ok() const { return error_.empty(); }
    const std::string& error() const { return error_; }
    size_t line_count() const { return line_count_; }

private:
    std::ostream& console_;
    std::ofstream log_;
    std::string path_;
    std::string error_;
    size_t line_count_ = 0;
};

// ============================================================================
// Log Filter
// ============================================================================

// True if the line contains a [YYYY-MM-DD_HH-MM-SS] marker
bool is_marker_line(const std::string& line);

struct FilterResult {
    bool ok = false;
    std::string error;
    size_t matches = 0;
};

// True if both artifact paths name the same file
bool log_paths_collide(const LogArtifact& artifact);

// Copy every marker line of the complete log, in order, to the specific log.
// Fails without touching either file if the two paths collide.
FilterResult filter_specific_log(const LogArtifact& artifact);

struct FinalizeResult {
    int exit_code = 0;
    std::vector<ErrorReport> errors;        // Cleanup errors, in order
    std::vector<std::string> notices;
    bool complete_log_kept = false;
    bool specific_log_kept = false;
};

// Post-process the logs of a finished build:
// - missing complete log: notice only
// - empty complete log: deleted
// - otherwise filtered; a specific log without matches is deleted
// A failure here turns a successful build_exit_code into 1 and never changes
// a non-zero one.
FinalizeResult finalize_logs(const LogArtifact& artifact, int build_exit_code);

} // namespace ctxstage
