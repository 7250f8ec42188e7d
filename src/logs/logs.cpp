#include "ctxstage/logs.hpp"
#include "ctxstage/image_ref.hpp"
#include "ctxstage/platform.hpp"

#include <filesystem>
#include <regex>
#include <system_error>

#include <spdlog/spdlog.h>

namespace ctxstage {

LogArtifact make_log_artifact(const std::string& log_dir, const std::string& tag,
                              const std::string& timestamp) {
    std::string prefix = "build_img_" + sanitize_image_reference(tag) + "_" + timestamp;

    LogArtifact artifact;
    artifact.complete_log_path = join_path(log_dir, prefix + "_complete.log");
    artifact.specific_log_path = join_path(log_dir, prefix + "_specific.log");
    return artifact;
}

// ============================================================================
// Log Multiplexer
// ============================================================================

bool LogMultiplexer::open(const std::string& complete_log_path) {
    path_ = complete_log_path;
    log_.open(complete_log_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!log_) {
        error_ = "failed to create log file '" + complete_log_path + "'";
        return false;
    }
    return true;
}

void LogMultiplexer::write_line(const std::string& line) {
    console_ << line << '\n' << std::flush;

    if (log_.is_open()) {
        log_ << line << '\n';
        log_.flush();
        if (!log_ && error_.empty()) {
            error_ = "failed to write log file '" + path_ + "'";
        }
    }

    ++line_count_;
}

exec::LineHandler LogMultiplexer::handler() {
    return [this](const std::string& line) { write_line(line); };
}

void LogMultiplexer::close() {
    if (log_.is_open()) {
        log_.close();
        if (log_.fail() && error_.empty()) {
            error_ = "failed to close log file '" + path_ + "'";
        }
    }
}

// ============================================================================
// Log Filter
// ============================================================================

bool is_marker_line(const std::string& line) {
    static const std::regex marker(R"(\[\d{4}-\d{2}-\d{2}_\d{2}-\d{2}-\d{2}\])");
    return std::regex_search(line, marker);
}

bool log_paths_collide(const LogArtifact& artifact) {
    namespace fs = std::filesystem;
    std::error_code ec1;
    std::error_code ec2;
    auto complete = fs::weakly_canonical(artifact.complete_log_path, ec1);
    auto specific = fs::weakly_canonical(artifact.specific_log_path, ec2);
    if (ec1 || ec2) {
        return artifact.complete_log_path == artifact.specific_log_path;
    }
    return complete == specific;
}

FilterResult filter_specific_log(const LogArtifact& artifact) {
    FilterResult result;

    // Opening the output would truncate the input
    if (log_paths_collide(artifact)) {
        result.error = "specific log '" + artifact.specific_log_path +
                       "' is the complete log itself";
        return result;
    }

    std::ifstream in(artifact.complete_log_path, std::ios::binary);
    if (!in) {
        result.error = "failed to open log file '" + artifact.complete_log_path + "'";
        return result;
    }

    std::ofstream out(artifact.specific_log_path, std::ios::out | std::ios::trunc | std::ios::binary);
    if (!out) {
        result.error = "failed to create log file '" + artifact.specific_log_path + "'";
        return result;
    }

    std::string line;
    while (std::getline(in, line)) {
        if (is_marker_line(line)) {
            out << line << '\n';
            ++result.matches;
        }
    }

    out.close();
    if (out.fail()) {
        result.error = "failed to write log file '" + artifact.specific_log_path + "'";
        return result;
    }

    result.ok = true;
    return result;
}

namespace {

void report_cleanup(FinalizeResult& result, const std::string& message) {
    spdlog::error("{}", message);
    result.errors.push_back({ErrorKind::Cleanup, message});
    if (result.exit_code == 0) {
        result.exit_code = 1;
    }
}

} // namespace

FinalizeResult finalize_logs(const LogArtifact& artifact, int build_exit_code) {
    FinalizeResult result;
    result.exit_code = build_exit_code;

    if (!path_exists(artifact.complete_log_path)) {
        result.notices.push_back("Log file '" + artifact.complete_log_path + "' does not exist.");
        return result;
    }

    auto size = file_size(artifact.complete_log_path);
    if (!size) {
        report_cleanup(result, "Could not stat log file '" + artifact.complete_log_path + "'");
        return result;
    }

    if (*size == 0) {
        std::string error;
        if (!remove_file(artifact.complete_log_path, &error)) {
            report_cleanup(result, "Could not remove log file '" + artifact.complete_log_path +
                                   "': " + error);
            result.complete_log_kept = true;
        }
        return result;
    }

    result.complete_log_kept = true;
    result.notices.push_back("Log file '" + artifact.complete_log_path + "' is ready");

    if (log_paths_collide(artifact)) {
        report_cleanup(result, "Specific log '" + artifact.specific_log_path +
                                   "' is the complete log itself");
        return result;
    }

    auto filtered = filter_specific_log(artifact);
    if (!filtered.ok) {
        report_cleanup(result, filtered.error);
        // Do not leave a partial specific log behind
        if (path_exists(artifact.specific_log_path)) {
            std::string error;
            if (!remove_file(artifact.specific_log_path, &error)) {
                report_cleanup(result, "Could not remove log file '" +
                                       artifact.specific_log_path + "': " + error);
                result.specific_log_kept = true;
            }
        }
        return result;
    }

    if (filtered.matches == 0) {
        result.notices.push_back("No matching specific log lines found.");
        std::string error;
        if (!remove_file(artifact.specific_log_path, &error)) {
            report_cleanup(result, "Could not remove log file '" + artifact.specific_log_path +
                                   "': " + error);
            result.specific_log_kept = true;
        }
        return result;
    }

    result.specific_log_kept = true;
    result.notices.push_back("Specific log file '" + artifact.specific_log_path + "' is ready.");
    return result;
}

} // namespace ctxstage
