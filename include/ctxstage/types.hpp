#pragma once

#include <nlohmann/json.hpp>

#include <string>
#include <variant>
#include <vector>

namespace ctxstage {

// ============================================================================
// Error Taxonomy
// ============================================================================

enum class ErrorKind {
    Validation,     // bad image reference, missing/empty required input
    Staging,        // manifest source missing, wrong kind, bad template context
    BuildEngine,    // child process exited non-zero, or its log could not be written
    Cleanup,        // log artifact could not be removed
    Interrupted,    // SIGINT / SIGTERM
};

inline const char* error_kind_to_string(ErrorKind k) {
    switch (k) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::Staging: return "staging";
        case ErrorKind::BuildEngine: return "build_engine";
        case ErrorKind::Cleanup: return "cleanup";
        case ErrorKind::Interrupted: return "interrupted";
        default: return "unknown";
    }
}

struct ErrorReport {
    ErrorKind kind;
    std::string message;
};

// ============================================================================
// Manifest Entries
// ============================================================================

// Copy a regular file, or a directory tree when the source is a directory
struct CopyAction {
    std::string source_path;
};

// Render a template file against a JSON object context
struct RenderAction {
    std::string source_path;
    nlohmann::json context;
};

enum class EmptyKind {
    File,
    Directory
};

struct CreateEmptyAction {
    EmptyKind kind = EmptyKind::File;
};

using ProvisionAction = std::variant<CopyAction, RenderAction, CreateEmptyAction>;

struct ManifestEntry {
    std::string destination_name;
    ProvisionAction action;
    bool executable = false;
};

inline const char* action_name(const ProvisionAction& action) {
    switch (action.index()) {
        case 0: return "copy";
        case 1: return "render";
        case 2: return "create";
        default: return "unknown";
    }
}

// ============================================================================
// Permission Classes
// ============================================================================

// rwxrwxr-x
constexpr unsigned EXECUTABLE_MODE = 0775;
// rw-rw-r--
constexpr unsigned DATA_FILE_MODE = 0664;

inline unsigned mode_for(bool executable) {
    return executable ? EXECUTABLE_MODE : DATA_FILE_MODE;
}

// ============================================================================
// Build Invocation
// ============================================================================

struct KeyValue {
    std::string key;
    std::string value;
};

// ============================================================================
// Log Artifacts
// ============================================================================

struct LogArtifact {
    std::string complete_log_path;
    std::string specific_log_path;
};

} // namespace ctxstage
