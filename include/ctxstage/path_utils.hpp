#pragma once

#include <string>

namespace ctxstage {

enum class PathError {
    None,
    Empty,
    ContainsNul,
    AbsoluteNotAllowed,
    EscapesRoot,
};

inline const char* path_error_to_string(PathError e) {
    switch (e) {
        case PathError::None: return "none";
        case PathError::Empty: return "names the root itself";
        case PathError::ContainsNul: return "contains a NUL byte";
        case PathError::AbsoluteNotAllowed: return "is absolute";
        case PathError::EscapesRoot: return "escapes the context root";
        default: return "invalid";
    }
}

struct PathResult {
    bool ok;
    std::string path;  // normalized path under root when ok
    PathError error;
};

// Resolve a destination name under a root without following symlinks (string-based).
// - Rejects NUL bytes and absolute names
// - Collapses "." and ".." segments
// - Fails if the result would escape root or would be root itself
PathResult resolve_under_root(const std::string& root, const std::string& relative_path);

} // namespace ctxstage
