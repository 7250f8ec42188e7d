#pragma once

#include <optional>
#include <string>
#include <vector>
#include <cstdint>
#include <unordered_map>

namespace ctxstage {

// ============================================================================
// Atomic File Operations
// ============================================================================

struct AtomicWriteResult {
    bool ok = false;
    std::string error;
};

// Write content atomically using temp file + fsync + rename + fsync(dir).
// The final file is created with the given mode (umask is not applied).
AtomicWriteResult atomic_write_file(const std::string& path, const std::string& content,
                                    unsigned mode = 0644);

// ============================================================================
// Path Utilities
// ============================================================================

// Get the directory containing a file path
std::string get_parent_directory(const std::string& path);

// Join path components
std::string join_path(const std::string& base, const std::string& rel);

// Expand a leading "~" to $HOME and make the path absolute
std::string expand_user_path(const std::string& path);

bool path_exists(const std::string& path);
bool is_directory(const std::string& path);
bool is_regular_file(const std::string& path);

// Size of a regular file, nullopt if it cannot be stat'ed
std::optional<std::uintmax_t> file_size(const std::string& path);

// List directory entries (names only, sorted)
std::vector<std::string> list_directory(const std::string& path);

// Create parent directories recursively
bool create_directories(const std::string& path);

// Remove a directory recursively
bool remove_directory(const std::string& path);

// Remove a file; error receives the reason on failure
bool remove_file(const std::string& path, std::string* error = nullptr);

// Copy a file byte-for-byte (overwrites)
bool copy_file(const std::string& src, const std::string& dst);

// Set permission bits exactly (no umask)
bool set_mode(const std::string& path, unsigned mode);

// Read permission bits
std::optional<unsigned> get_mode(const std::string& path);

// Read a whole file into memory
std::optional<std::string> read_file(const std::string& path);

// System temporary directory
std::string temp_directory();

// ============================================================================
// Environment
// ============================================================================

std::optional<std::string> get_env(const std::string& name);

std::unordered_map<std::string, std::string> get_all_env();

// Login name of the current user, "unknown" if it cannot be determined
std::string get_current_user();

// ============================================================================
// Time / Identifiers
// ============================================================================

// Current UTC time as RFC3339 (2024-01-01T00:00:00Z)
std::string get_current_timestamp();

// Current UTC time as 2024-01-01_00-00-00 (log file names and markers)
std::string get_log_timestamp();

} // namespace ctxstage
