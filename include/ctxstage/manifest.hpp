#pragma once

#include "ctxstage/types.hpp"

#include <map>
#include <string>
#include <vector>

namespace ctxstage {

// ============================================================================
// Manifest
// ============================================================================

// Ordered set of entries keyed by destination name. Iteration is lexicographic
// by destination name so two stagings of the same manifest visit entries in
// the same order regardless of how the manifest was assembled.
class Manifest {
public:
    using Entries = std::map<std::string, ManifestEntry>;

    // Adds an entry; fails if the destination name is already taken
    bool add(ManifestEntry entry, std::string* error = nullptr);

    // Adds or replaces the entry for entry.destination_name
    void put(ManifestEntry entry);

    bool contains(const std::string& destination_name) const;
    const ManifestEntry* find(const std::string& destination_name) const;

    const Entries& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

    // Name of the build file inside the context (e.g. "Dockerfile")
    const std::string& build_file() const { return build_file_; }
    void set_build_file(const std::string& name) { build_file_ = name; }

private:
    Entries entries_;
    std::string build_file_ = "Dockerfile";
};

// Convenience constructors
ManifestEntry copy_entry(const std::string& destination, const std::string& source,
                         bool executable = false);
ManifestEntry render_entry(const std::string& destination, const std::string& source,
                           nlohmann::json context, bool executable = false);
ManifestEntry create_entry(const std::string& destination, EmptyKind kind,
                           bool executable = false);

// ============================================================================
// Manifest File (ctxstage.manifest.v1)
// ============================================================================

constexpr const char* MANIFEST_SCHEMA = "ctxstage.manifest.v1";

struct ManifestParseResult {
    bool ok = false;
    std::string error;
    Manifest manifest;
    std::vector<std::string> warnings;
};

// Parse a manifest document. Relative source paths resolve against base_dir.
// Files listed under "context_files" are read and merged into every render
// context; a missing or blank context file fails the parse.
ManifestParseResult parse_manifest_json(const std::string& json_str,
                                        const std::string& base_dir,
                                        const std::string& source_path = "");

// Read and parse a manifest file; base_dir is the file's directory.
ManifestParseResult load_manifest_file(const std::string& path);

// ============================================================================
// Command-Line Overrides
// ============================================================================

struct OverrideResult {
    bool ok = false;
    std::string error;
};

// Apply a "DEST=PATH" override as a Copy entry. PATH must be a non-empty
// regular file.
OverrideResult apply_file_override(Manifest& manifest, const std::string& spec,
                                   bool executable);

// Split "KEY=VALUE" (first '='); key must be non-empty
bool parse_key_value(const std::string& spec, KeyValue& out);

} // namespace ctxstage
