#pragma once

#include "ctxstage/manifest.hpp"

#include <memory>
#include <string>
#include <vector>

namespace ctxstage {

// ============================================================================
// Build Context Directory
// ============================================================================

// Exclusively owned temporary directory. Created with mkdtemp under
// parent_dir, removed recursively when the owner goes out of scope.
class BuildContext {
public:
    static std::unique_ptr<BuildContext> create(const std::string& parent_dir,
                                                const std::string& prefix,
                                                std::string* error = nullptr);

    ~BuildContext();

    BuildContext(const BuildContext&) = delete;
    BuildContext& operator=(const BuildContext&) = delete;

    const std::string& path() const { return path_; }

private:
    explicit BuildContext(std::string path) : path_(std::move(path)) {}

    std::string path_;
};

// ============================================================================
// Context Staging
// ============================================================================

struct StageResult {
    bool ok = false;
    std::string error;
    std::vector<std::string> staged;   // destination names, in staging order
};

// Produce root/<destination> for every manifest entry, in manifest order.
// root must be empty or absent. Stops at the first invalid entry; nothing is
// left behind for the failing destination and later entries are not touched.
StageResult stage_context(const Manifest& manifest, const std::string& root);

// ============================================================================
// Tree Digest
// ============================================================================

struct DigestResult {
    bool ok = false;
    std::string error;
    std::string hex_digest;     // lowercase SHA-256
    size_t entry_count = 0;
};

// SHA-256 over every entry below root, in sorted path order: relative path,
// entry kind, permission bits, and file contents. Timestamps and ownership
// are ignored, so equal digests mean byte-identical trees.
DigestResult compute_tree_digest(const std::string& root);

} // namespace ctxstage
