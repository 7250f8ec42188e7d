#include "ctxstage/stager.hpp"
#include "ctxstage/path_utils.hpp"
#include "ctxstage/platform.hpp"
#include "ctxstage/renderer.hpp"

#include <algorithm>
#include <cerrno>
#include <cstring>
#include <filesystem>
#include <system_error>
#include <vector>

#include <spdlog/spdlog.h>
#include <stdlib.h>

namespace fs = std::filesystem;

namespace ctxstage {

// ============================================================================
// Build Context Directory
// ============================================================================

std::unique_ptr<BuildContext> BuildContext::create(const std::string& parent_dir,
                                                   const std::string& prefix,
                                                   std::string* error) {
    if (!create_directories(parent_dir)) {
        if (error) *error = "failed to create directory: " + parent_dir;
        return nullptr;
    }

    std::string pattern = join_path(parent_dir, prefix + "XXXXXX");
    std::vector<char> buf(pattern.begin(), pattern.end());
    buf.push_back('\0');

    if (mkdtemp(buf.data()) == nullptr) {
        if (error) *error = "mkdtemp failed: " + std::string(strerror(errno));
        return nullptr;
    }

    return std::unique_ptr<BuildContext>(new BuildContext(buf.data()));
}

BuildContext::~BuildContext() {
    if (!remove_directory(path_)) {
        spdlog::error("Could not remove context directory '{}'", path_);
    } else {
        spdlog::debug("Removed context directory '{}'", path_);
    }
}

// ============================================================================
// Context Staging
// ============================================================================

namespace {

// Create every missing directory between root and path (exclusive) with the
// executable mode, so implicit parents do not depend on the umask.
bool ensure_parents(const std::string& root, const std::string& path, std::string& error) {
    fs::path rel = fs::path(path).lexically_relative(root).parent_path();
    fs::path current(root);

    for (const auto& part : rel) {
        current /= part;
        std::error_code ec;
        if (fs::is_directory(current, ec)) continue;
        if (fs::exists(current, ec)) {
            error = "'" + current.string() + "' exists and is not a directory";
            return false;
        }
        if (!fs::create_directory(current, ec) || ec) {
            error = "failed to create directory '" + current.string() + "': " + ec.message();
            return false;
        }
        if (!set_mode(current.string(), EXECUTABLE_MODE)) {
            error = "failed to set mode on '" + current.string() + "'";
            return false;
        }
    }
    return true;
}

bool copy_regular_file(const std::string& src, const std::string& dst, unsigned mode,
                       std::string& error) {
    if (!copy_file(src, dst)) {
        error = "failed to copy '" + src + "' to '" + dst + "'";
        return false;
    }
    if (!set_mode(dst, mode)) {
        error = "failed to set mode on '" + dst + "'";
        return false;
    }
    return true;
}

bool copy_tree(const std::string& src, const std::string& dst, unsigned file_mode,
               std::string& error) {
    std::error_code ec;
    if (!fs::create_directory(dst, ec) || ec) {
        error = "failed to create directory '" + dst + "'";
        return false;
    }
    if (!set_mode(dst, EXECUTABLE_MODE)) {
        error = "failed to set mode on '" + dst + "'";
        return false;
    }

    std::vector<fs::path> children;
    for (const auto& entry : fs::directory_iterator(src, ec)) {
        children.push_back(entry.path());
    }
    if (ec) {
        error = "failed to list '" + src + "': " + ec.message();
        return false;
    }
    std::sort(children.begin(), children.end());

    for (const auto& child : children) {
        std::string target = join_path(dst, child.filename().string());
        if (fs::is_directory(child, ec)) {
            if (!copy_tree(child.string(), target, file_mode, error)) return false;
        } else if (fs::is_regular_file(child, ec)) {
            if (!copy_regular_file(child.string(), target, file_mode, error)) return false;
        } else {
            error = "Required resource '" + child.string() + "' is not a file or directory.";
            return false;
        }
    }
    return true;
}

// Performs one entry. dest has been resolved under root and its parents exist.
bool provision(const ManifestEntry& entry, const std::string& dest, std::string& error) {
    unsigned mode = mode_for(entry.executable);

    if (const auto* copy = std::get_if<CopyAction>(&entry.action)) {
        spdlog::info("Creating {} '{}'.", is_directory(copy->source_path) ? "directory" : "file",
                     dest);
        if (is_directory(copy->source_path)) {
            return copy_tree(copy->source_path, dest, mode, error);
        }
        return copy_regular_file(copy->source_path, dest, mode, error);
    }

    if (const auto* render = std::get_if<RenderAction>(&entry.action)) {
        auto rendered = render_template_file(render->source_path, render->context);
        if (!rendered.ok) {
            error = "failed to render '" + entry.destination_name + "': " + rendered.error;
            return false;
        }
        spdlog::info("Creating file '{}'.", dest);
        auto written = atomic_write_file(dest, rendered.text, mode);
        if (!written.ok) {
            error = "failed to write '" + dest + "': " + written.error;
            return false;
        }
        return true;
    }

    const auto& create = std::get<CreateEmptyAction>(entry.action);
    if (create.kind == EmptyKind::Directory) {
        spdlog::info("Creating directory '{}'.", dest);
        std::error_code ec;
        if (!fs::create_directory(dest, ec) || ec) {
            error = "failed to create directory '" + dest + "'";
            return false;
        }
        // Directories are always traversable
        if (!set_mode(dest, EXECUTABLE_MODE)) {
            error = "failed to set mode on '" + dest + "'";
            return false;
        }
        return true;
    }

    spdlog::info("Creating file '{}'.", dest);
    auto written = atomic_write_file(dest, std::string(), mode);
    if (!written.ok) {
        error = "failed to create '" + dest + "': " + written.error;
        return false;
    }
    return true;
}

// Checks that can fail before anything is written for the entry
bool validate_entry(const ManifestEntry& entry, std::string& error) {
    if (const auto* copy = std::get_if<CopyAction>(&entry.action)) {
        if (!path_exists(copy->source_path)) {
            error = "Required resource '" + copy->source_path + "' does not exist.";
            return false;
        }
        if (!is_regular_file(copy->source_path) && !is_directory(copy->source_path)) {
            error = "Required resource '" + copy->source_path + "' is not a file or directory.";
            return false;
        }
        return true;
    }

    if (const auto* render = std::get_if<RenderAction>(&entry.action)) {
        if (!path_exists(render->source_path)) {
            error = "Required resource '" + render->source_path + "' does not exist.";
            return false;
        }
        if (!is_regular_file(render->source_path)) {
            error = "Required resource '" + render->source_path + "' is not a file.";
            return false;
        }
        if (render->context.is_null()) {
            error = "Context for template rendering can't be null for element '" +
                    entry.destination_name + "'.";
            return false;
        }
        if (!render->context.is_object()) {
            error = "Context for template rendering must be an object for element '" +
                    entry.destination_name + "'.";
            return false;
        }
    }
    return true;
}

} // namespace

StageResult stage_context(const Manifest& manifest, const std::string& context_root) {
    StageResult result;

    std::string root = context_root;
    while (root.size() > 1 && root.back() == '/') {
        root.pop_back();
    }

    if (path_exists(root)) {
        if (!is_directory(root)) {
            result.error = "context root '" + root + "' is not a directory";
            return result;
        }
        if (!list_directory(root).empty()) {
            result.error = "context root '" + root + "' is not empty";
            return result;
        }
    } else if (!create_directories(root)) {
        result.error = "failed to create context root '" + root + "'";
        return result;
    }

    for (const auto& [name, entry] : manifest.entries()) {
        auto resolved = resolve_under_root(root, name);
        if (!resolved.ok) {
            result.error = "destination '" + name + "' " + path_error_to_string(resolved.error);
            return result;
        }

        if (!validate_entry(entry, result.error)) {
            return result;
        }

        if (path_exists(resolved.path)) {
            result.error = "destination '" + name + "' already exists in the context";
            return result;
        }

        if (!ensure_parents(root, resolved.path, result.error)) {
            return result;
        }

        if (!provision(entry, resolved.path, result.error)) {
            std::error_code ec;
            fs::remove_all(resolved.path, ec);
            return result;
        }

        spdlog::debug("Staged '{}' ({}, mode {:o})", name, action_name(entry.action),
                      mode_for(entry.executable));
        result.staged.push_back(name);
    }

    result.ok = true;
    return result;
}

} // namespace ctxstage
