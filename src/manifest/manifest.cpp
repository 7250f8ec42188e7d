#include "ctxstage/manifest.hpp"
#include "ctxstage/platform.hpp"

#include <algorithm>
#include <cctype>
#include <optional>

#include <nlohmann/json.hpp>

namespace ctxstage {

namespace {

std::string trim(const std::string& s) {
    size_t start = 0;
    while (start < s.size() && std::isspace(static_cast<unsigned char>(s[start]))) ++start;
    size_t end = s.size();
    while (end > start && std::isspace(static_cast<unsigned char>(s[end - 1]))) --end;
    return s.substr(start, end - start);
}

std::optional<std::string> get_string(const nlohmann::json& j, const std::string& key) {
    if (j.contains(key) && j[key].is_string()) {
        return j[key].get<std::string>();
    }
    return std::nullopt;
}

// Relative paths resolve against the manifest's directory
std::string resolve_source(const std::string& base_dir, const std::string& path) {
    if (!path.empty() && (path[0] == '/' || path[0] == '~')) {
        return expand_user_path(path);
    }
    return expand_user_path(join_path(base_dir, path));
}

const char* const ENTRY_KEYS[] = {"copy", "render", "create", "context", "executable"};

bool is_known_entry_key(const std::string& key) {
    return std::find(std::begin(ENTRY_KEYS), std::end(ENTRY_KEYS), key) != std::end(ENTRY_KEYS);
}

} // namespace

// ============================================================================
// Manifest
// ============================================================================

bool Manifest::add(ManifestEntry entry, std::string* error) {
    if (entries_.count(entry.destination_name) != 0) {
        if (error) *error = "duplicate destination '" + entry.destination_name + "'";
        return false;
    }
    std::string key = entry.destination_name;
    entries_.emplace(std::move(key), std::move(entry));
    return true;
}

void Manifest::put(ManifestEntry entry) {
    std::string key = entry.destination_name;
    entries_[key] = std::move(entry);
}

bool Manifest::contains(const std::string& destination_name) const {
    return entries_.count(destination_name) != 0;
}

const ManifestEntry* Manifest::find(const std::string& destination_name) const {
    auto it = entries_.find(destination_name);
    return it == entries_.end() ? nullptr : &it->second;
}

ManifestEntry copy_entry(const std::string& destination, const std::string& source,
                         bool executable) {
    return ManifestEntry{destination, CopyAction{source}, executable};
}

ManifestEntry render_entry(const std::string& destination, const std::string& source,
                           nlohmann::json context, bool executable) {
    return ManifestEntry{destination, RenderAction{source, std::move(context)}, executable};
}

ManifestEntry create_entry(const std::string& destination, EmptyKind kind, bool executable) {
    return ManifestEntry{destination, CreateEmptyAction{kind}, executable};
}

// ============================================================================
// Manifest File
// ============================================================================

ManifestParseResult parse_manifest_json(const std::string& json_str,
                                        const std::string& base_dir,
                                        const std::string& source_path) {
    ManifestParseResult result;
    std::string where = source_path.empty() ? std::string("manifest") : source_path;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = where + ": invalid JSON: " + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = where + ": JSON must be an object";
        return result;
    }

    // $schema (REQUIRED)
    auto schema = get_string(j, "$schema");
    if (!schema) {
        result.error = where + ": $schema missing";
        return result;
    }
    if (trim(*schema) != MANIFEST_SCHEMA) {
        result.error = where + ": $schema mismatch: expected " + MANIFEST_SCHEMA;
        return result;
    }

    if (j.contains("build_file")) {
        auto build_file = get_string(j, "build_file");
        if (!build_file || trim(*build_file).empty()) {
            result.error = where + ": build_file must be a non-empty string";
            return result;
        }
        result.manifest.set_build_file(trim(*build_file));
    }

    // Shared render context read from files
    nlohmann::json shared_context = nlohmann::json::object();
    if (j.contains("context_files")) {
        if (!j["context_files"].is_object()) {
            result.error = where + ": context_files must be an object";
            return result;
        }
        for (auto& [key, val] : j["context_files"].items()) {
            if (!val.is_string()) {
                result.error = where + ": context_files." + key + " must be a path string";
                return result;
            }
            std::string path = resolve_source(base_dir, val.get<std::string>());
            if (!is_regular_file(path)) {
                result.error = "File '" + path + "' not found (context_files." + key + ")";
                return result;
            }
            auto content = read_file(path);
            if (!content) {
                result.error = "File '" + path + "' could not be read (context_files." + key + ")";
                return result;
            }
            if (trim(*content).empty()) {
                result.error = "File '" + path + "' is empty (context_files." + key + ")";
                return result;
            }
            shared_context[key] = *content;
        }
    }

    if (!j.contains("entries") || !j["entries"].is_object()) {
        result.error = where + ": entries missing or not an object";
        return result;
    }

    for (auto& [dest, spec] : j["entries"].items()) {
        std::string ctx = where + ": entries." + dest;

        if (!spec.is_object()) {
            result.error = ctx + " must be an object";
            return result;
        }

        for (auto& [key, _] : spec.items()) {
            if (!is_known_entry_key(key)) {
                result.warnings.push_back(ctx + ": unknown field '" + key + "'");
            }
        }

        int action_count = static_cast<int>(spec.contains("copy")) +
                           static_cast<int>(spec.contains("render")) +
                           static_cast<int>(spec.contains("create"));
        if (action_count != 1) {
            result.error = ctx + " must declare exactly one of copy, render, create";
            return result;
        }

        ManifestEntry entry;
        entry.destination_name = dest;

        if (spec.contains("executable")) {
            if (!spec["executable"].is_boolean()) {
                result.error = ctx + ".executable must be a boolean";
                return result;
            }
            entry.executable = spec["executable"].get<bool>();
        }

        if (spec.contains("copy")) {
            auto src = get_string(spec, "copy");
            if (!src || src->empty()) {
                result.error = ctx + ".copy must be a non-empty path string";
                return result;
            }
            entry.action = CopyAction{resolve_source(base_dir, *src)};
        } else if (spec.contains("render")) {
            auto src = get_string(spec, "render");
            if (!src || src->empty()) {
                result.error = ctx + ".render must be a non-empty path string";
                return result;
            }
            if (!spec.contains("context") || spec["context"].is_null()) {
                result.error = "Context for template rendering can't be null for element '" +
                               dest + "'";
                return result;
            }
            if (!spec["context"].is_object()) {
                result.error = "Context for template rendering must be an object for element '" +
                               dest + "'";
                return result;
            }
            nlohmann::json context = shared_context;
            for (auto& [key, val] : spec["context"].items()) {
                context[key] = val;
            }
            entry.action = RenderAction{resolve_source(base_dir, *src), std::move(context)};
        } else {
            auto kind = get_string(spec, "create");
            if (kind && *kind == "file") {
                entry.action = CreateEmptyAction{EmptyKind::File};
            } else if (kind && *kind == "directory") {
                entry.action = CreateEmptyAction{EmptyKind::Directory};
            } else {
                result.error = ctx + ".create must be \"file\" or \"directory\"";
                return result;
            }
        }

        if (!result.manifest.add(std::move(entry), &result.error)) {
            return result;
        }
    }

    result.ok = true;
    return result;
}

ManifestParseResult load_manifest_file(const std::string& path) {
    std::string absolute = expand_user_path(path);

    if (!is_regular_file(absolute)) {
        ManifestParseResult result;
        result.error = "Manifest file '" + absolute + "' does not exist or is not a file";
        return result;
    }

    auto content = read_file(absolute);
    if (!content) {
        ManifestParseResult result;
        result.error = "failed to read manifest file: " + absolute;
        return result;
    }

    return parse_manifest_json(*content, get_parent_directory(absolute), absolute);
}

// ============================================================================
// Command-Line Overrides
// ============================================================================

bool parse_key_value(const std::string& spec, KeyValue& out) {
    auto eq = spec.find('=');
    if (eq == std::string::npos || eq == 0) {
        return false;
    }
    out.key = spec.substr(0, eq);
    out.value = spec.substr(eq + 1);
    return true;
}

OverrideResult apply_file_override(Manifest& manifest, const std::string& spec,
                                   bool executable) {
    OverrideResult result;

    KeyValue kv;
    if (!parse_key_value(spec, kv) || trim(kv.value).empty()) {
        result.error = "expected DEST=PATH, got '" + spec + "'";
        return result;
    }

    std::string path = expand_user_path(trim(kv.value));
    auto size = file_size(path);
    if (!is_regular_file(path) || !size || *size == 0) {
        result.error = "Custom file '" + path + "' not found or empty";
        return result;
    }

    manifest.put(copy_entry(trim(kv.key), path, executable));
    result.ok = true;
    return result;
}

} // namespace ctxstage
