#include "ctxstage/tool_config.hpp"
#include "ctxstage/platform.hpp"

#include <algorithm>
#include <cctype>

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

// Reads an optional string field; false only when present with the wrong type
bool read_string(const nlohmann::json& j, const std::string& key, std::string& out,
                 std::string& error) {
    if (!j.contains(key)) return true;
    if (!j[key].is_string() || trim(j[key].get<std::string>()).empty()) {
        error = key + " must be a non-empty string";
        return false;
    }
    out = trim(j[key].get<std::string>());
    return true;
}

const char* const KNOWN_KEYS[] = {
    "$schema", "engine", "log_dir", "temp_dir", "context_prefix", "buildkit", "progress",
};

} // namespace

ToolConfigParseResult parse_tool_config(const std::string& json_str,
                                        const std::string& source_path) {
    ToolConfigParseResult result;
    result.config.source_path = source_path;

    nlohmann::json j;
    try {
        j = nlohmann::json::parse(json_str);
    } catch (const nlohmann::json::parse_error& e) {
        result.error = source_path + ": invalid JSON: " + e.what();
        return result;
    }

    if (!j.is_object()) {
        result.error = source_path + ": JSON must be an object";
        return result;
    }

    if (!j.contains("$schema") || !j["$schema"].is_string()) {
        result.error = source_path + ": $schema missing";
        return result;
    }
    if (trim(j["$schema"].get<std::string>()) != CONFIG_SCHEMA) {
        result.error = source_path + ": $schema mismatch: expected " + CONFIG_SCHEMA;
        return result;
    }

    for (auto& [key, _] : j.items()) {
        if (std::find(std::begin(KNOWN_KEYS), std::end(KNOWN_KEYS), key) == std::end(KNOWN_KEYS)) {
            result.warnings.push_back(source_path + ": unknown field '" + key + "'");
        }
    }

    std::string error;
    if (!read_string(j, "engine", result.config.engine, error) ||
        !read_string(j, "log_dir", result.config.log_dir, error) ||
        !read_string(j, "temp_dir", result.config.temp_dir, error) ||
        !read_string(j, "context_prefix", result.config.context_prefix, error) ||
        !read_string(j, "progress", result.config.progress, error)) {
        result.error = source_path + ": " + error;
        return result;
    }

    if (result.config.context_prefix.find('/') != std::string::npos) {
        result.error = source_path + ": context_prefix must not contain '/'";
        return result;
    }

    if (j.contains("buildkit")) {
        if (!j["buildkit"].is_boolean()) {
            result.error = source_path + ": buildkit must be a boolean";
            return result;
        }
        result.config.buildkit = j["buildkit"].get<bool>();
    }

    result.ok = true;
    return result;
}

ToolConfigParseResult resolve_tool_config(const ConfigOverrides& overrides) {
    ToolConfigParseResult result;

    // 1. Locate the config file
    std::string config_path;
    bool explicit_path = false;
    if (overrides.config_path && !overrides.config_path->empty()) {
        config_path = expand_user_path(*overrides.config_path);
        explicit_path = true;
    } else if (auto env_path = get_env("CTXSTAGE_CONFIG"); env_path && !env_path->empty()) {
        config_path = expand_user_path(*env_path);
        explicit_path = true;
    } else if (auto home = get_env("HOME"); home && !home->empty()) {
        config_path = join_path(*home, ".config/ctxstage/config.json");
    }

    if (!config_path.empty() && is_regular_file(config_path)) {
        auto content = read_file(config_path);
        if (!content) {
            result.error = "failed to read config file: " + config_path;
            return result;
        }
        result = parse_tool_config(*content, config_path);
        if (!result.ok) {
            return result;
        }
    } else if (explicit_path) {
        result.error = "config file '" + config_path + "' not found";
        return result;
    }

    // 2. Environment
    if (auto v = get_env("CTXSTAGE_ENGINE"); v && !v->empty()) result.config.engine = *v;
    if (auto v = get_env("CTXSTAGE_LOG_DIR"); v && !v->empty()) result.config.log_dir = *v;
    if (auto v = get_env("CTXSTAGE_TMPDIR"); v && !v->empty()) result.config.temp_dir = *v;

    // 3. Command line
    if (overrides.engine && !overrides.engine->empty()) result.config.engine = *overrides.engine;
    if (overrides.log_dir && !overrides.log_dir->empty()) result.config.log_dir = *overrides.log_dir;
    if (overrides.temp_dir && !overrides.temp_dir->empty()) result.config.temp_dir = *overrides.temp_dir;

    // 4. Defaults
    if (result.config.log_dir.empty()) result.config.log_dir = temp_directory();
    if (result.config.temp_dir.empty()) result.config.temp_dir = temp_directory();

    result.config.log_dir = expand_user_path(result.config.log_dir);
    result.config.temp_dir = expand_user_path(result.config.temp_dir);

    result.ok = true;
    return result;
}

} // namespace ctxstage
