#pragma once

#include <optional>
#include <string>
#include <vector>

namespace ctxstage {

// ============================================================================
// Tool Configuration (ctxstage.config.v1)
// ============================================================================

constexpr const char* CONFIG_SCHEMA = "ctxstage.config.v1";

struct ToolConfig {
    std::string engine = "docker";
    std::string log_dir;            // empty: system temp directory
    std::string temp_dir;           // empty: system temp directory
    std::string context_prefix = "context_";
    bool buildkit = true;           // DOCKER_BUILDKIT=1 in the engine environment
    std::string progress = "plain";
    std::string source_path;        // config file it came from, if any
};

struct ToolConfigParseResult {
    bool ok = false;
    std::string error;
    ToolConfig config;
    std::vector<std::string> warnings;
};

// Parse a config document on top of the built-in defaults
ToolConfigParseResult parse_tool_config(const std::string& json_str,
                                        const std::string& source_path);

// Values given on the command line; unset fields fall through
struct ConfigOverrides {
    std::optional<std::string> config_path;   // --config
    std::optional<std::string> engine;        // --engine
    std::optional<std::string> log_dir;       // --log-dir
    std::optional<std::string> temp_dir;      // --tmp-dir
};

/**
 * Resolve the effective configuration.
 * Per field: command line > environment (CTXSTAGE_ENGINE, CTXSTAGE_LOG_DIR,
 * CTXSTAGE_TMPDIR) > config file > default.
 * Config file: --config, else CTXSTAGE_CONFIG, else
 * $HOME/.config/ctxstage/config.json when it exists. An explicitly named
 * file that is missing is an error; the default location is optional.
 */
ToolConfigParseResult resolve_tool_config(const ConfigOverrides& overrides);

} // namespace ctxstage
