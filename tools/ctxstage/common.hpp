/**
 * ctxstage CLI - Common utilities and types
 */

#pragma once

#include <ctxstage/manifest.hpp>
#include <ctxstage/tool_config.hpp>
#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>
#include <spdlog/sinks/stdout_color_sinks.h>

#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace ctxstage::cli {

/**
 * Global options available to all commands.
 */
struct GlobalOptions {
    std::string config;            // --config
    bool json = false;             // --json
    bool verbose = false;          // -v, --verbose
    bool quiet = false;            // -q, --quiet
};

/**
 * Route diagnostics to stderr so stdout carries only build output and
 * command results.
 */
inline void configure_logging(const GlobalOptions& opts) {
    if (!spdlog::get("ctxstage")) {
        spdlog::set_default_logger(spdlog::stderr_color_mt("ctxstage"));
        spdlog::set_pattern("%^[%l]%$ %v");
    }

    if (opts.verbose) {
        spdlog::set_level(spdlog::level::debug);
    } else if (opts.quiet) {
        spdlog::set_level(spdlog::level::warn);
    } else {
        spdlog::set_level(spdlog::level::info);
    }
}

/**
 * Warning collector for accumulating warnings during command execution.
 * In JSON mode, warnings are collected and output at the end.
 * In text mode, warnings are logged immediately.
 */
struct WarningCollector {
    std::vector<std::string> warnings;
    bool json_mode = false;

    void add(const std::string& msg) {
        if (json_mode) {
            warnings.push_back(msg);
        } else {
            spdlog::warn("{}", msg);
        }
    }

    void clear() { warnings.clear(); }
    bool empty() const { return warnings.empty(); }

    nlohmann::json to_json() const {
        return nlohmann::json(warnings);
    }
};

inline WarningCollector& get_warning_collector() {
    static WarningCollector collector;
    return collector;
}

inline void init_warning_collector(bool json_mode) {
    auto& collector = get_warning_collector();
    collector.clear();
    collector.json_mode = json_mode;
}

/**
 * Output utilities.
 */
inline void print_error(const std::string& msg, bool json_mode) {
    if (json_mode) {
        nlohmann::json j;
        j["ok"] = false;
        j["error"] = msg;
        auto& collector = get_warning_collector();
        if (!collector.empty()) {
            j["warnings"] = collector.to_json();
        }
        std::cout << j.dump(2) << std::endl;
    } else {
        std::cerr << "Error: " << msg << std::endl;
    }
}

inline void print_warning(const std::string& msg) {
    get_warning_collector().add(msg);
}

inline void print_success(const std::string& msg, bool json_mode) {
    if (!json_mode) {
        std::cout << msg << std::endl;
    }
}

inline void output_json(const nlohmann::json& j) {
    auto& collector = get_warning_collector();
    if (!collector.empty() && !j.contains("warnings")) {
        nlohmann::json output = j;
        output["warnings"] = collector.to_json();
        std::cout << output.dump(2) << std::endl;
    } else {
        std::cout << j.dump(2) << std::endl;
    }
}

inline std::optional<std::string> optional_flag(const std::string& value) {
    return value.empty() ? std::nullopt : std::make_optional(value);
}

/**
 * Resolve the tool configuration, reporting config-file warnings.
 * Priority per field: flag > environment > config file > default.
 */
inline bool load_config(const GlobalOptions& opts, ConfigOverrides overrides,
                        ToolConfig& out) {
    overrides.config_path = optional_flag(opts.config);

    auto result = resolve_tool_config(overrides);
    for (const auto& w : result.warnings) {
        print_warning(w);
    }
    if (!result.ok) {
        print_error(result.error, opts.json);
        return false;
    }

    if (!result.config.source_path.empty()) {
        spdlog::debug("Using config file '{}'", result.config.source_path);
    }
    out = result.config;
    return true;
}

/**
 * Load a manifest file and apply --file / --exec-file overrides on top.
 */
inline bool load_manifest(const GlobalOptions& opts, const std::string& manifest_path,
                          const std::vector<std::string>& files,
                          const std::vector<std::string>& exec_files, Manifest& out) {
    Manifest manifest;

    if (!manifest_path.empty()) {
        auto parsed = load_manifest_file(manifest_path);
        for (const auto& w : parsed.warnings) {
            print_warning(w);
        }
        if (!parsed.ok) {
            print_error(parsed.error, opts.json);
            return false;
        }
        manifest = std::move(parsed.manifest);
    }

    for (const auto& spec : files) {
        auto r = apply_file_override(manifest, spec, false);
        if (!r.ok) {
            print_error(r.error, opts.json);
            return false;
        }
    }
    for (const auto& spec : exec_files) {
        auto r = apply_file_override(manifest, spec, true);
        if (!r.ok) {
            print_error(r.error, opts.json);
            return false;
        }
    }

    out = std::move(manifest);
    return true;
}

/**
 * Parse repeated KEY=VALUE options.
 */
inline bool parse_key_values(const GlobalOptions& opts, const std::string& flag,
                             const std::vector<std::string>& specs,
                             std::vector<KeyValue>& out) {
    for (const auto& spec : specs) {
        KeyValue kv;
        if (!parse_key_value(spec, kv)) {
            print_error("Invalid " + flag + " '" + spec + "': expected KEY=VALUE", opts.json);
            return false;
        }
        out.push_back(kv);
    }
    return true;
}

} // namespace ctxstage::cli
