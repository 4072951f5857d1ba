#pragma once

#include <skills_mcp/config/app_config.hpp>
#include <skills_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

namespace skills_mcp {

// Parse a YAML config file into an AppConfig.
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path);

// Command-line view of the configuration. Only the fields the user actually
// passed are engaged, so they can be laid over a YAML base.
struct CliOptions {
    std::optional<std::string> config_path;
    std::optional<std::string> server_name;
    std::optional<std::vector<std::string>> enabled_tools;
    std::optional<LogLevel> log_level;
    std::optional<std::string> log_file;
    bool json_logs = false;
    std::optional<bool> color;
    std::optional<uint32_t> log_seed;
    std::optional<int> max_log_entries;
};

// Parse CLI arguments. --help and --version are handled by the parser
// itself (print and exit).
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv);

// Apply CLI options over a base config; CLI values win when present.
AppConfig MergeConfigs(const AppConfig& yaml_base, const CliOptions& cli);

// Validate that values are sane and every enabled tool is a built-in one.
Result<void, Error> ValidateConfig(const AppConfig& config);

// Split "a, b,c" into {"a","b","c"}; empty items are dropped.
std::vector<std::string> SplitToolList(std::string_view list);

} // namespace skills_mcp
