#include <skills_mcp/config/config_loader.hpp>

#include <skills_mcp/core/version.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cctype>
#include <set>

namespace skills_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", message, ErrorCategory::Config};
}

std::string TrimCopy(std::string_view s) {
    auto begin = std::find_if_not(s.begin(), s.end(),
                                  [](unsigned char c) { return std::isspace(c); });
    auto end = std::find_if_not(s.rbegin(), s.rend(),
                                [](unsigned char c) { return std::isspace(c); }).base();
    return begin < end ? std::string(begin, end) : std::string();
}

Result<void, Error> ParseYamlServer(const YAML::Node& node, ServerConfig& server) {
    if (!node.IsMap()) {
        return Result<void, Error>::Err(
            MakeConfigError("'server' must be a mapping"));
    }
    if (node["name"]) {
        server.name = node["name"].as<std::string>();
    }
    if (node["version"]) {
        server.version = node["version"].as<std::string>();
    }
    if (node["protocol_version"]) {
        server.protocol_version = node["protocol_version"].as<std::string>();
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> ParseYamlLogging(const YAML::Node& node, AppConfig& config) {
    if (!node.IsMap()) {
        return Result<void, Error>::Err(
            MakeConfigError("'logging' must be a mapping"));
    }
    if (node["level"]) {
        auto level = ParseLogLevel(node["level"].as<std::string>());
        if (level.IsErr()) {
            return Result<void, Error>::Err(MakeConfigError(level.Error()));
        }
        config.log_level = level.Value();
    }
    if (node["file"]) {
        config.log_file = node["file"].as<std::string>();
    }
    if (node["json"]) {
        config.json_logs = node["json"].as<bool>();
    }
    if (node["color"]) {
        config.color = node["color"].as<bool>();
    }
    return Result<void, Error>::Ok();
}

} // anonymous namespace

std::vector<std::string> SplitToolList(std::string_view list) {
    std::vector<std::string> out;
    std::size_t start = 0;
    while (start <= list.size()) {
        auto comma = list.find(',', start);
        if (comma == std::string_view::npos) comma = list.size();
        auto item = TrimCopy(list.substr(start, comma - start));
        if (!item.empty()) out.push_back(std::move(item));
        start = comma + 1;
    }
    return out;
}

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<AppConfig, Error> LoadFromYaml(std::string_view file_path) {
    AppConfig config;
    try {
        auto root = YAML::LoadFile(std::string(file_path));
        if (!root || root.IsNull()) {
            return Result<AppConfig, Error>::Ok(std::move(config));
        }
        if (!root.IsMap()) {
            return Result<AppConfig, Error>::Err(
                MakeConfigError("Top level of config file must be a mapping"));
        }

        if (root["server"]) {
            auto r = ParseYamlServer(root["server"], config.server);
            if (r.IsErr()) return Result<AppConfig, Error>::Err(r.Error());
        }

        if (root["tools"]) {
            const auto& tools = root["tools"];
            if (!tools.IsSequence()) {
                return Result<AppConfig, Error>::Err(
                    MakeConfigError("'tools' must be a list of tool names"));
            }
            for (const auto& tool : tools) {
                config.enabled_tools.push_back(tool.as<std::string>());
            }
        }

        if (root["logging"]) {
            auto r = ParseYamlLogging(root["logging"], config);
            if (r.IsErr()) return Result<AppConfig, Error>::Err(r.Error());
        }

        if (root["log_generator"]) {
            const auto& gen = root["log_generator"];
            if (gen["seed"]) {
                config.log_seed = gen["seed"].as<uint32_t>();
            }
            if (gen["max_entries"]) {
                config.max_log_entries = gen["max_entries"].as<int>();
            }
        }
    } catch (const YAML::Exception& e) {
        return Result<AppConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }

    return Result<AppConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<CliOptions, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("skills-mcp", kVersion);
    program.add_description(
        "MCP tool server over stdin/stdout (one JSON-RPC message per line).");

    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--name")
        .help("Server name reported by initialize");
    program.add_argument("--tools")
        .help("Comma-separated tools to expose (default: all)");
    program.add_argument("--log-level")
        .help("debug, info, warn or error");
    program.add_argument("--verbose")
        .help("Shorthand for --log-level info")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--debug")
        .help("Shorthand for --log-level debug")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--log-file")
        .help("Append logs to this file instead of stderr");
    program.add_argument("--json-logs")
        .help("Write logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--color")
        .help("Force colored logs")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored logs")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--seed")
        .help("Seed for the generate_logs tool")
        .scan<'i', long long>();
    program.add_argument("--max-log-entries")
        .help("Upper bound on generate_logs count")
        .scan<'i', int>();

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<CliOptions, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    CliOptions cli;
    cli.config_path = program.present("--config");
    cli.server_name = program.present("--name");
    if (auto val = program.present("--tools")) {
        cli.enabled_tools = SplitToolList(*val);
    }

    if (auto val = program.present("--log-level")) {
        auto level = ParseLogLevel(*val);
        if (level.IsErr()) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("Invalid --log-level: " + level.Error()));
        }
        cli.log_level = level.Value();
    } else if (program.get<bool>("--debug")) {
        cli.log_level = LogLevel::Debug;
    } else if (program.get<bool>("--verbose")) {
        cli.log_level = LogLevel::Info;
    }

    cli.log_file = program.present("--log-file");
    cli.json_logs = program.get<bool>("--json-logs");
    if (program.get<bool>("--no-color")) {
        cli.color = false;
    } else if (program.get<bool>("--color")) {
        cli.color = true;
    }

    if (auto val = program.present<long long>("--seed")) {
        if (*val < 0 || *val > 0xFFFFFFFFLL) {
            return Result<CliOptions, Error>::Err(
                MakeConfigError("--seed must be between 0 and 4294967295"));
        }
        cli.log_seed = static_cast<uint32_t>(*val);
    }
    cli.max_log_entries = program.present<int>("--max-log-entries");

    return Result<CliOptions, Error>::Ok(std::move(cli));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
AppConfig MergeConfigs(const AppConfig& yaml_base, const CliOptions& cli) {
    AppConfig merged = yaml_base;

    if (cli.server_name) {
        merged.server.name = *cli.server_name;
    }
    if (cli.enabled_tools) {
        merged.enabled_tools = *cli.enabled_tools;
    }
    if (cli.log_level) {
        merged.log_level = *cli.log_level;
    }
    if (cli.log_file) {
        merged.log_file = cli.log_file;
    }
    if (cli.json_logs) {
        merged.json_logs = true;
    }
    if (cli.color) {
        merged.color = cli.color;
    }
    if (cli.log_seed) {
        merged.log_seed = cli.log_seed;
    }
    if (cli.max_log_entries) {
        merged.max_log_entries = *cli.max_log_entries;
    }

    return merged;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const AppConfig& config) {
    if (config.server.name.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Server name must not be empty"));
    }
    if (config.server.protocol_version.empty()) {
        return Result<void, Error>::Err(
            MakeConfigError("Protocol version must not be empty"));
    }
    if (config.max_log_entries < 1) {
        return Result<void, Error>::Err(
            MakeConfigError("max_entries must be at least 1, got " +
                            std::to_string(config.max_log_entries)));
    }

    const auto& builtin = BuiltinToolNames();
    std::set<std::string> seen;
    for (const auto& tool : config.enabled_tools) {
        if (std::find(builtin.begin(), builtin.end(), tool) == builtin.end()) {
            return Result<void, Error>::Err(
                MakeConfigError("Unknown tool in config: " + tool));
        }
        if (!seen.insert(tool).second) {
            return Result<void, Error>::Err(
                MakeConfigError("Tool listed twice in config: " + tool));
        }
    }

    return Result<void, Error>::Ok();
}

} // namespace skills_mcp
