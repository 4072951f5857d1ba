#include <skills_mcp/config/config_loader.hpp>
#include <skills_mcp/core/log.hpp>
#include <skills_mcp/core/terminal.hpp>
#include <skills_mcp/core/version.hpp>
#include <skills_mcp/mcp/mcp_server.hpp>
#include <skills_mcp/mcp/mcp_tool_handlers.hpp>
#include <skills_mcp/mcp/tool_registry.hpp>

#include <iostream>
#include <memory>
#include <string>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitConfig  = 2;

void PrintError(const skills_mcp::Error& error) {
    std::cerr << "Error: " << error.ToString() << "\n";
}

skills_mcp::Result<skills_mcp::AppConfig, skills_mcp::Error> ResolveConfig(
    int argc, const char* const* argv) {
    using namespace skills_mcp;
    using R = Result<AppConfig, Error>;

    auto cli = LoadFromCli(argc, argv);
    if (cli.IsErr()) return R::Err(cli.Error());

    AppConfig base;
    if (cli.Value().config_path) {
        auto yaml = LoadFromYaml(*cli.Value().config_path);
        if (yaml.IsErr()) return R::Err(yaml.Error());
        base = std::move(yaml).Value();
    }

    auto config = MergeConfigs(base, cli.Value());
    auto valid = ValidateConfig(config);
    if (valid.IsErr()) return R::Err(valid.Error());
    return R::Ok(std::move(config));
}

// Logs never go to stdout: it carries the protocol.
skills_mcp::Result<void, skills_mcp::Error> InitLogging(
    const skills_mcp::AppConfig& config) {
    using namespace skills_mcp;

    std::unique_ptr<ILogSink> sink;
    if (config.log_file) {
        auto file = FileSink::Open(*config.log_file, config.json_logs);
        if (file.IsErr()) return Result<void, Error>::Err(file.Error());
        sink = std::move(file).Value();
    } else if (config.json_logs) {
        sink = std::make_unique<JsonSink>(std::cerr);
    } else {
        sink = std::make_unique<ColorConsoleSink>(ShouldUseColor(config.color));
    }
    InitGlobalLogger(std::move(sink), config.log_level);
    return Result<void, Error>::Ok();
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace skills_mcp;

    auto resolved = ResolveConfig(argc, argv);
    if (resolved.IsErr()) {
        PrintError(resolved.Error());
        return resolved.Error().ExitCode();
    }
    const auto config = std::move(resolved).Value();

    auto logging = InitLogging(config);
    if (logging.IsErr()) {
        PrintError(logging.Error());
        return kExitConfig;
    }

    ToolRegistry registry;
    auto registered = RegisterSkillTools(registry, config);
    if (registered.IsErr()) {
        LogError("main", registered.Error().ToString());
        return registered.Error().ExitCode();
    }

    LogInfo("main", config.server.name + " " + config.server.version +
                        " serving " + std::to_string(registry.Tools().size()) +
                        " tools on stdio");

    McpServer server(registry, config.server);
    server.Run();

    return kExitSuccess;
}
