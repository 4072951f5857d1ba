#pragma once

#include <skills_mcp/core/log.hpp>
#include <skills_mcp/core/version.hpp>

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace skills_mcp {

// Identity reported by initialize.
struct ServerConfig {
    std::string name = "skills-mcp";
    std::string version = kVersion;
    std::string protocol_version = "2024-11-05";
};

// Names of the built-in tools, in default registration order.
inline const std::vector<std::string>& BuiltinToolNames() {
    static const std::vector<std::string> names = {
        "echo", "add", "calculate", "generate_logs",
    };
    return names;
}

struct AppConfig {
    ServerConfig server;
    std::vector<std::string> enabled_tools; // empty = every built-in tool
    LogLevel log_level = LogLevel::Warn;
    std::optional<std::string> log_file;
    bool json_logs = false;
    std::optional<bool> color;              // unset = auto-detect
    std::optional<uint32_t> log_seed;
    int max_log_entries = 1000;
};

} // namespace skills_mcp
