#pragma once

#include <skills_mcp/config/app_config.hpp>
#include <skills_mcp/core/result.hpp>
#include <skills_mcp/mcp/tool_registry.hpp>
#include <skills_mcp/tools/calculator.hpp>

#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace skills_mcp {

// ---------------------------------------------------------------------------
// Tool arguments. Every field has a declared default that applies when the
// caller omits it or passes the wrong JSON type; no call is rejected for a
// missing argument.
// ---------------------------------------------------------------------------
struct EchoArgs {
    std::string text;
};

struct AddArgs {
    Number a = Number::Int(0);
    Number b = Number::Int(0);
};

struct CalculateArgs {
    std::string expression;
};

struct GenerateLogsArgs {
    int count = 5;
    std::string level = "all";
};

EchoArgs ParseEchoArgs(const nlohmann::json& arguments);
AddArgs ParseAddArgs(const nlohmann::json& arguments);
CalculateArgs ParseCalculateArgs(const nlohmann::json& arguments);
GenerateLogsArgs ParseGenerateLogsArgs(const nlohmann::json& arguments);

// Register the built-in tools selected by config.enabled_tools (all of them
// when the list is empty), in the listed order.
Result<void, Error> RegisterSkillTools(ToolRegistry& registry,
                                       const AppConfig& config);

} // namespace skills_mcp
