#include <skills_mcp/mcp/mcp_tool_handlers.hpp>

#include <skills_mcp/core/log.hpp>
#include <skills_mcp/tools/calculator.hpp>
#include <skills_mcp/tools/log_generator.hpp>

#include <algorithm>
#include <cstdint>
#include <limits>
#include <memory>
#include <random>
#include <sstream>

namespace skills_mcp {

namespace {

// ---------------------------------------------------------------------------
// Argument helpers
// ---------------------------------------------------------------------------

std::string OptString(const nlohmann::json& args, const std::string& key,
                      const std::string& default_val = "") {
    if (args.is_object() && args.contains(key) && args[key].is_string()) {
        return args[key].get<std::string>();
    }
    return default_val;
}

int OptInt(const nlohmann::json& args, const std::string& key,
           int default_val) {
    if (!args.is_object() || !args.contains(key)) return default_val;
    const auto& v = args[key];
    if (v.is_number_unsigned()) {
        return static_cast<int>(std::min<uint64_t>(
            v.get<uint64_t>(), std::numeric_limits<int>::max()));
    }
    if (v.is_number_integer()) {
        auto n = v.get<int64_t>();
        n = std::max<int64_t>(n, std::numeric_limits<int>::min());
        n = std::min<int64_t>(n, std::numeric_limits<int>::max());
        return static_cast<int>(n);
    }
    return default_val;
}

Number OptNumber(const nlohmann::json& args, const std::string& key,
                 Number default_val) {
    if (!args.is_object() || !args.contains(key)) return default_val;
    const auto& v = args[key];
    if (v.is_number_unsigned()) {
        auto n = v.get<uint64_t>();
        if (n <= static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
            return Number::Int(static_cast<int64_t>(n));
        }
        return Number::Float(static_cast<double>(n));
    }
    if (v.is_number_integer()) return Number::Int(v.get<int64_t>());
    if (v.is_number_float()) return Number::Float(v.get<double>());
    return default_val;
}

// ---------------------------------------------------------------------------
// JSON Schema helpers
// ---------------------------------------------------------------------------

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

nlohmann::json NumberProp(const std::string& desc) {
    return {{"type", "number"}, {"description", desc}};
}

nlohmann::json IntProp(const std::string& desc) {
    return {{"type", "integer"}, {"description", desc}};
}

nlohmann::json MakeSchema(const nlohmann::json& properties,
                          const nlohmann::json& required) {
    return {{"type", "object"},
            {"properties", properties},
            {"required", required}};
}

// ---------------------------------------------------------------------------
// Tool handlers
// ---------------------------------------------------------------------------

ToolResult HandleEcho(const nlohmann::json& arguments) {
    auto args = ParseEchoArgs(arguments);
    return TextResult("Echo: " + args.text);
}

ToolResult HandleAdd(const nlohmann::json& arguments) {
    auto args = ParseAddArgs(arguments);
    auto sum = Apply(BinaryOp::Add, args.a, args.b);
    if (sum.IsErr()) {
        return TextError("Error: " + sum.Error().message);
    }
    return TextResult("Result: " + args.a.ToString() + " + " +
                      args.b.ToString() + " = " + sum.Value().ToString());
}

ToolResult HandleCalculate(const nlohmann::json& arguments) {
    auto args = ParseCalculateArgs(arguments);
    auto value = EvaluateExpression(args.expression);
    if (value.IsErr()) {
        const auto& error = value.Error();
        if (error.category == ErrorCategory::InvalidArgument) {
            return TextError("Error: Invalid expression: " + args.expression);
        }
        return TextError("Error: Could not evaluate: " + error.message);
    }
    return TextResult(args.expression + " = " + value.Value().ToString());
}

ToolResult HandleGenerateLogs(LogGenerator& generator, int max_entries,
                              const nlohmann::json& arguments) {
    auto args = ParseGenerateLogsArgs(arguments);
    auto level = ParseLevelFilter(args.level);
    if (level.IsErr()) {
        return TextError("Error: " + level.Error().message);
    }

    int count = args.count;
    if (count > max_entries) {
        LogInfo("tools", "generate_logs count " + std::to_string(count) +
                             " clamped to " + std::to_string(max_entries));
        count = max_entries;
    }

    auto lines = generator.Generate(count, level.Value(),
                                    LogGenerator::Clock::now());
    std::ostringstream text;
    for (std::size_t i = 0; i < lines.size(); ++i) {
        if (i > 0) text << '\n';
        text << lines[i];
    }
    return TextResult(text.str());
}

struct ToolDefinition {
    std::string name;
    std::string description;
    nlohmann::json input_schema;
    ToolHandler handler;
};

std::vector<ToolDefinition> BuiltinTools(const AppConfig& config) {
    const uint32_t seed = config.log_seed ? *config.log_seed
                                          : std::random_device{}();
    auto generator = std::make_shared<LogGenerator>(seed);
    const int max_entries = config.max_log_entries;

    std::vector<ToolDefinition> tools;

    tools.push_back({
        "echo",
        "Echoes back the input text",
        MakeSchema({{"text", StringProp("The text to echo")}}, {"text"}),
        HandleEcho});

    tools.push_back({
        "add",
        "Adds two numbers together",
        MakeSchema({{"a", NumberProp("First number")},
                    {"b", NumberProp("Second number")}},
                   {"a", "b"}),
        HandleAdd});

    tools.push_back({
        "calculate",
        "Evaluates an arithmetic expression. Supports + - * / // % ** and "
        "parentheses, e.g. \"25 * 4\" or \"(1 + 2) / 3\".",
        MakeSchema({{"expression", StringProp("Arithmetic expression to evaluate")}},
                   {"expression"}),
        HandleCalculate});

    tools.push_back({
        "generate_logs",
        "Generates mock service log entries for testing log tooling.",
        MakeSchema({{"count", IntProp("Number of entries (default 5)")},
                    {"level", StringProp("info, warn, error, debug or all (default all)")}},
                   nlohmann::json::array()),
        [generator, max_entries](const nlohmann::json& arguments) -> ToolResult {
            return HandleGenerateLogs(*generator, max_entries, arguments);
        }});

    return tools;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Argument parsing
// ---------------------------------------------------------------------------

EchoArgs ParseEchoArgs(const nlohmann::json& arguments) {
    EchoArgs args;
    args.text = OptString(arguments, "text", args.text);
    return args;
}

AddArgs ParseAddArgs(const nlohmann::json& arguments) {
    AddArgs args;
    args.a = OptNumber(arguments, "a", args.a);
    args.b = OptNumber(arguments, "b", args.b);
    return args;
}

CalculateArgs ParseCalculateArgs(const nlohmann::json& arguments) {
    CalculateArgs args;
    args.expression = OptString(arguments, "expression", args.expression);
    return args;
}

GenerateLogsArgs ParseGenerateLogsArgs(const nlohmann::json& arguments) {
    GenerateLogsArgs args;
    args.count = OptInt(arguments, "count", args.count);
    args.level = OptString(arguments, "level", args.level);
    return args;
}

// ---------------------------------------------------------------------------
// Registration
// ---------------------------------------------------------------------------

Result<void, Error> RegisterSkillTools(ToolRegistry& registry,
                                       const AppConfig& config) {
    auto tools = BuiltinTools(config);
    const auto& wanted = config.enabled_tools.empty() ? BuiltinToolNames()
                                                      : config.enabled_tools;

    for (const auto& name : wanted) {
        auto it = std::find_if(tools.begin(), tools.end(),
                               [&name](const ToolDefinition& t) { return t.name == name; });
        if (it == tools.end()) {
            return Result<void, Error>::Err(
                Error{"RegisterSkillTools", "Unknown tool: " + name,
                      ErrorCategory::Config});
        }
        auto registered = registry.Register(it->name, it->description,
                                            it->input_schema, it->handler);
        if (registered.IsErr()) {
            return registered;
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace skills_mcp
