#pragma once

#include <skills_mcp/core/result.hpp>

#include <functional>
#include <map>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace skills_mcp {

// ---------------------------------------------------------------------------
// ToolSchema — what tools/list advertises for one tool.
// ---------------------------------------------------------------------------
struct ToolSchema {
    std::string name;
    std::string description;
    nlohmann::json input_schema;  // JSON Schema object
};

// ---------------------------------------------------------------------------
// ToolResult — outcome of a tool call that ran to completion. is_error marks
// a tool-level failure; the call itself still succeeded at the protocol level.
// ---------------------------------------------------------------------------
struct ToolResult {
    bool is_error = false;
    nlohmann::json content = nlohmann::json::array();  // array of content blocks
};

// Single text block results.
ToolResult TextResult(const std::string& text);
ToolResult TextError(const std::string& text);

// Receives the call's "arguments" object. May throw; the dispatcher turns an
// escaping exception into an internal-error response.
using ToolHandler = std::function<ToolResult(const nlohmann::json& arguments)>;

// ---------------------------------------------------------------------------
// ToolRegistry — tools in registration order, looked up by exact name.
// Filled once at startup and only read afterwards.
// ---------------------------------------------------------------------------
class ToolRegistry {
public:
    // Fails with ErrorCategory::Duplicate if the name is already taken.
    Result<void, Error> Register(const std::string& name,
                                 const std::string& description,
                                 const nlohmann::json& input_schema,
                                 ToolHandler handler);

    [[nodiscard]] const std::vector<ToolSchema>& Tools() const noexcept {
        return schemas_;
    }

    // nullptr when no tool has this name.
    [[nodiscard]] const ToolSchema* Find(const std::string& name) const;

    // Runs the named tool. An unknown name yields an is_error result naming
    // the tool. Exceptions from the handler propagate to the caller.
    [[nodiscard]] ToolResult Execute(const std::string& name,
                                     const nlohmann::json& arguments) const;

private:
    std::vector<ToolSchema> schemas_;
    std::map<std::string, ToolHandler> handlers_;
};

} // namespace skills_mcp
