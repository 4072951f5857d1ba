#include <skills_mcp/mcp/tool_registry.hpp>

#include <algorithm>

namespace skills_mcp {

ToolResult TextResult(const std::string& text) {
    return ToolResult{
        false,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

ToolResult TextError(const std::string& text) {
    return ToolResult{
        true,
        nlohmann::json::array({{{"type", "text"}, {"text", text}}})};
}

Result<void, Error> ToolRegistry::Register(const std::string& name,
                                           const std::string& description,
                                           const nlohmann::json& input_schema,
                                           ToolHandler handler) {
    if (handlers_.count(name) > 0) {
        return Result<void, Error>::Err(
            Error{"RegisterTool", "Tool already registered: " + name,
                  ErrorCategory::Duplicate});
    }
    schemas_.push_back({name, description, input_schema});
    handlers_[name] = std::move(handler);
    return Result<void, Error>::Ok();
}

const ToolSchema* ToolRegistry::Find(const std::string& name) const {
    auto it = std::find_if(schemas_.begin(), schemas_.end(),
                           [&name](const ToolSchema& s) { return s.name == name; });
    return it == schemas_.end() ? nullptr : &*it;
}

ToolResult ToolRegistry::Execute(const std::string& name,
                                 const nlohmann::json& arguments) const {
    auto it = handlers_.find(name);
    if (it == handlers_.end()) {
        return TextError("Unknown tool: " + name);
    }
    return it->second(arguments);
}

} // namespace skills_mcp
