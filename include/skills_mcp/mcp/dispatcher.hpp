#pragma once

#include <skills_mcp/config/app_config.hpp>
#include <skills_mcp/mcp/message_codec.hpp>
#include <skills_mcp/mcp/tool_registry.hpp>

#include <optional>
#include <string_view>

#include <nlohmann/json.hpp>

namespace skills_mcp {

// ---------------------------------------------------------------------------
// Method — the protocol methods the dispatcher tells apart.
//
//   initialize                       -> Initialize
//   notifications/initialized,
//   initialized                      -> Initialized (never answered)
//   tools/list                       -> ToolsList
//   tools/call                       -> ToolsCall
//   anything else                    -> Other (answered with {})
// ---------------------------------------------------------------------------
enum class Method {
    Initialize,
    Initialized,
    ToolsList,
    ToolsCall,
    Other,
};

[[nodiscard]] Method ClassifyMethod(std::string_view name);

// ---------------------------------------------------------------------------
// Dispatcher — routes one Request and normalizes the outcome.
//
// Returns nullopt whenever the request carries no id, on every path
// (success, unknown method and handler fault alike), and always for the
// initialized notification.
// ---------------------------------------------------------------------------
class Dispatcher {
public:
    Dispatcher(const ToolRegistry& registry, ServerConfig server);

    [[nodiscard]] std::optional<Response> Dispatch(const Request& request) const;

private:
    nlohmann::json HandleInitialize() const;
    nlohmann::json HandleToolsList() const;
    nlohmann::json HandleToolsCall(const nlohmann::json& params) const;
    std::optional<Response> Fault(const Request& request,
                                  const std::string& message) const;

    const ToolRegistry& registry_;
    ServerConfig server_;
};

} // namespace skills_mcp
