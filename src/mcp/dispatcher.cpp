#include <skills_mcp/mcp/dispatcher.hpp>

#include <skills_mcp/core/log.hpp>

#include <string>
#include <utility>

namespace skills_mcp {

namespace {

constexpr const char* kComponent = "dispatch";

std::string StringField(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) return "";
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) return "";
    return it->get<std::string>();
}

nlohmann::json ObjectField(const nlohmann::json& object, const char* key) {
    if (!object.is_object()) return nlohmann::json::object();
    auto it = object.find(key);
    if (it == object.end() || !it->is_object()) return nlohmann::json::object();
    return *it;
}

} // anonymous namespace

Method ClassifyMethod(std::string_view name) {
    if (name == "initialize") return Method::Initialize;
    if (name == "notifications/initialized" || name == "initialized") {
        return Method::Initialized;
    }
    if (name == "tools/list") return Method::ToolsList;
    if (name == "tools/call") return Method::ToolsCall;
    return Method::Other;
}

Dispatcher::Dispatcher(const ToolRegistry& registry, ServerConfig server)
    : registry_(registry), server_(std::move(server)) {}

std::optional<Response> Dispatcher::Dispatch(const Request& request) const {
    const auto method = ClassifyMethod(request.method);
    if (GlobalLogger().Enabled(LogLevel::Debug)) {
        LogDebug(kComponent, "method '" + request.method + "'" +
                                 (request.IsNotification() ? " (notification)" : ""));
    }

    if (method == Method::Initialized) {
        return std::nullopt;
    }

    nlohmann::json result;
    try {
        switch (method) {
            case Method::Initialize:
                result = HandleInitialize();
                break;
            case Method::ToolsList:
                result = HandleToolsList();
                break;
            case Method::ToolsCall:
                result = HandleToolsCall(request.params);
                break;
            case Method::Initialized:
            case Method::Other:
                result = nlohmann::json::object();
                break;
        }
    } catch (const std::exception& e) {
        return Fault(request, e.what());
    } catch (...) {
        return Fault(request, "Unknown error");
    }

    if (request.IsNotification()) {
        return std::nullopt;
    }
    return Response::Success(*request.id, std::move(result));
}

nlohmann::json Dispatcher::HandleInitialize() const {
    nlohmann::json result;
    result["protocolVersion"] = server_.protocol_version;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", server_.name},
        {"version", server_.version}
    };
    return result;
}

nlohmann::json Dispatcher::HandleToolsList() const {
    nlohmann::json tools = nlohmann::json::array();
    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }
    return {{"tools", tools}};
}

nlohmann::json Dispatcher::HandleToolsCall(const nlohmann::json& params) const {
    const auto tool_name = StringField(params, "name");
    const auto arguments = ObjectField(params, "arguments");

    if (registry_.Find(tool_name) == nullptr) {
        LogInfo(kComponent, "call to unknown tool '" + tool_name + "'");
    }
    auto outcome = registry_.Execute(tool_name, arguments);

    nlohmann::json result;
    result["content"] = std::move(outcome.content);
    if (outcome.is_error) {
        result["isError"] = true;
    }
    return result;
}

std::optional<Response> Dispatcher::Fault(const Request& request,
                                          const std::string& message) const {
    if (request.IsNotification()) {
        LogWarn(kComponent, "'" + request.method +
                                "' failed on a notification, dropping: " + message);
        return std::nullopt;
    }
    LogWarn(kComponent, "'" + request.method + "' failed: " + message);
    return Response::Failure(*request.id, kInternalError, message);
}

} // namespace skills_mcp
