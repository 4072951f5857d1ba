#include <skills_mcp/mcp/message_codec.hpp>

#include <string>
#include <utility>

namespace skills_mcp {

Response Response::Success(nlohmann::json id, nlohmann::json result) {
    return Response{std::move(id),
                    decltype(Response::payload)(std::in_place_index<0>, std::move(result))};
}

Response Response::Failure(nlohmann::json id, int code, std::string message) {
    return Response{std::move(id),
                    decltype(Response::payload)(std::in_place_index<1>,
                                                RpcError{code, std::move(message)})};
}

Result<Request, std::string> DecodeRequest(std::string_view line) {
    // Containers past the limit are discarded while parsing; the parser
    // itself keeps an explicit stack, so depth costs no recursion here.
    bool too_deep = false;
    auto limit_depth = [&too_deep](int depth, nlohmann::json::parse_event_t,
                                   nlohmann::json&) {
        if (depth > kMaxNestingDepth) {
            too_deep = true;
            return false;
        }
        return true;
    };

    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line.begin(), line.end(), limit_depth);
    } catch (const nlohmann::json::parse_error& e) {
        return Result<Request, std::string>::Err(e.what());
    }
    if (too_deep) {
        return Result<Request, std::string>::Err(
            "nesting deeper than " + std::to_string(kMaxNestingDepth) + " levels");
    }

    if (!message.is_object()) {
        return Result<Request, std::string>::Err(
            std::string("expected a JSON object, got ") + message.type_name());
    }

    Request request;
    auto method = message.find("method");
    if (method != message.end() && method->is_string()) {
        request.method = method->get<std::string>();
    }
    auto id = message.find("id");
    if (id != message.end()) {
        request.id = *id;
    }
    auto params = message.find("params");
    if (params != message.end() && !params->is_null()) {
        request.params = *params;
    }
    return Result<Request, std::string>::Ok(std::move(request));
}

std::string EncodeResponse(const Response& response) {
    nlohmann::json out = {
        {"jsonrpc", "2.0"},
        {"id", response.id},
    };
    if (const auto* error = std::get_if<RpcError>(&response.payload)) {
        out["error"] = {{"code", error->code}, {"message", error->message}};
    } else {
        out["result"] = std::get<nlohmann::json>(response.payload);
    }
    // Tool output may echo arbitrary bytes back; never let a bad UTF-8
    // sequence turn into an exception on the write path.
    return out.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace) + "\n";
}

} // namespace skills_mcp
