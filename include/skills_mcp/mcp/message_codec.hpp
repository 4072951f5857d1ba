#pragma once

#include <skills_mcp/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>
#include <variant>

#include <nlohmann/json.hpp>

namespace skills_mcp {

// JSON-RPC 2.0 error codes used by the server.
constexpr int kInternalError = -32603;

// Deepest array/object nesting accepted on an input line.
constexpr int kMaxNestingDepth = 512;

// ---------------------------------------------------------------------------
// Request — one decoded input line.
//
// `id` is engaged whenever the key exists in the message, whatever its value
// (0, false and null included). A disengaged id marks a notification.
// ---------------------------------------------------------------------------
struct Request {
    std::string method;
    std::optional<nlohmann::json> id;
    nlohmann::json params = nlohmann::json::object();

    [[nodiscard]] bool IsNotification() const noexcept { return !id.has_value(); }
};

struct RpcError {
    int code = kInternalError;
    std::string message;
};

// ---------------------------------------------------------------------------
// Response — echoes the request id and carries exactly one of result/error.
// ---------------------------------------------------------------------------
struct Response {
    nlohmann::json id;
    std::variant<nlohmann::json, RpcError> payload;

    static Response Success(nlohmann::json id, nlohmann::json result);
    static Response Failure(nlohmann::json id, int code, std::string message);

    [[nodiscard]] bool IsError() const noexcept { return payload.index() == 1; }
};

// Decode a single line into a Request. Fails when the line is not a JSON
// object or nests deeper than kMaxNestingDepth. A missing or non-string
// "method" decodes as the empty method.
Result<Request, std::string> DecodeRequest(std::string_view line);

// Serialize a Response as one JSON line, terminated by '\n'.
std::string EncodeResponse(const Response& response);

} // namespace skills_mcp
