#include <skills_mcp/mcp/mcp_server.hpp>

#include <skills_mcp/core/log.hpp>
#include <skills_mcp/mcp/message_codec.hpp>

#include <cctype>
#include <string>
#include <utility>

namespace skills_mcp {

namespace {

constexpr const char* kComponent = "session";

std::string_view Trim(std::string_view s) {
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.front()))) {
        s.remove_prefix(1);
    }
    while (!s.empty() && std::isspace(static_cast<unsigned char>(s.back()))) {
        s.remove_suffix(1);
    }
    return s;
}

} // anonymous namespace

McpServer::McpServer(const ToolRegistry& registry,
                     ServerConfig server,
                     std::istream& in,
                     std::ostream& out)
    : dispatcher_(registry, std::move(server)), in_(in), out_(out) {}

SessionStats McpServer::Run() {
    stats_ = SessionStats{};

    std::string line;
    while (std::getline(in_, line)) {
        ++stats_.lines_read;
        auto response = HandleLine(line);
        if (!response) continue;

        out_ << *response;
        out_.flush();
        ++stats_.responses_written;
    }

    LogInfo(kComponent, "input closed after " + std::to_string(stats_.lines_read) +
                            " lines, " + std::to_string(stats_.responses_written) +
                            " responses, " + std::to_string(stats_.framing_errors) +
                            " unparseable");
    return stats_;
}

std::optional<std::string> McpServer::HandleLine(std::string_view line) {
    auto decoded = DecodeRequest(Trim(line));
    if (decoded.IsErr()) {
        // No id to answer to.
        ++stats_.framing_errors;
        LogDebug(kComponent, "skipping unparseable line: " + decoded.Error());
        return std::nullopt;
    }

    auto response = dispatcher_.Dispatch(decoded.Value());
    if (!response) {
        return std::nullopt;
    }
    return EncodeResponse(*response);
}

} // namespace skills_mcp
