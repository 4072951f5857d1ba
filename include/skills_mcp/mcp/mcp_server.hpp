#pragma once

#include <skills_mcp/config/app_config.hpp>
#include <skills_mcp/mcp/dispatcher.hpp>
#include <skills_mcp/mcp/tool_registry.hpp>

#include <cstddef>
#include <iostream>
#include <optional>
#include <string>
#include <string_view>

namespace skills_mcp {

struct SessionStats {
    std::size_t lines_read = 0;
    std::size_t framing_errors = 0;
    std::size_t responses_written = 0;
};

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 session over a line-oriented duplex stream.
//
// Reads one line, decodes it, dispatches it and writes at most one line
// back (flushed) before reading the next. Undecodable lines and
// notifications produce no output. Returns when the input stream ends.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(const ToolRegistry& registry,
              ServerConfig server,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    // Blocks until EOF on the input stream.
    SessionStats Run();

    // Process one raw input line. Returns the encoded response line
    // (newline-terminated), or nullopt when nothing must be written.
    [[nodiscard]] std::optional<std::string> HandleLine(std::string_view line);

private:
    Dispatcher dispatcher_;
    std::istream& in_;
    std::ostream& out_;
    SessionStats stats_;
};

} // namespace skills_mcp
