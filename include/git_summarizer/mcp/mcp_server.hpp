#pragma once

#include <git_summarizer/config/server_config.hpp>
#include <git_summarizer/core/result.hpp>
#include <git_summarizer/mcp/protocol.hpp>
#include <git_summarizer/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace git_summarizer {

constexpr const char* kProtocolVersion = "2024-11-05";

// ---------------------------------------------------------------------------
// McpServer — MCP 2024-11-05 server over line-delimited stdin/stdout.
//
// Methods:
//   - initialize                 (may replace the commit template)
//   - notifications/initialized  (logged, never answered)
//   - tools/list
//   - tools/call
// Anything else is answered with -32601 when it carries an id.
//
// Requests are handled strictly one at a time: a line is fully answered and
// flushed before the next one is read.
// ---------------------------------------------------------------------------
class McpServer {
public:
    McpServer(const ToolRegistry& registry,
              ServerConfig& config,
              std::istream& in = std::cin,
              std::ostream& out = std::cout);

    // Run the server loop until EOF on the input stream. Returns an error
    // when a tools/call carries malformed params or the output stream fails;
    // the loop stops at that point.
    [[nodiscard]] Result<void, Error> Run();

    // Decode, dispatch and encode one input line. Returns nullopt when no
    // response is due: notifications and lines that fail to decode (those
    // are logged and dropped).
    [[nodiscard]] Result<std::optional<std::string>, Error> HandleLine(
        std::string_view line);

    // Route a decoded request by method. Returns nullopt when the method
    // produces no payload at all.
    [[nodiscard]] Result<std::optional<Outcome>, Error> Dispatch(
        const JsonRpcRequest& request);

private:
    Outcome HandleInitialize(const std::optional<nlohmann::json>& params);
    Outcome HandleToolsList();
    Result<Outcome, Error> HandleToolsCall(
        const std::optional<nlohmann::json>& params);

    const ToolRegistry& registry_;
    ServerConfig& config_;
    std::istream& in_;
    std::ostream& out_;
};

} // namespace git_summarizer
