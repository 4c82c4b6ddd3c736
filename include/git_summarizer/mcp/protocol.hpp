#pragma once

#include <git_summarizer/core/result.hpp>

#include <optional>
#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace git_summarizer {

// JSON-RPC 2.0 error codes used by the server.
constexpr int kMethodNotFound = -32601;

// ---------------------------------------------------------------------------
// JsonRpcRequest — one decoded input line.
//
// A request without id is a notification. An explicit "id": null and
// "params": null decode as absent.
// ---------------------------------------------------------------------------
struct JsonRpcRequest {
    std::string jsonrpc;
    std::string method;
    std::optional<nlohmann::json> params;
    std::optional<nlohmann::json> id;

    [[nodiscard]] bool IsNotification() const noexcept { return !id.has_value(); }
};

// ---------------------------------------------------------------------------
// RpcError — transport-level error object of a response.
// ---------------------------------------------------------------------------
struct RpcError {
    int code = 0;
    std::string message;
};

// ---------------------------------------------------------------------------
// Outcome — the payload of a response: a result value or an RpcError.
// ---------------------------------------------------------------------------
using Outcome = Result<nlohmann::json, RpcError>;

// Parse one line into a request. Fails when the line is not a JSON object or
// jsonrpc/method are missing or not strings.
Result<JsonRpcRequest, Error> DecodeRequest(std::string_view line);

// Serialize a response as a single line (no terminator; the transport adds it).
std::string EncodeResponse(const nlohmann::json& id, const Outcome& outcome);

// ---------------------------------------------------------------------------
// Typed params of the methods that take any.
// ---------------------------------------------------------------------------

// initialize: only options.commitFormat is interpreted. Everything else the
// client sends (protocolVersion, capabilities, clientInfo, other options) is
// kept in `extra` and ignored.
struct InitializeParams {
    std::optional<std::string> commit_format;
    nlohmann::json extra = nlohmann::json::object();
};

// tools/call
struct CallToolParams {
    std::string name;
    std::optional<nlohmann::json> arguments;
};

// Lenient: params that do not fit the shape yield nullopt, which the
// dispatcher treats as "no override".
std::optional<InitializeParams> ParseInitializeParams(
    const std::optional<nlohmann::json>& params);

// Strict: missing params or a missing/non-string name is an error that the
// caller must propagate.
Result<CallToolParams, Error> ParseCallToolParams(
    const std::optional<nlohmann::json>& params);

} // namespace git_summarizer
