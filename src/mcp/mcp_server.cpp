#include <git_summarizer/mcp/mcp_server.hpp>

#include <git_summarizer/core/log.hpp>
#include <git_summarizer/core/version.hpp>

#include <string>
#include <utility>

namespace git_summarizer {

namespace {

constexpr const char* kLogComponent = "mcp";

} // anonymous namespace

McpServer::McpServer(const ToolRegistry& registry,
                     ServerConfig& config,
                     std::istream& in,
                     std::ostream& out)
    : registry_(registry), config_(config), in_(in), out_(out) {}

Result<void, Error> McpServer::Run() {
    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty()) continue;

        auto handled = HandleLine(line);
        if (handled.IsErr()) {
            return Result<void, Error>::Err(std::move(handled).Error());
        }

        auto response = std::move(handled).Value();
        if (!response) continue;

        out_ << *response << '\n';
        out_.flush();
        if (!out_) {
            return Result<void, Error>::Err(Error{
                "WriteResponse", "failed to write response to output stream",
                std::nullopt, ErrorCategory::Io});
        }
        LogDebug(kLogComponent, "sent: " + *response);
    }

    LogInfo(kLogComponent, "input closed, shutting down");
    return Result<void, Error>::Ok();
}

Result<std::optional<std::string>, Error> McpServer::HandleLine(
    std::string_view line) {
    using LineResult = Result<std::optional<std::string>, Error>;

    LogDebug(kLogComponent, "received: " + std::string(line));

    auto decoded = DecodeRequest(line);
    if (decoded.IsErr()) {
        LogWarn(kLogComponent, "dropping malformed line: " +
                                   decoded.Error().message);
        return LineResult::Ok(std::nullopt);
    }
    const auto& request = decoded.Value();

    auto dispatched = Dispatch(request);
    if (dispatched.IsErr()) {
        return LineResult::Err(std::move(dispatched).Error());
    }
    auto outcome = std::move(dispatched).Value();

    if (!outcome || request.IsNotification()) {
        return LineResult::Ok(std::nullopt);
    }
    return LineResult::Ok(EncodeResponse(*request.id, *outcome));
}

Result<std::optional<Outcome>, Error> McpServer::Dispatch(
    const JsonRpcRequest& request) {
    using DispatchResult = Result<std::optional<Outcome>, Error>;
    const auto& method = request.method;

    if (method == "initialize") {
        return DispatchResult::Ok(HandleInitialize(request.params));
    }
    if (method == "notifications/initialized") {
        LogInfo(kLogComponent, "client acknowledged initialization");
        return DispatchResult::Ok(std::nullopt);
    }
    if (method == "tools/list") {
        return DispatchResult::Ok(HandleToolsList());
    }
    if (method == "tools/call") {
        auto called = HandleToolsCall(request.params);
        if (called.IsErr()) {
            return DispatchResult::Err(std::move(called).Error());
        }
        return DispatchResult::Ok(std::move(called).Value());
    }

    if (request.IsNotification()) {
        LogDebug(kLogComponent, "ignoring notification '" + method + "'");
        return DispatchResult::Ok(std::nullopt);
    }
    LogWarn(kLogComponent, "method not found: " + method);
    return DispatchResult::Ok(
        Outcome::Err(RpcError{kMethodNotFound, "Method not found"}));
}

Outcome McpServer::HandleInitialize(
    const std::optional<nlohmann::json>& params) {
    auto parsed = ParseInitializeParams(params);
    if (parsed && parsed->commit_format) {
        config_.SetCommitFormat(*parsed->commit_format);
        LogInfo(kLogComponent, "commit format replaced by client options");
    }

    nlohmann::json result;
    result["protocolVersion"] = kProtocolVersion;
    result["capabilities"] = {
        {"tools", {{"listChanged", true}}}
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };
    return Outcome::Ok(std::move(result));
}

Outcome McpServer::HandleToolsList() {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return Outcome::Ok(nlohmann::json{{"tools", tools}});
}

Result<Outcome, Error> McpServer::HandleToolsCall(
    const std::optional<nlohmann::json>& params) {
    auto parsed = ParseCallToolParams(params);
    if (parsed.IsErr()) {
        return Result<Outcome, Error>::Err(std::move(parsed).Error());
    }
    const auto& call = parsed.Value();

    LogInfo(kLogComponent, "tools/call " + call.name);
    auto result = registry_.Execute(
        call.name, call.arguments.value_or(nlohmann::json()));
    return Result<Outcome, Error>::Ok(Outcome::Ok(ToolResultToJson(result)));
}

} // namespace git_summarizer
