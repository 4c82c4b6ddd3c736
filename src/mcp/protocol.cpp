#include <git_summarizer/mcp/protocol.hpp>

#include <utility>

namespace git_summarizer {

namespace {

Error MakeProtocolError(const std::string& operation,
                        const std::string& message) {
    return Error{operation, message, std::nullopt, ErrorCategory::Protocol};
}

// Member value, or nullopt when the key is missing or null.
std::optional<nlohmann::json> OptMember(const nlohmann::json& object,
                                        const char* key) {
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::nullopt;
    }
    return *it;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// DecodeRequest
// ---------------------------------------------------------------------------
Result<JsonRpcRequest, Error> DecodeRequest(std::string_view line) {
    nlohmann::json message;
    try {
        message = nlohmann::json::parse(line.begin(), line.end());
    } catch (const nlohmann::json::parse_error& e) {
        return Result<JsonRpcRequest, Error>::Err(
            MakeProtocolError("DecodeRequest", e.what()));
    }

    if (!message.is_object()) {
        return Result<JsonRpcRequest, Error>::Err(MakeProtocolError(
            "DecodeRequest", "expected a JSON object, got " +
                                 std::string(message.type_name())));
    }

    auto jsonrpc = message.find("jsonrpc");
    if (jsonrpc == message.end() || !jsonrpc->is_string()) {
        return Result<JsonRpcRequest, Error>::Err(MakeProtocolError(
            "DecodeRequest", "missing or non-string field 'jsonrpc'"));
    }
    auto method = message.find("method");
    if (method == message.end() || !method->is_string()) {
        return Result<JsonRpcRequest, Error>::Err(MakeProtocolError(
            "DecodeRequest", "missing or non-string field 'method'"));
    }

    JsonRpcRequest request;
    request.jsonrpc = jsonrpc->get<std::string>();
    request.method = method->get<std::string>();
    request.params = OptMember(message, "params");
    request.id = OptMember(message, "id");
    return Result<JsonRpcRequest, Error>::Ok(std::move(request));
}

// ---------------------------------------------------------------------------
// EncodeResponse
// ---------------------------------------------------------------------------
std::string EncodeResponse(const nlohmann::json& id, const Outcome& outcome) {
    nlohmann::json response = {
        {"jsonrpc", "2.0"},
        {"id", id},
    };
    if (outcome.IsOk()) {
        response["result"] = outcome.Value();
    } else {
        response["error"] = {
            {"code", outcome.Error().code},
            {"message", outcome.Error().message},
        };
    }
    // Diff text is not guaranteed to be valid UTF-8; replace bad sequences
    // rather than fail the whole response.
    return response.dump(-1, ' ', false,
                         nlohmann::json::error_handler_t::replace);
}

// ---------------------------------------------------------------------------
// ParseInitializeParams
// ---------------------------------------------------------------------------
std::optional<InitializeParams> ParseInitializeParams(
    const std::optional<nlohmann::json>& params) {
    if (!params.has_value() || !params->is_object()) {
        return std::nullopt;
    }

    InitializeParams parsed;
    for (const auto& [key, value] : params->items()) {
        if (key == "options") continue;
        parsed.extra[key] = value;
    }

    auto options = OptMember(*params, "options");
    if (options.has_value() && options->is_object()) {
        auto format = options->find("commitFormat");
        if (format != options->end() && format->is_string()) {
            parsed.commit_format = format->get<std::string>();
        }
    }
    return parsed;
}

// ---------------------------------------------------------------------------
// ParseCallToolParams
// ---------------------------------------------------------------------------
Result<CallToolParams, Error> ParseCallToolParams(
    const std::optional<nlohmann::json>& params) {
    if (!params.has_value() || !params->is_object()) {
        return Result<CallToolParams, Error>::Err(MakeProtocolError(
            "ParseCallToolParams", "tools/call params must be an object"));
    }

    auto name = params->find("name");
    if (name == params->end() || !name->is_string()) {
        return Result<CallToolParams, Error>::Err(MakeProtocolError(
            "ParseCallToolParams", "missing or non-string field 'name'"));
    }

    CallToolParams parsed;
    parsed.name = name->get<std::string>();
    parsed.arguments = OptMember(*params, "arguments");
    return Result<CallToolParams, Error>::Ok(std::move(parsed));
}

} // namespace git_summarizer
