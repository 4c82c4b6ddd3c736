#include <catch2/catch_test_macros.hpp>

#include <git_summarizer/mcp/protocol.hpp>

#include <string>

using namespace git_summarizer;

namespace {

std::optional<nlohmann::json> Params(nlohmann::json j) {
    return std::optional<nlohmann::json>(std::move(j));
}

} // anonymous namespace

// ===========================================================================
// DecodeRequest
// ===========================================================================

TEST_CASE("DecodeRequest: full request", "[mcp][protocol]") {
    auto result = DecodeRequest(
        R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"x"}})");
    REQUIRE(result.IsOk());
    const auto& req = result.Value();
    CHECK(req.jsonrpc == "2.0");
    CHECK(req.method == "tools/call");
    REQUIRE(req.id.has_value());
    CHECK(*req.id == 7);
    REQUIRE(req.params.has_value());
    CHECK((*req.params)["name"] == "x");
    CHECK_FALSE(req.IsNotification());
}

TEST_CASE("DecodeRequest: notification has no id", "[mcp][protocol]") {
    auto result = DecodeRequest(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    REQUIRE(result.IsOk());
    CHECK(result.Value().IsNotification());
    CHECK_FALSE(result.Value().params.has_value());
}

TEST_CASE("DecodeRequest: string id and null params", "[mcp][protocol]") {
    auto result = DecodeRequest(
        R"({"jsonrpc":"2.0","id":"req-1","method":"tools/list","params":null})");
    REQUIRE(result.IsOk());
    CHECK(*result.Value().id == "req-1");
    CHECK_FALSE(result.Value().params.has_value());
}

TEST_CASE("DecodeRequest: null id counts as absent", "[mcp][protocol]") {
    auto result = DecodeRequest(R"({"jsonrpc":"2.0","id":null,"method":"tools/list"})");
    REQUIRE(result.IsOk());
    CHECK(result.Value().IsNotification());
}

TEST_CASE("DecodeRequest: version string is not validated", "[mcp][protocol]") {
    auto result = DecodeRequest(R"({"jsonrpc":"1.0","id":1,"method":"tools/list"})");
    REQUIRE(result.IsOk());
    CHECK(result.Value().jsonrpc == "1.0");
}

TEST_CASE("DecodeRequest: malformed input", "[mcp][protocol]") {
    CHECK(DecodeRequest("not json").IsErr());
    CHECK(DecodeRequest("").IsErr());
    CHECK(DecodeRequest(R"({"jsonrpc":"2.0","id":1)").IsErr());
    CHECK(DecodeRequest("[1,2,3]").IsErr());
    CHECK(DecodeRequest(R"({"jsonrpc":"2.0","id":1})").IsErr());
    CHECK(DecodeRequest(R"({"id":1,"method":"tools/list"})").IsErr());
    CHECK(DecodeRequest(R"({"jsonrpc":"2.0","id":1,"method":42})").IsErr());

    auto err = DecodeRequest("not json");
    CHECK(err.Error().category == ErrorCategory::Protocol);
}

// ===========================================================================
// EncodeResponse
// ===========================================================================

TEST_CASE("EncodeResponse: result", "[mcp][protocol]") {
    auto line = EncodeResponse(3, Outcome::Ok(nlohmann::json{{"tools", nlohmann::json::array()}}));
    CHECK(line.find('\n') == std::string::npos);

    auto j = nlohmann::json::parse(line);
    CHECK(j["jsonrpc"] == "2.0");
    CHECK(j["id"] == 3);
    CHECK(j["result"]["tools"].is_array());
    CHECK_FALSE(j.contains("error"));
}

TEST_CASE("EncodeResponse: error", "[mcp][protocol]") {
    auto line = EncodeResponse("abc", Outcome::Err(RpcError{kMethodNotFound, "Method not found"}));
    auto j = nlohmann::json::parse(line);
    CHECK(j["id"] == "abc");
    CHECK(j["error"]["code"] == -32601);
    CHECK(j["error"]["message"] == "Method not found");
    CHECK_FALSE(j.contains("result"));
}

TEST_CASE("EncodeResponse: multi-line text stays on one line", "[mcp][protocol]") {
    nlohmann::json result = {{"content", {{{"type", "text"}, {"text", "a\nb\n"}}}}};
    auto line = EncodeResponse(1, Outcome::Ok(result));
    CHECK(line.find('\n') == std::string::npos);
    CHECK(nlohmann::json::parse(line)["result"] == result);
}

TEST_CASE("EncodeResponse: invalid UTF-8 is replaced, not thrown", "[mcp][protocol]") {
    nlohmann::json result = {{"text", std::string("bin \xff\xfe data")}};
    std::string line;
    REQUIRE_NOTHROW(line = EncodeResponse(1, Outcome::Ok(result)));
    CHECK_NOTHROW(nlohmann::json::parse(line));
}

TEST_CASE("EncodeResponse: re-encoding a decoded response is equivalent",
          "[mcp][protocol]") {
    const std::string original =
        R"({"result":{"content":[{"text":"ok","type":"text"}]},"id":"x-1","jsonrpc":"2.0"})";
    auto parsed = nlohmann::json::parse(original);

    auto encoded = EncodeResponse(parsed["id"], Outcome::Ok(parsed["result"]));
    CHECK(nlohmann::json::parse(encoded) == parsed);

    const std::string error_line =
        R"({"jsonrpc":"2.0","id":9,"error":{"code":-32601,"message":"Method not found"}})";
    auto error_parsed = nlohmann::json::parse(error_line);
    auto error_encoded = EncodeResponse(
        error_parsed["id"],
        Outcome::Err(RpcError{error_parsed["error"]["code"].get<int>(),
                              error_parsed["error"]["message"].get<std::string>()}));
    CHECK(nlohmann::json::parse(error_encoded) == error_parsed);
}

// ===========================================================================
// Typed params
// ===========================================================================

TEST_CASE("ParseInitializeParams: commitFormat extracted, rest kept", "[mcp][protocol]") {
    nlohmann::json params = {
        {"protocolVersion", "2024-11-05"},
        {"clientInfo", {{"name", "agent"}}},
        {"options", {{"commitFormat", "X"}, {"other", true}}},
    };
    auto parsed = ParseInitializeParams(Params(params));
    REQUIRE(parsed.has_value());
    CHECK(parsed->commit_format == std::optional<std::string>("X"));
    CHECK(parsed->extra["protocolVersion"] == "2024-11-05");
    CHECK_FALSE(parsed->extra.contains("options"));
}

TEST_CASE("ParseInitializeParams: lenient shapes", "[mcp][protocol]") {
    CHECK_FALSE(ParseInitializeParams(std::nullopt).has_value());
    CHECK_FALSE(ParseInitializeParams(Params("text")).has_value());

    auto no_options = ParseInitializeParams(Params(nlohmann::json::object()));
    REQUIRE(no_options.has_value());
    CHECK_FALSE(no_options->commit_format.has_value());

    auto non_string = ParseInitializeParams(Params(
        nlohmann::json{{"options", {{"commitFormat", 5}}}}));
    REQUIRE(non_string.has_value());
    CHECK_FALSE(non_string->commit_format.has_value());

    auto options_array = ParseInitializeParams(Params(
        nlohmann::json{{"options", nlohmann::json::array()}}));
    REQUIRE(options_array.has_value());
    CHECK_FALSE(options_array->commit_format.has_value());
}

TEST_CASE("ParseCallToolParams: name and arguments", "[mcp][protocol]") {
    auto result = ParseCallToolParams(Params(
        nlohmann::json{{"name", "execute_commit"}, {"arguments", {{"message", "m"}}}}));
    REQUIRE(result.IsOk());
    CHECK(result.Value().name == "execute_commit");
    REQUIRE(result.Value().arguments.has_value());
    CHECK((*result.Value().arguments)["message"] == "m");
}

TEST_CASE("ParseCallToolParams: arguments optional", "[mcp][protocol]") {
    auto result = ParseCallToolParams(Params(nlohmann::json{{"name", "get_staged_diff"}}));
    REQUIRE(result.IsOk());
    CHECK_FALSE(result.Value().arguments.has_value());

    auto null_args = ParseCallToolParams(Params(
        nlohmann::json{{"name", "get_staged_diff"}, {"arguments", nullptr}}));
    REQUIRE(null_args.IsOk());
    CHECK_FALSE(null_args.Value().arguments.has_value());
}

TEST_CASE("ParseCallToolParams: strict on malformed params", "[mcp][protocol]") {
    CHECK(ParseCallToolParams(std::nullopt).IsErr());
    CHECK(ParseCallToolParams(Params(nlohmann::json::object())).IsErr());
    CHECK(ParseCallToolParams(Params(nlohmann::json{{"name", 12}})).IsErr());
    CHECK(ParseCallToolParams(Params(nlohmann::json::array({"execute_commit"}))).IsErr());

    auto err = ParseCallToolParams(Params(nlohmann::json::object()));
    CHECK(err.Error().category == ErrorCategory::Protocol);
}
