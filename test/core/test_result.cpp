#include <catch2/catch_test_macros.hpp>

#include <agent_relay/core/result.hpp>

#include <nlohmann/json.hpp>

#include <memory>
#include <string>
#include <utility>

using namespace agent_relay;

// ===========================================================================
// Result
// ===========================================================================

TEST_CASE("Result: Ok and Err", "[result]") {
    auto ok = Result<int, std::string>::Ok(7);
    REQUIRE(ok.IsOk());
    CHECK(ok.Value() == 7);

    auto err = Result<int, std::string>::Err("no server");
    REQUIRE(err.IsErr());
    CHECK(err.Error() == "no server");
    CHECK(err.ValueOr(3) == 3);
}

TEST_CASE("Result: AndThen stops at the first Err", "[result]") {
    int calls = 0;
    auto r = Result<int, std::string>::Ok(1)
                 .AndThen([&](int v) {
                     ++calls;
                     return Result<int, std::string>::Err("step " + std::to_string(v));
                 })
                 .AndThen([&](int v) {
                     ++calls;
                     return Result<int, std::string>::Ok(v + 1);
                 });
    REQUIRE(r.IsErr());
    CHECK(r.Error() == "step 1");
    CHECK(calls == 1);
}

TEST_CASE("Result: Map changes the value type", "[result]") {
    auto r = Result<int, std::string>::Ok(42).Map([](int v) { return std::to_string(v); });
    REQUIRE(r.IsOk());
    CHECK(r.Value() == "42");
}

TEST_CASE("Result: move-only value", "[result]") {
    auto r = Result<std::unique_ptr<int>, std::string>::Ok(std::make_unique<int>(5));
    REQUIRE(r.IsOk());
    auto owned = std::move(r).Value();
    CHECK(*owned == 5);
}

TEST_CASE("Result<void>: Ok and Err", "[result]") {
    auto ok = Result<void, Error>::Ok();
    CHECK(ok.IsOk());

    auto err = Result<void, Error>::Err(Error{"op", "", "failed", std::nullopt,
                                              ErrorCategory::Internal});
    REQUIRE(err.IsErr());
    CHECK(err.Error().message == "failed");
}

// ===========================================================================
// Error
// ===========================================================================

TEST_CASE("Error: ToString includes target and detail", "[error]") {
    Error e{"ServerConnection::SendRequest", "notes", "MCP server 'notes' timed out",
            "Stderr: traceback", ErrorCategory::Timeout};
    CHECK(e.ToString() ==
          "ServerConnection::SendRequest [notes]: MCP server 'notes' timed out (Stderr: traceback)");

    Error bare{"ConfigLoader", "", "Missing required field: principal", std::nullopt,
               ErrorCategory::Configuration};
    CHECK(bare.ToString() == "ConfigLoader: Missing required field: principal");
}

TEST_CASE("Error: default category is Internal", "[error]") {
    Error e{"op", "", "msg", std::nullopt};
    CHECK(e.category == ErrorCategory::Internal);
    CHECK(e.ExitCode() == 99);
}

TEST_CASE("Error: ExitCode per category", "[error]") {
    auto code = [](ErrorCategory c) { return Error{"op", "", "m", std::nullopt, c}.ExitCode(); };
    CHECK(code(ErrorCategory::Configuration) == 2);
    CHECK(code(ErrorCategory::Initialization) == 3);
    CHECK(code(ErrorCategory::Timeout) == 4);
    CHECK(code(ErrorCategory::UnknownCapability) == 5);
    CHECK(code(ErrorCategory::ProtocolDecode) == 6);
    CHECK(code(ErrorCategory::NoResponse) == 6);
    CHECK(code(ErrorCategory::ProcessExited) == 7);
    CHECK(code(ErrorCategory::RpcError) == 8);
    CHECK(code(ErrorCategory::Connection) == 9);
    CHECK(code(ErrorCategory::Authentication) == 10);
    CHECK(code(ErrorCategory::NotFound) == 11);
    CHECK(code(ErrorCategory::MaxRoundsExceeded) == 12);
}

TEST_CASE("Error: ToJson is parseable and omits empty fields", "[error]") {
    Error full{"ServerConnection::EnsureRunning", "notes", "Init failed for notes: \"boom\"",
               "Stderr: line1\nline2", ErrorCategory::Initialization};
    auto j = nlohmann::json::parse(full.ToJson());
    CHECK(j["error"]["category"] == "initialization");
    CHECK(j["error"]["target"] == "notes");
    CHECK(j["error"]["message"] == "Init failed for notes: \"boom\"");
    CHECK(j["error"]["detail"] == "Stderr: line1\nline2");
    CHECK(j["error"]["exit_code"] == 3);

    Error bare{"op", "", "msg", std::nullopt, ErrorCategory::NoResponse};
    auto b = nlohmann::json::parse(bare.ToJson());
    CHECK(b["error"]["category"] == "no_response");
    CHECK_FALSE(b["error"].contains("target"));
    CHECK_FALSE(b["error"].contains("detail"));
}

TEST_CASE("Error: equality compares every field", "[error]") {
    Error a{"op", "t", "m", std::nullopt, ErrorCategory::RpcError};
    Error b = a;
    CHECK(a == b);
    b.category = ErrorCategory::ProtocolDecode;
    CHECK(a != b);
}

// ===========================================================================
// FromHttpStatus
// ===========================================================================

TEST_CASE("FromHttpStatus: categories", "[error][http]") {
    CHECK(Error::FromHttpStatus("op", "/v1/messages", 401).category ==
          ErrorCategory::Authentication);
    CHECK(Error::FromHttpStatus("op", "/v1/messages", 403).category ==
          ErrorCategory::Authentication);
    CHECK(Error::FromHttpStatus("op", "/v1/messages", 404).category == ErrorCategory::NotFound);
    CHECK(Error::FromHttpStatus("op", "/v1/messages", 408).category == ErrorCategory::Timeout);
    CHECK(Error::FromHttpStatus("op", "/v1/messages", 429).category == ErrorCategory::Timeout);
    CHECK(Error::FromHttpStatus("op", "/v1/messages", 529).category == ErrorCategory::Connection);
    CHECK(Error::FromHttpStatus("op", "/v1/messages", 503).category == ErrorCategory::Connection);
    CHECK(Error::FromHttpStatus("op", "/v1/messages", 500).category == ErrorCategory::Internal);
    CHECK(Error::FromHttpStatus("op", "/v1/messages", 418).category == ErrorCategory::Internal);
}

TEST_CASE("FromHttpStatus: extracts the API error message", "[error][http]") {
    auto e = Error::FromHttpStatus(
        "AnthropicClient::Complete", "/v1/messages", 400,
        R"({"type":"error","error":{"type":"invalid_request_error","message":"messages: roles must alternate"}})");
    CHECK(e.target == "/v1/messages");
    CHECK(e.message == "HTTP 400 Bad request: messages: roles must alternate");
    REQUIRE(e.detail.has_value());
    CHECK(*e.detail == "messages: roles must alternate");
}

TEST_CASE("FromHttpStatus: non-JSON body yields no detail", "[error][http]") {
    auto e = Error::FromHttpStatus("op", "/v1/messages", 502, "<html>Bad Gateway</html>");
    CHECK_FALSE(e.detail.has_value());
    CHECK(e.message.rfind("HTTP 502", 0) == 0);
}
