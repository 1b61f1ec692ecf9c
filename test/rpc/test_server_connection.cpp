#include <catch2/catch_test_macros.hpp>

#include <agent_relay/rpc/server_connection.hpp>

#include <chrono>
#include <string>
#include <vector>

using namespace agent_relay;

namespace {

ServerConfig FakeServer(std::vector<std::string> args = {}) {
    ServerConfig config;
    config.command = FAKE_TOOL_SERVER_PATH;
    config.args = std::move(args);
    config.description = "fake tools";
    return config;
}

ConnectionOptions ShortTimeouts() {
    ConnectionOptions options;
    options.init_timeout = std::chrono::seconds(10);
    options.request_timeout = std::chrono::seconds(10);
    return options;
}

std::string FirstText(const nlohmann::json& result) {
    return result.at("content").at(0).at("text").get<std::string>();
}

nlohmann::json CallTool(const std::string& name, nlohmann::json arguments) {
    return {{"name", name}, {"arguments", std::move(arguments)}};
}

} // anonymous namespace

TEST_CASE("ServerConnection: lazy start and handshake", "[rpc][connection]") {
    ServerConnection conn("fake", FakeServer(), ShortTimeouts());
    CHECK(conn.State() == ConnectionState::Stopped);
    CHECK(conn.ProcessId() == -1);

    auto r = conn.SendRequest("tools/list", nlohmann::json::object());
    REQUIRE(r.IsOk());
    CHECK(r.Value()["tools"].size() == 3);
    CHECK(conn.IsInitialized());
    CHECK(conn.State() == ConnectionState::Initialized);
    CHECK(conn.ServerInfo()["name"] == "fake_tool_server");
    CHECK(conn.ProcessId() > 0);
}

TEST_CASE("ServerConnection: tool call in plain mode", "[rpc][connection]") {
    ServerConnection conn("fake", FakeServer(), ShortTimeouts());
    auto r = conn.SendRequest("tools/call", CallTool("add", {{"a", 2}, {"b", 40}}));
    REQUIRE(r.IsOk());
    CHECK(FirstText(r.Value()) == "42");
}

TEST_CASE("ServerConnection: Content-Length framed server", "[rpc][connection]") {
    ServerConnection conn("framed", FakeServer({"--content-length"}), ShortTimeouts());
    auto r = conn.SendRequest("tools/call", CallTool("echo", {{"text", "framed hello"}}));
    REQUIRE(r.IsOk());
    CHECK(FirstText(r.Value()) == "framed hello");
}

TEST_CASE("ServerConnection: noisy server still answers", "[rpc][connection]") {
    ServerConnection conn("noisy", FakeServer({"--noise"}), ShortTimeouts());
    for (int i = 0; i < 3; ++i) {
        auto r = conn.SendRequest("tools/call",
                                  CallTool("echo", {{"text", "n" + std::to_string(i)}}));
        REQUIRE(r.IsOk());
        CHECK(FirstText(r.Value()) == "n" + std::to_string(i));
    }
}

TEST_CASE("ServerConnection: runtime environment and configured env", "[rpc][connection]") {
    auto config = FakeServer();
    config.env["NOTES_TOKEN"] = "secret-123";
    ServerConnection conn("fake", config, ShortTimeouts());

    auto utf8 = conn.SendRequest("tools/call", CallTool("env", {{"name", "PYTHONUTF8"}}));
    REQUIRE(utf8.IsOk());
    CHECK(FirstText(utf8.Value()) == "1");

    auto token = conn.SendRequest("tools/call", CallTool("env", {{"name", "NOTES_TOKEN"}}));
    REQUIRE(token.IsOk());
    CHECK(FirstText(token.Value()) == "secret-123");
}

TEST_CASE("ServerConnection: RPC error keeps the process", "[rpc][connection]") {
    ServerConnection conn("fake", FakeServer(), ShortTimeouts());
    auto r = conn.SendRequest("tools/call", CallTool("missing_tool", nlohmann::json::object()));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::RpcError);
    CHECK(r.Error().target == "fake");
    CHECK(r.Error().message.find("Unknown tool: missing_tool") != std::string::npos);
    auto pid = conn.ProcessId();
    CHECK(conn.State() == ConnectionState::Initialized);

    auto again = conn.SendRequest("ping", nlohmann::json::object());
    REQUIRE(again.IsOk());
    CHECK(conn.ProcessId() == pid);
}

TEST_CASE("ServerConnection: timeout kills, next request restarts", "[rpc][connection]") {
    ConnectionOptions options = ShortTimeouts();
    options.request_timeout = std::chrono::seconds(1);
    ServerConnection conn("slow", FakeServer({"--hang-on", "echo"}), options);

    REQUIRE(conn.EnsureRunning().IsOk());
    auto first_pid = conn.ProcessId();

    auto r = conn.SendRequest("tools/call", CallTool("echo", {{"text", "x"}}));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Timeout);
    CHECK(r.Error().message == "MCP server 'slow' timed out");
    REQUIRE(r.Error().detail.has_value());
    CHECK(r.Error().detail->find("hanging on echo") != std::string::npos);
    CHECK(conn.State() == ConnectionState::Stopped);
    auto id_after_timeout = conn.LastRequestId();

    auto next = conn.SendRequest("tools/call", CallTool("add", {{"a", 1}, {"b", 1}}));
    REQUIRE(next.IsOk());
    CHECK(FirstText(next.Value()) == "2");
    CHECK(conn.ProcessId() != first_pid);
    CHECK(conn.LastRequestId() > id_after_timeout);
}

TEST_CASE("ServerConnection: server exit during a call", "[rpc][connection]") {
    ServerConnection conn("crashy", FakeServer({"--exit-on", "echo"}), ShortTimeouts());
    auto r = conn.SendRequest("tools/call", CallTool("echo", {{"text", "x"}}));
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::ProcessExited);
    CHECK(conn.State() == ConnectionState::Stopped);

    auto next = conn.SendRequest("ping", nlohmann::json::object());
    CHECK(next.IsOk());
}

TEST_CASE("ServerConnection: failed initialize reports stderr", "[rpc][connection]") {
    ServerConnection conn("broken", FakeServer({"--fail-init"}), ShortTimeouts());
    auto r = conn.EnsureRunning();
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Initialization);
    CHECK(r.Error().message.rfind("Init failed for broken", 0) == 0);
    REQUIRE(r.Error().detail.has_value());
    CHECK(r.Error().detail->rfind("Stderr:", 0) == 0);
    CHECK(r.Error().detail->find("missing credentials") != std::string::npos);
    CHECK(conn.State() == ConnectionState::Stopped);
}

TEST_CASE("ServerConnection: unknown executable", "[rpc][connection]") {
    ServerConfig config;
    config.command = "/nonexistent/tool-server";
    ServerConnection conn("ghost", config, ShortTimeouts());
    auto r = conn.SendRequest("tools/list", nlohmann::json::object());
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Initialization);
}

TEST_CASE("ServerConnection: Shutdown stops the child", "[rpc][connection]") {
    ServerConnection conn("fake", FakeServer(), ShortTimeouts());
    REQUIRE(conn.EnsureRunning().IsOk());
    conn.Shutdown();
    CHECK(conn.State() == ConnectionState::Stopped);
    CHECK(conn.ProcessId() == -1);
    conn.Shutdown();
}
