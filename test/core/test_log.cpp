#include <catch2/catch_test_macros.hpp>

#include <agent_relay/core/log.hpp>

#include <algorithm>
#include <cstdio>
#include <fstream>
#include <memory>
#include <sstream>
#include <string>
#include <thread>
#include <vector>

#include <unistd.h>

using namespace agent_relay;

// ===========================================================================
// Helper: a sink that keeps every line it receives.
// ===========================================================================

struct CapturedLine {
    LogLevel level;
    std::string component;
    std::string message;
};

class CaptureSink : public ILogSink {
public:
    void Write(LogLevel level, std::string_view component,
               std::string_view message) override {
        lines.push_back({level, std::string(component), std::string(message)});
    }

    std::vector<CapturedLine> lines;
};

namespace {

std::string TempLogPath(const std::string& name) {
    return "/tmp/agent_relay_test_" + name + "_" + std::to_string(::getpid()) + ".log";
}

std::string ReadFile(const std::string& path) {
    std::ifstream in(path);
    std::ostringstream buf;
    buf << in.rdbuf();
    return buf.str();
}

} // anonymous namespace

// ===========================================================================
// JsonSink
// ===========================================================================

TEST_CASE("JsonSink: one JSON object per line", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Info, "mcp:notes", "initialized");
    sink.Write(LogLevel::Warn, "approval", "expired");

    auto output = oss.str();
    CHECK(std::count(output.begin(), output.end(), '\n') == 2);
    CHECK(output.find("\"level\":\"INFO\"") != std::string::npos);
    CHECK(output.find("\"component\":\"mcp:notes\"") != std::string::npos);
    CHECK(output.find("\"message\":\"initialized\"") != std::string::npos);
    CHECK(output.find("\"level\":\"WARN\"") != std::string::npos);
    CHECK(output.find("\"ts\":\"") != std::string::npos);
}

TEST_CASE("JsonSink: escapes quotes, newlines and backslashes", "[log]") {
    std::ostringstream oss;
    JsonSink sink(oss);

    sink.Write(LogLevel::Error, "shell", "ran \"rm\"\nexit\\1");

    auto output = oss.str();
    CHECK(output.find("\\\"rm\\\"") != std::string::npos);
    CHECK(output.find("\\n") != std::string::npos);
    CHECK(output.find("exit\\\\1") != std::string::npos);
}

// ===========================================================================
// Logger
// ===========================================================================

TEST_CASE("Logger: filters below the minimum level", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* captured = sink.get();
    Logger logger(std::move(sink), LogLevel::Warn);

    logger.Debug("turn", "round 1");
    logger.Info("turn", "executing read_file");
    logger.Warn("turn", "duplicate tool_use id");
    logger.Error("turn", "model failed");

    REQUIRE(captured->lines.size() == 2);
    CHECK(captured->lines[0].level == LogLevel::Warn);
    CHECK(captured->lines[1].component == "turn");
    CHECK(captured->lines[1].message == "model failed");
}

TEST_CASE("Logger: SetLevel and IsEnabled", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* captured = sink.get();
    Logger logger(std::move(sink), LogLevel::Error);

    CHECK_FALSE(logger.IsEnabled(LogLevel::Debug));
    logger.Info("pool", "filtered");
    CHECK(captured->lines.empty());

    logger.SetLevel(LogLevel::Debug);
    CHECK(logger.IsEnabled(LogLevel::Debug));
    logger.Debug("pool", "now visible");
    REQUIRE(captured->lines.size() == 1);
    CHECK(captured->lines[0].message == "now visible");
}

TEST_CASE("Logger: concurrent writers lose no lines", "[log]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* captured = sink.get();
    Logger logger(std::move(sink), LogLevel::Debug);

    constexpr int kThreads = 6;
    constexpr int kPerThread = 100;
    std::vector<std::thread> threads;
    for (int t = 0; t < kThreads; ++t) {
        threads.emplace_back([&logger, t]() {
            for (int i = 0; i < kPerThread; ++i) {
                logger.Info("worker-" + std::to_string(t), std::to_string(i));
            }
        });
    }
    for (auto& th : threads) {
        th.join();
    }

    CHECK(captured->lines.size() == kThreads * kPerThread);
}

// ===========================================================================
// ColorConsoleSink
// ===========================================================================

TEST_CASE("ColorConsoleSink: plain mode has no escape codes", "[log]") {
    std::ostringstream oss;
    ColorConsoleSink sink(false, oss);

    sink.Write(LogLevel::Info, "rpc", "-> tools/list");

    auto output = oss.str();
    CHECK(output.find("[INFO]") != std::string::npos);
    CHECK(output.find("[rpc]") != std::string::npos);
    CHECK(output.find("-> tools/list") != std::string::npos);
    CHECK(output.find("\033[") == std::string::npos);
}

TEST_CASE("ColorConsoleSink: levels are colored differently", "[log]") {
    std::ostringstream warn_oss;
    std::ostringstream error_oss;
    ColorConsoleSink warn_sink(true, warn_oss);
    ColorConsoleSink error_sink(true, error_oss);

    warn_sink.Write(LogLevel::Warn, "approval", "prompt not delivered");
    error_sink.Write(LogLevel::Error, "mcp:notes", "timed out");

    CHECK(warn_oss.str().find("\033[33m") != std::string::npos);
    CHECK(error_oss.str().find("\033[1;31m") != std::string::npos);
    CHECK(error_oss.str().back() == '\n');
}

// ===========================================================================
// FileSink / TeeSink
// ===========================================================================

TEST_CASE("FileSink: appends lines to the file", "[log][file]") {
    const auto path = TempLogPath("file_sink");
    std::remove(path.c_str());
    {
        FileSink sink(path);
        REQUIRE(sink.IsOpen());
        sink.Write(LogLevel::Info, "store", "snapshot written");
    }
    {
        FileSink sink(path);
        sink.Write(LogLevel::Error, "store", "rename failed");
    }

    auto content = ReadFile(path);
    CHECK(content.find("snapshot written") != std::string::npos);
    CHECK(content.find("rename failed") != std::string::npos);
    CHECK(std::count(content.begin(), content.end(), '\n') == 2);
    std::remove(path.c_str());
}

TEST_CASE("FileSink: unopenable path reports closed", "[log][file]") {
    FileSink sink("/nonexistent-dir/agent-relay/log.txt");
    CHECK_FALSE(sink.IsOpen());
    sink.Write(LogLevel::Info, "x", "dropped");
}

TEST_CASE("TeeSink: forwards to both sinks", "[log]") {
    auto first = std::make_unique<CaptureSink>();
    auto second = std::make_unique<CaptureSink>();
    auto* first_ptr = first.get();
    auto* second_ptr = second.get();

    TeeSink tee(std::move(first), std::move(second));
    tee.Write(LogLevel::Debug, "history", "dropping orphaned tool_result");

    REQUIRE(first_ptr->lines.size() == 1);
    REQUIRE(second_ptr->lines.size() == 1);
    CHECK(second_ptr->lines[0].message == "dropping orphaned tool_result");
}

// ===========================================================================
// Global logger
// ===========================================================================

TEST_CASE("GlobalLogger: free functions reach the installed sink", "[log][global]") {
    auto sink = std::make_unique<CaptureSink>();
    auto* captured = sink.get();
    InitGlobalLogger(std::move(sink), LogLevel::Info);

    LogDebug("router", "filtered");
    LogInfo("router", "turn finished");
    LogError("router", "reply lost");

    REQUIRE(captured->lines.size() == 2);
    CHECK(captured->lines[0].message == "turn finished");
    CHECK(captured->lines[1].level == LogLevel::Error);

    InitGlobalLogger(std::make_unique<CaptureSink>(), LogLevel::Error);
}
