#include <catch2/catch_test_macros.hpp>

#include <agent_relay/agent/console_channel.hpp>
#include <agent_relay/core/ansi.hpp>

#include <sstream>
#include <string>

using namespace agent_relay;

TEST_CASE("ConsoleChannel: plain text", "[console]") {
    std::ostringstream out;
    ConsoleChannel channel(out);
    REQUIRE(channel.SendText("console", "Hello there").IsOk());
    CHECK(out.str() == "assistant> Hello there\n");
}

TEST_CASE("ConsoleChannel: approval prompt", "[console]") {
    std::ostringstream out;
    ConsoleChannel channel(out);
    REQUIRE(channel.SendApprovalRequest("console", "Run command:\nrm -rf build", "AB12CD34")
                .IsOk());
    CHECK(out.str() ==
          "Approval required [AB12CD34]\nRun command:\nrm -rf build\n\n"
          "Reply APPROVE AB12CD34 or DENY AB12CD34\n");
}

TEST_CASE("ConsoleChannel: media with and without caption", "[console]") {
    std::ostringstream out;
    ConsoleChannel channel(out);
    REQUIRE(channel.SendMedia("console", "https://x/cat.png", "A cat").IsOk());
    REQUIRE(channel.SendMedia("console", "https://x/dog.png", "").IsOk());
    CHECK(out.str() == "[media] https://x/cat.png\nA cat\n[media] https://x/dog.png\n");
}

TEST_CASE("ConsoleChannel: colored prefix", "[console]") {
    std::ostringstream out;
    ConsoleChannel channel(out, true);
    REQUIRE(channel.SendText("console", "hi").IsOk());
    CHECK(out.str() == std::string(ansi::kCyan) + "assistant> " + ansi::kReset + "hi\n");
}

TEST_CASE("ConsoleChannel: failed stream is an error", "[console]") {
    std::ostringstream out;
    out.setstate(std::ios::badbit);
    ConsoleChannel channel(out);
    auto r = channel.SendText("console", "lost");
    REQUIRE(r.IsErr());
    CHECK(r.Error().category == ErrorCategory::Internal);
}
