#include <catch2/catch_test_macros.hpp>

#include <agent_relay/agent/inbound_router.hpp>
#include <agent_relay/store/memory_store.hpp>

#include "../mocks/mock_model_client.hpp"
#include "../mocks/recording_channel.hpp"

#include <algorithm>
#include <cctype>
#include <chrono>
#include <future>
#include <memory>
#include <string>
#include <thread>
#include <vector>

using namespace agent_relay;
using agent_relay::testing::MockModelClient;
using agent_relay::testing::RecordingChannel;
using agent_relay::testing::SentApproval;
using namespace std::chrono_literals;

namespace {

class GatedCapability : public ICapability {
public:
    explicit GatedCapability(int& runs) : runs_(runs) {}

    [[nodiscard]] CapabilityKind Kind() const override { return CapabilityKind::FileWrite; }
    [[nodiscard]] CapabilityDescriptor Describe() const override {
        return {"write_note", "Write a note", {{"type", "object"}}};
    }
    [[nodiscard]] bool AlwaysNeedsApproval() const override { return true; }
    std::string Execute(const nlohmann::json&) override {
        ++runs_;
        return "written";
    }

private:
    int& runs_;
};

std::string ToLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

// Real clock, short poll: turns run on router worker threads.
struct RouterFixture {
    MemoryStore store;
    MockModelClient model;
    RecordingChannel channel;
    BusyRegistry busy;
    CapabilityRegistry registry;
    int runs = 0;
    ApprovalGate gate{store, channel, ApprovalOptions{30s, 10ms}};
    std::unique_ptr<TurnOrchestrator> orchestrator;
    std::unique_ptr<InboundRouter> router;

    RouterFixture() {
        REQUIRE(registry.Register(std::make_unique<GatedCapability>(runs)).IsOk());
        orchestrator = std::make_unique<TurnOrchestrator>(store, model, registry, gate,
                                                          channel, busy,
                                                          OrchestratorOptions{});
        router = std::make_unique<InboundRouter>("alice", *orchestrator, gate, store, channel);
    }

    ApprovalToken PendingToken() {
        auto token = gate.Request("conv-x", "alice", "write_note", nlohmann::json::object(),
                                  "Write a note");
        REQUIRE(token.IsOk());
        return token.Value();
    }
};

bool WaitForReplies(const RecordingChannel& channel, std::size_t count) {
    for (int i = 0; i < 500; ++i) {
        if (channel.TextBodies().size() >= count) return true;
        std::this_thread::sleep_for(10ms);
    }
    return false;
}

} // anonymous namespace

// ===========================================================================
// Filtering
// ===========================================================================

TEST_CASE("InboundRouter: unauthorised principal is rejected silently", "[router]") {
    RouterFixture f;
    CHECK(f.router->Route("mallory", "hello") == RouteOutcome::Rejected);
    CHECK(f.router->Route("mallory", "APPROVE AB12CD34") == RouteOutcome::Rejected);
    f.router->WaitIdle();
    CHECK(f.channel.Texts().empty());
    CHECK(f.model.CallCount() == 0);
}

TEST_CASE("InboundRouter: blank message is ignored", "[router]") {
    RouterFixture f;
    CHECK(f.router->Route("alice", "   \n") == RouteOutcome::Ignored);
    CHECK(f.channel.Texts().empty());
}

TEST_CASE("InboundRouter: /reset in any case", "[router]") {
    RouterFixture f;
    auto first = f.store.GetOrCreateActive("alice", 60min).Value();

    CHECK(f.router->Route("alice", "  /Reset ") == RouteOutcome::Reset);
    CHECK(f.channel.TextBodies() ==
          std::vector<std::string>{"Conversation reset. Starting fresh!"});
    CHECK(f.store.GetOrCreateActive("alice", 60min).Value().id != first.id);
}

// ===========================================================================
// Decisions
// ===========================================================================

TEST_CASE("InboundRouter: approve with a lowercase token", "[router]") {
    RouterFixture f;
    auto token = f.PendingToken();

    CHECK(f.router->Route("alice", "approve " + ToLower(token.Value())) ==
          RouteOutcome::Decision);
    CHECK(f.channel.TextBodies().back() == "✅ Request " + token.Value() + " approved.");
    CHECK(f.gate.Status(token.Value()) ==
          std::optional<ApprovalStatus>(ApprovalStatus::Approved));
}

TEST_CASE("InboundRouter: deny", "[router]") {
    RouterFixture f;
    auto token = f.PendingToken();
    CHECK(f.router->Route("alice", "DENY " + token.Value()) == RouteOutcome::Decision);
    CHECK(f.channel.TextBodies().back() == "❌ Request " + token.Value() + " denied.");
}

TEST_CASE("InboundRouter: second decision is already handled", "[router]") {
    RouterFixture f;
    auto token = f.PendingToken();
    f.router->Route("alice", "APPROVE " + token.Value());
    f.router->Route("alice", "DENY " + token.Value());
    CHECK(f.channel.TextBodies().back() ==
          "Approval " + token.Value() + " not found or already handled.");
    CHECK(f.gate.Status(token.Value()) ==
          std::optional<ApprovalStatus>(ApprovalStatus::Approved));
}

TEST_CASE("InboundRouter: malformed decisions", "[router]") {
    RouterFixture f;
    CHECK(f.router->Route("alice", "APPROVE") == RouteOutcome::Decision);
    CHECK(f.channel.TextBodies().back() == "Invalid format. Use: APPROVE <id> or DENY <id>");

    f.router->Route("alice", "approve AB12CD34 please");
    CHECK(f.channel.TextBodies().back() == "Invalid format. Use: APPROVE <id> or DENY <id>");

    f.router->Route("alice", "DENY xyz");
    CHECK(f.channel.TextBodies().back() == "Approval XYZ not found or already handled.");

    f.router->Route("alice", "APPROVE 00000000");
    CHECK(f.channel.TextBodies().back() == "Approval 00000000 not found or already handled.");
    CHECK(f.model.CallCount() == 0);
}

TEST_CASE("InboundRouter: words starting with APPROVE are ordinary turns", "[router]") {
    RouterFixture f;
    f.model.EnqueueEndTurn("Sure.");
    CHECK(f.router->Route("alice", "Approvers list please") == RouteOutcome::TurnStarted);
    f.router->WaitIdle();
    CHECK(f.model.CallCount() == 1);
}

// ===========================================================================
// Turns
// ===========================================================================

TEST_CASE("InboundRouter: ordinary message starts a turn", "[router]") {
    RouterFixture f;
    f.model.EnqueueEndTurn("Hi Alice!");
    CHECK(f.router->Route("alice", "  hello  ") == RouteOutcome::TurnStarted);
    f.router->WaitIdle();

    auto requests = f.model.Requests();
    REQUIRE(requests.size() == 1);
    CHECK(requests[0].messages.back().content == "hello");
    CHECK(f.channel.TextBodies() == std::vector<std::string>{"Hi Alice!"});
}

TEST_CASE("InboundRouter: approval resolves a waiting turn", "[router]") {
    RouterFixture f;
    std::promise<std::string> prompted;
    f.channel.on_approval = [&](const SentApproval& prompt) { prompted.set_value(prompt.token); };
    f.model.EnqueueToolUse("t1", "write_note", {{"text", "buy milk"}});
    f.model.EnqueueEndTurn("Saved your note.");

    REQUIRE(f.router->Route("alice", "note: buy milk") == RouteOutcome::TurnStarted);

    auto token_future = prompted.get_future();
    REQUIRE(token_future.wait_for(10s) == std::future_status::ready);
    auto token = token_future.get();

    CHECK(f.router->Route("alice", "APPROVE " + token) == RouteOutcome::Decision);
    f.router->WaitIdle();

    CHECK(f.runs == 1);
    auto bodies = f.channel.TextBodies();
    CHECK(std::find(bodies.begin(), bodies.end(), "✅ Request " + token + " approved.") !=
          bodies.end());
    CHECK(bodies.back() == "Saved your note.");
}

TEST_CASE("InboundRouter: finished turn threads are reclaimed", "[router]") {
    RouterFixture f;
    constexpr std::size_t kTurns = 20;
    for (std::size_t i = 0; i < kTurns; ++i) {
        f.model.EnqueueEndTurn("answer " + std::to_string(i));
    }

    for (std::size_t i = 0; i < kTurns; ++i) {
        REQUIRE(f.router->Route("alice", "question " + std::to_string(i)) ==
                RouteOutcome::TurnStarted);
        REQUIRE(WaitForReplies(f.channel, i + 1));
        // Let the worker run past its reply and release the conversation.
        std::this_thread::sleep_for(20ms);
        CHECK(f.router->TrackedWorkers() <= 2);
    }

    f.router->WaitIdle();
    CHECK(f.router->TrackedWorkers() == 0);
    CHECK(f.model.CallCount() == kTurns);
    CHECK(f.channel.TextBodies().back() == "answer 19");
}

TEST_CASE("RouteOutcomeName: names", "[router]") {
    CHECK(std::string(RouteOutcomeName(RouteOutcome::TurnStarted)) == "turn_started");
    CHECK(std::string(RouteOutcomeName(RouteOutcome::Rejected)) == "rejected");
}
