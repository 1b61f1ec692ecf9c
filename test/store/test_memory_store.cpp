#include <catch2/catch_test_macros.hpp>

#include <agent_relay/store/memory_store.hpp>

#include "../mocks/fake_clock.hpp"

#include <chrono>
#include <filesystem>
#include <fstream>
#include <string>

#include <unistd.h>

using namespace agent_relay;
using agent_relay::testing::FakeClock;
using namespace std::chrono_literals;

namespace {

std::string SnapshotPath(const std::string& tag) {
    return (std::filesystem::temp_directory_path() /
            ("agent_relay_store_" + tag + "_" + std::to_string(::getpid()) + ".json"))
        .string();
}

ApprovalRequest PendingApproval(const std::string& token, TimePoint now) {
    ApprovalRequest request;
    request.token = token;
    request.conversation_id = "conv-1";
    request.principal = "alice";
    request.tool_name = "write_file";
    request.input_json = R"({"file_path":"/tmp/x"})";
    request.description = "Write file:\n/tmp/x (0 chars)";
    request.created_at = now;
    request.expires_at = now + 300s;
    return request;
}

} // anonymous namespace

// ===========================================================================
// Conversations
// ===========================================================================

TEST_CASE("MemoryStore: one active conversation per principal", "[store]") {
    FakeClock clock;
    MemoryStore store(clock.NowFunction());

    auto a = store.GetOrCreateActive("alice", 60min);
    auto again = store.GetOrCreateActive("alice", 60min);
    auto b = store.GetOrCreateActive("bob", 60min);
    REQUIRE(a.IsOk());
    REQUIRE(again.IsOk());
    REQUIRE(b.IsOk());
    CHECK(a.Value().id == again.Value().id);
    CHECK(a.Value().id != b.Value().id);
    CHECK(a.Value().active);
    CHECK(a.Value().principal == "alice");
}

TEST_CASE("MemoryStore: idle conversation is replaced", "[store]") {
    FakeClock clock;
    MemoryStore store(clock.NowFunction());
    auto first = store.GetOrCreateActive("alice", 60min).Value();

    clock.Advance(60min);
    CHECK(store.GetOrCreateActive("alice", 60min).Value().id == first.id);

    clock.Advance(60min + 1ms);
    auto second = store.GetOrCreateActive("alice", 60min).Value();
    CHECK(second.id != first.id);
    REQUIRE(store.FindConversation(first.id).has_value());
    CHECK_FALSE(store.FindConversation(first.id)->active);
}

TEST_CASE("MemoryStore: activity keeps a conversation alive", "[store]") {
    FakeClock clock;
    MemoryStore store(clock.NowFunction());
    auto conv = store.GetOrCreateActive("alice", 60min).Value();

    clock.Advance(50min);
    REQUIRE(store.Append(conv.id, MessageRole::User, "still here").IsOk());
    clock.Advance(50min);
    REQUIRE(store.TouchActivity(conv.id).IsOk());
    clock.Advance(50min);
    CHECK(store.GetOrCreateActive("alice", 60min).Value().id == conv.id);
}

TEST_CASE("MemoryStore: Reset starts over", "[store]") {
    FakeClock clock;
    MemoryStore store(clock.NowFunction());
    auto first = store.GetOrCreateActive("alice", 60min).Value();
    REQUIRE(store.Reset("alice").IsOk());
    REQUIRE(store.Reset("nobody").IsOk());

    auto second = store.GetOrCreateActive("alice", 60min).Value();
    CHECK(second.id != first.id);
    REQUIRE(store.ReadAll(second.id).IsOk());
    CHECK(store.ReadAll(second.id).Value().empty());
}

TEST_CASE("MemoryStore: Append assigns increasing sequences", "[store]") {
    FakeClock clock;
    MemoryStore store(clock.NowFunction());
    auto conv = store.GetOrCreateActive("alice", 60min).Value();

    auto m1 = store.Append(conv.id, MessageRole::User, "list my files");
    auto m2 = store.Append(conv.id, MessageRole::Assistant,
                           nlohmann::json::array({{{"type", "tool_use"}, {"id", "t1"},
                                                   {"name", "execute_bash"},
                                                   {"input", {{"command", "ls"}}}}}));
    auto m3 = store.Append(conv.id, MessageRole::ToolResult, "a.txt", std::string("t1"),
                           std::string("execute_bash"));
    REQUIRE(m1.IsOk());
    REQUIRE(m2.IsOk());
    REQUIRE(m3.IsOk());
    CHECK(m1.Value().sequence < m2.Value().sequence);
    CHECK(m2.Value().sequence < m3.Value().sequence);

    auto log = store.ReadAll(conv.id);
    REQUIRE(log.IsOk());
    REQUIRE(log.Value().size() == 3);
    CHECK(log.Value()[0].role == MessageRole::User);
    CHECK(log.Value()[1].content[0]["name"] == "execute_bash");
    CHECK(log.Value()[2].invocation_id == std::optional<std::string>("t1"));
    CHECK(log.Value()[2].tool_name == std::optional<std::string>("execute_bash"));
}

TEST_CASE("MemoryStore: unknown conversation", "[store]") {
    MemoryStore store;
    auto appended = store.Append("conv-404", MessageRole::User, "hi");
    REQUIRE(appended.IsErr());
    CHECK(appended.Error().category == ErrorCategory::NotFound);
    CHECK(store.ReadAll("conv-404").IsErr());
    CHECK(store.TouchActivity("conv-404").IsErr());
}

// ===========================================================================
// Approvals
// ===========================================================================

TEST_CASE("MemoryStore: approval compare-and-set", "[store]") {
    FakeClock clock;
    MemoryStore store(clock.NowFunction());
    REQUIRE(store.InsertApproval(PendingApproval("AB12CD34", clock.Now())).IsOk());
    CHECK(store.InsertApproval(PendingApproval("AB12CD34", clock.Now())).IsErr());

    auto when = clock.Now() + 5s;
    CHECK(store.CompareAndSetStatus("AB12CD34", ApprovalStatus::Pending,
                                    ApprovalStatus::Approved, when));
    CHECK_FALSE(store.CompareAndSetStatus("AB12CD34", ApprovalStatus::Pending,
                                          ApprovalStatus::Expired, when));
    CHECK_FALSE(store.CompareAndSetStatus("00000000", ApprovalStatus::Pending,
                                          ApprovalStatus::Denied, when));

    auto record = store.FindApproval("AB12CD34");
    REQUIRE(record.has_value());
    CHECK(record->status == ApprovalStatus::Approved);
    CHECK(record->decided_at == std::optional<TimePoint>(when));
}

// ===========================================================================
// Snapshot
// ===========================================================================

TEST_CASE("MemoryStore: snapshot survives a restart", "[store][snapshot]") {
    auto path = SnapshotPath("restart");
    std::filesystem::remove(path);
    FakeClock clock;

    std::string conversation_id;
    {
        auto opened = MemoryStore::Open(path, clock.NowFunction());
        REQUIRE(opened.IsOk());
        auto store = std::move(opened).Value();
        conversation_id = store->GetOrCreateActive("alice", 60min).Value().id;
        REQUIRE(store->Append(conversation_id, MessageRole::User, "remember me").IsOk());
        REQUIRE(store->InsertApproval(PendingApproval("0F0F0F0F", clock.Now())).IsOk());
    }
    REQUIRE(std::filesystem::exists(path));

    auto reopened = MemoryStore::Open(path, clock.NowFunction());
    REQUIRE(reopened.IsOk());
    auto store = std::move(reopened).Value();

    CHECK(store->GetOrCreateActive("alice", 60min).Value().id == conversation_id);
    auto log = store->ReadAll(conversation_id);
    REQUIRE(log.IsOk());
    REQUIRE(log.Value().size() == 1);
    CHECK(log.Value()[0].content == "remember me");

    auto approval = store->FindApproval("0F0F0F0F");
    REQUIRE(approval.has_value());
    CHECK(approval->status == ApprovalStatus::Pending);
    CHECK(approval->expires_at == clock.Now() + 300s);

    // New ids continue after the restored ones.
    auto next = store->Append(conversation_id, MessageRole::Assistant, "ok");
    REQUIRE(next.IsOk());
    CHECK(next.Value().sequence > log.Value()[0].sequence);
    REQUIRE(store->Reset("alice").IsOk());
    CHECK(store->GetOrCreateActive("alice", 60min).Value().id != conversation_id);

    std::filesystem::remove(path);
}

TEST_CASE("MemoryStore: invalid UTF-8 tool output still persists", "[store][snapshot]") {
    auto path = SnapshotPath("latin1");
    std::filesystem::remove(path);
    FakeClock clock;

    std::string conversation_id;
    {
        auto opened = MemoryStore::Open(path, clock.NowFunction());
        REQUIRE(opened.IsOk());
        auto store = std::move(opened).Value();
        conversation_id = store->GetOrCreateActive("alice", 60min).Value().id;

        auto appended = store->Append(conversation_id, MessageRole::ToolResult,
                                      "STDOUT:\n\xff\xfe latin1 caf\xe9");
        REQUIRE(appended.IsOk());
        REQUIRE(store->Append(conversation_id, MessageRole::Assistant, "done").IsOk());
        REQUIRE(store->Reset("alice").IsOk());
    }

    auto reopened = MemoryStore::Open(path, clock.NowFunction());
    REQUIRE(reopened.IsOk());
    auto log = reopened.Value()->ReadAll(conversation_id);
    REQUIRE(log.IsOk());
    REQUIRE(log.Value().size() == 2);
    CHECK(log.Value()[0].content.get<std::string>().find("latin1 caf") != std::string::npos);
    CHECK(log.Value()[1].content == "done");
    CHECK(reopened.Value()->GetOrCreateActive("alice", 60min).Value().id != conversation_id);

    std::filesystem::remove(path);
}

TEST_CASE("MemoryStore: corrupt snapshot is a configuration error", "[store][snapshot]") {
    auto path = SnapshotPath("corrupt");
    std::ofstream(path) << "{ not json";
    auto opened = MemoryStore::Open(path);
    REQUIRE(opened.IsErr());
    CHECK(opened.Error().category == ErrorCategory::Configuration);
    std::filesystem::remove(path);
}

TEST_CASE("MemoryStore: ToJson layout", "[store][snapshot]") {
    FakeClock clock;
    MemoryStore store(clock.NowFunction());
    auto conv = store.GetOrCreateActive("alice", 60min).Value();
    REQUIRE(store.Append(conv.id, MessageRole::User, "hi").IsOk());

    auto j = store.ToJson();
    CHECK(j["version"] == 1);
    CHECK(j["conversations"].size() == 1);
    CHECK(j["messages"][0]["role"] == "user");
    CHECK(j["approvals"].empty());
}
