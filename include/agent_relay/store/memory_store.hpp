#pragma once

#include <agent_relay/approval/i_approval_store.hpp>
#include <agent_relay/store/i_conversation_store.hpp>

#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agent_relay {

// ---------------------------------------------------------------------------
// MemoryStore: in-process conversation and approval store.
//
// With a snapshot path every mutation rewrites a JSON snapshot (write to a
// temp file, then rename), and Open() loads it back, so messages and pending
// approvals survive a restart.
// ---------------------------------------------------------------------------
class MemoryStore : public IConversationStore, public IApprovalStore {
public:
    explicit MemoryStore(NowFn now = nullptr);

    /// Loads an existing snapshot (missing file = empty store) and persists
    /// every later mutation to it.
    static Result<std::unique_ptr<MemoryStore>, Error> Open(const std::string& snapshot_path,
                                                            NowFn now = nullptr);

    // IConversationStore
    Result<Conversation, Error> GetOrCreateActive(
        const std::string& principal, std::chrono::minutes idle_timeout) override;
    Result<void, Error> Reset(const std::string& principal) override;
    Result<TurnMessage, Error> Append(
        const std::string& conversation_id,
        MessageRole role,
        const nlohmann::json& content,
        const std::optional<std::string>& invocation_id = std::nullopt,
        const std::optional<std::string>& tool_name = std::nullopt) override;
    [[nodiscard]] Result<std::vector<TurnMessage>, Error> ReadAll(
        const std::string& conversation_id) const override;
    Result<void, Error> TouchActivity(const std::string& conversation_id) override;

    // IApprovalStore
    Result<void, Error> InsertApproval(const ApprovalRequest& request) override;
    [[nodiscard]] std::optional<ApprovalRequest> FindApproval(
        const std::string& token) const override;
    bool CompareAndSetStatus(const std::string& token,
                             ApprovalStatus expected,
                             ApprovalStatus next,
                             TimePoint when) override;

    [[nodiscard]] std::optional<Conversation> FindConversation(const std::string& id) const;

    [[nodiscard]] nlohmann::json ToJson() const;

private:
    Result<void, Error> LoadJson(const nlohmann::json& snapshot);
    Result<void, Error> PersistLocked() const;
    [[nodiscard]] nlohmann::json SnapshotLocked() const;
    std::string NextConversationIdLocked();

    NowFn now_;
    std::optional<std::string> snapshot_path_;

    mutable std::mutex mutex_;
    std::map<std::string, Conversation> conversations_;
    std::map<std::string, std::vector<TurnMessage>> messages_;
    std::map<std::string, ApprovalRequest> approvals_;
    std::int64_t next_sequence_ = 1;
    std::int64_t next_conversation_ = 1;
};

} // namespace agent_relay
