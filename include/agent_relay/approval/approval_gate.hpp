#pragma once

#include <agent_relay/agent/message_channel.hpp>
#include <agent_relay/approval/i_approval_store.hpp>
#include <agent_relay/core/clock.hpp>
#include <agent_relay/core/result.hpp>
#include <agent_relay/core/types.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <optional>
#include <string>

namespace agent_relay {

struct ApprovalOptions {
    std::chrono::seconds timeout{300};
    std::chrono::milliseconds poll_interval{2000};
};

// Outcome of an inbound APPROVE / DENY.
enum class DecisionOutcome {
    Recorded,
    NotFound,
    AlreadyHandled,
    Expired,
};

// ---------------------------------------------------------------------------
// ApprovalGate: records an approval request, prompts the human, and waits
// for the decision by polling the store. Every request is terminal once its
// timeout has elapsed, whether or not anyone answers.
// ---------------------------------------------------------------------------
class ApprovalGate {
public:
    ApprovalGate(IApprovalStore& store,
                 IMessageChannel& channel,
                 ApprovalOptions options = {},
                 NowFn now = nullptr,
                 SleepFn sleep = nullptr);

    /// Persists a pending request (expiry = now + timeout) and sends the
    /// approval prompt to the principal.
    Result<ApprovalToken, Error> Request(const std::string& conversation_id,
                                         const std::string& principal,
                                         const std::string& tool_name,
                                         const nlohmann::json& input,
                                         const std::string& description);

    /// Blocks until the request is terminal or `timeout` elapses; on elapse
    /// the request is expired with compare-and-set so a decision that lands
    /// first still wins. Returns the terminal status.
    ApprovalStatus AwaitDecision(const ApprovalToken& token, std::chrono::seconds timeout);

    /// AwaitDecision with the configured timeout.
    ApprovalStatus AwaitDecision(const ApprovalToken& token) {
        return AwaitDecision(token, options_.timeout);
    }

    /// Inbound decision. A late answer after the expiry time expires the
    /// request instead of recording it.
    DecisionOutcome Decide(const std::string& token, bool approved);

    /// Current status; a pending request past its expiry reads as expired.
    std::optional<ApprovalStatus> Status(const std::string& token);

    [[nodiscard]] const ApprovalOptions& Options() const noexcept { return options_; }

private:
    void NotifyExpired(const ApprovalRequest& request);

    IApprovalStore& store_;
    IMessageChannel& channel_;
    ApprovalOptions options_;
    NowFn now_;
    SleepFn sleep_;
};

} // namespace agent_relay
