#pragma once

#include <agent_relay/agent/busy_registry.hpp>
#include <agent_relay/agent/message_channel.hpp>
#include <agent_relay/agent/model_client.hpp>
#include <agent_relay/approval/approval_gate.hpp>
#include <agent_relay/store/i_conversation_store.hpp>
#include <agent_relay/tools/capability_registry.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstddef>
#include <string>

namespace agent_relay {

enum class TurnOutcome {
    EndTurn,
    MaxRoundsExceeded,
    UnexpectedStop,
    Busy,
    Failed,
};

const char* TurnOutcomeName(TurnOutcome outcome);

struct TurnResult {
    TurnOutcome outcome = TurnOutcome::Failed;
    std::string conversation_id;
    // Model calls made during the turn.
    int rounds = 0;
    // Final text sent to the principal (reply, notice or error).
    std::string reply;
};

struct OrchestratorOptions {
    std::string system_prompt;
    int max_rounds = 10;
    std::size_t max_history_messages = 50;
    std::chrono::minutes idle_timeout{60};
    std::string acknowledgement = "On it - give me a minute to work through that...";
};

// ---------------------------------------------------------------------------
// TurnOrchestrator: drives one user turn: model call, tool dispatch (with
// approval where a capability asks for it), results fed back, until the
// model ends the turn or the round ceiling is hit.
//
// Every failure is caught here and reported to the principal; nothing
// escapes HandleUserTurn.
// ---------------------------------------------------------------------------
class TurnOrchestrator {
public:
    TurnOrchestrator(IConversationStore& store,
                     IModelClient& model,
                     const CapabilityRegistry& capabilities,
                     ApprovalGate& approvals,
                     IMessageChannel& channel,
                     IBusyRegistry& busy,
                     OrchestratorOptions options);

    /// content is a string or an array of content blocks.
    TurnResult HandleUserTurn(const std::string& principal, const nlohmann::json& content);

    [[nodiscard]] const OrchestratorOptions& Options() const noexcept { return options_; }

private:
    Result<TurnResult, Error> RunTurn(const std::string& principal,
                                      const std::string& conversation_id,
                                      const nlohmann::json& content);

    std::string RunInvocation(const std::string& principal,
                              const std::string& conversation_id,
                              const ToolInvocation& invocation);

    void Reply(const std::string& principal, const std::string& text);

    IConversationStore& store_;
    IModelClient& model_;
    const CapabilityRegistry& capabilities_;
    ApprovalGate& approvals_;
    IMessageChannel& channel_;
    IBusyRegistry& busy_;
    OrchestratorOptions options_;
};

} // namespace agent_relay
