#pragma once

#include <agent_relay/agent/message_channel.hpp>
#include <agent_relay/agent/turn_orchestrator.hpp>
#include <agent_relay/approval/approval_gate.hpp>
#include <agent_relay/store/i_conversation_store.hpp>

#include <atomic>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace agent_relay {

enum class RouteOutcome {
    Rejected,     // principal not authorised
    Ignored,      // empty message
    Reset,
    Decision,     // APPROVE / DENY handled
    TurnStarted,
};

const char* RouteOutcomeName(RouteOutcome outcome);

// ---------------------------------------------------------------------------
// InboundRouter: entry point for messages from the principal.
//
// Recognises "/reset" and "APPROVE <token>" / "DENY <token>" (any case) and
// answers them inline; everything else becomes a user turn on its own
// worker thread, so a pending approval never blocks the decision that
// resolves it.
// ---------------------------------------------------------------------------
class InboundRouter {
public:
    InboundRouter(std::string authorized_principal,
                  TurnOrchestrator& orchestrator,
                  ApprovalGate& approvals,
                  IConversationStore& store,
                  IMessageChannel& channel);
    ~InboundRouter();

    InboundRouter(const InboundRouter&) = delete;
    InboundRouter& operator=(const InboundRouter&) = delete;

    RouteOutcome Route(const std::string& principal, const std::string& text);

    /// Joins every turn started so far.
    void WaitIdle();

    /// Turn threads not yet joined. Finished ones are reaped on the next
    /// Route that starts a turn.
    [[nodiscard]] std::size_t TrackedWorkers();

private:
    void HandleDecision(const std::string& principal, const std::string& text);
    void HandleReset(const std::string& principal);
    void Reply(const std::string& principal, const std::string& text);
    void ReapFinishedLocked();

    struct Worker {
        std::thread thread;
        std::shared_ptr<std::atomic<bool>> done;
    };

    std::string authorized_principal_;
    TurnOrchestrator& orchestrator_;
    ApprovalGate& approvals_;
    IConversationStore& store_;
    IMessageChannel& channel_;

    std::mutex workers_mutex_;
    std::vector<Worker> workers_;
};

} // namespace agent_relay
