#include <agent_relay/agent/inbound_router.hpp>

#include <agent_relay/core/log.hpp>
#include <agent_relay/core/types.hpp>

#include <algorithm>
#include <cctype>
#include <sstream>

namespace agent_relay {

namespace {

std::string Trim(const std::string& text) {
    auto begin = text.find_first_not_of(" \t\r\n");
    if (begin == std::string::npos) return "";
    auto end = text.find_last_not_of(" \t\r\n");
    return text.substr(begin, end - begin + 1);
}

std::string ToUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool IsDecisionCommand(const std::string& upper) {
    auto starts_with = [&](const char* word) {
        const std::string w(word);
        return upper == w || upper.rfind(w + " ", 0) == 0 || upper.rfind(w + "\t", 0) == 0;
    };
    return starts_with("APPROVE") || starts_with("DENY");
}

} // anonymous namespace

const char* RouteOutcomeName(RouteOutcome outcome) {
    switch (outcome) {
        case RouteOutcome::Rejected:    return "rejected";
        case RouteOutcome::Ignored:     return "ignored";
        case RouteOutcome::Reset:       return "reset";
        case RouteOutcome::Decision:    return "decision";
        case RouteOutcome::TurnStarted: return "turn_started";
    }
    return "ignored";
}

InboundRouter::InboundRouter(std::string authorized_principal,
                             TurnOrchestrator& orchestrator,
                             ApprovalGate& approvals,
                             IConversationStore& store,
                             IMessageChannel& channel)
    : authorized_principal_(std::move(authorized_principal)),
      orchestrator_(orchestrator),
      approvals_(approvals),
      store_(store),
      channel_(channel) {}

InboundRouter::~InboundRouter() {
    WaitIdle();
}

void InboundRouter::Reply(const std::string& principal, const std::string& text) {
    auto sent = channel_.SendText(principal, text);
    if (sent.IsErr()) {
        LogError("router", "could not deliver reply: " + sent.Error().ToString());
    }
}

RouteOutcome InboundRouter::Route(const std::string& principal, const std::string& text) {
    if (principal != authorized_principal_) {
        LogWarn("router", "rejected message from unauthorised principal '" + principal + "'");
        return RouteOutcome::Rejected;
    }

    const auto body = Trim(text);
    if (body.empty()) {
        return RouteOutcome::Ignored;
    }
    const auto upper = ToUpper(body);

    if (upper == "/RESET") {
        HandleReset(principal);
        return RouteOutcome::Reset;
    }
    if (IsDecisionCommand(upper)) {
        HandleDecision(principal, body);
        return RouteOutcome::Decision;
    }

    LogDebug("router", "starting turn: " + body.substr(0, 80));
    std::lock_guard<std::mutex> lock(workers_mutex_);
    ReapFinishedLocked();
    auto done = std::make_shared<std::atomic<bool>>(false);
    std::thread thread([this, principal, body, done]() {
        auto result = orchestrator_.HandleUserTurn(principal, nlohmann::json(body));
        LogInfo("router", std::string("turn finished: ") + TurnOutcomeName(result.outcome));
        done->store(true);
    });
    workers_.push_back(Worker{std::move(thread), std::move(done)});
    return RouteOutcome::TurnStarted;
}

void InboundRouter::HandleReset(const std::string& principal) {
    auto reset = store_.Reset(principal);
    if (reset.IsErr()) {
        LogError("router", reset.Error().ToString());
        Reply(principal, "Something went wrong: " + reset.Error().message);
        return;
    }
    LogInfo("router", "conversation reset for " + principal);
    Reply(principal, "Conversation reset. Starting fresh!");
}

void InboundRouter::HandleDecision(const std::string& principal, const std::string& text) {
    std::istringstream words(ToUpper(text));
    std::string action;
    std::string token;
    std::string extra;
    words >> action >> token >> extra;
    if (token.empty() || !extra.empty()) {
        Reply(principal, "Invalid format. Use: APPROVE <id> or DENY <id>");
        return;
    }

    const bool approved = action == "APPROVE";
    auto parsed = ApprovalToken::Create(token);
    if (parsed.IsErr()) {
        Reply(principal, "Approval " + token + " not found or already handled.");
        return;
    }

    switch (approvals_.Decide(parsed.Value().Value(), approved)) {
        case DecisionOutcome::Recorded:
            if (approved) {
                Reply(principal, "✅ Request " + token + " approved.");
            } else {
                Reply(principal, "❌ Request " + token + " denied.");
            }
            break;
        case DecisionOutcome::NotFound:
        case DecisionOutcome::AlreadyHandled:
            Reply(principal, "Approval " + token + " not found or already handled.");
            break;
        case DecisionOutcome::Expired:
            Reply(principal, "Approval " + token + " has expired.");
            break;
    }
}

void InboundRouter::WaitIdle() {
    std::vector<Worker> workers;
    {
        std::lock_guard<std::mutex> lock(workers_mutex_);
        workers.swap(workers_);
    }
    for (auto& worker : workers) {
        if (worker.thread.joinable()) {
            worker.thread.join();
        }
    }
}

// A finished worker only has its epilogue left, so the join is immediate.
void InboundRouter::ReapFinishedLocked() {
    auto finished = std::partition(workers_.begin(), workers_.end(),
                                   [](const Worker& w) { return !w.done->load(); });
    for (auto it = finished; it != workers_.end(); ++it) {
        if (it->thread.joinable()) {
            it->thread.join();
        }
    }
    workers_.erase(finished, workers_.end());
}

std::size_t InboundRouter::TrackedWorkers() {
    std::lock_guard<std::mutex> lock(workers_mutex_);
    return workers_.size();
}

} // namespace agent_relay
