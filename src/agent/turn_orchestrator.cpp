#include <agent_relay/agent/turn_orchestrator.hpp>

#include <agent_relay/agent/history.hpp>
#include <agent_relay/core/log.hpp>
#include <agent_relay/tools/media_capability.hpp>

#include <exception>
#include <set>

namespace agent_relay {

namespace {

constexpr const char* kBusyText = "Please wait for the previous request to finish...";
constexpr const char* kDeniedText = "Denied by user.";
constexpr const char* kMaxRoundsText = "Reached max tool turns. Please try a simpler request.";

} // anonymous namespace

const char* TurnOutcomeName(TurnOutcome outcome) {
    switch (outcome) {
        case TurnOutcome::EndTurn:           return "end_turn";
        case TurnOutcome::MaxRoundsExceeded: return "max_rounds_exceeded";
        case TurnOutcome::UnexpectedStop:    return "unexpected_stop";
        case TurnOutcome::Busy:              return "busy";
        case TurnOutcome::Failed:            return "failed";
    }
    return "failed";
}

TurnOrchestrator::TurnOrchestrator(IConversationStore& store,
                                   IModelClient& model,
                                   const CapabilityRegistry& capabilities,
                                   ApprovalGate& approvals,
                                   IMessageChannel& channel,
                                   IBusyRegistry& busy,
                                   OrchestratorOptions options)
    : store_(store),
      model_(model),
      capabilities_(capabilities),
      approvals_(approvals),
      channel_(channel),
      busy_(busy),
      options_(std::move(options)) {}

void TurnOrchestrator::Reply(const std::string& principal, const std::string& text) {
    auto sent = channel_.SendText(principal, text);
    if (sent.IsErr()) {
        LogError("turn", "could not deliver reply: " + sent.Error().ToString());
    }
}

// ---------------------------------------------------------------------------
// Turn boundary
// ---------------------------------------------------------------------------
TurnResult TurnOrchestrator::HandleUserTurn(const std::string& principal,
                                            const nlohmann::json& content) {
    TurnResult failed;
    failed.outcome = TurnOutcome::Failed;

    try {
        auto conversation = store_.GetOrCreateActive(principal, options_.idle_timeout);
        if (conversation.IsErr()) {
            LogError("turn", conversation.Error().ToString());
            failed.reply = "Something went wrong: " + conversation.Error().message;
            Reply(principal, failed.reply);
            return failed;
        }
        const auto conversation_id = conversation.Value().id;
        failed.conversation_id = conversation_id;

        if (!busy_.TryAcquire(conversation_id)) {
            LogInfo("turn", "conversation " + conversation_id + " is busy");
            Reply(principal, kBusyText);
            return TurnResult{TurnOutcome::Busy, conversation_id, 0, kBusyText};
        }
        BusyGuard guard(busy_, conversation_id);

        auto turn = RunTurn(principal, conversation_id, content);
        if (turn.IsOk()) {
            return std::move(turn).Value();
        }
        LogError("turn", turn.Error().ToString());
        failed.reply = "Something went wrong: " + turn.Error().message;
    } catch (const std::exception& e) {
        LogError("turn", std::string("unhandled exception: ") + e.what());
        failed.reply = std::string("Something went wrong: ") + e.what();
    }
    Reply(principal, failed.reply);
    return failed;
}

// ---------------------------------------------------------------------------
// Rounds
// ---------------------------------------------------------------------------
Result<TurnResult, Error> TurnOrchestrator::RunTurn(const std::string& principal,
                                                    const std::string& conversation_id,
                                                    const nlohmann::json& content) {
    TurnResult result;
    result.conversation_id = conversation_id;

    auto appended = store_.Append(conversation_id, MessageRole::User, content);
    if (appended.IsErr()) {
        return Result<TurnResult, Error>::Err(appended.Error());
    }
    auto touched = store_.TouchActivity(conversation_id);
    if (touched.IsErr()) {
        return Result<TurnResult, Error>::Err(touched.Error());
    }
    auto log = store_.ReadAll(conversation_id);
    if (log.IsErr()) {
        return Result<TurnResult, Error>::Err(log.Error());
    }

    ModelRequest request;
    request.system = options_.system_prompt;
    request.tools = capabilities_.ToolDefinitions();
    request.messages = ReconstructHistory(log.Value(), options_.max_history_messages);
    LogInfo("turn", "conversation " + conversation_id + ": " +
                        std::to_string(request.messages.size()) + " messages in context");

    bool acknowledged = false;
    while (result.rounds < options_.max_rounds) {
        ++result.rounds;
        auto completed = model_.Complete(request);
        if (completed.IsErr()) {
            return Result<TurnResult, Error>::Err(completed.Error());
        }
        const auto& response = completed.Value();
        LogInfo("turn", "round " + std::to_string(result.rounds) +
                            ": stop_reason=" + response.stop_reason);

        if (response.stop_reason == "end_turn") {
            result.outcome = TurnOutcome::EndTurn;
            result.reply = response.Text();
            if (!result.reply.empty()) {
                auto stored = store_.Append(conversation_id, MessageRole::Assistant,
                                            response.content);
                if (stored.IsErr()) {
                    return Result<TurnResult, Error>::Err(stored.Error());
                }
                Reply(principal, result.reply);
            }
            return Result<TurnResult, Error>::Ok(std::move(result));
        }

        if (response.stop_reason != "tool_use") {
            result.outcome = TurnOutcome::UnexpectedStop;
            result.reply = "Unexpected stop reason: " + response.stop_reason;
            Reply(principal, result.reply);
            return Result<TurnResult, Error>::Ok(std::move(result));
        }

        auto invocations = response.ToolInvocations();
        if (invocations.empty()) {
            // tool_use without a tool_use block; answering with an empty
            // user message would be rejected by the API.
            result.outcome = TurnOutcome::UnexpectedStop;
            result.reply = "Unexpected stop reason: " + response.stop_reason;
            Reply(principal, result.reply);
            return Result<TurnResult, Error>::Ok(std::move(result));
        }

        if (!acknowledged) {
            acknowledged = true;
            Reply(principal, options_.acknowledgement);
        }

        // The assistant message goes to the log before any tool runs, so a
        // restart mid-turn never leaves a tool_result without its tool_use.
        auto stored = store_.Append(conversation_id, MessageRole::Assistant, response.content);
        if (stored.IsErr()) {
            return Result<TurnResult, Error>::Err(stored.Error());
        }

        auto tool_results = nlohmann::json::array();
        std::set<std::string> answered;
        for (const auto& invocation : invocations) {
            if (!answered.insert(invocation.id).second) {
                LogWarn("turn", "duplicate tool_use id " + invocation.id + ", skipped");
                continue;
            }
            auto output = RunInvocation(principal, conversation_id, invocation);
            auto recorded = store_.Append(conversation_id, MessageRole::ToolResult, output,
                                          invocation.id, invocation.name);
            if (recorded.IsErr()) {
                return Result<TurnResult, Error>::Err(recorded.Error());
            }
            tool_results.push_back({
                {"type", "tool_result"},
                {"tool_use_id", invocation.id},
                {"content", output},
            });
        }

        request.messages.push_back({"assistant", response.content});
        request.messages.push_back({"user", std::move(tool_results)});
    }

    LogWarn("turn", "round ceiling of " + std::to_string(options_.max_rounds) + " reached");
    result.outcome = TurnOutcome::MaxRoundsExceeded;
    result.reply = kMaxRoundsText;
    Reply(principal, result.reply);
    return Result<TurnResult, Error>::Ok(std::move(result));
}

std::string TurnOrchestrator::RunInvocation(const std::string& principal,
                                            const std::string& conversation_id,
                                            const ToolInvocation& invocation) {
    const auto* capability = capabilities_.Find(invocation.name);
    if (capability != nullptr && capability->NeedsApproval(invocation.input)) {
        auto token = approvals_.Request(conversation_id, principal, invocation.name,
                                        invocation.input,
                                        capability->ApprovalDescription(invocation.input));
        if (token.IsErr()) {
            LogError("turn", "approval request failed: " + token.Error().ToString());
            return "Error: could not request approval: " + token.Error().message;
        }
        auto status = approvals_.AwaitDecision(token.Value());
        if (status != ApprovalStatus::Approved) {
            LogInfo("turn", invocation.name + " not approved (" +
                                ApprovalStatusName(status) + ")");
            return kDeniedText;
        }
    }

    LogInfo("turn", "executing " + invocation.name);
    auto output = capabilities_.Execute(invocation.name, invocation.input);

    auto media = ParseMediaMarker(output);
    if (media.has_value()) {
        auto sent = channel_.SendMedia(principal, media->media_url, media->caption);
        if (sent.IsErr()) {
            return "Error: failed to send media: " + sent.Error().message;
        }
        return "Media sent to the user: " + media->media_url;
    }
    return output;
}

} // namespace agent_relay
