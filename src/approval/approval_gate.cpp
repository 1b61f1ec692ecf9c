#include <agent_relay/approval/approval_gate.hpp>

#include <agent_relay/core/log.hpp>

namespace agent_relay {

const char* ApprovalStatusName(ApprovalStatus status) {
    switch (status) {
        case ApprovalStatus::Pending:  return "pending";
        case ApprovalStatus::Approved: return "approved";
        case ApprovalStatus::Denied:   return "denied";
        case ApprovalStatus::Expired:  return "expired";
    }
    return "pending";
}

std::optional<ApprovalStatus> ParseApprovalStatus(const std::string& name) {
    if (name == "pending") return ApprovalStatus::Pending;
    if (name == "approved") return ApprovalStatus::Approved;
    if (name == "denied") return ApprovalStatus::Denied;
    if (name == "expired") return ApprovalStatus::Expired;
    return std::nullopt;
}

ApprovalGate::ApprovalGate(IApprovalStore& store,
                           IMessageChannel& channel,
                           ApprovalOptions options,
                           NowFn now,
                           SleepFn sleep)
    : store_(store),
      channel_(channel),
      options_(options),
      now_(now ? std::move(now) : NowFn(SystemNow)),
      sleep_(sleep ? std::move(sleep) : SleepFn(SystemSleep)) {}

Result<ApprovalToken, Error> ApprovalGate::Request(const std::string& conversation_id,
                                                   const std::string& principal,
                                                   const std::string& tool_name,
                                                   const nlohmann::json& input,
                                                   const std::string& description) {
    // Retry on the (unlikely) collision with an existing token.
    auto token = ApprovalToken::Generate();
    for (int attempt = 0; attempt < 8 && store_.FindApproval(token.Value()).has_value(); ++attempt) {
        token = ApprovalToken::Generate();
    }

    ApprovalRequest request;
    request.token = token.Value();
    request.conversation_id = conversation_id;
    request.principal = principal;
    request.tool_name = tool_name;
    request.input_json = input.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    request.description = description;
    request.created_at = now_();
    request.expires_at = request.created_at + options_.timeout;

    auto inserted = store_.InsertApproval(request);
    if (inserted.IsErr()) {
        return Result<ApprovalToken, Error>::Err(inserted.Error());
    }
    LogInfo("approval", "requested " + token.Value() + " for " + tool_name);

    auto sent = channel_.SendApprovalRequest(principal, description, token.Value());
    if (sent.IsErr()) {
        // The request still expires on its own; the wait stays bounded.
        LogWarn("approval", "could not deliver prompt " + token.Value() + ": " +
                                sent.Error().ToString());
    }
    return Result<ApprovalToken, Error>::Ok(token);
}

ApprovalStatus ApprovalGate::AwaitDecision(const ApprovalToken& token,
                                           std::chrono::seconds timeout) {
    const auto deadline = now_() + timeout;
    for (;;) {
        auto request = store_.FindApproval(token.Value());
        if (!request.has_value()) {
            LogError("approval", "request " + token.Value() + " vanished while waiting");
            return ApprovalStatus::Expired;
        }
        if (IsTerminal(request->status)) {
            LogInfo("approval", token.Value() + " " + ApprovalStatusName(request->status));
            return request->status;
        }
        if (now_() >= deadline) {
            if (store_.CompareAndSetStatus(token.Value(), ApprovalStatus::Pending,
                                           ApprovalStatus::Expired, now_())) {
                LogInfo("approval", token.Value() + " expired");
                NotifyExpired(*request);
                return ApprovalStatus::Expired;
            }
            // A decision landed between the read and the swap.
            auto latest = store_.FindApproval(token.Value());
            return latest ? latest->status : ApprovalStatus::Expired;
        }
        sleep_(options_.poll_interval);
    }
}

DecisionOutcome ApprovalGate::Decide(const std::string& token, bool approved) {
    auto request = store_.FindApproval(token);
    if (!request.has_value()) {
        return DecisionOutcome::NotFound;
    }
    if (request->status == ApprovalStatus::Expired) {
        return DecisionOutcome::Expired;
    }
    if (IsTerminal(request->status)) {
        return DecisionOutcome::AlreadyHandled;
    }

    const auto now = now_();
    if (now >= request->expires_at) {
        if (store_.CompareAndSetStatus(token, ApprovalStatus::Pending,
                                       ApprovalStatus::Expired, now)) {
            LogInfo("approval", token + " answered after expiry");
            return DecisionOutcome::Expired;
        }
        auto latest = store_.FindApproval(token);
        return latest && latest->status == ApprovalStatus::Expired
                   ? DecisionOutcome::Expired
                   : DecisionOutcome::AlreadyHandled;
    }

    auto next = approved ? ApprovalStatus::Approved : ApprovalStatus::Denied;
    if (!store_.CompareAndSetStatus(token, ApprovalStatus::Pending, next, now)) {
        auto latest = store_.FindApproval(token);
        return latest && latest->status == ApprovalStatus::Expired
                   ? DecisionOutcome::Expired
                   : DecisionOutcome::AlreadyHandled;
    }
    LogInfo("approval", token + " " + ApprovalStatusName(next) + " by " + request->principal);
    return DecisionOutcome::Recorded;
}

std::optional<ApprovalStatus> ApprovalGate::Status(const std::string& token) {
    auto request = store_.FindApproval(token);
    if (!request.has_value()) {
        return std::nullopt;
    }
    if (request->status == ApprovalStatus::Pending) {
        const auto now = now_();
        if (now >= request->expires_at &&
            store_.CompareAndSetStatus(token, ApprovalStatus::Pending,
                                       ApprovalStatus::Expired, now)) {
            return ApprovalStatus::Expired;
        }
        auto latest = store_.FindApproval(token);
        return latest ? std::optional<ApprovalStatus>(latest->status) : std::nullopt;
    }
    return request->status;
}

void ApprovalGate::NotifyExpired(const ApprovalRequest& request) {
    auto sent = channel_.SendText(request.principal, "Approval " + request.token + " expired.");
    if (sent.IsErr()) {
        LogWarn("approval", "could not deliver expiry notice: " + sent.Error().ToString());
    }
}

} // namespace agent_relay
