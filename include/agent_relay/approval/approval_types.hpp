#pragma once

#include <agent_relay/core/clock.hpp>

#include <optional>
#include <string>

namespace agent_relay {

enum class ApprovalStatus {
    Pending,
    Approved,
    Denied,
    Expired,
};

const char* ApprovalStatusName(ApprovalStatus status);
std::optional<ApprovalStatus> ParseApprovalStatus(const std::string& name);

inline bool IsTerminal(ApprovalStatus status) {
    return status != ApprovalStatus::Pending;
}

// One human approval cycle. Mutated exactly once: pending -> terminal.
struct ApprovalRequest {
    std::string token;
    std::string conversation_id;
    std::string principal;
    std::string tool_name;
    std::string input_json;
    std::string description;
    TimePoint created_at;
    TimePoint expires_at;
    ApprovalStatus status = ApprovalStatus::Pending;
    std::optional<TimePoint> decided_at;
};

} // namespace agent_relay
