#pragma once

#include <agent_relay/approval/approval_types.hpp>
#include <agent_relay/core/result.hpp>

#include <optional>
#include <string>

namespace agent_relay {

// ---------------------------------------------------------------------------
// IApprovalStore: durable home of approval requests. The persisted record
// is the source of truth; the gate only polls it.
// ---------------------------------------------------------------------------
class IApprovalStore {
public:
    virtual ~IApprovalStore() = default;

    virtual Result<void, Error> InsertApproval(const ApprovalRequest& request) = 0;

    [[nodiscard]] virtual std::optional<ApprovalRequest> FindApproval(
        const std::string& token) const = 0;

    /// Atomically moves status from `expected` to `next` and stamps
    /// decided_at. Returns false when the current status is not `expected`.
    virtual bool CompareAndSetStatus(const std::string& token,
                                     ApprovalStatus expected,
                                     ApprovalStatus next,
                                     TimePoint when) = 0;

    IApprovalStore(const IApprovalStore&) = delete;
    IApprovalStore& operator=(const IApprovalStore&) = delete;

protected:
    IApprovalStore() = default;
};

} // namespace agent_relay
