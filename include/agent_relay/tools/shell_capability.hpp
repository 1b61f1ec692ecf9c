#pragma once

#include <agent_relay/tools/capability.hpp>

#include <chrono>
#include <string>

namespace agent_relay {

struct ShellOptions {
    std::chrono::seconds timeout{30};
    // false: never ask, even for destructive commands.
    bool require_approval = true;
};

/// True when the command matches the destructive-command pattern list
/// (deletion, process termination, power, permission and ownership changes,
/// moves and renames, user and service management, mutating HTTP, package
/// install or removal, destructive git operations). Case-insensitive.
bool IsDestructiveCommand(const std::string& command);

// execute_bash: runs `/bin/sh -c <command>`.
class ShellCapability : public ICapability {
public:
    explicit ShellCapability(ShellOptions options = {});

    [[nodiscard]] CapabilityKind Kind() const override { return CapabilityKind::Shell; }
    [[nodiscard]] CapabilityDescriptor Describe() const override;
    [[nodiscard]] bool AlwaysNeedsApproval() const override { return true; }
    [[nodiscard]] bool NeedsApproval(const nlohmann::json& input) const override;
    [[nodiscard]] std::string ApprovalDescription(const nlohmann::json& input) const override;
    std::string Execute(const nlohmann::json& input) override;

private:
    ShellOptions options_;
};

} // namespace agent_relay
