#pragma once

#include <agent_relay/tools/capability.hpp>

#include <cstddef>

namespace agent_relay {

// read_file: returns file content, truncated beyond read_limit characters.
class FileReadCapability : public ICapability {
public:
    explicit FileReadCapability(std::size_t read_limit = 10000);

    [[nodiscard]] CapabilityKind Kind() const override { return CapabilityKind::FileRead; }
    [[nodiscard]] CapabilityDescriptor Describe() const override;
    std::string Execute(const nlohmann::json& input) override;

private:
    std::size_t read_limit_;
};

// write_file: creates parent directories and overwrites. Always gated.
class FileWriteCapability : public ICapability {
public:
    [[nodiscard]] CapabilityKind Kind() const override { return CapabilityKind::FileWrite; }
    [[nodiscard]] CapabilityDescriptor Describe() const override;
    [[nodiscard]] bool AlwaysNeedsApproval() const override { return true; }
    [[nodiscard]] std::string ApprovalDescription(const nlohmann::json& input) const override;
    std::string Execute(const nlohmann::json& input) override;
};

} // namespace agent_relay
