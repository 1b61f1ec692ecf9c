#pragma once

#include <agent_relay/core/result.hpp>
#include <agent_relay/tools/capability.hpp>

#include <map>
#include <memory>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace agent_relay {

// ---------------------------------------------------------------------------
// CapabilityRegistry: the fixed set of capabilities offered to the model.
// Built once at startup; lookups are read-only afterwards.
// ---------------------------------------------------------------------------
class CapabilityRegistry {
public:
    /// Fails on a duplicate name.
    Result<void, Error> Register(std::unique_ptr<ICapability> capability);

    [[nodiscard]] const std::vector<CapabilityDescriptor>& Descriptors() const noexcept {
        return descriptors_;
    }

    /// [{name, description, input_schema}, ...] in registration order.
    [[nodiscard]] nlohmann::json ToolDefinitions() const;

    [[nodiscard]] bool HasCapability(const std::string& name) const;

    /// nullptr when unknown.
    [[nodiscard]] ICapability* Find(const std::string& name) const;

    /// Runs a capability; unknown names and escaped exceptions become text.
    [[nodiscard]] std::string Execute(const std::string& name,
                                      const nlohmann::json& input) const;

private:
    std::vector<CapabilityDescriptor> descriptors_;
    std::map<std::string, std::unique_ptr<ICapability>> capabilities_;
};

} // namespace agent_relay
