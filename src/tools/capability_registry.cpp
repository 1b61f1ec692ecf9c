#include <agent_relay/tools/capability_registry.hpp>

#include <agent_relay/core/log.hpp>

namespace agent_relay {

Result<void, Error> CapabilityRegistry::Register(std::unique_ptr<ICapability> capability) {
    auto descriptor = capability->Describe();
    if (capabilities_.count(descriptor.name) > 0) {
        return Result<void, Error>::Err(Error{
            "CapabilityRegistry::Register", descriptor.name,
            "Capability '" + descriptor.name + "' is already registered",
            std::nullopt, ErrorCategory::Configuration});
    }
    capabilities_[descriptor.name] = std::move(capability);
    descriptors_.push_back(std::move(descriptor));
    return Result<void, Error>::Ok();
}

nlohmann::json CapabilityRegistry::ToolDefinitions() const {
    auto tools = nlohmann::json::array();
    for (const auto& d : descriptors_) {
        tools.push_back({
            {"name", d.name},
            {"description", d.description},
            {"input_schema", d.input_schema},
        });
    }
    return tools;
}

bool CapabilityRegistry::HasCapability(const std::string& name) const {
    return capabilities_.count(name) > 0;
}

ICapability* CapabilityRegistry::Find(const std::string& name) const {
    auto it = capabilities_.find(name);
    return it == capabilities_.end() ? nullptr : it->second.get();
}

std::string CapabilityRegistry::Execute(const std::string& name,
                                        const nlohmann::json& input) const {
    auto* capability = Find(name);
    if (capability == nullptr) {
        LogWarn("tools", "model requested unknown tool '" + name + "'");
        return "Error: unknown tool '" + name + "'";
    }
    try {
        return capability->Execute(input);
    } catch (const std::exception& e) {
        LogError("tools", name + " threw: " + e.what());
        return std::string("Error: ") + e.what();
    }
}

} // namespace agent_relay
