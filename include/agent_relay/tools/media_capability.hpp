#pragma once

#include <agent_relay/tools/capability.hpp>

#include <optional>
#include <string>

namespace agent_relay {

// Outbound media request carried by a send_media result.
struct MediaMarker {
    std::string media_url;
    std::string caption;
};

/// Parses {"__media_send__":true,"media_url":..,"caption":..}; nullopt for any
/// other text.
std::optional<MediaMarker> ParseMediaMarker(const std::string& result);

// send_media: produces a marker the orchestrator forwards to the channel.
class MediaCapability : public ICapability {
public:
    [[nodiscard]] CapabilityKind Kind() const override { return CapabilityKind::MediaMarker; }
    [[nodiscard]] CapabilityDescriptor Describe() const override;
    std::string Execute(const nlohmann::json& input) override;
};

} // namespace agent_relay
