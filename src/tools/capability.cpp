#include <agent_relay/tools/capability.hpp>

namespace agent_relay {

namespace {

constexpr std::size_t kApprovalInputPreview = 200;

} // anonymous namespace

const char* CapabilityKindName(CapabilityKind kind) {
    switch (kind) {
        case CapabilityKind::Shell:        return "shell";
        case CapabilityKind::FileRead:     return "file_read";
        case CapabilityKind::FileWrite:    return "file_write";
        case CapabilityKind::WebSearch:    return "web_search";
        case CapabilityKind::MediaMarker:  return "media_marker";
        case CapabilityKind::RemoteBridge: return "remote_bridge";
    }
    return "unknown";
}

std::string ICapability::ApprovalDescription(const nlohmann::json& input) const {
    auto serialized = input.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
    return "Tool: " + Describe().name + "\n" + Utf8Prefix(serialized, kApprovalInputPreview);
}

std::string StringField(const nlohmann::json& input, const char* key,
                        const std::string& fallback) {
    if (!input.is_object()) return fallback;
    auto it = input.find(key);
    if (it == input.end() || !it->is_string()) return fallback;
    return it->get<std::string>();
}

std::string Utf8Prefix(const std::string& text, std::size_t limit) {
    if (text.size() <= limit) return text;
    std::size_t cut = limit;
    // Back off continuation bytes (10xxxxxx) so the cut lands on a boundary.
    while (cut > 0 && (static_cast<unsigned char>(text[cut]) & 0xC0) == 0x80) {
        --cut;
    }
    return text.substr(0, cut);
}

} // namespace agent_relay
