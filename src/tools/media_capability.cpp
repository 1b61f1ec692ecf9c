#include <agent_relay/tools/media_capability.hpp>

namespace agent_relay {

namespace {

constexpr const char* kMarkerKey = "__media_send__";

} // anonymous namespace

std::optional<MediaMarker> ParseMediaMarker(const std::string& result) {
    if (result.empty() || result.front() != '{') return std::nullopt;
    auto parsed = nlohmann::json::parse(result, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) return std::nullopt;
    auto flag = parsed.find(kMarkerKey);
    if (flag == parsed.end() || !flag->is_boolean() || !flag->get<bool>()) {
        return std::nullopt;
    }
    auto url = StringField(parsed, "media_url");
    if (url.empty()) return std::nullopt;
    return MediaMarker{url, StringField(parsed, "caption")};
}

CapabilityDescriptor MediaCapability::Describe() const {
    return CapabilityDescriptor{
        "send_media",
        "Send a media file (image, audio, video) to the user.\n\n"
        "The media_url must be a publicly accessible HTTPS URL. You can include an "
        "optional caption that appears with the media. The media goes to the "
        "current user automatically.",
        {
            {"type", "object"},
            {"properties", {
                {"media_url", {{"type", "string"},
                               {"description", "Public HTTPS URL of the media file"}}},
                {"caption", {{"type", "string"},
                             {"description", "Optional caption text to display with the media"}}},
            }},
            {"required", nlohmann::json::array({"media_url"})},
        }};
}

std::string MediaCapability::Execute(const nlohmann::json& input) {
    auto url = StringField(input, "media_url");
    if (url.empty()) {
        return "Error: media_url is required";
    }
    nlohmann::json marker = {
        {kMarkerKey, true},
        {"media_url", url},
        {"caption", StringField(input, "caption")},
    };
    return marker.dump();
}

} // namespace agent_relay
