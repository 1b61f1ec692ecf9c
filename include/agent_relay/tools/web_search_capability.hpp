#pragma once

#include <agent_relay/http/i_http_client.hpp>
#include <agent_relay/tools/capability.hpp>

namespace agent_relay {

// web_search: DuckDuckGo instant-answer API. The client must be bound to
// https://api.duckduckgo.com.
class WebSearchCapability : public ICapability {
public:
    explicit WebSearchCapability(IHttpClient& http);

    [[nodiscard]] CapabilityKind Kind() const override { return CapabilityKind::WebSearch; }
    [[nodiscard]] CapabilityDescriptor Describe() const override;
    std::string Execute(const nlohmann::json& input) override;

private:
    IHttpClient& http_;
};

} // namespace agent_relay
