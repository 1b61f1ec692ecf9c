#include <agent_relay/tools/web_search_capability.hpp>

#include <agent_relay/core/log.hpp>
#include <agent_relay/core/url.hpp>

#include <vector>

namespace agent_relay {

namespace {

constexpr std::size_t kMaxRelatedTopics = 5;
constexpr std::size_t kRelatedTopicChars = 200;

std::string Field(const nlohmann::json& data, const char* key) {
    return StringField(data, key);
}

std::string FormatInstantAnswer(const nlohmann::json& data) {
    std::vector<std::string> parts;

    auto abstract = Field(data, "Abstract");
    if (!abstract.empty()) {
        auto heading = Field(data, "Heading");
        parts.push_back("**" + (heading.empty() ? std::string("Result") : heading) + "**\n" +
                        abstract);
        auto source = Field(data, "AbstractURL");
        if (!source.empty()) {
            parts.push_back("Source: " + source);
        }
    }

    // Answer is usually a string but numeric answers happen.
    if (data.contains("Answer")) {
        const auto& answer = data["Answer"];
        if (answer.is_string() && !answer.get<std::string>().empty()) {
            parts.push_back("Answer: " + answer.get<std::string>());
        } else if (answer.is_number()) {
            parts.push_back("Answer: " + answer.dump());
        }
    }

    if (parts.empty() && data.contains("RelatedTopics") && data["RelatedTopics"].is_array()) {
        std::size_t taken = 0;
        for (const auto& topic : data["RelatedTopics"]) {
            if (taken == kMaxRelatedTopics) break;
            ++taken;
            auto text = Field(topic, "Text");
            if (!text.empty()) {
                parts.push_back("- " + Utf8Prefix(text, kRelatedTopicChars));
            }
        }
    }

    std::string out;
    for (std::size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) out += "\n\n";
        out += parts[i];
    }
    return out;
}

} // anonymous namespace

WebSearchCapability::WebSearchCapability(IHttpClient& http) : http_(http) {}

CapabilityDescriptor WebSearchCapability::Describe() const {
    return CapabilityDescriptor{
        "web_search",
        "Search the web for current information. Returns a summary of search "
        "results. Use this when the user asks about current events, weather, news, "
        "or anything that requires up-to-date information.",
        {
            {"type", "object"},
            {"properties", {
                {"query", {{"type", "string"}, {"description", "The search query"}}},
            }},
            {"required", nlohmann::json::array({"query"})},
        }};
}

std::string WebSearchCapability::Execute(const nlohmann::json& input) {
    auto query = StringField(input, "query");
    if (query.empty()) {
        return "Error: query is required";
    }

    auto path = "/" + BuildQueryString({
        {"q", query},
        {"format", "json"},
        {"no_html", "1"},
        {"skip_disambig", "1"},
    });
    LogInfo("search", "query: " + Utf8Prefix(query, 120));

    auto response = http_.Get(path, {{"Accept", "application/json"}});
    if (response.IsErr()) {
        if (response.Error().category == ErrorCategory::Timeout) {
            return "Search timed out.";
        }
        return "Search failed: " + response.Error().message;
    }
    const auto& res = response.Value();
    if (res.status_code != 200) {
        return "Search failed: HTTP " + std::to_string(res.status_code);
    }

    auto data = nlohmann::json::parse(res.body, nullptr, false);
    if (data.is_discarded() || !data.is_object()) {
        return "Search returned invalid data.";
    }

    auto formatted = FormatInstantAnswer(data);
    if (formatted.empty()) {
        return "No instant answer found for '" + query +
               "'. Try rephrasing or ask me to run a more specific search.";
    }
    return formatted;
}

} // namespace agent_relay
