#include <agent_relay/agent/anthropic_client.hpp>

#include <agent_relay/core/log.hpp>

#include <fstream>
#include <sstream>

namespace agent_relay {

namespace {

constexpr const char* kMessagesPath = "/v1/messages";

bool IsBlock(const nlohmann::json& block, const char* type) {
    return block.is_object() && block.value("type", "") == type;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// ModelResponse
// ---------------------------------------------------------------------------
std::string ModelResponse::Text() const {
    std::string text;
    for (const auto& block : content) {
        if (IsBlock(block, "text") && block.contains("text") && block["text"].is_string()) {
            text += block["text"].get<std::string>();
        }
    }
    return text;
}

std::vector<ToolInvocation> ModelResponse::ToolInvocations() const {
    std::vector<ToolInvocation> invocations;
    for (const auto& block : content) {
        if (!IsBlock(block, "tool_use")) continue;
        ToolInvocation invocation;
        invocation.id = block.value("id", "");
        invocation.name = block.value("name", "");
        invocation.input = block.contains("input") ? block["input"] : nlohmann::json::object();
        invocations.push_back(std::move(invocation));
    }
    return invocations;
}

// ---------------------------------------------------------------------------
// System prompt
// ---------------------------------------------------------------------------
std::string ComposeSystemPrompt(const std::string& base,
                                const std::optional<std::string>& instructions_file,
                                std::size_t limit) {
    if (!instructions_file.has_value() || instructions_file->empty()) {
        return base;
    }
    std::ifstream in(*instructions_file, std::ios::binary);
    if (!in) {
        LogWarn("model", "could not read instructions file " + *instructions_file);
        return base;
    }
    std::ostringstream buf;
    buf << in.rdbuf();
    auto content = buf.str();
    if (content.size() > limit) {
        content = content.substr(0, limit) + "\n\n... (truncated)";
    }
    return base + "\n\n--- Instructions ---\n" + content;
}

// ---------------------------------------------------------------------------
// AnthropicClient
// ---------------------------------------------------------------------------
AnthropicClient::AnthropicClient(IHttpClient& http, AnthropicOptions options)
    : http_(http), options_(std::move(options)) {}

nlohmann::json AnthropicClient::BuildRequestBody(const ModelRequest& request) const {
    auto messages = nlohmann::json::array();
    for (const auto& message : request.messages) {
        messages.push_back(message.ToJson());
    }
    nlohmann::json body = {
        {"model", options_.model},
        {"max_tokens", options_.max_tokens},
        {"messages", std::move(messages)},
    };
    if (!request.system.empty()) {
        body["system"] = request.system;
    }
    if (request.tools.is_array() && !request.tools.empty()) {
        body["tools"] = request.tools;
    }
    return body;
}

Result<ModelResponse, Error> AnthropicClient::ParseResponse(const std::string& body) {
    auto parsed = nlohmann::json::parse(body, nullptr, false);
    if (parsed.is_discarded() || !parsed.is_object()) {
        return Result<ModelResponse, Error>::Err(Error{
            "AnthropicClient::Complete", kMessagesPath, "Response is not a JSON object",
            std::nullopt, ErrorCategory::ProtocolDecode});
    }
    ModelResponse response;
    if (parsed.contains("content") && parsed["content"].is_array()) {
        response.content = parsed["content"];
    }
    if (parsed.contains("stop_reason") && parsed["stop_reason"].is_string()) {
        response.stop_reason = parsed["stop_reason"].get<std::string>();
    }
    return Result<ModelResponse, Error>::Ok(std::move(response));
}

Result<ModelResponse, Error> AnthropicClient::Complete(const ModelRequest& request) {
    HttpHeaders headers = {
        {"x-api-key", options_.api_key},
        {"anthropic-version", kAnthropicApiVersion},
    };
    auto body = BuildRequestBody(request).dump(-1, ' ', false,
                                               nlohmann::json::error_handler_t::replace);
    LogDebug("model", "POST " + std::string(kMessagesPath) + " (" +
                          std::to_string(request.messages.size()) + " messages)");

    auto res = http_.Post(kMessagesPath, body, "application/json", headers);
    if (res.IsErr()) {
        return Result<ModelResponse, Error>::Err(res.Error());
    }
    const auto& http = res.Value();
    if (http.status_code != 200) {
        LogWarn("model", "HTTP " + std::to_string(http.status_code));
        return Result<ModelResponse, Error>::Err(Error::FromHttpStatus(
            "AnthropicClient::Complete", kMessagesPath, http.status_code, http.body));
    }

    auto parsed = ParseResponse(http.body);
    if (parsed.IsOk()) {
        LogDebug("model", "stop_reason=" + parsed.Value().stop_reason);
    }
    return parsed;
}

} // namespace agent_relay
