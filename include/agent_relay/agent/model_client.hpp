#pragma once

#include <agent_relay/agent/history.hpp>
#include <agent_relay/core/result.hpp>

#include <nlohmann/json.hpp>

#include <string>
#include <vector>

namespace agent_relay {

// One tool_use block of a model response.
struct ToolInvocation {
    std::string id;
    std::string name;
    nlohmann::json input;
};

struct ModelResponse {
    // Raw content blocks, persisted unchanged as the assistant message.
    nlohmann::json content = nlohmann::json::array();
    std::string stop_reason;

    /// Concatenated text of all text blocks.
    [[nodiscard]] std::string Text() const;

    /// tool_use blocks in order.
    [[nodiscard]] std::vector<ToolInvocation> ToolInvocations() const;
};

struct ModelRequest {
    std::string system;
    std::vector<ChatMessage> messages;
    // [{name, description, input_schema}, ...]; omitted when empty.
    nlohmann::json tools = nlohmann::json::array();
};

// ---------------------------------------------------------------------------
// IModelClient: the external model oracle.
// ---------------------------------------------------------------------------
class IModelClient {
public:
    virtual ~IModelClient() = default;

    virtual Result<ModelResponse, Error> Complete(const ModelRequest& request) = 0;

    IModelClient(const IModelClient&) = delete;
    IModelClient& operator=(const IModelClient&) = delete;

protected:
    IModelClient() = default;
};

} // namespace agent_relay
