#pragma once

#include <agent_relay/core/clock.hpp>
#include <agent_relay/core/result.hpp>

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace agent_relay {

enum class MessageRole {
    User,
    Assistant,
    ToolResult,
};

const char* MessageRoleName(MessageRole role);
std::optional<MessageRole> ParseMessageRole(const std::string& name);

// One entry of a conversation's append-only log. content is either a JSON
// string or an array of typed content blocks.
struct TurnMessage {
    std::int64_t sequence = 0;
    std::string conversation_id;
    MessageRole role = MessageRole::User;
    nlohmann::json content;
    std::optional<std::string> invocation_id;
    std::optional<std::string> tool_name;
    TimePoint created_at;
};

struct Conversation {
    std::string id;
    std::string principal;
    bool active = true;
    TimePoint started_at;
    TimePoint last_activity;
};

// ---------------------------------------------------------------------------
// IConversationStore: durable conversation log. Exactly one conversation is
// active per principal.
// ---------------------------------------------------------------------------
class IConversationStore {
public:
    virtual ~IConversationStore() = default;

    /// The principal's active conversation; one idle longer than
    /// idle_timeout is deactivated and a fresh one started.
    virtual Result<Conversation, Error> GetOrCreateActive(
        const std::string& principal, std::chrono::minutes idle_timeout) = 0;

    /// Deactivates the principal's active conversation, if any.
    virtual Result<void, Error> Reset(const std::string& principal) = 0;

    virtual Result<TurnMessage, Error> Append(
        const std::string& conversation_id,
        MessageRole role,
        const nlohmann::json& content,
        const std::optional<std::string>& invocation_id = std::nullopt,
        const std::optional<std::string>& tool_name = std::nullopt) = 0;

    /// All messages in sequence order.
    [[nodiscard]] virtual Result<std::vector<TurnMessage>, Error> ReadAll(
        const std::string& conversation_id) const = 0;

    virtual Result<void, Error> TouchActivity(const std::string& conversation_id) = 0;

    IConversationStore(const IConversationStore&) = delete;
    IConversationStore& operator=(const IConversationStore&) = delete;

protected:
    IConversationStore() = default;
};

} // namespace agent_relay
