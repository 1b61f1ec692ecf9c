#pragma once

#include <agent_relay/store/i_conversation_store.hpp>

#include <nlohmann/json.hpp>

#include <cstddef>
#include <string>
#include <vector>

namespace agent_relay {

// One message in model-API form: role "user" or "assistant"; content is a
// string or an array of content blocks.
struct ChatMessage {
    std::string role;
    nlohmann::json content;

    [[nodiscard]] nlohmann::json ToJson() const {
        return {{"role", role}, {"content", content}};
    }
};

/// Rebuilds a protocol-valid, strictly alternating message list from the
/// append-only log:
///   - keeps only the most recent max_messages entries
///   - replays a tool_result only for an id emitted by the immediately
///     preceding assistant message, once per id
///   - merges consecutive tool_results into one user message
///   - drops tool_use blocks that never received a result
///   - merges same-role neighbours
///   - starts with a user message that is not a tool_result
std::vector<ChatMessage> ReconstructHistory(const std::vector<TurnMessage>& log,
                                            std::size_t max_messages = 50);

/// content as an array of blocks; a string becomes one text block.
nlohmann::json ToContentBlocks(const nlohmann::json& content);

} // namespace agent_relay
