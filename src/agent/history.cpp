#include <agent_relay/agent/history.hpp>

#include <agent_relay/core/log.hpp>

#include <optional>
#include <set>

namespace agent_relay {

namespace {

bool IsBlockOfType(const nlohmann::json& block, const char* type) {
    return block.is_object() && block.contains("type") && block["type"] == type;
}

bool StartsWithToolResult(const ChatMessage& message) {
    return message.content.is_array() && !message.content.empty() &&
           IsBlockOfType(message.content.front(), "tool_result");
}

std::set<std::string> ToolUseIds(const nlohmann::json& content) {
    std::set<std::string> ids;
    if (!content.is_array()) return ids;
    for (const auto& block : content) {
        if (IsBlockOfType(block, "tool_use") && block.contains("id") && block["id"].is_string()) {
            ids.insert(block["id"].get<std::string>());
        }
    }
    return ids;
}

nlohmann::json ToolResultText(const nlohmann::json& content) {
    if (content.is_string() || content.is_array()) return content;
    return content.dump();
}

// Forward walk over the log tracking the tool_use ids of the open assistant.
class HistoryBuilder {
public:
    void AddUser(const nlohmann::json& content) {
        CloseAssistant();
        out_.push_back({"user", content});
    }

    void AddAssistant(const nlohmann::json& content) {
        CloseAssistant();
        out_.push_back({"assistant", content});
        pending_ = ToolUseIds(content);
        open_assistant_ = out_.size() - 1;
    }

    void AddToolResult(const std::string& id, const nlohmann::json& content) {
        if (!open_assistant_ || pending_.count(id) == 0 || answered_.count(id) > 0) {
            LogDebug("history", "dropping orphaned tool_result " + id);
            return;
        }
        answered_.insert(id);
        nlohmann::json block = {
            {"type", "tool_result"},
            {"tool_use_id", id},
            {"content", ToolResultText(content)},
        };
        if (!out_.empty() && out_.back().role == "user" && StartsWithToolResult(out_.back())) {
            out_.back().content.push_back(std::move(block));
        } else {
            out_.push_back({"user", nlohmann::json::array({std::move(block)})});
        }
    }

    std::vector<ChatMessage> Finish() {
        CloseAssistant();
        return std::move(out_);
    }

private:
    // Strips tool_use blocks of the open assistant that never got a result.
    void CloseAssistant() {
        if (open_assistant_ && answered_.size() < pending_.size()) {
            auto& content = out_[*open_assistant_].content;
            auto kept = nlohmann::json::array();
            for (const auto& block : content) {
                if (IsBlockOfType(block, "tool_use") &&
                    answered_.count(block.value("id", "")) == 0) {
                    LogDebug("history", "dropping unanswered tool_use " + block.value("id", ""));
                    continue;
                }
                kept.push_back(block);
            }
            content = std::move(kept);
            if (content.empty() && *open_assistant_ == out_.size() - 1) {
                out_.pop_back();
            }
        }
        pending_.clear();
        answered_.clear();
        open_assistant_.reset();
    }

    std::vector<ChatMessage> out_;
    std::set<std::string> pending_;
    std::set<std::string> answered_;
    std::optional<std::size_t> open_assistant_;
};

std::vector<ChatMessage> MergeSameRole(std::vector<ChatMessage> messages) {
    std::vector<ChatMessage> merged;
    for (auto& message : messages) {
        if (!merged.empty() && merged.back().role == message.role) {
            auto blocks = ToContentBlocks(merged.back().content);
            for (const auto& block : ToContentBlocks(message.content)) {
                blocks.push_back(block);
            }
            merged.back().content = std::move(blocks);
            continue;
        }
        merged.push_back(std::move(message));
    }
    return merged;
}

} // anonymous namespace

nlohmann::json ToContentBlocks(const nlohmann::json& content) {
    if (content.is_array()) return content;
    if (content.is_string()) {
        return nlohmann::json::array({{{"type", "text"}, {"text", content.get<std::string>()}}});
    }
    return nlohmann::json::array({{{"type", "text"}, {"text", content.dump()}}});
}

std::vector<ChatMessage> ReconstructHistory(const std::vector<TurnMessage>& log,
                                            std::size_t max_messages) {
    std::size_t start = log.size() > max_messages ? log.size() - max_messages : 0;

    HistoryBuilder builder;
    for (std::size_t i = start; i < log.size(); ++i) {
        const auto& entry = log[i];
        switch (entry.role) {
            case MessageRole::User:
                builder.AddUser(entry.content);
                break;
            case MessageRole::Assistant:
                builder.AddAssistant(entry.content);
                break;
            case MessageRole::ToolResult:
                builder.AddToolResult(entry.invocation_id.value_or(""), entry.content);
                break;
        }
    }

    auto messages = MergeSameRole(builder.Finish());

    std::size_t first = 0;
    while (first < messages.size() &&
           (messages[first].role != "user" || StartsWithToolResult(messages[first]))) {
        ++first;
    }
    messages.erase(messages.begin(), messages.begin() + static_cast<std::ptrdiff_t>(first));
    return messages;
}

} // namespace agent_relay
