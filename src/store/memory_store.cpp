#include <agent_relay/store/memory_store.hpp>

#include <agent_relay/core/log.hpp>

#include <cstdio>
#include <filesystem>
#include <fstream>
#include <sstream>

namespace agent_relay {

namespace {

constexpr int kSnapshotVersion = 1;

Error MakeStoreError(const std::string& operation, const std::string& target,
                     const std::string& message,
                     ErrorCategory category = ErrorCategory::Internal) {
    return Error{operation, target, message, std::nullopt, category};
}

nlohmann::json ConversationToJson(const Conversation& c) {
    return {
        {"id", c.id},
        {"principal", c.principal},
        {"active", c.active},
        {"started_at", ToEpochMillis(c.started_at)},
        {"last_activity", ToEpochMillis(c.last_activity)},
    };
}

nlohmann::json MessageToJson(const TurnMessage& m) {
    nlohmann::json j = {
        {"sequence", m.sequence},
        {"conversation_id", m.conversation_id},
        {"role", MessageRoleName(m.role)},
        {"content", m.content},
        {"created_at", ToEpochMillis(m.created_at)},
    };
    if (m.invocation_id) j["invocation_id"] = *m.invocation_id;
    if (m.tool_name) j["tool_name"] = *m.tool_name;
    return j;
}

nlohmann::json ApprovalToJson(const ApprovalRequest& a) {
    nlohmann::json j = {
        {"token", a.token},
        {"conversation_id", a.conversation_id},
        {"principal", a.principal},
        {"tool_name", a.tool_name},
        {"input", a.input_json},
        {"description", a.description},
        {"created_at", ToEpochMillis(a.created_at)},
        {"expires_at", ToEpochMillis(a.expires_at)},
        {"status", ApprovalStatusName(a.status)},
    };
    if (a.decided_at) j["decided_at"] = ToEpochMillis(*a.decided_at);
    return j;
}

std::optional<std::string> OptionalString(const nlohmann::json& j, const char* key) {
    auto it = j.find(key);
    if (it == j.end() || !it->is_string()) return std::nullopt;
    return it->get<std::string>();
}

} // anonymous namespace

const char* MessageRoleName(MessageRole role) {
    switch (role) {
        case MessageRole::User:       return "user";
        case MessageRole::Assistant:  return "assistant";
        case MessageRole::ToolResult: return "tool_result";
    }
    return "user";
}

std::optional<MessageRole> ParseMessageRole(const std::string& name) {
    if (name == "user") return MessageRole::User;
    if (name == "assistant") return MessageRole::Assistant;
    if (name == "tool_result") return MessageRole::ToolResult;
    return std::nullopt;
}

MemoryStore::MemoryStore(NowFn now)
    : now_(now ? std::move(now) : NowFn(SystemNow)) {}

Result<std::unique_ptr<MemoryStore>, Error> MemoryStore::Open(const std::string& snapshot_path,
                                                             NowFn now) {
    auto store = std::make_unique<MemoryStore>(std::move(now));
    store->snapshot_path_ = snapshot_path;

    std::error_code ec;
    if (std::filesystem::exists(snapshot_path, ec)) {
        std::ifstream file(snapshot_path);
        if (!file) {
            return Result<std::unique_ptr<MemoryStore>, Error>::Err(MakeStoreError(
                "MemoryStore::Open", snapshot_path, "Cannot open snapshot file",
                ErrorCategory::Configuration));
        }
        std::ostringstream ss;
        ss << file.rdbuf();
        auto snapshot = nlohmann::json::parse(ss.str(), nullptr, false);
        if (snapshot.is_discarded() || !snapshot.is_object()) {
            return Result<std::unique_ptr<MemoryStore>, Error>::Err(MakeStoreError(
                "MemoryStore::Open", snapshot_path, "Snapshot file is not valid JSON",
                ErrorCategory::Configuration));
        }
        auto loaded = store->LoadJson(snapshot);
        if (loaded.IsErr()) {
            return Result<std::unique_ptr<MemoryStore>, Error>::Err(loaded.Error());
        }
        LogInfo("store", "loaded snapshot " + snapshot_path);
    }
    return Result<std::unique_ptr<MemoryStore>, Error>::Ok(std::move(store));
}

// ---------------------------------------------------------------------------
// Conversations
// ---------------------------------------------------------------------------
std::string MemoryStore::NextConversationIdLocked() {
    return "conv-" + std::to_string(next_conversation_++);
}

Result<Conversation, Error> MemoryStore::GetOrCreateActive(const std::string& principal,
                                                           std::chrono::minutes idle_timeout) {
    std::lock_guard<std::mutex> lock(mutex_);
    const auto now = now_();

    for (auto& [id, conversation] : conversations_) {
        if (conversation.principal != principal || !conversation.active) continue;
        if (now - conversation.last_activity <= idle_timeout) {
            return Result<Conversation, Error>::Ok(conversation);
        }
        conversation.active = false;
        LogInfo("store", "conversation " + id + " expired after inactivity");
    }

    Conversation fresh;
    fresh.id = NextConversationIdLocked();
    fresh.principal = principal;
    fresh.active = true;
    fresh.started_at = now;
    fresh.last_activity = now;
    conversations_[fresh.id] = fresh;
    messages_[fresh.id];

    auto persisted = PersistLocked();
    if (persisted.IsErr()) {
        return Result<Conversation, Error>::Err(persisted.Error());
    }
    LogDebug("store", "started conversation " + fresh.id + " for " + principal);
    return Result<Conversation, Error>::Ok(fresh);
}

Result<void, Error> MemoryStore::Reset(const std::string& principal) {
    std::lock_guard<std::mutex> lock(mutex_);
    bool changed = false;
    for (auto& [id, conversation] : conversations_) {
        if (conversation.principal == principal && conversation.active) {
            conversation.active = false;
            changed = true;
        }
    }
    if (!changed) return Result<void, Error>::Ok();
    return PersistLocked();
}

Result<TurnMessage, Error> MemoryStore::Append(const std::string& conversation_id,
                                              MessageRole role,
                                              const nlohmann::json& content,
                                              const std::optional<std::string>& invocation_id,
                                              const std::optional<std::string>& tool_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto conversation = conversations_.find(conversation_id);
    if (conversation == conversations_.end()) {
        return Result<TurnMessage, Error>::Err(MakeStoreError(
            "MemoryStore::Append", conversation_id, "Unknown conversation",
            ErrorCategory::NotFound));
    }

    TurnMessage message;
    message.sequence = next_sequence_++;
    message.conversation_id = conversation_id;
    message.role = role;
    message.content = content;
    message.invocation_id = invocation_id;
    message.tool_name = tool_name;
    message.created_at = now_();
    messages_[conversation_id].push_back(message);
    conversation->second.last_activity = message.created_at;

    auto persisted = PersistLocked();
    if (persisted.IsErr()) {
        return Result<TurnMessage, Error>::Err(persisted.Error());
    }
    return Result<TurnMessage, Error>::Ok(std::move(message));
}

Result<std::vector<TurnMessage>, Error> MemoryStore::ReadAll(
    const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    if (conversations_.count(conversation_id) == 0) {
        return Result<std::vector<TurnMessage>, Error>::Err(MakeStoreError(
            "MemoryStore::ReadAll", conversation_id, "Unknown conversation",
            ErrorCategory::NotFound));
    }
    auto it = messages_.find(conversation_id);
    if (it == messages_.end()) {
        return Result<std::vector<TurnMessage>, Error>::Ok({});
    }
    return Result<std::vector<TurnMessage>, Error>::Ok(it->second);
}

Result<void, Error> MemoryStore::TouchActivity(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(conversation_id);
    if (it == conversations_.end()) {
        return Result<void, Error>::Err(MakeStoreError(
            "MemoryStore::TouchActivity", conversation_id, "Unknown conversation",
            ErrorCategory::NotFound));
    }
    it->second.last_activity = now_();
    return PersistLocked();
}

std::optional<Conversation> MemoryStore::FindConversation(const std::string& id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = conversations_.find(id);
    if (it == conversations_.end()) return std::nullopt;
    return it->second;
}

// ---------------------------------------------------------------------------
// Approvals
// ---------------------------------------------------------------------------
Result<void, Error> MemoryStore::InsertApproval(const ApprovalRequest& request) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (approvals_.count(request.token) > 0) {
        return Result<void, Error>::Err(MakeStoreError(
            "MemoryStore::InsertApproval", request.token, "Approval token already exists"));
    }
    approvals_[request.token] = request;
    return PersistLocked();
}

std::optional<ApprovalRequest> MemoryStore::FindApproval(const std::string& token) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = approvals_.find(token);
    if (it == approvals_.end()) return std::nullopt;
    return it->second;
}

bool MemoryStore::CompareAndSetStatus(const std::string& token,
                                      ApprovalStatus expected,
                                      ApprovalStatus next,
                                      TimePoint when) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = approvals_.find(token);
    if (it == approvals_.end() || it->second.status != expected) {
        return false;
    }
    it->second.status = next;
    it->second.decided_at = when;
    auto persisted = PersistLocked();
    if (persisted.IsErr()) {
        LogError("store", persisted.Error().ToString());
    }
    return true;
}

// ---------------------------------------------------------------------------
// Snapshot
// ---------------------------------------------------------------------------
nlohmann::json MemoryStore::ToJson() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return SnapshotLocked();
}

nlohmann::json MemoryStore::SnapshotLocked() const {
    auto conversations = nlohmann::json::array();
    for (const auto& [id, c] : conversations_) {
        conversations.push_back(ConversationToJson(c));
    }
    auto messages = nlohmann::json::array();
    for (const auto& [id, log] : messages_) {
        for (const auto& m : log) {
            messages.push_back(MessageToJson(m));
        }
    }
    auto approvals = nlohmann::json::array();
    for (const auto& [token, a] : approvals_) {
        approvals.push_back(ApprovalToJson(a));
    }
    return {
        {"version", kSnapshotVersion},
        {"next_sequence", next_sequence_},
        {"next_conversation", next_conversation_},
        {"conversations", conversations},
        {"messages", messages},
        {"approvals", approvals},
    };
}

Result<void, Error> MemoryStore::LoadJson(const nlohmann::json& snapshot) {
    try {
        next_sequence_ = snapshot.value("next_sequence", std::int64_t{1});
        next_conversation_ = snapshot.value("next_conversation", std::int64_t{1});

        for (const auto& j : snapshot.value("conversations", nlohmann::json::array())) {
            Conversation c;
            c.id = j.at("id").get<std::string>();
            c.principal = j.at("principal").get<std::string>();
            c.active = j.value("active", false);
            c.started_at = FromEpochMillis(j.at("started_at").get<std::int64_t>());
            c.last_activity = FromEpochMillis(j.at("last_activity").get<std::int64_t>());
            conversations_[c.id] = c;
            messages_[c.id];
        }

        for (const auto& j : snapshot.value("messages", nlohmann::json::array())) {
            TurnMessage m;
            m.sequence = j.at("sequence").get<std::int64_t>();
            m.conversation_id = j.at("conversation_id").get<std::string>();
            auto role = ParseMessageRole(j.at("role").get<std::string>());
            if (!role) {
                return Result<void, Error>::Err(MakeStoreError(
                    "MemoryStore::LoadJson", m.conversation_id,
                    "Unknown message role in snapshot", ErrorCategory::Configuration));
            }
            m.role = *role;
            m.content = j.at("content");
            m.invocation_id = OptionalString(j, "invocation_id");
            m.tool_name = OptionalString(j, "tool_name");
            m.created_at = FromEpochMillis(j.at("created_at").get<std::int64_t>());
            messages_[m.conversation_id].push_back(std::move(m));
        }

        for (const auto& j : snapshot.value("approvals", nlohmann::json::array())) {
            ApprovalRequest a;
            a.token = j.at("token").get<std::string>();
            a.conversation_id = j.value("conversation_id", "");
            a.principal = j.value("principal", "");
            a.tool_name = j.value("tool_name", "");
            a.input_json = j.value("input", "");
            a.description = j.value("description", "");
            a.created_at = FromEpochMillis(j.at("created_at").get<std::int64_t>());
            a.expires_at = FromEpochMillis(j.at("expires_at").get<std::int64_t>());
            auto status = ParseApprovalStatus(j.value("status", "pending"));
            a.status = status.value_or(ApprovalStatus::Pending);
            if (j.contains("decided_at")) {
                a.decided_at = FromEpochMillis(j["decided_at"].get<std::int64_t>());
            }
            approvals_[a.token] = std::move(a);
        }
    } catch (const nlohmann::json::exception& e) {
        return Result<void, Error>::Err(MakeStoreError(
            "MemoryStore::LoadJson", snapshot_path_.value_or(""),
            std::string("Malformed snapshot: ") + e.what(), ErrorCategory::Configuration));
    }
    return Result<void, Error>::Ok();
}

Result<void, Error> MemoryStore::PersistLocked() const {
    if (!snapshot_path_) return Result<void, Error>::Ok();

    const auto tmp = *snapshot_path_ + ".tmp";
    {
        std::ofstream file(tmp, std::ios::trunc);
        if (!file) {
            return Result<void, Error>::Err(MakeStoreError(
                "MemoryStore::Persist", tmp, "Cannot open snapshot for writing"));
        }
        // Tool output may carry arbitrary bytes; invalid UTF-8 becomes U+FFFD.
        file << SnapshotLocked().dump(2, ' ', false, nlohmann::json::error_handler_t::replace);
        if (!file) {
            return Result<void, Error>::Err(MakeStoreError(
                "MemoryStore::Persist", tmp, "Failed to write snapshot"));
        }
    }
    std::error_code ec;
    std::filesystem::rename(tmp, *snapshot_path_, ec);
    if (ec) {
        return Result<void, Error>::Err(MakeStoreError(
            "MemoryStore::Persist", *snapshot_path_, "Failed to replace snapshot: " + ec.message()));
    }
    return Result<void, Error>::Ok();
}

} // namespace agent_relay
