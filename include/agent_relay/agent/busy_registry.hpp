#pragma once

#include <mutex>
#include <set>
#include <string>

namespace agent_relay {

// ---------------------------------------------------------------------------
// IBusyRegistry: one running turn per conversation. A second turn is
// rejected, never queued.
// ---------------------------------------------------------------------------
class IBusyRegistry {
public:
    virtual ~IBusyRegistry() = default;

    /// false when the conversation already has a turn running.
    virtual bool TryAcquire(const std::string& conversation_id) = 0;
    virtual void Release(const std::string& conversation_id) = 0;

    IBusyRegistry(const IBusyRegistry&) = delete;
    IBusyRegistry& operator=(const IBusyRegistry&) = delete;

protected:
    IBusyRegistry() = default;
};

class BusyRegistry : public IBusyRegistry {
public:
    BusyRegistry() = default;

    bool TryAcquire(const std::string& conversation_id) override;
    void Release(const std::string& conversation_id) override;

    [[nodiscard]] bool IsBusy(const std::string& conversation_id) const;

private:
    mutable std::mutex mutex_;
    std::set<std::string> busy_;
};

// Releases the conversation on scope exit.
class BusyGuard {
public:
    BusyGuard(IBusyRegistry& registry, std::string conversation_id)
        : registry_(registry), conversation_id_(std::move(conversation_id)) {}
    ~BusyGuard() { registry_.Release(conversation_id_); }

    BusyGuard(const BusyGuard&) = delete;
    BusyGuard& operator=(const BusyGuard&) = delete;

private:
    IBusyRegistry& registry_;
    std::string conversation_id_;
};

} // namespace agent_relay
