#include <agent_relay/agent/busy_registry.hpp>

namespace agent_relay {

bool BusyRegistry::TryAcquire(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_.insert(conversation_id).second;
}

void BusyRegistry::Release(const std::string& conversation_id) {
    std::lock_guard<std::mutex> lock(mutex_);
    busy_.erase(conversation_id);
}

bool BusyRegistry::IsBusy(const std::string& conversation_id) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return busy_.count(conversation_id) > 0;
}

} // namespace agent_relay
