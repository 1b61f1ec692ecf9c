#include <agent_relay/tools/builtin_capabilities.hpp>

#include <agent_relay/tools/bridge_capability.hpp>
#include <agent_relay/tools/file_capabilities.hpp>
#include <agent_relay/tools/media_capability.hpp>
#include <agent_relay/tools/web_search_capability.hpp>

#include <memory>
#include <vector>

namespace agent_relay {

Result<void, Error> RegisterBuiltinCapabilities(CapabilityRegistry& registry,
                                                const BuiltinCapabilityOptions& options,
                                                IHttpClient& search_http,
                                                IConnectionPool& pool) {
    std::vector<std::unique_ptr<ICapability>> capabilities;
    capabilities.push_back(std::make_unique<ShellCapability>(options.shell));
    capabilities.push_back(std::make_unique<FileReadCapability>(options.file_read_limit));
    capabilities.push_back(std::make_unique<FileWriteCapability>());
    capabilities.push_back(std::make_unique<WebSearchCapability>(search_http));
    capabilities.push_back(std::make_unique<MediaCapability>());
    if (!pool.ServerNames().empty()) {
        capabilities.push_back(
            std::make_unique<BridgeCapability>(pool, options.bridge_output_limit));
    }

    for (auto& capability : capabilities) {
        auto registered = registry.Register(std::move(capability));
        if (registered.IsErr()) {
            return registered;
        }
    }
    return Result<void, Error>::Ok();
}

} // namespace agent_relay
