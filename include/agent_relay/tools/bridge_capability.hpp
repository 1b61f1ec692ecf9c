#pragma once

#include <agent_relay/rpc/connection_pool.hpp>
#include <agent_relay/tools/capability.hpp>

#include <cstddef>

namespace agent_relay {

// mcp_call: lists or calls tools on the configured external servers through
// the connection pool.
class BridgeCapability : public ICapability {
public:
    explicit BridgeCapability(IConnectionPool& pool, std::size_t output_limit = 8000);

    [[nodiscard]] CapabilityKind Kind() const override { return CapabilityKind::RemoteBridge; }
    [[nodiscard]] CapabilityDescriptor Describe() const override;
    std::string Execute(const nlohmann::json& input) override;

    /// "Available tools (N):\n- **name**: description" for one server.
    std::string ListTools(const std::string& server_name);

    std::string CallTool(const std::string& server_name, const std::string& tool_name,
                         const nlohmann::json& arguments);

private:
    IConnectionPool& pool_;
    std::size_t output_limit_;
};

/// Text blocks of a tools/call result joined with "\n"; pretty JSON of the
/// whole result when there are none.
std::string FlattenToolResult(const nlohmann::json& result);

} // namespace agent_relay
