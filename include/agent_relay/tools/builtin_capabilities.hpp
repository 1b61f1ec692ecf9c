#pragma once

#include <agent_relay/core/result.hpp>
#include <agent_relay/http/i_http_client.hpp>
#include <agent_relay/rpc/connection_pool.hpp>
#include <agent_relay/tools/capability_registry.hpp>
#include <agent_relay/tools/shell_capability.hpp>

#include <cstddef>

namespace agent_relay {

struct BuiltinCapabilityOptions {
    ShellOptions shell;
    std::size_t file_read_limit = 10000;
    std::size_t bridge_output_limit = 8000;
};

// Registers execute_bash, read_file, write_file, web_search and send_media,
// plus mcp_call when the pool has at least one configured server.
// search_http and pool must outlive the registry.
Result<void, Error> RegisterBuiltinCapabilities(CapabilityRegistry& registry,
                                                const BuiltinCapabilityOptions& options,
                                                IHttpClient& search_http,
                                                IConnectionPool& pool);

} // namespace agent_relay
