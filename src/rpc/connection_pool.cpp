#include <agent_relay/rpc/connection_pool.hpp>

#include <agent_relay/core/log.hpp>

namespace agent_relay {

ConnectionPool::ConnectionPool(std::map<std::string, ServerConfig> servers,
                               ConnectionOptions options,
                               Factory factory)
    : servers_(std::move(servers)),
      options_(options),
      factory_(std::move(factory)) {
    if (!factory_) {
        factory_ = [](const std::string& name, const ServerConfig& config,
                      const ConnectionOptions& opts) {
            return std::make_shared<ServerConnection>(name, config, opts);
        };
    }
}

ConnectionPool::~ConnectionPool() {
    ShutdownAll();
}

Result<std::shared_ptr<IServerConnection>, Error> ConnectionPool::GetOrCreate(
    const std::string& server_name) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (shut_down_) {
        return Result<std::shared_ptr<IServerConnection>, Error>::Err(Error{
            "ConnectionPool::GetOrCreate", server_name, "Connection pool is shut down",
            std::nullopt, ErrorCategory::Internal});
    }

    auto existing = connections_.find(server_name);
    if (existing != connections_.end()) {
        return Result<std::shared_ptr<IServerConnection>, Error>::Ok(existing->second);
    }

    auto config = servers_.find(server_name);
    if (config == servers_.end()) {
        return Result<std::shared_ptr<IServerConnection>, Error>::Err(Error{
            "ConnectionPool::GetOrCreate", server_name,
            "Unknown server '" + server_name + "'", std::nullopt,
            ErrorCategory::NotFound});
    }

    auto connection = factory_(server_name, config->second, options_);
    connections_.emplace(server_name, connection);
    LogDebug("pool", "created connection for '" + server_name + "'");
    return Result<std::shared_ptr<IServerConnection>, Error>::Ok(std::move(connection));
}

std::vector<std::string> ConnectionPool::ServerNames() const {
    std::vector<std::string> names;
    names.reserve(servers_.size());
    for (const auto& [name, config] : servers_) {
        names.push_back(name);
    }
    return names;
}

std::optional<std::string> ConnectionPool::Describe(const std::string& server_name) const {
    auto it = servers_.find(server_name);
    if (it == servers_.end()) return std::nullopt;
    return it->second.description;
}

void ConnectionPool::ShutdownAll() {
    std::map<std::string, std::shared_ptr<IServerConnection>> connections;
    {
        std::lock_guard<std::mutex> lock(mutex_);
        shut_down_ = true;
        connections.swap(connections_);
    }
    for (auto& [name, connection] : connections) {
        LogInfo("pool", "shutting down '" + name + "'");
        connection->Shutdown();
    }
}

std::size_t ConnectionPool::ActiveCount() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return connections_.size();
}

} // namespace agent_relay
