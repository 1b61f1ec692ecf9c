#pragma once

#include <agent_relay/core/result.hpp>
#include <agent_relay/rpc/server_connection.hpp>

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace agent_relay {

// ---------------------------------------------------------------------------
// IConnectionPool: process-wide map from server name to its connection.
// ---------------------------------------------------------------------------
class IConnectionPool {
public:
    virtual ~IConnectionPool() = default;

    /// The connection for a configured server, created on first use. The
    /// same instance is returned for the lifetime of the pool.
    virtual Result<std::shared_ptr<IServerConnection>, Error> GetOrCreate(
        const std::string& server_name) = 0;

    /// Configured server names, sorted.
    [[nodiscard]] virtual std::vector<std::string> ServerNames() const = 0;

    [[nodiscard]] virtual std::optional<std::string> Describe(
        const std::string& server_name) const = 0;

    /// Shuts down every tracked connection and clears the map.
    virtual void ShutdownAll() = 0;

    IConnectionPool(const IConnectionPool&) = delete;
    IConnectionPool& operator=(const IConnectionPool&) = delete;

protected:
    IConnectionPool() = default;
};

class ConnectionPool : public IConnectionPool {
public:
    using Factory = std::function<std::shared_ptr<IServerConnection>(
        const std::string& name, const ServerConfig& config,
        const ConnectionOptions& options)>;

    /// factory defaults to spawning a real ServerConnection.
    ConnectionPool(std::map<std::string, ServerConfig> servers,
                   ConnectionOptions options,
                   Factory factory = nullptr);
    ~ConnectionPool() override;

    Result<std::shared_ptr<IServerConnection>, Error> GetOrCreate(
        const std::string& server_name) override;
    [[nodiscard]] std::vector<std::string> ServerNames() const override;
    [[nodiscard]] std::optional<std::string> Describe(
        const std::string& server_name) const override;
    void ShutdownAll() override;

    /// Connections created so far.
    [[nodiscard]] std::size_t ActiveCount() const;

private:
    std::map<std::string, ServerConfig> servers_;
    ConnectionOptions options_;
    Factory factory_;

    mutable std::mutex mutex_;
    std::map<std::string, std::shared_ptr<IServerConnection>> connections_;
    bool shut_down_ = false;
};

} // namespace agent_relay
