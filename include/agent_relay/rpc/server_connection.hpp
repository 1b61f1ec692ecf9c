#pragma once

#include <agent_relay/core/result.hpp>
#include <agent_relay/rpc/child_process.hpp>

#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace agent_relay {

constexpr const char* kMcpProtocolVersion = "2024-11-05";

// Launch description of one external tool server.
struct ServerConfig {
    std::string command;
    std::vector<std::string> args;
    std::map<std::string, std::string> env;
    std::string description;
};

struct ConnectionOptions {
    std::chrono::seconds init_timeout{60};
    std::chrono::seconds request_timeout{120};
    int max_scan_lines = 200;
};

enum class ConnectionState {
    Stopped,
    Starting,
    Initialized,
    Busy,
};

const char* ConnectionStateName(ConnectionState state);

// ---------------------------------------------------------------------------
// IServerConnection: one named external tool server speaking JSON-RPC over
// stdio. At most one exchange is in flight per connection.
// ---------------------------------------------------------------------------
class IServerConnection {
public:
    virtual ~IServerConnection() = default;

    [[nodiscard]] virtual const std::string& Name() const = 0;

    /// Starts and initializes the server if it is not running.
    virtual Result<void, Error> EnsureRunning() = 0;

    /// One request/response exchange; returns the response's "result".
    virtual Result<nlohmann::json, Error> SendRequest(
        const std::string& method, const nlohmann::json& params) = 0;

    virtual void Shutdown() = 0;

    [[nodiscard]] virtual bool IsInitialized() const = 0;
    [[nodiscard]] virtual ConnectionState State() const = 0;

    IServerConnection(const IServerConnection&) = delete;
    IServerConnection& operator=(const IServerConnection&) = delete;

protected:
    IServerConnection() = default;
};

// ---------------------------------------------------------------------------
// ServerConnection: owns the child process. Restarts lazily on the next
// request after a timeout, crash or failed handshake.
// ---------------------------------------------------------------------------
class ServerConnection : public IServerConnection {
public:
    ServerConnection(std::string name, ServerConfig config, ConnectionOptions options);
    ~ServerConnection() override;

    [[nodiscard]] const std::string& Name() const override { return name_; }

    Result<void, Error> EnsureRunning() override;
    Result<nlohmann::json, Error> SendRequest(
        const std::string& method, const nlohmann::json& params) override;
    void Shutdown() override;

    [[nodiscard]] bool IsInitialized() const override;
    [[nodiscard]] ConnectionState State() const override { return state_.load(); }

    /// serverInfo from the last successful handshake (null before).
    [[nodiscard]] nlohmann::json ServerInfo() const;

    /// pid of the live child, or -1.
    [[nodiscard]] pid_t ProcessId() const;

    /// Ids handed out so far; never reset across restarts.
    [[nodiscard]] std::int64_t LastRequestId() const { return next_id_.load() - 1; }

private:
    Result<void, Error> EnsureRunningLocked();
    Result<nlohmann::json, Error> ExchangeLocked(const std::string& method,
                                                 const nlohmann::json& params,
                                                 std::chrono::seconds timeout);
    void StopLocked();
    [[nodiscard]] std::string LogComponent() const { return "mcp:" + name_; }

    std::string name_;
    ServerConfig config_;
    ConnectionOptions options_;

    mutable std::mutex mutex_;
    std::unique_ptr<ChildProcess> process_;
    std::atomic<ConnectionState> state_{ConnectionState::Stopped};
    std::atomic<std::int64_t> next_id_{1};
    nlohmann::json server_info_;
};

} // namespace agent_relay
