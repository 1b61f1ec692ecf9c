#include <agent_relay/rpc/server_connection.hpp>

#include <agent_relay/core/log.hpp>
#include <agent_relay/core/version.hpp>
#include <agent_relay/rpc/rpc_codec.hpp>

namespace agent_relay {

namespace {

constexpr std::size_t kTimeoutStderrChars = 300;
constexpr std::chrono::milliseconds kShutdownGrace{200};

// Child servers written in Python or Node print through these knobs.
void AddRuntimeEnvironment(std::map<std::string, std::string>& env) {
    env["PYTHONIOENCODING"] = "utf-8";
    env["PYTHONUTF8"] = "1";
    env["NO_UPDATE_NOTIFIER"] = "1";
}

std::optional<std::string> StderrDetail(const std::string& text) {
    if (text.empty()) return std::nullopt;
    return "Stderr: " + text;
}

} // anonymous namespace

const char* ConnectionStateName(ConnectionState state) {
    switch (state) {
        case ConnectionState::Stopped:     return "stopped";
        case ConnectionState::Starting:    return "starting";
        case ConnectionState::Initialized: return "initialized";
        case ConnectionState::Busy:        return "busy";
    }
    return "unknown";
}

ServerConnection::ServerConnection(std::string name, ServerConfig config,
                                   ConnectionOptions options)
    : name_(std::move(name)),
      config_(std::move(config)),
      options_(options) {}

ServerConnection::~ServerConnection() {
    Shutdown();
}

bool ServerConnection::IsInitialized() const {
    auto state = state_.load();
    return state == ConnectionState::Initialized || state == ConnectionState::Busy;
}

nlohmann::json ServerConnection::ServerInfo() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return server_info_;
}

pid_t ServerConnection::ProcessId() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return process_ ? process_->Pid() : -1;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
Result<void, Error> ServerConnection::EnsureRunning() {
    std::lock_guard<std::mutex> lock(mutex_);
    return EnsureRunningLocked();
}

Result<void, Error> ServerConnection::EnsureRunningLocked() {
    if (process_ && process_->IsRunning() && IsInitialized()) {
        return Result<void, Error>::Ok();
    }
    if (process_) {
        LogWarn(LogComponent(), "process not running or not initialized, restarting");
    }
    StopLocked();
    state_ = ConnectionState::Starting;

    SpawnOptions spawn;
    spawn.command = config_.command;
    spawn.args = config_.args;
    spawn.env = config_.env;
    AddRuntimeEnvironment(spawn.env);

    auto spawned = ChildProcess::Spawn(spawn);
    if (spawned.IsErr()) {
        state_ = ConnectionState::Stopped;
        auto err = spawned.Error();
        return Result<void, Error>::Err(Error{
            "ServerConnection::EnsureRunning", name_,
            "Init failed for " + name_ + ": " + err.message, err.detail,
            ErrorCategory::Initialization});
    }
    process_ = std::move(spawned).Value();
    LogInfo(LogComponent(), "started '" + config_.command + "' (pid " +
                                std::to_string(process_->Pid()) + ")");

    nlohmann::json params = {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {{"name", "agent-relay"}, {"version", kVersion}}},
    };
    auto init = ExchangeLocked("initialize", params, options_.init_timeout);
    if (init.IsErr()) {
        auto stderr_text = process_ ? process_->StderrTail() : std::string();
        StopLocked();
        LogError(LogComponent(), "initialize failed: " + init.Error().message);
        return Result<void, Error>::Err(Error{
            "ServerConnection::EnsureRunning", name_,
            "Init failed for " + name_ + ": " + init.Error().message,
            StderrDetail(stderr_text), ErrorCategory::Initialization});
    }
    const auto& result = init.Value();
    server_info_ = result.contains("serverInfo") ? result["serverInfo"] : nlohmann::json();

    auto notified = process_->WriteAll(
        EncodeMessage("notifications/initialized", nlohmann::json(), std::nullopt));
    if (notified.IsErr()) {
        auto stderr_text = process_->StderrTail();
        StopLocked();
        return Result<void, Error>::Err(Error{
            "ServerConnection::EnsureRunning", name_,
            "Init failed for " + name_ + ": " + notified.Error().message,
            StderrDetail(stderr_text), ErrorCategory::Initialization});
    }

    state_ = ConnectionState::Initialized;
    LogInfo(LogComponent(), "initialized");
    return Result<void, Error>::Ok();
}

void ServerConnection::StopLocked() {
    if (process_) {
        process_->Terminate(kShutdownGrace);
        process_.reset();
    }
    state_ = ConnectionState::Stopped;
}

void ServerConnection::Shutdown() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (process_) {
        LogInfo(LogComponent(), "shutting down");
    }
    StopLocked();
}

// ---------------------------------------------------------------------------
// Exchange
// ---------------------------------------------------------------------------
Result<nlohmann::json, Error> ServerConnection::ExchangeLocked(
    const std::string& method, const nlohmann::json& params,
    std::chrono::seconds timeout) {
    const auto id = next_id_.fetch_add(1);
    auto written = process_->WriteAll(EncodeMessage(method, params, id));
    if (written.IsErr()) {
        return Result<nlohmann::json, Error>::Err(written.Error());
    }
    ProcessMessageSource source(*process_, std::chrono::steady_clock::now() + timeout);
    auto response = DecodeOne(source, id, options_.max_scan_lines);
    if (response.IsErr()) {
        return Result<nlohmann::json, Error>::Err(response.Error());
    }
    return ExtractResult(response.Value());
}

Result<nlohmann::json, Error> ServerConnection::SendRequest(
    const std::string& method, const nlohmann::json& params) {
    std::lock_guard<std::mutex> lock(mutex_);

    auto running = EnsureRunningLocked();
    if (running.IsErr()) {
        return Result<nlohmann::json, Error>::Err(running.Error());
    }

    state_ = ConnectionState::Busy;
    LogDebug(LogComponent(), "-> " + method);
    auto result = ExchangeLocked(method, params, options_.request_timeout);
    if (result.IsOk()) {
        state_ = ConnectionState::Initialized;
        return result;
    }

    auto err = result.Error();
    err.operation = "ServerConnection::SendRequest";
    err.target = name_;

    switch (err.category) {
        case ErrorCategory::Timeout: {
            auto stderr_text = process_->StderrTail().substr(0, kTimeoutStderrChars);
            LogError(LogComponent(), method + " timed out, killing server");
            process_->Kill();
            process_.reset();
            state_ = ConnectionState::Stopped;
            return Result<nlohmann::json, Error>::Err(Error{
                err.operation, name_, "MCP server '" + name_ + "' timed out",
                StderrDetail(stderr_text), ErrorCategory::Timeout});
        }
        case ErrorCategory::ProcessExited: {
            auto stderr_text = process_->StderrTail();
            process_->Kill();
            auto code = process_->ExitCode();
            process_.reset();
            state_ = ConnectionState::Stopped;
            LogError(LogComponent(), "server exited during " + method +
                                         (code ? " (exit code " + std::to_string(*code) + ")" : ""));
            err.detail = StderrDetail(stderr_text);
            return Result<nlohmann::json, Error>::Err(err);
        }
        case ErrorCategory::Connection: {
            process_->Kill();
            process_.reset();
            state_ = ConnectionState::Stopped;
            return Result<nlohmann::json, Error>::Err(err);
        }
        default:
            // RpcError, NoResponse, ProtocolDecode: the process is still usable.
            LogWarn(LogComponent(), method + " failed: " + err.message);
            state_ = ConnectionState::Initialized;
            return Result<nlohmann::json, Error>::Err(err);
    }
}

} // namespace agent_relay
