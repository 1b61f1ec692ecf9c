#pragma once

#include <agent_relay/core/result.hpp>

#include <chrono>
#include <cstddef>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <sys/types.h>
#include <vector>

namespace agent_relay {

using Deadline = std::chrono::steady_clock::time_point;

struct SpawnOptions {
    std::string command;
    std::vector<std::string> args;
    // Added on top of the inherited parent environment; entries win.
    std::map<std::string, std::string> env;
    // Bytes of stderr kept (oldest dropped first).
    std::size_t stderr_limit = 16384;
};

// ---------------------------------------------------------------------------
// ChildProcess: a spawned POSIX child with piped stdin/stdout/stderr.
//
// stdout is consumed through ReadLine/ReadExact against a deadline; stderr is
// drained on every poll into a bounded tail so a chatty child never blocks
// on a full pipe. Not thread-safe: callers serialize access.
// ---------------------------------------------------------------------------
class ChildProcess {
public:
    ~ChildProcess();

    ChildProcess(const ChildProcess&) = delete;
    ChildProcess& operator=(const ChildProcess&) = delete;

    static Result<std::unique_ptr<ChildProcess>, Error> Spawn(const SpawnOptions& options);

    Result<void, Error> WriteAll(std::string_view data);

    /// Next line from stdout without the trailing "\n" / "\r\n".
    /// EOF before any byte is a ProcessExited error; an elapsed deadline is a
    /// Timeout error and leaves buffered bytes in place.
    Result<std::string, Error> ReadLine(Deadline deadline);

    /// Exactly n bytes from stdout.
    Result<std::string, Error> ReadExact(std::size_t n, Deadline deadline);

    /// Reads stdout and stderr until both reach EOF. Used for one-shot
    /// commands whose stdin was closed.
    Result<void, Error> ReadUntilExit(Deadline deadline, std::string& out);

    /// Drains whatever stderr is immediately available and returns the tail.
    std::string StderrTail();

    void CloseStdin();

    /// SIGKILL and reap. Idempotent.
    void Kill();

    /// Close stdin, SIGTERM, wait up to `grace`, then SIGKILL.
    void Terminate(std::chrono::milliseconds grace);

    /// Non-blocking liveness check (reaps the child if it exited).
    [[nodiscard]] bool IsRunning();

    /// Blocks until the child exits and returns its exit status.
    int Wait();

    [[nodiscard]] std::optional<int> ExitCode() const { return exit_code_; }
    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }

private:
    ChildProcess() = default;

    enum class PumpResult { Data, Eof, TimedOut, Failed };
    PumpResult Pump(Deadline deadline);
    void DrainStderrNonBlocking();
    void AppendStderr(const char* data, std::size_t n);
    void CloseFd(int& fd);
    void RecordExit(int status);

    pid_t pid_ = -1;
    int stdin_fd_ = -1;
    int stdout_fd_ = -1;
    int stderr_fd_ = -1;
    bool stdout_eof_ = false;
    std::optional<int> exit_code_;
    std::string stdout_buf_;
    std::string stderr_tail_;
    std::size_t stderr_limit_ = 16384;
    std::string command_;
};

/// Output of a one-shot command run through RunCommand.
struct CommandOutput {
    std::string stdout_text;
    std::string stderr_text;
    int exit_code = 0;
};

/// Runs `/bin/sh -c <command_line>` with stdin closed. On timeout the child
/// is killed and a Timeout error returned.
Result<CommandOutput, Error> RunShellCommand(const std::string& command_line,
                                             std::chrono::seconds timeout);

} // namespace agent_relay
