#include <agent_relay/rpc/child_process.hpp>

#include <agent_relay/core/log.hpp>

#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <mutex>
#include <thread>

#include <fcntl.h>
#include <poll.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace agent_relay {

namespace {

std::string ErrnoMessage(int err) {
    return std::strerror(err);
}

// Writes to a child that already exited must surface as EPIPE, not kill us.
void IgnoreSigpipeOnce() {
    static std::once_flag flag;
    std::call_once(flag, [] { std::signal(SIGPIPE, SIG_IGN); });
}

void ClosePair(int fds[2]) {
    if (fds[0] >= 0) ::close(fds[0]);
    if (fds[1] >= 0) ::close(fds[1]);
    fds[0] = fds[1] = -1;
}

int RemainingMs(Deadline deadline) {
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    if (remaining.count() <= 0) return 0;
    if (remaining.count() > 60 * 60 * 1000) return 60 * 60 * 1000;
    return static_cast<int>(remaining.count());
}

// Report a failed step of the child-side setup to the parent and exit.
[[noreturn]] void ChildFail(int error_fd) {
    int err = errno;
    (void)::write(error_fd, &err, sizeof(err));
    _exit(127);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Spawn
// ---------------------------------------------------------------------------
Result<std::unique_ptr<ChildProcess>, Error> ChildProcess::Spawn(
    const SpawnOptions& options) {
    IgnoreSigpipeOnce();

    auto fail = [&](const std::string& what, int err) {
        return Result<std::unique_ptr<ChildProcess>, Error>::Err(Error{
            "ChildProcess::Spawn", options.command,
            what + ": " + ErrnoMessage(err), std::nullopt,
            ErrorCategory::Initialization});
    };

    if (options.command.empty()) {
        return Result<std::unique_ptr<ChildProcess>, Error>::Err(Error{
            "ChildProcess::Spawn", "", "Command must not be empty", std::nullopt,
            ErrorCategory::Configuration});
    }

    // O_CLOEXEC keeps sibling children from inheriting our pipe ends, which
    // would otherwise hide EOF when one of them exits.
    int in_pipe[2] = {-1, -1};
    int out_pipe[2] = {-1, -1};
    int err_pipe[2] = {-1, -1};
    int exec_pipe[2] = {-1, -1};
    if (::pipe2(in_pipe, O_CLOEXEC) != 0) {
        return fail("Failed to create stdin pipe", errno);
    }
    if (::pipe2(out_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        ClosePair(in_pipe);
        return fail("Failed to create stdout pipe", err);
    }
    if (::pipe2(err_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        ClosePair(in_pipe);
        ClosePair(out_pipe);
        return fail("Failed to create stderr pipe", err);
    }
    if (::pipe2(exec_pipe, O_CLOEXEC) != 0) {
        int err = errno;
        ClosePair(in_pipe);
        ClosePair(out_pipe);
        ClosePair(err_pipe);
        return fail("Failed to create exec status pipe", err);
    }

    // Build argv before forking; only async-signal-safe calls after fork.
    std::vector<char*> argv;
    argv.push_back(const_cast<char*>(options.command.c_str()));
    for (const auto& arg : options.args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ClosePair(in_pipe);
        ClosePair(out_pipe);
        ClosePair(err_pipe);
        ClosePair(exec_pipe);
        return fail("Failed to fork", err);
    }

    if (pid == 0) {
        ::close(exec_pipe[0]);
        if (::dup2(in_pipe[0], STDIN_FILENO) < 0) ChildFail(exec_pipe[1]);
        if (::dup2(out_pipe[1], STDOUT_FILENO) < 0) ChildFail(exec_pipe[1]);
        if (::dup2(err_pipe[1], STDERR_FILENO) < 0) ChildFail(exec_pipe[1]);
        ::signal(SIGPIPE, SIG_DFL);
        for (const auto& [key, value] : options.env) {
            ::setenv(key.c_str(), value.c_str(), 1);
        }
        ::execvp(options.command.c_str(), argv.data());
        ChildFail(exec_pipe[1]);
    }

    ::close(in_pipe[0]);
    ::close(out_pipe[1]);
    ::close(err_pipe[1]);
    ::close(exec_pipe[1]);

    int child_errno = 0;
    ssize_t n = 0;
    do {
        n = ::read(exec_pipe[0], &child_errno, sizeof(child_errno));
    } while (n < 0 && errno == EINTR);
    ::close(exec_pipe[0]);

    if (n > 0) {
        ::waitpid(pid, nullptr, 0);
        ::close(in_pipe[1]);
        ::close(out_pipe[0]);
        ::close(err_pipe[0]);
        return fail("Failed to start '" + options.command + "'", child_errno);
    }

    std::unique_ptr<ChildProcess> child(new ChildProcess());
    child->pid_ = pid;
    child->stdin_fd_ = in_pipe[1];
    child->stdout_fd_ = out_pipe[0];
    child->stderr_fd_ = err_pipe[0];
    child->stderr_limit_ = options.stderr_limit;
    child->command_ = options.command;

    LogDebug("process", "spawned '" + options.command + "' pid " + std::to_string(pid));
    return Result<std::unique_ptr<ChildProcess>, Error>::Ok(std::move(child));
}

ChildProcess::~ChildProcess() {
    Kill();
    CloseFd(stdout_fd_);
    CloseFd(stderr_fd_);
}

// ---------------------------------------------------------------------------
// I/O
// ---------------------------------------------------------------------------
Result<void, Error> ChildProcess::WriteAll(std::string_view data) {
    if (stdin_fd_ < 0) {
        return Result<void, Error>::Err(Error{
            "ChildProcess::WriteAll", command_, "stdin is closed", std::nullopt,
            ErrorCategory::ProcessExited});
    }
    std::size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            int err = errno;
            auto category = (err == EPIPE) ? ErrorCategory::ProcessExited
                                           : ErrorCategory::Connection;
            return Result<void, Error>::Err(Error{
                "ChildProcess::WriteAll", command_,
                "Write failed: " + ErrnoMessage(err), std::nullopt, category});
        }
        written += static_cast<std::size_t>(n);
    }
    return Result<void, Error>::Ok();
}

ChildProcess::PumpResult ChildProcess::Pump(Deadline deadline) {
    for (;;) {
        pollfd fds[2];
        nfds_t count = 0;
        int out_index = -1;
        int err_index = -1;
        if (!stdout_eof_ && stdout_fd_ >= 0) {
            out_index = static_cast<int>(count);
            fds[count++] = pollfd{stdout_fd_, POLLIN, 0};
        }
        if (stderr_fd_ >= 0) {
            err_index = static_cast<int>(count);
            fds[count++] = pollfd{stderr_fd_, POLLIN, 0};
        }
        if (count == 0) {
            return PumpResult::Eof;
        }

        int ready = ::poll(fds, count, RemainingMs(deadline));
        if (ready < 0) {
            if (errno == EINTR) continue;
            return PumpResult::Failed;
        }
        if (ready == 0) {
            return PumpResult::TimedOut;
        }

        char buf[4096];
        if (err_index >= 0 && fds[err_index].revents != 0) {
            ssize_t n = ::read(stderr_fd_, buf, sizeof(buf));
            if (n > 0) {
                AppendStderr(buf, static_cast<std::size_t>(n));
            } else if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                CloseFd(stderr_fd_);
            }
        }
        if (out_index >= 0 && fds[out_index].revents != 0) {
            ssize_t n = ::read(stdout_fd_, buf, sizeof(buf));
            if (n > 0) {
                stdout_buf_.append(buf, static_cast<std::size_t>(n));
                return PumpResult::Data;
            }
            if (n == 0 || (errno != EINTR && errno != EAGAIN)) {
                stdout_eof_ = true;
                CloseFd(stdout_fd_);
                return PumpResult::Eof;
            }
        }
        return PumpResult::Data;
    }
}

Result<std::string, Error> ChildProcess::ReadLine(Deadline deadline) {
    for (;;) {
        auto pos = stdout_buf_.find('\n');
        if (pos != std::string::npos) {
            std::string line = stdout_buf_.substr(0, pos);
            stdout_buf_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') {
                line.pop_back();
            }
            return Result<std::string, Error>::Ok(std::move(line));
        }
        if (stdout_eof_) {
            if (!stdout_buf_.empty()) {
                std::string rest = std::move(stdout_buf_);
                stdout_buf_.clear();
                return Result<std::string, Error>::Ok(std::move(rest));
            }
            return Result<std::string, Error>::Err(Error{
                "ChildProcess::ReadLine", command_, "Server closed connection (EOF)",
                std::nullopt, ErrorCategory::ProcessExited});
        }
        auto pumped = Pump(deadline);
        if (pumped == PumpResult::TimedOut) {
            return Result<std::string, Error>::Err(Error{
                "ChildProcess::ReadLine", command_, "Timed out waiting for output",
                std::nullopt, ErrorCategory::Timeout});
        }
        if (pumped == PumpResult::Failed) {
            return Result<std::string, Error>::Err(Error{
                "ChildProcess::ReadLine", command_, "poll failed: " + ErrnoMessage(errno),
                std::nullopt, ErrorCategory::Internal});
        }
    }
}

Result<std::string, Error> ChildProcess::ReadExact(std::size_t n, Deadline deadline) {
    while (stdout_buf_.size() < n) {
        if (stdout_eof_) {
            return Result<std::string, Error>::Err(Error{
                "ChildProcess::ReadExact", command_,
                "Server closed connection (EOF) after " +
                    std::to_string(stdout_buf_.size()) + " of " + std::to_string(n) + " bytes",
                std::nullopt, ErrorCategory::ProcessExited});
        }
        auto pumped = Pump(deadline);
        if (pumped == PumpResult::TimedOut) {
            return Result<std::string, Error>::Err(Error{
                "ChildProcess::ReadExact", command_, "Timed out waiting for message body",
                std::nullopt, ErrorCategory::Timeout});
        }
        if (pumped == PumpResult::Failed) {
            return Result<std::string, Error>::Err(Error{
                "ChildProcess::ReadExact", command_, "poll failed: " + ErrnoMessage(errno),
                std::nullopt, ErrorCategory::Internal});
        }
    }
    std::string body = stdout_buf_.substr(0, n);
    stdout_buf_.erase(0, n);
    return Result<std::string, Error>::Ok(std::move(body));
}

Result<void, Error> ChildProcess::ReadUntilExit(Deadline deadline, std::string& out) {
    while (!stdout_eof_ || stderr_fd_ >= 0) {
        auto pumped = Pump(deadline);
        if (pumped == PumpResult::TimedOut) {
            return Result<void, Error>::Err(Error{
                "ChildProcess::ReadUntilExit", command_, "Timed out", std::nullopt,
                ErrorCategory::Timeout});
        }
        if (pumped == PumpResult::Failed) {
            return Result<void, Error>::Err(Error{
                "ChildProcess::ReadUntilExit", command_, "poll failed: " + ErrnoMessage(errno),
                std::nullopt, ErrorCategory::Internal});
        }
    }
    out = std::move(stdout_buf_);
    stdout_buf_.clear();
    return Result<void, Error>::Ok();
}

void ChildProcess::DrainStderrNonBlocking() {
    while (stderr_fd_ >= 0) {
        pollfd fd{stderr_fd_, POLLIN, 0};
        int ready = ::poll(&fd, 1, 0);
        if (ready <= 0) return;
        char buf[4096];
        ssize_t n = ::read(stderr_fd_, buf, sizeof(buf));
        if (n > 0) {
            AppendStderr(buf, static_cast<std::size_t>(n));
        } else {
            CloseFd(stderr_fd_);
        }
    }
}

void ChildProcess::AppendStderr(const char* data, std::size_t n) {
    stderr_tail_.append(data, n);
    if (stderr_tail_.size() > stderr_limit_) {
        stderr_tail_.erase(0, stderr_tail_.size() - stderr_limit_);
    }
}

std::string ChildProcess::StderrTail() {
    DrainStderrNonBlocking();
    return stderr_tail_;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------
void ChildProcess::CloseFd(int& fd) {
    if (fd >= 0) {
        ::close(fd);
        fd = -1;
    }
}

void ChildProcess::CloseStdin() {
    CloseFd(stdin_fd_);
}

void ChildProcess::RecordExit(int status) {
    if (WIFEXITED(status)) {
        exit_code_ = WEXITSTATUS(status);
    } else if (WIFSIGNALED(status)) {
        exit_code_ = 128 + WTERMSIG(status);
    } else {
        exit_code_ = -1;
    }
    pid_ = -1;
}

bool ChildProcess::IsRunning() {
    if (pid_ <= 0) return false;
    int status = 0;
    pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) return true;
    if (r == pid_) {
        RecordExit(status);
    } else {
        pid_ = -1;
    }
    return false;
}

int ChildProcess::Wait() {
    if (pid_ <= 0) return exit_code_.value_or(-1);
    int status = 0;
    pid_t r = 0;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
        RecordExit(status);
    } else {
        pid_ = -1;
        exit_code_ = -1;
    }
    return exit_code_.value_or(-1);
}

void ChildProcess::Kill() {
    CloseStdin();
    if (pid_ <= 0) return;
    if (IsRunning()) {
        ::kill(pid_, SIGKILL);
        Wait();
    }
}

void ChildProcess::Terminate(std::chrono::milliseconds grace) {
    CloseStdin();
    if (!IsRunning()) return;
    ::kill(pid_, SIGTERM);
    auto until = std::chrono::steady_clock::now() + grace;
    while (std::chrono::steady_clock::now() < until) {
        if (!IsRunning()) return;
        std::this_thread::sleep_for(std::chrono::milliseconds(20));
    }
    Kill();
}

// ---------------------------------------------------------------------------
// RunShellCommand
// ---------------------------------------------------------------------------
Result<CommandOutput, Error> RunShellCommand(const std::string& command_line,
                                             std::chrono::seconds timeout) {
    SpawnOptions options;
    options.command = "/bin/sh";
    options.args = {"-c", command_line};
    options.stderr_limit = 1024 * 1024;

    auto spawned = ChildProcess::Spawn(options);
    if (spawned.IsErr()) {
        return Result<CommandOutput, Error>::Err(spawned.Error());
    }
    auto child = std::move(spawned).Value();
    child->CloseStdin();

    CommandOutput output;
    auto read = child->ReadUntilExit(std::chrono::steady_clock::now() + timeout,
                                     output.stdout_text);
    if (read.IsErr()) {
        child->Kill();
        return Result<CommandOutput, Error>::Err(read.Error());
    }
    output.stderr_text = child->StderrTail();
    output.exit_code = child->Wait();
    return Result<CommandOutput, Error>::Ok(std::move(output));
}

} // namespace agent_relay
