#include <discord_mcp/mcp/subprocess.hpp>

#include <discord_mcp/core/log.hpp>

#include <cerrno>
#include <cstring>
#include <thread>

#include <fcntl.h>
#include <signal.h>
#include <sys/wait.h>
#include <unistd.h>

namespace discord_mcp {

namespace {

constexpr std::chrono::milliseconds kExitGracePeriod{2000};
constexpr std::chrono::milliseconds kTerminateGracePeriod{1000};
constexpr std::chrono::milliseconds kPollInterval{20};

Error MakeProcessError(const std::string& operation,
                       const std::string& executable,
                       const std::string& message) {
    return Error{operation, executable, std::nullopt, message, std::nullopt,
                 ErrorCategory::Protocol};
}

std::string ErrnoMessage(int err) {
    return std::strerror(err);
}

void ClosePair(int (&fds)[2]) {
    for (int& fd : fds) {
        if (fd >= 0) {
            ::close(fd);
            fd = -1;
        }
    }
}

int DecodeWaitStatus(int status) {
    if (WIFEXITED(status)) return WEXITSTATUS(status);
    if (WIFSIGNALED(status)) return 128 + WTERMSIG(status);
    return -1;
}

// Child side: report errno to the parent and exit without running atexit
// handlers inherited from the parent.
[[noreturn]] void FailChild(int error_fd) {
    int err = errno;
    (void)!::write(error_fd, &err, sizeof(err));
    _exit(127);
}

} // anonymous namespace

Result<std::unique_ptr<Subprocess>, Error> Subprocess::Spawn(
    const std::string& executable,
    const std::vector<std::string>& args,
    const EnvironmentOverrides& env) {
    using R = Result<std::unique_ptr<Subprocess>, Error>;

    int stdin_pipe[2] = {-1, -1};
    int stdout_pipe[2] = {-1, -1};
    int error_pipe[2] = {-1, -1};

    if (::pipe(stdin_pipe) != 0) {
        return R::Err(MakeProcessError("Spawn", executable,
            "Failed to create stdin pipe: " + ErrnoMessage(errno)));
    }
    if (::pipe(stdout_pipe) != 0) {
        int err = errno;
        ClosePair(stdin_pipe);
        return R::Err(MakeProcessError("Spawn", executable,
            "Failed to create stdout pipe: " + ErrnoMessage(err)));
    }
    if (::pipe(error_pipe) != 0) {
        int err = errno;
        ClosePair(stdin_pipe);
        ClosePair(stdout_pipe);
        return R::Err(MakeProcessError("Spawn", executable,
            "Failed to create error pipe: " + ErrnoMessage(err)));
    }
    ::fcntl(error_pipe[1], F_SETFD, FD_CLOEXEC);
    // Parent ends must not leak into this or any later child.
    ::fcntl(stdin_pipe[1], F_SETFD, FD_CLOEXEC);
    ::fcntl(stdout_pipe[0], F_SETFD, FD_CLOEXEC);

    // argv is built before fork so the child only touches prepared memory.
    std::vector<char*> argv;
    argv.reserve(args.size() + 2);
    argv.push_back(const_cast<char*>(executable.c_str()));
    for (const auto& arg : args) {
        argv.push_back(const_cast<char*>(arg.c_str()));
    }
    argv.push_back(nullptr);

    pid_t pid = ::fork();
    if (pid < 0) {
        int err = errno;
        ClosePair(stdin_pipe);
        ClosePair(stdout_pipe);
        ClosePair(error_pipe);
        return R::Err(MakeProcessError("Spawn", executable,
            "Failed to fork process: " + ErrnoMessage(err)));
    }

    if (pid == 0) {
        ::close(error_pipe[0]);
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        if (::dup2(stdin_pipe[0], STDIN_FILENO) < 0) FailChild(error_pipe[1]);
        if (::dup2(stdout_pipe[1], STDOUT_FILENO) < 0) FailChild(error_pipe[1]);
        ::close(stdin_pipe[0]);
        ::close(stdout_pipe[1]);

        ::signal(SIGPIPE, SIG_DFL);
        for (const auto& [key, value] : env) {
            if (::setenv(key.c_str(), value.c_str(), 1) != 0) {
                FailChild(error_pipe[1]);
            }
        }

        ::execvp(executable.c_str(), argv.data());
        FailChild(error_pipe[1]);
    }

    // Parent: the error pipe reads EOF on a successful exec.
    ::close(error_pipe[1]);
    ::close(stdin_pipe[0]);
    ::close(stdout_pipe[1]);

    int child_errno = 0;
    ssize_t error_bytes = 0;
    do {
        error_bytes = ::read(error_pipe[0], &child_errno, sizeof(child_errno));
    } while (error_bytes < 0 && errno == EINTR);
    ::close(error_pipe[0]);

    if (error_bytes > 0) {
        ::waitpid(pid, nullptr, 0);
        ::close(stdin_pipe[1]);
        ::close(stdout_pipe[0]);
        return R::Err(MakeProcessError("Spawn", executable,
            "Failed to execute '" + executable + "': " + ErrnoMessage(child_errno)));
    }

    LogDebug("process", "Spawned " + executable + " (pid " +
                            std::to_string(pid) + ")");
    return R::Ok(std::unique_ptr<Subprocess>(
        new Subprocess(executable, pid, stdin_pipe[1], stdout_pipe[0])));
}

Subprocess::Subprocess(std::string executable, pid_t pid,
                       int stdin_fd, int stdout_fd)
    : executable_(std::move(executable)),
      pid_(pid),
      stdin_fd_(stdin_fd),
      stdout_fd_(stdout_fd) {}

Subprocess::~Subprocess() {
    CloseStdin();
    if (stdout_fd_ >= 0) {
        ::close(stdout_fd_);
        stdout_fd_ = -1;
    }
    if (exit_status_) return;

    if (WaitFor(kExitGracePeriod)) return;
    LogWarn("process", executable_ + " did not exit, sending SIGTERM");
    ::kill(pid_, SIGTERM);
    if (WaitFor(kTerminateGracePeriod)) return;
    ::kill(pid_, SIGKILL);
    (void)Wait();
}

Result<void, Error> Subprocess::Write(std::string_view data) {
    if (stdin_fd_ < 0) {
        return Result<void, Error>::Err(MakeProcessError(
            "Write", executable_, "stdin pipe is closed"));
    }
    size_t written = 0;
    while (written < data.size()) {
        ssize_t n = ::write(stdin_fd_, data.data() + written, data.size() - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            if (errno == EPIPE) {
                return Result<void, Error>::Err(MakeProcessError(
                    "Write", executable_, "Broken pipe (process closed stdin)"));
            }
            return Result<void, Error>::Err(MakeProcessError(
                "Write", executable_, "Write failed: " + ErrnoMessage(errno)));
        }
        written += static_cast<size_t>(n);
    }
    return Result<void, Error>::Ok();
}

Result<std::string, Error> Subprocess::ReadLine() {
    if (stdout_fd_ < 0) {
        return Result<std::string, Error>::Err(MakeProcessError(
            "ReadLine", executable_, "stdout pipe is closed"));
    }
    char chunk[4096];
    while (true) {
        auto pos = read_buffer_.find('\n');
        if (pos != std::string::npos) {
            std::string line = read_buffer_.substr(0, pos);
            read_buffer_.erase(0, pos + 1);
            if (!line.empty() && line.back() == '\r') line.pop_back();
            return Result<std::string, Error>::Ok(std::move(line));
        }

        ssize_t n = ::read(stdout_fd_, chunk, sizeof(chunk));
        if (n < 0) {
            if (errno == EINTR) continue;
            return Result<std::string, Error>::Err(MakeProcessError(
                "ReadLine", executable_, "Read failed: " + ErrnoMessage(errno)));
        }
        if (n == 0) {
            // A final unterminated line is still a line.
            if (!read_buffer_.empty()) {
                std::string line = std::move(read_buffer_);
                read_buffer_.clear();
                return Result<std::string, Error>::Ok(std::move(line));
            }
            return Result<std::string, Error>::Err(MakeProcessError(
                "ReadLine", executable_, "Process closed its output"));
        }
        read_buffer_.append(chunk, static_cast<size_t>(n));
    }
}

void Subprocess::CloseStdin() {
    if (stdin_fd_ >= 0) {
        ::close(stdin_fd_);
        stdin_fd_ = -1;
    }
}

Result<int, Error> Subprocess::Wait() {
    if (exit_status_) return Result<int, Error>::Ok(*exit_status_);

    int status = 0;
    pid_t result = 0;
    do {
        result = ::waitpid(pid_, &status, 0);
    } while (result < 0 && errno == EINTR);

    if (result != pid_) {
        return Result<int, Error>::Err(MakeProcessError(
            "Wait", executable_, "waitpid failed: " + ErrnoMessage(errno)));
    }
    exit_status_ = DecodeWaitStatus(status);
    LogDebug("process", executable_ + " exited with status " +
                            std::to_string(*exit_status_));
    return Result<int, Error>::Ok(*exit_status_);
}

std::optional<int> Subprocess::TryWait() {
    if (exit_status_) return exit_status_;

    int status = 0;
    pid_t result = ::waitpid(pid_, &status, WNOHANG);
    if (result == pid_) {
        exit_status_ = DecodeWaitStatus(status);
    } else if (result < 0 && errno == ECHILD) {
        // Reaped elsewhere; nothing left to wait for.
        exit_status_ = -1;
    }
    return exit_status_;
}

bool Subprocess::WaitFor(std::chrono::milliseconds timeout) {
    auto deadline = std::chrono::steady_clock::now() + timeout;
    while (std::chrono::steady_clock::now() < deadline) {
        if (TryWait()) return true;
        std::this_thread::sleep_for(kPollInterval);
    }
    return TryWait().has_value();
}

// ---------------------------------------------------------------------------
// SubprocessChannel
// ---------------------------------------------------------------------------

Result<void, Error> SubprocessChannel::WriteLine(std::string_view line) {
    std::string framed(line);
    framed.push_back('\n');
    return process_.Write(framed);
}

Result<std::string, Error> SubprocessChannel::ReadLine() {
    return process_.ReadLine();
}

} // namespace discord_mcp
