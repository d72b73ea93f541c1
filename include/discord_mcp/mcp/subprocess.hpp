#pragma once

#include <discord_mcp/core/result.hpp>
#include <discord_mcp/mcp/line_channel.hpp>

#include <chrono>
#include <map>
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include <sys/types.h>

namespace discord_mcp {

// Extra environment variables set in the child on top of the inherited ones.
using EnvironmentOverrides = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// Subprocess: a child process with piped stdin/stdout (POSIX only).
//
// stderr is inherited so the child's logs reach the parent's terminal.
// Exec failures are reported by Spawn through a close-on-exec error pipe
// rather than by a child that exits with 127.
//
// Destruction closes both pipes, waits briefly for the child to exit and
// terminates it (SIGTERM, then SIGKILL) if it does not.
// ---------------------------------------------------------------------------
class Subprocess {
public:
    [[nodiscard]] static Result<std::unique_ptr<Subprocess>, Error> Spawn(
        const std::string& executable,
        const std::vector<std::string>& args = {},
        const EnvironmentOverrides& env = {});

    ~Subprocess();

    Subprocess(const Subprocess&) = delete;
    Subprocess& operator=(const Subprocess&) = delete;
    Subprocess(Subprocess&&) = delete;
    Subprocess& operator=(Subprocess&&) = delete;

    // Write all of data to the child's stdin.
    [[nodiscard]] Result<void, Error> Write(std::string_view data);

    // Read one line from the child's stdout, without the trailing newline.
    // EOF before any byte is a Protocol error.
    [[nodiscard]] Result<std::string, Error> ReadLine();

    // Close the child's stdin so it sees EOF.
    void CloseStdin();

    // Block until the child exits; returns its exit status
    // (128 + signal number when killed by a signal).
    [[nodiscard]] Result<int, Error> Wait();

    // Non-blocking check; nullopt while the child is still running.
    [[nodiscard]] std::optional<int> TryWait();

    [[nodiscard]] pid_t Pid() const noexcept { return pid_; }
    [[nodiscard]] const std::string& Executable() const noexcept { return executable_; }

private:
    Subprocess(std::string executable, pid_t pid, int stdin_fd, int stdout_fd);

    bool WaitFor(std::chrono::milliseconds timeout);

    std::string executable_;
    pid_t pid_;
    int stdin_fd_;
    int stdout_fd_;
    std::string read_buffer_;
    std::optional<int> exit_status_;
};

// ---------------------------------------------------------------------------
// SubprocessChannel: ILineChannel over a Subprocess's stdin/stdout.
// Borrows the process; it must outlive the channel.
// ---------------------------------------------------------------------------
class SubprocessChannel : public ILineChannel {
public:
    explicit SubprocessChannel(Subprocess& process) : process_(process) {}

    [[nodiscard]] Result<void, Error> WriteLine(std::string_view line) override;
    [[nodiscard]] Result<std::string, Error> ReadLine() override;

private:
    Subprocess& process_;
};

} // namespace discord_mcp
