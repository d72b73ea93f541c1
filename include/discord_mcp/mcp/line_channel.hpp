#pragma once

#include <discord_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace discord_mcp {

// ---------------------------------------------------------------------------
// ILineChannel: a bidirectional, newline-delimited message channel.
//
// Used by McpClient to talk to a server. Production implementation is
// SubprocessChannel (pipes to a spawned server); tests use an in-process
// loopback.
// ---------------------------------------------------------------------------
class ILineChannel {
public:
    virtual ~ILineChannel() = default;

    // Write one message; the channel appends the newline.
    [[nodiscard]] virtual Result<void, Error> WriteLine(std::string_view line) = 0;

    // Read the next message without its trailing newline.
    // EOF is reported as a Protocol error.
    [[nodiscard]] virtual Result<std::string, Error> ReadLine() = 0;

    ILineChannel(const ILineChannel&) = delete;
    ILineChannel& operator=(const ILineChannel&) = delete;

protected:
    ILineChannel() = default;
};

} // namespace discord_mcp
