#pragma once

#include <discord_mcp/core/result.hpp>
#include <discord_mcp/mcp/line_channel.hpp>
#include <discord_mcp/mcp/tool_registry.hpp>

#include <cstdint>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

namespace discord_mcp {

inline constexpr const char* kClientName = "discord-mcp-client";

// ---------------------------------------------------------------------------
// ServerInfo: what the server reported during the initialize handshake.
// ---------------------------------------------------------------------------
struct ServerInfo {
    std::string name;
    std::string version;
    std::string protocol_version;
};

// ---------------------------------------------------------------------------
// McpClient: JSON-RPC 2.0 client side of an MCP session.
//
// One request in flight at a time. While waiting for a response, server
// notifications and responses carrying another id are skipped.
//
// A JSON-RPC error response becomes an Error whose category is taken from
// error.data.kind when the server supplied one, otherwise InvalidParams for
// -32602 and Protocol for everything else. Channel failures are Protocol.
// ---------------------------------------------------------------------------
class McpClient {
public:
    explicit McpClient(ILineChannel& channel) : channel_(channel) {}

    // initialize + notifications/initialized.
    [[nodiscard]] Result<ServerInfo, Error> Initialize();

    [[nodiscard]] Result<std::vector<ToolSchema>, Error> ListTools();

    [[nodiscard]] Result<ToolResult, Error> CallTool(
        const std::string& name, const nlohmann::json& arguments);

    [[nodiscard]] Result<void, Error> Ping();

private:
    // Send a request and wait for its result member.
    Result<nlohmann::json, Error> Request(const std::string& method,
                                          const nlohmann::json& params);
    Result<void, Error> Notify(const std::string& method);

    ILineChannel& channel_;
    int64_t next_id_ = 1;
};

/// Concatenate the text blocks of a content array, one per line.
std::string ContentText(const nlohmann::json& content);

} // namespace discord_mcp
