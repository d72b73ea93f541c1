#pragma once

#include <discord_mcp/core/result.hpp>
#include <discord_mcp/mcp/tool_registry.hpp>

#include <iostream>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace discord_mcp {

inline constexpr const char* kMcpProtocolVersion = "2024-11-05";
inline constexpr const char* kServerName = "discord-mcp";

// ---------------------------------------------------------------------------
// McpServer: MCP 2024-11-05 server over newline-delimited JSON-RPC 2.0.
//
// Methods:
//   - initialize
//   - ping
//   - tools/list
//   - tools/call
//   - notifications/* (no response)
//
// tools/call failures become JSON-RPC errors whose "data" carries the error
// kind (InvalidParams, UnknownTool, DeliveryError, ConfigurationError) and,
// for rejected deliveries, the HTTP status and response body.
// ---------------------------------------------------------------------------
class McpServer {
public:
    explicit McpServer(ToolRegistry registry,
                       std::istream& in = std::cin,
                       std::ostream& out = std::cout);

    // Run the server loop (blocks until EOF on the input stream).
    void Run();

    // Process a single JSON-RPC message and return the response (if any).
    // Returns nullopt for notifications.
    [[nodiscard]] std::optional<nlohmann::json> HandleMessage(
        const nlohmann::json& message);

    [[nodiscard]] bool IsInitialized() const noexcept { return initialized_; }

private:
    nlohmann::json HandleInitialize(const nlohmann::json& params,
                                    const nlohmann::json& id);
    nlohmann::json HandleToolsList(const nlohmann::json& id);
    nlohmann::json HandleToolsCall(const nlohmann::json& params,
                                   const nlohmann::json& id);
    void WriteMessage(const nlohmann::json& message);

    ToolRegistry registry_;
    std::istream& in_;
    std::ostream& out_;
    bool initialized_ = false;
};

// -- JSON-RPC envelope helpers (shared with McpClient and tests) -------------

nlohmann::json MakeRpcResult(const nlohmann::json& id, const nlohmann::json& result);

nlohmann::json MakeRpcError(const nlohmann::json& id, int code,
                            const std::string& message);

/// A JSON-RPC error response carrying a structured tool Error in "data".
nlohmann::json MakeRpcToolError(const nlohmann::json& id, const Error& error);

} // namespace discord_mcp
