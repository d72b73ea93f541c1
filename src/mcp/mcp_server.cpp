#include <discord_mcp/mcp/mcp_server.hpp>

#include <discord_mcp/core/log.hpp>
#include <discord_mcp/core/version.hpp>

#include <string>

namespace discord_mcp {

nlohmann::json MakeRpcResult(const nlohmann::json& id,
                             const nlohmann::json& result) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"result", result}
    };
}

nlohmann::json MakeRpcError(const nlohmann::json& id, int code,
                            const std::string& message) {
    return {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"error", {
            {"code", code},
            {"message", message}
        }}
    };
}

nlohmann::json MakeRpcToolError(const nlohmann::json& id, const Error& error) {
    auto response = MakeRpcError(id, error.JsonRpcCode(), error.message);
    nlohmann::json data = {{"kind", error.CategoryName()}};
    if (error.http_status.has_value()) {
        data["http_status"] = *error.http_status;
    }
    if (error.response_body.has_value()) {
        data["response_body"] = *error.response_body;
    }
    response["error"]["data"] = data;
    return response;
}

McpServer::McpServer(ToolRegistry registry,
                     std::istream& in,
                     std::ostream& out)
    : registry_(std::move(registry)), in_(in), out_(out) {}

void McpServer::Run() {
    LogInfo("mcp", "Serving " + std::to_string(registry_.Tools().size()) +
                       " tool(s) on stdio");
    std::string line;
    while (std::getline(in_, line)) {
        if (line.empty() || line == "\r") continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line);
        } catch (const nlohmann::json::exception& e) {
            LogWarn("mcp", std::string("Unparseable message: ") + e.what());
            WriteMessage(MakeRpcError(nullptr, kJsonRpcParseError, "Parse error"));
            continue;
        }

        std::optional<nlohmann::json> response;
        try {
            response = HandleMessage(message);
        } catch (const nlohmann::json::exception& e) {
            LogError("mcp", std::string("Request failed: ") + e.what());
            auto id = message.is_object() && message.contains("id")
                          ? message["id"]
                          : nlohmann::json(nullptr);
            response = MakeRpcError(id, kJsonRpcInternalError,
                                    std::string("Internal error: ") + e.what());
        }
        if (response) {
            WriteMessage(*response);
        }
    }
    LogInfo("mcp", "Input closed, shutting down");
}

void McpServer::WriteMessage(const nlohmann::json& message) {
    // Response bodies from the webhook may hold invalid UTF-8.
    out_ << message.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace)
         << "\n";
    out_.flush();
}

std::optional<nlohmann::json> McpServer::HandleMessage(
    const nlohmann::json& message) {
    if (!message.is_object()) {
        return MakeRpcError(nullptr, kJsonRpcInvalidRequest, "Invalid request");
    }

    // Check for JSON-RPC 2.0.
    if (!message.contains("jsonrpc") || message["jsonrpc"] != "2.0") {
        if (message.contains("id")) {
            return MakeRpcError(message["id"], kJsonRpcInvalidRequest,
                                "Invalid JSON-RPC version");
        }
        return std::nullopt;
    }

    if (message.contains("method") && !message["method"].is_string()) {
        if (message.contains("id")) {
            return MakeRpcError(message["id"], kJsonRpcInvalidRequest,
                                "Invalid request: method must be a string");
        }
        return std::nullopt;
    }

    // Notifications have no "id"; they are acknowledged silently.
    auto method = message.value("method", std::string());
    if (!message.contains("id")) {
        LogDebug("mcp", "Notification: " + method);
        return std::nullopt;
    }

    const auto& id = message["id"];
    auto params = message.value("params", nlohmann::json::object());
    LogDebug("mcp", "Request: " + method);

    if (method == "initialize") {
        return HandleInitialize(params, id);
    } else if (method == "ping") {
        return MakeRpcResult(id, nlohmann::json::object());
    } else if (method == "tools/list") {
        return HandleToolsList(id);
    } else if (method == "tools/call") {
        return HandleToolsCall(params, id);
    } else {
        return MakeRpcError(id, kJsonRpcMethodNotFound, "Method not found: " + method);
    }
}

nlohmann::json McpServer::HandleInitialize(
    const nlohmann::json& params, const nlohmann::json& id) {
    initialized_ = true;

    if (params.contains("clientInfo") && params["clientInfo"].is_object()) {
        const auto& info = params["clientInfo"];
        auto field = [&info](const char* key, const char* fallback) {
            auto it = info.find(key);
            return it != info.end() && it->is_string() ? it->get<std::string>()
                                                       : std::string(fallback);
        };
        LogInfo("mcp", "Client connected: " + field("name", "unknown") + " " +
                           field("version", ""));
    }

    nlohmann::json result;
    result["protocolVersion"] = kMcpProtocolVersion;
    result["capabilities"] = {
        {"tools", nlohmann::json::object()}
    };
    result["serverInfo"] = {
        {"name", kServerName},
        {"version", kVersion}
    };

    return MakeRpcResult(id, result);
}

nlohmann::json McpServer::HandleToolsList(const nlohmann::json& id) {
    nlohmann::json tools = nlohmann::json::array();

    for (const auto& schema : registry_.Tools()) {
        tools.push_back({
            {"name", schema.name},
            {"description", schema.description},
            {"inputSchema", schema.input_schema}
        });
    }

    return MakeRpcResult(id, {{"tools", tools}});
}

nlohmann::json McpServer::HandleToolsCall(
    const nlohmann::json& params, const nlohmann::json& id) {
    if (!params.is_object() || !params.contains("name") ||
        !params["name"].is_string()) {
        return MakeRpcError(id, kJsonRpcInvalidParams, "Missing 'name' parameter");
    }

    auto tool_name = params["name"].get<std::string>();
    auto arguments = params.value("arguments", nlohmann::json::object());
    if (arguments.is_null()) {
        arguments = nlohmann::json::object();
    }

    auto result = registry_.Execute(tool_name, arguments);
    if (result.IsErr()) {
        const auto& error = result.Error();
        LogWarn("mcp", error.ToString());
        return MakeRpcToolError(id, error);
    }

    const auto& tool_result = result.Value();
    nlohmann::json response_result;
    response_result["content"] = tool_result.content;
    if (tool_result.is_error) {
        response_result["isError"] = true;
    }
    return MakeRpcResult(id, response_result);
}

} // namespace discord_mcp
