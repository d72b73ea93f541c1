#include <discord_mcp/mcp/mcp_client.hpp>

#include <discord_mcp/core/log.hpp>
#include <discord_mcp/core/version.hpp>
#include <discord_mcp/mcp/mcp_server.hpp>

#include <string>

namespace discord_mcp {

namespace {

Error MakeProtocolError(const std::string& operation, const std::string& message) {
    return Error{operation, "", std::nullopt, message, std::nullopt,
                 ErrorCategory::Protocol};
}

// Server replies are untrusted: read a string member only when it is one.
std::string StringField(const nlohmann::json& object, const char* key,
                        const std::string& fallback = "") {
    if (!object.is_object()) return fallback;
    auto it = object.find(key);
    return it != object.end() && it->is_string() ? it->get<std::string>()
                                                 : fallback;
}

// Translate a JSON-RPC "error" member into an Error.
Error ErrorFromRpc(const std::string& operation, const nlohmann::json& rpc_error) {
    Error error;
    error.operation = operation;
    error.category = ErrorCategory::Protocol;
    if (!rpc_error.is_object()) {
        error.message = "Malformed JSON-RPC error: " + rpc_error.dump();
        return error;
    }
    error.message = StringField(rpc_error, "message", "JSON-RPC error");
    if (rpc_error.contains("code") && rpc_error["code"].is_number_integer() &&
        rpc_error["code"].get<int>() == kJsonRpcInvalidParams) {
        error.category = ErrorCategory::InvalidParams;
    }

    if (rpc_error.contains("data") && rpc_error["data"].is_object()) {
        const auto& data = rpc_error["data"];
        if (data.contains("kind") && data["kind"].is_string()) {
            auto category = CategoryFromName(data["kind"].get<std::string>());
            if (category) error.category = *category;
        }
        if (data.contains("http_status") && data["http_status"].is_number_integer()) {
            error.http_status = data["http_status"].get<int>();
        }
        if (data.contains("response_body") && data["response_body"].is_string()) {
            error.response_body = data["response_body"].get<std::string>();
        }
    }
    return error;
}

} // anonymous namespace

std::string ContentText(const nlohmann::json& content) {
    std::string text;
    if (!content.is_array()) return text;
    for (const auto& block : content) {
        if (StringField(block, "type") != "text") continue;
        if (!text.empty()) text += "\n";
        text += StringField(block, "text");
    }
    return text;
}

Result<nlohmann::json, Error> McpClient::Request(const std::string& method,
                                                 const nlohmann::json& params) {
    using R = Result<nlohmann::json, Error>;
    const int64_t id = next_id_++;
    nlohmann::json request = {
        {"jsonrpc", "2.0"},
        {"id", id},
        {"method", method},
        {"params", params}
    };

    LogDebug("client", "-> " + method + " (id " + std::to_string(id) + ")");
    auto sent = channel_.WriteLine(request.dump());
    if (sent.IsErr()) {
        auto error = std::move(sent).Error();
        error.operation = method;
        return R::Err(std::move(error));
    }

    while (true) {
        auto line = channel_.ReadLine();
        if (line.IsErr()) {
            auto error = std::move(line).Error();
            error.operation = method;
            return R::Err(std::move(error));
        }
        if (line.Value().empty()) continue;

        nlohmann::json message;
        try {
            message = nlohmann::json::parse(line.Value());
        } catch (const nlohmann::json::exception& e) {
            return R::Err(MakeProtocolError(
                method, std::string("Unparseable response: ") + e.what()));
        }

        if (!message.is_object()) {
            return R::Err(MakeProtocolError(method, "Response is not a JSON object"));
        }
        if (!message.contains("id")) {
            LogDebug("client", "Skipping notification " +
                                   StringField(message, "method", "?"));
            continue;
        }
        if (message["id"] != id) {
            LogDebug("client", "Skipping response with id " + message["id"].dump());
            continue;
        }

        if (message.contains("error")) {
            return R::Err(ErrorFromRpc(method, message["error"]));
        }
        if (!message.contains("result")) {
            return R::Err(MakeProtocolError(method, "Response has no result"));
        }
        return R::Ok(message["result"]);
    }
}

Result<void, Error> McpClient::Notify(const std::string& method) {
    nlohmann::json notification = {
        {"jsonrpc", "2.0"},
        {"method", method}
    };
    LogDebug("client", "-> " + method);
    return channel_.WriteLine(notification.dump());
}

Result<ServerInfo, Error> McpClient::Initialize() {
    using R = Result<ServerInfo, Error>;
    nlohmann::json params = {
        {"protocolVersion", kMcpProtocolVersion},
        {"capabilities", nlohmann::json::object()},
        {"clientInfo", {
            {"name", kClientName},
            {"version", kVersion}
        }}
    };

    auto result = Request("initialize", params);
    if (result.IsErr()) return R::Err(std::move(result).Error());
    const auto& body = result.Value();
    if (!body.is_object()) {
        return R::Err(MakeProtocolError("initialize", "Result is not a JSON object"));
    }

    ServerInfo info;
    info.protocol_version = StringField(body, "protocolVersion");
    if (body.contains("serverInfo")) {
        info.name = StringField(body["serverInfo"], "name");
        info.version = StringField(body["serverInfo"], "version");
    }
    if (info.protocol_version != kMcpProtocolVersion) {
        LogWarn("client", "Server speaks protocol " + info.protocol_version +
                              ", expected " + kMcpProtocolVersion);
    }

    auto notified = Notify("notifications/initialized");
    if (notified.IsErr()) return R::Err(std::move(notified).Error());
    return R::Ok(std::move(info));
}

Result<std::vector<ToolSchema>, Error> McpClient::ListTools() {
    using R = Result<std::vector<ToolSchema>, Error>;
    auto result = Request("tools/list", nlohmann::json::object());
    if (result.IsErr()) return R::Err(std::move(result).Error());

    const auto& body = result.Value();
    if (!body.is_object() || !body.contains("tools") || !body["tools"].is_array()) {
        return R::Err(MakeProtocolError("tools/list", "Response has no tools array"));
    }

    std::vector<ToolSchema> tools;
    for (const auto& tool : body["tools"]) {
        if (!tool.is_object() || !tool.contains("name") || !tool["name"].is_string()) {
            LogWarn("client", "Skipping malformed tool entry " + tool.dump());
            continue;
        }
        tools.push_back({tool["name"].get<std::string>(),
                         StringField(tool, "description"),
                         tool.value("inputSchema", nlohmann::json::object())});
    }
    return R::Ok(std::move(tools));
}

Result<ToolResult, Error> McpClient::CallTool(const std::string& name,
                                              const nlohmann::json& arguments) {
    using R = Result<ToolResult, Error>;
    nlohmann::json params = {
        {"name", name},
        {"arguments", arguments}
    };

    auto result = Request("tools/call", params);
    if (result.IsErr()) {
        auto error = std::move(result).Error();
        error.operation = "CallTool";
        error.endpoint = name;
        return R::Err(std::move(error));
    }

    const auto& body = result.Value();
    if (!body.is_object()) {
        return R::Err(Error{"CallTool", name, std::nullopt,
                            "Result is not a JSON object", std::nullopt,
                            ErrorCategory::Protocol});
    }
    ToolResult tool_result;
    tool_result.is_error = body.contains("isError") && body["isError"].is_boolean() &&
                           body["isError"].get<bool>();
    tool_result.content = body.value("content", nlohmann::json::array());
    return R::Ok(std::move(tool_result));
}

Result<void, Error> McpClient::Ping() {
    auto result = Request("ping", nlohmann::json::object());
    if (result.IsErr()) return Result<void, Error>::Err(std::move(result).Error());
    return Result<void, Error>::Ok();
}

} // namespace discord_mcp
