#include <discord_mcp/mcp/mcp_tool_handlers.hpp>

#include <discord_mcp/core/log.hpp>

#include <string>

namespace discord_mcp {

namespace {

Error MakeParamError(const std::string& msg) {
    return Error{"CallTool", kSendMessageTool, std::nullopt, msg, std::nullopt,
                 ErrorCategory::InvalidParams};
}

nlohmann::json StringProp(const std::string& desc) {
    return {{"type", "string"}, {"description", desc}};
}

} // anonymous namespace

nlohmann::json SendMessageSchema() {
    auto msg_type = StringProp("Message type: text or markdown");
    msg_type["default"] = "text";
    msg_type["enum"] = nlohmann::json::array({"text", "markdown"});

    return {{"type", "object"},
            {"properties", {
                {"content", StringProp("Message content")},
                {"msg_type", msg_type},
            }},
            {"required", nlohmann::json::array({"content"})},
            {"additionalProperties", false}};
}

Result<SendMessageRequest, Error> ParseSendMessageRequest(
    const nlohmann::json& arguments) {
    if (!arguments.contains("content") || !arguments["content"].is_string()) {
        return Result<SendMessageRequest, Error>::Err(
            MakeParamError("Missing required parameter: content"));
    }

    SendMessageRequest request;
    request.content = arguments["content"].get<std::string>();
    if (request.content.empty()) {
        return Result<SendMessageRequest, Error>::Err(
            MakeParamError("Message content must not be empty"));
    }

    if (arguments.contains("msg_type")) {
        if (!arguments["msg_type"].is_string()) {
            return Result<SendMessageRequest, Error>::Err(
                MakeParamError("Parameter 'msg_type' must be of type string"));
        }
        auto type = ParseMessageType(arguments["msg_type"].get<std::string>());
        if (type.IsErr()) {
            return Result<SendMessageRequest, Error>::Err(
                MakeParamError(type.Error()));
        }
        request.type = type.Value();
    }
    return Result<SendMessageRequest, Error>::Ok(std::move(request));
}

Result<DeliveryResult, Error> DiscordTools::SendMessage(
    const SendMessageRequest& request) const {
    auto sent = sender_->Send(DiscordMessage{request.content, request.type});
    if (sent.IsErr()) {
        return Result<DeliveryResult, Error>::Err(sent.Error());
    }
    return Result<DeliveryResult, Error>::Ok(
        DeliveryResult{sent.Value(), kDeliverySuccessText});
}

void RegisterDiscordTools(ToolRegistry& registry, const MessageSender& sender) {
    registry.Register(
        kSendMessageTool,
        "Send a message to Discord; supports text and markdown",
        SendMessageSchema(),
        [tools = DiscordTools(sender)](const nlohmann::json& arguments)
            -> Result<ToolResult, Error> {
            auto request = ParseSendMessageRequest(arguments);
            if (request.IsErr()) {
                return Result<ToolResult, Error>::Err(request.Error());
            }
            auto delivered = tools.SendMessage(request.Value());
            if (delivered.IsErr()) {
                return Result<ToolResult, Error>::Err(delivered.Error());
            }
            return Result<ToolResult, Error>::Ok(
                ToolResult{false, TextContent(delivered.Value().message)});
        });
    LogDebug("registry", std::string("Registered tool ") + kSendMessageTool);
}

} // namespace discord_mcp
