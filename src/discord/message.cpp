#include <discord_mcp/discord/message.hpp>

namespace discord_mcp {

Result<MessageType, std::string> ParseMessageType(std::string_view name) {
    if (name == "text") {
        return Result<MessageType, std::string>::Ok(MessageType::Text);
    }
    if (name == "markdown") {
        return Result<MessageType, std::string>::Ok(MessageType::Markdown);
    }
    return Result<MessageType, std::string>::Err(
        "Unsupported message type: " + std::string(name) +
        " (expected text or markdown)");
}

const char* MessageTypeName(MessageType type) {
    switch (type) {
        case MessageType::Text:     return "text";
        case MessageType::Markdown: return "markdown";
    }
    return "text";
}

nlohmann::json BuildWebhookPayload(const DiscordMessage& message) {
    return {{"content", message.content}};
}

} // namespace discord_mcp
