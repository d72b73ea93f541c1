#pragma once

#include <discord_mcp/core/result.hpp>

#include <string>
#include <string_view>

#include <nlohmann/json.hpp>

namespace discord_mcp {

// Confirmation text returned to the caller after a successful delivery.
inline constexpr const char* kDeliverySuccessText = "消息发送成功";

// ---------------------------------------------------------------------------
// MessageType: formatting hint accepted from callers. Discord renders
// markdown in plain content anyway, so the type is never sent on the wire.
// ---------------------------------------------------------------------------
enum class MessageType {
    Text,
    Markdown,
};

Result<MessageType, std::string> ParseMessageType(std::string_view name);

const char* MessageTypeName(MessageType type);

// ---------------------------------------------------------------------------
// DiscordMessage: one message to deliver. content is non-empty.
// ---------------------------------------------------------------------------
struct DiscordMessage {
    std::string content;
    MessageType type = MessageType::Text;
};

// ---------------------------------------------------------------------------
// DeliveryResult: outcome reported back to the tool caller.
// ---------------------------------------------------------------------------
struct DeliveryResult {
    bool success = false;
    std::string message;
};

/// The webhook request body: exactly {"content": <content>}.
nlohmann::json BuildWebhookPayload(const DiscordMessage& message);

} // namespace discord_mcp
