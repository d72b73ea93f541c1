#pragma once

#include <discord_mcp/discord/message.hpp>
#include <discord_mcp/discord/message_sender.hpp>
#include <discord_mcp/mcp/tool_registry.hpp>

#include <nlohmann/json.hpp>

namespace discord_mcp {

inline constexpr const char* kSendMessageTool = "send_message";

// ---------------------------------------------------------------------------
// SendMessageRequest: validated send_message arguments.
// ---------------------------------------------------------------------------
struct SendMessageRequest {
    std::string content;
    MessageType type = MessageType::Text;
};

/// Input schema of send_message: content (required string), msg_type
/// (optional, enum text|markdown, default text), no other fields.
nlohmann::json SendMessageSchema();

/// Build the typed request from arguments that passed SendMessageSchema().
/// Rejects empty content and unsupported msg_type values with InvalidParams.
Result<SendMessageRequest, Error> ParseSendMessageRequest(
    const nlohmann::json& arguments);

// ---------------------------------------------------------------------------
// DiscordTools: the operations behind the registered Discord tools.
// Borrows the sender; the sender must outlive this object and the registry.
// ---------------------------------------------------------------------------
class DiscordTools {
public:
    explicit DiscordTools(const MessageSender& sender) : sender_(&sender) {}

    [[nodiscard]] Result<DeliveryResult, Error> SendMessage(
        const SendMessageRequest& request) const;

private:
    const MessageSender* sender_;
};

// Register send_message with the registry. The handler captures &sender.
void RegisterDiscordTools(ToolRegistry& registry, const MessageSender& sender);

} // namespace discord_mcp
