#pragma once

#include <discord_mcp/core/result.hpp>
#include <discord_mcp/core/webhook_url.hpp>
#include <discord_mcp/discord/i_webhook_transport.hpp>
#include <discord_mcp/discord/message.hpp>

#include <string_view>

namespace discord_mcp {

// ---------------------------------------------------------------------------
// MessageSender: delivers one message per call to the configured webhook.
//
// Create() rejects an empty or malformed URL with ConfigurationError, so a
// sender that exists always has a usable endpoint. Send() makes exactly one
// POST of {"content": ...} and classifies the outcome:
//   - status < 400            -> Ok(true)
//   - status >= 400           -> DeliveryError with status and body
//   - transport failure       -> DeliveryError with the transport message
//   - any thrown exception    -> DeliveryError wrapping what()
//
// The transport is borrowed and must outlive the sender.
// ---------------------------------------------------------------------------
class MessageSender {
public:
    static Result<MessageSender, Error> Create(std::string_view webhook_url,
                                               IWebhookTransport& transport);

    [[nodiscard]] Result<bool, Error> Send(const DiscordMessage& message) const;

    [[nodiscard]] const WebhookUrl& Url() const noexcept { return url_; }

private:
    MessageSender(WebhookUrl url, IWebhookTransport& transport)
        : url_(std::move(url)), transport_(&transport) {}

    WebhookUrl url_;
    IWebhookTransport* transport_;
};

} // namespace discord_mcp
