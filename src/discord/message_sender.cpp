#include <discord_mcp/discord/message_sender.hpp>

#include <discord_mcp/core/log.hpp>

#include <exception>

namespace discord_mcp {

namespace {

constexpr const char* kOperation = "SendMessage";
constexpr const char* kJsonContentType = "application/json";

} // anonymous namespace

Result<MessageSender, Error> MessageSender::Create(std::string_view webhook_url,
                                                   IWebhookTransport& transport) {
    if (webhook_url.empty()) {
        return Result<MessageSender, Error>::Err(Error{
            "MessageSender", "", std::nullopt, "Webhook URL must not be empty",
            std::nullopt, ErrorCategory::ConfigurationError});
    }
    auto url = WebhookUrl::Create(webhook_url);
    if (url.IsErr()) {
        return Result<MessageSender, Error>::Err(Error{
            "MessageSender", "", std::nullopt, url.Error(), std::nullopt,
            ErrorCategory::ConfigurationError});
    }
    return Result<MessageSender, Error>::Ok(
        MessageSender(std::move(url).Value(), transport));
}

Result<bool, Error> MessageSender::Send(const DiscordMessage& message) const {
    const auto endpoint = url_.Redacted();
    try {
        const auto body = BuildWebhookPayload(message).dump();
        LogDebug("sender", "Sending " + std::string(MessageTypeName(message.type)) +
                               " message (" + std::to_string(message.content.size()) +
                               " bytes)");

        auto response = transport_->Post(url_.Path(), body, kJsonContentType);
        if (response.IsErr()) {
            const auto& err = response.Error();
            LogWarn("sender", "Delivery failed: " + err.message);
            return Result<bool, Error>::Err(Error{
                kOperation, endpoint, std::nullopt,
                "Failed to send message: " + err.message, std::nullopt,
                ErrorCategory::DeliveryError});
        }

        const auto& http = response.Value();
        if (http.status_code >= 400) {
            LogWarn("sender", "Webhook rejected message with HTTP " +
                                  std::to_string(http.status_code));
            return Result<bool, Error>::Err(
                Error::FromHttpStatus(kOperation, endpoint, http.status_code, http.body));
        }
        LogInfo("sender", "Message delivered (HTTP " +
                              std::to_string(http.status_code) + ")");
        return Result<bool, Error>::Ok(true);
    } catch (const std::exception& e) {
        LogError("sender", std::string("Unexpected error: ") + e.what());
        return Result<bool, Error>::Err(Error{
            kOperation, endpoint, std::nullopt,
            std::string("Unexpected error while sending message: ") + e.what(),
            std::nullopt, ErrorCategory::DeliveryError});
    }
}

} // namespace discord_mcp
