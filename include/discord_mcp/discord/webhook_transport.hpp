#pragma once

#include <discord_mcp/core/webhook_url.hpp>
#include <discord_mcp/discord/i_webhook_transport.hpp>

#include <chrono>
#include <memory>

namespace discord_mcp {

// ---------------------------------------------------------------------------
// WebhookTransportOptions: timeouts for the webhook HTTP connection.
// ---------------------------------------------------------------------------
struct WebhookTransportOptions {
    std::chrono::seconds connect_timeout{30};
    std::chrono::seconds read_timeout{30};
    std::chrono::seconds write_timeout{30};
};

// ---------------------------------------------------------------------------
// HttplibWebhookTransport: IWebhookTransport over cpp-httplib.
//
// Opens one httplib::Client for the webhook's scheme/host/port at
// construction; the client is released with the transport. Uses pimpl so
// httplib stays out of the public header.
// ---------------------------------------------------------------------------
class HttplibWebhookTransport : public IWebhookTransport {
public:
    explicit HttplibWebhookTransport(const WebhookUrl& url,
                                     const WebhookTransportOptions& options = {});

    ~HttplibWebhookTransport() override;

    HttplibWebhookTransport(const HttplibWebhookTransport&) = delete;
    HttplibWebhookTransport& operator=(const HttplibWebhookTransport&) = delete;
    HttplibWebhookTransport(HttplibWebhookTransport&&) = delete;
    HttplibWebhookTransport& operator=(HttplibWebhookTransport&&) = delete;

    [[nodiscard]] Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) override;

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace discord_mcp
