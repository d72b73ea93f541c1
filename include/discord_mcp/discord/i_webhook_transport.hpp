#pragma once

#include <discord_mcp/core/result.hpp>

#include <map>
#include <string>
#include <string_view>

namespace discord_mcp {

// ---------------------------------------------------------------------------
// HttpHeaders: header name/value pairs. Names are case-sensitive here;
// callers normalise as needed.
// ---------------------------------------------------------------------------
using HttpHeaders = std::map<std::string, std::string>;

// ---------------------------------------------------------------------------
// HttpResponse: the result of an HTTP request.
// ---------------------------------------------------------------------------
struct HttpResponse {
    int status_code = 0;
    HttpHeaders headers;
    std::string body;
};

// ---------------------------------------------------------------------------
// IWebhookTransport: abstract HTTP connection to the webhook host.
//
// MessageSender depends on this interface rather than a concrete HTTP client,
// which keeps delivery logic testable offline via MockWebhookTransport.
//
// Post returns Result<HttpResponse, Error>: any HTTP status is a successful
// exchange; only transport failures (refused, DNS, timeout, TLS) are errors,
// reported as DeliveryError.
// ---------------------------------------------------------------------------
class IWebhookTransport {
public:
    virtual ~IWebhookTransport() = default;

    IWebhookTransport(const IWebhookTransport&) = delete;
    IWebhookTransport& operator=(const IWebhookTransport&) = delete;
    IWebhookTransport(IWebhookTransport&&) = delete;
    IWebhookTransport& operator=(IWebhookTransport&&) = delete;

    [[nodiscard]] virtual Result<HttpResponse, Error> Post(
        std::string_view path,
        std::string_view body,
        std::string_view content_type,
        const HttpHeaders& headers = {}) = 0;

protected:
    IWebhookTransport() = default;
};

} // namespace discord_mcp
