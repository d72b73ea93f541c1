#include <discord_mcp/discord/webhook_transport.hpp>

#include <discord_mcp/core/log.hpp>
#include <discord_mcp/core/version.hpp>

#include <httplib.h>

#include <algorithm>
#include <cctype>

namespace discord_mcp {

namespace {

constexpr size_t kMaxBodyLog = 2000;

bool IsSensitiveHeader(std::string_view key) {
    std::string lower_key(key);
    std::transform(lower_key.begin(), lower_key.end(), lower_key.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return lower_key == "authorization" || lower_key == "cookie";
}

HttpHeaders ToHttpHeaders(const httplib::Headers& hdrs) {
    HttpHeaders result;
    for (const auto& [key, value] : hdrs) {
        result[key] = value;
    }
    return result;
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// Impl: pimpl body holding the httplib::Client.
// ---------------------------------------------------------------------------
struct HttplibWebhookTransport::Impl {
    std::unique_ptr<httplib::Client> client;
    std::string redacted_url;

    Impl(const WebhookUrl& url, const WebhookTransportOptions& options)
        : client(std::make_unique<httplib::Client>(url.BaseUrl())),
          redacted_url(url.Redacted()) {
        client->set_connection_timeout(options.connect_timeout);
        client->set_read_timeout(options.read_timeout);
        client->set_write_timeout(options.write_timeout);
        if (url.IsHttps()) {
            client->enable_server_certificate_verification(true);
        }
        client->set_default_headers(
            {{"User-Agent", std::string("discord-mcp/") + kVersion}});
        if (!client->is_valid()) {
            LogWarn("http", "HTTP client for " + url.BaseUrl() +
                                " is not usable (TLS support missing?)");
        }
    }

    static void LogRequestHeaders(const httplib::Headers& hdrs) {
        for (const auto& [k, v] : hdrs) {
            LogDebug("http", "  > " + k + ": " +
                                 (IsSensitiveHeader(k) ? "<redacted>" : v));
        }
    }

    static void LogResponse(int status, const std::string& body) {
        LogInfo("http", "  < " + std::to_string(status));
        if (status >= 400 && !body.empty()) {
            if (body.size() <= kMaxBodyLog) {
                LogDebug("http", "  < body: " + body);
            } else {
                LogDebug("http", "  < body: " + body.substr(0, kMaxBodyLog) +
                                     "... (truncated)");
            }
        }
    }
};

HttplibWebhookTransport::HttplibWebhookTransport(
    const WebhookUrl& url, const WebhookTransportOptions& options)
    : impl_(std::make_unique<Impl>(url, options)) {}

HttplibWebhookTransport::~HttplibWebhookTransport() = default;

Result<HttpResponse, Error> HttplibWebhookTransport::Post(
    std::string_view path,
    std::string_view body,
    std::string_view content_type,
    const HttpHeaders& headers) {
    httplib::Headers hdrs;
    for (const auto& [key, value] : headers) {
        hdrs.emplace(key, value);
    }

    LogInfo("http", "POST " + impl_->redacted_url);
    Impl::LogRequestHeaders(hdrs);
    auto res = impl_->client->Post(std::string(path), hdrs, std::string(body),
                                   std::string(content_type));
    if (!res) {
        return Result<HttpResponse, Error>::Err(Error{
            "Post", impl_->redacted_url, std::nullopt,
            "HTTP request failed: " + httplib::to_string(res.error()),
            std::nullopt, ErrorCategory::DeliveryError});
    }
    Impl::LogResponse(res->status, res->body);
    return Result<HttpResponse, Error>::Ok(HttpResponse{
        res->status, ToHttpHeaders(res->headers), res->body});
}

} // namespace discord_mcp
