#pragma once

#include <discord_mcp/core/result.hpp>

#include <string>
#include <string_view>

namespace discord_mcp {

// ---------------------------------------------------------------------------
// WebhookUrl: validated webhook endpoint URL.
//
// Rules:
//   - Non-empty, no whitespace
//   - Scheme is http:// or https://
//   - Host part is non-empty
//
// The URL is split into BaseUrl() ("https://discord.com[:port]") for the
// HTTP client and Path() ("/api/webhooks/<id>/<token>[?query]") for the
// request line. The last path segment is the webhook token, so anything that
// is logged must go through Redacted().
// ---------------------------------------------------------------------------
class WebhookUrl {
public:
    static Result<WebhookUrl, std::string> Create(std::string_view url);

    [[nodiscard]] const std::string& Value() const noexcept { return value_; }
    [[nodiscard]] bool IsHttps() const noexcept { return scheme_ == "https"; }
    [[nodiscard]] std::string BaseUrl() const { return scheme_ + "://" + authority_; }
    [[nodiscard]] const std::string& Path() const noexcept { return path_; }

    /// The URL with its final path segment (and any query) replaced by "***".
    [[nodiscard]] std::string Redacted() const;

    bool operator==(const WebhookUrl& other) const { return value_ == other.value_; }
    bool operator!=(const WebhookUrl& other) const { return value_ != other.value_; }

    WebhookUrl(const WebhookUrl&) = default;
    WebhookUrl& operator=(const WebhookUrl&) = default;
    WebhookUrl(WebhookUrl&&) noexcept = default;
    WebhookUrl& operator=(WebhookUrl&&) noexcept = default;

private:
    WebhookUrl(std::string value, std::string scheme, std::string authority,
               std::string path)
        : value_(std::move(value)),
          scheme_(std::move(scheme)),
          authority_(std::move(authority)),
          path_(std::move(path)) {}

    std::string value_;
    std::string scheme_;
    std::string authority_;
    std::string path_;
};

} // namespace discord_mcp
