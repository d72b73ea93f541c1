#include <discord_mcp/core/webhook_url.hpp>

#include <algorithm>
#include <cctype>

namespace discord_mcp {

namespace {

bool HasWhitespace(std::string_view s) {
    return std::any_of(s.begin(), s.end(), [](unsigned char c) {
        return std::isspace(c) != 0;
    });
}

bool StartsWith(std::string_view s, std::string_view prefix) {
    return s.substr(0, prefix.size()) == prefix;
}

} // anonymous namespace

Result<WebhookUrl, std::string> WebhookUrl::Create(std::string_view url) {
    if (url.empty()) {
        return Result<WebhookUrl, std::string>::Err(
            "Webhook URL must not be empty");
    }
    if (HasWhitespace(url)) {
        return Result<WebhookUrl, std::string>::Err(
            "Webhook URL must not contain whitespace");
    }

    std::string scheme;
    if (StartsWith(url, "https://")) {
        scheme = "https";
    } else if (StartsWith(url, "http://")) {
        scheme = "http";
    } else {
        return Result<WebhookUrl, std::string>::Err(
            "Webhook URL must start with http:// or https://");
    }

    // The authority ends at the first '/' or '?', whichever comes first.
    auto rest = url.substr(scheme.size() + 3);
    auto end = rest.find_first_of("/?");
    auto authority = rest.substr(0, end);
    std::string path;
    if (end == std::string_view::npos) {
        path = "/";
    } else if (rest[end] == '?') {
        path = "/" + std::string(rest.substr(end));
    } else {
        path = std::string(rest.substr(end));
    }

    if (authority.empty()) {
        return Result<WebhookUrl, std::string>::Err("Webhook URL has no host");
    }
    if (authority.find('@') != std::string_view::npos) {
        return Result<WebhookUrl, std::string>::Err(
            "Webhook URL must not contain user information");
    }

    return Result<WebhookUrl, std::string>::Ok(WebhookUrl(
        std::string(url), std::move(scheme), std::string(authority),
        std::move(path)));
}

std::string WebhookUrl::Redacted() const {
    auto path = path_.substr(0, path_.find('?'));
    auto last_slash = path.rfind('/');
    if (last_slash == std::string::npos || last_slash + 1 == path.size()) {
        return BaseUrl() + path;
    }
    return BaseUrl() + path.substr(0, last_slash + 1) + "***";
}

} // namespace discord_mcp
