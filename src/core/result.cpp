#include <discord_mcp/core/result.hpp>

#include <nlohmann/json.hpp>

#include <sstream>

namespace discord_mcp {

namespace {

// Short human-readable reason for the status codes Discord documents for
// webhook execution.
std::string DescribeWebhookStatus(int status_code) {
    switch (status_code) {
        case 400: return "Bad request";
        case 401: return "Webhook token rejected";
        case 403: return "Webhook token rejected";
        case 404: return "Unknown webhook";
        case 413: return "Payload too large";
        case 429: return "Rate limited by Discord";
        case 500:
        case 502:
        case 503:
        case 504: return "Discord server error";
        default:
            return "Unexpected HTTP " + std::to_string(status_code);
    }
}

} // anonymous namespace

std::optional<ErrorCategory> CategoryFromName(std::string_view name) {
    if (name == "InvalidParams")      return ErrorCategory::InvalidParams;
    if (name == "UnknownTool")        return ErrorCategory::UnknownTool;
    if (name == "DeliveryError")      return ErrorCategory::DeliveryError;
    if (name == "ConfigurationError") return ErrorCategory::ConfigurationError;
    if (name == "Protocol")           return ErrorCategory::Protocol;
    return std::nullopt;
}

Error Error::FromHttpStatus(const std::string& operation,
                            const std::string& endpoint,
                            int status_code,
                            const std::string& response_body) {
    auto message = DescribeWebhookStatus(status_code) +
                   " - status " + std::to_string(status_code) +
                   ", response: " + response_body;
    return Error{operation, endpoint, status_code, std::move(message),
                 response_body, ErrorCategory::DeliveryError};
}

std::string Error::ToString() const {
    std::ostringstream oss;
    oss << CategoryName() << " in " << operation;
    if (!endpoint.empty()) {
        oss << " [" << endpoint << "]";
    }
    if (http_status.has_value()) {
        oss << " (HTTP " << *http_status << ")";
    }
    oss << ": " << message;
    return oss.str();
}

std::string Error::ToJson() const {
    nlohmann::json inner = {
        {"kind", CategoryName()},
        {"operation", operation},
        {"message", message},
        {"exit_code", ExitCode()},
    };
    if (!endpoint.empty()) {
        inner["endpoint"] = endpoint;
    }
    if (http_status.has_value()) {
        inner["http_status"] = *http_status;
    }
    if (response_body.has_value()) {
        inner["response_body"] = *response_body;
    }
    return nlohmann::json{{"error", inner}}.dump(
        -1, ' ', false, nlohmann::json::error_handler_t::replace);
}

} // namespace discord_mcp
