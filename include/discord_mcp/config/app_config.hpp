#pragma once

#include <optional>
#include <string>
#include <vector>

namespace discord_mcp {

// Environment variable the webhook URL falls back to.
inline constexpr const char* kWebhookUrlEnv = "DISCORD_WEBHOOK_URL";

// Default delivery timeout, applied to connect, read and write.
inline constexpr int kDefaultTimeoutSeconds = 30;

struct ServerConfig {
    std::string webhook_url;  // raw; validated by ValidateConfig
    std::optional<int> timeout_seconds;  // unset: kDefaultTimeoutSeconds
    std::optional<std::string> config_path;
    std::optional<std::string> log_file;
    bool json_logs = false;
    bool no_color = false;
    int verbosity = 0;  // -v = 1, -vv = 2

    [[nodiscard]] int TimeoutSeconds() const {
        return timeout_seconds.value_or(kDefaultTimeoutSeconds);
    }
};

struct ClientConfig {
    std::string server_command;  // empty: locate discord-mcp-server
    std::vector<std::string> server_args;
    std::optional<std::string> webhook_url;
    std::string content = "# 今日黄金\n## 今日黄金价格1060元！";
    std::string msg_type = "markdown";
    int verbosity = 0;
};

} // namespace discord_mcp
