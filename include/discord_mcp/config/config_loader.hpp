#pragma once

#include <discord_mcp/config/app_config.hpp>
#include <discord_mcp/core/result.hpp>

#include <string_view>

namespace discord_mcp {

// Parse a YAML config file into a ServerConfig.
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path);

// Parse discord-mcp-server arguments. The webhook URL is the optional first
// positional argument.
Result<ServerConfig, Error> LoadFromCli(int argc, const char* const* argv);

// Merge two configs: fields set in cli_overrides replace those in yaml_base.
ServerConfig MergeConfigs(const ServerConfig& yaml_base,
                          const ServerConfig& cli_overrides);

// If webhook_url is empty, read it from DISCORD_WEBHOOK_URL.
ServerConfig ResolveWebhookEnv(ServerConfig config);

// Check the startup invariants. Every failure is a ConfigurationError.
Result<void, Error> ValidateConfig(const ServerConfig& config);

// Full startup resolution: CLI, optional YAML (-c), env fallback, validation.
Result<ServerConfig, Error> LoadServerConfig(int argc, const char* const* argv);

// Parse discord-mcp-client arguments. --webhook-url falls back to
// DISCORD_WEBHOOK_URL; if neither is set the server's own environment applies.
Result<ClientConfig, Error> LoadClientFromCli(int argc, const char* const* argv);

} // namespace discord_mcp
