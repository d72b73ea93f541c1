#include <discord_mcp/config/config_loader.hpp>

#include <discord_mcp/core/version.hpp>
#include <discord_mcp/core/webhook_url.hpp>

#include <argparse/argparse.hpp>
#include <yaml-cpp/yaml.h>

#include <algorithm>
#include <cstdlib>

namespace discord_mcp {

namespace {

Error MakeConfigError(const std::string& message) {
    return Error{"ConfigLoader", "", std::nullopt, message, std::nullopt,
                 ErrorCategory::ConfigurationError};
}

int VerbosityFrom(const argparse::ArgumentParser& program) {
    if (program.get<bool>("-vv")) return 2;
    if (program.get<bool>("--verbose")) return 1;
    return 0;
}

void AddVerbosityFlags(argparse::ArgumentParser& program) {
    program.add_argument("-v", "--verbose")
        .help("Log requests (INFO)")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("-vv")
        .help("Log request details (DEBUG)")
        .default_value(false)
        .implicit_value(true);
}

} // anonymous namespace

// ---------------------------------------------------------------------------
// LoadFromYaml
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> LoadFromYaml(std::string_view file_path) {
    ServerConfig config;
    try {
        auto root = YAML::LoadFile(std::string(file_path));
        if (root["webhook_url"]) {
            config.webhook_url = root["webhook_url"].as<std::string>();
        }
        if (root["timeout"]) {
            config.timeout_seconds = root["timeout"].as<int>();
        }
        if (root["log_file"]) {
            config.log_file = root["log_file"].as<std::string>();
        }
        if (root["json_logs"]) {
            config.json_logs = root["json_logs"].as<bool>();
        }
        if (root["verbosity"]) {
            config.verbosity = root["verbosity"].as<int>();
        }
    } catch (const YAML::Exception& e) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("Failed to parse YAML file: " + std::string(e.what())));
    }
    config.config_path = std::string(file_path);
    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadFromCli
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> LoadFromCli(int argc, const char* const* argv) {
    argparse::ArgumentParser program("discord-mcp-server", kVersion);

    program.add_argument("webhook_url")
        .help("Discord webhook URL (default: $DISCORD_WEBHOOK_URL)")
        .default_value(std::string{});
    program.add_argument("-c", "--config")
        .help("Path to YAML config file");
    program.add_argument("--timeout")
        .help("Webhook request timeout in seconds")
        .scan<'i', int>();
    program.add_argument("--log-file")
        .help("Append logs to this file instead of stderr");
    program.add_argument("--json-logs")
        .help("Write logs as JSON lines")
        .default_value(false)
        .implicit_value(true);
    program.add_argument("--no-color")
        .help("Disable colored log output")
        .default_value(false)
        .implicit_value(true);
    AddVerbosityFlags(program);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<ServerConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    ServerConfig config;
    config.webhook_url = program.get<std::string>("webhook_url");
    if (auto val = program.present("--config")) {
        config.config_path = *val;
    }
    if (auto val = program.present<int>("--timeout")) {
        config.timeout_seconds = *val;
    }
    if (auto val = program.present("--log-file")) {
        config.log_file = *val;
    }
    config.json_logs = program.get<bool>("--json-logs");
    config.no_color = program.get<bool>("--no-color");
    config.verbosity = VerbosityFrom(program);

    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// MergeConfigs
// ---------------------------------------------------------------------------
ServerConfig MergeConfigs(const ServerConfig& yaml_base,
                          const ServerConfig& cli_overrides) {
    ServerConfig merged = yaml_base;
    if (!cli_overrides.webhook_url.empty()) {
        merged.webhook_url = cli_overrides.webhook_url;
    }
    if (cli_overrides.timeout_seconds.has_value()) {
        merged.timeout_seconds = cli_overrides.timeout_seconds;
    }
    if (cli_overrides.config_path.has_value()) {
        merged.config_path = cli_overrides.config_path;
    }
    if (cli_overrides.log_file.has_value()) {
        merged.log_file = cli_overrides.log_file;
    }
    merged.json_logs = merged.json_logs || cli_overrides.json_logs;
    merged.no_color = merged.no_color || cli_overrides.no_color;
    merged.verbosity = std::max(merged.verbosity, cli_overrides.verbosity);
    return merged;
}

// ---------------------------------------------------------------------------
// ResolveWebhookEnv
// ---------------------------------------------------------------------------
ServerConfig ResolveWebhookEnv(ServerConfig config) {
    if (config.webhook_url.empty()) {
        const char* env_val = std::getenv(kWebhookUrlEnv);
        if (env_val != nullptr) {
            config.webhook_url = env_val;
        }
    }
    return config;
}

// ---------------------------------------------------------------------------
// ValidateConfig
// ---------------------------------------------------------------------------
Result<void, Error> ValidateConfig(const ServerConfig& config) {
    if (config.webhook_url.empty()) {
        return Result<void, Error>::Err(MakeConfigError(
            "A webhook URL is required: pass it as the first argument, set "
            "webhook_url in the config file, or set " +
            std::string(kWebhookUrlEnv)));
    }
    auto url = WebhookUrl::Create(config.webhook_url);
    if (url.IsErr()) {
        return Result<void, Error>::Err(
            MakeConfigError("Invalid webhook URL: " + url.Error()));
    }
    if (config.TimeoutSeconds() <= 0) {
        return Result<void, Error>::Err(MakeConfigError(
            "Timeout must be positive, got " +
            std::to_string(config.TimeoutSeconds())));
    }
    return Result<void, Error>::Ok();
}

// ---------------------------------------------------------------------------
// LoadServerConfig
// ---------------------------------------------------------------------------
Result<ServerConfig, Error> LoadServerConfig(int argc, const char* const* argv) {
    auto cli_result = LoadFromCli(argc, argv);
    if (cli_result.IsErr()) {
        return cli_result;
    }
    auto config = std::move(cli_result).Value();

    if (config.config_path.has_value()) {
        auto yaml_result = LoadFromYaml(*config.config_path);
        if (yaml_result.IsErr()) {
            return yaml_result;
        }
        config = MergeConfigs(std::move(yaml_result).Value(), config);
    }

    config = ResolveWebhookEnv(std::move(config));

    auto valid = ValidateConfig(config);
    if (valid.IsErr()) {
        return Result<ServerConfig, Error>::Err(valid.Error());
    }
    return Result<ServerConfig, Error>::Ok(std::move(config));
}

// ---------------------------------------------------------------------------
// LoadClientFromCli
// ---------------------------------------------------------------------------
Result<ClientConfig, Error> LoadClientFromCli(int argc, const char* const* argv) {
    ClientConfig defaults;
    argparse::ArgumentParser program("discord-mcp-client", kVersion);

    program.add_argument("--server")
        .help("Server executable (default: discord-mcp-server next to this "
              "binary, then on PATH)");
    program.add_argument("--server-arg")
        .help("Extra argument passed to the server (repeatable)")
        .append();
    program.add_argument("--webhook-url")
        .help("Webhook URL handed to the server via DISCORD_WEBHOOK_URL");
    program.add_argument("--content")
        .help("Message content")
        .default_value(defaults.content);
    program.add_argument("--msg-type")
        .help("Message type: text or markdown")
        .default_value(defaults.msg_type);
    AddVerbosityFlags(program);

    try {
        program.parse_args(argc, argv);
    } catch (const std::exception& e) {
        return Result<ClientConfig, Error>::Err(
            MakeConfigError("CLI parse error: " + std::string(e.what())));
    }

    ClientConfig config;
    if (auto val = program.present("--server")) {
        config.server_command = *val;
    }
    if (auto val = program.present<std::vector<std::string>>("--server-arg")) {
        config.server_args = *val;
    }
    if (auto val = program.present("--webhook-url")) {
        config.webhook_url = *val;
    } else if (const char* env_val = std::getenv(kWebhookUrlEnv)) {
        config.webhook_url = std::string(env_val);
    }
    config.content = program.get<std::string>("--content");
    config.msg_type = program.get<std::string>("--msg-type");
    config.verbosity = VerbosityFrom(program);

    return Result<ClientConfig, Error>::Ok(std::move(config));
}

} // namespace discord_mcp
