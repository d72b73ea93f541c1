#include <discord_mcp/config/config_loader.hpp>
#include <discord_mcp/core/log.hpp>
#include <discord_mcp/core/terminal.hpp>
#include <discord_mcp/core/webhook_url.hpp>
#include <discord_mcp/discord/message_sender.hpp>
#include <discord_mcp/discord/webhook_transport.hpp>
#include <discord_mcp/mcp/mcp_server.hpp>
#include <discord_mcp/mcp/mcp_tool_handlers.hpp>

#include <chrono>
#include <iostream>
#include <memory>

namespace {

constexpr int kExitSuccess = 0;

// stdout carries JSON-RPC, so every diagnostic goes to stderr.
void PrintError(const discord_mcp::Error& error, bool json_output) {
    if (json_output) {
        std::cerr << error.ToJson() << "\n";
    } else {
        std::cerr << "Error: " << error.ToString() << "\n";
    }
}

std::unique_ptr<discord_mcp::ILogSink> MakeLogSink(
    const discord_mcp::ServerConfig& config) {
    using namespace discord_mcp;

    if (config.log_file) {
        auto sink = std::make_unique<FileSink>(*config.log_file);
        if (sink->IsOpen()) {
            return sink;
        }
        std::cerr << "Warning: cannot open log file " << *config.log_file
                  << ", logging to stderr\n";
    }
    if (config.json_logs) {
        return std::make_unique<JsonSink>(std::cerr);
    }
    bool use_color = !config.no_color && !NoColorEnvSet() && IsStderrTty();
    return std::make_unique<ColorConsoleSink>(use_color);
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace discord_mcp;

    // Step 1: CLI, optional YAML, env fallback, validation. Nothing is read
    // from stdin until this succeeds.
    auto config_result = LoadServerConfig(argc, argv);
    if (config_result.IsErr()) {
        const auto& error = config_result.Error();
        PrintError(error, false);
        return error.ExitCode();
    }
    auto config = std::move(config_result).Value();

    // Step 2: Logging.
    InitGlobalLogger(MakeLogSink(config), LevelFromVerbosity(config.verbosity));

    // Step 3: Webhook connection, opened once for the server's lifetime.
    auto url = WebhookUrl::Create(config.webhook_url);
    if (url.IsErr()) {
        PrintError(Error{"ConfigLoader", "", std::nullopt,
                         "Invalid webhook URL: " + url.Error(), std::nullopt,
                         ErrorCategory::ConfigurationError},
                   config.json_logs);
        return 2;
    }

    WebhookTransportOptions transport_opts;
    transport_opts.connect_timeout = std::chrono::seconds(config.TimeoutSeconds());
    transport_opts.read_timeout = std::chrono::seconds(config.TimeoutSeconds());
    transport_opts.write_timeout = std::chrono::seconds(config.TimeoutSeconds());
    auto transport = std::make_unique<HttplibWebhookTransport>(url.Value(),
                                                               transport_opts);

    auto sender = MessageSender::Create(config.webhook_url, *transport);
    if (sender.IsErr()) {
        PrintError(sender.Error(), config.json_logs);
        return sender.Error().ExitCode();
    }
    LogInfo("server", "Delivering to " + sender.Value().Url().Redacted());

    // Step 4: Tools.
    ToolRegistry registry;
    RegisterDiscordTools(registry, sender.Value());

    // Step 5: Serve until EOF on stdin.
    McpServer server(std::move(registry));
    server.Run();

    return kExitSuccess;
}
