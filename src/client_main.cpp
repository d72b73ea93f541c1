#include <discord_mcp/config/app_config.hpp>
#include <discord_mcp/config/config_loader.hpp>
#include <discord_mcp/core/ansi.hpp>
#include <discord_mcp/core/log.hpp>
#include <discord_mcp/core/terminal.hpp>
#include <discord_mcp/mcp/mcp_client.hpp>
#include <discord_mcp/mcp/mcp_tool_handlers.hpp>
#include <discord_mcp/mcp/subprocess.hpp>

#include <nlohmann/json.hpp>

#include <csignal>
#include <filesystem>
#include <iostream>
#include <string>
#include <system_error>

namespace {

constexpr int kExitSuccess = 0;
constexpr int kExitFailure = 1;
constexpr const char* kServerExecutable = "discord-mcp-server";

struct Style {
    bool color = false;
    const char* operator()(const char* code) const { return color ? code : ""; }
};

void PrintError(const discord_mcp::Error& error, bool color) {
    Style style{color};
    std::cerr << style(discord_mcp::ansi::kRed) << "Error:"
              << style(discord_mcp::ansi::kReset) << " " << error.ToString()
              << "\n";
}

// Prefer the server installed next to this binary, then fall back to PATH.
std::string ResolveServerCommand(const discord_mcp::ClientConfig& config,
                                 const char* argv0) {
    if (!config.server_command.empty()) {
        return config.server_command;
    }
    std::error_code ec;
    auto sibling = std::filesystem::path(argv0).parent_path() / kServerExecutable;
    if (!sibling.parent_path().empty() &&
        std::filesystem::is_regular_file(sibling, ec)) {
        return sibling.string();
    }
    return kServerExecutable;
}

} // anonymous namespace

int main(int argc, const char* argv[]) {
    using namespace discord_mcp;

    auto config_result = LoadClientFromCli(argc, argv);
    if (config_result.IsErr()) {
        PrintError(config_result.Error(), IsStderrTty() && !NoColorEnvSet());
        return kExitFailure;
    }
    auto config = std::move(config_result).Value();

    bool err_color = IsStderrTty() && !NoColorEnvSet();
    Style out{IsStdoutTty() && !NoColorEnvSet()};
    InitGlobalLogger(std::make_unique<ColorConsoleSink>(err_color),
                     LevelFromVerbosity(config.verbosity));

    // A server that dies mid-request must surface as a write error, not kill us.
    std::signal(SIGPIPE, SIG_IGN);

    // Step 1: Spawn the server.
    auto command = ResolveServerCommand(config, argv[0]);
    auto server_args = config.server_args;
    if (config.verbosity >= 2) {
        server_args.emplace_back("-vv");
    } else if (config.verbosity == 1) {
        server_args.emplace_back("-v");
    }
    EnvironmentOverrides env;
    if (config.webhook_url) {
        env[kWebhookUrlEnv] = *config.webhook_url;
    }

    std::cout << "Starting " << out(ansi::kBold) << command << out(ansi::kReset)
              << "\n";
    auto process = Subprocess::Spawn(command, server_args, env);
    if (process.IsErr()) {
        PrintError(process.Error(), err_color);
        return kExitFailure;
    }
    auto server = std::move(process).Value();
    SubprocessChannel channel(*server);
    McpClient client(channel);

    // Step 2: Handshake.
    auto info = client.Initialize();
    if (info.IsErr()) {
        PrintError(info.Error(), err_color);
        return kExitFailure;
    }
    std::cout << "Connected to " << out(ansi::kBold) << info.Value().name
              << out(ansi::kReset) << " " << info.Value().version
              << " (protocol " << info.Value().protocol_version << ")\n";

    // Step 3: Tool discovery.
    auto tools = client.ListTools();
    if (tools.IsErr()) {
        PrintError(tools.Error(), err_color);
        return kExitFailure;
    }
    std::cout << "Available tools:\n";
    for (const auto& tool : tools.Value()) {
        std::cout << "  " << out(ansi::kCyan) << tool.name << out(ansi::kReset)
                  << "  " << tool.description << "\n";
    }

    // Step 4: Send the message.
    nlohmann::json arguments = {
        {"content", config.content},
        {"msg_type", config.msg_type}
    };
    auto called = client.CallTool(kSendMessageTool, arguments);
    if (called.IsErr()) {
        PrintError(called.Error(), err_color);
        return kExitFailure;
    }
    const auto& result = called.Value();
    auto text = ContentText(result.content);
    if (result.is_error) {
        PrintError(Error{"CallTool", kSendMessageTool, std::nullopt, text,
                         std::nullopt, ErrorCategory::DeliveryError},
                   err_color);
        return kExitFailure;
    }
    std::cout << out(ansi::kGreen) << "Result:" << out(ansi::kReset) << " "
              << text << "\n";

    // Step 5: EOF on the server's stdin ends its loop.
    server->CloseStdin();
    auto status = server->Wait();
    if (status.IsErr()) {
        PrintError(status.Error(), err_color);
        return kExitFailure;
    }
    if (status.Value() != 0) {
        LogWarn("client", "Server exited with status " +
                              std::to_string(status.Value()));
    }
    return kExitSuccess;
}
