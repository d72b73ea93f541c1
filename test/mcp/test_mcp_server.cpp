#include <catch2/catch_test_macros.hpp>

#include <discord_mcp/core/version.hpp>
#include <discord_mcp/mcp/mcp_server.hpp>

#include <sstream>
#include <vector>

using namespace discord_mcp;

namespace {

ToolRegistry MakeTestRegistry() {
    ToolRegistry registry;
    registry.Register("echo", "Echo the input",
        {{"type", "object"},
         {"properties", {{"message", {{"type", "string"}}}}},
         {"required", nlohmann::json::array({"message"})},
         {"additionalProperties", false}},
        [](const nlohmann::json& params) {
            return Result<ToolResult, Error>::Ok(
                ToolResult{false, TextContent(params.value("message", ""))});
        });
    registry.Register("fail", "Always fails delivery", nlohmann::json::object(),
        [](const nlohmann::json&) {
            return Result<ToolResult, Error>::Err(Error::FromHttpStatus(
                "SendMessage", "https://example.test/***", 503, "down"));
        });
    return registry;
}

nlohmann::json Request(int id, const std::string& method,
                       nlohmann::json params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

std::vector<nlohmann::json> ParseLines(const std::string& output) {
    std::vector<nlohmann::json> lines;
    std::istringstream stream(output);
    std::string line;
    while (std::getline(stream, line)) {
        lines.push_back(nlohmann::json::parse(line));
    }
    return lines;
}

} // anonymous namespace

// ===========================================================================
// HandleMessage
// ===========================================================================

TEST_CASE("McpServer: initialize returns capabilities", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);
    CHECK_FALSE(server.IsInitialized());

    auto response = server.HandleMessage(Request(1, "initialize", {
        {"protocolVersion", "2024-11-05"},
        {"clientInfo", {{"name", "test"}, {"version", "1"}}}
    }));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["serverInfo"]["name"] == "discord-mcp");
    CHECK(r["result"]["serverInfo"]["version"] == kVersion);
    CHECK(r["result"]["capabilities"].contains("tools"));
    CHECK(server.IsInitialized());
}

TEST_CASE("McpServer: ping returns an empty result", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(Request(7, "ping"));
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == 7);
    CHECK((*response)["result"] == nlohmann::json::object());
}

TEST_CASE("McpServer: tools/list returns registered tools", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(Request(2, "tools/list"));
    REQUIRE(response.has_value());

    auto& tools = (*response)["result"]["tools"];
    REQUIRE(tools.size() == 2);
    CHECK(tools[0]["name"] == "echo");
    CHECK(tools[0]["description"] == "Echo the input");
    CHECK(tools[0]["inputSchema"]["type"] == "object");
}

TEST_CASE("McpServer: tools/call executes tool", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(Request(3, "tools/call", {
        {"name", "echo"},
        {"arguments", {{"message", "hello world"}}}
    }));
    REQUIRE(response.has_value());

    auto& result = (*response)["result"];
    REQUIRE(result["content"].size() == 1);
    CHECK(result["content"][0]["type"] == "text");
    CHECK(result["content"][0]["text"] == "hello world");
    CHECK_FALSE(result.contains("isError"));
}

TEST_CASE("McpServer: tools/call unknown tool is -32602 UnknownTool", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(Request(4, "tools/call", {{"name", "ping"}}));
    REQUIRE(response.has_value());
    auto& error = (*response)["error"];
    CHECK(error["code"] == -32602);
    CHECK(error["message"] == "Unknown tool: ping");
    CHECK(error["data"]["kind"] == "UnknownTool");
}

TEST_CASE("McpServer: tools/call schema violation is -32602 InvalidParams", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(Request(5, "tools/call", {{"name", "echo"}}));
    REQUIRE(response.has_value());
    auto& error = (*response)["error"];
    CHECK(error["code"] == -32602);
    CHECK(error["data"]["kind"] == "InvalidParams");
    CHECK(error["message"] == "Missing required parameter: message");
}

TEST_CASE("McpServer: tools/call delivery failure is -32603 with details", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(Request(6, "tools/call", {{"name", "fail"}}));
    REQUIRE(response.has_value());
    auto& error = (*response)["error"];
    CHECK(error["code"] == -32603);
    CHECK(error["data"]["kind"] == "DeliveryError");
    CHECK(error["data"]["http_status"] == 503);
    CHECK(error["data"]["response_body"] == "down");
}

TEST_CASE("McpServer: tools/call missing or non-string name", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto missing = server.HandleMessage(Request(6, "tools/call"));
    REQUIRE(missing.has_value());
    CHECK((*missing)["error"]["code"] == -32602);

    auto numeric = server.HandleMessage(Request(7, "tools/call", {{"name", 42}}));
    REQUIRE(numeric.has_value());
    CHECK((*numeric)["error"]["code"] == -32602);
}

TEST_CASE("McpServer: unknown method returns -32601", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(Request(5, "resources/list"));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32601);
}

TEST_CASE("McpServer: notification returns no response", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage({
        {"jsonrpc", "2.0"},
        {"method", "notifications/initialized"}
    });
    CHECK_FALSE(response.has_value());
}

TEST_CASE("McpServer: wrong jsonrpc version", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto with_id = server.HandleMessage({{"jsonrpc", "1.0"}, {"id", 1}, {"method", "ping"}});
    REQUIRE(with_id.has_value());
    CHECK((*with_id)["error"]["code"] == -32600);

    auto without_id = server.HandleMessage({{"method", "ping"}});
    CHECK_FALSE(without_id.has_value());
}

TEST_CASE("McpServer: non-object message is an invalid request", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(nlohmann::json::array({1, 2}));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32600);
    CHECK((*response)["id"].is_null());
}

// ===========================================================================
// Run (stdio loop)
// ===========================================================================

TEST_CASE("McpServer: Run answers each request on its own line", "[mcp][server]") {
    std::string input;
    input += Request(1, "initialize", {{"protocolVersion", "2024-11-05"}}).dump() + "\n";
    input += nlohmann::json({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).dump() + "\n";
    input += "\n";
    input += Request(2, "tools/list").dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    server.Run();

    auto responses = ParseLines(out.str());
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[0]["result"]["protocolVersion"] == "2024-11-05");
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[1]["result"]["tools"].size() == 2);
}

TEST_CASE("McpServer: Run keeps serving after parse and tool errors", "[mcp][server]") {
    std::string input;
    input += "not json\n";
    input += Request(1, "tools/call", {{"name", "fail"}}).dump() + "\n";
    input += Request(2, "tools/call", {{"name", "echo"},
                                       {"arguments", {{"message", "still here"}}}}).dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    server.Run();

    auto responses = ParseLines(out.str());
    REQUIRE(responses.size() == 3);
    CHECK(responses[0]["error"]["code"] == -32700);
    CHECK(responses[0]["id"].is_null());
    CHECK(responses[1]["error"]["data"]["kind"] == "DeliveryError");
    CHECK(responses[2]["result"]["content"][0]["text"] == "still here");
}

TEST_CASE("McpServer: Run survives a non-string method", "[mcp][server]") {
    std::string input;
    input += R"({"jsonrpc":"2.0","id":1,"method":7})" "\n";
    input += R"({"jsonrpc":"2.0","method":["notifications","x"]})" "\n";
    input += Request(2, "ping").dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    REQUIRE_NOTHROW(server.Run());

    auto responses = ParseLines(out.str());
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[0]["error"]["code"] == -32600);
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[1]["result"] == nlohmann::json::object());
}

TEST_CASE("McpServer: initialize tolerates non-string clientInfo fields", "[mcp][server]") {
    std::string input;
    input += Request(1, "initialize", {
        {"protocolVersion", "2024-11-05"},
        {"clientInfo", {{"name", 5}, {"version", nullptr}}}
    }).dump() + "\n";
    input += Request(2, "ping").dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    REQUIRE_NOTHROW(server.Run());

    auto responses = ParseLines(out.str());
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["result"]["serverInfo"]["name"] == "discord-mcp");
    CHECK(responses[1]["id"] == 2);
    CHECK(server.IsInitialized());
}

TEST_CASE("McpServer: Run answers a throwing handler with -32603", "[mcp][server]") {
    ToolRegistry registry;
    registry.Register("strict", "Reads a string field", nlohmann::json::object(),
        [](const nlohmann::json& params) {
            return Result<ToolResult, Error>::Ok(
                ToolResult{false, TextContent(params.value("text", "none"))});
        });

    std::string input;
    input += Request(1, "tools/call", {{"name", "strict"},
                                       {"arguments", {{"text", 12}}}}).dump() + "\n";
    input += Request(2, "ping").dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(std::move(registry), in, out);

    REQUIRE_NOTHROW(server.Run());

    auto responses = ParseLines(out.str());
    REQUIRE(responses.size() == 2);
    CHECK(responses[0]["id"] == 1);
    CHECK(responses[0]["error"]["code"] == -32603);
    CHECK(responses[1]["id"] == 2);
    CHECK(responses[1]["result"] == nlohmann::json::object());
}

TEST_CASE("McpServer: Run writes invalid UTF-8 bodies without throwing", "[mcp][server]") {
    ToolRegistry registry;
    registry.Register("garbled", "Returns a raw body", nlohmann::json::object(),
        [](const nlohmann::json&) {
            return Result<ToolResult, Error>::Err(Error::FromHttpStatus(
                "SendMessage", "", 502, std::string("\xc3\x28 bad")));
        });

    std::istringstream in(Request(1, "tools/call", {{"name", "garbled"}}).dump() + "\n");
    std::ostringstream out;
    McpServer server(std::move(registry), in, out);

    REQUIRE_NOTHROW(server.Run());
    auto responses = ParseLines(out.str());
    REQUIRE(responses.size() == 1);
    CHECK(responses[0]["error"]["data"]["http_status"] == 502);
}
