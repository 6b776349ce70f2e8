#include <catch2/catch_test_macros.hpp>

#include <ffmpeg_tools/core/version.hpp>
#include <ffmpeg_tools/mcp/mcp_server.hpp>

#include <sstream>
#include <string>
#include <vector>

using namespace ffmpeg_tools;

namespace {

using HandlerResult = Result<ToolOutput, ToolError>;

ToolRegistry MakeTestRegistry() {
    ToolRegistry registry;
    registry.Register("echo", "Echo the input",
        {{"type", "object"},
         {"properties", {{"message", {{"type", "string"}}}}},
         {"required", nlohmann::json::array({"message"})}},
        [](const nlohmann::json& params) -> HandlerResult {
            return HandlerResult::Ok(TextContent{params["message"].get<std::string>()});
        });
    registry.Register("fail", "Always fails", nlohmann::json::object(),
        [](const nlohmann::json&) -> HandlerResult {
            return HandlerResult::Err(ToolError::HandlerFailed("ffmpeg error: boom"));
        });
    return registry;
}

nlohmann::json Request(int id, const std::string& method,
                       const nlohmann::json& params = nlohmann::json::object()) {
    return {{"jsonrpc", "2.0"}, {"id", id}, {"method", method}, {"params", params}};
}

std::vector<nlohmann::json> ParseLines(const std::string& output) {
    std::vector<nlohmann::json> messages;
    std::istringstream lines(output);
    std::string line;
    while (std::getline(lines, line)) {
        messages.push_back(nlohmann::json::parse(line));
    }
    return messages;
}

} // anonymous namespace

// ===========================================================================
// HandleMessage
// ===========================================================================

TEST_CASE("McpServer: initialize returns capabilities", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(
        Request(1, "initialize", {{"protocolVersion", "2024-11-05"},
                                  {"clientInfo", {{"name", "test"}, {"version", "1"}}}}));
    REQUIRE(response.has_value());

    auto& r = *response;
    CHECK(r["jsonrpc"] == "2.0");
    CHECK(r["id"] == 1);
    CHECK(r["result"]["protocolVersion"] == "2024-11-05");
    CHECK(r["result"]["serverInfo"]["name"] == "ffmpeg-tools");
    CHECK(r["result"]["serverInfo"]["version"] == kVersion);
    CHECK(r["result"]["capabilities"].contains("tools"));
    CHECK(server.Initialized());
}

TEST_CASE("McpServer: tools/list returns registered tools in order", "[mcp][server]") {
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
    CHECK(tools[1]["name"] == "fail");
}

TEST_CASE("McpServer: tools/call executes tool", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(
        Request(3, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "hi"}}}}));
    REQUIRE(response.has_value());

    auto& result = (*response)["result"];
    CHECK_FALSE(result.contains("isError"));
    REQUIRE(result["content"].size() == 1);
    CHECK(result["content"][0]["type"] == "text");
    CHECK(result["content"][0]["text"] == "hi");
}

TEST_CASE("McpServer: tool failure is a result with isError", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(Request(4, "tools/call", {{"name", "fail"}}));
    REQUIRE(response.has_value());
    CHECK_FALSE(response->contains("error"));
    CHECK((*response)["result"]["isError"] == true);
}

TEST_CASE("McpServer: invalid arguments is a result with isError", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(
        Request(5, "tools/call", {{"name", "echo"}, {"arguments", {{"message", 7}}}}));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["isError"] == true);
    auto text = (*response)["result"]["content"][0]["text"].get<std::string>();
    CHECK(nlohmann::json::parse(text)["error"]["kind"] == "InvalidArguments");
}

TEST_CASE("McpServer: unknown tool is a JSON-RPC error", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(Request(6, "tools/call", {{"name", "nope"}}));
    REQUIRE(response.has_value());
    REQUIRE(response->contains("error"));
    CHECK((*response)["error"]["code"] == -32602);
    CHECK((*response)["error"]["data"]["kind"] == "UnknownTool");
    CHECK((*response)["error"]["data"]["tool"] == "nope");
}

TEST_CASE("McpServer: tools/call without name", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(Request(7, "tools/call"));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32602);
    CHECK((*response)["error"]["message"] == "Missing 'name' parameter");
}

TEST_CASE("McpServer: unknown method", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(Request(8, "sampling/createMessage"));
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32601);
}

TEST_CASE("McpServer: ping and empty listings", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto ping = server.HandleMessage(Request(9, "ping"));
    REQUIRE(ping.has_value());
    CHECK((*ping)["result"].empty());

    auto prompts = server.HandleMessage(Request(10, "prompts/list"));
    REQUIRE(prompts.has_value());
    CHECK((*prompts)["result"]["prompts"].empty());

    auto resources = server.HandleMessage(Request(11, "resources/list"));
    REQUIRE(resources.has_value());
    CHECK((*resources)["result"]["resources"].empty());
}

TEST_CASE("McpServer: notifications get no response", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    CHECK_FALSE(server.Initialized());
    auto initialized = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}});
    CHECK_FALSE(initialized.has_value());
    CHECK(server.Initialized());

    auto cancelled = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"method", "notifications/cancelled"},
         {"params", {{"requestId", 3}}}});
    CHECK_FALSE(cancelled.has_value());
}

TEST_CASE("McpServer: wrong jsonrpc version", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage({{"jsonrpc", "1.0"}, {"id", 1}, {"method", "ping"}});
    REQUIRE(response.has_value());
    CHECK((*response)["error"]["code"] == -32600);
}

TEST_CASE("McpServer: non-string method is an invalid request", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 4}, {"method", 5}});
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == 4);
    CHECK((*response)["error"]["code"] == -32600);

    auto missing = server.HandleMessage({{"jsonrpc", "2.0"}, {"id", 5}});
    REQUIRE(missing.has_value());
    CHECK((*missing)["error"]["code"] == -32600);
}

TEST_CASE("McpServer: non-object params are invalid params", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(
        {{"jsonrpc", "2.0"}, {"id", 6}, {"method", "tools/call"},
         {"params", nlohmann::json::array({1, 2})}});
    REQUIRE(response.has_value());
    CHECK((*response)["id"] == 6);
    CHECK((*response)["error"]["code"] == -32602);
}

TEST_CASE("McpServer: initialize tolerates non-string clientInfo fields", "[mcp][server]") {
    std::istringstream in;
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);

    auto response = server.HandleMessage(
        Request(1, "initialize", {{"clientInfo", {{"name", 42}, {"version", nullptr}}}}));
    REQUIRE(response.has_value());
    CHECK((*response)["result"]["serverInfo"]["name"] == "ffmpeg-tools");
    CHECK(server.Initialized());
}

// ===========================================================================
// Run loop
// ===========================================================================

TEST_CASE("McpServer: Run answers each line in order", "[mcp][server]") {
    std::string input =
        Request(1, "initialize").dump() + "\n" +
        nlohmann::json({{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}}).dump() + "\n" +
        "\n" +
        Request(2, "tools/list").dump() + "\r\n" +
        Request(3, "tools/call", {{"name", "echo"}, {"arguments", {{"message", "x"}}}}).dump() + "\n";

    std::istringstream in(input);
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);
    server.Run();

    auto messages = ParseLines(out.str());
    REQUIRE(messages.size() == 3);
    CHECK(messages[0]["id"] == 1);
    CHECK(messages[1]["id"] == 2);
    CHECK(messages[2]["id"] == 3);
    CHECK(messages[2]["result"]["content"][0]["text"] == "x");
}

TEST_CASE("McpServer: Run answers unparseable lines with a parse error", "[mcp][server]") {
    std::istringstream in("{not json\n" + Request(1, "ping").dump() + "\n");
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);
    server.Run();

    auto messages = ParseLines(out.str());
    REQUIRE(messages.size() == 2);
    CHECK(messages[0]["error"]["code"] == -32700);
    CHECK(messages[0]["id"].is_null());
    CHECK(messages[1]["id"] == 1);
}

TEST_CASE("McpServer: Run survives a request with a mistyped method", "[mcp][server]") {
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":5}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"ping\"}\n");
    std::ostringstream out;
    McpServer server(MakeTestRegistry(), in, out);
    REQUIRE_NOTHROW(server.Run());

    auto messages = ParseLines(out.str());
    REQUIRE(messages.size() == 2);
    CHECK(messages[0]["id"] == 1);
    CHECK(messages[0]["error"]["code"] == -32600);
    CHECK(messages[1]["id"] == 2);
    CHECK(messages[1]["result"].is_object());
}
