#include <gtest/gtest.h>
#include <sstream>
#include "mcp/McpServer.h"
#include "backend/MockBackend.h"
#include "FakeBackend.h"

class McpServerTest : public ::testing::Test {
protected:
    void SetUp() override {
        silenceLogger();
        dispatcher = std::make_unique<RequestDispatcher>(std::make_unique<MockBackend>(), std::chrono::milliseconds(0));
        server = std::make_unique<McpServer>(*dispatcher, "xtquantai", "0.1.0");
    }

    nlohmann::json call(const std::string& method, const nlohmann::json& params = nlohmann::json::object()) {
        nlohmann::json request = {{"jsonrpc", "2.0"}, {"id", nextId++}, {"method", method}, {"params", params}};
        auto response = server->handleMessage(request);
        EXPECT_TRUE(response.has_value()) << method;
        return response ? *response : nlohmann::json();
    }

    std::unique_ptr<RequestDispatcher> dispatcher;
    std::unique_ptr<McpServer> server;
    int nextId = 1;
};

TEST_F(McpServerTest, Initialize) {
    auto res = call("initialize", {{"protocolVersion", "2024-11-05"}});
    EXPECT_EQ(res["jsonrpc"], "2.0");
    EXPECT_EQ(res["id"], 1);
    EXPECT_EQ(res["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ(res["result"]["serverInfo"]["name"], "xtquantai");
    EXPECT_TRUE(res["result"]["capabilities"].contains("tools"));
}

TEST_F(McpServerTest, NotificationsGetNoReply) {
    nlohmann::json note = {{"jsonrpc", "2.0"}, {"method", "notifications/initialized"}};
    EXPECT_FALSE(server->handleMessage(note).has_value());
}

TEST_F(McpServerTest, ToolsListAndCall) {
    auto list = call("tools/list");
    ASSERT_EQ(list["result"]["tools"].size(), 8u);

    auto res = call("tools/call", {{"name", "get_stock_list"}, {"arguments", {{"sector", "沪深A股"}}}});
    ASSERT_TRUE(res.contains("result")) << res.dump();
    const auto& content = res["result"]["content"];
    ASSERT_EQ(content.size(), 1u);
    auto stocks = nlohmann::json::parse(content[0]["text"].get<std::string>());
    EXPECT_EQ(stocks, nlohmann::json({"000001.SZ", "600519.SH", "300059.SZ"}));
}

TEST_F(McpServerTest, UnknownToolIsProtocolError) {
    auto res = call("tools/call", {{"name", "place_order"}, {"arguments", nlohmann::json::object()}});
    ASSERT_TRUE(res.contains("error"));
    EXPECT_EQ(res["error"]["code"], -32602);
    EXPECT_EQ(res["error"]["message"], "Unknown tool: place_order");
}

TEST_F(McpServerTest, ResourcesAndPromptsAreEmpty) {
    EXPECT_EQ(call("resources/list")["result"]["resources"], nlohmann::json::array());
    EXPECT_EQ(call("prompts/list")["result"]["prompts"], nlohmann::json::array());

    auto read = call("resources/read", {{"uri", "file:///etc/passwd"}});
    EXPECT_EQ(read["error"]["code"], -32602);
    EXPECT_EQ(read["error"]["message"], "Unsupported URI: file:///etc/passwd");

    auto prompt = call("prompts/get", {{"name", "daily_report"}});
    EXPECT_EQ(prompt["error"]["code"], -32602);
    EXPECT_EQ(prompt["error"]["message"], "Unknown prompt: daily_report");

    EXPECT_THROW(server->readResource("x"), UnsupportedUriError);
    EXPECT_THROW(server->getPrompt("x", nlohmann::json::object()), UnknownPromptError);
}

TEST_F(McpServerTest, UnknownMethod) {
    auto res = call("sampling/createMessage");
    EXPECT_EQ(res["error"]["code"], -32601);
}

TEST_F(McpServerTest, RunLoopSurvivesBadInput) {
    std::istringstream in(
        "{\"jsonrpc\":\"2.0\",\"id\":1,\"method\":\"ping\"}\n"
        "this is not json\n"
        "\n"
        "{\"jsonrpc\":\"2.0\",\"method\":\"notifications/initialized\"}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":2,\"method\":\"tools/call\",\"params\":{\"name\":\"nope\"}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":3,\"method\":\"tools/call\",\"params\":{\"name\":\"get_instrument_detail\",\"arguments\":{}}}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":4,\"method\":5}\n"
        "{\"jsonrpc\":\"2.0\",\"id\":5,\"method\":\"ping\"}\n");
    std::ostringstream out;
    server->run(in, out);

    std::istringstream lines(out.str());
    std::vector<nlohmann::json> responses;
    std::string line;
    while (std::getline(lines, line)) {
        responses.push_back(nlohmann::json::parse(line));
    }

    ASSERT_EQ(responses.size(), 6u);
    EXPECT_EQ(responses[0]["id"], 1);
    EXPECT_EQ(responses[0]["result"], nlohmann::json::object());
    EXPECT_EQ(responses[1]["error"]["code"], -32700);
    EXPECT_TRUE(responses[1]["id"].is_null());
    EXPECT_EQ(responses[2]["error"]["code"], -32602);
    EXPECT_EQ(responses[3]["result"]["content"][0]["text"], "错误: 缺少必要参数 'code'");
    EXPECT_EQ(responses[4]["id"], 4);
    EXPECT_EQ(responses[4]["error"]["code"], -32600);
    EXPECT_EQ(responses[5]["id"], 5);
    EXPECT_EQ(responses[5]["result"], nlohmann::json::object());
}

TEST_F(McpServerTest, NonStringMethodIsInvalidRequest) {
    auto res = server->handleMessage({{"jsonrpc", "2.0"}, {"id", 9}, {"method", nlohmann::json::array({"ping"})}});
    ASSERT_TRUE(res.has_value());
    EXPECT_EQ((*res)["id"], 9);
    EXPECT_EQ((*res)["error"]["code"], -32600);
}
