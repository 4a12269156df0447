#include <gtest/gtest.h>
#include "fake_tools.hpp"
#include "config.hpp"
#include "mcp_protocol.hpp"

#include <chrono>
#include <memory>
#include <stdexcept>

using namespace toolserver;
using toolserver_test::FnTool;

class McpProtocolTest : public ::testing::Test {
protected:
    void SetUp() override {
        std::string err;
        ASSERT_TRUE(registry.Register(
            std::make_unique<FnTool>("greet", SchemaBuilder::Object().StringProperty("who", "who", true).Build(),
                                     [](const ParamMap& p) { return "hello " + p.GetString("who"); }),
            &err));
        ASSERT_TRUE(registry.Register(
            std::make_unique<FnTool>("fail", SchemaBuilder::Object().Build(),
                                     [](const ParamMap&) -> std::string { throw std::runtime_error("nope"); }),
            &err));
        registry.Seal();
        context.Start();
    }

    void TearDown() override { context.Stop(); }

    nlohmann::json Call(const std::string& body) {
        auto reply = handler.Process(body);
        EXPECT_EQ(reply.status, 200);
        return nlohmann::json::parse(reply.body);
    }

    ToolRegistry registry;
    WorkQueueContext context;
    ExecutionBridge bridge{&context};
    RequestDispatcher dispatcher{&registry, &bridge, DispatcherOptions{}};
    McpProtocolHandler handler{&registry, &dispatcher};
};

TEST_F(McpProtocolTest, Initialize) {
    auto j = Call(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    EXPECT_EQ(j["jsonrpc"], "2.0");
    EXPECT_EQ(j["id"], 1);
    EXPECT_EQ(j["result"]["protocolVersion"], kProtocolVersion);
    EXPECT_TRUE(j["result"]["capabilities"]["tools"].is_object());
    EXPECT_EQ(j["result"]["serverInfo"]["name"], kServerName);
}

TEST_F(McpProtocolTest, ToolsList) {
    auto j = Call(R"({"jsonrpc":"2.0","id":"abc","method":"tools/list"})");
    EXPECT_EQ(j["id"], "abc");
    ASSERT_EQ(j["result"]["tools"].size(), 2u);
    EXPECT_EQ(j["result"]["tools"][0]["name"], "greet");
    EXPECT_EQ(j["result"]["tools"][0]["inputSchema"]["required"][0], "who");
}

TEST_F(McpProtocolTest, ToolsCallSuccess) {
    auto j = Call(R"({"jsonrpc":"2.0","id":2,"method":"tools/call","params":{"name":"greet","arguments":{"who":"ide"}}})");
    const auto& result = j["result"];
    EXPECT_EQ(result["content"][0]["type"], "text");
    EXPECT_EQ(result["content"][0]["text"], "hello ide");
    EXPECT_FALSE(result.contains("isError"));
}

TEST_F(McpProtocolTest, ToolsCallFailureIsReportedInResult) {
    auto j = Call(R"({"jsonrpc":"2.0","id":3,"method":"tools/call","params":{"name":"fail"}})");
    EXPECT_EQ(j["result"]["isError"], true);
    EXPECT_EQ(j["result"]["content"][0]["text"], "Error: nope");

    j = Call(R"({"jsonrpc":"2.0","id":4,"method":"tools/call","params":{"name":"greet","arguments":{}}})");
    EXPECT_EQ(j["result"]["isError"], true);
    EXPECT_EQ(j["result"]["content"][0]["text"], "Error: missing required field: who");
}

TEST_F(McpProtocolTest, UnknownToolIsMethodNotFound) {
    auto j = Call(R"({"jsonrpc":"2.0","id":5,"method":"tools/call","params":{"name":"ghost"}})");
    EXPECT_FALSE(j.contains("result"));
    EXPECT_EQ(j["id"], 5);
    EXPECT_EQ(j["error"]["code"], kJsonRpcMethodNotFound);
    EXPECT_EQ(j["error"]["message"], "Error: unknown tool: ghost");
}

TEST_F(McpProtocolTest, InvalidParams) {
    auto j = Call(R"({"jsonrpc":"2.0","id":6,"method":"tools/call","params":{}})");
    EXPECT_EQ(j["error"]["code"], kJsonRpcInvalidParams);

    j = Call(R"({"jsonrpc":"2.0","id":7,"method":"tools/call","params":{"name":"greet","arguments":[1]}})");
    EXPECT_EQ(j["error"]["code"], kJsonRpcInvalidParams);
}

TEST_F(McpProtocolTest, ProtocolErrors) {
    auto j = Call("{oops");
    EXPECT_EQ(j["error"]["code"], kJsonRpcParseError);
    EXPECT_TRUE(j["id"].is_null());

    j = Call(R"({"jsonrpc":"2.0","id":8})");
    EXPECT_EQ(j["error"]["code"], kJsonRpcInvalidRequest);
    EXPECT_EQ(j["id"], 8);

    j = Call(R"({"jsonrpc":"2.0","id":9,"method":"resources/list"})");
    EXPECT_EQ(j["error"]["code"], kJsonRpcMethodNotFound);
    EXPECT_EQ(j["error"]["message"], "Method not found: resources/list");
}

TEST_F(McpProtocolTest, NotificationGetsAcceptedWithoutBody) {
    auto reply = handler.Process(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
    EXPECT_EQ(reply.status, 202);
    EXPECT_TRUE(reply.body.empty());
}

TEST_F(McpProtocolTest, Ping) {
    auto j = Call(R"({"jsonrpc":"2.0","id":10,"method":"ping"})");
    EXPECT_TRUE(j["result"].is_object());
    EXPECT_TRUE(j["result"].empty());
}

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    return RUN_ALL_TESTS();
}
