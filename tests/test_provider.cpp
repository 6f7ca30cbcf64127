#include <gtest/gtest.h>
#include "provider.hpp"
#include <stdexcept>

using namespace zenbot;

TEST(ProviderTest, BaseUrlParsing) {
    EXPECT_EQ(OllamaProvider("http://127.0.0.1:11434").base_url(), "http://127.0.0.1:11434");
    EXPECT_EQ(OllamaProvider("http://gpu-box").base_url(), "http://gpu-box:80");
    EXPECT_EQ(OllamaProvider("localhost:9000/").base_url(), "http://localhost:9000");
    EXPECT_THROW(OllamaProvider("http://host:port"), std::invalid_argument);
}

TEST(ProviderTest, BodyCarriesModelMessagesAndFlags) {
    ChatRequest req;
    req.model = "ministral-3:14b";
    req.stream = true;
    req.messages = {Message::system("sys"), Message::user("hi")};

    auto body = OllamaProvider::build_body(req);
    EXPECT_EQ(body["model"], "ministral-3:14b");
    EXPECT_EQ(body["stream"], true);
    EXPECT_EQ(body["think"], false);
    ASSERT_EQ(body["messages"].size(), 2u);
    EXPECT_EQ(body["messages"][0]["role"], "system");
    EXPECT_EQ(body["messages"][1]["content"], "hi");
    EXPECT_FALSE(body.contains("tools"));
    EXPECT_FALSE(body.contains("format"));
}

TEST(ProviderTest, BodyIncludesToolsAndFormatWhenSet) {
    ChatRequest req;
    req.model = "m";
    req.tools = nlohmann::json::array({{{"type", "function"}, {"function", {{"name", "datetime"}}}}});
    req.format = {{"type", "object"}};

    auto body = OllamaProvider::build_body(req);
    ASSERT_TRUE(body.contains("tools"));
    EXPECT_EQ(body["tools"][0]["function"]["name"], "datetime");
    EXPECT_EQ(body["format"]["type"], "object");
}

TEST(ProviderTest, ToolMessagesAndCallsUseWireForm) {
    Message call;
    call.role = Role::assistant;
    call.tool_calls.push_back(ToolCall{"set_reminder", R"({"request": "water at 9"})"});
    call.tool_calls.push_back(ToolCall{"datetime", "not json"});

    ChatRequest req;
    req.messages = {call, Message::tool("set_reminder", R"({"success": true})")};
    auto body = OllamaProvider::build_body(req);

    auto& calls = body["messages"][0]["tool_calls"];
    ASSERT_EQ(calls.size(), 2u);
    EXPECT_EQ(calls[0]["function"]["arguments"]["request"], "water at 9");
    EXPECT_TRUE(calls[1]["function"]["arguments"].is_object());
    EXPECT_TRUE(calls[1]["function"]["arguments"].empty());
    EXPECT_EQ(body["messages"][1]["role"], "tool");
    EXPECT_EQ(body["messages"][1]["tool_name"], "set_reminder");
}

TEST(ProviderTest, StreamBodyAggregatesChunks) {
    std::string body =
        R"({"message":{"role":"assistant","content":"Hel"},"done":false})" "\n"
        R"({"message":{"role":"assistant","content":"lo"},"done":false})" "\r\n"
        "\n"
        R"({"message":{"role":"assistant","content":""},"done":true})" "\n"
        R"({"message":{"role":"assistant","content":"ignored"},"done":false})" "\n";

    std::vector<std::string> chunks;
    auto m = OllamaProvider::parse_stream_body(body, [&](const std::string& c) { chunks.push_back(c); });
    EXPECT_EQ(m.role, Role::assistant);
    EXPECT_EQ(m.content, "Hello");
    EXPECT_EQ(chunks, (std::vector<std::string>{"Hel", "lo"}));
    EXPECT_FALSE(m.has_tool_calls());
}

TEST(ProviderTest, StreamBodyCollectsToolCalls) {
    std::string body =
        R"({"message":{"role":"assistant","content":"","tool_calls":[{"function":{"name":"list_reminders","arguments":{}}}]},"done":false})" "\n"
        "garbage line\n"
        R"({"done":true})";

    auto m = OllamaProvider::parse_stream_body(body, nullptr);
    ASSERT_EQ(m.tool_calls.size(), 1u);
    EXPECT_EQ(m.tool_calls[0].name, "list_reminders");
    EXPECT_TRUE(m.content.empty());
}

TEST(ProviderTest, StreamErrorLineThrows) {
    std::string body =
        R"({"message":{"role":"assistant","content":"par"},"done":false})" "\n"
        R"({"error":"model not found"})" "\n";
    EXPECT_THROW(OllamaProvider::parse_stream_body(body, nullptr), std::runtime_error);
}

TEST(ProviderTest, MessageFromJsonKeepsStringArguments) {
    auto m = Message::from_json({
        {"role", "assistant"},
        {"tool_calls", nlohmann::json::array({{{"function", {{"name", "x"}, {"arguments", "{\"a\":1}"}}}}})}
    });
    ASSERT_EQ(m.tool_calls.size(), 1u);
    EXPECT_TRUE(m.tool_calls[0].arguments.is_string());
}
