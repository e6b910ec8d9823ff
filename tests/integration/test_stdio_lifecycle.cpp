#include <gtest/gtest.h>
#include "session.hpp"
#include "dtmcp/error.hpp"
#include <cstdint>

using namespace dtmcp;
using dtmcp::test_support::ServerSession;
using json = nlohmann::json;

TEST(StdioLifecycle, FullLifecycle) {
    ServerSession session;

    auto init = session.call(R"({"jsonrpc":"2.0","id":1,"method":"initialize","params":{}})");
    ASSERT_TRUE(init.has_value());
    EXPECT_EQ((*init)["id"], 1);
    EXPECT_EQ((*init)["result"]["protocolVersion"], "2024-11-05");
    EXPECT_EQ((*init)["result"]["serverInfo"]["name"], "datetime-mcp-server");
    EXPECT_EQ((*init)["result"]["serverInfo"]["version"], "1.0.0");
    EXPECT_TRUE((*init)["result"]["capabilities"]["tools"].is_object());
    EXPECT_TRUE(session.server().is_running());

    auto list = session.call(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    ASSERT_TRUE(list.has_value());
    EXPECT_EQ((*list)["result"]["tools"].size(), 5u);

    session.close_input();
    EXPECT_FALSE(session.server().is_running());
    EXPECT_FALSE(session.read_line().has_value());
}

TEST(StdioLifecycle, EachResponseIsFlushedBeforeNextRequest) {
    ServerSession session;
    for (int i = 1; i <= 20; ++i) {
        auto resp = session.call(R"({"jsonrpc":"2.0","id":)" + std::to_string(i)
                                 + R"(,"method":"initialize"})");
        ASSERT_TRUE(resp.has_value()) << "no response to request " << i;
        EXPECT_EQ((*resp)["id"], i);
    }
}

TEST(StdioLifecycle, InvalidLineThenValidRequest) {
    ServerSession session;

    auto bad = session.call("{oops");
    ASSERT_TRUE(bad.has_value());
    EXPECT_TRUE((*bad)["id"].is_null());
    EXPECT_EQ((*bad)["error"]["code"], error::ParseError);
    EXPECT_EQ((*bad)["error"]["message"], "Parse error");

    auto good = session.call(R"({"jsonrpc":"2.0","id":3,"method":"initialize"})");
    ASSERT_TRUE(good.has_value());
    EXPECT_EQ((*good)["id"], 3);
    EXPECT_TRUE(good->contains("result"));
}

TEST(StdioLifecycle, BlankLinesProduceNoOutput) {
    ServerSession session;
    session.send_line("");
    session.send_line("   ");
    session.send_line(R"({"jsonrpc":"2.0","id":9,"method":"tools/list"})");

    auto line = session.read_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(json::parse(*line)["id"], 9);
}

TEST(StdioLifecycle, NotificationIsAnsweredWithNullId) {
    ServerSession session;
    auto resp = session.call(R"({"jsonrpc":"2.0","method":"initialize"})");
    ASSERT_TRUE(resp.has_value());
    ASSERT_TRUE(resp->contains("id"));
    EXPECT_TRUE((*resp)["id"].is_null());
    EXPECT_TRUE(resp->contains("result"));
}

TEST(StdioLifecycle, IdsAreEchoed) {
    ServerSession session;

    auto numeric = session.call(R"({"jsonrpc":"2.0","id":123456789012,"method":"tools/list"})");
    ASSERT_TRUE(numeric.has_value());
    EXPECT_EQ((*numeric)["id"], 123456789012LL);

    auto text = session.call(R"({"jsonrpc":"2.0","id":"req-7","method":"nope"})");
    ASSERT_TRUE(text.has_value());
    EXPECT_EQ((*text)["id"], "req-7");
    EXPECT_EQ((*text)["error"]["code"], error::MethodNotFound);

    auto null_id = session.call(R"({"jsonrpc":"2.0","id":null,"method":"nope"})");
    ASSERT_TRUE(null_id.has_value());
    EXPECT_TRUE((*null_id)["id"].is_null());

    auto max_id = session.call(R"({"jsonrpc":"2.0","id":9223372036854775807,"method":"tools/list"})");
    ASSERT_TRUE(max_id.has_value());
    EXPECT_EQ((*max_id)["id"], INT64_MAX);

    // Beyond int64 the id cannot round-trip, so the line is rejected outright
    auto too_big = session.call(R"({"jsonrpc":"2.0","id":9223372036854775808,"method":"tools/list"})");
    ASSERT_TRUE(too_big.has_value());
    EXPECT_TRUE((*too_big)["id"].is_null());
    EXPECT_EQ((*too_big)["error"]["code"], error::ParseError);
    EXPECT_FALSE(too_big->contains("result"));
}

TEST(StdioLifecycle, UnknownMethod) {
    ServerSession session;
    auto resp = session.call(R"({"jsonrpc":"2.0","id":4,"method":"resources/list"})");
    ASSERT_TRUE(resp.has_value());
    EXPECT_EQ((*resp)["error"]["code"], error::MethodNotFound);
    EXPECT_EQ((*resp)["error"]["message"], "Method not found: resources/list");
    EXPECT_FALSE(resp->contains("result"));
}

TEST(StdioLifecycle, UnterminatedFinalLineIsAnswered) {
    ServerSession session;
    session.send_raw(R"({"jsonrpc":"2.0","id":2,"method":"tools/list"})");
    session.close_input();

    auto line = session.read_line();
    ASSERT_TRUE(line.has_value());
    EXPECT_EQ(json::parse(*line)["id"], 2);
    EXPECT_FALSE(session.read_line().has_value());
}
