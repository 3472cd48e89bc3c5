#include <gtest/gtest.h>
#include "parley/engine/tool_sequence.hpp"
#include "parley/response.hpp"

using namespace parley;
using namespace parley::engine;
using json = nlohmann::json;

namespace {

Message replay(const std::vector<std::string>& ids) {
    std::vector<ToolCall> calls;
    for (const auto& id : ids) {
        calls.push_back(*ToolCall::from_json(json{{"id", id}, {"name", "get_time"}}));
    }
    return Message::from_response(ToolResponse("", calls, Usage{}, "m", "tool_calls", "resp_1"));
}

} // namespace

class ToolSequenceTest : public ::testing::Test {};

TEST_F(ToolSequenceTest, EmptyAndPlainConversationsAreValid) {
    EXPECT_TRUE(ToolSequence::validate({}).has_value());
    EXPECT_TRUE(ToolSequence::validate({
        Message::system("s"), Message::user("u"), Message::assistant("a"), Message::user("u2")
    }).has_value());
}

TEST_F(ToolSequenceTest, CompleteBatchIsValid) {
    std::vector<Message> messages = {
        Message::user("go"),
        replay({"a", "b"}),
        Message::tool("a", "1"),
        Message::tool("b", "2"),
        Message::assistant("done")
    };
    EXPECT_TRUE(ToolSequence::validate(messages).has_value());
    EXPECT_TRUE(ToolSequence::pending_calls(messages).empty());
}

TEST_F(ToolSequenceTest, ToolResultWithoutReplay) {
    auto result = ToolSequence::validate({Message::user("go"), Message::tool("a", "1")});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ToolResultWithoutReplay);
    EXPECT_EQ(result.error().kind(), ErrorKind::ToolCall);
    EXPECT_EQ(result.error().context, std::optional<std::string>("index 1, tool_call_id a"));
}

TEST_F(ToolSequenceTest, ToolResultAfterPlainAssistant) {
    auto result = ToolSequence::validate({Message::assistant("hi"), Message::tool("a", "1")});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ToolResultWithoutReplay);
}

TEST_F(ToolSequenceTest, ResultsOutOfOrder) {
    auto result = ToolSequence::validate({
        replay({"a", "b"}), Message::tool("b", "2"), Message::tool("a", "1")
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ToolCallIdMismatch);
    EXPECT_NE(result.error().message.find("expected a"), std::string::npos);
}

TEST_F(ToolSequenceTest, UnknownCallId) {
    auto result = ToolSequence::validate({replay({"a"}), Message::tool("zzz", "1")});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ToolCallIdMismatch);
}

TEST_F(ToolSequenceTest, ExtraResultExceedsBatch) {
    auto result = ToolSequence::validate({
        replay({"a"}), Message::tool("a", "1"), Message::tool("a", "again")
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ToolCallIdMismatch);
    EXPECT_EQ(result.error().context, std::optional<std::string>("index 2, tool_call_id a"));
}

TEST_F(ToolSequenceTest, InterruptedBatch) {
    auto result = ToolSequence::validate({
        replay({"a", "b"}), Message::tool("a", "1"), Message::user("never mind")
    });
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::MissingToolResult);
    EXPECT_EQ(result.error().context, std::optional<std::string>("index 2, missing b"));
}

TEST_F(ToolSequenceTest, TrailingIncompleteBatch) {
    std::vector<Message> messages = {Message::user("go"), replay({"a", "b"}), Message::tool("a", "1")};

    auto result = ToolSequence::validate(messages);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::MissingToolResult);
    EXPECT_EQ(result.error().context, std::optional<std::string>("b"));

    EXPECT_EQ(ToolSequence::pending_calls(messages), (std::vector<std::string>{"b"}));
}

TEST_F(ToolSequenceTest, ConsecutiveBatches) {
    std::vector<Message> messages = {
        replay({"a"}), Message::tool("a", "1"),
        replay({"b"}), Message::tool("b", "2")
    };
    EXPECT_TRUE(ToolSequence::validate(messages).has_value());

    messages.push_back(replay({"c"}));
    EXPECT_EQ(ToolSequence::pending_calls(messages), (std::vector<std::string>{"c"}));
}

TEST_F(ToolSequenceTest, PendingCallsEmptyWhenOrderingInvalid) {
    EXPECT_TRUE(ToolSequence::pending_calls({Message::tool("a", "1"), replay({"b"})}).empty());
}
