#include <gtest/gtest.h>
#include <string>
#include <string_view>
#include <vector>
#include "parley/engine/builders.hpp"
#include "mocks/mock_provider.hpp"

using namespace parley;
using namespace parley::engine;
using parley::testing::MockProvider;
using json = nlohmann::json;

class PlainBuilderTest : public ::testing::Test {
protected:
    void SetUp() override {
        mock = std::make_shared<MockProvider>();
        messages.append_user("Hello");
    }

    PlainBuilder builder() const {
        return PlainBuilder(mock, provider::ModelSpec{"mock", "test-model"});
    }

    std::shared_ptr<MockProvider> mock;
    MessageCollection messages;
};

TEST_F(PlainBuilderTest, CompleteReturnsResponse) {
    mock->enqueue_text("Hi there!", provider::ReportedUsage{10, 5, std::nullopt});

    auto response = builder().complete(messages);

    ASSERT_TRUE(response.has_value()) << response.error().to_string();
    EXPECT_EQ(response->content(), "Hi there!");
    EXPECT_EQ(response->model(), "test-model");
    EXPECT_EQ(response->finish_reason(), "stop");
    EXPECT_EQ(response->usage().prompt_tokens, 10);
    EXPECT_EQ(response->usage().output_tokens, 5);
    EXPECT_EQ(response->usage().total_tokens, 15);

    EXPECT_EQ(mock->call_count, 1);
    EXPECT_EQ(mock->last_model_id, "test-model");
    ASSERT_EQ(mock->last_messages.size(), 1u);
    EXPECT_EQ(mock->last_messages[0], Message::user("Hello"));
    EXPECT_TRUE(mock->last_options.tools.empty());
    EXPECT_FALSE(mock->last_options.output_format.has_value());
}

TEST_F(PlainBuilderTest, ReportedTotalIsAuthoritative) {
    mock->enqueue_text("ok", provider::ReportedUsage{10, 5, 20});

    auto response = builder().complete(messages);

    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->usage().total_tokens, 20);
}

TEST_F(PlainBuilderTest, MissingUsageIsZero) {
    mock->enqueue_text("ok");

    auto response = builder().complete(messages);

    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->usage(), Usage{});
}

TEST_F(PlainBuilderTest, FinishReasonForwarded) {
    mock->enqueue_text("cut", std::nullopt, std::string("length"));

    auto response = builder().complete(messages);

    ASSERT_TRUE(response.has_value());
    EXPECT_EQ(response->finish_reason(), "length");
}

TEST_F(PlainBuilderTest, ConfigReachesProvider) {
    auto b = builder();
    b.set_temperature(0.5f).set_max_tokens(100).set_top_p(0.9f)
     .set_frequency_penalty(0.1f).set_presence_penalty(-0.1f);

    ASSERT_TRUE(b.complete(messages).has_value());
    EXPECT_EQ(mock->last_config, b.config());
    EXPECT_EQ(mock->last_config.temperature, std::optional<float>(0.5f));
    EXPECT_EQ(mock->last_config.max_tokens, std::optional<int>(100));
}

TEST_F(PlainBuilderTest, UnsetConfigStaysUnset) {
    ASSERT_TRUE(builder().complete(messages).has_value());
    EXPECT_EQ(mock->last_config, RequestConfig{});
}

TEST_F(PlainBuilderTest, OutOfRangeConfigFailsBeforeDispatch) {
    auto hot = builder();
    hot.set_temperature(2.5f);
    auto result = hot.complete(messages);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidRequestConfig);
    EXPECT_EQ(result.error().kind(), ErrorKind::Validation);

    auto zero = builder();
    zero.set_max_tokens(0);
    EXPECT_FALSE(zero.complete(messages).has_value());

    auto wide = builder();
    wide.set_top_p(1.5f);
    EXPECT_FALSE(wide.complete(messages).has_value());

    auto penalty = builder();
    penalty.set_presence_penalty(-2.5f);
    EXPECT_FALSE(penalty.complete(messages).has_value());

    EXPECT_EQ(mock->call_count, 0);
}

TEST_F(PlainBuilderTest, EmptyToolCallIdFailsBeforeDispatch) {
    messages.append_tool_result("", "42");

    auto response = builder().complete(messages);

    ASSERT_FALSE(response.has_value());
    EXPECT_EQ(response.error().code, ErrorCode::InvalidMessage);
    EXPECT_EQ(mock->call_count, 0);
}

TEST_F(PlainBuilderTest, DispatchIsLoggedAtDebug) {
    std::vector<std::string> records;
    set_log_callback([&records](LogLevel level, std::string_view text) {
        if (level == LogLevel::Debug) records.emplace_back(text);
    });
    set_log_level(LogLevel::Debug);

    auto response = builder().complete(messages);

    set_log_callback(nullptr);
    set_log_level(LogLevel::Warn);
    ASSERT_TRUE(response.has_value());
    ASSERT_EQ(records.size(), 1u);
    EXPECT_EQ(records[0], "Dispatching 1 messages to mock:test-model");
}

TEST_F(PlainBuilderTest, BoundaryValuesAccepted) {
    auto b = builder();
    b.set_temperature(2.0f).set_max_tokens(1).set_top_p(1.0f)
     .set_frequency_penalty(-2.0f).set_presence_penalty(2.0f);

    EXPECT_TRUE(b.complete(messages).has_value());
    EXPECT_EQ(mock->call_count, 1);
}

TEST_F(PlainBuilderTest, WithOptionsMergesKnownKeys) {
    auto b = builder();
    b.set_top_p(0.8f).with_options(json{{"temperature", 0.25}, {"max_tokens", 64}, {"seed", 7}});

    EXPECT_EQ(b.config().temperature, std::optional<float>(0.25f));
    EXPECT_EQ(b.config().max_tokens, std::optional<int>(64));
    EXPECT_EQ(b.config().top_p, std::optional<float>(0.8f));
    EXPECT_TRUE(b.complete(messages).has_value());
}

TEST_F(PlainBuilderTest, WithOptionsBadValueIsReportedAtComplete) {
    auto b = builder();
    b.with_options(json{{"temperature", "hot"}});

    auto result = b.complete(messages);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidRequestConfig);
    EXPECT_EQ(mock->call_count, 0);
}

TEST_F(PlainBuilderTest, FirstDeferredErrorWins) {
    auto b = builder();
    b.with_options(json::array()).with_options(json{{"max_tokens", 1.5}});

    auto result = b.complete(messages);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().message, "Options must be a JSON object");
}

TEST_F(PlainBuilderTest, ConfigCheckedBeforeToolOrdering) {
    std::vector<Message> orphan = {Message::tool("call_1", "result")};

    auto b = builder();
    b.set_temperature(-1.0f);
    auto result = b.complete(orphan);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::InvalidRequestConfig);

    auto ordering = builder().complete(orphan);
    ASSERT_FALSE(ordering.has_value());
    EXPECT_EQ(ordering.error().code, ErrorCode::ToolResultWithoutReplay);
    EXPECT_EQ(mock->call_count, 0);
}

TEST_F(PlainBuilderTest, ProviderErrorForwardedUnchanged) {
    mock->enqueue_error(Error{ErrorCode::ConnectionTimeout, "timed out", "mock"});

    auto result = builder().complete(messages);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConnectionTimeout);
    EXPECT_EQ(result.error().kind(), ErrorKind::Connection);
    EXPECT_EQ(result.error().message, "timed out");
}

TEST_F(PlainBuilderTest, NullProviderIsConnectionError) {
    PlainBuilder detached(nullptr, provider::ModelSpec{"mock", "test-model"});

    auto result = detached.complete(messages);

    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code, ErrorCode::ConnectionFailed);
}

TEST_F(PlainBuilderTest, EmptyConversationIsSent) {
    auto result = builder().complete(std::vector<Message>{});

    ASSERT_TRUE(result.has_value());
    EXPECT_EQ(result->content(), mock->default_content);
    EXPECT_TRUE(mock->last_messages.empty());
}

TEST_F(PlainBuilderTest, BuilderIsReusable) {
    auto b = builder();
    mock->enqueue_text("one");
    mock->enqueue_text("two");

    EXPECT_EQ(b.complete(messages)->content(), "one");
    EXPECT_EQ(b.complete(messages)->content(), "two");
    EXPECT_EQ(mock->call_count, 2);
}
