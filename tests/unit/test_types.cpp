#include <gtest/gtest.h>
#include <cmath>
#include <limits>
#include <vector>
#include "parley/types.hpp"
#include "parley/log.hpp"

using namespace parley;
using json = nlohmann::json;

// ============================================================================
// Role Tests
// ============================================================================

TEST(RoleTest, RoleToString) {
    EXPECT_STREQ(role_to_string(Role::System), "system");
    EXPECT_STREQ(role_to_string(Role::User), "user");
    EXPECT_STREQ(role_to_string(Role::Assistant), "assistant");
    EXPECT_STREQ(role_to_string(Role::Tool), "tool");
}

TEST(RoleTest, RoleFromString) {
    EXPECT_EQ(role_from_string("system"), Role::System);
    EXPECT_EQ(role_from_string("user"), Role::User);
    EXPECT_EQ(role_from_string("assistant"), Role::Assistant);
    EXPECT_EQ(role_from_string("tool"), Role::Tool);
    EXPECT_FALSE(role_from_string("developer").has_value());
    EXPECT_FALSE(role_from_string("").has_value());
}

// ============================================================================
// Usage Tests
// ============================================================================

TEST(UsageTest, DefaultIsZero) {
    Usage usage;
    EXPECT_EQ(usage.prompt_tokens, 0);
    EXPECT_EQ(usage.output_tokens, 0);
    EXPECT_EQ(usage.total_tokens, 0);
}

TEST(UsageTest, TotalFallsBackToSum) {
    auto usage = Usage::from_counts(12, 30);
    EXPECT_EQ(usage.prompt_tokens, 12);
    EXPECT_EQ(usage.output_tokens, 30);
    EXPECT_EQ(usage.total_tokens, 42);
}

TEST(UsageTest, ReportedTotalIsAuthoritative) {
    auto usage = Usage::from_counts(12, 30, 50);
    EXPECT_EQ(usage.prompt_tokens, 12);
    EXPECT_EQ(usage.output_tokens, 30);
    EXPECT_EQ(usage.total_tokens, 50);
}

TEST(UsageTest, ReportedTotalEqualToSum) {
    auto usage = Usage::from_counts(5, 5, 10);
    EXPECT_EQ(usage.total_tokens, usage.prompt_tokens + usage.output_tokens);
}

TEST(UsageTest, NegativeCountsClampToZero) {
    auto usage = Usage::from_counts(-3, 7);
    EXPECT_EQ(usage.prompt_tokens, 0);
    EXPECT_EQ(usage.output_tokens, 7);
    EXPECT_EQ(usage.total_tokens, 7);
}

TEST(UsageTest, FromJsonMissingTotal) {
    auto usage = usage_from_json(json{{"prompt_tokens", 3}, {"output_tokens", 4}});
    ASSERT_TRUE(usage.has_value());
    EXPECT_EQ(usage->total_tokens, 7);
}

TEST(UsageTest, FromJsonRejectsNegative) {
    auto usage = usage_from_json(json{{"prompt_tokens", -1}, {"output_tokens", 4}});
    ASSERT_FALSE(usage.has_value());
    EXPECT_EQ(usage.error().code, ErrorCode::InvalidMessage);
}

TEST(UsageTest, Equality) {
    EXPECT_EQ(Usage::from_counts(1, 2), Usage::from_counts(1, 2, 3));
    EXPECT_NE(Usage::from_counts(1, 2), Usage::from_counts(1, 2, 4));
}

// ============================================================================
// Error Tests
// ============================================================================

TEST(ErrorTest, Construction) {
    Error err(ErrorCode::InvalidRequestConfig, "Test error");
    EXPECT_EQ(err.code, ErrorCode::InvalidRequestConfig);
    EXPECT_EQ(err.message, "Test error");
    EXPECT_FALSE(err.context.has_value());
    EXPECT_FALSE(err.raw_content.has_value());
    EXPECT_FALSE(err.usage.has_value());

    Error with_context(ErrorCode::ConnectionFailed, "Test error", "Additional context");
    ASSERT_TRUE(with_context.context.has_value());
    EXPECT_EQ(*with_context.context, "Additional context");
}

TEST(ErrorTest, KindFromCodeRange) {
    EXPECT_EQ(Error(ErrorCode::InvalidToolDefinition, "").kind(), ErrorKind::Validation);
    EXPECT_EQ(Error(ErrorCode::InvalidProviderOptions, "").kind(), ErrorKind::Validation);
    EXPECT_EQ(Error(ErrorCode::StructuredOutputParseFailed, "").kind(), ErrorKind::StructuredOutput);
    EXPECT_EQ(Error(ErrorCode::UnknownTool, "").kind(), ErrorKind::ToolCall);
    EXPECT_EQ(Error(ErrorCode::MissingToolResult, "").kind(), ErrorKind::ToolCall);
    EXPECT_EQ(Error(ErrorCode::ConnectionTimeout, "").kind(), ErrorKind::Connection);
    EXPECT_EQ(Error(ErrorCode::Unknown, "").kind(), ErrorKind::Unknown);
}

TEST(ErrorTest, ToString) {
    Error err(ErrorCode::InvalidRequestConfig, "temperature must be within [0, 2]", "3.0");
    std::string str = err.to_string();
    EXPECT_NE(str.find("ValidationError"), std::string::npos);
    EXPECT_NE(str.find("101"), std::string::npos);
    EXPECT_NE(str.find("temperature must be within [0, 2]"), std::string::npos);
    EXPECT_NE(str.find("Context: 3.0"), std::string::npos);
}

TEST(ErrorTest, KindNames) {
    EXPECT_STREQ(error_kind_to_string(ErrorKind::Validation), "ValidationError");
    EXPECT_STREQ(error_kind_to_string(ErrorKind::StructuredOutput), "StructuredOutputError");
    EXPECT_STREQ(error_kind_to_string(ErrorKind::ToolCall), "ToolCallError");
    EXPECT_STREQ(error_kind_to_string(ErrorKind::Connection), "ConnectionError");
}

// ============================================================================
// OutputFormat Tests
// ============================================================================

TEST(OutputFormatTest, ParseKnownNames) {
    auto json_format = parse_output_format("json");
    ASSERT_TRUE(json_format.has_value());
    EXPECT_EQ(*json_format, OutputFormat::Json);

    auto schema_format = parse_output_format("json_schema");
    ASSERT_TRUE(schema_format.has_value());
    EXPECT_EQ(*schema_format, OutputFormat::JsonSchema);

    EXPECT_STREQ(output_format_to_string(OutputFormat::JsonSchema), "json_schema");
}

TEST(OutputFormatTest, RejectsUnknownName) {
    auto format = parse_output_format("xml");
    ASSERT_FALSE(format.has_value());
    EXPECT_EQ(format.error().code, ErrorCode::InvalidOutputFormat);
    EXPECT_EQ(format.error().kind(), ErrorKind::Validation);
}

// ============================================================================
// RequestConfig Tests
// ============================================================================

TEST(RequestConfigTest, EmptyIsValid) {
    RequestConfig config;
    EXPECT_TRUE(config.validate().has_value());
}

TEST(RequestConfigTest, BoundsAreInclusive) {
    RequestConfig config;
    config.temperature = 2.0f;
    config.top_p = 0.0f;
    config.frequency_penalty = -2.0f;
    config.presence_penalty = 2.0f;
    config.max_tokens = 1;
    EXPECT_TRUE(config.validate().has_value());
}

TEST(RequestConfigTest, OutOfRangeValues) {
    struct Case {
        RequestConfig config;
        const char* field;
    };
    std::vector<Case> cases(6);
    cases[0].config.temperature = 2.5f;       cases[0].field = "temperature";
    cases[1].config.temperature = -0.1f;      cases[1].field = "temperature";
    cases[2].config.max_tokens = 0;           cases[2].field = "max_tokens";
    cases[3].config.top_p = 1.5f;             cases[3].field = "top_p";
    cases[4].config.frequency_penalty = 2.1f; cases[4].field = "frequency_penalty";
    cases[5].config.presence_penalty = -3.0f; cases[5].field = "presence_penalty";

    for (const auto& c : cases) {
        auto result = c.config.validate();
        ASSERT_FALSE(result.has_value()) << c.field;
        EXPECT_EQ(result.error().code, ErrorCode::InvalidRequestConfig) << c.field;
        EXPECT_NE(result.error().message.find(c.field), std::string::npos) << c.field;
    }
}

TEST(RequestConfigTest, NaNIsRejected) {
    RequestConfig config;
    config.temperature = std::numeric_limits<float>::quiet_NaN();
    EXPECT_FALSE(config.validate().has_value());
}

TEST(RequestConfigTest, MergeOverridesSetFieldsOnly) {
    RequestConfig base;
    base.temperature = 0.5f;
    base.max_tokens = 100;

    RequestConfig overrides;
    overrides.max_tokens = 200;
    overrides.top_p = 0.9f;

    base.merge(overrides);
    EXPECT_EQ(base.temperature, 0.5f);
    EXPECT_EQ(base.max_tokens, 200);
    EXPECT_EQ(base.top_p, 0.9f);
    EXPECT_FALSE(base.presence_penalty.has_value());
}

TEST(RequestConfigTest, FromJsonReadsKnownKeys) {
    auto config = RequestConfig::from_json(json{
        {"temperature", 0.3},
        {"max_tokens", 64},
        {"top_p", 0.8},
        {"frequency_penalty", 0.5},
        {"presence_penalty", -0.5},
        {"unrelated", "ignored"}
    });
    ASSERT_TRUE(config.has_value());
    EXPECT_FLOAT_EQ(*config->temperature, 0.3f);
    EXPECT_EQ(*config->max_tokens, 64);
    EXPECT_FLOAT_EQ(*config->top_p, 0.8f);
    EXPECT_FLOAT_EQ(*config->frequency_penalty, 0.5f);
    EXPECT_FLOAT_EQ(*config->presence_penalty, -0.5f);
}

TEST(RequestConfigTest, FromJsonSkipsNulls) {
    auto config = RequestConfig::from_json(json{{"temperature", nullptr}});
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->temperature.has_value());
}

TEST(RequestConfigTest, FromJsonRejectsWrongTypes) {
    auto text = RequestConfig::from_json(json{{"temperature", "hot"}});
    ASSERT_FALSE(text.has_value());
    EXPECT_EQ(text.error().code, ErrorCode::InvalidRequestConfig);

    auto fractional = RequestConfig::from_json(json{{"max_tokens", 1.5}});
    ASSERT_FALSE(fractional.has_value());
    EXPECT_EQ(fractional.error().code, ErrorCode::InvalidRequestConfig);

    for (int64_t huge : {int64_t{10000000000}, int64_t{4294967297}, int64_t{-4294967297}}) {
        auto overflow = RequestConfig::from_json(json{{"max_tokens", huge}});
        ASSERT_FALSE(overflow.has_value()) << huge;
        EXPECT_EQ(overflow.error().code, ErrorCode::InvalidRequestConfig);
    }

    auto unsigned_overflow = RequestConfig::from_json(json{{"max_tokens", uint64_t{18446744073709551615ULL}}});
    ASSERT_FALSE(unsigned_overflow.has_value());
    EXPECT_EQ(unsigned_overflow.error().code, ErrorCode::InvalidRequestConfig);

    auto not_object = RequestConfig::from_json(json::array());
    EXPECT_FALSE(not_object.has_value());
}

TEST(RequestConfigTest, FromJsonDoesNotCheckRanges) {
    auto config = RequestConfig::from_json(json{{"temperature", 9.0}});
    ASSERT_TRUE(config.has_value());
    EXPECT_FALSE(config->validate().has_value());
}

TEST(RequestConfigTest, ToJsonOmitsUnsetFields) {
    RequestConfig config;
    config.max_tokens = 10;
    auto out = config.to_json();
    EXPECT_EQ(out.size(), 1u);
    EXPECT_EQ(out["max_tokens"], 10);
}

// ============================================================================
// Log Tests
// ============================================================================

class LogTest : public ::testing::Test {
protected:
    void TearDown() override {
        set_log_callback(nullptr);
        set_log_level(LogLevel::Warn);
    }
};

TEST_F(LogTest, CallbackReceivesRecordsAtOrAboveLevel) {
    std::vector<std::pair<LogLevel, std::string>> records;
    set_log_callback([&records](LogLevel level, std::string_view text) {
        records.emplace_back(level, std::string(text));
    });
    set_log_level(LogLevel::Info);

    parley::log_debug("hidden");
    parley::log_info("shown");
    parley::log_error("also shown");

    ASSERT_EQ(records.size(), 2u);
    EXPECT_EQ(records[0].first, LogLevel::Info);
    EXPECT_EQ(records[0].second, "shown");
    EXPECT_EQ(records[1].first, LogLevel::Error);
}

TEST_F(LogTest, DefaultLevelIsWarn) {
    int count = 0;
    set_log_callback([&count](LogLevel, std::string_view) { ++count; });

    parley::log_info("dropped");
    parley::log_warn("kept");

    EXPECT_EQ(count, 1);
}
