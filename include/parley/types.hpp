#pragma once

#include <algorithm>
#include <cstdint>
#include <limits>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>
#include <tl/expected.hpp>

namespace parley {

// ============================================================================
// Message Roles
// ============================================================================

/**
 * @brief Message role in conversation flow
 *
 * Defines the source and purpose of a message in the conversation history.
 */
enum class Role {
    System,     ///< Instructions that guide model behavior
    User,       ///< Input from the end user
    Assistant,  ///< Model-generated turn (text or a tool-call request)
    Tool        ///< Result of a tool executed by the caller
};

[[nodiscard]] inline const char* role_to_string(Role role) {
    switch (role) {
        case Role::System: return "system";
        case Role::User: return "user";
        case Role::Assistant: return "assistant";
        case Role::Tool: return "tool";
    }
    return "unknown";
}

[[nodiscard]] inline std::optional<Role> role_from_string(const std::string& name) {
    if (name == "system") return Role::System;
    if (name == "user") return Role::User;
    if (name == "assistant") return Role::Assistant;
    if (name == "tool") return Role::Tool;
    return std::nullopt;
}

// ============================================================================
// Token Usage
// ============================================================================

/**
 * @brief Token usage statistics for a single exchange
 *
 * Pure value type. The provider-reported total is authoritative; the sum of
 * prompt and output tokens is used only when the provider omitted the total.
 */
struct Usage {
    int64_t prompt_tokens = 0;   ///< Tokens in the input prompt
    int64_t output_tokens = 0;   ///< Tokens generated in the response
    int64_t total_tokens = 0;    ///< Provider total, or prompt + output when absent

    /**
     * @brief Build usage from provider counts
     *
     * Negative counts are clamped to zero.
     *
     * @param prompt Prompt token count
     * @param output Output token count
     * @param reported_total Total reported by the provider, if any
     */
    static Usage from_counts(int64_t prompt, int64_t output,
                             std::optional<int64_t> reported_total = std::nullopt) {
        Usage usage;
        usage.prompt_tokens = std::max<int64_t>(0, prompt);
        usage.output_tokens = std::max<int64_t>(0, output);
        usage.total_tokens = reported_total.has_value()
            ? *reported_total
            : usage.prompt_tokens + usage.output_tokens;
        return usage;
    }

    nlohmann::json to_json() const {
        return nlohmann::json{
            {"prompt_tokens", prompt_tokens},
            {"output_tokens", output_tokens},
            {"total_tokens", total_tokens}
        };
    }

    bool operator==(const Usage& other) const {
        return prompt_tokens == other.prompt_tokens &&
               output_tokens == other.output_tokens &&
               total_tokens == other.total_tokens;
    }

    bool operator!=(const Usage& other) const {
        return !(*this == other);
    }
};

// ============================================================================
// Error Types
// ============================================================================

/**
 * @brief Error codes organized by category range
 *
 * - 100-199: Validation errors (malformed input, out-of-range configuration)
 * - 200-299: Structured output errors
 * - 300-399: Tool call errors
 * - 400-499: Connection errors forwarded from the provider
 */
enum class ErrorCode {
    // Validation errors (100-199)
    InvalidToolDefinition = 100,
    InvalidRequestConfig = 101,
    InvalidMessage = 102,
    InvalidModelSpec = 103,
    UnknownProvider = 104,
    InvalidSchema = 105,
    DuplicateToolName = 106,
    InvalidOutputFormat = 107,
    InvalidProviderOptions = 108,

    // Structured output errors (200-299)
    StructuredOutputParseFailed = 200,
    StructuredOutputUnsupported = 201,

    // Tool call errors (300-399)
    UnknownTool = 300,
    DuplicateToolCallId = 301,
    ToolResultWithoutReplay = 302,
    MissingToolResult = 303,
    ToolCallIdMismatch = 304,
    ToolsUnsupported = 305,
    InvalidToolCall = 306,

    // Connection errors (400-499)
    ConnectionFailed = 400,
    ConnectionTimeout = 401,
    ProviderRejected = 402,
    ModelLoadFailed = 403,
    InferenceFailed = 404,

    // Unknown
    Unknown = 999
};

/** @brief Error kind derived from the code range. */
enum class ErrorKind {
    Validation,
    StructuredOutput,
    ToolCall,
    Connection,
    Unknown
};

[[nodiscard]] inline const char* error_kind_to_string(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Validation: return "ValidationError";
        case ErrorKind::StructuredOutput: return "StructuredOutputError";
        case ErrorKind::ToolCall: return "ToolCallError";
        case ErrorKind::Connection: return "ConnectionError";
        case ErrorKind::Unknown: return "Error";
    }
    return "Error";
}

/**
 * @brief Error information with code, message, context and partial results
 *
 * Value type used with tl::expected. Errors detected after the provider has
 * answered carry the raw reply text and its usage so the caller can recover
 * without re-issuing the call.
 */
struct Error {
    ErrorCode code;                          ///< Categorized error code
    std::string message;                     ///< Human-readable error description
    std::optional<std::string> context;      ///< Additional context (offending value, index)
    std::optional<std::string> raw_content;  ///< Unparsed provider text, when a reply was received
    std::optional<Usage> usage;              ///< Usage of the failed exchange, when known

    Error(ErrorCode code, std::string message, std::optional<std::string> context = std::nullopt)
        : code(code), message(std::move(message)), context(std::move(context)) {}

    ErrorKind kind() const {
        const int value = static_cast<int>(code);
        if (value >= 100 && value < 200) return ErrorKind::Validation;
        if (value >= 200 && value < 300) return ErrorKind::StructuredOutput;
        if (value >= 300 && value < 400) return ErrorKind::ToolCall;
        if (value >= 400 && value < 500) return ErrorKind::Connection;
        return ErrorKind::Unknown;
    }

    std::string to_string() const {
        std::string result = std::string(error_kind_to_string(kind())) +
            " [" + std::to_string(static_cast<int>(code)) + "] " + message;
        if (context.has_value()) {
            result += " | Context: " + *context;
        }
        return result;
    }
};

// Expected type alias
template<typename T>
using Expected = tl::expected<T, Error>;

// ============================================================================
// Output Format
// ============================================================================

/** @brief Structured output mode requested from the provider. */
enum class OutputFormat {
    Json,        ///< Any syntactically valid JSON
    JsonSchema   ///< JSON constrained by a caller-supplied schema
};

[[nodiscard]] inline const char* output_format_to_string(OutputFormat format) {
    switch (format) {
        case OutputFormat::Json: return "json";
        case OutputFormat::JsonSchema: return "json_schema";
    }
    return "unknown";
}

inline Expected<OutputFormat> parse_output_format(const std::string& name) {
    if (name == "json") return OutputFormat::Json;
    if (name == "json_schema") return OutputFormat::JsonSchema;
    return tl::unexpected(Error{
        ErrorCode::InvalidOutputFormat,
        "Output format must be 'json' or 'json_schema'",
        name
    });
}

// ============================================================================
// Request Configuration
// ============================================================================

/**
 * @brief Generation parameters for one completion call
 *
 * Every field is optional; unset fields fall back to the provider's defaults.
 * Validated by the builders before the provider is contacted.
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
struct RequestConfig {
    std::optional<float> temperature;        ///< Sampling temperature, [0, 2]
    std::optional<int> max_tokens;           ///< Maximum tokens to generate, > 0
    std::optional<float> top_p;              ///< Nucleus sampling threshold, [0, 1]
    std::optional<float> frequency_penalty;  ///< Frequency penalty, [-2, 2]
    std::optional<float> presence_penalty;   ///< Presence penalty, [-2, 2]

    Expected<void> validate() const {
        if (temperature && !in_range(*temperature, 0.0f, 2.0f)) {
            return out_of_range("temperature must be within [0, 2]", *temperature);
        }
        if (max_tokens && *max_tokens <= 0) {
            return tl::unexpected(Error{
                ErrorCode::InvalidRequestConfig,
                "max_tokens must be positive",
                std::to_string(*max_tokens)
            });
        }
        if (top_p && !in_range(*top_p, 0.0f, 1.0f)) {
            return out_of_range("top_p must be within [0, 1]", *top_p);
        }
        if (frequency_penalty && !in_range(*frequency_penalty, -2.0f, 2.0f)) {
            return out_of_range("frequency_penalty must be within [-2, 2]", *frequency_penalty);
        }
        if (presence_penalty && !in_range(*presence_penalty, -2.0f, 2.0f)) {
            return out_of_range("presence_penalty must be within [-2, 2]", *presence_penalty);
        }
        return {};
    }

    /**
     * @brief Overwrite the fields that are set in @p overrides
     */
    void merge(const RequestConfig& overrides) {
        if (overrides.temperature) temperature = overrides.temperature;
        if (overrides.max_tokens) max_tokens = overrides.max_tokens;
        if (overrides.top_p) top_p = overrides.top_p;
        if (overrides.frequency_penalty) frequency_penalty = overrides.frequency_penalty;
        if (overrides.presence_penalty) presence_penalty = overrides.presence_penalty;
    }

    /**
     * @brief Read generation options from an untyped map
     *
     * Recognized keys: temperature, max_tokens, top_p, frequency_penalty,
     * presence_penalty. Unknown keys are ignored; a known key with a
     * non-numeric value is a validation error. Ranges are not checked here.
     */
    static Expected<RequestConfig> from_json(const nlohmann::json& options) {
        if (!options.is_object()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidRequestConfig,
                "Options must be a JSON object"
            });
        }

        RequestConfig config;
        for (const auto& [key, value] : options.items()) {
            if (key != "temperature" && key != "max_tokens" && key != "top_p" &&
                key != "frequency_penalty" && key != "presence_penalty") {
                continue;
            }
            if (value.is_null()) {
                continue;
            }
            if (!value.is_number()) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidRequestConfig,
                    "Option '" + key + "' must be a number",
                    value.dump()
                });
            }
            if (key == "max_tokens") {
                if (!value.is_number_integer()) {
                    return tl::unexpected(Error{
                        ErrorCode::InvalidRequestConfig,
                        "Option 'max_tokens' must be an integer",
                        value.dump()
                    });
                }
                const bool overflows_int = value.is_number_unsigned()
                    ? value.get<uint64_t>() > static_cast<uint64_t>(std::numeric_limits<int>::max())
                    : (value.get<int64_t>() > std::numeric_limits<int>::max() ||
                       value.get<int64_t>() < std::numeric_limits<int>::min());
                if (overflows_int) {
                    return tl::unexpected(Error{
                        ErrorCode::InvalidRequestConfig,
                        "Option 'max_tokens' is out of range",
                        value.dump()
                    });
                }
                config.max_tokens = value.get<int>();
            } else if (key == "temperature") {
                config.temperature = value.get<float>();
            } else if (key == "top_p") {
                config.top_p = value.get<float>();
            } else if (key == "frequency_penalty") {
                config.frequency_penalty = value.get<float>();
            } else {
                config.presence_penalty = value.get<float>();
            }
        }
        return config;
    }

    /** @brief Serialize the fields that are set. */
    nlohmann::json to_json() const {
        nlohmann::json out = nlohmann::json::object();
        if (temperature) out["temperature"] = *temperature;
        if (max_tokens) out["max_tokens"] = *max_tokens;
        if (top_p) out["top_p"] = *top_p;
        if (frequency_penalty) out["frequency_penalty"] = *frequency_penalty;
        if (presence_penalty) out["presence_penalty"] = *presence_penalty;
        return out;
    }

    bool operator==(const RequestConfig& other) const {
        return temperature == other.temperature &&
               max_tokens == other.max_tokens &&
               top_p == other.top_p &&
               frequency_penalty == other.frequency_penalty &&
               presence_penalty == other.presence_penalty;
    }

    bool operator!=(const RequestConfig& other) const {
        return !(*this == other);
    }

private:
    // NaN fails both comparisons
    static bool in_range(float value, float lo, float hi) {
        return value >= lo && value <= hi;
    }

    static tl::unexpected<Error> out_of_range(const char* what, float value) {
        return tl::unexpected(Error{
            ErrorCode::InvalidRequestConfig,
            what,
            std::to_string(value)
        });
    }
};

// ============================================================================
// JSON helpers
// ============================================================================

namespace detail {

/** @brief Optional string to JSON, null when absent. */
inline nlohmann::json optional_to_json(const std::optional<std::string>& value) {
    return value.has_value() ? nlohmann::json(*value) : nlohmann::json(nullptr);
}

/**
 * @brief Read an optional string field; null and missing both mean absent
 *
 * @return Expected<std::optional<std::string>> Value, or an error if present with a non-string type
 */
inline Expected<std::optional<std::string>> optional_string_field(
    const nlohmann::json& object, const char* key, ErrorCode code)
{
    auto it = object.find(key);
    if (it == object.end() || it->is_null()) {
        return std::optional<std::string>{};
    }
    if (!it->is_string()) {
        return tl::unexpected(Error{code, std::string("Field '") + key + "' must be a string", it->dump()});
    }
    return std::optional<std::string>{it->get<std::string>()};
}

/** @brief Read a required string field. */
inline Expected<std::string> string_field(
    const nlohmann::json& object, const char* key, ErrorCode code, const char* owner)
{
    auto it = object.find(key);
    if (it == object.end() || !it->is_string()) {
        return tl::unexpected(Error{
            code,
            std::string(owner) + " must have a string '" + key + "' field"
        });
    }
    return it->get<std::string>();
}

} // namespace detail

/**
 * @brief Rebuild usage from its serialized form
 *
 * A missing total falls back to the sum of the counts.
 */
inline Expected<Usage> usage_from_json(const nlohmann::json& data) {
    if (!data.is_object()) {
        return tl::unexpected(Error{ErrorCode::InvalidMessage, "Usage must be a JSON object"});
    }
    auto read_count = [&data](const char* key) -> Expected<std::optional<int64_t>> {
        auto it = data.find(key);
        if (it == data.end() || it->is_null()) {
            return std::optional<int64_t>{};
        }
        if (!it->is_number_integer() || it->get<int64_t>() < 0) {
            return tl::unexpected(Error{
                ErrorCode::InvalidMessage,
                std::string("Usage field '") + key + "' must be a non-negative integer",
                it->dump()
            });
        }
        return std::optional<int64_t>{it->get<int64_t>()};
    };

    auto prompt = read_count("prompt_tokens");
    if (!prompt) return tl::unexpected(prompt.error());
    auto output = read_count("output_tokens");
    if (!output) return tl::unexpected(output.error());
    auto total = read_count("total_tokens");
    if (!total) return tl::unexpected(total.error());

    return Usage::from_counts(prompt->value_or(0), output->value_or(0), *total);
}

} // namespace parley
