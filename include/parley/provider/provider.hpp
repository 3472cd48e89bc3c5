#pragma once

#include "../types.hpp"
#include "../tool.hpp"
#include "../message.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parley {
namespace provider {

/**
 * @brief Parsed "provider:model" selection
 */
struct ModelSpec {
    std::string provider;  ///< Vendor name, e.g. "llama"
    std::string model;     ///< Vendor-specific model id or path

    /**
     * @brief Split at the first ':'
     *
     * @return Expected<ModelSpec> Spec, or InvalidModelSpec when either half is empty
     */
    static Expected<ModelSpec> parse(const std::string& text) {
        const auto colon = text.find(':');
        if (colon == std::string::npos || colon == 0 || colon + 1 == text.size()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidModelSpec,
                "Model must be given as 'provider:model'",
                text
            });
        }
        return ModelSpec{text.substr(0, colon), text.substr(colon + 1)};
    }

    std::string to_string() const {
        return provider + ":" + model;
    }

    bool operator==(const ModelSpec& other) const {
        return provider == other.provider && model == other.model;
    }

    bool operator!=(const ModelSpec& other) const {
        return !(*this == other);
    }
};

/**
 * @brief Opaque per-session overrides handed to the adapter
 *
 * The core never interprets these; each adapter documents which keys of
 * @c extra it honours.
 */
struct ProviderOptions {
    std::optional<std::string> api_key;
    std::optional<std::string> base_url;
    std::optional<std::chrono::milliseconds> timeout;
    nlohmann::json extra = nlohmann::json::object();  ///< Adapter-specific settings

    /**
     * @brief Read options from an untyped map
     *
     * "api_key" and "base_url" must be strings, "timeout" a non-negative
     * number of seconds. Every other key is copied into @c extra.
     */
    static Expected<ProviderOptions> from_json(const nlohmann::json& data) {
        if (!data.is_object()) {
            return tl::unexpected(Error{ErrorCode::InvalidProviderOptions, "Provider options must be a JSON object"});
        }
        ProviderOptions options;
        auto api_key = detail::optional_string_field(data, "api_key", ErrorCode::InvalidProviderOptions);
        if (!api_key) return tl::unexpected(api_key.error());
        options.api_key = std::move(*api_key);
        auto base_url = detail::optional_string_field(data, "base_url", ErrorCode::InvalidProviderOptions);
        if (!base_url) return tl::unexpected(base_url.error());
        options.base_url = std::move(*base_url);

        for (const auto& [key, value] : data.items()) {
            if (key == "api_key" || key == "base_url") {
                continue;
            }
            if (key == "timeout") {
                if (value.is_null()) {
                    continue;
                }
                if (!value.is_number() || value.get<double>() < 0.0) {
                    return tl::unexpected(Error{
                        ErrorCode::InvalidProviderOptions,
                        "timeout must be a non-negative number of seconds",
                        value.dump()
                    });
                }
                // 2^63 is exact as a double; anything at or above it does not fit milliseconds::rep.
                const double millis = value.get<double>() * 1000.0;
                if (!(millis < static_cast<double>(std::chrono::milliseconds::max().count()))) {
                    return tl::unexpected(Error{
                        ErrorCode::InvalidProviderOptions,
                        "timeout is out of range",
                        value.dump()
                    });
                }
                options.timeout = std::chrono::milliseconds(static_cast<int64_t>(millis));
                continue;
            }
            options.extra[key] = value;
        }
        return options;
    }
};

/** @brief Tool call as reported by a vendor, before validation. */
struct ProviderToolCall {
    std::string id;
    std::string name;
    nlohmann::json arguments;  ///< Object, or a JSON-encoded string
};

/** @brief Token counts as reported by a vendor. */
struct ReportedUsage {
    int64_t prompt_tokens = 0;
    int64_t output_tokens = 0;
    std::optional<int64_t> total_tokens;  ///< Absent when the vendor did not report one
};

/** @brief Request features beyond the conversation and RequestConfig. */
struct CompletionOptions {
    std::vector<ToolDefinition> tools;
    std::optional<OutputFormat> output_format;
    std::optional<nlohmann::json> schema;
};

/**
 * @brief Raw outcome of one provider call
 *
 * Mapped into Response, StructuredResponse or ToolResponse by the core.
 */
struct ProviderReply {
    std::string content;
    std::optional<std::string> finish_reason;
    std::optional<ReportedUsage> usage;            ///< Absent: all-zero Usage
    std::vector<ProviderToolCall> tool_calls;
    std::optional<nlohmann::json> structured_value; ///< Already-parsed structured output
    std::optional<std::string> response_id;
};

/**
 * @brief Abstract interface for model vendors
 *
 * Enables dependency injection for testing. complete_chat() is the only
 * blocking operation; it performs the whole exchange and returns either the
 * raw reply or a ConnectionError. Implementations report their own
 * transport, authentication and timeout failures; the core never retries.
 */
class IProvider {
public:
    virtual ~IProvider() = default;

    /**
     * @brief Perform one completion exchange
     *
     * @param model_id Model half of the session's "provider:model"
     * @param messages Full conversation in send order
     * @param config Generation parameters; unset fields use provider defaults
     * @param options Offered tools and requested output format
     * @return Expected<ProviderReply> Raw reply or error
     */
    virtual Expected<ProviderReply> complete_chat(
        const std::string& model_id,
        const std::vector<Message>& messages,
        const RequestConfig& config,
        const CompletionOptions& options
    ) = 0;

    virtual bool supports_tools(const std::string& /*model_id*/) const { return true; }

    virtual bool supports_structured_output(const std::string& /*model_id*/) const { return true; }

    /** @brief Vendor name used in log records. */
    virtual std::string name() const = 0;
};

/**
 * @brief Factory for the adapter serving @p spec.provider
 *
 * Defined by the adapter library. For testing, inject a MockProvider instead.
 *
 * @return Expected<std::shared_ptr<IProvider>> Adapter, or UnknownProvider
 */
Expected<std::shared_ptr<IProvider>> create_provider(const ModelSpec& spec, const ProviderOptions& options);

} // namespace provider
} // namespace parley
