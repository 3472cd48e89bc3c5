#pragma once

#include "../log.hpp"
#include "../message.hpp"
#include "../message_collection.hpp"
#include "../provider/provider.hpp"
#include "../response.hpp"
#include "../tool.hpp"
#include "../types.hpp"
#include "reply_mapper.hpp"
#include "tool_sequence.hpp"
#include <memory>
#include <optional>
#include <string>
#include <unordered_set>
#include <vector>

namespace parley {
namespace engine {

// ============================================================================
// BuilderBase
// ============================================================================

/**
 * @brief Shared request configuration and dispatch for all builders
 *
 * Setters record their value and return the derived builder by reference.
 * Nothing is validated until complete(); the first setter error is kept and
 * reported then, before the provider is contacted.
 *
 * @tparam Derived Concrete builder (CRTP)
 */
template<typename Derived>
class BuilderBase {
public:
    Derived& set_temperature(float value) {
        config_.temperature = value;
        return self();
    }

    Derived& set_max_tokens(int value) {
        config_.max_tokens = value;
        return self();
    }

    Derived& set_top_p(float value) {
        config_.top_p = value;
        return self();
    }

    Derived& set_frequency_penalty(float value) {
        config_.frequency_penalty = value;
        return self();
    }

    Derived& set_presence_penalty(float value) {
        config_.presence_penalty = value;
        return self();
    }

    /**
     * @brief Merge generation options from an untyped map
     *
     * @see RequestConfig::from_json
     */
    Derived& with_options(const nlohmann::json& options) {
        auto parsed = RequestConfig::from_json(options);
        if (!parsed) {
            defer(parsed.error());
        } else {
            config_.merge(*parsed);
        }
        return self();
    }

    const RequestConfig& config() const { return config_; }
    const provider::ModelSpec& model() const { return model_; }

protected:
    BuilderBase(std::shared_ptr<provider::IProvider> provider, provider::ModelSpec model, RequestConfig config)
        : provider_(std::move(provider))
        , model_(std::move(model))
        , config_(std::move(config))
    {}

    template<typename> friend class BuilderBase;

    Derived& self() { return static_cast<Derived&>(*this); }

    // Hands a pending setter error on to a builder seeded from this one
    template<typename Builder>
    Builder seeded(Builder builder) const {
        static_cast<BuilderBase<Builder>&>(builder).deferred_error_ = deferred_error_;
        return builder;
    }

    void defer(Error error) {
        if (!deferred_error_.has_value()) {
            deferred_error_ = std::move(error);
        }
    }

    /**
     * @brief Checks shared by every complete()
     *
     * Reports a deferred setter error, an out-of-range config, a missing
     * provider or a broken tool-call ordering.
     */
    Expected<void> preflight(const std::vector<Message>& messages) const {
        if (deferred_error_.has_value()) {
            return tl::unexpected(*deferred_error_);
        }
        if (auto valid = config_.validate(); !valid) {
            return tl::unexpected(valid.error());
        }
        if (!provider_) {
            return tl::unexpected(Error{
                ErrorCode::ConnectionFailed,
                "No provider attached to builder",
                model_.to_string()
            });
        }
        if (auto sequence = ToolSequence::validate(messages); !sequence) {
            return tl::unexpected(sequence.error());
        }
        return {};
    }

    Expected<provider::ProviderReply> dispatch(const std::vector<Message>& messages,
                                               const provider::CompletionOptions& options) const {
        log_debug("Dispatching " + std::to_string(messages.size()) + " messages to " +
                  provider_->name() + ":" + model_.model);
        return provider_->complete_chat(model_.model, messages, config_, options);
    }

    std::shared_ptr<provider::IProvider> provider_;
    provider::ModelSpec model_;
    RequestConfig config_;
    std::optional<Error> deferred_error_;
};

// ============================================================================
// PlainBuilder
// ============================================================================

/** @brief Free-text completion. */
class PlainBuilder : public BuilderBase<PlainBuilder> {
public:
    PlainBuilder(std::shared_ptr<provider::IProvider> provider, provider::ModelSpec model,
                 RequestConfig config = {})
        : BuilderBase(std::move(provider), std::move(model), std::move(config))
    {}

    Expected<Response> complete(const std::vector<Message>& messages) const {
        if (auto ready = preflight(messages); !ready) {
            return tl::unexpected(ready.error());
        }
        auto reply = dispatch(messages, provider::CompletionOptions{});
        if (!reply) {
            return tl::unexpected(reply.error());
        }
        return ReplyMapper::to_response(std::move(*reply), model_.model);
    }

    Expected<Response> complete(const MessageCollection& messages) const {
        return complete(messages.all());
    }
};

// ============================================================================
// StructuredBuilder
// ============================================================================

/**
 * @brief Completion whose content must be JSON
 *
 * The format defaults to json_schema when a schema is set and json otherwise.
 * The raw content is always kept on the response; on a parse failure it is
 * attached to the error instead. No retry is attempted.
 */
class StructuredBuilder : public BuilderBase<StructuredBuilder> {
public:
    StructuredBuilder(std::shared_ptr<provider::IProvider> provider, provider::ModelSpec model,
                      RequestConfig config = {})
        : BuilderBase(std::move(provider), std::move(model), std::move(config))
    {}

    StructuredBuilder& with_schema(nlohmann::json schema) {
        schema_ = std::move(schema);
        return *this;
    }

    /** @brief Schema given as JSON text; a parse failure is reported by complete(). */
    StructuredBuilder& with_schema(const std::string& schema_text) {
        auto parsed = nlohmann::json::parse(schema_text, nullptr, false);
        if (parsed.is_discarded()) {
            defer(Error{ErrorCode::InvalidSchema, "Schema text is not valid JSON", schema_text});
        } else {
            schema_ = std::move(parsed);
        }
        return *this;
    }

    StructuredBuilder& with_schema(const char* schema_text) {
        return with_schema(std::string(schema_text));
    }

    StructuredBuilder& with_format(OutputFormat format) {
        format_ = format;
        return *this;
    }

    /** @brief Format by name: "json" or "json_schema". */
    StructuredBuilder& with_format(const std::string& format) {
        auto parsed = parse_output_format(format);
        if (!parsed) {
            defer(parsed.error());
        } else {
            format_ = *parsed;
        }
        return *this;
    }

    const std::optional<nlohmann::json>& schema() const { return schema_; }

    OutputFormat format() const {
        if (format_.has_value()) {
            return *format_;
        }
        return schema_.has_value() ? OutputFormat::JsonSchema : OutputFormat::Json;
    }

    Expected<StructuredResponse> complete(const std::vector<Message>& messages) const {
        if (auto ready = preflight(messages); !ready) {
            return tl::unexpected(ready.error());
        }

        const OutputFormat effective = format();
        if (schema_.has_value() && !schema_->is_object()) {
            return tl::unexpected(Error{ErrorCode::InvalidSchema, "Schema must be a JSON object", schema_->dump()});
        }
        if (effective == OutputFormat::JsonSchema && !schema_.has_value()) {
            return tl::unexpected(Error{ErrorCode::InvalidSchema, "json_schema format requires a schema"});
        }
        if (!provider_->supports_structured_output(model_.model)) {
            return tl::unexpected(Error{
                ErrorCode::StructuredOutputUnsupported,
                "Provider cannot produce structured output for this model",
                model_.to_string()
            });
        }

        provider::CompletionOptions options;
        options.output_format = effective;
        options.schema = schema_;

        auto reply = dispatch(messages, options);
        if (!reply) {
            return tl::unexpected(reply.error());
        }
        return ReplyMapper::to_structured(std::move(*reply), model_.model);
    }

    Expected<StructuredResponse> complete(const MessageCollection& messages) const {
        return complete(messages.all());
    }

private:
    std::optional<nlohmann::json> schema_;
    std::optional<OutputFormat> format_;
};

// ============================================================================
// ToolBuilder
// ============================================================================

/**
 * @brief Tool-enabled completion
 *
 * Returns a ToolResponse whose state() tells the caller whether the turn must
 * be replayed and answered before the next complete(). This layer never
 * executes tools. An empty tool set is sent as a plain completion.
 */
class ToolBuilder : public BuilderBase<ToolBuilder> {
public:
    ToolBuilder(std::shared_ptr<provider::IProvider> provider, provider::ModelSpec model,
                RequestConfig config = {}, std::vector<ToolDefinition> tools = {})
        : BuilderBase(std::move(provider), std::move(model), std::move(config))
        , tools_(std::move(tools))
    {}

    ToolBuilder& add_tool(ToolDefinition tool) {
        tools_.push_back(std::move(tool));
        return *this;
    }

    ToolBuilder& set_tools(std::vector<ToolDefinition> tools) {
        tools_ = std::move(tools);
        return *this;
    }

    /** @brief Tools as an array of {name, description, parameters} objects. */
    ToolBuilder& set_tools(const nlohmann::json& tools) {
        if (!tools.is_array()) {
            defer(Error{ErrorCode::InvalidToolDefinition, "Tools must be a JSON array", tools.dump()});
            return *this;
        }
        std::vector<ToolDefinition> parsed;
        parsed.reserve(tools.size());
        for (const auto& entry : tools) {
            auto tool = ToolDefinition::from_json(entry);
            if (!tool) {
                defer(tool.error());
                return *this;
            }
            parsed.push_back(std::move(*tool));
        }
        tools_ = std::move(parsed);
        return *this;
    }

    /**
     * @brief Reserved
     *
     * Recorded and reported by auto_execute() only; tools are always executed
     * by the caller.
     */
    ToolBuilder& set_auto_execute(bool enabled) {
        auto_execute_ = enabled;
        return *this;
    }

    bool auto_execute() const { return auto_execute_; }

    const std::vector<ToolDefinition>& tools() const { return tools_; }

    Expected<ToolResponse> complete(const std::vector<Message>& messages) const {
        if (auto ready = preflight(messages); !ready) {
            return tl::unexpected(ready.error());
        }

        std::unordered_set<std::string> names;
        for (const auto& tool : tools_) {
            if (!names.insert(tool.name()).second) {
                return tl::unexpected(Error{
                    ErrorCode::DuplicateToolName,
                    "Tool names must be unique within a request",
                    tool.name()
                });
            }
        }
        if (!tools_.empty() && !provider_->supports_tools(model_.model)) {
            return tl::unexpected(Error{
                ErrorCode::ToolsUnsupported,
                "Provider does not support tool calling for this model",
                model_.to_string()
            });
        }

        provider::CompletionOptions options;
        options.tools = tools_;

        auto reply = dispatch(messages, options);
        if (!reply) {
            return tl::unexpected(reply.error());
        }
        return ReplyMapper::to_tool_response(std::move(*reply), model_.model, tools_);
    }

    Expected<ToolResponse> complete(const MessageCollection& messages) const {
        return complete(messages.all());
    }

private:
    std::vector<ToolDefinition> tools_;
    bool auto_execute_ = false;
};

} // namespace engine
} // namespace parley
