#pragma once

#include "types.hpp"
#include "tool.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <vector>

namespace parley {

// ============================================================================
// Response Types
// ============================================================================

/**
 * @brief Fields shared by every completion outcome
 *
 * Response variants are produced by complete() and are read-only to the caller.
 */
class ResponseBase {
public:
    const std::string& content() const { return content_; }
    const Usage& usage() const { return usage_; }
    const std::string& model() const { return model_; }
    const std::string& finish_reason() const { return finish_reason_; }

protected:
    ResponseBase(std::string content, Usage usage, std::string model, std::string finish_reason)
        : content_(std::move(content))
        , usage_(usage)
        , model_(std::move(model))
        , finish_reason_(std::move(finish_reason))
    {}

    nlohmann::json base_json() const {
        return nlohmann::json{
            {"content", content_},
            {"usage", usage_.to_json()},
            {"model", model_},
            {"finish_reason", finish_reason_}
        };
    }

    bool base_equals(const ResponseBase& other) const {
        return content_ == other.content_ &&
               usage_ == other.usage_ &&
               model_ == other.model_ &&
               finish_reason_ == other.finish_reason_;
    }

    struct Fields {
        std::string content;
        Usage usage;
        std::string model;
        std::string finish_reason;
    };

    static Expected<Fields> read_base(const nlohmann::json& data) {
        if (!data.is_object()) {
            return tl::unexpected(Error{ErrorCode::InvalidMessage, "Response must be a JSON object"});
        }
        auto content = detail::string_field(data, "content", ErrorCode::InvalidMessage, "Response");
        if (!content) return tl::unexpected(content.error());
        auto model = detail::string_field(data, "model", ErrorCode::InvalidMessage, "Response");
        if (!model) return tl::unexpected(model.error());
        auto finish_reason = detail::optional_string_field(data, "finish_reason", ErrorCode::InvalidMessage);
        if (!finish_reason) return tl::unexpected(finish_reason.error());

        Usage usage;
        if (auto it = data.find("usage"); it != data.end() && !it->is_null()) {
            auto parsed = usage_from_json(*it);
            if (!parsed) return tl::unexpected(parsed.error());
            usage = *parsed;
        }
        return Fields{std::move(*content), usage, std::move(*model), finish_reason->value_or("stop")};
    }

private:
    std::string content_;
    Usage usage_;
    std::string model_;
    std::string finish_reason_;
};

/**
 * @brief Outcome of a plain completion
 */
class Response : public ResponseBase {
public:
    Response(std::string content, Usage usage, std::string model, std::string finish_reason)
        : ResponseBase(std::move(content), usage, std::move(model), std::move(finish_reason))
    {}

    /** @brief Wire form: {content, usage, model, finish_reason}. */
    nlohmann::json to_json() const {
        return base_json();
    }

    static Expected<Response> from_json(const nlohmann::json& data) {
        auto fields = read_base(data);
        if (!fields) return tl::unexpected(fields.error());
        return Response(std::move(fields->content), fields->usage,
                        std::move(fields->model), std::move(fields->finish_reason));
    }

    bool operator==(const Response& other) const { return base_equals(other); }
    bool operator!=(const Response& other) const { return !(*this == other); }
};

/**
 * @brief Outcome of a structured-output completion
 *
 * content() always holds the raw text the provider returned; structured()
 * holds the parsed JSON value.
 */
class StructuredResponse : public ResponseBase {
public:
    StructuredResponse(std::string content, nlohmann::json structured, Usage usage,
                       std::string model, std::string finish_reason)
        : ResponseBase(std::move(content), usage, std::move(model), std::move(finish_reason))
        , structured_(std::move(structured))
    {}

    const nlohmann::json& structured() const { return structured_; }

    /** @brief Wire form: Response fields plus "structured". */
    nlohmann::json to_json() const {
        auto out = base_json();
        out["structured"] = structured_;
        return out;
    }

    static Expected<StructuredResponse> from_json(const nlohmann::json& data) {
        auto fields = read_base(data);
        if (!fields) return tl::unexpected(fields.error());
        nlohmann::json structured = data.value("structured", nlohmann::json());
        return StructuredResponse(std::move(fields->content), std::move(structured), fields->usage,
                                  std::move(fields->model), std::move(fields->finish_reason));
    }

    bool operator==(const StructuredResponse& other) const {
        return base_equals(other) && structured_ == other.structured_;
    }
    bool operator!=(const StructuredResponse& other) const { return !(*this == other); }

private:
    nlohmann::json structured_;
};

/** @brief Position of a conversation after a tool-enabled completion. */
enum class TurnState {
    HasToolCalls,  ///< Caller must replay the turn and answer every call
    Terminal       ///< The model produced a final answer
};

[[nodiscard]] inline const char* turn_state_to_string(TurnState state) {
    switch (state) {
        case TurnState::HasToolCalls: return "HasToolCalls";
        case TurnState::Terminal: return "Terminal";
    }
    return "unknown";
}

/**
 * @brief Outcome of a tool-enabled completion
 *
 * When has_tool_calls() is true the caller replays the turn with
 * MessageCollection::from_response(), answers every call in order with
 * append_tool_result(), and calls complete() again.
 */
class ToolResponse : public ResponseBase {
public:
    ToolResponse(std::string content, std::vector<ToolCall> tool_calls, Usage usage,
                 std::string model, std::string finish_reason,
                 std::optional<std::string> response_id = std::nullopt)
        : ResponseBase(std::move(content), usage, std::move(model), std::move(finish_reason))
        , tool_calls_(std::move(tool_calls))
        , response_id_(std::move(response_id))
    {}

    const std::vector<ToolCall>& tool_calls() const { return tool_calls_; }
    const std::optional<std::string>& response_id() const { return response_id_; }

    bool has_tool_calls() const { return !tool_calls_.empty(); }

    TurnState state() const {
        return has_tool_calls() ? TurnState::HasToolCalls : TurnState::Terminal;
    }

    /** @brief Wire form: Response fields plus "tool_calls" and "response_id". */
    nlohmann::json to_json() const {
        auto out = base_json();
        nlohmann::json calls = nlohmann::json::array();
        for (const auto& call : tool_calls_) {
            calls.push_back(call.to_json());
        }
        out["tool_calls"] = std::move(calls);
        out["response_id"] = detail::optional_to_json(response_id_);
        return out;
    }

    static Expected<ToolResponse> from_json(const nlohmann::json& data) {
        auto fields = read_base(data);
        if (!fields) return tl::unexpected(fields.error());

        std::vector<ToolCall> calls;
        if (auto it = data.find("tool_calls"); it != data.end() && !it->is_null()) {
            if (!it->is_array()) {
                return tl::unexpected(Error{ErrorCode::InvalidToolCall, "'tool_calls' must be an array"});
            }
            calls.reserve(it->size());
            for (const auto& entry : *it) {
                auto call = ToolCall::from_json(entry);
                if (!call) return tl::unexpected(call.error());
                calls.push_back(std::move(*call));
            }
        }

        auto response_id = detail::optional_string_field(data, "response_id", ErrorCode::InvalidMessage);
        if (!response_id) return tl::unexpected(response_id.error());

        return ToolResponse(std::move(fields->content), std::move(calls), fields->usage,
                            std::move(fields->model), std::move(fields->finish_reason),
                            std::move(*response_id));
    }

    bool operator==(const ToolResponse& other) const {
        return base_equals(other) &&
               tool_calls_ == other.tool_calls_ &&
               response_id_ == other.response_id_;
    }
    bool operator!=(const ToolResponse& other) const { return !(*this == other); }

private:
    std::vector<ToolCall> tool_calls_;
    std::optional<std::string> response_id_;
};

} // namespace parley
