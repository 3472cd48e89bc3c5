#pragma once

#include "types.hpp"
#include "tool.hpp"
#include "response.hpp"
#include <nlohmann/json.hpp>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace parley {

// ============================================================================
// Message
// ============================================================================

/** @brief System instruction turn. */
struct SystemTurn {
    std::string content;
};

/** @brief End-user turn. */
struct UserTurn {
    std::string content;
};

/**
 * @brief Model turn
 *
 * When tool_calls is set the turn is a replay of a provider's tool-call
 * request and must be kept byte-identical to what the provider returned.
 */
struct AssistantTurn {
    std::string content;
    std::optional<std::vector<ToolCall>> tool_calls;  ///< Replayed tool-call batch
    std::optional<std::string> id;                    ///< Provider-assigned exchange id
};

/** @brief Result of a caller-executed tool. */
struct ToolTurn {
    std::string content;
    std::string tool_call_id;  ///< Id of the ToolCall this result answers
};

/**
 * @brief Single turn of a conversation
 *
 * A closed variant over the four turn kinds. The role is derived from the
 * active alternative, so only tool turns can carry a call id and only
 * assistant turns can carry tool calls or an exchange id.
 *
 * @threadsafety Immutable; safe to copy and share across threads
 */
class Message {
public:
    using Body = std::variant<SystemTurn, UserTurn, AssistantTurn, ToolTurn>;

    static Message system(std::string content) {
        return Message(SystemTurn{std::move(content)});
    }

    static Message user(std::string content) {
        return Message(UserTurn{std::move(content)});
    }

    static Message assistant(std::string content) {
        return Message(AssistantTurn{std::move(content), std::nullopt, std::nullopt});
    }

    static Message tool(std::string tool_call_id, std::string result) {
        return Message(ToolTurn{std::move(result), std::move(tool_call_id)});
    }

    /**
     * @brief Build the replay of a tool-enabled reply
     *
     * Carries the reply's content, response id and tool calls verbatim. A
     * reply without tool calls yields a plain assistant message.
     */
    static Message from_response(const ToolResponse& response) {
        std::optional<std::vector<ToolCall>> calls;
        if (response.has_tool_calls()) {
            calls = response.tool_calls();
        }
        return Message(AssistantTurn{response.content(), std::move(calls), response.response_id()});
    }

    /**
     * @brief Validated construction from a role name
     *
     * @return Expected<Message> Message, or InvalidMessage when a tool message
     *         lacks a call id or another role is given one
     */
    static Expected<Message> create(Role role, std::string content,
                                    std::optional<std::string> tool_call_id = std::nullopt) {
        if (role == Role::Tool) {
            if (!tool_call_id.has_value() || tool_call_id->empty()) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidMessage,
                    "Tool message requires a tool_call_id"
                });
            }
            return tool(std::move(*tool_call_id), std::move(content));
        }
        if (tool_call_id.has_value()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidMessage,
                "Only tool messages may carry a tool_call_id",
                role_to_string(role)
            });
        }
        switch (role) {
            case Role::System: return system(std::move(content));
            case Role::User: return user(std::move(content));
            default: return assistant(std::move(content));
        }
    }

    /**
     * @brief Rebuild a message from its serialized form
     *
     * Accepts "tool_calls" as an array or as a string holding a JSON array.
     * An empty tool_calls array is treated as absent.
     */
    static Expected<Message> from_json(const nlohmann::json& data) {
        if (!data.is_object()) {
            return tl::unexpected(Error{ErrorCode::InvalidMessage, "Message must be a JSON object"});
        }

        auto role_name = detail::string_field(data, "role", ErrorCode::InvalidMessage, "Message");
        if (!role_name) return tl::unexpected(role_name.error());
        auto role = role_from_string(*role_name);
        if (!role) {
            return tl::unexpected(Error{ErrorCode::InvalidMessage, "Unknown message role", *role_name});
        }

        std::string content;
        if (auto it = data.find("content"); it != data.end() && !it->is_null()) {
            if (!it->is_string()) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidMessage,
                    "Message content must be a string",
                    it->dump()
                });
            }
            content = it->get<std::string>();
        }

        auto tool_call_id = detail::optional_string_field(data, "tool_call_id", ErrorCode::InvalidMessage);
        if (!tool_call_id) return tl::unexpected(tool_call_id.error());
        auto id = detail::optional_string_field(data, "id", ErrorCode::InvalidMessage);
        if (!id) return tl::unexpected(id.error());
        auto calls = read_tool_calls(data);
        if (!calls) return tl::unexpected(calls.error());

        if (*role != Role::Assistant) {
            if (calls->has_value()) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidMessage,
                    "Only assistant messages may carry tool_calls",
                    *role_name
                });
            }
            if (id->has_value()) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidMessage,
                    "Only assistant messages may carry an id",
                    *role_name
                });
            }
            return create(*role, std::move(content), std::move(*tool_call_id));
        }

        if (tool_call_id->has_value()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidMessage,
                "Only tool messages may carry a tool_call_id",
                *role_name
            });
        }
        return Message(AssistantTurn{std::move(content), std::move(*calls), std::move(*id)});
    }

    Role role() const {
        switch (body_.index()) {
            case 0: return Role::System;
            case 1: return Role::User;
            case 2: return Role::Assistant;
            default: return Role::Tool;
        }
    }

    const std::string& content() const {
        return std::visit([](const auto& turn) -> const std::string& { return turn.content; }, body_);
    }

    std::optional<std::string> tool_call_id() const {
        if (const auto* turn = std::get_if<ToolTurn>(&body_)) {
            return turn->tool_call_id;
        }
        return std::nullopt;
    }

    bool has_tool_calls() const {
        const auto* turn = std::get_if<AssistantTurn>(&body_);
        return turn != nullptr && turn->tool_calls.has_value() && !turn->tool_calls->empty();
    }

    /** @brief Replayed tool calls; empty unless this is a replay. */
    const std::vector<ToolCall>& tool_calls() const {
        static const std::vector<ToolCall> none;
        const auto* turn = std::get_if<AssistantTurn>(&body_);
        if (turn == nullptr || !turn->tool_calls.has_value()) {
            return none;
        }
        return *turn->tool_calls;
    }

    std::optional<std::string> id() const {
        if (const auto* turn = std::get_if<AssistantTurn>(&body_)) {
            return turn->id;
        }
        return std::nullopt;
    }

    const Body& body() const { return body_; }

    /** @brief Wire form: {content, id, role, tool_call_id, tool_calls}, null when absent. */
    nlohmann::json to_json() const {
        nlohmann::json calls = nullptr;
        if (has_tool_calls()) {
            calls = nlohmann::json::array();
            for (const auto& call : tool_calls()) {
                calls.push_back(call.to_json());
            }
        }
        return nlohmann::json{
            {"role", role_to_string(role())},
            {"content", content()},
            {"tool_calls", std::move(calls)},
            {"id", detail::optional_to_json(id())},
            {"tool_call_id", detail::optional_to_json(tool_call_id())}
        };
    }

    bool operator==(const Message& other) const {
        return role() == other.role() &&
               content() == other.content() &&
               tool_call_id() == other.tool_call_id() &&
               tool_calls() == other.tool_calls() &&
               id() == other.id();
    }

    bool operator!=(const Message& other) const {
        return !(*this == other);
    }

private:
    explicit Message(Body body) : body_(std::move(body)) {}

    static Expected<std::optional<std::vector<ToolCall>>> read_tool_calls(const nlohmann::json& data) {
        using Result = std::optional<std::vector<ToolCall>>;
        auto it = data.find("tool_calls");
        if (it == data.end() || it->is_null()) {
            return Result{};
        }

        nlohmann::json entries = *it;
        if (entries.is_string()) {
            entries = nlohmann::json::parse(it->get<std::string>(), nullptr, false);
        }
        if (!entries.is_array()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidMessage,
                "Message tool_calls must be an array",
                it->dump()
            });
        }
        if (entries.empty()) {
            return Result{};
        }

        std::vector<ToolCall> calls;
        calls.reserve(entries.size());
        for (const auto& entry : entries) {
            auto call = ToolCall::from_json(entry);
            if (!call) {
                return tl::unexpected(Error{ErrorCode::InvalidMessage, call.error().message, call.error().context});
            }
            calls.push_back(std::move(*call));
        }
        return Result{std::move(calls)};
    }

    Body body_;
};

} // namespace parley
