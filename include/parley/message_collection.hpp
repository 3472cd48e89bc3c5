#pragma once

#include "message.hpp"
#include "response.hpp"
#include "engine/tool_sequence.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace parley {

/**
 * @brief Ordered, owned history of one conversation
 *
 * Insertion order is conversation order. The public surface only appends;
 * messages are never edited in place.
 *
 * Thread Safety: Not synchronized. One caller thread at a time.
 */
class MessageCollection {
public:
    MessageCollection() = default;

    explicit MessageCollection(std::vector<Message> messages)
        : messages_(std::move(messages))
    {}

    /**
     * @brief Rebuild a collection from to_serializable() output
     *
     * @return Expected<MessageCollection> Collection, or InvalidMessage naming the bad element
     */
    static Expected<MessageCollection> from_serializable(const nlohmann::json& data) {
        if (!data.is_array()) {
            return tl::unexpected(Error{ErrorCode::InvalidMessage, "Serialized conversation must be an array"});
        }
        std::vector<Message> messages;
        messages.reserve(data.size());
        for (size_t i = 0; i < data.size(); ++i) {
            auto message = Message::from_json(data[i]);
            if (!message) {
                Error error = message.error();
                error.context = "index " + std::to_string(i) +
                    (error.context ? ": " + *error.context : std::string());
                return tl::unexpected(std::move(error));
            }
            messages.push_back(std::move(*message));
        }
        return MessageCollection(std::move(messages));
    }

    MessageCollection& append(Message message) {
        messages_.push_back(std::move(message));
        return *this;
    }

    MessageCollection& append_user(std::string content) {
        return append(Message::user(std::move(content)));
    }

    MessageCollection& append_assistant(std::string content) {
        return append(Message::assistant(std::move(content)));
    }

    MessageCollection& append_system(std::string content) {
        return append(Message::system(std::move(content)));
    }

    /**
     * @brief Append the result of the tool call identified by @p tool_call_id
     *
     * An empty id is accepted here and rejected with InvalidMessage when the
     * conversation is validated before dispatch.
     */
    MessageCollection& append_tool_result(std::string tool_call_id, std::string result) {
        return append(Message::tool(std::move(tool_call_id), std::move(result)));
    }

    /**
     * @brief Replay a tool-enabled reply as the next assistant turn
     *
     * Must be called once per reply before its tool results are appended.
     */
    MessageCollection& from_response(const ToolResponse& response) {
        return append(Message::from_response(response));
    }

    /** @brief Message at @p index; empty when negative or out of range. */
    std::optional<Message> get(int64_t index) const {
        if (index < 0 || static_cast<uint64_t>(index) >= messages_.size()) {
            return std::nullopt;
        }
        return messages_[static_cast<size_t>(index)];
    }

    const std::vector<Message>& all() const { return messages_; }

    size_t count() const { return messages_.size(); }

    bool empty() const { return messages_.empty(); }

    nlohmann::json to_serializable() const {
        nlohmann::json out = nlohmann::json::array();
        for (const auto& message : messages_) {
            out.push_back(message.to_json());
        }
        return out;
    }

    /** @brief Call ids of the latest replay that still need a result, in call order. */
    std::vector<std::string> pending_tool_calls() const {
        return engine::ToolSequence::pending_calls(messages_);
    }

    bool operator==(const MessageCollection& other) const {
        return messages_ == other.messages_;
    }

    bool operator!=(const MessageCollection& other) const {
        return !(*this == other);
    }

private:
    std::vector<Message> messages_;
};

} // namespace parley
