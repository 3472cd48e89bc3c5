#pragma once

#include "../message.hpp"
#include "../types.hpp"
#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace parley {
namespace engine {

/**
 * @brief Checks the replay-before-result ordering of a conversation
 *
 * Rules enforced over the whole message sequence:
 * - Every tool message carries a non-empty tool_call_id
 * - A tool message must directly follow a replayed assistant turn or another
 *   tool message of the same batch
 * - Tool messages answer the replayed calls one by one, in call order
 * - A batch may not be interrupted by a non-tool message before every call
 *   has a result
 *
 * A trailing replay that still awaits results is reported by validate() and
 * exposed by pending_calls().
 *
 * Stateless; all functions are pure.
 */
class ToolSequence {
public:
    /**
     * @brief Validate a conversation before it is sent
     *
     * @param messages Conversation in send order
     * @return Expected<void> Success, InvalidMessage for an empty tool_call_id,
     *         or ToolCallError describing the first violation
     */
    static Expected<void> validate(const std::vector<Message>& messages) {
        auto state = scan(messages);
        if (!state) {
            return tl::unexpected(state.error());
        }
        if (state->replay_index.has_value() && state->answered < state->expected.size()) {
            return tl::unexpected(Error{
                ErrorCode::MissingToolResult,
                "Conversation ends before every replayed tool call has a result",
                state->expected[state->answered]
            });
        }
        return {};
    }

    /**
     * @brief Ids of the most recent replayed batch still awaiting a result
     *
     * Returned in call order. Empty when the conversation is not waiting on
     * tool results or when its ordering is already invalid.
     */
    static std::vector<std::string> pending_calls(const std::vector<Message>& messages) {
        auto state = scan(messages);
        if (!state || !state->replay_index.has_value()) {
            return {};
        }
        return std::vector<std::string>(
            state->expected.begin() + static_cast<std::ptrdiff_t>(state->answered),
            state->expected.end());
    }

private:
    struct Batch {
        std::optional<size_t> replay_index;   ///< Position of the open replay, if any
        std::vector<std::string> expected;    ///< Call ids of the open replay
        size_t answered = 0;                  ///< Results received so far
    };

    static Expected<Batch> scan(const std::vector<Message>& messages) {
        Batch batch;
        for (size_t i = 0; i < messages.size(); ++i) {
            const Message& message = messages[i];

            if (message.role() == Role::Tool) {
                const std::string call_id = message.tool_call_id().value_or("");
                if (call_id.empty()) {
                    return tl::unexpected(Error{
                        ErrorCode::InvalidMessage,
                        "Tool message requires a tool_call_id",
                        "index " + std::to_string(i)
                    });
                }
                if (!batch.replay_index.has_value()) {
                    return tl::unexpected(Error{
                        ErrorCode::ToolResultWithoutReplay,
                        "Tool result is not preceded by a replayed assistant tool-call turn",
                        "index " + std::to_string(i) + ", tool_call_id " + call_id
                    });
                }
                if (batch.answered >= batch.expected.size()) {
                    return tl::unexpected(Error{
                        ErrorCode::ToolCallIdMismatch,
                        "Tool result exceeds the replayed batch",
                        "index " + std::to_string(i) + ", tool_call_id " + call_id
                    });
                }
                if (call_id != batch.expected[batch.answered]) {
                    return tl::unexpected(Error{
                        ErrorCode::ToolCallIdMismatch,
                        "Tool result does not answer the next outstanding call (expected " +
                            batch.expected[batch.answered] + ")",
                        "index " + std::to_string(i) + ", tool_call_id " + call_id
                    });
                }
                ++batch.answered;
                continue;
            }

            if (batch.replay_index.has_value() && batch.answered < batch.expected.size()) {
                return tl::unexpected(Error{
                    ErrorCode::MissingToolResult,
                    "Replayed tool-call batch is interrupted before every call has a result",
                    "index " + std::to_string(i) + ", missing " + batch.expected[batch.answered]
                });
            }

            batch = Batch{};
            if (message.has_tool_calls()) {
                batch.replay_index = i;
                for (const auto& call : message.tool_calls()) {
                    batch.expected.push_back(call.id());
                }
            }
        }
        return batch;
    }
};

} // namespace engine
} // namespace parley
