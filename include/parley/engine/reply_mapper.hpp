#pragma once

#include "../log.hpp"
#include "../provider/provider.hpp"
#include "../response.hpp"
#include "../tool.hpp"
#include "../types.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <unordered_set>
#include <vector>

namespace parley {
namespace engine {

/**
 * @brief Maps a raw ProviderReply into the matching response variant
 *
 * Errors detected after the provider has answered carry the raw reply text
 * and its usage.
 */
class ReplyMapper {
public:
    /** @brief Provider usage, or all-zero Usage when the reply carried none. */
    static Usage map_usage(const provider::ProviderReply& reply) {
        if (!reply.usage.has_value()) {
            return Usage{};
        }
        return Usage::from_counts(reply.usage->prompt_tokens,
                                  reply.usage->output_tokens,
                                  reply.usage->total_tokens);
    }

    static Response to_response(provider::ProviderReply reply, const std::string& model) {
        Usage usage = map_usage(reply);
        return Response(std::move(reply.content), usage, model, finish_reason(reply));
    }

    /**
     * @brief Build a StructuredResponse
     *
     * Uses the provider's structured value when present; otherwise parses
     * the content as JSON exactly once.
     *
     * @return Expected<StructuredResponse> Response, or StructuredOutputParseFailed
     *         carrying the unparsed text
     */
    static Expected<StructuredResponse> to_structured(provider::ProviderReply reply, const std::string& model) {
        Usage usage = map_usage(reply);
        nlohmann::json structured;
        if (reply.structured_value.has_value()) {
            structured = std::move(*reply.structured_value);
        } else {
            structured = nlohmann::json::parse(reply.content, nullptr, false);
            if (structured.is_discarded()) {
                log_warn("Structured output is not valid JSON");
                Error error{
                    ErrorCode::StructuredOutputParseFailed,
                    "Provider content is not valid JSON",
                    model
                };
                error.raw_content = reply.content;
                error.usage = usage;
                return tl::unexpected(std::move(error));
            }
        }
        std::string reason = finish_reason(reply);
        return StructuredResponse(std::move(reply.content), std::move(structured), usage,
                                  model, std::move(reason));
    }

    /**
     * @brief Build a ToolResponse
     *
     * Every call must name one of @p offered and carry a non-empty id unique
     * within the reply.
     */
    static Expected<ToolResponse> to_tool_response(provider::ProviderReply reply,
                                                   const std::string& model,
                                                   const std::vector<ToolDefinition>& offered) {
        Usage usage = map_usage(reply);

        std::unordered_set<std::string> names;
        for (const auto& tool : offered) {
            names.insert(tool.name());
        }

        std::unordered_set<std::string> seen_ids;
        std::vector<ToolCall> calls;
        calls.reserve(reply.tool_calls.size());
        for (auto& raw : reply.tool_calls) {
            if (names.find(raw.name) == names.end()) {
                return tl::unexpected(rejected(ErrorCode::UnknownTool,
                    "Model called a tool that was not offered", raw.name, reply, usage));
            }
            if (raw.id.empty()) {
                return tl::unexpected(rejected(ErrorCode::InvalidToolCall,
                    "Tool call has an empty id", raw.name, reply, usage));
            }
            if (!seen_ids.insert(raw.id).second) {
                return tl::unexpected(rejected(ErrorCode::DuplicateToolCallId,
                    "Tool call id repeats within one reply", raw.id, reply, usage));
            }
            calls.push_back(ToolCall(std::move(raw.id), std::move(raw.name),
                                     ToolCall::decode_arguments(raw.arguments)));
        }

        std::string reason = finish_reason(reply);
        return ToolResponse(std::move(reply.content), std::move(calls), usage, model,
                            std::move(reason), std::move(reply.response_id));
    }

private:
    static std::string finish_reason(const provider::ProviderReply& reply) {
        return reply.finish_reason.value_or("stop");
    }

    static Error rejected(ErrorCode code, std::string message, std::string context,
                          const provider::ProviderReply& reply, const Usage& usage) {
        log_warn(message + ": " + context);
        Error error{code, std::move(message), std::move(context)};
        error.raw_content = reply.content;
        error.usage = usage;
        return error;
    }
};

} // namespace engine
} // namespace parley
