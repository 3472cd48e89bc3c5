#pragma once

#include "../provider/provider.hpp"
#include <nlohmann/json.hpp>
#include <atomic>
#include <set>
#include <string>
#include <vector>

namespace parley {
namespace engine {

// ============================================================================
// ToolCallParser
// ============================================================================

/**
 * @brief Detects and extracts tool calls from raw model output text.
 *
 * Scans for JSON objects containing "name" and "arguments" fields, which
 * indicate the model is requesting a tool invocation. Used by adapters whose
 * models have no native tool-call channel.
 */
class ToolCallParser {
public:
    /** @brief Result of parsing model output for tool calls. */
    struct ParseResult {
        std::vector<provider::ProviderToolCall> tool_calls;  ///< Calls in output order
        std::string text_before;                             ///< Text before the first call
    };

    /**
     * @brief Parse model output to detect tool calls.
     *
     * Every balanced JSON object with a string "name" and an "arguments"
     * field is a call. The "id" field is kept when present, otherwise a
     * "call_N" id is generated that no other call in the same output uses.
     *
     * @param output Raw text output from the model
     * @return ParseResult containing the detected calls and preceding text
     */
    static ParseResult parse(const std::string& output) {
        ParseResult result;
        size_t first_call = std::string::npos;
        std::vector<bool> needs_id;

        auto pos = output.find('{');
        while (pos != std::string::npos) {
            auto end_pos = find_json_object_end(output, pos);
            if (end_pos != std::string::npos) {
                try {
                    auto begin_it = output.cbegin() + static_cast<std::string::difference_type>(pos);
                    auto end_it = output.cbegin() + static_cast<std::string::difference_type>(end_pos + 1);
                    auto j = nlohmann::json::parse(begin_it, end_it);

                    if (j.is_object() && j.contains("name") && j.contains("arguments")) {
                        provider::ProviderToolCall call;
                        call.name = j["name"].get<std::string>();
                        call.arguments = std::move(j["arguments"]);
                        auto id_it = j.find("id");
                        const bool has_id = id_it != j.end() && id_it->is_string();
                        if (has_id) {
                            call.id = id_it->get<std::string>();
                        }
                        needs_id.push_back(!has_id);

                        if (first_call == std::string::npos) {
                            first_call = pos;
                        }
                        result.tool_calls.push_back(std::move(call));
                        pos = output.find('{', end_pos + 1);
                        continue;
                    }
                } catch (const nlohmann::json::exception&) {
                    // Not a tool call, try next '{'
                }
            }

            pos = output.find('{', pos + 1);
        }

        // Explicit ids are only known once the whole output is scanned
        std::set<std::string> taken;
        for (size_t i = 0; i < result.tool_calls.size(); ++i) {
            if (!needs_id[i]) taken.insert(result.tool_calls[i].id);
        }
        for (size_t i = 0; i < result.tool_calls.size(); ++i) {
            if (!needs_id[i]) continue;
            std::string id = generate_id();
            while (taken.count(id) > 0) {
                id = generate_id();
            }
            taken.insert(id);
            result.tool_calls[i].id = std::move(id);
        }

        result.text_before = first_call == std::string::npos ? output : output.substr(0, first_call);
        return result;
    }

private:
    /**
     * @brief Find the end position of a balanced JSON object starting at start.
     *
     * Handles string escaping and nested objects.
     *
     * @return Position of the matching closing brace, or std::string::npos if unbalanced
     */
    static size_t find_json_object_end(const std::string& text, size_t start) {
        if (start >= text.size() || text[start] != '{') return std::string::npos;

        int depth = 0;
        bool in_string = false;
        bool escape_next = false;

        for (size_t i = start; i < text.size(); ++i) {
            char c = text[i];

            if (escape_next) {
                escape_next = false;
                continue;
            }

            if (c == '\\' && in_string) {
                escape_next = true;
                continue;
            }

            if (c == '"') {
                in_string = !in_string;
                continue;
            }

            if (!in_string) {
                if (c == '{') ++depth;
                else if (c == '}') {
                    --depth;
                    if (depth == 0) {
                        return i;
                    }
                }
            }
        }

        return std::string::npos;
    }

    // Format: "call_N", N from a process-wide counter
    static std::string generate_id() {
        static std::atomic<int> counter{0};
        return "call_" + std::to_string(counter.fetch_add(1, std::memory_order_relaxed) + 1);
    }
};

} // namespace engine
} // namespace parley
