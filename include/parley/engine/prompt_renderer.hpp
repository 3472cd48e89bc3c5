#pragma once

#include "../message.hpp"
#include "../provider/provider.hpp"
#include <nlohmann/json.hpp>
#include <string>
#include <vector>

namespace parley {
namespace engine {

/**
 * @brief Flattens a conversation into role/content turns for a chat template
 *
 * Models without a native tool or structured-output channel get the offered
 * tools and the requested output format as system instructions. Assistant
 * replays are rendered as their tool-call JSON so the model sees the exact
 * shape it is asked to produce.
 */
class PromptRenderer {
public:
    /** @brief One rendered turn, ready for llama_chat_apply_template. */
    struct Turn {
        std::string role;
        std::string content;

        bool operator==(const Turn& other) const {
            return role == other.role && content == other.content;
        }
    };

    /**
     * @brief Render the conversation with any instructions the options require
     *
     * Instructions are merged into a leading system message, or prepended as
     * a new one.
     */
    static std::vector<Turn> render(const std::vector<Message>& messages,
                                    const provider::CompletionOptions& options) {
        std::string instructions;
        if (!options.tools.empty()) {
            instructions += render_tool_instructions(options.tools);
        }
        if (options.output_format.has_value()) {
            if (!instructions.empty()) {
                instructions += "\n";
            }
            instructions += render_format_instructions(*options.output_format, options.schema);
        }

        std::vector<Turn> turns;
        turns.reserve(messages.size() + 1);
        for (const auto& message : messages) {
            turns.push_back(Turn{role_to_string(message.role()), render_content(message)});
        }
        return with_instructions(std::move(turns), instructions);
    }

    static std::string render_tool_instructions(const std::vector<ToolDefinition>& tools) {
        std::string out;
        out.reserve(512);
        out += "You can call the following tools.\n";
        out += "To call a tool, reply with one JSON object per call on its own line:\n";
        out += "{\"name\": \"<tool name>\", \"arguments\": {<arguments>}}\n";
        out += "Answer directly when no tool is needed.\n";
        out += "\nTools:\n";

        nlohmann::json schemas = nlohmann::json::array();
        for (const auto& tool : tools) {
            schemas.push_back(tool.to_function_schema());
        }
        out += schemas.dump(2);
        out += "\n";
        return out;
    }

    static std::string render_format_instructions(OutputFormat format,
                                                  const std::optional<nlohmann::json>& schema) {
        std::string out = "Respond only with a single valid JSON value and no other text.\n";
        if (format == OutputFormat::JsonSchema && schema.has_value()) {
            out += "The JSON must conform to this JSON Schema:\n";
            out += schema->dump(2);
            out += "\n";
        }
        return out;
    }

    /** @brief Text the model sees for @p message. */
    static std::string render_content(const Message& message) {
        if (!message.has_tool_calls()) {
            return message.content();
        }
        std::string out = message.content();
        for (const auto& call : message.tool_calls()) {
            if (!out.empty() && out.back() != '\n') {
                out += "\n";
            }
            out += nlohmann::json{
                {"id", call.id()},
                {"name", call.name()},
                {"arguments", call.arguments()}
            }.dump();
        }
        return out;
    }

    static std::vector<Turn> with_instructions(std::vector<Turn> turns, const std::string& instructions) {
        if (instructions.empty()) {
            return turns;
        }
        if (!turns.empty() && turns.front().role == "system") {
            turns.front().content += "\n\n" + instructions;
            return turns;
        }
        turns.insert(turns.begin(), Turn{"system", instructions});
        return turns;
    }
};

} // namespace engine
} // namespace parley
