#pragma once

#include "types.hpp"
#include <nlohmann/json.hpp>
#include <algorithm>
#include <string>
#include <vector>

namespace parley {

namespace engine {
class ReplyMapper;
} // namespace engine

// ============================================================================
// ToolDefinition
// ============================================================================

/**
 * @brief Function contract offered to the model
 *
 * Immutable once created. The parameters schema must be a JSON object that
 * declares "type": "object"; the name must be identifier-safe (1-64 characters
 * from [A-Za-z0-9_-]).
 *
 * @threadsafety Safe to copy and pass by value across threads
 */
class ToolDefinition {
public:
    /**
     * @brief Create a validated tool definition
     *
     * @param name Tool name used by the model to invoke it
     * @param description Human-readable description of what the tool does
     * @param parameters JSON Schema describing the tool's arguments
     * @return Expected<ToolDefinition> Definition or InvalidToolDefinition error
     */
    static Expected<ToolDefinition> create(std::string name, std::string description,
                                           nlohmann::json parameters) {
        if (!is_identifier_safe(name)) {
            return tl::unexpected(Error{
                ErrorCode::InvalidToolDefinition,
                "Tool name must be 1-64 characters of [A-Za-z0-9_-]",
                name
            });
        }
        if (!parameters.is_object()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidToolDefinition,
                "Tool parameters must be a JSON object",
                parameters.dump()
            });
        }
        auto type_it = parameters.find("type");
        if (type_it == parameters.end() || !type_it->is_string() || *type_it != "object") {
            return tl::unexpected(Error{
                ErrorCode::InvalidToolDefinition,
                "Tool parameters schema must declare \"type\": \"object\"",
                name
            });
        }
        return ToolDefinition(std::move(name), std::move(description), std::move(parameters));
    }

    /**
     * @brief Build a definition from an untyped map
     *
     * Expects "name", "description" and "parameters"; parameters may be a
     * JSON object or a string holding JSON.
     */
    static Expected<ToolDefinition> from_json(const nlohmann::json& data) {
        if (!data.is_object()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidToolDefinition,
                "Tool definition must be a JSON object"
            });
        }
        auto name = detail::string_field(data, "name", ErrorCode::InvalidToolDefinition, "Tool");
        if (!name) return tl::unexpected(name.error());
        auto description = detail::string_field(data, "description", ErrorCode::InvalidToolDefinition, "Tool");
        if (!description) return tl::unexpected(description.error());

        auto params_it = data.find("parameters");
        if (params_it == data.end()) {
            return tl::unexpected(Error{
                ErrorCode::InvalidToolDefinition,
                "Tool must have a 'parameters' field",
                *name
            });
        }

        nlohmann::json parameters;
        if (params_it->is_string()) {
            parameters = nlohmann::json::parse(params_it->get<std::string>(), nullptr, false);
            if (parameters.is_discarded()) {
                return tl::unexpected(Error{
                    ErrorCode::InvalidToolDefinition,
                    "Tool parameters string is not valid JSON",
                    *name
                });
            }
        } else {
            parameters = *params_it;
        }

        return create(std::move(*name), std::move(*description), std::move(parameters));
    }

    const std::string& name() const { return name_; }
    const std::string& description() const { return description_; }
    const nlohmann::json& parameters() const { return parameters_; }

    /** @brief Wire form: {name, description, parameters}. */
    nlohmann::json to_json() const {
        return nlohmann::json{
            {"name", name_},
            {"description", description_},
            {"parameters", parameters_}
        };
    }

    /** @brief OpenAI-style function-calling envelope. */
    nlohmann::json to_function_schema() const {
        return nlohmann::json{
            {"type", "function"},
            {"function", to_json()}
        };
    }

    bool operator==(const ToolDefinition& other) const {
        return name_ == other.name_ &&
               description_ == other.description_ &&
               parameters_ == other.parameters_;
    }

    bool operator!=(const ToolDefinition& other) const {
        return !(*this == other);
    }

private:
    ToolDefinition(std::string name, std::string description, nlohmann::json parameters)
        : name_(std::move(name))
        , description_(std::move(description))
        , parameters_(std::move(parameters))
    {}

    static bool is_identifier_safe(const std::string& name) {
        if (name.empty() || name.size() > 64) {
            return false;
        }
        return std::all_of(name.begin(), name.end(), [](char c) {
            return (c >= 'a' && c <= 'z') || (c >= 'A' && c <= 'Z') ||
                   (c >= '0' && c <= '9') || c == '_' || c == '-';
        });
    }

    std::string name_;
    std::string description_;
    nlohmann::json parameters_;
};

// ============================================================================
// ToolCall
// ============================================================================

/**
 * @brief Model-issued request to invoke an offered tool
 *
 * Only produced by mapping a provider reply or by deserializing a previously
 * serialized call. Arguments are exposed as-is and are not validated against
 * the tool's schema.
 */
class ToolCall {
public:
    const std::string& id() const { return id_; }
    const std::string& name() const { return name_; }
    const nlohmann::json& arguments() const { return arguments_; }

    /** @brief Wire form: {id, name, arguments}. */
    nlohmann::json to_json() const {
        return nlohmann::json{
            {"id", id_},
            {"name", name_},
            {"arguments", arguments_}
        };
    }

    static Expected<ToolCall> from_json(const nlohmann::json& data) {
        if (!data.is_object()) {
            return tl::unexpected(Error{ErrorCode::InvalidToolCall, "Tool call must be a JSON object"});
        }
        auto id = detail::string_field(data, "id", ErrorCode::InvalidToolCall, "Tool call");
        if (!id) return tl::unexpected(id.error());
        auto name = detail::string_field(data, "name", ErrorCode::InvalidToolCall, "Tool call");
        if (!name) return tl::unexpected(name.error());

        nlohmann::json arguments = nlohmann::json::object();
        if (auto it = data.find("arguments"); it != data.end()) {
            arguments = decode_arguments(*it);
        }
        return ToolCall(std::move(*id), std::move(*name), std::move(arguments));
    }

    bool operator==(const ToolCall& other) const {
        return id_ == other.id_ && name_ == other.name_ && arguments_ == other.arguments_;
    }

    bool operator!=(const ToolCall& other) const {
        return !(*this == other);
    }

private:
    friend class engine::ReplyMapper;

    ToolCall(std::string id, std::string name, nlohmann::json arguments)
        : id_(std::move(id))
        , name_(std::move(name))
        , arguments_(std::move(arguments))
    {}

    // Some providers deliver arguments as a JSON-encoded string
    static nlohmann::json decode_arguments(const nlohmann::json& raw) {
        if (raw.is_string()) {
            auto parsed = nlohmann::json::parse(raw.get<std::string>(), nullptr, false);
            if (!parsed.is_discarded() && (parsed.is_object() || parsed.is_array())) {
                return parsed;
            }
        }
        return raw;
    }

    std::string id_;
    std::string name_;
    nlohmann::json arguments_;
};

} // namespace parley
