#pragma once

#include "engine/builders.hpp"
#include "log.hpp"
#include "message_collection.hpp"
#include "provider/provider.hpp"
#include "types.hpp"
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace parley {

/**
 * @brief Session entry point bound to one "provider:model" selection
 *
 * Owns the session-level RequestConfig and shares its provider with every
 * builder it hands out. Builders receive a copy of the configuration as it
 * stands when they are created.
 *
 * Example:
 * @code
 * auto llm = parley::Llm::create("llama:/models/qwen2.5-7b-instruct.gguf");
 * if (!llm) { ... }
 * llm->set_temperature(0.2f).set_max_tokens(256);
 *
 * parley::MessageCollection messages;
 * messages.append_user("Hello!");
 * auto reply = llm->complete(messages);
 * @endcode
 */
class Llm : public engine::BuilderBase<Llm> {
public:
    /**
     * @brief Create a session
     *
     * @param model "provider:model", split at the first ':'
     * @param options Opaque overrides forwarded to the adapter factory
     * @param provider Injected provider; when null, provider::create_provider() builds one
     * @return Expected<Llm> Session or error
     */
    static Expected<Llm> create(const std::string& model,
                                const provider::ProviderOptions& options = {},
                                std::shared_ptr<provider::IProvider> provider = nullptr) {
        auto spec = provider::ModelSpec::parse(model);
        if (!spec) {
            return tl::unexpected(spec.error());
        }
        if (!provider) {
            auto created = provider::create_provider(*spec, options);
            if (!created) {
                return tl::unexpected(created.error());
            }
            provider = std::move(*created);
        }
        log_info("Session created for " + spec->to_string());
        return Llm(std::move(provider), std::move(*spec));
    }

    /** @brief Plain completion with the session configuration. */
    Expected<Response> complete(const std::vector<Message>& messages) const {
        return plain().complete(messages);
    }

    Expected<Response> complete(const MessageCollection& messages) const {
        return complete(messages.all());
    }

    engine::PlainBuilder plain() const {
        return seeded(engine::PlainBuilder(provider_, model_, config_));
    }

    engine::StructuredBuilder structured(std::optional<nlohmann::json> schema = std::nullopt) const {
        auto builder = seeded(engine::StructuredBuilder(provider_, model_, config_));
        if (schema.has_value()) {
            builder.with_schema(std::move(*schema));
        }
        return builder;
    }

    engine::ToolBuilder with_tools(std::vector<ToolDefinition> tools) const {
        return seeded(engine::ToolBuilder(provider_, model_, config_, std::move(tools)));
    }

    const std::shared_ptr<provider::IProvider>& provider() const { return provider_; }

private:
    Llm(std::shared_ptr<provider::IProvider> provider, provider::ModelSpec spec)
        : BuilderBase(std::move(provider), std::move(spec), RequestConfig{})
    {}
};

} // namespace parley
