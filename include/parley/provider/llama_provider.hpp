#pragma once

#include "provider.hpp"
#include "../types.hpp"
#include <chrono>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

// Forward declarations for llama.cpp types
struct llama_model;
struct llama_context;
struct llama_sampler;
struct llama_vocab;

namespace parley {
namespace provider {

/**
 * @brief Settings read from ProviderOptions::extra
 */
struct LlamaSettings {
    int context_size = 8192;  ///< "context_size": context window in tokens
    int n_gpu_layers = -1;    ///< "n_gpu_layers": layers offloaded to GPU, -1 for all
    std::optional<std::chrono::milliseconds> timeout;

    static Expected<LlamaSettings> from_options(const ProviderOptions& options);
};

/**
 * @brief Local GGUF model served through llama.cpp
 *
 * Selected with "llama:<path to .gguf>". The model and a single context are
 * loaded once by initialize(); every complete_chat() clears the KV cache and
 * evaluates the full conversation. Tools and output formats are rendered as
 * system instructions, tool calls are parsed back out of the generated text,
 * and format requests constrain sampling with a JSON grammar.
 *
 * Thread Safety: complete_chat() is serialized by an internal mutex.
 */
class LlamaProvider : public IProvider {
public:
    LlamaProvider();
    ~LlamaProvider() override;

    LlamaProvider(const LlamaProvider&) = delete;
    LlamaProvider& operator=(const LlamaProvider&) = delete;
    LlamaProvider(LlamaProvider&&) = delete;
    LlamaProvider& operator=(LlamaProvider&&) = delete;

    /**
     * @brief Load the model and create the inference context
     *
     * @param model_path Path to a GGUF file
     * @param options Session options; see LlamaSettings for the honoured keys
     * @return Expected<void> Success, InvalidProviderOptions or ModelLoadFailed
     */
    Expected<void> initialize(const std::string& model_path, const ProviderOptions& options);

    Expected<ProviderReply> complete_chat(
        const std::string& model_id,
        const std::vector<Message>& messages,
        const RequestConfig& config,
        const CompletionOptions& options
    ) override;

    std::string name() const override { return "llama"; }

    int get_context_size() const { return context_size_; }

    /** @brief Idempotent llama.cpp backend initialization. */
    static void initialize_global();

private:
    struct Generation {
        std::string text;
        int output_tokens = 0;
        bool hit_limit = false;
    };

    Expected<std::string> format_prompt(const std::vector<Message>& messages,
                                        const CompletionOptions& options);

    Expected<std::vector<int>> tokenize(const std::string& text);

    Expected<Generation> generate(const std::vector<int>& prompt_tokens,
                                  int max_tokens,
                                  llama_sampler* sampler);

    /**
     * @brief Build the per-request sampler chain
     * @return llama_sampler* Chain (ownership transferred to caller), or nullptr
     */
    llama_sampler* create_sampler_chain(const RequestConfig& config, bool constrain_to_json) const;

    void clear_kv_cache();

    llama_model* model_ = nullptr;
    llama_context* ctx_ = nullptr;
    const llama_vocab* vocab_ = nullptr;  // Retrieved from model, not owned

    std::string model_path_;
    int context_size_ = 0;
    std::optional<std::chrono::milliseconds> timeout_;

    // Chat template pointer (model lifetime, not owned)
    const char* tmpl_ = nullptr;
    std::vector<char> formatted_;

    std::mutex mutex_;
};

} // namespace provider
} // namespace parley
