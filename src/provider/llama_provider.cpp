#include "parley/provider/llama_provider.hpp"
#include "parley/engine/prompt_renderer.hpp"
#include "parley/engine/tool_call_parser.hpp"
#include "parley/log.hpp"
#include <llama.h>
#include <atomic>
#include <climits>
#include <ctime>
#include <memory>

namespace parley {
namespace provider {

namespace {

std::once_flag g_init_flag;
std::atomic<int> g_response_counter{0};

constexpr int kDefaultMaxTokens = 512;
constexpr float kDefaultTemperature = 0.7f;
constexpr int kPenaltyLastN = 64;

// Any JSON value; adapted from llama.cpp's grammars/json.gbnf
constexpr const char* kJsonGrammar = R"GBNF(
root   ::= value
value  ::= object | array | string | number | ("true" | "false" | "null") ws
object ::= "{" ws ( string ":" ws value ("," ws string ":" ws value)* )? "}" ws
array  ::= "[" ws ( value ("," ws value)* )? "]" ws
string ::= "\"" ( [^"\\\x7F\x00-\x1F] | "\\" (["\\/bfnrt] | "u" [0-9a-fA-F]{4}) )* "\"" ws
number ::= ("-"? ([0-9] | [1-9] [0-9]{0,15})) ("." [0-9]+)? ([eE] [-+]? [0-9] [1-9]{0,15})? ws
ws     ::= | " " | "\n" [ \t]{0,20}
)GBNF";

struct SamplerDeleter {
    void operator()(llama_sampler* sampler) const {
        if (sampler != nullptr) {
            llama_sampler_free(sampler);
        }
    }
};

using SamplerPtr = std::unique_ptr<llama_sampler, SamplerDeleter>;

LogLevel to_log_level(ggml_log_level level) {
    switch (level) {
        case GGML_LOG_LEVEL_ERROR: return LogLevel::Error;
        case GGML_LOG_LEVEL_WARN: return LogLevel::Warn;
        case GGML_LOG_LEVEL_INFO: return LogLevel::Info;
        default: return LogLevel::Debug;
    }
}

Expected<int> int_setting(const nlohmann::json& extra, const char* key, int fallback) {
    auto it = extra.find(key);
    if (it == extra.end() || it->is_null()) {
        return fallback;
    }
    if (!it->is_number_integer()) {
        return tl::unexpected(Error{
            ErrorCode::InvalidProviderOptions,
            std::string("'") + key + "' must be an integer",
            it->dump()
        });
    }
    return it->get<int>();
}

std::string trim_trailing(std::string text) {
    while (!text.empty() && (text.back() == ' ' || text.back() == '\n' ||
                             text.back() == '\t' || text.back() == '\r')) {
        text.pop_back();
    }
    return text;
}

} // namespace

// ============================================================================
// LlamaSettings
// ============================================================================

Expected<LlamaSettings> LlamaSettings::from_options(const ProviderOptions& options) {
    LlamaSettings settings;
    if (!options.extra.is_null() && !options.extra.is_object()) {
        return tl::unexpected(Error{
            ErrorCode::InvalidProviderOptions,
            "Provider 'extra' options must be a JSON object",
            options.extra.dump()
        });
    }
    if (options.extra.is_object()) {
        auto context_size = int_setting(options.extra, "context_size", settings.context_size);
        if (!context_size) return tl::unexpected(context_size.error());
        if (*context_size <= 0) {
            return tl::unexpected(Error{
                ErrorCode::InvalidProviderOptions,
                "'context_size' must be positive",
                std::to_string(*context_size)
            });
        }
        settings.context_size = *context_size;

        auto n_gpu_layers = int_setting(options.extra, "n_gpu_layers", settings.n_gpu_layers);
        if (!n_gpu_layers) return tl::unexpected(n_gpu_layers.error());
        settings.n_gpu_layers = *n_gpu_layers;
    }
    settings.timeout = options.timeout;
    return settings;
}

// ============================================================================
// LlamaProvider
// ============================================================================

void LlamaProvider::initialize_global() {
    std::call_once(g_init_flag, []() {
        llama_backend_init();
        ggml_backend_load_all();
    });
}

LlamaProvider::LlamaProvider() {
    // Route llama.cpp/ggml output through the parley log sink
    llama_log_set([](enum ggml_log_level level, const char* text, void*) {
        if (text == nullptr) {
            return;
        }
        std::string line(text);
        while (!line.empty() && line.back() == '\n') {
            line.pop_back();
        }
        if (!line.empty()) {
            detail::log(to_log_level(level), "llama.cpp: " + line);
        }
    }, nullptr);
}

LlamaProvider::~LlamaProvider() {
    if (ctx_ != nullptr) {
        llama_free(ctx_);
        ctx_ = nullptr;
    }
    if (model_ != nullptr) {
        llama_model_free(model_);
        model_ = nullptr;
    }
}

Expected<void> LlamaProvider::initialize(const std::string& model_path, const ProviderOptions& options) {
    initialize_global();

    auto settings = LlamaSettings::from_options(options);
    if (!settings) {
        return tl::unexpected(settings.error());
    }
    if (options.api_key.has_value() || options.base_url.has_value()) {
        parley::log_warn("llama provider ignores api_key and base_url");
    }

    auto model_params = llama_model_default_params();
    model_params.n_gpu_layers = settings->n_gpu_layers;

    model_ = llama_model_load_from_file(model_path.c_str(), model_params);
    if (model_ == nullptr) {
        return tl::unexpected(Error{
            ErrorCode::ModelLoadFailed,
            "Failed to load model from path: " + model_path
        });
    }

    auto ctx_params = llama_context_default_params();
    ctx_params.n_ctx = static_cast<uint32_t>(settings->context_size);
    ctx_params.n_batch = static_cast<uint32_t>(settings->context_size);
    ctx_params.n_ubatch = 512;

    ctx_ = llama_init_from_model(model_, ctx_params);
    if (ctx_ == nullptr) {
        llama_model_free(model_);
        model_ = nullptr;
        return tl::unexpected(Error{
            ErrorCode::ModelLoadFailed,
            "Failed to create llama context",
            model_path
        });
    }

    vocab_ = llama_model_get_vocab(model_);
    if (vocab_ == nullptr) {
        llama_free(ctx_);
        llama_model_free(model_);
        ctx_ = nullptr;
        model_ = nullptr;
        return tl::unexpected(Error{
            ErrorCode::ModelLoadFailed,
            "Failed to get model vocabulary",
            model_path
        });
    }

    context_size_ = static_cast<int>(llama_n_ctx(ctx_));
    // May be nullptr; llama_chat_apply_template falls back to ChatML
    tmpl_ = llama_model_chat_template(model_, nullptr);
    formatted_.resize(static_cast<size_t>(context_size_) * 4);
    model_path_ = model_path;
    timeout_ = settings->timeout;

    parley::log_info("Loaded " + model_path + " (context " + std::to_string(context_size_) + " tokens)");
    return {};
}

Expected<ProviderReply> LlamaProvider::complete_chat(
    const std::string& model_id,
    const std::vector<Message>& messages,
    const RequestConfig& config,
    const CompletionOptions& options
) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (ctx_ == nullptr || model_ == nullptr) {
        return tl::unexpected(Error{
            ErrorCode::InferenceFailed,
            "llama provider not initialized",
            model_id
        });
    }
    if (model_id != model_path_) {
        parley::log_warn("llama provider serves " + model_path_ + ", ignoring requested model " + model_id);
    }

    // Every request evaluates the full conversation
    clear_kv_cache();

    auto prompt = format_prompt(messages, options);
    if (!prompt) {
        return tl::unexpected(prompt.error());
    }
    auto tokens = tokenize(*prompt);
    if (!tokens) {
        return tl::unexpected(tokens.error());
    }

    SamplerPtr sampler(create_sampler_chain(config, options.output_format.has_value()));
    if (!sampler) {
        return tl::unexpected(Error{
            ErrorCode::InferenceFailed,
            "Failed to create sampler chain"
        });
    }

    const int max_tokens = config.max_tokens.value_or(kDefaultMaxTokens);
    auto generation = generate(*tokens, max_tokens, sampler.get());
    if (!generation) {
        return tl::unexpected(generation.error());
    }

    ProviderReply reply;
    reply.usage = ReportedUsage{
        static_cast<int64_t>(tokens->size()),
        static_cast<int64_t>(generation->output_tokens),
        std::nullopt
    };

    if (!options.tools.empty()) {
        auto parsed = engine::ToolCallParser::parse(generation->text);
        if (!parsed.tool_calls.empty()) {
            reply.content = trim_trailing(std::move(parsed.text_before));
            reply.tool_calls = std::move(parsed.tool_calls);
            reply.finish_reason = "tool_calls";
            reply.response_id = "resp_" + std::to_string(
                g_response_counter.fetch_add(1, std::memory_order_relaxed) + 1);
            return reply;
        }
    }

    reply.content = trim_trailing(std::move(generation->text));
    reply.finish_reason = generation->hit_limit ? "length" : "stop";
    return reply;
}

Expected<std::string> LlamaProvider::format_prompt(const std::vector<Message>& messages,
                                                   const CompletionOptions& options) {
    const auto turns = engine::PromptRenderer::render(messages, options);

    // Points at turns, which outlives every use of llama_msgs
    std::vector<llama_chat_message> llama_msgs;
    llama_msgs.reserve(turns.size());
    for (const auto& turn : turns) {
        llama_msgs.push_back({turn.role.c_str(), turn.content.c_str()});
    }

    int new_len = llama_chat_apply_template(
        tmpl_, llama_msgs.data(), llama_msgs.size(),
        true, formatted_.data(), static_cast<int32_t>(formatted_.size()));

    if (new_len > static_cast<int>(formatted_.size())) {
        formatted_.resize(static_cast<size_t>(new_len));
        new_len = llama_chat_apply_template(
            tmpl_, llama_msgs.data(), llama_msgs.size(),
            true, formatted_.data(), static_cast<int32_t>(formatted_.size()));
    }

    if (new_len < 0) {
        return tl::unexpected(Error{
            ErrorCode::InferenceFailed,
            "llama_chat_apply_template failed"
        });
    }

    return std::string(formatted_.begin(), formatted_.begin() + new_len);
}

Expected<std::vector<int>> LlamaProvider::tokenize(const std::string& text) {
    static_assert(sizeof(int) == sizeof(llama_token), "int must match llama_token size");

    // llama_tokenize returns the negated required size when the buffer is too small
    const int32_t raw = llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.length()),
                                       nullptr, 0, true, true);
    if (raw == INT32_MIN) {
        return tl::unexpected(Error{
            ErrorCode::InferenceFailed,
            "Tokenization overflow (input too large)"
        });
    }
    const int n_prompt_tokens = (raw < 0) ? -raw : raw;
    std::vector<int> tokens(static_cast<size_t>(n_prompt_tokens));
    if (n_prompt_tokens == 0) {
        return tokens;
    }
    if (llama_tokenize(vocab_, text.c_str(), static_cast<int32_t>(text.length()),
                       reinterpret_cast<llama_token*>(tokens.data()),
                       static_cast<int32_t>(tokens.size()), true, true) < 0) {
        return tl::unexpected(Error{
            ErrorCode::InferenceFailed,
            "Tokenization failed"
        });
    }
    return tokens;
}

Expected<LlamaProvider::Generation> LlamaProvider::generate(
    const std::vector<int>& prompt_tokens,
    int max_tokens,
    llama_sampler* sampler
) {
    using Clock = std::chrono::steady_clock;
    // Elapsed time is compared in milliseconds so very long timeouts cannot overflow the clock.
    const auto start = Clock::now();

    Generation result;
    result.text.reserve(static_cast<size_t>(max_tokens) * 8);

    if (static_cast<int>(prompt_tokens.size()) > context_size_) {
        return tl::unexpected(Error{
            ErrorCode::InferenceFailed,
            "Prompt exceeds the context window",
            "prompt_tokens=" + std::to_string(prompt_tokens.size()) +
            " context_size=" + std::to_string(context_size_)
        });
    }

    // llama_decode only reads through the batch pointer
    llama_batch batch = llama_batch_get_one(
        const_cast<llama_token*>(reinterpret_cast<const llama_token*>(prompt_tokens.data())),
        static_cast<int32_t>(prompt_tokens.size())
    );
    llama_token new_token;
    while (true) {
        if (timeout_.has_value() &&
            std::chrono::duration_cast<std::chrono::milliseconds>(Clock::now() - start) > *timeout_) {
            return tl::unexpected(Error{
                ErrorCode::ConnectionTimeout,
                "Generation exceeded the configured timeout",
                std::to_string(timeout_->count()) + " ms"
            });
        }

        const int n_ctx_used = llama_memory_seq_pos_max(llama_get_memory(ctx_), 0) + 1;
        if (n_ctx_used + batch.n_tokens > context_size_) {
            result.hit_limit = true;
            break;
        }

        if (llama_decode(ctx_, batch) != 0) {
            return tl::unexpected(Error{
                ErrorCode::InferenceFailed,
                "Failed to decode batch"
            });
        }

        new_token = llama_sampler_sample(sampler, ctx_, -1);
        if (llama_vocab_is_eog(vocab_, new_token)) {
            break;
        }

        char buff[256];
        const int n = llama_token_to_piece(vocab_, new_token, buff, sizeof(buff), 0, true);
        if (n < 0) {
            return tl::unexpected(Error{
                ErrorCode::InferenceFailed,
                "Failed to convert token to piece"
            });
        }
        result.text.append(buff, static_cast<size_t>(n));
        ++result.output_tokens;

        if (result.output_tokens >= max_tokens) {
            result.hit_limit = true;
            break;
        }

        batch = llama_batch_get_one(&new_token, 1);
    }

    return result;
}

llama_sampler* LlamaProvider::create_sampler_chain(const RequestConfig& config, bool constrain_to_json) const {
    auto chain_params = llama_sampler_chain_default_params();
    llama_sampler* chain = llama_sampler_chain_init(chain_params);
    if (chain == nullptr) {
        return nullptr;
    }

    // Order: grammar, penalties, top-p, temperature, distribution

    if (constrain_to_json) {
        auto* grammar = llama_sampler_init_grammar(vocab_, kJsonGrammar, "root");
        if (grammar == nullptr) {
            llama_sampler_free(chain);
            return nullptr;
        }
        llama_sampler_chain_add(chain, grammar);
    }

    const float frequency = config.frequency_penalty.value_or(0.0f);
    const float presence = config.presence_penalty.value_or(0.0f);
    if (frequency != 0.0f || presence != 0.0f) {
        auto* penalties = llama_sampler_init_penalties(kPenaltyLastN, 1.0f, frequency, presence);
        if (penalties != nullptr) {
            llama_sampler_chain_add(chain, penalties);
        }
    }

    const float top_p = config.top_p.value_or(1.0f);
    if (top_p < 1.0f) {
        auto* sampler = llama_sampler_init_top_p(top_p, 1);
        if (sampler != nullptr) {
            llama_sampler_chain_add(chain, sampler);
        }
    }

    const float temperature = config.temperature.value_or(kDefaultTemperature);
    if (temperature <= 0.0f) {
        auto* greedy = llama_sampler_init_greedy();
        if (greedy != nullptr) {
            llama_sampler_chain_add(chain, greedy);
        }
        return chain;
    }

    auto* temp = llama_sampler_init_temp(temperature);
    if (temp != nullptr) {
        llama_sampler_chain_add(chain, temp);
    }

    auto* dist = llama_sampler_init_dist(static_cast<uint32_t>(time(nullptr)));
    if (dist != nullptr) {
        llama_sampler_chain_add(chain, dist);
    } else {
        auto* greedy = llama_sampler_init_greedy();
        if (greedy != nullptr) {
            llama_sampler_chain_add(chain, greedy);
        }
    }

    return chain;
}

void LlamaProvider::clear_kv_cache() {
    if (ctx_ != nullptr) {
        llama_memory_clear(llama_get_memory(ctx_), false);
    }
}

// ============================================================================
// Factory
// ============================================================================

Expected<std::shared_ptr<IProvider>> create_provider(const ModelSpec& spec, const ProviderOptions& options) {
    if (spec.provider != "llama") {
        return tl::unexpected(Error{
            ErrorCode::UnknownProvider,
            "No adapter for provider '" + spec.provider + "'",
            spec.to_string()
        });
    }
    auto provider = std::make_shared<LlamaProvider>();
    if (auto init = provider->initialize(spec.model, options); !init) {
        return tl::unexpected(init.error());
    }
    return std::shared_ptr<IProvider>(std::move(provider));
}

} // namespace provider
} // namespace parley
