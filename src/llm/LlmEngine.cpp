// SPDX-License-Identifier: Apache-2.0
#include "LlmEngine.hpp"

#include <core/Log.hpp>
#include <llm/ToolCallTagScanner.hpp>

#include <llama.h>

#include <algorithm>
#include <array>
#include <deque>
#include <format>
#include <mutex>
#include <optional>
#include <string>
#include <thread>
#include <vector>

namespace toolchat
{

struct LlmEngine::Impl
{
    llama_model* model = nullptr;
    llama_context* ctx = nullptr;
    LlmEngineConfig config;
    std::mutex mutex;

    ~Impl()
    {
        if (ctx)
            llama_free(ctx);
        if (model)
            llama_model_free(model);
    }
};

namespace
{

    /// @brief Line buffer for llama.cpp log continuation messages.
    auto llamaLineBuffer = std::string {};

    auto mapGgmlLevel(ggml_log_level level) -> std::optional<log::Level>
    {
        switch (level)
        {
            case GGML_LOG_LEVEL_ERROR: return log::Level::Error;
            case GGML_LOG_LEVEL_WARN: return log::Level::Warning;
            case GGML_LOG_LEVEL_INFO: return log::Level::Debug;
            case GGML_LOG_LEVEL_DEBUG: return log::Level::Trace;
            default: return std::nullopt;
        }
    }

    /// @brief Forwards llama.cpp log output to toolchat::log, one complete line at a time.
    ///
    /// llama.cpp is chatty at info level, so its info and debug output is demoted by one level.
    void llamaLogCallback(ggml_log_level level, char const* text, void* /*userData*/)
    {
        if (level == GGML_LOG_LEVEL_NONE || text == nullptr)
            return;

        llamaLineBuffer += std::string_view { text };

        while (true)
        {
            auto const nlPos = llamaLineBuffer.find('\n');
            if (nlPos == std::string::npos)
                break;

            auto line = llamaLineBuffer.substr(0, nlPos);
            auto const end = line.find_last_not_of(" \t\r");
            if (end != std::string::npos)
                line = line.substr(0, end + 1);

            if (!line.empty() && end != std::string::npos)
                log::write(mapGgmlLevel(level).value_or(log::Level::Debug), line);

            llamaLineBuffer.erase(0, nlPos + 1);
        }
    }

    struct SamplerDeleter
    {
        void operator()(llama_sampler* sampler) const { llama_sampler_free(sampler); }
    };

    using SamplerPtr = std::unique_ptr<llama_sampler, SamplerDeleter>;

    auto makeSampler(const LlmEngineConfig& config) -> SamplerPtr
    {
        auto sampler = SamplerPtr { llama_sampler_chain_init(llama_sampler_chain_default_params()) };
        if (config.temperature <= 0.0f)
        {
            llama_sampler_chain_add(sampler.get(), llama_sampler_init_greedy());
            return sampler;
        }

        llama_sampler_chain_add(sampler.get(), llama_sampler_init_top_k(config.topK));
        llama_sampler_chain_add(sampler.get(), llama_sampler_init_top_p(config.topP, 1));
        llama_sampler_chain_add(sampler.get(), llama_sampler_init_temp(config.temperature));
        llama_sampler_chain_add(
            sampler.get(),
            llama_sampler_init_dist(config.seed < 0 ? LLAMA_DEFAULT_SEED : static_cast<uint32_t>(config.seed)));
        return sampler;
    }

    /// @brief Renders a previously issued call the same way the model is asked to emit it.
    auto renderToolCall(const ToolCallRecord& call) -> std::string
    {
        auto arguments = nlohmann::json::parse(call.argumentText, nullptr, /*allow_exceptions=*/false);
        if (arguments.is_discarded())
            arguments = call.argumentText;
        auto const body = nlohmann::json { { "name", call.qualifiedName }, { "arguments", arguments } };
        return std::format("{}\n{}\n{}", ToolCallTagScanner::OpenTag, body.dump(), ToolCallTagScanner::CloseTag);
    }

    /// @brief Role/content pairs in the shape llama_chat_apply_template expects.
    struct PromptMessages
    {
        std::vector<std::string> roles;
        std::vector<std::string> contents;

        void add(std::string_view role, std::string content)
        {
            roles.emplace_back(role);
            contents.push_back(std::move(content));
        }

        [[nodiscard]] auto view() const -> std::vector<llama_chat_message>
        {
            auto out = std::vector<llama_chat_message> {};
            out.reserve(roles.size());
            for (auto i = size_t { 0 }; i < roles.size(); ++i)
                out.push_back(llama_chat_message { .role = roles[i].c_str(), .content = contents[i].c_str() });
            return out;
        }
    };

    auto buildPromptMessages(std::span<const ChatMessage> messages, std::span<const ToolDescriptor> tools)
        -> PromptMessages
    {
        auto out = PromptMessages {};
        auto const toolPrompt = tools.empty() ? std::string {} : renderToolPrompt(tools);
        auto toolPromptPlaced = toolPrompt.empty();

        for (const auto& msg: messages)
        {
            switch (msg.role)
            {
                case Role::System:
                    if (!toolPromptPlaced)
                    {
                        out.add("system", std::format("{}\n\n{}", msg.content, toolPrompt));
                        toolPromptPlaced = true;
                    }
                    else
                        out.add("system", msg.content);
                    break;
                case Role::Assistant: {
                    auto content = msg.content;
                    for (const auto& call: msg.toolCalls)
                    {
                        if (!content.empty())
                            content += '\n';
                        content += renderToolCall(call);
                    }
                    out.add("assistant", std::move(content));
                    break;
                }
                case Role::Tool:
                    out.add("tool", std::format("<tool_response>\n{}\n</tool_response>", msg.content));
                    break;
                case Role::User: out.add("user", msg.content); break;
            }
        }

        if (!toolPromptPlaced)
        {
            out.roles.insert(out.roles.begin(), "system");
            out.contents.insert(out.contents.begin(), toolPrompt);
        }
        return out;
    }

    /// @brief Generates one turn token by token and hands out the resulting fragments.
    ///
    /// Holds the engine lock for its whole lifetime.
    class LlamaFragmentStream final: public FragmentStream
    {
      public:
        LlamaFragmentStream(std::unique_lock<std::mutex> lock,
                            llama_context* ctx,
                            const llama_vocab* vocab,
                            SamplerPtr sampler,
                            int tokenBudget):
            _lock(std::move(lock)),
            _ctx(ctx),
            _vocab(vocab),
            _sampler(std::move(sampler)),
            _tokenBudget(tokenBudget),
            _scanner(ToolCallTagScanner::randomIdPrefix())
        {
        }

        auto next() -> Result<std::optional<Fragment>> override
        {
            while (_pending.empty())
            {
                if (_done)
                    return std::nullopt;
                if (auto stepped = step(); !stepped)
                {
                    _done = true;
                    return std::unexpected(stepped.error());
                }
            }

            auto fragment = std::move(_pending.front());
            _pending.pop_front();
            return fragment;
        }

      private:
        std::unique_lock<std::mutex> _lock;
        llama_context* _ctx;
        const llama_vocab* _vocab;
        SamplerPtr _sampler;
        int _tokenBudget;
        int _generated = 0;
        bool _done = false;
        ToolCallTagScanner _scanner;
        std::deque<Fragment> _pending;

        void enqueue(std::vector<Fragment> fragments)
        {
            for (auto& fragment: fragments)
                _pending.push_back(std::move(fragment));
        }

        void finish()
        {
            enqueue(_scanner.finish());
            _done = true;
            log::debug("Generation finished after {} tokens ({} tool calls)", _generated, _scanner.callCount());
        }

        auto step() -> VoidResult
        {
            if (_generated >= _tokenBudget)
            {
                log::warning("Generation stopped at the token limit ({})", _tokenBudget);
                finish();
                return {};
            }

            auto token = llama_sampler_sample(_sampler.get(), _ctx, -1);
            ++_generated;

            if (llama_vocab_is_eog(_vocab, token))
            {
                finish();
                return {};
            }

            auto tokenBuf = std::array<char, 256> {};
            auto const tokenLen = llama_token_to_piece(
                _vocab, token, tokenBuf.data(), static_cast<int32_t>(tokenBuf.size()), 0, true);
            if (tokenLen > 0)
                enqueue(_scanner.feed(std::string_view(tokenBuf.data(), static_cast<size_t>(tokenLen))));

            auto batch = llama_batch_get_one(&token, 1);
            if (llama_decode(_ctx, batch) != 0)
                return makeError(ErrorCode::BackendError, "Failed to decode generated token");
            return {};
        }
    };

} // namespace

auto renderToolPrompt(std::span<const ToolDescriptor> tools) -> std::string
{
    auto prompt = std::string { "# Tools\n\n"
                                "You may call one or more functions to assist with the user query.\n\n"
                                "You are provided with function signatures within <tools></tools> XML tags:\n"
                                "<tools>\n" };
    for (const auto& tool: tools)
    {
        auto const entry = nlohmann::json {
            { "type", "function" },
            { "function",
              { { "name", tool.qualifiedName },
                { "description", tool.description },
                { "parameters", tool.inputSchema.is_null() ? nlohmann::json::object() : tool.inputSchema } } },
        };
        prompt += entry.dump();
        prompt += '\n';
    }
    prompt += "</tools>\n\n"
              "For each function call, return a json object with function name and arguments within "
              "<tool_call></tool_call> XML tags:\n"
              "<tool_call>\n"
              "{\"name\": <function-name>, \"arguments\": <args-json-object>}\n"
              "</tool_call>";
    return prompt;
}

LlmEngine::LlmEngine(): _impl(std::make_unique<Impl>())
{
}

LlmEngine::~LlmEngine() = default;

auto LlmEngine::load(const LlmEngineConfig& config) -> VoidResult
{
    log::info("Loading model: {}", config.modelPath);

    llama_log_set(llamaLogCallback, nullptr);

    auto modelParams = llama_model_default_params();
    modelParams.n_gpu_layers = config.gpuLayers >= 0 ? config.gpuLayers : 999; // Auto: offload everything

    auto* model = llama_model_load_from_file(config.modelPath.c_str(), modelParams);
    if (!model)
        return makeError(ErrorCode::ModelLoadError, std::format("Failed to load model: {}", config.modelPath));

    auto ctxParams = llama_context_default_params();
    ctxParams.n_ctx = static_cast<uint32_t>(config.contextSize);
    ctxParams.n_threads = config.threads > 0 ? config.threads
                                             : static_cast<int32_t>(std::thread::hardware_concurrency());
    ctxParams.n_threads_batch = ctxParams.n_threads;

    auto* ctx = llama_init_from_model(model, ctxParams);
    if (!ctx)
    {
        llama_model_free(model);
        return makeError(ErrorCode::ModelLoadError, "Failed to create llama context");
    }

    auto const lock = std::lock_guard { _impl->mutex };
    if (_impl->ctx)
        llama_free(_impl->ctx);
    if (_impl->model)
        llama_model_free(_impl->model);
    _impl->model = model;
    _impl->ctx = ctx;
    _impl->config = config;

    log::info("Model loaded (context size: {})", config.contextSize);
    return {};
}

auto LlmEngine::streamTurn(std::span<const ChatMessage> messages, std::span<const ToolDescriptor> tools)
    -> Result<std::unique_ptr<FragmentStream>>
{
    auto lock = std::unique_lock { _impl->mutex };
    if (!_impl->model || !_impl->ctx)
        return makeError(ErrorCode::BackendError, "No model loaded");

    auto const* tmpl = llama_model_chat_template(_impl->model, nullptr);
    auto const chatTemplate = tmpl ? std::string(tmpl) : std::string("chatml");

    auto const promptMessages = buildPromptMessages(messages, tools);
    auto const llamaMsgs = promptMessages.view();

    auto buf = std::vector<char>(16 * 1024);
    auto len = llama_chat_apply_template(
        chatTemplate.c_str(), llamaMsgs.data(), llamaMsgs.size(), true, buf.data(), static_cast<int32_t>(buf.size()));
    if (len > static_cast<int32_t>(buf.size()))
    {
        buf.resize(static_cast<size_t>(len));
        len = llama_chat_apply_template(chatTemplate.c_str(),
                                        llamaMsgs.data(),
                                        llamaMsgs.size(),
                                        true,
                                        buf.data(),
                                        static_cast<int32_t>(buf.size()));
    }
    if (len < 0)
        return makeError(ErrorCode::BackendError, "Failed to apply chat template");

    auto const prompt = std::string(buf.data(), static_cast<size_t>(len));
    log::trace("Prompt:\n{}", prompt);

    auto const* vocab = llama_model_get_vocab(_impl->model);
    auto const contextSize = static_cast<int>(llama_n_ctx(_impl->ctx));
    auto const required =
        -llama_tokenize(vocab, prompt.c_str(), static_cast<int32_t>(prompt.size()), nullptr, 0, true, true);
    if (required <= 0 || required >= contextSize)
        return makeError(ErrorCode::BackendError,
                         std::format("Prompt of {} tokens does not fit the context of {} tokens", required, contextSize));

    auto tokens = std::vector<llama_token>(static_cast<size_t>(required));
    auto const nTokens = llama_tokenize(vocab,
                                        prompt.c_str(),
                                        static_cast<int32_t>(prompt.size()),
                                        tokens.data(),
                                        static_cast<int32_t>(tokens.size()),
                                        true,
                                        true);
    if (nTokens < 0)
        return makeError(ErrorCode::BackendError, "Tokenization failed");
    tokens.resize(static_cast<size_t>(nTokens));

    // Every turn re-decodes the whole conversation.
    if (auto* mem = llama_get_memory(_impl->ctx))
        llama_memory_clear(mem, true);

    auto batch = llama_batch_get_one(tokens.data(), nTokens);
    if (llama_decode(_impl->ctx, batch) != 0)
        return makeError(ErrorCode::BackendError, "Failed to decode prompt");

    auto budget = contextSize - nTokens;
    if (_impl->config.maxTokens > 0)
        budget = std::min(budget, _impl->config.maxTokens);

    log::debug("Prompt decoded: {} tokens, up to {} new tokens", nTokens, budget);
    return std::make_unique<LlamaFragmentStream>(
        std::move(lock), _impl->ctx, vocab, makeSampler(_impl->config), budget);
}

auto LlmEngine::isLoaded() const -> bool
{
    return _impl->model != nullptr && _impl->ctx != nullptr;
}

auto LlmEngine::contextSize() const -> int
{
    return _impl->config.contextSize;
}

} // namespace toolchat
