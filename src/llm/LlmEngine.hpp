// SPDX-License-Identifier: Apache-2.0
#pragma once

#include <core/Error.hpp>
#include <core/Types.hpp>
#include <llm/Fragment.hpp>

#include <cstdint>
#include <memory>
#include <span>
#include <string>

namespace toolchat
{

/// @brief Configuration for the local llama.cpp backend, including sampling.
struct LlmEngineConfig
{
    std::string modelPath;
    int contextSize = 8192;
    int gpuLayers = -1; // -1 means auto
    int threads = 0;    // 0 means auto

    float temperature = 0.7f;
    float topP = 0.9f;
    int topK = 40;
    int64_t seed = -1;  // -1 means random
    int maxTokens = 0;  // 0 means until the context is full
};

/// @brief Runs a GGUF model through llama.cpp as a ModelBackend.
///
/// The tool catalog is rendered into the system prompt and the model is expected to answer with
/// @c <tool_call> tags, which are turned into fragments by ToolCallTagScanner while generating.
///
/// Only one turn can be in flight: the stream returned by streamTurn() owns the engine until it
/// is destroyed, and a second streamTurn() blocks until then.
class LlmEngine final: public ModelBackend
{
  public:
    LlmEngine();
    ~LlmEngine() override;

    LlmEngine(const LlmEngine&) = delete;
    LlmEngine& operator=(const LlmEngine&) = delete;
    LlmEngine(LlmEngine&&) = delete;
    LlmEngine& operator=(LlmEngine&&) = delete;

    /// @brief Loads a GGUF model from disk.
    [[nodiscard]] auto load(const LlmEngineConfig& config) -> VoidResult;

    [[nodiscard]] auto streamTurn(std::span<const ChatMessage> messages, std::span<const ToolDescriptor> tools)
        -> Result<std::unique_ptr<FragmentStream>> override;

    [[nodiscard]] auto isLoaded() const -> bool;
    [[nodiscard]] auto contextSize() const -> int;

  private:
    struct Impl;
    std::unique_ptr<Impl> _impl;
};

/// @brief Builds the system prompt section that advertises @p tools to the model.
[[nodiscard]] auto renderToolPrompt(std::span<const ToolDescriptor> tools) -> std::string;

} // namespace toolchat
