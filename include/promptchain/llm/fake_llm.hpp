#pragma once

#include "base_llm.hpp"
#include <string>
#include <vector>
#include <memory>
#include <atomic>

namespace promptchain::llm {

/**
 * @brief Configuration for the in-process fake model
 */
struct FakeLLMConfig {
    // Replies handed out in order, wrapping around. Empty means echo the last message.
    std::vector<std::string> responses;
    size_t chunk_size = 5;
    std::string model = "fake";

    void validate() const;
};

/**
 * @brief Deterministic model used by examples and tests
 *
 * Honors stop_words, max_length and streaming_func from its options and
 * checks the cancellation token before every chunk.
 */
class FakeLLM : public BaseLLM {
private:
    FakeLLMConfig config_;
    LLMOptions options_;
    mutable std::atomic<size_t> next_response_{0};

    std::string next_reply(const std::vector<ChatMessage>& messages) const;
    std::vector<std::string> split_chunks(const std::string& text) const;
    TokenUsage usage_for(const std::vector<ChatMessage>& messages, const std::string& reply) const;

public:
    explicit FakeLLM(const FakeLLMConfig& config = FakeLLMConfig{});

    GenerateResult generate(
        const std::vector<ChatMessage>& messages,
        const utils::CancellationToken& token = {}
    ) const override;

    std::unique_ptr<LLMStream> stream(
        const std::vector<ChatMessage>& messages,
        const utils::CancellationToken& token = {}
    ) const override;

    void add_options(const LLMOptions& options) override;

    std::string get_provider() const override;

    const LLMOptions& get_options() const { return options_; }
    const FakeLLMConfig& get_config() const { return config_; }

    // Simple approximation: ~4 characters per token
    size_t count_tokens(const std::string& text) const;
};

} // namespace promptchain::llm
