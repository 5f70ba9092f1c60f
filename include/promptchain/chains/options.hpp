#pragma once

#include "../llm/base_llm.hpp"
#include <string>
#include <vector>
#include <optional>
#include <chrono>
#include <cstdint>

namespace promptchain::chains {

/**
 * @brief Call-time tunables folded into the model when a chain is built
 *
 * Mirrors llm::LLMOptions field for field, so the conversion is lossless.
 */
struct ChainCallOptions {
    std::optional<size_t> max_tokens;
    std::optional<double> temperature;
    std::optional<std::vector<std::string>> stop_words;
    std::optional<size_t> top_k;
    std::optional<double> top_p;
    std::optional<uint64_t> seed;
    std::optional<size_t> min_length;
    std::optional<size_t> max_length;
    std::optional<double> repetition_penalty;
    std::optional<std::chrono::milliseconds> timeout;
    llm::StreamingFunc streaming_func;

    ChainCallOptions& with_max_tokens(size_t value) { max_tokens = value; return *this; }
    ChainCallOptions& with_temperature(double value) { temperature = value; return *this; }
    ChainCallOptions& with_stop_words(std::vector<std::string> value) { stop_words = std::move(value); return *this; }
    ChainCallOptions& with_top_k(size_t value) { top_k = value; return *this; }
    ChainCallOptions& with_top_p(double value) { top_p = value; return *this; }
    ChainCallOptions& with_seed(uint64_t value) { seed = value; return *this; }
    ChainCallOptions& with_min_length(size_t value) { min_length = value; return *this; }
    ChainCallOptions& with_max_length(size_t value) { max_length = value; return *this; }
    ChainCallOptions& with_repetition_penalty(double value) { repetition_penalty = value; return *this; }
    ChainCallOptions& with_timeout(std::chrono::milliseconds value) { timeout = value; return *this; }
    ChainCallOptions& with_streaming_func(llm::StreamingFunc func) { streaming_func = std::move(func); return *this; }

    /**
     * @brief Same ranges as llm::LLMOptions::validate
     * @throws std::invalid_argument
     */
    void validate() const;

    static llm::LLMOptions to_llm_options(const ChainCallOptions& options);
};

} // namespace promptchain::chains
