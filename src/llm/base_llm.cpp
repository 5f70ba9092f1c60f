#include "promptchain/llm/base_llm.hpp"
#include "promptchain/utils/logging.hpp"
#include <stdexcept>

namespace promptchain::llm {

void LLMOptions::merge(const LLMOptions& incoming) {
    if (incoming.max_tokens) max_tokens = incoming.max_tokens;
    if (incoming.temperature) temperature = incoming.temperature;
    if (incoming.stop_words) stop_words = incoming.stop_words;
    if (incoming.top_k) top_k = incoming.top_k;
    if (incoming.top_p) top_p = incoming.top_p;
    if (incoming.seed) seed = incoming.seed;
    if (incoming.min_length) min_length = incoming.min_length;
    if (incoming.max_length) max_length = incoming.max_length;
    if (incoming.repetition_penalty) repetition_penalty = incoming.repetition_penalty;
    if (incoming.timeout) timeout = incoming.timeout;
    if (incoming.streaming_func) streaming_func = incoming.streaming_func;
}

void LLMOptions::validate() const {
    LOG_DEBUG("Validating LLM options");

    if (temperature.has_value() && (*temperature < 0.0 || *temperature > 2.0)) {
        throw std::invalid_argument("Temperature must be between 0.0 and 2.0");
    }

    if (top_p.has_value() && (*top_p <= 0.0 || *top_p > 1.0)) {
        throw std::invalid_argument("Top_p must be between 0.0 and 1.0");
    }

    if (top_k.has_value() && *top_k == 0) {
        throw std::invalid_argument("Top_k must be positive");
    }

    if (max_tokens.has_value() && (*max_tokens == 0 || *max_tokens > 128000)) {
        throw std::invalid_argument("Max tokens must be between 1 and 128000");
    }

    if (min_length.has_value() && max_length.has_value() && *min_length > *max_length) {
        throw std::invalid_argument("Min length cannot exceed max length");
    }

    if (repetition_penalty.has_value() && *repetition_penalty <= 0.0) {
        throw std::invalid_argument("Repetition penalty must be positive");
    }

    if (timeout.has_value() &&
        (timeout->count() < 100 || timeout->count() > 300000)) { // 100ms to 5 minutes
        throw std::invalid_argument("Timeout must be between 100ms and 300000ms");
    }

    if (stop_words.has_value()) {
        for (const auto& word : *stop_words) {
            if (word.empty()) {
                throw std::invalid_argument("Stop words cannot be empty");
            }
        }
    }

    LOG_DEBUG("LLM options validation passed");
}

} // namespace promptchain::llm
