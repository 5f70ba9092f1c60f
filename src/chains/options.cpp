#include "promptchain/chains/options.hpp"

namespace promptchain::chains {

void ChainCallOptions::validate() const {
    to_llm_options(*this).validate();
}

llm::LLMOptions ChainCallOptions::to_llm_options(const ChainCallOptions& options) {
    llm::LLMOptions llm_options;
    llm_options.max_tokens = options.max_tokens;
    llm_options.temperature = options.temperature;
    llm_options.stop_words = options.stop_words;
    llm_options.top_k = options.top_k;
    llm_options.top_p = options.top_p;
    llm_options.seed = options.seed;
    llm_options.min_length = options.min_length;
    llm_options.max_length = options.max_length;
    llm_options.repetition_penalty = options.repetition_penalty;
    llm_options.timeout = options.timeout;
    llm_options.streaming_func = options.streaming_func;
    return llm_options;
}

} // namespace promptchain::chains
