#pragma once

#include "../core/base.hpp"
#include "../core/types.hpp"
#include "../utils/cancellation.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>
#include <functional>
#include <chrono>
#include <cstdint>

namespace promptchain::llm {

/**
 * @brief Callback receiving each generated chunk as it arrives
 */
using StreamingFunc = std::function<void(const std::string&)>;

/**
 * @brief Model-level generation options
 *
 * Every field is optional; an unset field means "use the model default".
 */
struct LLMOptions {
    // Generation parameters
    std::optional<size_t> max_tokens;
    std::optional<double> temperature;
    std::optional<std::vector<std::string>> stop_words;

    // Sampling parameters
    std::optional<size_t> top_k;
    std::optional<double> top_p;
    std::optional<uint64_t> seed;
    std::optional<size_t> min_length;
    std::optional<size_t> max_length;
    std::optional<double> repetition_penalty;

    // Transport
    std::optional<std::chrono::milliseconds> timeout;

    // Streaming configuration
    StreamingFunc streaming_func;

    /**
     * @brief Fold incoming options into this set
     *
     * Fields set in `incoming` replace the current value; unset fields are kept.
     */
    void merge(const LLMOptions& incoming);

    // Validation
    void validate() const;
};

/**
 * @brief Lazy, finite, non-restartable sequence of stream items
 *
 * Destroying the stream releases whatever produces it.
 */
class LLMStream {
public:
    virtual ~LLMStream() = default;

    /**
     * @brief Pull the next item
     * @return The item, or nullopt once the stream has ended
     * @throws LLMException if producing this item failed
     */
    virtual std::optional<StreamData> next() = 0;
};

/**
 * @brief Base interface for all LLM implementations
 */
class BaseLLM {
public:
    virtual ~BaseLLM() = default;

    /**
     * @brief Generate a chat completion
     * @param messages Conversation history
     * @param token Cancellation observed while generating
     * @return Generation plus metadata
     * @throws LLMException on any model failure
     */
    virtual GenerateResult generate(
        const std::vector<ChatMessage>& messages,
        const utils::CancellationToken& token = {}
    ) const = 0;

    /**
     * @brief Start a streamed chat completion
     * @param messages Conversation history
     * @param token Cancellation observed while streaming
     * @return Stream of incremental items
     * @throws LLMException if the stream cannot be established
     */
    virtual std::unique_ptr<LLMStream> stream(
        const std::vector<ChatMessage>& messages,
        const utils::CancellationToken& token = {}
    ) const = 0;

    /**
     * @brief Merge options into this model's configuration
     */
    virtual void add_options(const LLMOptions& options) = 0;

    /**
     * @brief Get provider name
     */
    virtual std::string get_provider() const = 0;

    /**
     * @brief Generate from a single user prompt and return the text
     */
    virtual std::string invoke(const std::string& prompt) const {
        return generate({ChatMessage::user(prompt)}).generation;
    }
};

} // namespace promptchain::llm
