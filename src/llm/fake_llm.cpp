#include "promptchain/llm/fake_llm.hpp"
#include "promptchain/utils/logging.hpp"
#include <algorithm>
#include <stdexcept>

namespace promptchain::llm {

namespace {

bool is_utf8_continuation(char c) {
    return (static_cast<unsigned char>(c) & 0xC0) == 0x80;
}

class FakeLLMStream : public LLMStream {
private:
    std::vector<std::string> chunks_;
    size_t position_ = 0;
    TokenUsage usage_;
    utils::CancellationToken token_;
    StreamingFunc streaming_func_;

public:
    FakeLLMStream(std::vector<std::string> chunks, TokenUsage usage,
                  utils::CancellationToken token, StreamingFunc streaming_func)
        : chunks_(std::move(chunks)), usage_(usage),
          token_(std::move(token)), streaming_func_(std::move(streaming_func)) {}

    ~FakeLLMStream() override {
        if (position_ < chunks_.size()) {
            LOG_DEBUG("Fake stream released after " + std::to_string(position_) + " of " +
                      std::to_string(chunks_.size()) + " chunks");
        }
    }

    std::optional<StreamData> next() override {
        if (position_ >= chunks_.size()) {
            return std::nullopt;
        }

        if (token_.is_cancelled()) {
            position_ = chunks_.size();
            throw LLMException("Generation cancelled");
        }

        const std::string& chunk = chunks_[position_++];
        if (streaming_func_) {
            streaming_func_(chunk);
        }

        StreamData item(chunk);
        // Usage rides on the final chunk
        if (position_ == chunks_.size()) {
            item.tokens = usage_;
        }
        return item;
    }
};

} // namespace

void FakeLLMConfig::validate() const {
    if (chunk_size == 0) {
        throw std::invalid_argument("Chunk size must be positive");
    }

    if (model.empty()) {
        throw std::invalid_argument("Model name cannot be empty");
    }
}

FakeLLM::FakeLLM(const FakeLLMConfig& config) : config_(config) {
    config_.validate();
    LOG_DEBUG("Fake LLM initialized with " + std::to_string(config_.responses.size()) + " canned responses");
}

std::string FakeLLM::next_reply(const std::vector<ChatMessage>& messages) const {
    std::string reply;

    if (!config_.responses.empty()) {
        size_t index = next_response_.fetch_add(1) % config_.responses.size();
        reply = config_.responses[index];
    } else {
        if (messages.empty()) {
            throw LLMException("No messages to generate from");
        }
        reply = messages.back().content;
    }

    if (options_.stop_words) {
        size_t cut = std::string::npos;
        for (const auto& word : *options_.stop_words) {
            size_t pos = reply.find(word);
            if (pos != std::string::npos) {
                cut = std::min(cut, pos);
            }
        }
        if (cut != std::string::npos) {
            reply.erase(cut);
        }
    }

    if (options_.max_length && reply.size() > *options_.max_length) {
        // Never keep half of a multibyte character
        size_t cut = *options_.max_length;
        while (cut > 0 && is_utf8_continuation(reply[cut])) {
            --cut;
        }
        reply.resize(cut);
    }

    return reply;
}

std::vector<std::string> FakeLLM::split_chunks(const std::string& text) const {
    // chunk_size counts bytes; a chunk grows to the end of a multibyte character
    std::vector<std::string> chunks;
    size_t start = 0;
    while (start < text.size()) {
        size_t end = std::min(start + config_.chunk_size, text.size());
        while (end < text.size() && is_utf8_continuation(text[end])) {
            ++end;
        }
        chunks.push_back(text.substr(start, end - start));
        start = end;
    }
    return chunks;
}

TokenUsage FakeLLM::usage_for(const std::vector<ChatMessage>& messages, const std::string& reply) const {
    size_t prompt_tokens = 0;
    for (const auto& msg : messages) {
        prompt_tokens += count_tokens(msg.content);
    }
    size_t completion_tokens = count_tokens(reply);
    return TokenUsage{prompt_tokens, completion_tokens, prompt_tokens + completion_tokens};
}

GenerateResult FakeLLM::generate(
    const std::vector<ChatMessage>& messages,
    const utils::CancellationToken& token
) const {
    LOG_DEBUG("Fake generate request with " + std::to_string(messages.size()) + " messages");

    if (token.is_cancelled()) {
        throw LLMException("Generation cancelled");
    }

    std::string reply = next_reply(messages);

    if (options_.streaming_func) {
        for (const auto& chunk : split_chunks(reply)) {
            if (token.is_cancelled()) {
                throw LLMException("Generation cancelled");
            }
            options_.streaming_func(chunk);
        }
    }

    GenerateResult result(reply, usage_for(messages, reply));
    result.model = config_.model;
    return result;
}

std::unique_ptr<LLMStream> FakeLLM::stream(
    const std::vector<ChatMessage>& messages,
    const utils::CancellationToken& token
) const {
    LOG_DEBUG("Fake stream request with " + std::to_string(messages.size()) + " messages");

    if (token.is_cancelled()) {
        throw LLMException("Generation cancelled");
    }

    std::string reply = next_reply(messages);
    return std::make_unique<FakeLLMStream>(
        split_chunks(reply), usage_for(messages, reply), token, options_.streaming_func);
}

void FakeLLM::add_options(const LLMOptions& options) {
    options_.merge(options);
    LOG_DEBUG("Fake LLM options updated");
}

std::string FakeLLM::get_provider() const {
    return "fake";
}

size_t FakeLLM::count_tokens(const std::string& text) const {
    return (text.length() + 3) / 4;
}

} // namespace promptchain::llm
