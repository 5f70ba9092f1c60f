#include "promptchain/chains/llm_chain.hpp"
#include "promptchain/utils/logging.hpp"
#include <stdexcept>

namespace promptchain::chains {

namespace {

// Forwards the model stream item by item, re-typing model failures
class LLMChainStream : public ChainStream {
private:
    std::unique_ptr<llm::LLMStream> inner_;

public:
    explicit LLMChainStream(std::unique_ptr<llm::LLMStream> inner)
        : inner_(std::move(inner)) {}

    std::optional<StreamData> next() override {
        try {
            return inner_->next();
        } catch (const std::exception& e) {
            LOG_WARN("LLMChain stream item failed: " + std::string(e.what()));
            throw ModelError(e.what());
        }
    }
};

} // namespace

LLMChain::LLMChain(
    std::unique_ptr<prompts::FormatPrompter> prompt,
    std::unique_ptr<llm::BaseLLM> llm,
    std::string output_key,
    std::unique_ptr<output_parsers::OutputParser> output_parser
) : prompt_(std::move(prompt)), llm_(std::move(llm)),
    output_key_(std::move(output_key)), output_parser_(std::move(output_parser)) {

    if (!prompt_) {
        throw std::invalid_argument("Prompt instance cannot be null");
    }
    if (!llm_) {
        throw std::invalid_argument("LLM instance cannot be null");
    }
    if (!output_parser_) {
        throw std::invalid_argument("Output parser instance cannot be null");
    }
    if (output_key_.empty()) {
        throw std::invalid_argument("Output key cannot be empty");
    }

    LOG_DEBUG("LLMChain initialized with provider " + llm_->get_provider() +
              " and output key: " + output_key_);
}

std::vector<std::string> LLMChain::get_input_keys() const {
    return prompt_->get_input_variables();
}

std::vector<std::string> LLMChain::get_output_keys() const {
    return {output_key_};
}

std::vector<ChatMessage> LLMChain::render_messages(const PromptArgs& args) const {
    if (auto missing = validate_input(args)) {
        LOG_WARN("LLMChain missing required input key: " + *missing);
        throw MissingInputError(*missing);
    }

    try {
        auto prompt = prompt_->format_prompt(args);
        LOG_DEBUG("Prompt: " + prompt.to_string());
        return prompt.to_chat_messages();
    } catch (const std::exception& e) {
        LOG_WARN("LLMChain prompt formatting failed: " + std::string(e.what()));
        throw FormatError(e.what());
    }
}

GenerateResult LLMChain::generate(const std::vector<ChatMessage>& messages,
                                  const utils::CancellationToken& token) const {
    try {
        return llm_->generate(messages, token);
    } catch (const std::exception& e) {
        LOG_WARN("LLMChain generation failed: " + std::string(e.what()));
        throw ModelError(e.what());
    }
}

GenerateResult LLMChain::call(const PromptArgs& args, const utils::CancellationToken& token) const {
    auto messages = render_messages(args);
    auto output = generate(messages, token);

    try {
        output.generation = output_parser_->parse(output.generation);
    } catch (const std::exception& e) {
        LOG_WARN("LLMChain output parsing failed: " + std::string(e.what()));
        throw ParseError(e.what());
    }

    return output;
}

std::string LLMChain::invoke(const PromptArgs& args, const utils::CancellationToken& token) const {
    auto messages = render_messages(args);
    return generate(messages, token).generation;
}

std::unique_ptr<ChainStream> LLMChain::stream(const PromptArgs& args, const utils::CancellationToken& token) const {
    auto messages = render_messages(args);

    std::unique_ptr<llm::LLMStream> llm_stream;
    try {
        llm_stream = llm_->stream(messages, token);
    } catch (const std::exception& e) {
        LOG_WARN("LLMChain stream setup failed: " + std::string(e.what()));
        throw ModelError(e.what());
    }

    if (!llm_stream) {
        throw ModelError("LLM returned no stream");
    }

    return std::make_unique<LLMChainStream>(std::move(llm_stream));
}

// LLMChainBuilder implementation

LLMChainBuilder& LLMChainBuilder::prompt(std::unique_ptr<prompts::FormatPrompter> prompt) {
    prompt_ = std::move(prompt);
    return *this;
}

LLMChainBuilder& LLMChainBuilder::llm(std::unique_ptr<llm::BaseLLM> llm) {
    llm_ = std::move(llm);
    return *this;
}

LLMChainBuilder& LLMChainBuilder::output_key(std::string output_key) {
    output_key_ = std::move(output_key);
    return *this;
}

LLMChainBuilder& LLMChainBuilder::options(ChainCallOptions options) {
    options_ = std::move(options);
    return *this;
}

LLMChainBuilder& LLMChainBuilder::output_parser(std::unique_ptr<output_parsers::OutputParser> output_parser) {
    output_parser_ = std::move(output_parser);
    return *this;
}

std::unique_ptr<LLMChain> LLMChainBuilder::build() {
    if (!prompt_) {
        throw MissingObjectError("Prompt must be set");
    }

    if (!llm_) {
        throw MissingObjectError("LLM must be set");
    }

    if (options_) {
        options_->validate();
        LOG_DEBUG("Folding call options into LLM " + llm_->get_provider());
        llm_->add_options(ChainCallOptions::to_llm_options(*options_));
        options_.reset();
    }

    std::string key = output_key_ ? std::move(*output_key_) : std::string(DEFAULT_OUTPUT_KEY);
    output_key_.reset();

    std::unique_ptr<output_parsers::OutputParser> parser = std::move(output_parser_);
    if (!parser) {
        parser = std::make_unique<output_parsers::SimpleParser>();
    }

    auto chain = std::make_unique<LLMChain>(
        std::move(prompt_), std::move(llm_), std::move(key), std::move(parser));

    LOG_INFO("LLMChain built with output key: " + chain->output_key());
    return chain;
}

} // namespace promptchain::chains
