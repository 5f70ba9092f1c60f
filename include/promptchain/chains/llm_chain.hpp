#pragma once

#include "base_chain.hpp"
#include "options.hpp"
#include "../llm/base_llm.hpp"
#include "../prompts/prompt_template.hpp"
#include "../output_parsers/output_parser.hpp"
#include <string>
#include <vector>
#include <memory>
#include <optional>

namespace promptchain::chains {

inline constexpr const char* DEFAULT_OUTPUT_KEY = "output";

/**
 * @brief Chain that renders a prompt, sends it to an LLM and parses the reply
 *
 * Owns its prompter, model and parser exclusively. Use LLMChainBuilder to
 * construct one.
 */
class LLMChain : public BaseChain {
public:
    LLMChain(
        std::unique_ptr<prompts::FormatPrompter> prompt,
        std::unique_ptr<llm::BaseLLM> llm,
        std::string output_key,
        std::unique_ptr<output_parsers::OutputParser> output_parser
    );

    // BaseChain interface
    std::vector<std::string> get_input_keys() const override;
    std::vector<std::string> get_output_keys() const override;

    GenerateResult call(
        const PromptArgs& args,
        const utils::CancellationToken& token = {}
    ) const override;

    /**
     * @brief Raw generation; the output parser is not applied
     */
    std::string invoke(
        const PromptArgs& args,
        const utils::CancellationToken& token = {}
    ) const override;

    /**
     * @brief Raw incremental output; the output parser is not applied
     */
    std::unique_ptr<ChainStream> stream(
        const PromptArgs& args,
        const utils::CancellationToken& token = {}
    ) const override;

    const std::string& output_key() const { return output_key_; }

private:
    std::unique_ptr<prompts::FormatPrompter> prompt_;
    std::unique_ptr<llm::BaseLLM> llm_;
    std::string output_key_;
    std::unique_ptr<output_parsers::OutputParser> output_parser_;

    std::vector<ChatMessage> render_messages(const PromptArgs& args) const;
    GenerateResult generate(const std::vector<ChatMessage>& messages,
                            const utils::CancellationToken& token) const;
};

/**
 * @brief Accumulates the parts of an LLMChain and validates the wiring
 *
 * Single use: build() moves the parts out of the builder.
 */
class LLMChainBuilder {
public:
    LLMChainBuilder() = default;

    LLMChainBuilder& prompt(std::unique_ptr<prompts::FormatPrompter> prompt);
    LLMChainBuilder& llm(std::unique_ptr<llm::BaseLLM> llm);
    LLMChainBuilder& output_key(std::string output_key);
    LLMChainBuilder& options(ChainCallOptions options);
    LLMChainBuilder& output_parser(std::unique_ptr<output_parsers::OutputParser> output_parser);

    /**
     * @throws MissingObjectError if the prompt or the LLM is missing
     * @throws std::invalid_argument if the options are out of range
     */
    std::unique_ptr<LLMChain> build();

private:
    std::unique_ptr<prompts::FormatPrompter> prompt_;
    std::unique_ptr<llm::BaseLLM> llm_;
    std::optional<std::string> output_key_;
    std::optional<ChainCallOptions> options_;
    std::unique_ptr<output_parsers::OutputParser> output_parser_;
};

} // namespace promptchain::chains
