#include "promptchain/promptchain.hpp"
#include <cctype>
#include <iostream>
#include <memory>
#include <string>

using namespace promptchain;

namespace {

// Upper-cases the reply, to show call() applying a parser and invoke() not
class ShoutingParser : public output_parsers::OutputParser {
public:
    std::string parse(const std::string& output) const override {
        std::string result = output;
        for (auto& c : result) {
            c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
        return result;
    }
};

} // namespace

int main() {
    utils::Logger::get_instance().configure_from_env();

    std::cout << "=== promptchain LLM Chain Example ===" << std::endl;

    try {
        // 1. A chat prompt with a system message and a templated user message
        auto prompt = std::make_unique<prompts::ChatPromptTemplate>();
        prompt->add_message(ChatMessage::system("You are a helpful assistant."))
              .add_template(prompts::MessageTemplate::user("Mi nombre es: {nombre}"));

        // 2. An echoing fake model; call options cap the reply length
        auto llm = std::make_unique<llm::FakeLLM>();

        chains::ChainCallOptions options;
        options.with_temperature(0.2).with_max_length(64);

        auto chain = chains::LLMChainBuilder()
            .prompt(std::move(prompt))
            .llm(std::move(llm))
            .options(options)
            .output_parser(std::make_unique<ShoutingParser>())
            .build();

        PromptArgs args{{"nombre", "luis"}};

        std::cout << "\n=== invoke ===" << std::endl;
        std::cout << chain->invoke(args) << std::endl;

        std::cout << "\n=== call ===" << std::endl;
        auto result = chain->call(args);
        std::cout << result.generation << std::endl;
        if (result.tokens) {
            std::cout << "Token usage: " << result.tokens->prompt_tokens << " prompt, "
                      << result.tokens->completion_tokens << " completion tokens" << std::endl;
        }

        std::cout << "\n=== stream ===" << std::endl;
        auto stream = chain->stream(args);
        while (auto item = stream->next()) {
            std::cout << "[" << item->content << "]";
        }
        std::cout << std::endl;

        std::cout << "\n=== missing input ===" << std::endl;
        try {
            chain->invoke({});
        } catch (const ChainException& e) {
            std::cout << e.error_code() << ": " << e.what() << std::endl;
        }

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
