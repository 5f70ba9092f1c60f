#include "promptchain/core/types.hpp"
#include "promptchain/core/base.hpp"
#include "promptchain/chains/options.hpp"
#include "promptchain/utils/cancellation.hpp"
#include <catch2/catch.hpp>
#include <chrono>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace promptchain;

TEST_CASE("Core types - Message roles", "[core][types]") {
    SECTION("Round trip through strings") {
        for (auto role : {MessageRole::SYSTEM, MessageRole::USER, MessageRole::ASSISTANT,
                          MessageRole::FUNCTION, MessageRole::TOOL}) {
            REQUIRE(string_to_message_role(message_role_to_string(role)) == role);
        }
    }

    SECTION("Unknown role string defaults to user") {
        REQUIRE(string_to_message_role("narrator") == MessageRole::USER);
    }
}

TEST_CASE("Core types - ChatMessage", "[core][types]") {
    auto msg = ChatMessage::system("You are helpful.");
    REQUIRE(msg.role == MessageRole::SYSTEM);
    REQUIRE(msg.content == "You are helpful.");
    REQUIRE(msg.name.empty());

    REQUIRE(ChatMessage::user("hi") == ChatMessage(MessageRole::USER, "hi"));
    REQUIRE(ChatMessage::user("hi") != ChatMessage::assistant("hi"));
    REQUIRE(ChatMessage(MessageRole::TOOL, "out", "search") != ChatMessage(MessageRole::TOOL, "out"));
}

TEST_CASE("Core types - Results", "[core][types]") {
    SECTION("GenerateResult") {
        GenerateResult result("Hola", TokenUsage(10, 2, 12));
        REQUIRE(result.generation == "Hola");
        REQUIRE(result.tokens == TokenUsage(10, 2, 12));
        REQUIRE(result.model.empty());

        GenerateResult bare("Hola");
        REQUIRE_FALSE(bare.tokens.has_value());
        REQUIRE(bare != result);
    }

    SECTION("StreamData") {
        StreamData chunk("Ho");
        REQUIRE(chunk.content == "Ho");
        REQUIRE_FALSE(chunk.tokens.has_value());
        REQUIRE(chunk == StreamData("Ho"));

        chunk.metadata["finish_reason"] = "stop";
        REQUIRE(chunk != StreamData("Ho"));
    }
}

TEST_CASE("Core types - Chain errors", "[core][errors]") {
    SECTION("Error codes follow the kind") {
        REQUIRE(MissingObjectError("Prompt must be set").error_code() == "MISSING_OBJECT");
        REQUIRE(MissingInputError("nombre").error_code() == "MISSING_INPUT");
        REQUIRE(FormatError("bad").error_code() == "FORMAT_ERROR");
        REQUIRE(ModelError("down").error_code() == "MODEL_ERROR");
        REQUIRE(ParseError("junk").error_code() == "PARSE_ERROR");
    }

    SECTION("Kinds") {
        REQUIRE(FormatError("x").kind() == ChainErrorKind::FORMAT);
        REQUIRE(ModelError("x").kind() == ChainErrorKind::MODEL);
        REQUIRE(ParseError("x").kind() == ChainErrorKind::PARSE);
    }

    SECTION("Missing input names the key") {
        MissingInputError error("nombre");
        REQUIRE(error.key() == "nombre");
        REQUIRE(std::string(error.what()) == "Missing required input key: nombre");
    }

    SECTION("Chain errors are catchable as the common bases") {
        REQUIRE_THROWS_AS(throw ModelError("x"), ChainException);
        REQUIRE_THROWS_AS(throw ParseError("x"), PromptChainException);
        REQUIRE_THROWS_AS(throw MissingObjectError("x"), std::exception);
    }

    SECTION("Collaborator exceptions carry their own codes") {
        REQUIRE(PromptException("x").error_code() == "PROMPT_ERROR");
        REQUIRE(LLMException("x").error_code() == "LLM_ERROR");
        REQUIRE(OutputParserException("x").error_code() == "PARSER_ERROR");
    }
}

TEST_CASE("Cancellation", "[utils][cancellation]") {
    SECTION("Default token is never cancelled") {
        utils::CancellationToken token;
        REQUIRE_FALSE(token.can_be_cancelled());
        REQUIRE_FALSE(token.is_cancelled());
    }

    SECTION("Tokens observe their source") {
        utils::CancellationSource source;
        auto token = source.token();
        auto copy = token;

        REQUIRE(token.can_be_cancelled());
        REQUIRE_FALSE(token.is_cancelled());

        source.cancel();
        REQUIRE(source.is_cancelled());
        REQUIRE(token.is_cancelled());
        REQUIRE(copy.is_cancelled());
    }

    SECTION("Cancellation is visible across threads") {
        utils::CancellationSource source;
        auto token = source.token();

        std::thread canceller([&source]() { source.cancel(); });
        canceller.join();

        REQUIRE(token.is_cancelled());
    }

    SECTION("Token outlives its source") {
        utils::CancellationToken token;
        {
            utils::CancellationSource source;
            token = source.token();
            source.cancel();
        }
        REQUIRE(token.is_cancelled());
    }
}

TEST_CASE("ChainCallOptions", "[chains][options]") {
    using chains::ChainCallOptions;

    SECTION("Conversion keeps every field") {
        int calls = 0;
        ChainCallOptions options;
        options.with_max_tokens(128)
               .with_temperature(0.3)
               .with_stop_words({"END"})
               .with_top_k(20)
               .with_top_p(0.8)
               .with_seed(42)
               .with_min_length(1)
               .with_max_length(64)
               .with_repetition_penalty(1.1)
               .with_timeout(std::chrono::milliseconds(5000))
               .with_streaming_func([&calls](const std::string&) { ++calls; });

        auto llm_options = ChainCallOptions::to_llm_options(options);

        REQUIRE(llm_options.max_tokens == size_t(128));
        REQUIRE(*llm_options.temperature == Catch::Detail::Approx(0.3));
        REQUIRE(llm_options.stop_words == std::vector<std::string>{"END"});
        REQUIRE(llm_options.top_k == size_t(20));
        REQUIRE(*llm_options.top_p == Catch::Detail::Approx(0.8));
        REQUIRE(llm_options.seed == uint64_t(42));
        REQUIRE(llm_options.min_length == size_t(1));
        REQUIRE(llm_options.max_length == size_t(64));
        REQUIRE(*llm_options.repetition_penalty == Catch::Detail::Approx(1.1));
        REQUIRE(llm_options.timeout == std::chrono::milliseconds(5000));

        REQUIRE(llm_options.streaming_func);
        llm_options.streaming_func("chunk");
        REQUIRE(calls == 1);
    }

    SECTION("Unset fields stay unset") {
        auto llm_options = ChainCallOptions::to_llm_options(ChainCallOptions{});

        REQUIRE_FALSE(llm_options.max_tokens.has_value());
        REQUIRE_FALSE(llm_options.temperature.has_value());
        REQUIRE_FALSE(llm_options.stop_words.has_value());
        REQUIRE_FALSE(llm_options.timeout.has_value());
        REQUIRE_FALSE(llm_options.streaming_func);
    }

    SECTION("Validation") {
        ChainCallOptions options;
        REQUIRE_NOTHROW(options.validate());

        options.with_temperature(3.0);
        REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);

        options.with_temperature(0.5).with_top_k(0);
        REQUIRE_THROWS_AS(options.validate(), std::invalid_argument);
    }
}
