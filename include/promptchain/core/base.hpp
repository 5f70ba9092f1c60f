#pragma once

#include "types.hpp"
#include <string>
#include <exception>

namespace promptchain {

/**
 * @brief Exception hierarchy for promptchain
 *
 * Collaborators (formatters, models, parsers) throw their own exception
 * types. Chains re-type them into the closed ChainException family.
 */

/**
 * @brief Base exception class for promptchain
 */
class PromptChainException : public std::exception {
private:
    std::string message_;
    std::string error_code_;

public:
    PromptChainException(const std::string& message, const std::string& error_code = "")
        : message_(message), error_code_(error_code) {}

    const char* what() const noexcept override {
        return message_.c_str();
    }

    const std::string& error_code() const noexcept {
        return error_code_;
    }
};

/**
 * @brief Prompt formatting exception
 */
class PromptException : public PromptChainException {
public:
    explicit PromptException(const std::string& message)
        : PromptChainException(message, "PROMPT_ERROR") {}
};

/**
 * @brief LLM exception
 */
class LLMException : public PromptChainException {
public:
    explicit LLMException(const std::string& message)
        : PromptChainException(message, "LLM_ERROR") {}
};

/**
 * @brief Output parser exception
 */
class OutputParserException : public PromptChainException {
public:
    explicit OutputParserException(const std::string& message)
        : PromptChainException(message, "PARSER_ERROR") {}
};

/**
 * @brief Kinds of failure a chain reports
 */
enum class ChainErrorKind {
    MISSING_OBJECT,
    MISSING_INPUT,
    FORMAT,
    MODEL,
    PARSE
};

inline std::string chain_error_kind_to_string(ChainErrorKind kind) {
    switch (kind) {
        case ChainErrorKind::MISSING_OBJECT: return "MISSING_OBJECT";
        case ChainErrorKind::MISSING_INPUT: return "MISSING_INPUT";
        case ChainErrorKind::FORMAT: return "FORMAT_ERROR";
        case ChainErrorKind::MODEL: return "MODEL_ERROR";
        case ChainErrorKind::PARSE: return "PARSE_ERROR";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Base class of every error a chain throws
 */
class ChainException : public PromptChainException {
private:
    ChainErrorKind kind_;

public:
    ChainException(ChainErrorKind kind, const std::string& message)
        : PromptChainException(message, chain_error_kind_to_string(kind)), kind_(kind) {}

    ChainErrorKind kind() const noexcept { return kind_; }
};

/**
 * @brief Required wiring absent at build time
 */
class MissingObjectError : public ChainException {
public:
    explicit MissingObjectError(const std::string& which)
        : ChainException(ChainErrorKind::MISSING_OBJECT, which) {}
};

/**
 * @brief Caller arguments lack a variable the chain requires
 */
class MissingInputError : public ChainException {
private:
    std::string key_;

public:
    explicit MissingInputError(const std::string& key)
        : ChainException(ChainErrorKind::MISSING_INPUT, "Missing required input key: " + key),
          key_(key) {}

    const std::string& key() const noexcept { return key_; }
};

class FormatError : public ChainException {
public:
    explicit FormatError(const std::string& message)
        : ChainException(ChainErrorKind::FORMAT, message) {}
};

class ModelError : public ChainException {
public:
    explicit ModelError(const std::string& message)
        : ChainException(ChainErrorKind::MODEL, message) {}
};

class ParseError : public ChainException {
public:
    explicit ParseError(const std::string& message)
        : ChainException(ChainErrorKind::PARSE, message) {}
};

} // namespace promptchain
