#pragma once

#include <string>
#include <vector>
#include <unordered_map>
#include <optional>
#include <cstddef>

namespace promptchain {

/**
 * @brief Core data structures shared by prompts, models and chains
 */

/**
 * @brief Named prompt arguments, variable name to value
 */
using PromptArgs = std::unordered_map<std::string, std::string>;

/**
 * @brief Message role types for chat conversations
 */
enum class MessageRole {
    SYSTEM,
    USER,
    ASSISTANT,
    FUNCTION,
    TOOL
};

/**
 * @brief Convert message role to string
 */
inline std::string message_role_to_string(MessageRole role) {
    switch (role) {
        case MessageRole::SYSTEM: return "system";
        case MessageRole::USER: return "user";
        case MessageRole::ASSISTANT: return "assistant";
        case MessageRole::FUNCTION: return "function";
        case MessageRole::TOOL: return "tool";
        default: return "unknown";
    }
}

/**
 * @brief Convert string to message role
 */
inline MessageRole string_to_message_role(const std::string& role_str) {
    if (role_str == "system") return MessageRole::SYSTEM;
    if (role_str == "user") return MessageRole::USER;
    if (role_str == "assistant") return MessageRole::ASSISTANT;
    if (role_str == "function") return MessageRole::FUNCTION;
    if (role_str == "tool") return MessageRole::TOOL;
    return MessageRole::USER; // Default to user
}

/**
 * @brief Chat message structure
 */
struct ChatMessage {
    MessageRole role;
    std::string content;
    std::string name; // Optional name for function/tool messages

    ChatMessage(MessageRole r, std::string c, std::string n = "")
        : role(r), content(std::move(c)), name(std::move(n)) {}

    static ChatMessage system(std::string content) {
        return ChatMessage(MessageRole::SYSTEM, std::move(content));
    }

    static ChatMessage user(std::string content) {
        return ChatMessage(MessageRole::USER, std::move(content));
    }

    static ChatMessage assistant(std::string content) {
        return ChatMessage(MessageRole::ASSISTANT, std::move(content));
    }

    bool operator==(const ChatMessage& other) const {
        return role == other.role && content == other.content && name == other.name;
    }

    bool operator!=(const ChatMessage& other) const { return !(*this == other); }
};

/**
 * @brief Token usage statistics
 */
struct TokenUsage {
    size_t prompt_tokens = 0;
    size_t completion_tokens = 0;
    size_t total_tokens = 0;

    TokenUsage() = default;
    TokenUsage(size_t prompt, size_t completion, size_t total)
        : prompt_tokens(prompt), completion_tokens(completion), total_tokens(total) {}

    bool operator==(const TokenUsage& other) const {
        return prompt_tokens == other.prompt_tokens &&
               completion_tokens == other.completion_tokens &&
               total_tokens == other.total_tokens;
    }

    bool operator!=(const TokenUsage& other) const { return !(*this == other); }
};

/**
 * @brief Result of a one-shot generation
 *
 * Everything except `generation` is metadata owned by the model client.
 */
struct GenerateResult {
    std::string generation;
    std::optional<TokenUsage> tokens;
    std::string model;
    std::unordered_map<std::string, std::string> metadata;

    GenerateResult() = default;
    explicit GenerateResult(std::string gen, std::optional<TokenUsage> usage = std::nullopt)
        : generation(std::move(gen)), tokens(std::move(usage)) {}

    bool operator==(const GenerateResult& other) const {
        return generation == other.generation && tokens == other.tokens &&
               model == other.model && metadata == other.metadata;
    }

    bool operator!=(const GenerateResult& other) const { return !(*this == other); }
};

/**
 * @brief One incremental unit of a streamed generation
 */
struct StreamData {
    std::string content;
    std::optional<TokenUsage> tokens;
    std::unordered_map<std::string, std::string> metadata;

    StreamData() = default;
    explicit StreamData(std::string c, std::optional<TokenUsage> usage = std::nullopt)
        : content(std::move(c)), tokens(std::move(usage)) {}

    bool operator==(const StreamData& other) const {
        return content == other.content && tokens == other.tokens && metadata == other.metadata;
    }

    bool operator!=(const StreamData& other) const { return !(*this == other); }
};

} // namespace promptchain
