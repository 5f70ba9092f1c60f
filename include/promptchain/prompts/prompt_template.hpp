#pragma once

#include "../core/types.hpp"
#include <string>
#include <vector>
#include <variant>

namespace promptchain::prompts {

/**
 * @brief A rendered prompt, ready to be sent to a chat model
 */
class PromptValue {
private:
    std::vector<ChatMessage> messages_;

public:
    PromptValue() = default;
    explicit PromptValue(std::vector<ChatMessage> messages) : messages_(std::move(messages)) {}

    const std::vector<ChatMessage>& to_chat_messages() const { return messages_; }

    /**
     * @brief One "[role]: content" line per message
     */
    std::string to_string() const;
};

/**
 * @brief Capability of turning named arguments into a rendered prompt
 */
class FormatPrompter {
public:
    virtual ~FormatPrompter() = default;

    /**
     * @brief Variables this prompter consumes, in a stable order
     */
    virtual std::vector<std::string> get_input_variables() const = 0;

    /**
     * @brief Render the prompt
     * @throws PromptException if a required variable is missing
     */
    virtual PromptValue format_prompt(const PromptArgs& args) const = 0;
};

/**
 * @brief Simple string prompt template with {variable} substitution
 *
 * format_prompt renders the template as a single user message.
 */
class PromptTemplate : public FormatPrompter {
private:
    std::string template_str_;
    std::vector<std::string> input_variables_;

public:
    PromptTemplate(
        const std::string& template_str,
        const std::vector<std::string>& input_variables = {}
    );

    std::string format(const PromptArgs& variables) const;
    std::vector<std::string> get_input_variables() const override { return input_variables_; }
    PromptValue format_prompt(const PromptArgs& args) const override;

    const std::string& template_string() const { return template_str_; }

    // Extract variables from template string, in order of first appearance
    static std::vector<std::string> extract_variables(const std::string& template_str);
    // Validate every template variable is declared
    static void validate_template(const std::string& template_str, const std::vector<std::string>& variables);
};

/**
 * @brief A templated message bound to a chat role
 */
class MessageTemplate {
private:
    MessageRole role_;
    PromptTemplate template_;

public:
    MessageTemplate(MessageRole role, PromptTemplate prompt_template)
        : role_(role), template_(std::move(prompt_template)) {}

    static MessageTemplate system(const std::string& template_str) {
        return MessageTemplate(MessageRole::SYSTEM, PromptTemplate(template_str));
    }

    static MessageTemplate user(const std::string& template_str) {
        return MessageTemplate(MessageRole::USER, PromptTemplate(template_str));
    }

    static MessageTemplate assistant(const std::string& template_str) {
        return MessageTemplate(MessageRole::ASSISTANT, PromptTemplate(template_str));
    }

    MessageRole role() const { return role_; }
    const PromptTemplate& prompt_template() const { return template_; }

    ChatMessage format(const PromptArgs& args) const {
        return ChatMessage(role_, template_.format(args));
    }
};

/**
 * @brief Chat prompt made of fixed messages and message templates
 */
class ChatPromptTemplate : public FormatPrompter {
public:
    using Entry = std::variant<ChatMessage, MessageTemplate>;

private:
    std::vector<Entry> entries_;
    std::vector<std::string> input_variables_;

    void collect_variables(const Entry& entry);

public:
    ChatPromptTemplate() = default;
    explicit ChatPromptTemplate(const std::vector<Entry>& entries);

    ChatPromptTemplate& add_message(const ChatMessage& message);
    ChatPromptTemplate& add_template(const MessageTemplate& message_template);

    std::vector<std::string> get_input_variables() const override { return input_variables_; }
    PromptValue format_prompt(const PromptArgs& args) const override;

    size_t size() const { return entries_.size(); }
};

} // namespace promptchain::prompts
