#include "promptchain/prompts/prompt_template.hpp"
#include "promptchain/core/base.hpp"
#include <algorithm>
#include <regex>
#include <sstream>

namespace promptchain::prompts {

std::string PromptValue::to_string() const {
    std::stringstream result;

    for (size_t i = 0; i < messages_.size(); ++i) {
        if (i > 0) result << "\n";
        result << "[" << message_role_to_string(messages_[i].role) << "]: " << messages_[i].content;
    }

    return result.str();
}

// PromptTemplate implementation
PromptTemplate::PromptTemplate(
    const std::string& template_str,
    const std::vector<std::string>& input_variables
) : template_str_(template_str), input_variables_(input_variables) {

    if (input_variables_.empty()) {
        input_variables_ = extract_variables(template_str_);
    }

    PromptTemplate::validate_template(template_str_, input_variables_);
}

std::string PromptTemplate::format(const PromptArgs& variables) const {
    for (const auto& var : input_variables_) {
        if (variables.find(var) == variables.end()) {
            throw PromptException("Missing value for variable: " + var);
        }
    }

    // Scan the template only, so substituted values are never re-expanded
    std::string result;
    result.reserve(template_str_.size());

    size_t pos = 0;
    while (pos < template_str_.size()) {
        size_t open = template_str_.find('{', pos);
        if (open == std::string::npos) {
            break;
        }

        size_t close = template_str_.find_first_of("{}", open + 1);
        if (close == std::string::npos) {
            break;
        }
        if (template_str_[close] == '{') {
            // Unmatched brace, copied as text
            result.append(template_str_, pos, close - pos);
            pos = close;
            continue;
        }

        std::string name = template_str_.substr(open + 1, close - open - 1);
        result.append(template_str_, pos, open - pos);

        bool declared = std::find(input_variables_.begin(), input_variables_.end(), name) != input_variables_.end();
        if (declared) {
            result += variables.at(name);
        } else {
            result.append(template_str_, open, close - open + 1);
        }
        pos = close + 1;
    }

    if (pos < template_str_.size()) {
        result.append(template_str_, pos, std::string::npos);
    }

    return result;
}

PromptValue PromptTemplate::format_prompt(const PromptArgs& args) const {
    return PromptValue({ChatMessage::user(format(args))});
}

std::vector<std::string> PromptTemplate::extract_variables(const std::string& template_str) {
    std::vector<std::string> variables;
    static const std::regex variable_regex(R"(\{([^{}]+)\})");
    std::smatch match;

    std::string str = template_str;
    while (std::regex_search(str, match, variable_regex)) {
        std::string var = match[1].str();
        if (std::find(variables.begin(), variables.end(), var) == variables.end()) {
            variables.push_back(var);
        }
        str = match.suffix();
    }

    return variables;
}

void PromptTemplate::validate_template(const std::string& template_str, const std::vector<std::string>& variables) {
    std::vector<std::string> found_vars = extract_variables(template_str);

    for (const auto& var : found_vars) {
        if (std::find(variables.begin(), variables.end(), var) == variables.end()) {
            throw PromptException("Variable found in template but not in input_variables: " + var);
        }
    }
}

// ChatPromptTemplate implementation
ChatPromptTemplate::ChatPromptTemplate(const std::vector<Entry>& entries) {
    for (const auto& entry : entries) {
        entries_.push_back(entry);
        collect_variables(entry);
    }
}

ChatPromptTemplate& ChatPromptTemplate::add_message(const ChatMessage& message) {
    entries_.emplace_back(message);
    return *this;
}

ChatPromptTemplate& ChatPromptTemplate::add_template(const MessageTemplate& message_template) {
    entries_.emplace_back(message_template);
    collect_variables(entries_.back());
    return *this;
}

void ChatPromptTemplate::collect_variables(const Entry& entry) {
    const auto* message_template = std::get_if<MessageTemplate>(&entry);
    if (!message_template) {
        return;
    }

    for (const auto& var : message_template->prompt_template().get_input_variables()) {
        if (std::find(input_variables_.begin(), input_variables_.end(), var) == input_variables_.end()) {
            input_variables_.push_back(var);
        }
    }
}

PromptValue ChatPromptTemplate::format_prompt(const PromptArgs& args) const {
    std::vector<ChatMessage> messages;
    messages.reserve(entries_.size());

    for (const auto& entry : entries_) {
        if (const auto* message = std::get_if<ChatMessage>(&entry)) {
            messages.push_back(*message);
        } else {
            messages.push_back(std::get<MessageTemplate>(entry).format(args));
        }
    }

    return PromptValue(std::move(messages));
}

} // namespace promptchain::prompts
