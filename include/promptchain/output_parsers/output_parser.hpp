#pragma once

#include "../core/base.hpp"
#include <string>

namespace promptchain::output_parsers {

/**
 * @brief Capability of post-processing raw model output
 */
class OutputParser {
public:
    virtual ~OutputParser() = default;

    /**
     * @brief Transform a raw generation
     * @throws OutputParserException if the output cannot be parsed
     */
    virtual std::string parse(const std::string& output) const = 0;
};

/**
 * @brief Pass-through parser
 *
 * Returns its input unchanged unless trimming is enabled. Never throws.
 */
class SimpleParser : public OutputParser {
private:
    bool trim_ = false;

public:
    SimpleParser() = default;

    SimpleParser& with_trim(bool trim) {
        trim_ = trim;
        return *this;
    }

    bool trims() const { return trim_; }

    std::string parse(const std::string& output) const override;
};

} // namespace promptchain::output_parsers
