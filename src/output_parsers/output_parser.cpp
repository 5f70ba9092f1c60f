#include "promptchain/output_parsers/output_parser.hpp"

namespace promptchain::output_parsers {

std::string SimpleParser::parse(const std::string& output) const {
    if (!trim_) {
        return output;
    }

    const char* whitespace = " \t\n\r\f\v";
    size_t first = output.find_first_not_of(whitespace);
    if (first == std::string::npos) {
        return "";
    }
    size_t last = output.find_last_not_of(whitespace);
    return output.substr(first, last - first + 1);
}

} // namespace promptchain::output_parsers
