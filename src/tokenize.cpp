// cmdbench - Parameter value tokenizer implementation

#include "tokenize.hpp"
#include <utility>

std::vector<std::string> tokenize(const std::string& values) {
    std::vector<std::string> tokens;
    std::string buf;

    for (size_t i = 0; i < values.size(); ++i) {
        char c = values[i];
        if (c == '\\') {
            if (i + 1 >= values.size()) {
                // Trailing backslash
                buf.push_back('\\');
                continue;
            }
            char next = values[++i];
            if (next == ',' || next == '\\') {
                buf.push_back(next);
            } else {
                buf.push_back('\\');
                buf.push_back(next);
            }
        } else if (c == ',') {
            tokens.push_back(std::move(buf));
            buf.clear();
        } else {
            buf.push_back(c);
        }
    }

    tokens.push_back(std::move(buf));
    return tokens;
}
