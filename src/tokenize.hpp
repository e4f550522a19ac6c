#pragma once
// cmdbench - Parameter value tokenizer

#include <string>
#include <vector>

// Split a comma-separated value list into tokens.
// "\," yields a literal comma and "\\" a literal backslash; any other
// backslash sequence is kept verbatim. Always returns at least one token,
// the count being the number of unescaped commas plus one.
std::vector<std::string> tokenize(const std::string& values);
