#pragma once
// cmdbench - Parameter sweep expansion

#include "types.hpp"
#include <string>
#include <vector>

// A named parameter and the values to sweep it over
struct ParameterList {
    std::string name;
    std::vector<std::string> values;
};

// Parse "NAME=V1,V2,..." into a ParameterList.
// Values are split with tokenize(), so "\," and "\\" escape.
// Throws std::invalid_argument if '=' is missing or NAME is empty.
ParameterList parse_parameter_list(const std::string& text);

// Replace every "{name}" in command with value
std::string substitute_parameter(const std::string& command,
                                 const std::string& name,
                                 const std::string& value);

// One BenchmarkCommand per (value, command) pair, value-major.
// With a null list, the commands are passed through without a parameter.
std::vector<BenchmarkCommand> expand_commands(const std::vector<std::string>& commands,
                                              const ParameterList* list);
