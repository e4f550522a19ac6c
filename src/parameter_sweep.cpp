// cmdbench - Parameter sweep expansion implementation

#include "parameter_sweep.hpp"
#include "tokenize.hpp"
#include <stdexcept>
#include <utility>

ParameterList parse_parameter_list(const std::string& text) {
    size_t eq = text.find('=');
    if (eq == std::string::npos) {
        throw std::invalid_argument("Invalid parameter list '" + text + "'. Expected NAME=V1,V2,...");
    }

    ParameterList list;
    list.name = text.substr(0, eq);
    if (list.name.empty()) {
        throw std::invalid_argument("Invalid parameter list '" + text + "'. Parameter name must not be empty");
    }
    list.values = tokenize(text.substr(eq + 1));
    return list;
}

std::string substitute_parameter(const std::string& command,
                                 const std::string& name,
                                 const std::string& value) {
    const std::string placeholder = "{" + name + "}";
    std::string out;
    out.reserve(command.size());

    size_t pos = 0;
    while (true) {
        size_t hit = command.find(placeholder, pos);
        if (hit == std::string::npos) {
            out.append(command, pos, std::string::npos);
            break;
        }
        out.append(command, pos, hit - pos);
        out += value;
        pos = hit + placeholder.size();
    }
    return out;
}

std::vector<BenchmarkCommand> expand_commands(const std::vector<std::string>& commands,
                                              const ParameterList* list) {
    std::vector<BenchmarkCommand> expanded;

    if (list == nullptr) {
        expanded.reserve(commands.size());
        for (const auto& cmd : commands) {
            expanded.push_back(BenchmarkCommand{cmd, std::nullopt});
        }
        return expanded;
    }

    expanded.reserve(commands.size() * list->values.size());
    for (const auto& value : list->values) {
        for (const auto& cmd : commands) {
            BenchmarkCommand bc;
            bc.expression = substitute_parameter(cmd, list->name, value);
            bc.parameter = ParameterValue(list->name, value);
            expanded.push_back(std::move(bc));
        }
    }
    return expanded;
}
