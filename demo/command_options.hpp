#pragma once

#include <algorithm>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

inline std::string get_command_option(
    const std::vector<std::string>& args,
    const std::string& option,
    const std::optional<std::string>& default_value = std::nullopt) {
    auto option_pointer = std::find(args.begin(), args.end(), option);
    if (option_pointer != args.end() && ++option_pointer != args.end())
        return *option_pointer;
    if (!default_value.has_value())
        throw std::invalid_argument("missing value for option " + option);
    return default_value.value();
}

inline int get_command_option_int(
    const std::vector<std::string>& args,
    const std::string& option,
    const std::optional<int>& default_value = std::nullopt) {
    std::string param;
    if (default_value.has_value())
        param = get_command_option(args, option, std::to_string(default_value.value()));
    else
        param = get_command_option(args, option);
    std::size_t consumed = 0;
    int value = std::stoi(param, &consumed, 0);
    if (consumed != param.size())
        throw std::invalid_argument("option " + option + " expects an integer, got '" + param + "'");
    return value;
}

inline bool has_command_option(const std::vector<std::string>& args, const std::string& option) {
    return std::find(args.begin(), args.end(), option) != args.end();
}

// Arguments that are neither options nor option values.
inline std::vector<std::string> get_positional_args(
    const std::vector<std::string>& args, const std::vector<std::string>& valued_options) {
    std::vector<std::string> positional;
    for (std::size_t i = 0; i < args.size(); ++i) {
        if (std::find(valued_options.begin(), valued_options.end(), args[i]) != valued_options.end()) {
            ++i;
            continue;
        }
        if (args[i].rfind("--", 0) == 0)
            continue;
        positional.push_back(args[i]);
    }
    return positional;
}
