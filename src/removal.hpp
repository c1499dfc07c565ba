#pragma once

#include <optional>
#include <string>

#include <fmt/format.h>

// Result of removing the next element from a persistent container.
// `value` is empty when the container was empty, in which case `rest`
// is the container itself.
template <typename T, typename Rest>
struct Removal {
    std::optional<T> value;
    Rest rest;
};

template <typename T>
std::string show_option(const std::optional<T>& value) {
    if (!value.has_value())
        return "None";
    return fmt::format("Some({})", *value);
}
