#pragma once

#include "persistent_list.hpp"
#include "removal.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

template <typename T>
class PersistentStack {
public:
    using size_type = std::size_t;

    static PersistentStack create() { return PersistentStack(PersistentList<T>()); }

    // The first value ends up on top.
    static PersistentStack of(std::initializer_list<T> values) {
        return PersistentStack(PersistentList<T>::of(values));
    }

    PersistentStack push(const T& value) const { return PersistentStack(elements_.prepend(value)); }

    PersistentStack push(T&& value) const { return PersistentStack(elements_.prepend(std::move(value))); }

    Removal<T, PersistentStack> pop() const {
        if (elements_.empty())
            return {std::nullopt, *this};
        return {elements_.front(), PersistentStack(elements_.tail())};
    }

    std::optional<T> peek() const { return elements_.head_option(); }

    size_type size() const { return elements_.size(); }

    bool empty() const { return elements_.empty(); }

    std::string to_string() const {
        return fmt::format("top -> ({})", fmt::join(elements_, ", "));
    }

    friend bool operator==(const PersistentStack& lhs, const PersistentStack& rhs) {
        return lhs.elements_ == rhs.elements_;
    }

    friend bool operator!=(const PersistentStack& lhs, const PersistentStack& rhs) {
        return !(lhs == rhs);
    }

private:
    PersistentList<T> elements_;

    explicit PersistentStack(PersistentList<T> elements) : elements_(std::move(elements)) {}
};

template <typename T>
struct fmt::formatter<PersistentStack<T>> : fmt::formatter<std::string> {
    auto format(const PersistentStack<T>& stack, fmt::format_context& ctx) const {
        return formatter<std::string>::format(stack.to_string(), ctx);
    }
};
