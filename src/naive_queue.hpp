#pragma once

#include "persistent_list.hpp"
#include "removal.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

// Single-list queue. Enqueue copies the whole spine, so it is linear in the
// queue's size; it serves as the reference behaviour for AmortizedQueue.
template <typename T>
class NaiveQueue {
public:
    using size_type = std::size_t;

    static NaiveQueue create() { return NaiveQueue(PersistentList<T>()); }

    static NaiveQueue of(std::initializer_list<T> values) {
        return NaiveQueue(PersistentList<T>::of(values));
    }

    template <typename InputIt>
    static NaiveQueue from(InputIt first, InputIt last) {
        return NaiveQueue(PersistentList<T>::from(first, last));
    }

    NaiveQueue enqueue(const T& value) const { return NaiveQueue(elements_.append(value)); }

    NaiveQueue enqueue(T&& value) const { return NaiveQueue(elements_.append(std::move(value))); }

    Removal<T, NaiveQueue> dequeue() const {
        if (elements_.empty())
            return {std::nullopt, *this};
        return {elements_.front(), NaiveQueue(elements_.tail())};
    }

    std::optional<T> peek_front() const { return elements_.head_option(); }

    std::optional<T> peek_back() const { return elements_.last_option(); }

    size_type size() const { return elements_.size(); }

    bool empty() const { return elements_.empty(); }

    const PersistentList<T>& to_list() const { return elements_; }

    std::string to_string() const {
        return fmt::format("front -> ({})", fmt::join(elements_, ", "));
    }

    friend bool operator==(const NaiveQueue& lhs, const NaiveQueue& rhs) {
        return lhs.elements_ == rhs.elements_;
    }

    friend bool operator!=(const NaiveQueue& lhs, const NaiveQueue& rhs) {
        return !(lhs == rhs);
    }

private:
    PersistentList<T> elements_;

    explicit NaiveQueue(PersistentList<T> elements) : elements_(std::move(elements)) {}
};

template <typename T>
struct fmt::formatter<NaiveQueue<T>> : fmt::formatter<std::string> {
    auto format(const NaiveQueue<T>& queue, fmt::format_context& ctx) const {
        return formatter<std::string>::format(queue.to_string(), ctx);
    }
};
