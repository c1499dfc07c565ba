#pragma once

#include "persistent_list.hpp"
#include "removal.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>

#include <fmt/format.h>

// Two-list queue. `front_` holds the next elements to dequeue in order,
// `rear_` holds recently enqueued elements newest first, so the logical
// content is front_ ++ reverse(rear_) and size_ == |front_| + |rear_|.
//
// Enqueue only ever prepends to `rear_`. Dequeue reverses `rear_` into a new
// `front_` when `front_` has run dry; every element is reversed at most once
// between its enqueue and its dequeue, which makes both operations amortized
// O(1). Peeking never stores a reversal.
template <typename T>
class AmortizedQueue {
public:
    using size_type = std::size_t;

    static AmortizedQueue create() {
        return AmortizedQueue(PersistentList<T>(), PersistentList<T>(), 0);
    }

    static AmortizedQueue of(std::initializer_list<T> values) {
        PersistentList<T> front = PersistentList<T>::of(values);
        size_type size = front.size();
        return AmortizedQueue(std::move(front), PersistentList<T>(), size);
    }

    template <typename InputIt>
    static AmortizedQueue from(InputIt first, InputIt last) {
        PersistentList<T> front = PersistentList<T>::from(first, last);
        size_type size = front.size();
        return AmortizedQueue(std::move(front), PersistentList<T>(), size);
    }

    AmortizedQueue enqueue(const T& value) const {
        return AmortizedQueue(front_, rear_.prepend(value), size_ + 1);
    }

    AmortizedQueue enqueue(T&& value) const {
        return AmortizedQueue(front_, rear_.prepend(std::move(value)), size_ + 1);
    }

    Removal<T, AmortizedQueue> dequeue() const {
        if (front_.empty() && rear_.empty())
            return {std::nullopt, *this};
        if (front_.empty()) {
            PersistentList<T> reversed = rear_.reverse();
            return {reversed.front(), AmortizedQueue(reversed.tail(), PersistentList<T>(), size_ - 1)};
        }
        return {front_.front(), AmortizedQueue(front_.tail(), rear_, size_ - 1)};
    }

    std::optional<T> peek_front() const {
        if (!front_.empty())
            return front_.front();
        return rear_.last_option();
    }

    std::optional<T> peek_back() const {
        if (!rear_.empty())
            return rear_.front();
        return front_.last_option();
    }

    size_type size() const { return size_; }

    bool empty() const { return front_.empty() && rear_.empty(); }

    const PersistentList<T>& front_list() const { return front_; }

    const PersistentList<T>& rear_list() const { return rear_; }

    PersistentList<T> to_list() const { return front_.concat(rear_.reverse()); }

    // The rear group is printed in enqueue order.
    std::string to_string() const {
        PersistentList<T> arrivals = rear_.reverse();
        return fmt::format("front -> ({}) ({}) <- rear", fmt::join(front_, ", "), fmt::join(arrivals, ", "));
    }

    friend bool operator==(const AmortizedQueue& lhs, const AmortizedQueue& rhs) {
        return lhs.size_ == rhs.size_ && lhs.to_list() == rhs.to_list();
    }

    friend bool operator!=(const AmortizedQueue& lhs, const AmortizedQueue& rhs) {
        return !(lhs == rhs);
    }

private:
    PersistentList<T> front_;
    PersistentList<T> rear_;
    size_type size_;

    AmortizedQueue(PersistentList<T> front, PersistentList<T> rear, size_type size)
        : front_(std::move(front)), rear_(std::move(rear)), size_(size) {}
};

template <typename T>
struct fmt::formatter<AmortizedQueue<T>> : fmt::formatter<std::string> {
    auto format(const AmortizedQueue<T>& queue, fmt::format_context& ctx) const {
        return formatter<std::string>::format(queue.to_string(), ctx);
    }
};
