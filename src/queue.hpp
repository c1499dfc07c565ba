#ifndef QUEUE_HPP
#define QUEUE_HPP

#include "amortized_queue.hpp"
#include "naive_queue.hpp"
#include "persistent_list.hpp"
#include "removal.hpp"

#include <cstddef>
#include <initializer_list>
#include <optional>
#include <string>
#include <utility>
#include <variant>

#include <fmt/format.h>

enum class QueueStrategy { Naive, Amortized };

inline const char* strategy_name(QueueStrategy strategy) {
    switch (strategy) {
        case QueueStrategy::Naive: return "naive";
        case QueueStrategy::Amortized: return "amortized";
    }
    return "unknown";
}

// A persistent queue whose strategy is picked at runtime. Every operation
// returns a queue of the same strategy as the receiver.
template <typename T>
class Queue {
public:
    using size_type = std::size_t;

    static Queue create(QueueStrategy strategy) {
        if (strategy == QueueStrategy::Naive)
            return Queue(NaiveQueue<T>::create());
        return Queue(AmortizedQueue<T>::create());
    }

    static Queue of(QueueStrategy strategy, std::initializer_list<T> values) {
        if (strategy == QueueStrategy::Naive)
            return Queue(NaiveQueue<T>::of(values));
        return Queue(AmortizedQueue<T>::of(values));
    }

    static Queue wrap(NaiveQueue<T> queue) { return Queue(std::move(queue)); }

    static Queue wrap(AmortizedQueue<T> queue) { return Queue(std::move(queue)); }

    QueueStrategy strategy() const {
        return std::holds_alternative<NaiveQueue<T>>(impl_) ? QueueStrategy::Naive : QueueStrategy::Amortized;
    }

    Queue enqueue(const T& value) const {
        return std::visit([&value](const auto& queue) { return Queue(queue.enqueue(value)); }, impl_);
    }

    Queue enqueue(T&& value) const {
        return std::visit([&value](const auto& queue) { return Queue(queue.enqueue(std::move(value))); }, impl_);
    }

    Removal<T, Queue> dequeue() const {
        return std::visit(
            [](const auto& queue) {
                auto removed = queue.dequeue();
                return Removal<T, Queue>{std::move(removed.value), Queue(std::move(removed.rest))};
            },
            impl_);
    }

    std::optional<T> peek_front() const {
        return std::visit([](const auto& queue) { return queue.peek_front(); }, impl_);
    }

    std::optional<T> peek_back() const {
        return std::visit([](const auto& queue) { return queue.peek_back(); }, impl_);
    }

    size_type size() const {
        return std::visit([](const auto& queue) { return queue.size(); }, impl_);
    }

    bool empty() const {
        return std::visit([](const auto& queue) { return queue.empty(); }, impl_);
    }

    PersistentList<T> to_list() const {
        return std::visit([](const auto& queue) { return PersistentList<T>(queue.to_list()); }, impl_);
    }

    std::string to_string() const {
        return std::visit([](const auto& queue) { return queue.to_string(); }, impl_);
    }

    // Compares content only; queues of different strategies can be equal.
    friend bool operator==(const Queue& lhs, const Queue& rhs) {
        return lhs.size() == rhs.size() && lhs.to_list() == rhs.to_list();
    }

    friend bool operator!=(const Queue& lhs, const Queue& rhs) {
        return !(lhs == rhs);
    }

private:
    std::variant<NaiveQueue<T>, AmortizedQueue<T>> impl_;

    explicit Queue(NaiveQueue<T> queue) : impl_(std::move(queue)) {}
    explicit Queue(AmortizedQueue<T> queue) : impl_(std::move(queue)) {}
};

template <typename T>
struct fmt::formatter<Queue<T>> : fmt::formatter<std::string> {
    auto format(const Queue<T>& queue, fmt::format_context& ctx) const {
        return formatter<std::string>::format(queue.to_string(), ctx);
    }
};

#endif
