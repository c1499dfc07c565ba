#pragma once

#include <cstddef>
#include <initializer_list>
#include <iterator>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <utility>

#include <fmt/format.h>

template <typename T>
class PersistentList {
private:
    struct Node {
        T value;
        std::shared_ptr<const Node> next;
        Node(const T& v, std::shared_ptr<const Node> n) : value(v), next(std::move(n)) {}
        Node(T&& v, std::shared_ptr<const Node> n) : value(std::move(v)), next(std::move(n)) {}
    };

    using NodePtr = std::shared_ptr<const Node>;

public:
    using value_type = T;
    using size_type = std::size_t;

    class ConstIterator {
    public:
        using iterator_category = std::forward_iterator_tag;
        using value_type = T;
        using difference_type = std::ptrdiff_t;
        using pointer = const T*;
        using reference = const T&;

        ConstIterator() : current_(nullptr) {}
        explicit ConstIterator(const Node* node) : current_(node) {}
        const T& operator*() const { return current_->value; }
        const T* operator->() const { return &current_->value; }
        ConstIterator& operator++() { current_ = current_->next.get(); return *this; }
        ConstIterator operator++(int) { ConstIterator prev = *this; ++*this; return prev; }
        bool operator==(const ConstIterator& other) const { return current_ == other.current_; }
        bool operator!=(const ConstIterator& other) const { return current_ != other.current_; }
    private:
        const Node* current_;
    };

    using const_iterator = ConstIterator;

    PersistentList() : head_(nullptr), size_(0) {}

    static PersistentList of(std::initializer_list<T> values) {
        return from(values.begin(), values.end());
    }

    template <typename InputIt>
    static PersistentList from(InputIt first, InputIt last) {
        PersistentList reversed;
        for (; first != last; ++first)
            reversed = reversed.prepend(*first);
        return reversed.reverse();
    }

    PersistentList(const PersistentList& other) = default;

    PersistentList(PersistentList&& other) noexcept
        : head_(std::move(other.head_)), size_(other.size_) {
        other.size_ = 0;
    }

    // The previous contents end up in `other` and are released by its destructor.
    PersistentList& operator=(PersistentList other) noexcept {
        swap(other);
        return *this;
    }

    ~PersistentList() { release(); }

    PersistentList prepend(const T& value) const {
        return PersistentList(std::make_shared<Node>(value, head_), size_ + 1);
    }

    PersistentList prepend(T&& value) const {
        return PersistentList(std::make_shared<Node>(std::move(value), head_), size_ + 1);
    }

    PersistentList append(const T& value) const {
        return reverse().prepend(value).reverse();
    }

    PersistentList append(T&& value) const {
        return reverse().prepend(std::move(value)).reverse();
    }

    // Returns this list's elements followed by `other`'s. Only this list's spine is copied.
    PersistentList concat(const PersistentList& other) const {
        PersistentList result = other;
        PersistentList reversed = reverse();
        for (const T& value : reversed)
            result = result.prepend(value);
        return result;
    }

    PersistentList reverse() const {
        PersistentList result;
        for (const T& value : *this)
            result = result.prepend(value);
        return result;
    }

    PersistentList tail() const {
        if (head_ == nullptr)
            throw std::out_of_range("PersistentList::tail: list is empty");
        return PersistentList(head_->next, size_ - 1);
    }

    const T& front() const {
        if (head_ == nullptr)
            throw std::out_of_range("PersistentList::front: list is empty");
        return head_->value;
    }

    const T& back() const {
        if (head_ == nullptr)
            throw std::out_of_range("PersistentList::back: list is empty");
        const Node* curr = head_.get();
        while (curr->next != nullptr)
            curr = curr->next.get();
        return curr->value;
    }

    std::optional<T> head_option() const {
        if (head_ == nullptr)
            return std::nullopt;
        return head_->value;
    }

    std::optional<T> last_option() const {
        if (head_ == nullptr)
            return std::nullopt;
        return back();
    }

    size_type size() const { return size_; }
    bool empty() const { return size_ == 0; }

    ConstIterator begin() const { return ConstIterator(head_.get()); }
    ConstIterator end() const { return ConstIterator(nullptr); }

    std::string to_string() const {
        return fmt::format("({})", fmt::join(*this, ", "));
    }

    friend bool operator==(const PersistentList& lhs, const PersistentList& rhs) {
        if (lhs.size_ != rhs.size_)
            return false;
        const Node* a = lhs.head_.get();
        const Node* b = rhs.head_.get();
        // Shared tails are equal without walking them.
        while (a != b) {
            if (!(a->value == b->value))
                return false;
            a = a->next.get();
            b = b->next.get();
        }
        return true;
    }

    friend bool operator!=(const PersistentList& lhs, const PersistentList& rhs) {
        return !(lhs == rhs);
    }

private:
    NodePtr head_;
    size_type size_;

    PersistentList(NodePtr head, size_type size) : head_(std::move(head)), size_(size) {}

    void swap(PersistentList& other) noexcept {
        std::swap(head_, other.head_);
        std::swap(size_, other.size_);
    }

    // Unlinks uniquely owned nodes one at a time so a long list does not
    // release its spine recursively.
    void release() noexcept {
        NodePtr curr = std::move(head_);
        while (curr != nullptr && curr.use_count() == 1) {
            NodePtr next = curr->next;
            curr = std::move(next);
        }
        size_ = 0;
    }
};

template <typename T>
struct fmt::formatter<PersistentList<T>> : fmt::formatter<std::string> {
    auto format(const PersistentList<T>& list, fmt::format_context& ctx) const {
        return formatter<std::string>::format(list.to_string(), ctx);
    }
};
