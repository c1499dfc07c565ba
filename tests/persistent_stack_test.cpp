#include "persistent_stack.hpp"

#include <cassert>
#include <cstdio>
#include <string>

#include <fmt/format.h>

#define TEST(name)                                                             \
    static void test_##name();                                                 \
    struct Register_##name {                                                   \
        Register_##name() { tests[count++] = {#name, test_##name}; }          \
    } reg_##name;                                                              \
    static void test_##name()

struct TestEntry {
    const char* name;
    void (*fn)();
};

static TestEntry tests[64];
static int count = 0;

// --- Tests ---

TEST(new_stack_is_empty) {
    PersistentStack<int> s = PersistentStack<int>::create();
    assert(s.size() == 0);
    assert(s.empty());
}

TEST(peek_on_empty_is_absent) {
    PersistentStack<int> s = PersistentStack<int>::create();
    assert(!s.peek().has_value());
}

TEST(pop_on_empty_returns_same_stack) {
    PersistentStack<int> s = PersistentStack<int>::create();
    auto [value, rest] = s.pop();
    assert(!value.has_value());
    assert(rest.empty());
    assert(rest == s);
}

TEST(push_single_element) {
    PersistentStack<int> s = PersistentStack<int>::create().push(42);
    assert(s.size() == 1);
    assert(!s.empty());
    assert(s.peek() == 42);
}

TEST(push_leaves_original_unchanged) {
    PersistentStack<int> s = PersistentStack<int>::create().push(1);
    PersistentStack<int> pushed = s.push(2);
    assert(s.size() == 1);
    assert(s.peek() == 1);
    assert(pushed.size() == 2);
    assert(pushed.peek() == 2);
}

TEST(pop_returns_top) {
    PersistentStack<int> s = PersistentStack<int>::create().push(100).push(200);
    auto [value, rest] = s.pop();
    assert(value == 200);
    assert(rest.size() == 1);
    assert(rest.peek() == 100);
}

TEST(pop_leaves_original_unchanged) {
    PersistentStack<int> s = PersistentStack<int>::create().push(1).push(2);
    auto removed = s.pop();
    assert(removed.value == 2);
    assert(s.size() == 2);
    assert(s.peek() == 2);
}

TEST(lifo_order) {
    PersistentStack<int> s = PersistentStack<int>::create().push(1).push(2).push(3);
    auto first = s.pop();
    auto second = first.rest.pop();
    auto third = second.rest.pop();
    auto fourth = third.rest.pop();
    assert(first.value == 3);
    assert(second.value == 2);
    assert(third.value == 1);
    assert(!fourth.value.has_value());
    assert(fourth.rest.empty());
}

TEST(peek_is_idempotent) {
    PersistentStack<int> s = PersistentStack<int>::of({5, 6});
    assert(s.peek() == 5);
    assert(s.peek() == 5);
    assert(s.size() == 2);
}

TEST(of_puts_first_value_on_top) {
    PersistentStack<int> s = PersistentStack<int>::of({1, 2, 3});
    assert(s.size() == 3);
    assert(s.peek() == 1);
    assert(s.to_string() == "top -> (1, 2, 3)");
}

TEST(to_string_walkthrough) {
    PersistentStack<int> s = PersistentStack<int>::create();
    assert(s.to_string() == "top -> ()");
    PersistentStack<int> pushed = s.push(1).push(2);
    assert(pushed.to_string() == "top -> (2, 1)");
    auto [value, rest] = pushed.pop();
    assert(show_option(value) == "Some(2)");
    assert(fmt::format("{}", rest) == "top -> (1)");
}

TEST(structural_equality) {
    PersistentStack<int> a = PersistentStack<int>::create().push(3).push(2).push(1);
    PersistentStack<int> b = PersistentStack<int>::of({1, 2, 3});
    assert(a == b);
    assert(a != b.push(0));
}

TEST(works_with_strings) {
    PersistentStack<std::string> s = PersistentStack<std::string>::create().push("hello").push("world");
    assert(s.peek() == std::string("world"));
    auto removed = s.pop();
    assert(removed.value == std::string("world"));
    assert(removed.rest.peek() == std::string("hello"));
}

TEST(large_number_of_elements) {
    PersistentStack<int> s = PersistentStack<int>::create();
    for (int i = 0; i < 1000; ++i)
        s = s.push(i);
    assert(s.size() == 1000);
    for (int i = 999; i >= 0; --i) {
        auto removed = s.pop();
        assert(removed.value == i);
        s = removed.rest;
    }
    assert(s.empty());
}

// --- Runner ---

int main() {
    int passed = 0;
    int failed = 0;
    for (int i = 0; i < count; ++i) {
        try {
            tests[i].fn();
            std::printf("  PASS  %s\n", tests[i].name);
            ++passed;
        } catch (const std::exception& e) {
            std::printf("  FAIL  %s: %s\n", tests[i].name, e.what());
            ++failed;
        } catch (...) {
            std::printf("  FAIL  %s: unknown exception\n", tests[i].name);
            ++failed;
        }
    }
    std::printf("\n%d passed, %d failed\n", passed, failed);
    return failed > 0 ? 1 : 0;
}
