#include "command_options.hpp"
#include "persistent_stack.hpp"
#include "queue.hpp"

#include <stdexcept>
#include <string>
#include <vector>

#include <fmt/format.h>
#include <spdlog/cfg/env.h>
#include <spdlog/sinks/stdout_color_sinks.h>
#include <spdlog/spdlog.h>

namespace {

void print_usage() {
    fmt::print(
        "usage: queue_demo [naive|amortized|stack|compare|all] [--count <n>] [--log-level <level>]\n"
        "  naive       walk through NaiveQueue\n"
        "  amortized   walk through AmortizedQueue\n"
        "  stack       walk through PersistentStack\n"
        "  compare     run the same enqueue/dequeue sequence through both queue strategies\n"
        "  all         every walkthrough above (default)\n");
}

void run_naive() {
    fmt::print("== naive queue ==\n");
    NaiveQueue<int> queue = NaiveQueue<int>::create();
    fmt::print("{}\n", queue);
    auto [empty_value, drained] = queue.dequeue();
    fmt::print("{}\n", show_option(empty_value));
    fmt::print("{}\n", drained);
    NaiveQueue<int> filled = drained.enqueue(42).enqueue(43);
    fmt::print("{}\n", filled);
    auto [value, rest] = filled.dequeue();
    fmt::print("{}\n", show_option(value));
    fmt::print("{}\n", rest);
}

void run_amortized() {
    fmt::print("== amortized queue ==\n");
    AmortizedQueue<int> queue = AmortizedQueue<int>::of({1, 2, 3});
    fmt::print("{}\n", queue);
    auto [value, rest] = queue.dequeue();
    fmt::print("{}\n", show_option(value));
    fmt::print("{}\n", rest);
    AmortizedQueue<int> grown = rest.enqueue(42).enqueue(43);
    fmt::print("{}\n", grown);
    SPDLOG_DEBUG("front buffer {} rear buffer {}", grown.front_list(), grown.rear_list());
}

void run_stack() {
    fmt::print("== persistent stack ==\n");
    PersistentStack<int> stack = PersistentStack<int>::create();
    fmt::print("Initial stack: {}\n", stack);
    PersistentStack<int> one = stack.push(1);
    fmt::print("After pushing 1: {}\n", one);
    PersistentStack<int> two = one.push(2);
    fmt::print("After pushing 2: {}\n", two);
    auto first = two.pop();
    fmt::print("Popped element: {}, New stack: {}\n", show_option(first.value), first.rest);
    fmt::print("Peeked element: {}\n", show_option(first.rest.peek()));
    fmt::print("Is the stack empty? {}\n", first.rest.empty());
    auto second = first.rest.pop();
    fmt::print("Popped element: {}, New stack: {}\n", show_option(second.value), second.rest);
    auto third = second.rest.pop();
    fmt::print("Popped element: {}, New stack: {}\n", show_option(third.value), third.rest);
    fmt::print("Is the stack empty after popping all elements? {}\n", third.rest.empty());
    fmt::print("Stack created with elements: {}\n", PersistentStack<int>::of({1, 2, 3}));
}

// Enqueues `count` values into a queue of each strategy, then dequeues one
// more time than that, checking that every observation agrees.
bool run_compare(int count) {
    fmt::print("== compare strategies ({} elements) ==\n", count);
    Queue<int> naive = Queue<int>::create(QueueStrategy::Naive);
    Queue<int> amortized = Queue<int>::create(QueueStrategy::Amortized);
    int mismatches = 0;

    auto check = [&](const char* step) {
        if (naive.size() != amortized.size() || naive.empty() != amortized.empty() ||
            naive.peek_front() != amortized.peek_front() || naive.peek_back() != amortized.peek_back()) {
            SPDLOG_ERROR("after {}: {} disagrees with {}", step, naive, amortized);
            ++mismatches;
        }
    };

    for (int i = 0; i < count; ++i) {
        naive = naive.enqueue(i);
        amortized = amortized.enqueue(i);
        check("enqueue");
        SPDLOG_DEBUG("enqueue {}: {} | {}", i, naive, amortized);
    }
    for (int i = 0; i <= count; ++i) {
        auto from_naive = naive.dequeue();
        auto from_amortized = amortized.dequeue();
        if (from_naive.value != from_amortized.value) {
            SPDLOG_ERROR(
                "dequeue {}: {} from {} but {} from {}",
                i,
                show_option(from_naive.value),
                strategy_name(QueueStrategy::Naive),
                show_option(from_amortized.value),
                strategy_name(QueueStrategy::Amortized));
            ++mismatches;
        }
        naive = from_naive.rest;
        amortized = from_amortized.rest;
        check("dequeue");
        SPDLOG_DEBUG("dequeue {}: {} | {}", show_option(from_naive.value), naive, amortized);
    }

    if (mismatches > 0) {
        fmt::print("{} mismatched observations\n", mismatches);
        return false;
    }
    fmt::print("{} enqueues and {} dequeues matched\n", count, count + 1);
    return true;
}

}  // namespace

int main(int argc, char** argv) {
    spdlog::set_default_logger(spdlog::stderr_color_mt("queue_demo"));
    spdlog::cfg::load_env_levels();

    std::vector<std::string> args(argv + 1, argv + argc);
    if (has_command_option(args, "--help")) {
        print_usage();
        return 0;
    }

    std::string demo;
    int count = 0;
    try {
        if (has_command_option(args, "--log-level")) {
            std::string level_name = get_command_option(args, "--log-level");
            spdlog::level::level_enum level = spdlog::level::from_str(level_name);
            if (level == spdlog::level::off && level_name != "off")
                throw std::invalid_argument("unknown log level '" + level_name + "'");
            spdlog::set_level(level);
        }
        count = get_command_option_int(args, "--count", 8);
        if (count < 0)
            throw std::invalid_argument("--count must not be negative");
        std::vector<std::string> positional = get_positional_args(args, {"--count", "--log-level"});
        if (positional.size() > 1)
            throw std::invalid_argument("expected at most one walkthrough name");
        demo = positional.empty() ? "all" : positional.front();
    } catch (const std::invalid_argument& e) {
        SPDLOG_ERROR("{}", e.what());
        print_usage();
        return 2;
    } catch (const std::out_of_range& e) {
        SPDLOG_ERROR("option value out of range: {}", e.what());
        print_usage();
        return 2;
    }

    SPDLOG_INFO("running '{}'", demo);
    try {
        if (demo == "naive") {
            run_naive();
        } else if (demo == "amortized") {
            run_amortized();
        } else if (demo == "stack") {
            run_stack();
        } else if (demo == "compare") {
            return run_compare(count) ? 0 : 1;
        } else if (demo == "all") {
            run_naive();
            run_amortized();
            run_stack();
            return run_compare(count) ? 0 : 1;
        } else {
            SPDLOG_ERROR("unknown walkthrough '{}'", demo);
            print_usage();
            return 2;
        }
    } catch (const std::exception& e) {
        SPDLOG_ERROR("queue_demo failed: {}", e.what());
        return 1;
    }
    return 0;
}
