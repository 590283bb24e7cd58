#include <lfq/lfq.hpp>

#include <atomic>
#include <charconv>
#include <chrono>
#include <cstddef>
#include <cstdint>
#include <iostream>
#include <string>
#include <thread>
#include <unordered_set>
#include <vector>

namespace {

struct Options {
    std::size_t producers = 4;
    std::size_t consumers = 2;
    std::size_t items_per_producer = 1000;
    std::size_t consume_target = 2000;
    std::size_t idle_sleep_us = 100;
};

void print_help(const char* argv0) {
    std::cout << "Usage: " << argv0 << " [options]\n"
              << "Options:\n"
              << "  --producers=<N>           Producer threads (default: 4)\n"
              << "  --consumers=<N>           Consumer threads (default: 2)\n"
              << "  --items-per-producer=<N>  Items per producer (default: 1000)\n"
              << "  --consume-target=<N>      Items consumed in total by all consumers (default: 2000)\n"
              << "  --idle-sleep-us=<N>       Consumer sleep when the queue is empty (default: 100)\n"
              << "  --help                    Show help\n";
}

bool parse_u64(const std::string& s, std::size_t& out) {
    unsigned long long v = 0;
    const char* begin = s.data();
    const char* end = s.data() + s.size();
    const auto res = std::from_chars(begin, end, v, 10);
    if (res.ec != std::errc() || res.ptr != end) {
        return false;
    }
    out = static_cast<std::size_t>(v);
    return true;
}

enum class ParseResult { kRun, kHelp, kError };

ParseResult parse_args(int argc, char** argv, Options& opt) {
    for (int i = 1; i < argc; ++i) {
        const std::string a = argv[i];
        if (a == "--help" || a == "-h") {
            print_help(argv[0]);
            return ParseResult::kHelp;
        }
        const auto eq = a.find('=');
        if (eq == std::string::npos) {
            std::cerr << "Unknown arg: " << a << "\n";
            return ParseResult::kError;
        }
        const std::string key = a.substr(0, eq);
        const std::string val = a.substr(eq + 1);

        std::size_t* target = nullptr;
        if (key == "--producers") {
            target = &opt.producers;
        } else if (key == "--consumers") {
            target = &opt.consumers;
        } else if (key == "--items-per-producer") {
            target = &opt.items_per_producer;
        } else if (key == "--consume-target") {
            target = &opt.consume_target;
        } else if (key == "--idle-sleep-us") {
            target = &opt.idle_sleep_us;
        } else {
            std::cerr << "Unknown arg: " << a << "\n";
            return ParseResult::kError;
        }

        if (!parse_u64(val, *target)) {
            std::cerr << "Invalid value for " << key << ": " << val << "\n";
            return ParseResult::kError;
        }
    }

    if (opt.producers == 0 || opt.consumers == 0) {
        std::cerr << "Invalid: producers/consumers must be > 0\n";
        return ParseResult::kError;
    }
    if (opt.consume_target > opt.producers * opt.items_per_producer) {
        std::cerr << "Invalid: consume-target exceeds the number of items produced\n";
        return ParseResult::kError;
    }
    return ParseResult::kRun;
}

}  // namespace

int main(int argc, char** argv) {
    Options opt;
    switch (parse_args(argc, argv, opt)) {
        case ParseResult::kHelp:
            return 0;
        case ParseResult::kError:
            return 2;
        case ParseResult::kRun:
            break;
    }

    const std::size_t total_items = opt.producers * opt.items_per_producer;
    std::cout << "lfq example - producer/consumer (MPMC, partial drain)\n"
              << "Producers: " << opt.producers << "\n"
              << "Consumers: " << opt.consumers << "\n"
              << "Items per producer: " << opt.items_per_producer << "\n"
              << "Total items: " << total_items << "\n"
              << "Consume target: " << opt.consume_target << "\n"
              << "Idle sleep: " << opt.idle_sleep_us << " us\n\n";

    lfq::ConcurrentQueue<std::uint64_t> q;

    std::atomic<std::size_t> ready{0};
    std::atomic<bool> start{false};

    // Consumers draw tickets; a ticket below the target entitles its holder to one item.
    std::atomic<std::size_t> tickets{0};

    std::vector<std::vector<std::uint64_t>> consumed_by(opt.consumers);
    std::vector<std::thread> producer_threads;
    std::vector<std::thread> consumer_threads;
    producer_threads.reserve(opt.producers);
    consumer_threads.reserve(opt.consumers);

    for (std::size_t c = 0; c < opt.consumers; ++c) {
        consumer_threads.emplace_back([&, c] {
            ready.fetch_add(1, std::memory_order_release);
            while (!start.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }

            auto& local = consumed_by[c];
            while (tickets.fetch_add(1, std::memory_order_relaxed) < opt.consume_target) {
                for (;;) {
                    if (auto v = q.pop()) {
                        local.push_back(*v);
                        break;
                    }
                    std::this_thread::sleep_for(std::chrono::microseconds(opt.idle_sleep_us));
                }
            }
        });
    }

    for (std::size_t p = 0; p < opt.producers; ++p) {
        producer_threads.emplace_back([&, p] {
            ready.fetch_add(1, std::memory_order_release);
            while (!start.load(std::memory_order_acquire)) {
                std::this_thread::yield();
            }

            const std::uint64_t base_id = static_cast<std::uint64_t>(p * opt.items_per_producer);
            for (std::size_t i = 0; i < opt.items_per_producer; ++i) {
                q.push(base_id + i);
            }
        });
    }

    while (ready.load(std::memory_order_acquire) != opt.producers + opt.consumers) {
        std::this_thread::yield();
    }

    const auto t0 = std::chrono::steady_clock::now();
    start.store(true, std::memory_order_release);

    for (auto& t : producer_threads) {
        t.join();
    }
    for (auto& t : consumer_threads) {
        t.join();
    }
    const auto t1 = std::chrono::steady_clock::now();
    const std::chrono::duration<double> dt = t1 - t0;

    std::size_t consumed_n = 0;
    bool values_ok = true;
    std::unordered_set<std::uint64_t> seen;
    seen.reserve(opt.consume_target);
    for (const auto& local : consumed_by) {
        for (std::uint64_t v : local) {
            ++consumed_n;
            if (v >= total_items) {
                std::cerr << "ERROR: consumed value " << v << " was never produced\n";
                values_ok = false;
            } else if (!seen.insert(v).second) {
                std::cerr << "ERROR: value " << v << " consumed more than once\n";
                values_ok = false;
            }
        }
    }

    const std::size_t remaining = q.size();
    std::cout << "Consumed: " << consumed_n << "\n"
              << "Elapsed: " << dt.count() << " s\n"
              << "Final queue length: " << remaining << "\n";

    if (consumed_n != opt.consume_target || remaining != total_items - consumed_n) {
        std::cerr << "ERROR: unexpected item counts (expected " << total_items - opt.consume_target
                  << " remaining)\n";
        return 1;
    }
    return values_ok ? 0 : 1;
}
