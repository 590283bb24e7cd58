#pragma once

#include <lfq/concurrent_queue.hpp>
#include <lfq/mutex_queue.hpp>

#include <benchmark/benchmark.h>

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#if LFQ_PLATFORM_LINUX
#include <pthread.h>
#include <sched.h>
#endif

namespace lfq_bench {

constexpr int kThreadCounts[] = {1, 2, 4, 8, 16};

constexpr std::size_t kPrefillPerThread = 100;

class CyclicBarrier {
public:
    explicit CyclicBarrier(int parties) : parties_(parties), arrived_(0), generation_(0) {}

    void arrive_and_wait() {
        std::unique_lock<std::mutex> lock(mu_);
        const std::size_t gen = generation_;
        if (++arrived_ == static_cast<std::size_t>(parties_)) {
            arrived_ = 0;
            ++generation_;
            cv_.notify_all();
            return;
        }
        cv_.wait(lock, [&] { return generation_ != gen; });
    }

private:
    int parties_;
    std::size_t arrived_;
    std::size_t generation_;
    std::mutex mu_;
    std::condition_variable cv_;
};

struct XorShift64Star {
    std::uint64_t s;

    explicit XorShift64Star(std::uint64_t seed) : s(seed ? seed : 0x9e3779b97f4a7c15ULL) {}

    std::uint64_t next() noexcept {
        std::uint64_t x = s;
        x ^= x >> 12;
        x ^= x << 25;
        x ^= x >> 27;
        s = x;
        return x * 2685821657736338717ULL;
    }
};

// Spread benchmark threads over the available CPUs. Affinity is best effort and Linux only;
// elsewhere threads float.
inline void pin_thread_index(int thread_index) noexcept {
#if LFQ_PLATFORM_LINUX
    const unsigned hc = std::thread::hardware_concurrency();
    const unsigned cpu = static_cast<unsigned>(thread_index) % (hc == 0 ? 1u : hc);
    cpu_set_t set;
    CPU_ZERO(&set);
    CPU_SET(cpu, &set);
    (void)pthread_setaffinity_np(pthread_self(), sizeof(set), &set);
#else
    (void)thread_index;
#endif
}

inline void add_common_counters(benchmark::State& state, int producers, int consumers,
                                std::uint64_t total_ops) {
    state.counters["threads"] =
        benchmark::Counter(static_cast<double>(state.threads()), benchmark::Counter::kAvgThreads);
    state.counters["producers"] =
        benchmark::Counter(static_cast<double>(producers), benchmark::Counter::kAvgThreads);
    state.counters["consumers"] =
        benchmark::Counter(static_cast<double>(consumers), benchmark::Counter::kAvgThreads);
    state.counters["total_ops"] =
        benchmark::Counter(static_cast<double>(total_ops), benchmark::Counter::kAvgThreads);
    state.counters["Mops"] =
        benchmark::Counter(static_cast<double>(total_ops) / 1e6, benchmark::Counter::kIsRate);
}

using Value = std::uint64_t;

// Uniform adapter over the queues under comparison. Both expose push/pop with std::optional,
// so the adapter only contributes a display name.
template <class Queue>
struct QueueOps;

template <>
struct QueueOps<lfq::ConcurrentQueue<Value>> {
    using queue_type = lfq::ConcurrentQueue<Value>;
    static constexpr const char* name() { return "ConcurrentQueue"; }
};

template <>
struct QueueOps<lfq::MutexQueue<Value>> {
    using queue_type = lfq::MutexQueue<Value>;
    static constexpr const char* name() { return "MutexQueue"; }
};

template <class Queue>
struct SharedContext {
    using queue_type = typename QueueOps<Queue>::queue_type;

    std::unique_ptr<queue_type> q;
    CyclicBarrier start;
    CyclicBarrier finish;

    explicit SharedContext(int threads)
        : q(std::make_unique<queue_type>()), start(threads), finish(threads) {}

    void prefill(std::size_t n) {
        for (std::size_t i = 0; i < n; ++i) {
            q->push(static_cast<Value>(i));
        }
    }

    static Value make_item(int thread_index, std::uint64_t seq) noexcept {
        return (static_cast<std::uint64_t>(thread_index) << 32u) + seq;
    }
};

}  // namespace lfq_bench
