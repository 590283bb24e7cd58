/**
 * @file benchmark_components.cpp
 * @brief Overhead of the building blocks underneath ConcurrentQueue.
 *
 * Measures, in isolation:
 * - Backoff::spin at a fixed delay (cost of one contention pause)
 * - EpochGuard enter/exit (paid by every push and pop)
 * - retire + amortized reclaim of one cell
 * - pop on an empty queue (the uncontended fast path)
 */

#include <benchmark/benchmark.h>

#include <cstdint>

#include <lfq/backoff.hpp>
#include <lfq/concurrent_queue.hpp>
#include <lfq/ebr.hpp>

//=============================================================================
// Backoff
//=============================================================================

/**
 * @brief Cost of one spin at the delay given by the argument.
 *
 * The cap equals the initial delay, so every spin pauses exactly range(0) times.
 */
static void BM_Backoff_Spin(benchmark::State& state) {
    const auto delay = static_cast<std::uint32_t>(state.range(0));
    lfq::Backoff backoff(delay, delay);

    for (auto _ : state) {
        backoff.spin();
        benchmark::ClobberMemory();
    }
    state.counters["pauses"] =
        benchmark::Counter(static_cast<double>(delay), benchmark::Counter::kAvgThreads);
}
BENCHMARK(BM_Backoff_Spin)->RangeMultiplier(4)->Range(1, 1024);

/**
 * @brief Full escalation from the initial delay to the cap, then reset.
 */
static void BM_Backoff_Escalate(benchmark::State& state) {
    lfq::Backoff backoff;

    for (auto _ : state) {
        while (backoff.current_delay() < backoff.max_delay()) {
            backoff.spin();
        }
        backoff.reset();
    }
}
BENCHMARK(BM_Backoff_Escalate);

//=============================================================================
// Epoch-based reclamation
//=============================================================================

static void BM_EpochGuard_EnterExit(benchmark::State& state) {
    static lfq::EBRManager ebr;

    for (auto _ : state) {
        lfq::EpochGuard guard(ebr);
        benchmark::ClobberMemory();
    }
}
BENCHMARK(BM_EpochGuard_EnterExit)->Threads(1)->Threads(2)->Threads(4)->Threads(8);

/**
 * @brief Nested guard: only the outermost pair touches the shared record.
 */
static void BM_EpochGuard_Nested(benchmark::State& state) {
    lfq::EBRManager ebr;
    lfq::EpochGuard outer(ebr);

    for (auto _ : state) {
        lfq::EpochGuard inner(ebr);
        benchmark::ClobberMemory();
    }
}
BENCHMARK(BM_EpochGuard_Nested);

static void BM_EBR_RetireReclaim(benchmark::State& state) {
    lfq::EBRManager ebr;

    for (auto _ : state) {
        ebr.retire(new std::uint64_t(42));
    }
    state.counters["pending_at_end"] =
        benchmark::Counter(static_cast<double>(ebr.pending_count()));
}
BENCHMARK(BM_EBR_RetireReclaim);

//=============================================================================
// Queue fast paths
//=============================================================================

static void BM_ConcurrentQueue_EmptyPop(benchmark::State& state) {
    lfq::ConcurrentQueue<std::uint64_t> q;

    for (auto _ : state) {
        auto v = q.pop();
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_ConcurrentQueue_EmptyPop);

static void BM_ConcurrentQueue_PushPopSingleThread(benchmark::State& state) {
    lfq::ConcurrentQueue<std::uint64_t> q;
    std::uint64_t seq = 0;

    for (auto _ : state) {
        q.push(seq++);
        auto v = q.pop();
        benchmark::DoNotOptimize(v);
    }
}
BENCHMARK(BM_ConcurrentQueue_PushPopSingleThread);
