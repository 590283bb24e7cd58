#include "benchmark_utils.hpp"

namespace {

constexpr std::size_t kOpsPerThread = 200'000;

// Half of the threads only push, the other half only pop until they have taken as many values
// as one producer pushed. Producer and consumer counts are equal, so the queue drains fully.
template <class Queue>
static void BM_ProducerConsumer(benchmark::State& state) {
    lfq_bench::pin_thread_index(state.thread_index());

    using Value = lfq_bench::Value;
    using ctx_t = lfq_bench::SharedContext<Queue>;

    const int threads = static_cast<int>(state.threads());
    const int producers = threads / 2;
    const int consumers = threads - producers;

    static std::atomic<ctx_t*> g_ctx{nullptr};

    if (state.thread_index() == 0) {
        auto* ctx = new ctx_t(threads);
        g_ctx.store(ctx, std::memory_order_release);
    }

    ctx_t* ctx = nullptr;
    while ((ctx = g_ctx.load(std::memory_order_acquire)) == nullptr) {
        std::this_thread::yield();
    }

    for (auto _ : state) {
        ctx->start.arrive_and_wait();

        if (state.thread_index() < producers) {
            const std::uint64_t base = static_cast<std::uint64_t>(state.thread_index()) << 32;
            for (std::size_t i = 0; i < kOpsPerThread; ++i) {
                ctx->q->push(static_cast<Value>(base + i));
            }
        } else {
            std::size_t done = 0;
            while (done < kOpsPerThread) {
                auto out = ctx->q->pop();
                if (!out) {
                    continue;
                }
                benchmark::DoNotOptimize(out);
                ++done;
            }
        }

        ctx->finish.arrive_and_wait();
    }

    const std::uint64_t total_ops = static_cast<std::uint64_t>(state.iterations()) *
                                    static_cast<std::uint64_t>(threads) * kOpsPerThread;
    lfq_bench::add_common_counters(state, producers, consumers, total_ops);
    state.counters["ops_per_thread"] =
        benchmark::Counter(static_cast<double>(kOpsPerThread), benchmark::Counter::kAvgThreads);
    state.SetLabel(lfq_bench::QueueOps<Queue>::name());

    ctx->finish.arrive_and_wait();
    if (state.thread_index() == 0) {
        delete ctx;
        g_ctx.store(nullptr, std::memory_order_release);
    }
}

}  // namespace

static void apply_threads(benchmark::internal::Benchmark* b) {
    // Even counts only: producers and consumers are paired one to one.
    for (int t : {2, 4, 8, 16}) {
        b->Threads(t);
    }
    b->Iterations(1);
    b->UseRealTime();
}

BENCHMARK(BM_ProducerConsumer<lfq::ConcurrentQueue<lfq_bench::Value>>)
    ->Name("BM_ConcurrentQueue_ProducerConsumer")
    ->Apply(apply_threads);
BENCHMARK(BM_ProducerConsumer<lfq::MutexQueue<lfq_bench::Value>>)
    ->Name("BM_MutexQueue_ProducerConsumer")
    ->Apply(apply_threads);
