#include "benchmark_utils.hpp"

namespace {

// Every thread alternates push and pop on one shared queue.
template <class Queue>
static void BM_Pair(benchmark::State& state) {
    lfq_bench::pin_thread_index(state.thread_index());

    using ctx_t = lfq_bench::SharedContext<Queue>;

    static std::atomic<ctx_t*> g_ctx{nullptr};

    const int threads = static_cast<int>(state.threads());

    if (state.thread_index() == 0) {
        auto* ctx = new ctx_t(threads);
        // Warm start: the first pops do not all hit an empty queue.
        ctx->prefill(static_cast<std::size_t>(threads) * lfq_bench::kPrefillPerThread);
        g_ctx.store(ctx, std::memory_order_release);
    }

    ctx_t* ctx = nullptr;
    while ((ctx = g_ctx.load(std::memory_order_acquire)) == nullptr) {
        std::this_thread::yield();
    }

    ctx->start.arrive_and_wait();

    std::uint64_t seq = 0;
    for (auto _ : state) {
        ctx->q->push(ctx_t::make_item(state.thread_index(), seq++));

        std::optional<lfq_bench::Value> out;
        while (!(out = ctx->q->pop())) {
            std::this_thread::yield();
        }
        benchmark::DoNotOptimize(out);
    }

    ctx->finish.arrive_and_wait();

    const std::uint64_t total_ops =
        static_cast<std::uint64_t>(state.iterations()) * static_cast<std::uint64_t>(threads) * 2u;
    lfq_bench::add_common_counters(state, threads, threads, total_ops);
    state.SetLabel(lfq_bench::QueueOps<Queue>::name());

    ctx->finish.arrive_and_wait();
    if (state.thread_index() == 0) {
        delete ctx;
        g_ctx.store(nullptr, std::memory_order_release);
    }
}

}  // namespace

static void apply_threads(benchmark::internal::Benchmark* b) {
    for (int t : lfq_bench::kThreadCounts) {
        b->Threads(t);
    }
    b->UseRealTime();
}

BENCHMARK(BM_Pair<lfq::ConcurrentQueue<lfq_bench::Value>>)
    ->Name("BM_ConcurrentQueue_Pair")
    ->Apply(apply_threads);
BENCHMARK(BM_Pair<lfq::MutexQueue<lfq_bench::Value>>)
    ->Name("BM_MutexQueue_Pair")
    ->Apply(apply_threads);
