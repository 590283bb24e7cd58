#include "benchmark_utils.hpp"

namespace {

// Each iteration is a push with probability PushPct and a (possibly empty) pop otherwise.
template <class Queue, int PushPct>
static void BM_Mixed(benchmark::State& state) {
    lfq_bench::pin_thread_index(state.thread_index());

    static_assert(PushPct >= 0 && PushPct <= 100);

    using ctx_t = lfq_bench::SharedContext<Queue>;

    static std::atomic<ctx_t*> g_ctx{nullptr};

    const int threads = static_cast<int>(state.threads());

    if (state.thread_index() == 0) {
        auto* ctx = new ctx_t(threads);
        ctx->prefill(static_cast<std::size_t>(threads) * lfq_bench::kPrefillPerThread);
        g_ctx.store(ctx, std::memory_order_release);
    }

    ctx_t* ctx = nullptr;
    while ((ctx = g_ctx.load(std::memory_order_acquire)) == nullptr) {
        std::this_thread::yield();
    }

    ctx->start.arrive_and_wait();

    lfq_bench::XorShift64Star rng(
        static_cast<std::uint64_t>(0x9e3779b97f4a7c15ULL ^ (static_cast<std::uint64_t>(state.thread_index()) + 1u) ^
                                   (static_cast<std::uint64_t>(PushPct) << 32u)));

    std::uint64_t seq = 0;
    std::uint64_t empty_pops = 0;
    for (auto _ : state) {
        const std::uint64_t r = rng.next();
        const int pct = static_cast<int>(r % 100u);
        if (pct < PushPct) {
            ctx->q->push(ctx_t::make_item(state.thread_index(), seq++));
        } else {
            auto out = ctx->q->pop();
            if (!out) {
                ++empty_pops;
            }
            benchmark::DoNotOptimize(out);
        }
    }

    ctx->finish.arrive_and_wait();

    const std::uint64_t total_ops =
        static_cast<std::uint64_t>(state.iterations()) * static_cast<std::uint64_t>(threads);
    lfq_bench::add_common_counters(state, threads, threads, total_ops);
    state.counters["push_pct"] =
        benchmark::Counter(static_cast<double>(PushPct), benchmark::Counter::kAvgThreads);
    state.counters["pop_pct"] =
        benchmark::Counter(static_cast<double>(100 - PushPct), benchmark::Counter::kAvgThreads);
    state.counters["empty_pops"] = benchmark::Counter(static_cast<double>(empty_pops));
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

// 50/50
BENCHMARK(BM_Mixed<lfq::ConcurrentQueue<lfq_bench::Value>, 50>)
    ->Name("BM_ConcurrentQueue_50P50C")
    ->Apply(apply_threads);
BENCHMARK(BM_Mixed<lfq::MutexQueue<lfq_bench::Value>, 50>)
    ->Name("BM_MutexQueue_50P50C")
    ->Apply(apply_threads);

// 30/70: mostly pops, exercises the empty-queue path.
BENCHMARK(BM_Mixed<lfq::ConcurrentQueue<lfq_bench::Value>, 30>)
    ->Name("BM_ConcurrentQueue_30P70C")
    ->Apply(apply_threads);
BENCHMARK(BM_Mixed<lfq::MutexQueue<lfq_bench::Value>, 30>)
    ->Name("BM_MutexQueue_30P70C")
    ->Apply(apply_threads);

// 70/30: the queue keeps growing, so cell allocation and reclamation dominate.
BENCHMARK(BM_Mixed<lfq::ConcurrentQueue<lfq_bench::Value>, 70>)
    ->Name("BM_ConcurrentQueue_70P30C")
    ->Apply(apply_threads);
BENCHMARK(BM_Mixed<lfq::MutexQueue<lfq_bench::Value>, 70>)
    ->Name("BM_MutexQueue_70P30C")
    ->Apply(apply_threads);
