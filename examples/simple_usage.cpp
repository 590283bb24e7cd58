#include <lfq/lfq.hpp>
#include <lfq/mutex_queue.hpp>

#include <cstdint>
#include <iostream>
#include <memory>
#include <string>

int main() {
    std::cout << "lfq examples - simple usage (single-thread)\n\n";

    // -----------------------------------------------------------------------------
    // 1) ConcurrentQueue: unbounded MPMC queue storing values
    // -----------------------------------------------------------------------------
    //
    // pop() returns std::optional<T>; an empty queue is not an error, just std::nullopt.
    lfq::ConcurrentQueue<std::uint64_t> q;

    if (q.pop().has_value()) {
        std::cerr << "ERROR: pop() on a new queue returned a value\n";
        return 1;
    }

    std::cout << "[ConcurrentQueue] push 1..5\n";
    for (std::uint64_t v = 1; v <= 5; ++v) {
        q.push(v);
    }
    std::cout << "[ConcurrentQueue] size = " << q.size() << "\n";

    std::cout << "[ConcurrentQueue] pop until empty:\n";
    while (auto v = q.pop()) {
        std::cout << "  got " << *v << "\n";
    }
    std::cout << "\n";

    // -----------------------------------------------------------------------------
    // 2) Move-only payloads
    // -----------------------------------------------------------------------------
    //
    // Values are moved into and out of the queue; ownership travels with them.
    {
        lfq::ConcurrentQueue<std::unique_ptr<std::string>> jobs;
        jobs.push(std::make_unique<std::string>("compile"));
        jobs.push(std::make_unique<std::string>("link"));
        jobs.emplace(std::make_unique<std::string>("test"));

        std::cout << "[ConcurrentQueue<unique_ptr>] pop until empty:\n";
        while (auto job = jobs.pop()) {
            std::cout << "  got " << **job << "\n";
        }
        std::cout << "\n";
    }

    // -----------------------------------------------------------------------------
    // 3) Several queues sharing one reclamation manager
    // -----------------------------------------------------------------------------
    //
    // The manager must outlive every queue constructed with it.
    {
        lfq::EBRManager ebr;
        lfq::ConcurrentQueue<int> a(ebr);
        lfq::ConcurrentQueue<int> b(ebr);

        a.push(1);
        b.push(2);
        const int sum = *a.pop() + *b.pop();
        std::cout << "[shared EBRManager] sum = " << sum
                  << ", retired cells pending = " << ebr.pending_count() << "\n";
        ebr.try_reclaim();
        ebr.try_reclaim();
        std::cout << "[shared EBRManager] after two reclaim passes, pending = "
                  << ebr.pending_count() << "\n\n";
    }

    // -----------------------------------------------------------------------------
    // 4) MutexQueue: the blocking baseline with the same surface
    // -----------------------------------------------------------------------------
    {
        lfq::MutexQueue<std::uint64_t> muq;
        std::cout << "[MutexQueue] push 7,8,9\n";
        muq.push(7);
        muq.push(8);
        muq.push(9);

        std::cout << "[MutexQueue] pop until empty:\n";
        while (auto v = muq.pop()) {
            std::cout << "  got " << *v << "\n";
        }
        std::cout << "\n";
    }

    std::cout << "Done.\n";
    return 0;
}
