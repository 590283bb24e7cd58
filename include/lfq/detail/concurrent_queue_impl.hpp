#pragma once

// Member definitions of lfq::ConcurrentQueue. Included at the end of <lfq/concurrent_queue.hpp>.

#include <lfq/detail/likely.hpp>

namespace lfq {

template <class T>
ConcurrentQueue<T>::ConcurrentQueue()
    : owned_ebr_(std::make_unique<EBRManager>()),
      ebr_(owned_ebr_.get()),
      head_(nullptr),
      tail_(nullptr),
      approx_count_(0) {
    Cell* sentinel = Cell::create_sentinel();
    head_.store(sentinel, std::memory_order_relaxed);
    tail_.store(sentinel, std::memory_order_relaxed);
}

template <class T>
ConcurrentQueue<T>::ConcurrentQueue(EBRManager& ebr)
    : owned_ebr_(), ebr_(&ebr), head_(nullptr), tail_(nullptr), approx_count_(0) {
    Cell* sentinel = Cell::create_sentinel();
    head_.store(sentinel, std::memory_order_relaxed);
    tail_.store(sentinel, std::memory_order_relaxed);
}

template <class T>
ConcurrentQueue<T>::~ConcurrentQueue() {
    // Exclusive access: everything still linked from head is owned by the queue alone. Cells
    // already retired belong to the manager (freed below when it is ours).
    delete_chain(head_.load(std::memory_order_acquire));
}

template <class T>
void ConcurrentQueue<T>::delete_chain(Cell* first) noexcept {
    Cell* cur = first;
    while (cur != nullptr) {
        Cell* next = cur->next.load(std::memory_order_relaxed);
        delete cur;
        cur = next;
    }
}

template <class T>
template <class... Args>
void ConcurrentQueue<T>::emplace(Args&&... args) {
    std::unique_ptr<Cell> owned(Cell::create(std::forward<Args>(args)...));
    Cell* cell = owned.get();

    EpochGuard guard(*ebr_);
    Backoff backoff;

    while (true) {
        Cell* tail = tail_.load(std::memory_order_acquire);
        Cell* next = tail->next.load(std::memory_order_acquire);

        if (LFQ_UNLIKELY(tail != tail_.load(std::memory_order_acquire))) {
            continue;
        }

        if (next == nullptr) {
            if (tail->next.compare_exchange_strong(next, cell, std::memory_order_release,
                                                   std::memory_order_relaxed)) {
                (void)owned.release();
                // Best effort: whoever sees the lag first finishes the swing.
                (void)tail_.compare_exchange_strong(tail, cell, std::memory_order_release,
                                                    std::memory_order_relaxed);
                approx_count_.fetch_add(1, std::memory_order_relaxed);
                return;
            }
            backoff.spin();
        } else {
            // Tail lags behind a cell another producer already linked.
            (void)tail_.compare_exchange_strong(tail, next, std::memory_order_release,
                                                std::memory_order_relaxed);
        }
    }
}

template <class T>
std::optional<T> ConcurrentQueue<T>::pop() {
    EpochGuard guard(*ebr_);
    Backoff backoff;

    while (true) {
        Cell* head = head_.load(std::memory_order_acquire);
        Cell* tail = tail_.load(std::memory_order_acquire);
        Cell* next = head->next.load(std::memory_order_acquire);

        if (LFQ_UNLIKELY(head != head_.load(std::memory_order_acquire))) {
            continue;
        }

        if (head == tail) {
            if (next == nullptr) {
                return std::nullopt;  // Empty.
            }
            (void)tail_.compare_exchange_strong(tail, next, std::memory_order_release,
                                                std::memory_order_relaxed);
            continue;
        }

        if (LFQ_UNLIKELY(next == nullptr)) {
            continue;
        }

        if (head_.compare_exchange_strong(head, next, std::memory_order_acq_rel,
                                          std::memory_order_acquire)) {
            // Pinned: retiring the old sentinel does not allocate. The link structure and the
            // count are settled before any user code runs.
            ebr_->retire(head, &Cell::reclaim);
            approx_count_.fetch_sub(1, std::memory_order_relaxed);

            // Only the CAS winner touches next->value; next is now the sentinel.
            std::optional<T> value;
            try {
                value.emplace(std::move(*next->value));
            } catch (...) {
                next->value.reset();
                throw;
            }
            next->value.reset();
            return value;
        }
        backoff.spin();
    }
}

template <class T>
std::size_t ConcurrentQueue<T>::size() const noexcept {
    const std::int64_t n = approx_count_.load(std::memory_order_relaxed);
    return n > 0 ? static_cast<std::size_t>(n) : 0;
}

}  // namespace lfq
