/**
 * @file concurrent_queue.hpp
 * @brief Unbounded lock-free MPMC FIFO queue (Michael-Scott) with epoch-based reclamation.
 * @author lfq contributors
 * @version 0.1.0
 */

#ifndef LFQ_CONCURRENT_QUEUE_HPP_
#define LFQ_CONCURRENT_QUEUE_HPP_

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <optional>
#include <utility>

#include <lfq/backoff.hpp>
#include <lfq/config.hpp>
#include <lfq/detail/cell.hpp>
#include <lfq/ebr.hpp>

namespace lfq {

/**
 * @class ConcurrentQueue
 * @brief Unbounded multi-producer multi-consumer FIFO queue without locks.
 *
 * The queue is a singly linked chain of cells starting at a sentinel. Producers link new cells
 * after the last one with CAS and then swing @c tail; consumers swing @c head to the successor
 * and take its value, which turns that successor into the new sentinel. A thread that observes a
 * lagging @c tail advances it on behalf of the producer that linked the cell, so no operation
 * ever waits for another thread. Failed CAS attempts are paced by a per-call @ref Backoff.
 *
 * Unlinked cells are never freed directly. Every operation pins an epoch of the queue's
 * @ref EBRManager and hands the old sentinel to it, so a cell is destroyed only after no thread
 * can still be dereferencing it. This rules out use-after-free and ABA on @c head and @c tail.
 *
 * @tparam T Value type. Must be move-constructible.
 *
 * Thread-safety: @ref push, @ref emplace, @ref pop, @ref size, @ref is_empty and
 * @ref try_reclaim are safe for any number of concurrent callers. The destructor is not.
 *
 * Progress: lock-free (some thread always completes in a bounded number of steps), not
 * wait-free. No call ever blocks on a lock or the scheduler.
 *
 * Complexity: O(1) expected per operation (may spin under contention).
 *
 * Example:
 * @code
 * lfq::ConcurrentQueue<int> q;
 * q.push(1);
 * if (std::optional<int> v = q.pop()) {
 *     // *v == 1
 * }
 * @endcode
 */
template <class T>
class ConcurrentQueue {
   private:
    using Cell = detail::Cell<T>;

   public:
    using value_type = T;

    /**
     * @brief Construct an empty queue with its own reclamation manager.
     * @throws std::bad_alloc If allocating the sentinel or the manager fails.
     */
    ConcurrentQueue();

    /**
     * @brief Construct an empty queue whose retired cells go to a shared manager.
     *
     * @param ebr Reclamation manager. Must outlive the queue; cells retired by this queue are
     *        freed by that manager's reclamation passes or its destructor.
     * @throws std::bad_alloc If allocating the sentinel fails.
     */
    explicit ConcurrentQueue(EBRManager& ebr);

    /**
     * @brief Destroy every remaining value and free all cells.
     *
     * @warning Not thread-safe. The caller must guarantee that no other thread is inside, or
     * will call, any member of this queue. Destroying a queue that is still in use is undefined
     * behavior.
     */
    ~ConcurrentQueue();

    ConcurrentQueue(const ConcurrentQueue&) = delete;
    ConcurrentQueue& operator=(const ConcurrentQueue&) = delete;
    ConcurrentQueue(ConcurrentQueue&&) = delete;
    ConcurrentQueue& operator=(ConcurrentQueue&&) = delete;

    /**
     * @brief Append a copy of @p value at the tail.
     * @throws std::bad_alloc If allocation fails; the queue is left unchanged.
     */
    void push(const T& value) { emplace(value); }

    /**
     * @brief Append @p value at the tail by moving it.
     * @throws std::bad_alloc If allocation fails; the queue is left unchanged.
     */
    void push(T&& value) { emplace(std::move(value)); }

    /**
     * @brief Append a value constructed in place from @p args.
     *
     * Always succeeds once the cell is allocated; may retry internally under contention.
     *
     * @throws std::bad_alloc, or whatever the constructor of @p T throws. Nothing is published in
     * that case.
     */
    template <class... Args>
    void emplace(Args&&... args);

    /**
     * @brief Remove and return the value at the head.
     * @return The oldest value, or std::nullopt if the queue was observed empty.
     *
     * @throws std::bad_alloc Only when this thread has to register a new reclamation record,
     * before the queue is touched. Once a value is unlinked nothing on the removal path
     * allocates. If the move constructor of @p T throws, the value is consumed and destroyed,
     * the exception propagates and the queue stays consistent.
     */
    std::optional<T> pop();

    /**
     * @brief Approximate number of values in the queue.
     *
     * The counter is maintained separately from the link protocol and is eventually consistent:
     * it is exact once all concurrent operations have returned, but a reading taken while
     * operations are in flight may lag either way. Do not use it for synchronization.
     */
    std::size_t size() const noexcept;

    /** @brief Queue length; alias of @ref size. */
    std::size_t len() const noexcept { return size(); }

    /** @brief Equivalent to `size() == 0`; carries the same caveats as @ref size. */
    bool is_empty() const noexcept { return size() == 0; }

    /**
     * @brief Run a reclamation pass on the queue's manager.
     * @return Number of retired cells freed by this call.
     */
    std::size_t try_reclaim() { return ebr_->try_reclaim(); }

    /** @brief Size in bytes of one cell allocation. */
    static constexpr std::size_t cell_size_bytes() noexcept { return sizeof(Cell); }

   private:
    void delete_chain(Cell* first) noexcept;

    std::unique_ptr<EBRManager> owned_ebr_;
    EBRManager* ebr_;

    alignas(config::CACHE_LINE_SIZE) std::atomic<Cell*> head_;
    alignas(config::CACHE_LINE_SIZE) std::atomic<Cell*> tail_;
    alignas(config::CACHE_LINE_SIZE) std::atomic<std::int64_t> approx_count_;
};

extern template class ConcurrentQueue<std::uint64_t>;
extern template class ConcurrentQueue<std::uint32_t>;

}  // namespace lfq

#include <lfq/detail/concurrent_queue_impl.hpp>

#endif  // LFQ_CONCURRENT_QUEUE_HPP_
