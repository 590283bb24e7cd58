/**
 * @file mutex_queue.hpp
 * @brief Mutex-based queue baseline implementation.
 * @author lfq contributors
 * @version 0.1.0
 *
 * This queue is provided as a reference/baseline for tests and benchmarks. It exposes the same
 * surface as @ref lfq::ConcurrentQueue.
 */

#ifndef LFQ_MUTEX_QUEUE_HPP_
#define LFQ_MUTEX_QUEUE_HPP_

#include <cstddef>
#include <mutex>
#include <optional>
#include <queue>
#include <utility>

namespace lfq {

/**
 * @class MutexQueue
 * @brief Simple queue protected by a single mutex (baseline).
 *
 * @tparam T Value type stored in the queue.
 *
 * Thread-safety: All public methods are thread-safe, but operations are blocking.
 *
 * Complexity: O(1) per operation (amortized), plus mutex contention.
 *
 * Example:
 * @code
 * lfq::MutexQueue<int> q;
 * q.push(1);
 * if (auto v = q.pop()) {
 *     // *v == 1
 * }
 * @endcode
 */
template <class T>
class MutexQueue {
   public:
    /** @brief Value type stored in the queue. */
    using value_type = T;

    MutexQueue() = default;

    MutexQueue(const MutexQueue&) = delete;
    MutexQueue& operator=(const MutexQueue&) = delete;
    MutexQueue(MutexQueue&&) = delete;
    MutexQueue& operator=(MutexQueue&&) = delete;

    /** @brief Enqueue a value by copying. */
    void push(const T& value) {
        std::lock_guard<std::mutex> lock(mu_);
        q_.push(value);
    }

    /** @brief Enqueue a value by moving. */
    void push(T&& value) {
        std::lock_guard<std::mutex> lock(mu_);
        q_.push(std::move(value));
    }

    /**
     * @brief Dequeue a value.
     * @return The oldest value, or std::nullopt if the queue was empty.
     */
    std::optional<T> pop() {
        std::lock_guard<std::mutex> lock(mu_);
        if (q_.empty()) {
            return std::nullopt;
        }
        std::optional<T> out(std::move(q_.front()));
        q_.pop();
        return out;
    }

    /** @brief Number of queued values. */
    std::size_t size() const {
        std::lock_guard<std::mutex> lock(mu_);
        return q_.size();
    }

    /** @brief Whether the queue is empty. */
    bool is_empty() const { return size() == 0; }

   private:
    mutable std::mutex mu_;
    std::queue<T> q_;
};

}  // namespace lfq

#endif  // LFQ_MUTEX_QUEUE_HPP_
