/**
 * @file backoff.hpp
 * @brief Bounded exponential backoff used between failed CAS retries.
 * @author lfq contributors
 * @version 0.1.0
 */

#ifndef LFQ_BACKOFF_HPP_
#define LFQ_BACKOFF_HPP_

#include <cstdint>

#include <lfq/config.hpp>
#include <lfq/detail/platform.hpp>

namespace lfq {

/**
 * @class Backoff
 * @brief Exponential spin backoff with a hard cap.
 *
 * Each @ref spin executes @ref current_delay CPU relax instructions and then doubles the delay,
 * saturating at @ref max_delay. The thread never sleeps or yields to the scheduler, so the wake-up
 * latency after contention clears is at most one capped spin.
 *
 * Thread-safety: none. A Backoff is a plain value meant to live on the stack of a single
 * operation; construct a fresh one (or call @ref reset) at the start of every retry loop.
 *
 * Example:
 * @code
 * lfq::Backoff backoff;
 * while (!slot.compare_exchange_weak(expected, desired)) {
 *     backoff.spin();
 * }
 * @endcode
 */
class Backoff {
   public:
    /**
     * @brief Construct a backoff helper.
     * @param initial_delay Relax instructions for the first spin (0 is treated as 1).
     * @param max_delay Cap for a single spin (raised to @p initial_delay if smaller).
     */
    explicit Backoff(std::uint32_t initial_delay = config::BACKOFF_INITIAL_DELAY,
                     std::uint32_t max_delay = config::BACKOFF_MAX_DELAY) noexcept
        : initial_delay_(initial_delay == 0 ? 1u : initial_delay),
          max_delay_(max_delay < initial_delay_ ? initial_delay_ : max_delay),
          current_delay_(initial_delay_) {}

    /** @brief Busy-wait for the current delay, then double it up to the cap. */
    void spin() noexcept {
        for (std::uint32_t i = 0; i < current_delay_; ++i) {
            detail::cpu_relax();
        }
        current_delay_ = (current_delay_ > max_delay_ / 2) ? max_delay_ : current_delay_ * 2;
    }

    /** @brief Restore the delay to its initial value. */
    void reset() noexcept { current_delay_ = initial_delay_; }

    /** @brief Relax instructions the next @ref spin will execute. */
    std::uint32_t current_delay() const noexcept { return current_delay_; }

    /** @brief Upper bound for a single @ref spin. */
    std::uint32_t max_delay() const noexcept { return max_delay_; }

   private:
    std::uint32_t initial_delay_;
    std::uint32_t max_delay_;
    std::uint32_t current_delay_;
};

}  // namespace lfq

#endif  // LFQ_BACKOFF_HPP_
