/**
 * @file lfq.hpp
 * @brief Umbrella header for the lfq library.
 * @author lfq contributors
 * @version 0.1.0
 *
 * Pulls in the lock-free queue, its backoff helper and the reclamation manager.
 */

#ifndef LFQ_LFQ_HPP_
#define LFQ_LFQ_HPP_

#include <lfq/backoff.hpp>
#include <lfq/concurrent_queue.hpp>
#include <lfq/config.hpp>
#include <lfq/ebr.hpp>

#endif  // LFQ_LFQ_HPP_
