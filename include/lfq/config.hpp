/**
 * @file config.hpp
 * @brief Public configuration constants and build/target detection macros.
 * @author lfq contributors
 * @version 0.1.0
 *
 * This header is intentionally standalone and can be included by all public headers.
 *
 * Example:
 * @code
 * // Construct a backoff helper using the project default delays.
 * lfq::Backoff b(lfq::config::BACKOFF_INITIAL_DELAY, lfq::config::BACKOFF_MAX_DELAY);
 * @endcode
 */

#pragma once

#include <cstddef>
#include <cstdint>

/** @def LFQ_ENABLE_SANITIZERS
 * @brief Build-time toggle indicating sanitizer instrumentation is enabled.
 *
 * This macro is typically provided by CMake. Tests use it to shrink stress parameters, since
 * ThreadSanitizer slows atomic-heavy loops by an order of magnitude.
 */
#ifndef LFQ_ENABLE_SANITIZERS
#define LFQ_ENABLE_SANITIZERS 0
#endif

/** @def LFQ_PLATFORM_LINUX
 * @brief 1 on Linux (benchmarks pin threads there), otherwise 0.
 */
#if defined(__linux__)
#define LFQ_PLATFORM_LINUX 1
#else
#define LFQ_PLATFORM_LINUX 0
#endif

/** @def LFQ_ARCH_X86_64
 * @brief Defined to 1 when building for x86_64, otherwise 0.
 */
#if defined(_M_X64) || defined(__x86_64__)
#define LFQ_ARCH_X86_64 1
#else
#define LFQ_ARCH_X86_64 0
#endif

/** @def LFQ_ARCH_X86_32
 * @brief Defined to 1 when building for x86_32, otherwise 0.
 */
#if defined(_M_IX86) || defined(__i386__)
#define LFQ_ARCH_X86_32 1
#else
#define LFQ_ARCH_X86_32 0
#endif

/** @def LFQ_ARCH_ARM64
 * @brief Defined to 1 when building for AArch64/ARM64, otherwise 0.
 */
#if defined(_M_ARM64) || defined(_M_ARM64EC) || defined(__aarch64__) || defined(__arm64__)
#define LFQ_ARCH_ARM64 1
#else
#define LFQ_ARCH_ARM64 0
#endif

/** @def LFQ_COMPILER_MSVC
 * @brief Defined to 1 when building with MSVC, otherwise 0.
 */
#if defined(_MSC_VER)
#define LFQ_COMPILER_MSVC 1
#else
#define LFQ_COMPILER_MSVC 0
#endif

namespace lfq {

/** @brief ABI version for public headers (bumped on breaking changes). */
inline constexpr std::uint32_t kAbiVersion = 0;
/** @brief Whether sanitizers are enabled at build time. */
inline constexpr bool kEnableSanitizers = (LFQ_ENABLE_SANITIZERS != 0);

namespace config {

/** @brief Assumed destructive-interference size used to separate hot atomics. */
inline constexpr std::size_t CACHE_LINE_SIZE = 64;

/**
 * @brief Initial number of CPU relax instructions executed by the first @ref lfq::Backoff spin.
 */
inline constexpr std::uint32_t BACKOFF_INITIAL_DELAY = 1;

/**
 * @brief Upper bound on CPU relax instructions executed by a single @ref lfq::Backoff spin.
 *
 * @note 1024 pause instructions are roughly a microsecond on current x86 parts, which keeps the
 * worst-case retry latency well below a scheduler quantum.
 */
inline constexpr std::uint32_t BACKOFF_MAX_DELAY = 1024;

/**
 * @brief Number of retired pointers a participant record accumulates before the retiring thread
 * attempts an epoch advance and reclaims the record.
 */
inline constexpr std::size_t EBR_RECLAIM_THRESHOLD = 64;

}  // namespace config

}  // namespace lfq
