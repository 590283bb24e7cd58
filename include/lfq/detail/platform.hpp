#pragma once

#include <atomic>
#include <cstddef>
#include <cstdint>
#include <lfq/config.hpp>

#if (LFQ_ARCH_X86_64 || LFQ_ARCH_X86_32) && LFQ_COMPILER_MSVC
#include <intrin.h>
#elif LFQ_ARCH_ARM64 && LFQ_COMPILER_MSVC
#include <intrin.h>
#endif

namespace lfq::detail {

inline bool is_cache_aligned(const void* ptr) noexcept {
    return (reinterpret_cast<std::uintptr_t>(ptr) & (config::CACHE_LINE_SIZE - 1)) == 0;
}

// Spin-wait hint: lets the core back off the memory bus without yielding the time slice.
inline void cpu_relax() noexcept {
#if (LFQ_ARCH_X86_64 || LFQ_ARCH_X86_32)
#if LFQ_COMPILER_MSVC
    _mm_pause();
#else
    __builtin_ia32_pause();
#endif
#elif LFQ_ARCH_ARM64
#if LFQ_COMPILER_MSVC
    __yield();
#else
    __asm__ __volatile__("yield" ::: "memory");
#endif
#else
    // Unknown target: at least keep the compiler from collapsing the spin loop.
    std::atomic_signal_fence(std::memory_order_seq_cst);
#endif
}

}  // namespace lfq::detail
