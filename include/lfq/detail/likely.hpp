#pragma once

// Cold-branch hint for the re-validation checks in the queue's retry loops.
#if defined(__clang__) || defined(__GNUC__)
#define LFQ_UNLIKELY(x) (__builtin_expect(!!(x), 0))
#else
#define LFQ_UNLIKELY(x) (!!(x))
#endif
