#pragma once

// 内联控制宏：热路径强制内联，被测辅助函数禁止内联
#if defined(_MSC_VER)
#define MBENCH_ALWAYS_INLINE __forceinline
#define MBENCH_NOINLINE __declspec(noinline)
#elif defined(__GNUC__) || defined(__clang__)
#define MBENCH_ALWAYS_INLINE __attribute__((always_inline)) inline
#define MBENCH_NOINLINE __attribute__((noinline))
#else
#define MBENCH_ALWAYS_INLINE inline
#define MBENCH_NOINLINE
#endif
