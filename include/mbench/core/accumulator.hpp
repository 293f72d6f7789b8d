#pragma once

#include "mbench/macros.hpp"
#include "mbench/types.hpp"

#include <cmath>
#include <cstdint>
#include <string>
#include <variant>

namespace mbench {

/**
 * @brief 告诉编译器该变量被"使用"了，防止被优化掉。
 * "r,m": 输入可以是寄存器或内存；"memory": 禁止读写重排越过此处
 */
template <typename T>
MBENCH_ALWAYS_INLINE void do_not_optimize(T &&value) noexcept {
#if defined(__clang__) || defined(__GNUC__)
  asm volatile("" : : "r,m"(value) : "memory");
#else
  static volatile char sink;
  const char *p = reinterpret_cast<const char *>(&value);
  sink = *p;
#endif
}

// =========================================================
// 累加器 (Accumulator Sink)
// =========================================================
// 每次被测函数调用的返回值都要折叠进 sink，否则优化器可以把整个
// 调用当作死代码删掉。seed 逐次 +1，保证相邻调用输入不同。
// 两者都按 2^32 取模回绕，永不溢出、永不抛异常。
// 生命周期：一次基准运行。
struct AccumulatorState {
  std::int32_t seed = 1;
  std::uint32_t sink = 0;

  MBENCH_ALWAYS_INLINE std::int32_t next_seed() noexcept {
    const std::int32_t current = seed;
    seed = static_cast<std::int32_t>(static_cast<std::uint32_t>(seed) + 1u);
    return current;
  }

  MBENCH_ALWAYS_INLINE void fold(std::int64_t v) noexcept {
    sink += static_cast<std::uint32_t>(v);
  }

  MBENCH_ALWAYS_INLINE void fold(double v) noexcept {
    if (!std::isfinite(v))
      return;
    // 先截断到 (-2^32, 2^32)，再转整数，避免超范围转换的 UB
    const double reduced = std::fmod(std::trunc(v), 4294967296.0);
    sink += static_cast<std::uint32_t>(static_cast<std::int64_t>(reduced));
  }

  void fold(const BenchmarkValue &value) {
    struct Visitor {
      AccumulatorState &acc;
      void operator()(std::monostate) const noexcept {}
      void operator()(std::int64_t v) const noexcept { acc.fold(v); }
      void operator()(double v) const noexcept { acc.fold(v); }
      void operator()(const std::string &s) const noexcept {
        acc.sink += static_cast<std::uint32_t>(s.size());
      }
      void operator()(Structured) const noexcept { acc.sink += 1u; }
    };
    std::visit(Visitor{*this}, value);
  }
};

} // namespace mbench
