#pragma once

#include "mbench/config.hpp"
#include "mbench/core/sampler.hpp"

#include <algorithm>
#include <cstdint>
#include <limits>

namespace mbench {

// 按次数预热：iterations 个单次调用批，不计时
template <typename Fn>
void warmup_by_count(Fn &fn, AccumulatorState &acc, int iterations) {
  for (int i = 0; i < iterations; ++i) {
    run_batch(fn, 1, acc);
  }
}

// 时间盒预热的迭代上限，在 int64 中计算后截断到 int 范围
[[nodiscard]] constexpr int warmup_time_box_limit(int warmup_iterations) noexcept {
  const int64_t scaled = static_cast<int64_t>(warmup_iterations) *
                         Defaults::WARMUP_TIME_BOX_FACTOR;
  return static_cast<int>(std::clamp<int64_t>(
      scaled, Defaults::MIN_WARMUP_TIME_BOX, std::numeric_limits<int>::max()));
}

/**
 * @brief 时间盒预热：持续执行单次调用批，直到耗时达到 warmup_ms
 * 或迭代数达到 limit。
 *
 * 迭代上限保证时钟冻结时也能结束。返回实际执行的迭代数。
 */
template <typename Fn>
int warmup_time_boxed(Fn &fn, AccumulatorState &acc, const ClockSource &clock,
                      double warmup_ms, int limit) {
  const double start = clock.now();
  int executed = 0;
  for (; executed < limit; ++executed) {
    if (clock.now() - start >= warmup_ms)
      break;
    run_batch(fn, 1, acc);
  }
  return executed;
}

} // namespace mbench
