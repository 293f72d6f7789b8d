#pragma once

#include "mbench/config.hpp"
#include "mbench/core/accumulator.hpp"
#include "mbench/core/clock.hpp"
#include "mbench/core/recorder.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <functional>

namespace mbench {

// =========================================================
// 批执行
// =========================================================
// 连续调用 fn batch_size 次，每次的返回值都折叠进累加器。
template <typename Fn>
MBENCH_ALWAYS_INLINE void run_batch(Fn &fn, int64_t batch_size,
                                    AccumulatorState &acc) {
  for (int64_t i = 0; i < batch_size; ++i) {
    acc.fold(std::invoke(fn, acc.next_seed()));
  }
  do_not_optimize(acc.sink);
}

// 计时执行一个批次，返回耗时 (ms)
template <typename Fn>
[[nodiscard]] MBENCH_ALWAYS_INLINE double
time_batch(Fn &fn, int64_t batch_size, AccumulatorState &acc,
           const ClockSource &clock) {
  const double start = clock.now();
  run_batch(fn, batch_size, acc);
  return clock.now() - start;
}

/**
 * @brief 测量阶段预算封顶。
 *
 * 预计总耗时 calibration_elapsed_ms * measured 超出预算时，缩减到
 * ceil(预算 / 单样本耗时)，下限 MIN_MEASURED_ITERATIONS，且永不超过
 * 原始 measured。预算或单样本耗时非正时不做缩减。
 */
[[nodiscard]] inline int
cap_measured_iterations(int measured, double calibration_elapsed_ms,
                        double max_measured_total_ms) noexcept {
  if (calibration_elapsed_ms <= 0.0 || max_measured_total_ms <= 0.0)
    return measured;

  const double estimated_total = calibration_elapsed_ms * measured;
  if (estimated_total <= max_measured_total_ms)
    return measured;

  const auto scaled = static_cast<int>(
      std::ceil(max_measured_total_ms / calibration_elapsed_ms));
  return std::min(measured,
                  std::max(Defaults::MIN_MEASURED_ITERATIONS, scaled));
}

// 以固定批大小采集 count 个样本
template <typename Fn>
void run_samples(Fn &fn, AccumulatorState &acc, const ClockSource &clock,
                 int64_t batch_size, int count, SampleRecorder &recorder) {
  recorder.reserve(static_cast<std::size_t>(std::max(count, 0)));
  for (int i = 0; i < count; ++i) {
    recorder.record(time_batch(fn, batch_size, acc, clock));
  }
}

} // namespace mbench
