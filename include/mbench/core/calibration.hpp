#pragma once

#include "mbench/config.hpp"
#include "mbench/core/clock.hpp"
#include "mbench/core/recorder.hpp"
#include "mbench/core/sampler.hpp"
#include "mbench/core/warmup.hpp"
#include "mbench/types.hpp"

#include <algorithm>
#include <cmath>
#include <cstdint>
#include <memory>
#include <string_view>
#include <vector>

namespace mbench {

// 运行目标：完整算法 或 受限环境下的低开销算法
enum class RuntimeProfile { Full, Constrained };

[[nodiscard]] constexpr std::string_view to_string(RuntimeProfile p) noexcept {
  return p == RuntimeProfile::Full ? "full" : "constrained";
}

struct CalibrationResult {
  int64_t batch_size = 1;
  double elapsed_ms = 0.0;
  int attempts = 0;
};

// 单样本目标时长 = clamp(分辨率 * 50, 20, 100)
[[nodiscard]] inline double target_sample_ms(double resolution_ms) noexcept {
  return std::clamp(resolution_ms * Defaults::RESOLUTION_TARGET_FACTOR,
                    Defaults::MIN_TARGET_SAMPLE_MS,
                    Defaults::MAX_TARGET_SAMPLE_MS);
}

// 批大小上限：同时保证 inner * batch <= MAX_OPS_PER_SAMPLE，至少为 1
[[nodiscard]] inline int64_t max_batch_size(int64_t inner_iterations) noexcept {
  if (inner_iterations <= 0)
    return Defaults::MAX_BATCH_SIZE;
  const int64_t by_ops = Defaults::MAX_OPS_PER_SAMPLE / inner_iterations;
  if (by_ops <= 0)
    return 1;
  return std::min(Defaults::MAX_BATCH_SIZE, by_ops);
}

// 比例放大：至少 +1 保证前进，且不超过上限
[[nodiscard]] inline int64_t grow_batch(int64_t batch_size, double elapsed_ms,
                                        double target_ms, double resolution_ms,
                                        int64_t max_batch) noexcept {
  if (elapsed_ms <= 0.0) {
    // 低于时钟分辨率：用替代值保证除法有定义
    elapsed_ms = std::max(resolution_ms, Defaults::FALLBACK_RESOLUTION_MS);
  }
  const double scale = target_ms / elapsed_ms;
  const double wanted = std::ceil(static_cast<double>(batch_size) * scale);
  const auto scaled = wanted >= static_cast<double>(max_batch)
                          ? max_batch
                          : static_cast<int64_t>(wanted);
  return std::min(max_batch, std::max(batch_size + 1, scaled));
}

/**
 * @brief 分辨率感知校准 (完整路径)。
 *
 * 从 batch = 1 开始，每轮按 target / elapsed 比例放大，最多
 * CALIBRATION_ATTEMPTS 轮。预算耗尽时接受最后一次尝试。
 * 若最后一次测得 elapsed <= 0，返回的 elapsed 为替代值。
 */
template <typename Fn>
CalibrationResult calibrate_proportional(Fn &fn, AccumulatorState &acc,
                                         const ClockSource &clock,
                                         double target_ms, double resolution_ms,
                                         int64_t max_batch) {
  CalibrationResult r;
  for (int attempt = 0; attempt < Defaults::CALIBRATION_ATTEMPTS; ++attempt) {
    r.attempts = attempt + 1;
    r.elapsed_ms = time_batch(fn, r.batch_size, acc, clock);
    if (r.elapsed_ms >= target_ms)
      break;
    if (attempt + 1 == Defaults::CALIBRATION_ATTEMPTS)
      break; // 最后一轮测得的 batch 即为结果，不再放大
    if (r.elapsed_ms <= 0.0)
      r.elapsed_ms = std::max(resolution_ms, Defaults::FALLBACK_RESOLUTION_MS);
    r.batch_size = grow_batch(r.batch_size, r.elapsed_ms, target_ms,
                              resolution_ms, max_batch);
  }
  if (r.elapsed_ms <= 0.0)
    r.elapsed_ms = std::max(resolution_ms, Defaults::FALLBACK_RESOLUTION_MS);
  return r;
}

/**
 * @brief 倍增校准 (受限路径)。
 *
 * 固定目标，不足则 batch 翻倍；超过 DOUBLING_MAX_BATCH 时截断并结束，
 * 最多 DOUBLING_ATTEMPTS 轮。循环体只有一次计时和一次比较。
 */
template <typename Fn>
CalibrationResult calibrate_doubling(Fn &fn, AccumulatorState &acc,
                                     const ClockSource &clock,
                                     double target_ms) {
  CalibrationResult r;
  for (int attempt = 0; attempt < Defaults::DOUBLING_ATTEMPTS; ++attempt) {
    r.attempts = attempt + 1;
    r.elapsed_ms = time_batch(fn, r.batch_size, acc, clock);
    if (r.elapsed_ms >= target_ms)
      break;
    r.batch_size *= 2;
    if (r.batch_size > Defaults::DOUBLING_MAX_BATCH) {
      r.batch_size = Defaults::DOUBLING_MAX_BATCH;
      break;
    }
  }
  return r;
}

// =========================================================
// 校准策略接口
// =========================================================
// 两条路径在时钟选择、预热、校准、测量次数与统计方式上都不同，
// 引擎只按固定流程调用本接口。
class CalibrationStrategy {
public:
  virtual ~CalibrationStrategy() = default;

  [[nodiscard]] virtual RuntimeProfile profile() const noexcept = 0;

  [[nodiscard]] virtual ClockSource
  establish_clock(const std::vector<ClockCandidate> &candidates) const = 0;

  [[nodiscard]] virtual double
  target_sample_ms(const ClockSource &clock) const = 0;

  // 执行预热，返回报告用的 warmup_ms
  virtual double warmup(BenchmarkFn &fn, AccumulatorState &acc,
                        const ClockSource &clock, const ResolvedOptions &opts,
                        double target_ms) const = 0;

  [[nodiscard]] virtual CalibrationResult
  calibrate(BenchmarkFn &fn, AccumulatorState &acc, const ClockSource &clock,
            double target_ms, int64_t inner_iterations) const = 0;

  [[nodiscard]] virtual int
  measured_iterations(const CalibrationResult &calibration,
                      const ResolvedOptions &opts) const = 0;

  [[nodiscard]] virtual SampleRecorder::Mode recorder_mode() const noexcept = 0;

  [[nodiscard]] virtual Summary
  summarize(const SampleRecorder &recorder) const = 0;
};

class ResolutionAwareCalibration final : public CalibrationStrategy {
public:
  RuntimeProfile profile() const noexcept override {
    return RuntimeProfile::Full;
  }

  ClockSource
  establish_clock(const std::vector<ClockCandidate> &candidates) const override {
    ClockSource clock = ClockSource::select(candidates);
    clock.estimate_resolution();
    return clock;
  }

  double target_sample_ms(const ClockSource &clock) const override {
    return mbench::target_sample_ms(clock.resolution_ms());
  }

  // 两阶段：先按次数，再按时间盒
  double warmup(BenchmarkFn &fn, AccumulatorState &acc,
                const ClockSource &clock, const ResolvedOptions &opts,
                double target_ms) const override {
    const double warmup_ms =
        opts.warmup_ms.value_or(std::max(Defaults::MIN_WARMUP_MS, target_ms));
    warmup_by_count(fn, acc, opts.warmup_iterations);
    warmup_time_boxed(fn, acc, clock, warmup_ms,
                      warmup_time_box_limit(opts.warmup_iterations));
    return warmup_ms;
  }

  CalibrationResult calibrate(BenchmarkFn &fn, AccumulatorState &acc,
                              const ClockSource &clock, double target_ms,
                              int64_t inner_iterations) const override {
    return calibrate_proportional(fn, acc, clock, target_ms,
                                  clock.resolution_ms(),
                                  max_batch_size(inner_iterations));
  }

  int measured_iterations(const CalibrationResult &calibration,
                          const ResolvedOptions &opts) const override {
    return cap_measured_iterations(opts.measured_iterations,
                                   calibration.elapsed_ms,
                                   opts.max_measured_total_ms);
  }

  SampleRecorder::Mode recorder_mode() const noexcept override {
    return SampleRecorder::Mode::Keep;
  }

  Summary summarize(const SampleRecorder &recorder) const override {
    return recorder.summarize_sorted();
  }
};

class FixedDoublingCalibration final : public CalibrationStrategy {
public:
  RuntimeProfile profile() const noexcept override {
    return RuntimeProfile::Constrained;
  }

  // 探测本身的开销会干扰受限目标上的测量
  ClockSource
  establish_clock(const std::vector<ClockCandidate> &candidates) const override {
    return ClockSource::first_available(candidates);
  }

  double target_sample_ms(const ClockSource &) const override {
    return Defaults::DOUBLING_TARGET_MS;
  }

  double warmup(BenchmarkFn &fn, AccumulatorState &acc, const ClockSource &,
                const ResolvedOptions &opts, double) const override {
    warmup_by_count(fn, acc, opts.warmup_iterations);
    return 0.0;
  }

  CalibrationResult calibrate(BenchmarkFn &fn, AccumulatorState &acc,
                              const ClockSource &clock, double target_ms,
                              int64_t) const override {
    return calibrate_doubling(fn, acc, clock, target_ms);
  }

  int measured_iterations(const CalibrationResult &,
                          const ResolvedOptions &opts) const override {
    return opts.measured_iterations;
  }

  SampleRecorder::Mode recorder_mode() const noexcept override {
    return SampleRecorder::Mode::Streaming;
  }

  Summary summarize(const SampleRecorder &recorder) const override {
    return recorder.summarize_streaming();
  }
};

[[nodiscard]] inline std::unique_ptr<CalibrationStrategy>
make_strategy(RuntimeProfile profile) {
  if (profile == RuntimeProfile::Constrained)
    return std::make_unique<FixedDoublingCalibration>();
  return std::make_unique<ResolutionAwareCalibration>();
}

} // namespace mbench
