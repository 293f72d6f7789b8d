#pragma once

#include "mbench/config.hpp"
#include "mbench/core/accumulator.hpp"
#include "mbench/core/calibration.hpp"
#include "mbench/core/clock.hpp"
#include "mbench/core/recorder.hpp"
#include "mbench/core/sampler.hpp"
#include "mbench/types.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace mbench {

inline constexpr const char *MISSING_BENCHMARK = "missing benchmark";

struct BenchmarkSpec {
  std::string name;
  BenchmarkFn run;
  int64_t inner_iterations = 1;
  BenchmarkOptions options{};
};

struct BenchmarkResult {
  std::string name;
  int warmup_iterations = 0;
  int measured_iterations = 0;
  int64_t inner_iterations = 0;
  int64_t batch_size = 1;
  double warmup_ms = 0.0;

  double total_ms = 0.0;
  double mean_ms = 0.0;
  double median_ms = 0.0;
  double p95_ms = 0.0;
  double min_ms = 0.0;
  double max_ms = 0.0;

  double ns_per_op = 0.0;
  double ops_per_sec = 0.0;

  std::string clock_source;
  double clock_resolution_ms = 0.0;
  double target_sample_ms = 0.0;

  RuntimeProfile runtime = RuntimeProfile::Full;
  // 样本数少于 THIN_SAMPLE_THRESHOLD，p95 不具统计意义
  bool thin_sample = false;
};

struct BenchmarkError {
  std::string name;
  std::string error;
};

using BenchmarkOutcome = std::variant<BenchmarkResult, BenchmarkError>;

[[nodiscard]] inline const std::string &outcome_name(const BenchmarkOutcome &o) {
  return std::visit([](const auto &v) -> const std::string & { return v.name; },
                    o);
}

// =========================================================
// 测量引擎
// =========================================================
// 流程：选时钟 -> 预热 -> 校准批大小 -> 采样 -> 统计。
// 单线程同步执行；基准之间严格串行。
class Engine {
public:
  struct Settings {
    RuntimeProfile profile = RuntimeProfile::Full;
    BenchmarkOptions defaults{};          // 进程级覆盖项
    std::vector<ClockCandidate> clocks{}; // 为空时使用内置候选
    bool verbose = false;
  };

  Engine() : Engine(Settings{}) {}

  explicit Engine(Settings settings)
      : settings_(std::move(settings)),
        strategy_(make_strategy(settings_.profile)) {
    if (settings_.clocks.empty())
      settings_.clocks = default_clock_candidates();
  }

  [[nodiscard]] RuntimeProfile profile() const noexcept {
    return strategy_->profile();
  }

  [[nodiscard]] const BenchmarkOptions &defaults() const noexcept {
    return settings_.defaults;
  }

  /**
   * @brief 运行单个基准。
   *
   * 缺失的函数返回 BenchmarkError，不抛异常。
   * @throws std::invalid_argument inner_iterations <= 0 或配置为负 (调用方错误)
   */
  BenchmarkOutcome run(const BenchmarkSpec &spec) const {
    if (!spec.run)
      return BenchmarkError{spec.name, MISSING_BENCHMARK};
    if (spec.inner_iterations <= 0) {
      throw std::invalid_argument(fmt::format(
          "benchmark '{}': inner_iterations must be > 0, got {}", spec.name,
          spec.inner_iterations));
    }

    const ResolvedOptions opts =
        resolve_options(spec.options, settings_.defaults);

    // 每次运行都复制一份可调用对象与独立的累加器
    BenchmarkFn fn = spec.run;
    AccumulatorState acc;

    const ClockSource clock = strategy_->establish_clock(settings_.clocks);
    const double target_ms = strategy_->target_sample_ms(clock);
    log("[Clock] {}: source={} resolution={:.6f}ms target={:.1f}ms", spec.name,
        clock.source(), clock.resolution_ms(), target_ms);

    const double warmup_ms =
        strategy_->warmup(fn, acc, clock, opts, target_ms);

    const CalibrationResult calibration = strategy_->calibrate(
        fn, acc, clock, target_ms, spec.inner_iterations);
    const int measured = strategy_->measured_iterations(calibration, opts);
    log("[Calibrate] {}: batch={} elapsed={:.3f}ms attempts={} measured={}",
        spec.name, calibration.batch_size, calibration.elapsed_ms,
        calibration.attempts, measured);

    SampleRecorder recorder(strategy_->recorder_mode());
    run_samples(fn, acc, clock, calibration.batch_size, measured, recorder);
    do_not_optimize(acc.sink);

    const Summary summary = strategy_->summarize(recorder);
    const Throughput tp =
        compute_throughput(spec.inner_iterations, calibration.batch_size,
                           measured, summary.total_ms);

    BenchmarkResult r;
    r.name = spec.name;
    r.warmup_iterations = opts.warmup_iterations;
    r.measured_iterations = measured;
    r.inner_iterations = spec.inner_iterations;
    r.batch_size = calibration.batch_size;
    r.warmup_ms = warmup_ms;
    r.total_ms = summary.total_ms;
    r.mean_ms = summary.mean_ms;
    r.median_ms = summary.median_ms;
    r.p95_ms = summary.p95_ms;
    r.min_ms = summary.min_ms;
    r.max_ms = summary.max_ms;
    r.ns_per_op = tp.ns_per_op;
    r.ops_per_sec = tp.ops_per_sec;
    r.clock_source = std::string(clock.source());
    r.clock_resolution_ms = clock.resolution_ms();
    r.target_sample_ms = target_ms;
    r.runtime = strategy_->profile();
    r.thin_sample = measured < Defaults::THIN_SAMPLE_THRESHOLD;
    return r;
  }

private:
  template <typename... Args>
  void log(fmt::format_string<Args...> f, Args &&...args) const {
    if (settings_.verbose)
      fmt::print(stderr, "{}\n", fmt::format(f, std::forward<Args>(args)...));
  }

  Settings settings_;
  std::unique_ptr<CalibrationStrategy> strategy_;
};

} // namespace mbench
