#pragma once

#include "mbench/mbench.hpp"

#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <memory>
#include <stdexcept>
#include <utility>
#include <variant>
#include <vector>

namespace mbench::test {

// =========================================================
// 模拟时钟
// =========================================================
// 时间只在两种情况下前进：每次读取推进 tick_per_read，被测函数调用
// advance()。读数按 quantum 向下取整，quantum == 0 表示不量化。
// 测试因此与机器负载无关，完全可复现。
class SimulatedClock {
public:
  SimulatedClock(double quantum_ms, double tick_per_read_ms)
      : quantum_ms_(quantum_ms), tick_per_read_ms_(tick_per_read_ms) {}

  double read() {
    now_ms_ += tick_per_read_ms_;
    if (quantum_ms_ <= 0.0)
      return now_ms_;
    return std::floor(now_ms_ / quantum_ms_) * quantum_ms_;
  }

  void advance(double ms) { now_ms_ += ms; }

  // 注意：返回的候选引用 this，时钟必须活得比引擎久
  [[nodiscard]] ClockCandidate candidate(ClockKind kind = ClockKind::Perf) {
    return {kind, [this] { return read(); }};
  }

private:
  double quantum_ms_;
  double tick_per_read_ms_;
  double now_ms_ = 0.0;
};

// 恒定读数的时钟：探测永远失败
inline ClockCandidate frozen_candidate(ClockKind kind = ClockKind::Perf,
                                       double value = 42.0) {
  return {kind, [value] { return value; }};
}

// 每次调用把模拟时钟推进 cost_ms，并返回种子相关的值
inline BenchmarkFn simulated_workload(SimulatedClock &clock, double cost_ms,
                                      int64_t *calls = nullptr) {
  return [&clock, cost_ms, calls](int32_t seed) -> BenchmarkValue {
    clock.advance(cost_ms);
    if (calls != nullptr)
      ++*calls;
    return static_cast<int64_t>(seed) * 3 + 1;
  };
}

inline Engine make_engine(RuntimeProfile profile,
                          std::vector<ClockCandidate> clocks,
                          BenchmarkOptions defaults = {}) {
  Engine::Settings s;
  s.profile = profile;
  s.clocks = std::move(clocks);
  s.defaults = defaults;
  return Engine(std::move(s));
}

// 取出成功结果 (按值返回，outcome 常是临时对象)；失败则当前测试直接终止
inline BenchmarkResult expect_result(const BenchmarkOutcome &outcome) {
  const auto *r = std::get_if<BenchmarkResult>(&outcome);
  EXPECT_NE(r, nullptr) << "expected a result for '" << outcome_name(outcome)
                        << "'";
  if (r == nullptr)
    throw std::runtime_error("outcome is an error record");
  return *r;
}

// 所有输出字段都必须是有限值
inline void verify_finite(const BenchmarkResult &r) {
  for (double v : {r.warmup_ms, r.total_ms, r.mean_ms, r.median_ms, r.p95_ms,
                   r.min_ms, r.max_ms, r.ns_per_op, r.ops_per_sec,
                   r.clock_resolution_ms, r.target_sample_ms}) {
    EXPECT_TRUE(std::isfinite(v)) << "non-finite field in " << r.name;
  }
}

// 统计量之间的单调关系
inline void verify_ordering(const BenchmarkResult &r) {
  if (r.measured_iterations == 0)
    return;
  EXPECT_LE(r.min_ms, r.median_ms);
  EXPECT_LE(r.median_ms, r.p95_ms);
  EXPECT_LE(r.p95_ms, r.max_ms);
  EXPECT_LE(r.min_ms, r.mean_ms);
  EXPECT_LE(r.mean_ms, r.max_ms);
}

} // namespace mbench::test
