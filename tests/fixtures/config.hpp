#pragma once

#include "mbench/config.hpp"

namespace mbench::test {

// 测试配置常量
struct TestConfig {
  // 模拟时钟
  static constexpr double QUANTUM_MS = 1.0;     // 读数量化粒度
  static constexpr double TICK_PER_READ_MS = 0.2; // 每次读取自身推进的时间

  // 单次调用的模拟开销 (2 的负幂，累加无舍入误差)
  static constexpr double CHEAP_CALL_MS = 1.0 / 64.0;
  static constexpr double TINY_CALL_MS = 1.0 / 1024.0;
  static constexpr double SLOW_CALL_MS = 50.0;

  // 小预算，避免真实时钟测试拖慢整个测试集
  static constexpr int SMALL_MEASURED = 8;
  static constexpr double SMALL_BUDGET_MS = 200.0;
};

// 只覆盖测量次数与预算的轻量选项，供真实时钟测试使用
inline BenchmarkOptions small_options() {
  BenchmarkOptions o;
  o.warmup_iterations = 2;
  o.measured_iterations = TestConfig::SMALL_MEASURED;
  o.warmup_ms = 1.0;
  o.max_measured_total_ms = TestConfig::SMALL_BUDGET_MS;
  return o;
}

} // namespace mbench::test
