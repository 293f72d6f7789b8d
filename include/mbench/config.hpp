#pragma once

#include <cerrno>
#include <cstdint>
#include <cstdlib>
#include <optional>
#include <stdexcept>
#include <string>

namespace mbench {

// -----------------------------------------------------------------------------
// 硬编码默认值 (最后一级回退)
// -----------------------------------------------------------------------------
struct Defaults {
  // 预热 / 测量
  static constexpr int WARMUP_ITERATIONS = 20;
  static constexpr int MEASURED_ITERATIONS = 30;
  static constexpr double MIN_WARMUP_MS = 100.0;
  static constexpr int WARMUP_TIME_BOX_FACTOR = 10; // 时间盒预热上限 = 次数 * 10
  static constexpr int MIN_WARMUP_TIME_BOX = 50;

  // 单样本目标时长
  static constexpr double MIN_TARGET_SAMPLE_MS = 20.0;
  static constexpr double MAX_TARGET_SAMPLE_MS = 100.0;
  static constexpr double RESOLUTION_TARGET_FACTOR = 50.0;

  // 批大小约束
  static constexpr int64_t MAX_BATCH_SIZE = 1'000'000;
  static constexpr int64_t MAX_OPS_PER_SAMPLE = 5'000'000;
  static constexpr int CALIBRATION_ATTEMPTS = 20;

  // 测量阶段预算
  static constexpr double MAX_MEASURED_TOTAL_MS = 2000.0;
  static constexpr int MIN_MEASURED_ITERATIONS = 5;
  static constexpr int THIN_SAMPLE_THRESHOLD = 20; // 少于此数 p95 不可靠

  // 时钟探测
  static constexpr int CLOCK_PROBE_ROUNDS = 6;
  static constexpr int CLOCK_PROBE_SPIN = 20'000;
  static constexpr int RESOLUTION_READS = 1000;
  static constexpr double FALLBACK_RESOLUTION_MS = 1.0;

  // 受限目标 (倍增校准)
  static constexpr double DOUBLING_TARGET_MS = 20.0;
  static constexpr int64_t DOUBLING_MAX_BATCH = 10'000;
  static constexpr int DOUBLING_ATTEMPTS = 15;
};

// -----------------------------------------------------------------------------
// 基准配置项
// -----------------------------------------------------------------------------
// 未设置的字段依次回退到：进程级配置 -> Defaults
struct BenchmarkOptions {
  std::optional<int> warmup_iterations;
  std::optional<int> measured_iterations;
  std::optional<double> warmup_ms;
  std::optional<double> max_measured_total_ms;
};

// 合并后的有效配置。warmup_ms 依赖校准目标，由引擎在确定时钟后补齐
struct ResolvedOptions {
  int warmup_iterations = Defaults::WARMUP_ITERATIONS;
  int measured_iterations = Defaults::MEASURED_ITERATIONS;
  std::optional<double> warmup_ms;
  double max_measured_total_ms = Defaults::MAX_MEASURED_TOTAL_MS;
};

namespace detail {

template <typename T>
T pick(const std::optional<T> &local, const std::optional<T> &global,
       T fallback) {
  if (local)
    return *local;
  if (global)
    return *global;
  return fallback;
}

} // namespace detail

/**
 * @brief 按 BenchmarkSpec 自带选项 > 进程级选项 > 常量 的优先级合并配置。
 * @throws std::invalid_argument 任一数值为负
 */
inline ResolvedOptions resolve_options(const BenchmarkOptions &local,
                                       const BenchmarkOptions &global) {
  ResolvedOptions r;
  r.warmup_iterations = detail::pick(local.warmup_iterations,
                                     global.warmup_iterations,
                                     Defaults::WARMUP_ITERATIONS);
  r.measured_iterations = detail::pick(local.measured_iterations,
                                       global.measured_iterations,
                                       Defaults::MEASURED_ITERATIONS);
  r.max_measured_total_ms = detail::pick(local.max_measured_total_ms,
                                         global.max_measured_total_ms,
                                         Defaults::MAX_MEASURED_TOTAL_MS);
  r.warmup_ms = local.warmup_ms ? local.warmup_ms : global.warmup_ms;

  if (r.warmup_iterations < 0)
    throw std::invalid_argument("warmup_iterations must be >= 0");
  if (r.measured_iterations < 0)
    throw std::invalid_argument("measured_iterations must be >= 0");
  if (r.max_measured_total_ms < 0.0)
    throw std::invalid_argument("max_measured_total_ms must be >= 0");
  if (r.warmup_ms && *r.warmup_ms < 0.0)
    throw std::invalid_argument("warmup_ms must be >= 0");
  return r;
}

// -----------------------------------------------------------------------------
// 环境变量配置 (由外层 CLI 注入)
// -----------------------------------------------------------------------------
namespace env {

inline constexpr const char *WARMUP_ITERATIONS = "MBENCH_WARMUP_ITERATIONS";
inline constexpr const char *MEASURED_ITERATIONS = "MBENCH_MEASURED_ITERATIONS";
inline constexpr const char *WARMUP_MS = "MBENCH_WARMUP_MS";
inline constexpr const char *MAX_MEASURED_TOTAL_MS =
    "MBENCH_MAX_MEASURED_TOTAL_MS";
inline constexpr const char *FILTER = "MBENCH_FILTER";
inline constexpr const char *PROFILE = "MBENCH_PROFILE";
inline constexpr const char *CPU = "MBENCH_CPU";
inline constexpr const char *VERBOSE = "MBENCH_VERBOSE";

// 未设置或为空返回 nullopt
inline std::optional<std::string> get(const char *name) {
  const char *raw = std::getenv(name);
  if (raw == nullptr || *raw == '\0')
    return std::nullopt;
  return std::string(raw);
}

inline std::optional<int> get_int(const char *name) {
  auto raw = get(name);
  if (!raw)
    return std::nullopt;

  errno = 0;
  char *end = nullptr;
  const long v = std::strtol(raw->c_str(), &end, 10);
  if (errno != 0 || end == raw->c_str() || *end != '\0' || v < INT32_MIN ||
      v > INT32_MAX) {
    throw std::invalid_argument(std::string(name) + ": not an integer: '" +
                                *raw + "'");
  }
  return static_cast<int>(v);
}

inline std::optional<double> get_double(const char *name) {
  auto raw = get(name);
  if (!raw)
    return std::nullopt;

  errno = 0;
  char *end = nullptr;
  const double v = std::strtod(raw->c_str(), &end);
  if (errno != 0 || end == raw->c_str() || *end != '\0') {
    throw std::invalid_argument(std::string(name) + ": not a number: '" +
                                *raw + "'");
  }
  return v;
}

} // namespace env

/**
 * @brief 从环境变量读取进程级覆盖项。
 * @throws std::invalid_argument 变量存在但无法解析
 */
inline BenchmarkOptions options_from_env() {
  BenchmarkOptions o;
  o.warmup_iterations = env::get_int(env::WARMUP_ITERATIONS);
  o.measured_iterations = env::get_int(env::MEASURED_ITERATIONS);
  o.warmup_ms = env::get_double(env::WARMUP_MS);
  o.max_measured_total_ms = env::get_double(env::MAX_MEASURED_TOTAL_MS);
  return o;
}

} // namespace mbench
