#pragma once

#include "mbench/config.hpp"
#include "mbench/core/accumulator.hpp"

#include <chrono>
#include <functional>
#include <limits>
#include <string_view>
#include <utility>
#include <vector>

namespace mbench {

enum class ClockKind { Perf, WallClock, None };

[[nodiscard]] constexpr std::string_view to_string(ClockKind kind) noexcept {
  switch (kind) {
  case ClockKind::Perf:
    return "perf";
  case ClockKind::WallClock:
    return "wallclock";
  case ClockKind::None:
    break;
  }
  return "none";
}

// 候选时间源：now() 单位毫秒
struct ClockCandidate {
  ClockKind kind;
  std::function<double()> now;
};

// =========================================================
// 内置候选
// =========================================================
namespace clocks {

// 高精度单调时钟
inline double steady_ms() noexcept {
  using namespace std::chrono;
  return duration<double, std::milli>(steady_clock::now().time_since_epoch())
      .count();
}

// 毫秒粒度墙钟 (粗精度回退)
inline double wall_ms() noexcept {
  using namespace std::chrono;
  return static_cast<double>(
      duration_cast<milliseconds>(system_clock::now().time_since_epoch())
          .count());
}

} // namespace clocks

// 按偏好顺序排列：高精度在前，墙钟在后
inline std::vector<ClockCandidate> default_clock_candidates() {
  return {{ClockKind::Perf, &clocks::steady_ms},
          {ClockKind::WallClock, &clocks::wall_ms}};
}

// =========================================================
// ClockSource
// =========================================================
class ClockSource {
public:
  // 常量 0 时钟：所有时长退化为 0，下游应视为"不可测"
  static ClockSource none() {
    return ClockSource(ClockKind::None, [] { return 0.0; }, 0.0);
  }

  /**
   * @brief 按偏好顺序选择第一个经实测确实在走的候选。
   *
   * 仅凭类型无法判断时钟是否可用（受限环境下的墙钟可能长时间冻结），
   * 因此对每个候选做若干轮 CPU 自旋，观察读数是否严格递增。
   */
  static ClockSource select(const std::vector<ClockCandidate> &candidates) {
    for (const auto &c : candidates) {
      if (c.now && probe(c.now)) {
        return ClockSource(c.kind, c.now, 0.0);
      }
    }
    return none();
  }

  // 受限目标：不探测，直接取第一个可用候选，也不估计分辨率
  static ClockSource first_available(
      const std::vector<ClockCandidate> &candidates) {
    for (const auto &c : candidates) {
      if (c.now) {
        return ClockSource(c.kind, c.now, 0.0);
      }
    }
    return none();
  }

  static bool probe(const std::function<double()> &now) {
    double last = now();
    for (int round = 0; round < Defaults::CLOCK_PROBE_ROUNDS; ++round) {
      int spin = 0;
      for (int i = 0; i < Defaults::CLOCK_PROBE_SPIN; ++i) {
        spin = spin + 1;
        do_not_optimize(spin);
      }
      const double current = now();
      if (current > last) {
        return true;
      }
      last = current;
    }
    return false;
  }

  // 连续读 1000 次，取最小正增量；一次正增量都没有则视为 1ms
  static double estimate_resolution(const std::function<double()> &now) {
    double last = now();
    double min_delta = std::numeric_limits<double>::infinity();
    for (int i = 0; i < Defaults::RESOLUTION_READS; ++i) {
      const double current = now();
      const double delta = current - last;
      if (delta > 0.0 && delta < min_delta) {
        min_delta = delta;
      }
      last = current;
    }
    return min_delta == std::numeric_limits<double>::infinity()
               ? Defaults::FALLBACK_RESOLUTION_MS
               : min_delta;
  }

  double estimate_resolution() {
    resolution_ms_ = estimate_resolution(now_);
    return resolution_ms_;
  }

  [[nodiscard]] double now() const { return now_(); }
  [[nodiscard]] ClockKind kind() const noexcept { return kind_; }
  [[nodiscard]] std::string_view source() const noexcept {
    return to_string(kind_);
  }
  [[nodiscard]] double resolution_ms() const noexcept { return resolution_ms_; }

private:
  ClockSource(ClockKind kind, std::function<double()> now, double resolution)
      : kind_(kind), now_(std::move(now)), resolution_ms_(resolution) {}

  ClockKind kind_;
  std::function<double()> now_;
  double resolution_ms_;
};

} // namespace mbench
