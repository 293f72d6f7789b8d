#pragma once

#include <algorithm>
#include <cmath>
#include <cstddef>
#include <cstdint>
#include <limits>
#include <vector>

namespace mbench {

// 样本统计 (单位：毫秒)
struct Summary {
  std::size_t count = 0;
  double total_ms = 0.0;
  double mean_ms = 0.0;
  double median_ms = 0.0;
  double p95_ms = 0.0;
  double min_ms = 0.0;
  double max_ms = 0.0;
};

// 吞吐指标
// total_ops 用 double：inner_iterations 没有上限，整数乘积可能溢出
struct Throughput {
  double total_ops = 0.0;
  double ns_per_op = 0.0;
  double ops_per_sec = 0.0;
};

/**
 * @brief 已排序数组上的百分位：累计占比首次达到 p 的最小下标。
 *
 * idx = clamp(ceil(p * n) - 1, 0, n - 1)。n == 1 时恒返回唯一元素；
 * 空数组返回 0。
 */
[[nodiscard]] inline double percentile_from_sorted(const std::vector<double> &sorted,
                                                   double p) noexcept {
  const std::size_t n = sorted.size();
  if (n == 0)
    return 0.0;
  const auto rank =
      static_cast<int64_t>(std::ceil(p * static_cast<double>(n))) - 1;
  const auto idx = std::min<int64_t>(static_cast<int64_t>(n) - 1,
                                     std::max<int64_t>(0, rank));
  return sorted[static_cast<std::size_t>(idx)];
}

[[nodiscard]] inline Throughput compute_throughput(int64_t inner_iterations,
                                                   int64_t batch_size,
                                                   int64_t measured_iterations,
                                                   double total_ms) noexcept {
  Throughput t;
  t.total_ops = static_cast<double>(inner_iterations) *
                static_cast<double>(batch_size) *
                static_cast<double>(measured_iterations);
  t.ns_per_op = t.total_ops > 0.0 ? (total_ms * 1'000'000.0) / t.total_ops : 0.0;
  t.ops_per_sec = total_ms > 0.0 ? t.total_ops / (total_ms / 1000.0) : 0.0;
  return t;
}

// =========================================================
// 样本记录器
// =========================================================
// 两种模式：
// - Keep: 保留全部样本，可排序求中位数 / p95 (完整路径)
// - Streaming: 只维护 total/min/max，零分配 (受限路径)
class SampleRecorder {
public:
  enum class Mode { Keep, Streaming };

  explicit SampleRecorder(Mode mode = Mode::Keep) : mode_(mode) {}

  void reserve(std::size_t n) {
    if (mode_ == Mode::Keep)
      samples_.reserve(n);
  }

  void record(double elapsed_ms) {
    count_++;
    total_ms_ += elapsed_ms;
    if (elapsed_ms < min_ms_)
      min_ms_ = elapsed_ms;
    if (elapsed_ms > max_ms_)
      max_ms_ = elapsed_ms;
    if (mode_ == Mode::Keep)
      samples_.push_back(elapsed_ms);
  }

  [[nodiscard]] std::size_t count() const noexcept { return count_; }
  [[nodiscard]] Mode mode() const noexcept { return mode_; }
  [[nodiscard]] const std::vector<double> &samples() const noexcept {
    return samples_;
  }

  /**
   * @brief 完整统计：排序后取中位数与 p95。
   *
   * Streaming 模式下没有原始样本，退化为 summarize_streaming()。
   */
  [[nodiscard]] Summary summarize_sorted() const {
    if (mode_ == Mode::Streaming || count_ == 0)
      return summarize_streaming();

    std::vector<double> sorted = samples_;
    std::sort(sorted.begin(), sorted.end());

    Summary s;
    s.count = count_;
    s.total_ms = total_ms_;
    s.mean_ms = total_ms_ / static_cast<double>(count_);
    s.median_ms = percentile_from_sorted(sorted, 0.5);
    s.p95_ms = percentile_from_sorted(sorted, 0.95);
    s.min_ms = sorted.front();
    s.max_ms = sorted.back();
    return s;
  }

  // 近似统计：median 取 mean，p95 取 max，不排序
  [[nodiscard]] Summary summarize_streaming() const noexcept {
    Summary s;
    if (count_ == 0)
      return s;
    s.count = count_;
    s.total_ms = total_ms_;
    s.mean_ms = total_ms_ / static_cast<double>(count_);
    s.median_ms = s.mean_ms;
    s.p95_ms = max_ms_;
    s.min_ms = min_ms_;
    s.max_ms = max_ms_;
    return s;
  }

  void reset() {
    count_ = 0;
    total_ms_ = 0.0;
    min_ms_ = std::numeric_limits<double>::max();
    max_ms_ = std::numeric_limits<double>::lowest();
    samples_.clear();
  }

private:
  Mode mode_;
  std::size_t count_ = 0;
  double total_ms_ = 0.0;
  double min_ms_ = std::numeric_limits<double>::max();
  double max_ms_ = std::numeric_limits<double>::lowest();
  std::vector<double> samples_;
};

} // namespace mbench
