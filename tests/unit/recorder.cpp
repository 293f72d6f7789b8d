#include "mbench/core/recorder.hpp"
#include "../fixtures/config.hpp"
#include "../fixtures/utils.hpp"
#include <gtest/gtest.h>

#include <cmath>
#include <cstdint>
#include <vector>

using namespace mbench;
using namespace mbench::test;

TEST(PercentileTest, EmptyIsZero) {
  EXPECT_EQ(percentile_from_sorted({}, 0.5), 0.0);
}

TEST(PercentileTest, SingleSampleForEveryP) {
  const std::vector<double> one{4.2};
  EXPECT_EQ(percentile_from_sorted(one, 0.0), 4.2);
  EXPECT_EQ(percentile_from_sorted(one, 0.5), 4.2);
  EXPECT_EQ(percentile_from_sorted(one, 0.95), 4.2);
  EXPECT_EQ(percentile_from_sorted(one, 1.0), 4.2);
}

TEST(PercentileTest, SmallestIndexReachingP) {
  const std::vector<double> four{1, 2, 3, 4};
  EXPECT_EQ(percentile_from_sorted(four, 0.5), 2);
  EXPECT_EQ(percentile_from_sorted(four, 0.95), 4);
  EXPECT_EQ(percentile_from_sorted(four, 0.0), 1);

  std::vector<double> thirty;
  for (int i = 1; i <= 30; ++i)
    thirty.push_back(i);
  EXPECT_EQ(percentile_from_sorted(thirty, 0.5), 15);
  EXPECT_EQ(percentile_from_sorted(thirty, 0.95), 29);

  const std::vector<double> five{10, 20, 30, 40, 50};
  EXPECT_EQ(percentile_from_sorted(five, 0.5), 30);
  EXPECT_EQ(percentile_from_sorted(five, 0.95), 50);
}

TEST(ThroughputTest, Basic) {
  // 10 * 100 * 5 = 5000 ops in 2ms
  const auto t = compute_throughput(10, 100, 5, 2.0);
  EXPECT_DOUBLE_EQ(t.total_ops, 5000.0);
  EXPECT_DOUBLE_EQ(t.ns_per_op, 400.0);
  EXPECT_DOUBLE_EQ(t.ops_per_sec, 2'500'000.0);
}

TEST(ThroughputTest, ZeroTimeIsZeroThroughput) {
  const auto t = compute_throughput(10, 100, 5, 0.0);
  EXPECT_EQ(t.ns_per_op, 0.0);
  EXPECT_EQ(t.ops_per_sec, 0.0);
}

TEST(ThroughputTest, ZeroSamplesIsZero) {
  const auto t = compute_throughput(10, 100, 0, 0.0);
  EXPECT_EQ(t.total_ops, 0.0);
  EXPECT_EQ(t.ns_per_op, 0.0);
  EXPECT_EQ(t.ops_per_sec, 0.0);
}

TEST(ThroughputTest, HugeInnerIterationsStayPositive) {
  const int64_t inner = int64_t{1} << 60;
  const auto t = compute_throughput(inner, 1, 30, 600.0);
  EXPECT_DOUBLE_EQ(t.total_ops, 30.0 * static_cast<double>(inner));
  EXPECT_GT(t.ops_per_sec, 0.0);
  EXPECT_TRUE(std::isfinite(t.ops_per_sec));
  EXPECT_DOUBLE_EQ(t.ops_per_sec, t.total_ops / 0.6);
  EXPECT_GT(t.ns_per_op, 0.0);
}

class RecorderTest : public ::testing::Test {
protected:
  void fill(SampleRecorder &r) {
    for (double v : {5.0, 1.0, 3.0, 2.0, 4.0})
      r.record(v);
  }
};

TEST_F(RecorderTest, ModeIsFixedAtConstruction) {
  EXPECT_EQ(SampleRecorder().mode(), SampleRecorder::Mode::Keep);
  SampleRecorder streaming(SampleRecorder::Mode::Streaming);
  EXPECT_EQ(streaming.mode(), SampleRecorder::Mode::Streaming);
  streaming.record(1.0);
  streaming.reset();
  EXPECT_EQ(streaming.mode(), SampleRecorder::Mode::Streaming);
}

TEST_F(RecorderTest, EmptySummaryIsZero) {
  SampleRecorder r;
  const auto s = r.summarize_sorted();
  EXPECT_EQ(s.count, 0u);
  EXPECT_EQ(s.total_ms, 0.0);
  EXPECT_EQ(s.min_ms, 0.0);
  EXPECT_EQ(s.max_ms, 0.0);
}

TEST_F(RecorderTest, SortedSummary) {
  SampleRecorder r(SampleRecorder::Mode::Keep);
  fill(r);
  const auto s = r.summarize_sorted();
  EXPECT_EQ(s.count, 5u);
  EXPECT_DOUBLE_EQ(s.total_ms, 15.0);
  EXPECT_DOUBLE_EQ(s.mean_ms, 3.0);
  EXPECT_DOUBLE_EQ(s.median_ms, 3.0);
  EXPECT_DOUBLE_EQ(s.p95_ms, 5.0);
  EXPECT_DOUBLE_EQ(s.min_ms, 1.0);
  EXPECT_DOUBLE_EQ(s.max_ms, 5.0);
  // 原始顺序保留
  EXPECT_EQ(r.samples().front(), 5.0);
}

TEST_F(RecorderTest, StreamingKeepsNoSamples) {
  SampleRecorder r(SampleRecorder::Mode::Streaming);
  fill(r);
  EXPECT_TRUE(r.samples().empty());
  EXPECT_EQ(r.count(), 5u);

  const auto s = r.summarize_streaming();
  EXPECT_DOUBLE_EQ(s.mean_ms, 3.0);
  EXPECT_DOUBLE_EQ(s.median_ms, s.mean_ms);
  EXPECT_DOUBLE_EQ(s.p95_ms, s.max_ms);
  EXPECT_DOUBLE_EQ(s.min_ms, 1.0);
  EXPECT_DOUBLE_EQ(s.max_ms, 5.0);
}

TEST_F(RecorderTest, StreamingModeSortedFallsBack) {
  SampleRecorder r(SampleRecorder::Mode::Streaming);
  fill(r);
  const auto s = r.summarize_sorted();
  EXPECT_DOUBLE_EQ(s.median_ms, 3.0);
  EXPECT_DOUBLE_EQ(s.p95_ms, 5.0);
}

TEST_F(RecorderTest, ZeroSamplesAreKept) {
  SampleRecorder r;
  r.record(0.0);
  r.record(0.0);
  r.record(1.0);
  const auto s = r.summarize_sorted();
  EXPECT_EQ(s.count, 3u);
  EXPECT_EQ(s.min_ms, 0.0);
  EXPECT_EQ(s.median_ms, 0.0);
  EXPECT_EQ(s.max_ms, 1.0);
}

TEST_F(RecorderTest, Reset) {
  SampleRecorder r;
  fill(r);
  r.reset();
  EXPECT_EQ(r.count(), 0u);
  EXPECT_TRUE(r.samples().empty());
  r.record(9.0);
  const auto s = r.summarize_sorted();
  EXPECT_EQ(s.min_ms, 9.0);
  EXPECT_EQ(s.max_ms, 9.0);
}
