#include "mbench/report.hpp"
#include "../fixtures/config.hpp"
#include "../fixtures/utils.hpp"
#include <gtest/gtest.h>

#include <cstdio>
#include <limits>
#include <string>
#include <vector>

using namespace mbench;
using namespace mbench::test;

namespace {

BenchmarkResult sample_result(std::string name = "arith") {
  BenchmarkResult r;
  r.name = std::move(name);
  r.warmup_iterations = 20;
  r.measured_iterations = 30;
  r.inner_iterations = 1000;
  r.batch_size = 64;
  r.warmup_ms = 100.0;
  r.total_ms = 600.0;
  r.mean_ms = 20.0;
  r.median_ms = 20.0;
  r.p95_ms = 21.0;
  r.min_ms = 19.5;
  r.max_ms = 22.0;
  r.ns_per_op = 312.5;
  r.ops_per_sec = 3'200'000.0;
  r.clock_source = "perf";
  r.clock_resolution_ms = 0.001;
  r.target_sample_ms = 20.0;
  return r;
}

bool contains(const std::string &haystack, const std::string &needle) {
  return haystack.find(needle) != std::string::npos;
}

} // namespace

TEST(ReportTest, ResultHasAllKeys) {
  const auto json = to_json(BenchmarkOutcome{sample_result()});
  for (const char *key :
       {"\"name\"", "\"warmup_iterations\"", "\"warmup_ms\"",
        "\"measured_iterations\"", "\"inner_iterations\"", "\"batch_size\"",
        "\"total_ms\"", "\"mean_ms\"", "\"median_ms\"", "\"p95_ms\"",
        "\"min_ms\"", "\"max_ms\"", "\"ns_per_op\"", "\"ops_per_sec\"",
        "\"clock_source\"", "\"clock_resolution_ms\"", "\"target_sample_ms\"",
        "\"runtime\""}) {
    EXPECT_TRUE(contains(json, key)) << "missing " << key;
  }
  EXPECT_TRUE(contains(json, "\"clock_source\": \"perf\""));
  EXPECT_TRUE(contains(json, "\"runtime\": \"full\""));
  EXPECT_TRUE(contains(json, "\"batch_size\": 64"));
  EXPECT_FALSE(contains(json, "thin_sample"));
}

TEST(ReportTest, ThinSampleOnlyWhenSet) {
  auto r = sample_result();
  r.measured_iterations = 5;
  r.thin_sample = true;
  EXPECT_TRUE(contains(to_json(BenchmarkOutcome{r}), "\"thin_sample\": true"));
}

TEST(ReportTest, ErrorRecordShape) {
  const auto json =
      to_json(BenchmarkOutcome{BenchmarkError{"ghost", MISSING_BENCHMARK}});
  EXPECT_EQ(json, "{\n  \"name\": \"ghost\",\n  \"error\": \"missing benchmark\"\n}");
}

TEST(ReportTest, NonFiniteNumbersBecomeZero) {
  auto r = sample_result();
  r.ns_per_op = std::numeric_limits<double>::quiet_NaN();
  r.ops_per_sec = std::numeric_limits<double>::infinity();
  const auto json = to_json(BenchmarkOutcome{r});
  EXPECT_TRUE(contains(json, "\"ns_per_op\": 0,"));
  EXPECT_TRUE(contains(json, "\"ops_per_sec\": 0,"));
  EXPECT_FALSE(contains(json, "nan"));
  EXPECT_FALSE(contains(json, "inf"));
}

TEST(ReportTest, EscapesNames) {
  const auto json =
      to_json(BenchmarkOutcome{BenchmarkError{"a\"b\\c\n", "boom"}});
  EXPECT_TRUE(contains(json, "\"a\\\"b\\\\c\\n\""));
}

TEST(ReportTest, ResultsKeyedByNameInOrder) {
  std::vector<BenchmarkOutcome> results{
      sample_result("zeta"), BenchmarkError{"ghost", MISSING_BENCHMARK},
      sample_result("alpha")};
  const auto json = to_json(results);

  const auto zeta = json.find("\"zeta\": {");
  const auto ghost = json.find("\"ghost\": {");
  const auto alpha = json.find("\"alpha\": {");
  ASSERT_NE(zeta, std::string::npos);
  ASSERT_NE(ghost, std::string::npos);
  ASSERT_NE(alpha, std::string::npos);
  EXPECT_LT(zeta, ghost);
  EXPECT_LT(ghost, alpha);
  EXPECT_EQ(json.front(), '{');
  EXPECT_EQ(json.back(), '}');
}

TEST(ReportTest, EmptyResultsIsEmptyObject) {
  EXPECT_EQ(to_json(std::vector<BenchmarkOutcome>{}), "{}");
}

TEST(ReportTest, FormatOpsPerSec) {
  EXPECT_EQ(format_ops_per_sec(2'500'000'000.0), "2.50B");
  EXPECT_EQ(format_ops_per_sec(3'200'000.0), "3.20M");
  EXPECT_EQ(format_ops_per_sec(1'500.0), "1.50K");
  EXPECT_EQ(format_ops_per_sec(999.4), "999");
  EXPECT_EQ(format_ops_per_sec(0.0), "0");
}

TEST(ReportTest, SummaryLines) {
  auto none = sample_result("frozen");
  none.clock_source = "none";
  none.ops_per_sec = 0.0;
  std::vector<BenchmarkOutcome> results{
      sample_result("arith"), none, BenchmarkError{"ghost", MISSING_BENCHMARK}};

  std::FILE *tmp = std::tmpfile();
  ASSERT_NE(tmp, nullptr);
  print_summary(results, tmp);
  std::rewind(tmp);

  std::string text;
  char buf[256];
  while (std::fgets(buf, sizeof(buf), tmp) != nullptr)
    text += buf;
  std::fclose(tmp);

  EXPECT_TRUE(contains(text, "  arith: 3.20M ops/sec\n"));
  EXPECT_TRUE(contains(text, "  frozen: 0 ops/sec (unmeasurable: no clock)\n"));
  EXPECT_TRUE(contains(text, "  ghost: missing benchmark\n"));
}
