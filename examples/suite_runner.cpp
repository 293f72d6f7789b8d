#include "mbench/mbench.hpp"
#include "mbench/platform.hpp"
#include "workloads.hpp"

#include <fmt/core.h>
#include <tabulate/table.hpp>

#include <exception>
#include <iostream>
#include <stdexcept>
#include <string>
#include <utility>
#include <variant>
#include <vector>

// 运行示例基准集合：JSON 写到 stdout，日志与表格写到 stderr。
// 配置全部来自环境变量：
//   MBENCH_FILTER=arithmetic,parseInt   只运行指定基准
//   MBENCH_PROFILE=full|constrained     校准算法
//   MBENCH_CPU=3                        绑定到该 CPU 及其 NUMA 节点
//   MBENCH_VERBOSE=1                    打印时钟与校准过程
//   MBENCH_WARMUP_ITERATIONS / MBENCH_MEASURED_ITERATIONS /
//   MBENCH_WARMUP_MS / MBENCH_MAX_MEASURED_TOTAL_MS

namespace {

mbench::RuntimeProfile profile_from_env() {
  const auto raw = mbench::env::get(mbench::env::PROFILE);
  if (!raw || *raw == "full")
    return mbench::RuntimeProfile::Full;
  if (*raw == "constrained")
    return mbench::RuntimeProfile::Constrained;
  throw std::invalid_argument(fmt::format(
      "{}: expected 'full' or 'constrained', got '{}'", mbench::env::PROFILE,
      *raw));
}

void pin_if_requested() {
  const auto cpu = mbench::env::get_int(mbench::env::CPU);
  if (!cpu)
    return;
  try {
    mbench::bind_numa_local(*cpu);
    fmt::print(stderr, "[System] Bound to CPU {}\n", *cpu);
  } catch (const std::exception &e) {
    fmt::print(stderr, "[System] Setup warning: {}\n", e.what());
  }
  try {
    mbench::set_realtime_priority();
  } catch (const std::exception &e) {
    fmt::print(stderr, "[System] Setup warning: {}\n", e.what());
  }
}

void print_table(const std::vector<mbench::BenchmarkOutcome> &results) {
  using namespace tabulate;
  Table table;
  table.add_row(Table::Row_t{"Benchmark", "ops/sec", "ns/op", "batch",
                             "samples", "median(ms)", "p95(ms)", "clock"});

  for (const auto &o : results) {
    if (const auto *r = std::get_if<mbench::BenchmarkResult>(&o)) {
      table.add_row(Table::Row_t{
          r->name, mbench::format_ops_per_sec(r->ops_per_sec),
          fmt::format("{:.2f}", r->ns_per_op), std::to_string(r->batch_size),
          std::to_string(r->measured_iterations) + (r->thin_sample ? "*" : ""),
          fmt::format("{:.3f}", r->median_ms), fmt::format("{:.3f}", r->p95_ms),
          r->clock_source});
    } else {
      const auto &e = std::get<mbench::BenchmarkError>(o);
      table.add_row(Table::Row_t{e.name, e.error, "", "", "", "", "", ""});
    }
  }

  table[0]
      .format()
      .font_align(FontAlign::center)
      .font_style({FontStyle::bold})
      .font_color(Color::yellow);

  table.column(0)
      .format()
      .font_color(Color::cyan)
      .font_style({FontStyle::bold});

  std::cerr << table << std::endl;
}

} // namespace

int main() {
  try {
    mbench::Engine::Settings settings;
    settings.profile = profile_from_env();
    settings.defaults = mbench::options_from_env();
    settings.verbose = mbench::env::get(mbench::env::VERBOSE).has_value();

    mbench::Suite suite;
    workloads::register_all(suite);
    const auto names =
        suite.select(mbench::env::get(mbench::env::FILTER).value_or(""));

    pin_if_requested();

    const mbench::Engine engine(std::move(settings));
    fmt::print(stderr, "=== Microbenchmarks: {} ({} selected) ===\n",
               mbench::to_string(engine.profile()), names.size());

    const auto results = suite.run(engine, names);

    mbench::print_summary(results);
    print_table(results);
    fmt::print("{}\n", mbench::to_json(results));
    return 0;
  } catch (const std::exception &e) {
    fmt::print(stderr, "[Runner] Error: {}\n", e.what());
    return 1;
  }
}
