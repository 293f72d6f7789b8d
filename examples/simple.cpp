#include "mbench/mbench.hpp"

#include <fmt/core.h>

#include <cstdint>
#include <exception>
#include <variant>

// 最小示例：直接用 Engine 测一个 lambda，分别跑两种校准路径
int main() {
  mbench::BenchmarkSpec spec{
      .name = "sum_of_squares",
      .run = [](int32_t seed) -> mbench::BenchmarkValue {
        int64_t acc = 0;
        for (int64_t i = 0; i < 1000; ++i)
          acc += (i + seed) * (i + seed) % 7919;
        return acc;
      },
      .inner_iterations = 1000,
  };

  try {
    for (const auto profile :
         {mbench::RuntimeProfile::Full, mbench::RuntimeProfile::Constrained}) {
      const mbench::Engine engine({.profile = profile, .verbose = true});
      const auto outcome = engine.run(spec);
      fmt::print("{}\n", mbench::to_json(outcome));

      if (const auto *r = std::get_if<mbench::BenchmarkResult>(&outcome)) {
        fmt::print(stderr, "[{}] {:.2f} ns/op, {} ops/sec\n",
                   mbench::to_string(profile), r->ns_per_op,
                   mbench::format_ops_per_sec(r->ops_per_sec));
      }
    }
  } catch (const std::exception &e) {
    fmt::print(stderr, "[Simple] Error: {}\n", e.what());
    return 1;
  }
  return 0;
}
