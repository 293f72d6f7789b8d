#include "mbench/mbench.hpp"

#include <benchmark/benchmark.h>

#include <cstdint>
#include <functional>
#include <random>
#include <string>

// 引擎自身开销：批循环、时钟读取、统计归约。
// 这些开销决定了多小的被测函数还能被可靠地测出来。

static void BM_ClockRead_Steady(benchmark::State &state) {
  for ([[maybe_unused]] auto _ : state) {
    benchmark::DoNotOptimize(mbench::clocks::steady_ms());
  }
}
BENCHMARK(BM_ClockRead_Steady);

static void BM_ClockRead_Wall(benchmark::State &state) {
  for ([[maybe_unused]] auto _ : state) {
    benchmark::DoNotOptimize(mbench::clocks::wall_ms());
  }
}
BENCHMARK(BM_ClockRead_Wall);

// 通过 std::function 的间接调用 + 折叠，即每次被测调用的固定成本
static void BM_RunBatch_Trivial(benchmark::State &state) {
  const int64_t batch = state.range(0);
  mbench::BenchmarkFn fn = [](int32_t seed) -> mbench::BenchmarkValue {
    return static_cast<int64_t>(seed) + 1;
  };
  mbench::AccumulatorState acc;

  for ([[maybe_unused]] auto _ : state) {
    mbench::run_batch(fn, batch, acc);
  }
  state.SetItemsProcessed(state.iterations() * batch);
}
BENCHMARK(BM_RunBatch_Trivial)->RangeMultiplier(10)->Range(1, 100'000);

static void BM_RunBatch_String(benchmark::State &state) {
  const int64_t batch = state.range(0);
  mbench::BenchmarkFn fn = [](int32_t seed) -> mbench::BenchmarkValue {
    return std::string(static_cast<std::size_t>(seed & 15), 'x');
  };
  mbench::AccumulatorState acc;

  for ([[maybe_unused]] auto _ : state) {
    mbench::run_batch(fn, batch, acc);
  }
  state.SetItemsProcessed(state.iterations() * batch);
}
BENCHMARK(BM_RunBatch_String)->RangeMultiplier(10)->Range(1, 10'000);

static void BM_ClockProbe(benchmark::State &state) {
  const std::function<double()> now = &mbench::clocks::steady_ms;
  for ([[maybe_unused]] auto _ : state) {
    benchmark::DoNotOptimize(mbench::ClockSource::probe(now));
  }
}
BENCHMARK(BM_ClockProbe);

static void BM_EstimateResolution(benchmark::State &state) {
  const std::function<double()> now = &mbench::clocks::steady_ms;
  for ([[maybe_unused]] auto _ : state) {
    benchmark::DoNotOptimize(mbench::ClockSource::estimate_resolution(now));
  }
}
BENCHMARK(BM_EstimateResolution);

// 排序统计 vs 流式统计，对应两条路径的归约成本
static void fill_recorder(mbench::SampleRecorder &recorder, int64_t n) {
  std::mt19937 g(42);
  std::uniform_real_distribution<double> dist(19.0, 25.0);
  for (int64_t i = 0; i < n; ++i)
    recorder.record(dist(g));
}

static void BM_Summarize_Sorted(benchmark::State &state) {
  mbench::SampleRecorder recorder(mbench::SampleRecorder::Mode::Keep);
  fill_recorder(recorder, state.range(0));
  for ([[maybe_unused]] auto _ : state) {
    benchmark::DoNotOptimize(recorder.summarize_sorted());
  }
}
BENCHMARK(BM_Summarize_Sorted)->Arg(5)->Arg(30)->Arg(1000);

static void BM_Summarize_Streaming(benchmark::State &state) {
  mbench::SampleRecorder recorder(mbench::SampleRecorder::Mode::Streaming);
  fill_recorder(recorder, state.range(0));
  for ([[maybe_unused]] auto _ : state) {
    benchmark::DoNotOptimize(recorder.summarize_streaming());
  }
}
BENCHMARK(BM_Summarize_Streaming)->Arg(5)->Arg(30)->Arg(1000);

BENCHMARK_MAIN();
