#pragma once

#include "mbench/engine.hpp"

#include <fmt/core.h>
#include <fmt/format.h>

#include <cmath>
#include <cstdio>
#include <iterator>
#include <string>
#include <string_view>
#include <vector>

namespace mbench {

namespace detail {

inline std::string json_escape(std::string_view s) {
  std::string out;
  out.reserve(s.size() + 2);
  for (const char c : s) {
    switch (c) {
    case '"':
      out += "\\\"";
      break;
    case '\\':
      out += "\\\\";
      break;
    case '\n':
      out += "\\n";
      break;
    case '\r':
      out += "\\r";
      break;
    case '\t':
      out += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(c) < 0x20)
        out += fmt::format("\\u{:04x}", static_cast<unsigned>(c));
      else
        out += c;
    }
  }
  return out;
}

// JSON 不支持 NaN / Inf
inline std::string json_number(double v) {
  if (!std::isfinite(v))
    return "0";
  return fmt::format("{}", v);
}

inline void append_object(std::string &out, const BenchmarkResult &r,
                          std::string_view indent) {
  auto it = std::back_inserter(out);
  fmt::format_to(it, "{{\n");
  fmt::format_to(it, "{0}  \"name\": \"{1}\",\n", indent, json_escape(r.name));
  fmt::format_to(it, "{0}  \"warmup_iterations\": {1},\n", indent,
                 r.warmup_iterations);
  fmt::format_to(it, "{0}  \"warmup_ms\": {1},\n", indent,
                 json_number(r.warmup_ms));
  fmt::format_to(it, "{0}  \"measured_iterations\": {1},\n", indent,
                 r.measured_iterations);
  fmt::format_to(it, "{0}  \"inner_iterations\": {1},\n", indent,
                 r.inner_iterations);
  fmt::format_to(it, "{0}  \"batch_size\": {1},\n", indent, r.batch_size);
  fmt::format_to(it, "{0}  \"total_ms\": {1},\n", indent,
                 json_number(r.total_ms));
  fmt::format_to(it, "{0}  \"mean_ms\": {1},\n", indent, json_number(r.mean_ms));
  fmt::format_to(it, "{0}  \"median_ms\": {1},\n", indent,
                 json_number(r.median_ms));
  fmt::format_to(it, "{0}  \"p95_ms\": {1},\n", indent, json_number(r.p95_ms));
  fmt::format_to(it, "{0}  \"min_ms\": {1},\n", indent, json_number(r.min_ms));
  fmt::format_to(it, "{0}  \"max_ms\": {1},\n", indent, json_number(r.max_ms));
  fmt::format_to(it, "{0}  \"ns_per_op\": {1},\n", indent,
                 json_number(r.ns_per_op));
  fmt::format_to(it, "{0}  \"ops_per_sec\": {1},\n", indent,
                 json_number(r.ops_per_sec));
  fmt::format_to(it, "{0}  \"clock_source\": \"{1}\",\n", indent,
                 json_escape(r.clock_source));
  fmt::format_to(it, "{0}  \"clock_resolution_ms\": {1},\n", indent,
                 json_number(r.clock_resolution_ms));
  fmt::format_to(it, "{0}  \"target_sample_ms\": {1},\n", indent,
                 json_number(r.target_sample_ms));
  if (r.thin_sample)
    fmt::format_to(it, "{0}  \"thin_sample\": true,\n", indent);
  fmt::format_to(it, "{0}  \"runtime\": \"{1}\"\n", indent,
                 to_string(r.runtime));
  fmt::format_to(it, "{}}}", indent);
}

inline void append_object(std::string &out, const BenchmarkError &e,
                          std::string_view indent) {
  fmt::format_to(std::back_inserter(out),
                 "{{\n{0}  \"name\": \"{1}\",\n{0}  \"error\": \"{2}\"\n{0}}}",
                 indent, json_escape(e.name), json_escape(e.error));
}

} // namespace detail

// 单条记录
inline std::string to_json(const BenchmarkOutcome &outcome) {
  std::string out;
  std::visit([&](const auto &v) { detail::append_object(out, v, ""); },
             outcome);
  return out;
}

// 以基准名为键的 JSON 对象，保持运行顺序
inline std::string to_json(const std::vector<BenchmarkOutcome> &results) {
  if (results.empty())
    return "{}";

  std::string out = "{\n";
  for (std::size_t i = 0; i < results.size(); ++i) {
    out += fmt::format("  \"{}\": ",
                       detail::json_escape(outcome_name(results[i])));
    std::visit([&](const auto &v) { detail::append_object(out, v, "  "); },
               results[i]);
    out += (i + 1 < results.size()) ? ",\n" : "\n";
  }
  out += "}";
  return out;
}

/**
 * @brief ops/sec 缩写：B / M / K 两位小数，其余取整。
 */
inline std::string format_ops_per_sec(double ops) {
  if (ops >= 1'000'000'000.0)
    return fmt::format("{:.2f}B", ops / 1'000'000'000.0);
  if (ops >= 1'000'000.0)
    return fmt::format("{:.2f}M", ops / 1'000'000.0);
  if (ops >= 1'000.0)
    return fmt::format("{:.2f}K", ops / 1'000.0);
  return fmt::format("{:.0f}", ops);
}

// 控制台摘要：每个基准一行
inline void print_summary(const std::vector<BenchmarkOutcome> &results,
                          std::FILE *out = stderr) {
  for (const auto &o : results) {
    if (const auto *r = std::get_if<BenchmarkResult>(&o)) {
      fmt::print(out, "  {}: {} ops/sec{}\n", r->name,
                 format_ops_per_sec(r->ops_per_sec),
                 r->clock_source == "none" ? " (unmeasurable: no clock)" : "");
    } else {
      const auto &e = std::get<BenchmarkError>(o);
      fmt::print(out, "  {}: {}\n", e.name, e.error);
    }
  }
}

} // namespace mbench
