#pragma once

#include "mbench/suite.hpp"

#include <algorithm>
#include <array>
#include <charconv>
#include <cmath>
#include <cstdint>
#include <cstdlib>
#include <string>
#include <string_view>
#include <system_error>

// -----------------------------------------------------------------------------
// 示例负载：每个函数内部循环 *_ITERATIONS 次，作为 inner_iterations 上报
// -----------------------------------------------------------------------------
namespace workloads {

inline constexpr int64_t ARITHMETIC_ITERATIONS = 50'000;
inline constexpr int64_t STRING_OPS_ITERATIONS = 50'000;
inline constexpr int64_t FUNCTION_CALLS_ITERATIONS = 50'000;
inline constexpr int64_t PARSE_INT_ITERATIONS = 20'000;
inline constexpr int64_t MATH_OPS_ITERATIONS = 20'000;
inline constexpr int64_t QUERY_PARSING_ITERATIONS = 10'000;
inline constexpr int64_t STRING_BUILD_ITERATIONS = 10'000;

inline int64_t arithmetic(int32_t seed) {
  int64_t sum = seed;
  for (int64_t i = 0; i < ARITHMETIC_ITERATIONS; ++i) {
    sum = (sum + i + seed) % 1'000'000;
    sum = (sum - ((i + seed) % 1000) + 1'000'000) % 1'000'000;
    sum = (sum * 2 + seed) % 1'000'000;
    sum = sum >> 1;
  }
  return sum;
}

inline int64_t string_ops(int32_t seed) {
  static const std::string text = "The quick brown fox jumps over the lazy dog";
  const std::string_view needle = (seed & 1) ? "fox" : "dog";
  int64_t count = 0;
  for (int64_t i = 0; i < STRING_OPS_ITERATIONS; ++i) {
    count = (count + static_cast<int64_t>(text.find(needle))) % 1'000'000;
    count = (count + static_cast<int64_t>(text.size()) + (seed & 7)) % 1'000'000;
  }
  return count;
}

MBENCH_NOINLINE inline int64_t add_mod(int64_t a, int64_t b) {
  return (a + b) % 1'000'000;
}

MBENCH_NOINLINE inline int64_t compute(int64_t x, int64_t y) {
  return add_mod(x, y);
}

inline int64_t function_calls(int32_t seed) {
  int64_t result = seed & 0xff;
  for (int64_t i = 0; i < FUNCTION_CALLS_ITERATIONS; ++i) {
    result = compute(i % 1000, result);
  }
  return result;
}

inline int to_int(std::string_view s) {
  int value = 0;
  const auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);
  return ec == std::errc{} ? value : 0;
}

inline int64_t parse_int(int32_t seed) {
  static constexpr std::array<std::string_view, 8> numbers = {
      "0", "1", "42", "100", "999", "1234", "9999", "12345"};
  int64_t result = 0;
  for (int64_t i = 0; i < PARSE_INT_ITERATIONS; ++i) {
    const auto s = numbers[static_cast<std::size_t>((i + seed) & 7)];
    const int n1 = to_int(s);
    const int n2 = to_int(s);
    const int n3 = to_int(s);
    const int n4 = to_int(s);
    result = (result + n1 + n2 + n3 + n4) % 1'000'000;
  }
  return result;
}

inline double math_ops(int32_t seed) {
  const int64_t s = seed & 0x7fff;
  double result = 0.0;
  for (int64_t i = 0; i < MATH_OPS_ITERATIONS; ++i) {
    const double x = static_cast<double>((i + s) % 1000) + 0.5;
    const int64_t y = (i * 7 + s) % 500;
    const int64_t z = (i * 13 + s) % 2000;

    const double floored = std::floor(x);
    const double ceiled = std::ceil(x);
    const double rounded = std::round(x);
    const int64_t lo = std::min(y, z);
    const int64_t hi = std::max(y, z);
    const int64_t diff = std::abs(y - z);
    const double clamped = std::clamp(floored, 0.0, 100.0);

    result = std::fmod(result + floored + ceiled + rounded +
                           static_cast<double>(lo + hi + diff) + clamped,
                       1'000'000.0);
  }
  return result;
}

// 在 query 中取 key= 之后到下一个 & 的整数值
inline int query_param(std::string_view query, std::string_view key,
                       int fallback) {
  const auto pos = query.find(key);
  if (pos == std::string_view::npos)
    return fallback;
  const auto begin = pos + key.size();
  const auto amp = query.find('&', begin);
  return to_int(query.substr(begin, amp == std::string_view::npos
                                        ? std::string_view::npos
                                        : amp - begin));
}

inline int64_t query_parsing(int32_t seed) {
  static constexpr std::array<std::string_view, 4> queries = {
      "page=1&limit=10&offset=0", "page=5&limit=25&offset=100",
      "page=12&limit=50&offset=550", "id=42&count=7&max=999"};
  int64_t result = 0;
  for (int64_t i = 0; i < QUERY_PARSING_ITERATIONS; ++i) {
    const auto q = queries[static_cast<std::size_t>((i + seed) & 3)];
    const int64_t page = query_param(q, "page=", 1);
    const int64_t limit = std::max(1, query_param(q, "limit=", 10));
    const int64_t offset = query_param(q, "offset=", 0);

    const int64_t total_items = 1000 + (seed & 0xff);
    const int64_t total_pages = (total_items + limit - 1) / limit;
    const int64_t current = std::min(std::max<int64_t>(1, page), total_pages);
    const int64_t start = (current - 1) * limit;
    const int64_t end = std::min(start + limit, total_items);
    const int64_t clamped = std::clamp<int64_t>(offset, 0, total_items - 1);
    const int64_t remaining = std::abs(total_items - clamped);

    result = (result + page + limit + offset + total_pages + start + end +
              remaining) %
             1'000'000;
  }
  return result;
}

// 返回最后拼出的字符串，由累加器按长度折叠
inline std::string string_build(int32_t seed) {
  std::string last;
  int64_t total = 0;
  for (int64_t i = 0; i < STRING_BUILD_ITERATIONS; ++i) {
    std::string s1 = "id=" + std::to_string((i + seed) % 100) + "&name=user" +
                     std::to_string(seed & 7);
    std::string s2 = "prefix";
    s2 += '-';
    s2 += std::to_string((i * seed) % 50);
    s2 += "-suffix";
    std::string parts = "a,b,c," + std::to_string((seed + i) % 10);
    total += static_cast<int64_t>(s1.size() + s2.size() + parts.size());
    last = std::move(parts);
  }
  last += std::to_string(total % 10);
  return last;
}

inline void register_all(mbench::Suite &suite) {
  suite.add("arithmetic", &arithmetic, ARITHMETIC_ITERATIONS);
  suite.add("stringOps", &string_ops, STRING_OPS_ITERATIONS);
  suite.add("functionCalls", &function_calls, FUNCTION_CALLS_ITERATIONS);
  suite.add("parseInt", &parse_int, PARSE_INT_ITERATIONS);
  suite.add("mathOps", &math_ops, MATH_OPS_ITERATIONS);
  suite.add("queryParsing", &query_parsing, QUERY_PARSING_ITERATIONS);
  suite.add("stringBuild", &string_build, STRING_BUILD_ITERATIONS);
}

} // namespace workloads
