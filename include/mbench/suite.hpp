#pragma once

#include "mbench/engine.hpp"

#include <fmt/core.h>
#include <fmt/ranges.h>

#include <algorithm>
#include <cstddef>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace mbench {

/**
 * @brief 解析逗号分隔的过滤列表：去空白、丢空项、按首次出现去重。
 */
inline std::vector<std::string> parse_filter(std::string_view filter) {
  std::vector<std::string> names;
  std::size_t start = 0;
  while (start <= filter.size()) {
    const std::size_t comma = filter.find(',', start);
    const std::size_t end = comma == std::string_view::npos ? filter.size() : comma;
    std::string_view token = filter.substr(start, end - start);

    const auto first = token.find_first_not_of(" \t\r\n");
    if (first != std::string_view::npos) {
      const auto last = token.find_last_not_of(" \t\r\n");
      std::string name(token.substr(first, last - first + 1));
      if (std::find(names.begin(), names.end(), name) == names.end())
        names.push_back(std::move(name));
    }

    if (comma == std::string_view::npos)
      break;
    start = comma + 1;
  }
  return names;
}

// =========================================================
// 基准集合
// =========================================================
// 按注册顺序保存 BenchmarkSpec；运行时严格串行。
class Suite {
public:
  // 同名重复注册时替换原有 BenchmarkSpec，位置不变
  Suite &add(BenchmarkSpec spec) {
    auto it = find(spec.name);
    if (it != specs_.end())
      *it = std::move(spec);
    else
      specs_.push_back(std::move(spec));
    return *this;
  }

  template <typename Fn>
    requires BenchmarkCallable<Fn>
  Suite &add(std::string name, Fn fn, int64_t inner_iterations,
             BenchmarkOptions options = {}) {
    return add(BenchmarkSpec{std::move(name), BenchmarkFn(std::move(fn)),
                             inner_iterations, options});
  }

  [[nodiscard]] const BenchmarkSpec *get(std::string_view name) const {
    auto it = std::find_if(specs_.begin(), specs_.end(),
                           [&](const auto &s) { return s.name == name; });
    return it == specs_.end() ? nullptr : &*it;
  }

  [[nodiscard]] std::vector<std::string> names() const {
    std::vector<std::string> out;
    out.reserve(specs_.size());
    for (const auto &s : specs_)
      out.push_back(s.name);
    return out;
  }

  [[nodiscard]] std::size_t size() const noexcept { return specs_.size(); }

  /**
   * @brief 按过滤串选择基准名，保持注册顺序；空过滤串选中全部。
   * @throws std::invalid_argument 含未知名称
   */
  [[nodiscard]] std::vector<std::string> select(std::string_view filter) const {
    const auto wanted = parse_filter(filter);
    if (wanted.empty())
      return names();

    std::vector<std::string> unknown;
    for (const auto &w : wanted) {
      if (get(w) == nullptr)
        unknown.push_back(w);
    }
    if (!unknown.empty()) {
      throw std::invalid_argument(
          fmt::format("Unknown benchmark filter name(s): {}. Known names: {}",
                      fmt::join(unknown, ", "), fmt::join(names(), ", ")));
    }

    std::vector<std::string> out;
    for (const auto &s : specs_) {
      if (std::find(wanted.begin(), wanted.end(), s.name) != wanted.end())
        out.push_back(s.name);
    }
    return out;
  }

  // 逐个运行；不在集合中的名字得到 "missing benchmark" 记录
  std::vector<BenchmarkOutcome> run(const Engine &engine,
                                    const std::vector<std::string> &names) const {
    std::vector<BenchmarkOutcome> results;
    results.reserve(names.size());
    for (const auto &name : names) {
      const BenchmarkSpec *spec = get(name);
      if (spec == nullptr) {
        results.emplace_back(BenchmarkError{name, MISSING_BENCHMARK});
        continue;
      }
      results.push_back(engine.run(*spec));
    }
    return results;
  }

  std::vector<BenchmarkOutcome> run(const Engine &engine) const {
    return run(engine, names());
  }

private:
  std::vector<BenchmarkSpec>::iterator find(std::string_view name) {
    return std::find_if(specs_.begin(), specs_.end(),
                        [&](const auto &s) { return s.name == name; });
  }

  std::vector<BenchmarkSpec> specs_;
};

} // namespace mbench
