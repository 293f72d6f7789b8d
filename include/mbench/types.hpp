#pragma once

#include <concepts>
#include <cstdint>
#include <functional>
#include <string>
#include <variant>

namespace mbench {

/**
 * @brief 结构化返回值的占位标记
 *
 * 被测函数返回对象/记录类结果时使用，折叠进累加器时只贡献常数 1。
 */
struct Structured {};

/**
 * @brief 被测函数的返回值
 *
 * - std::monostate: 无返回值，不参与折叠
 * - int64_t / double: 数值，直接累加
 * - std::string: 贡献其长度
 * - Structured: 贡献常数
 */
using BenchmarkValue =
    std::variant<std::monostate, std::int64_t, double, std::string, Structured>;

// 被测函数：输入单调递增的种子，返回一个需要被"消费"的值
using BenchmarkFn = std::function<BenchmarkValue(std::int32_t seed)>;

/**
 * @brief [调用约束] 可作为基准函数的可调用对象
 *
 * 必须能以 int32 种子调用，且返回值可以隐式构造为 BenchmarkValue。
 */
template <typename F>
concept BenchmarkCallable = std::invocable<F &, std::int32_t> &&
    std::convertible_to<std::invoke_result_t<F &, std::int32_t>,
                        BenchmarkValue>;

} // namespace mbench
