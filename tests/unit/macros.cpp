// 只包含引擎头文件：任何一层间接引入 <numa.h> 都会在这里被发现
#include "mbench/mbench.hpp"

#if defined(_NUMA_H)
#define MBENCH_TEST_ENGINE_SEES_NUMA 1
#else
#define MBENCH_TEST_ENGINE_SEES_NUMA 0
#endif

#include "../fixtures/config.hpp"
#include "../fixtures/utils.hpp"
#include <gtest/gtest.h>

#include <cstdint>

using namespace mbench;
using namespace mbench::test;

namespace {

MBENCH_NOINLINE int64_t opaque_square(int64_t x) { return x * x; }

struct Counter {
  int64_t hits = 0;
  MBENCH_ALWAYS_INLINE void bump() noexcept { ++hits; }
};

} // namespace

TEST(HeaderDependencyTest, EngineDoesNotIncludeNuma) {
  EXPECT_EQ(MBENCH_TEST_ENGINE_SEES_NUMA, 0);
}

TEST(HeaderDependencyTest, InlineMacrosAreUsable) {
  Counter c;
  for (int i = 0; i < 4; ++i)
    c.bump();
  EXPECT_EQ(c.hits, 4);
  EXPECT_EQ(opaque_square(12), 144);
}
