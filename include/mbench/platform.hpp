#pragma once

#include "mbench/macros.hpp"

#include <cerrno>
#include <numa.h>
#include <pthread.h>
#include <sched.h>
#include <system_error>

namespace mbench {

/**
 * 设置当前线程为实时调度优先级
 */
inline void set_realtime_priority(int priority = 99) {
  sched_param param;
  param.sched_priority = priority;

  const int rc = pthread_setschedparam(pthread_self(), SCHED_FIFO, &param);
  if (rc != 0) {
    // pthread_* 直接返回错误码，不设置 errno
    throw std::system_error(rc, std::generic_category(),
                            "Failed to set SCHED_FIFO realtime priority");
  }
}

/**
 * 绑定 CPU 亲和性
 */
inline void bind_cpu(int core_id) {
  cpu_set_t cpuset;
  CPU_ZERO(&cpuset);
  CPU_SET(core_id, &cpuset);

  if (sched_setaffinity(0, sizeof(cpu_set_t), &cpuset) != 0) {
    throw std::system_error(errno, std::generic_category(),
                            "Failed to set CPU affinity");
  }
}

/**
 * 绑定 CPU 及其所在 NUMA 节点的内存策略
 *
 * 与 bind_cpu 不同，这里由 core_id 反查节点：基准测试只关心被测线程
 * 的内存分配不跨节点，不需要调用方指定拓扑。
 */
inline void bind_numa_local(int core_id) {
  if (numa_available() < 0) {
    throw std::system_error(ENOTSUP, std::generic_category(),
                            "NUMA is not available on this system");
  }

  const int node = numa_node_of_cpu(core_id);
  if (node < 0) {
    throw std::system_error(EINVAL, std::generic_category(),
                            "Core does not belong to any NUMA node");
  }

  struct bitmask *nodemask = numa_allocate_nodemask();
  if (!nodemask) {
    throw std::system_error(errno, std::generic_category(),
                            "Failed to allocate NUMA nodemask");
  }

  numa_bitmask_setbit(nodemask, static_cast<unsigned>(node));
  numa_set_membind(nodemask);
  numa_free_nodemask(nodemask);

  bind_cpu(core_id);
}

} // namespace mbench
