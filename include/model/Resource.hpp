#pragma once
#include <chrono>
#include <cstdint>

namespace vitals::model {

// Point-in-time host utilization as handed to callers. Every percentage is
// kept within 0..100.
struct ResourceSnapshot {
  double cpu_pct{};      // this process's share of one CPU
  double memory_pct{};
  double network_pct{};
  double disk_pct{};
  std::chrono::steady_clock::time_point taken_at{};
  uint64_t seq{};        // refresh counter, 0 = never measured

  bool operator==(const ResourceSnapshot&) const = default;
};

} // namespace vitals::model
