#pragma once
#include <chrono>
#include <cstdint>

namespace vitals::model {

// Raw CPU accounting reference point for this process
struct CpuMark {
  uint64_t utime_ticks{};
  uint64_t stime_ticks{};
  std::chrono::steady_clock::time_point at{};
  uint64_t ticks() const { return utime_ticks + stime_ticks; }
};

// CPU consumed between two marks
struct CpuDelta {
  double cpu_secs{};   // user + system
  double wall_secs{};  // steady clock interval
  double usage_pct{};  // cpu_secs / wall_secs * 100, clamped 0..100
};

} // namespace vitals::model
