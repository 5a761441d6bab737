#pragma once
#include <cstdint>

namespace vitals::model {

struct Memory {
  uint64_t total_kb{};
  uint64_t free_kb{};  // MemAvailable, or MemFree+Buffers+Cached on old kernels
  uint64_t used_kb{};
  double   used_pct{}; // 0..100
};

} // namespace vitals::model
