#pragma once
#include <cstdint>
#include <mutex>
#include <optional>
#include <random>
#include "app/Config.hpp"
#include "collectors/DiskCollector.hpp"
#include "collectors/MemoryCollector.hpp"
#include "collectors/NetCollector.hpp"
#include "collectors/ProcessCpuCollector.hpp"
#include "model/Resource.hpp"

namespace vitals::app {

// On-demand host utilization with a single-slot TTL cache.
//
// sample() re-measures at most once per cache duration; callers inside the
// window get the previous snapshot back unchanged. The cache check, the
// refresh and the CPU baseline reset happen under one lock, so a caller never
// sees a new snapshot paired with an old baseline or the reverse.
//
// The CPU baseline is consumed destructively on every refresh. Create one
// sampler per process and hand it to callers by reference.
class ResourceSampler {
public:
  explicit ResourceSampler(SamplerConfig cfg = {});
  ResourceSampler(const ResourceSampler&) = delete;
  ResourceSampler& operator=(const ResourceSampler&) = delete;

  // Never fails: unreadable sources keep their previous value (0 initially)
  vitals::model::ResourceSnapshot sample();

  std::chrono::milliseconds cache_duration() const { return cfg_.cache_duration; }
  EstimateMode mode() const { return cfg_.mode; }
  uint64_t refresh_count() const;

private:
  enum Source : unsigned { kCpu = 1u, kMem = 2u, kNet = 4u, kDisk = 8u };

  vitals::model::ResourceSnapshot refresh(std::chrono::steady_clock::time_point now);
  void warn_once(Source src, const char* what);

  mutable std::mutex mu_;
  SamplerConfig cfg_;
  vitals::collectors::ProcessCpuCollector cpu_{};
  vitals::collectors::MemoryCollector mem_{};
  vitals::collectors::NetCollector net_;
  vitals::collectors::DiskCollector disk_{};
  std::optional<vitals::model::ResourceSnapshot> cached_{};
  std::mt19937 rng_;
  uint64_t refreshes_{0};
  unsigned warned_{0};
};

} // namespace vitals::app
