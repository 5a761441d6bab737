#include "app/ResourceSampler.hpp"
#include <algorithm>
#include <cmath>
#include <cstdio>

using namespace std::chrono;

namespace vitals::app {

static double clamp_pct(double v) {
  if (std::isnan(v)) return 0.0;
  return std::clamp(v, 0.0, 100.0);
}

ResourceSampler::ResourceSampler(SamplerConfig cfg)
    : cfg_(cfg), net_(cfg.nominal_link_mbps), rng_(std::random_device{}()) {
  // First baselines: the first sample() reports usage since construction
  if (!cpu_.mark()) warn_once(kCpu, "cannot read /proc/self/stat");
  if (cfg_.mode == EstimateMode::Counters) {
    vitals::model::NetSnapshot ns{};
    if (!net_.sample(ns)) warn_once(kNet, "cannot read /proc/net/dev");
    vitals::model::DiskSnapshot ds{};
    if (!disk_.sample(ds)) warn_once(kDisk, "cannot read /proc/diskstats");
  }
}

uint64_t ResourceSampler::refresh_count() const {
  std::lock_guard<std::mutex> lk(mu_);
  return refreshes_;
}

void ResourceSampler::warn_once(Source src, const char* what) {
  if (warned_ & src) return;
  warned_ |= src;
  std::fprintf(stderr, "vitals: ResourceSampler: %s; reporting last known value\n", what);
}

vitals::model::ResourceSnapshot ResourceSampler::sample() {
  std::lock_guard<std::mutex> lk(mu_);
  auto now = steady_clock::now();
  if (cached_ && (now - cached_->taken_at) < cfg_.cache_duration) return *cached_;
  cached_ = refresh(now);
  return *cached_;
}

vitals::model::ResourceSnapshot ResourceSampler::refresh(steady_clock::time_point now) {
  vitals::model::ResourceSnapshot prev = cached_.value_or(vitals::model::ResourceSnapshot{});
  vitals::model::ResourceSnapshot s{};

  if (auto d = cpu_.take_delta()) s.cpu_pct = d->usage_pct;
  else { warn_once(kCpu, "cannot read /proc/self/stat"); s.cpu_pct = prev.cpu_pct; }

  vitals::model::Memory m{};
  if (mem_.sample(m)) s.memory_pct = m.used_pct;
  else { warn_once(kMem, "cannot read /proc/meminfo"); s.memory_pct = prev.memory_pct; }

  if (cfg_.mode == EstimateMode::Simulated) {
    // Placeholder signal for hosts without usable counters
    s.network_pct = std::uniform_real_distribution<double>(10.0, 40.0)(rng_);
    s.disk_pct = std::uniform_real_distribution<double>(20.0, 60.0)(rng_);
  } else {
    vitals::model::NetSnapshot ns{};
    if (net_.sample(ns)) s.network_pct = ns.util_pct;
    else { warn_once(kNet, "cannot read /proc/net/dev"); s.network_pct = prev.network_pct; }
    vitals::model::DiskSnapshot ds{};
    if (disk_.sample(ds)) s.disk_pct = ds.busiest_util_pct;
    else { warn_once(kDisk, "cannot read /proc/diskstats"); s.disk_pct = prev.disk_pct; }
  }

  s.cpu_pct = clamp_pct(s.cpu_pct);
  s.memory_pct = clamp_pct(s.memory_pct);
  s.network_pct = clamp_pct(s.network_pct);
  s.disk_pct = clamp_pct(s.disk_pct);
  s.taken_at = now;
  s.seq = ++refreshes_;
  return s;
}

} // namespace vitals::app
