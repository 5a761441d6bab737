#pragma once
#include <cstdint>
#include <deque>
#include <mutex>
#include <string>
#include <string_view>
#include <vector>
#include "model/Activity.hpp"

namespace vitals::app {

// Counters over everything ever recorded, evicted events included
struct ActivityStats {
  uint64_t total{};
  uint64_t success{};
  uint64_t warning{};
  uint64_t info{};
  size_t retained{};
  size_t capacity{};
};

// Bounded, newest-first, in-memory event log. Oldest events are evicted once
// the log holds more than capacity() entries. Timestamps are assigned here and
// never decrease in insertion order.
class ActivityLog {
public:
  static constexpr size_t kDefaultCapacity = 50;

  explicit ActivityLog(size_t capacity = kDefaultCapacity);
  ActivityLog(const ActivityLog&) = delete;
  ActivityLog& operator=(const ActivityLog&) = delete;

  void record(std::string source, std::string message,
              vitals::model::ActivityStatus status = vitals::model::ActivityStatus::Info);

  // Boundary overload for untyped callers. Throws std::invalid_argument for a
  // status other than "success", "warning" or "info"; the log is unchanged.
  void record(std::string source, std::string message, std::string_view status);

  // Up to limit events, most recent first
  [[nodiscard]] std::vector<vitals::model::ActivityEvent> recent(size_t limit = 10) const;

  [[nodiscard]] size_t size() const;
  size_t capacity() const { return capacity_; }
  [[nodiscard]] ActivityStats stats() const;
  void clear();

private:
  mutable std::mutex mu_;
  const size_t capacity_;
  std::deque<vitals::model::ActivityEvent> events_;
  ActivityStats counts_{};
};

} // namespace vitals::app
