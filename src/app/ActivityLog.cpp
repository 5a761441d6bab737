#include "app/ActivityLog.hpp"
#include <algorithm>
#include <cstddef>
#include <stdexcept>

namespace vitals::app {

using vitals::model::ActivityEvent;
using vitals::model::ActivityStatus;

ActivityLog::ActivityLog(size_t capacity) : capacity_(capacity > 0 ? capacity : 1) {}

void ActivityLog::record(std::string source, std::string message, ActivityStatus status) {
  ActivityEvent ev{std::move(source), std::chrono::system_clock::now(), status, std::move(message)};
  std::lock_guard<std::mutex> lk(mu_);
  // wall clock may step backwards; keep insertion order == time order
  if (!events_.empty() && ev.timestamp < events_.front().timestamp)
    ev.timestamp = events_.front().timestamp;
  events_.push_front(std::move(ev));
  while (events_.size() > capacity_) events_.pop_back();
  ++counts_.total;
  switch (status) {
    case ActivityStatus::Success: ++counts_.success; break;
    case ActivityStatus::Warning: ++counts_.warning; break;
    case ActivityStatus::Info:    ++counts_.info; break;
  }
}

void ActivityLog::record(std::string source, std::string message, std::string_view status) {
  auto parsed = vitals::model::parse_activity_status(status);
  if (!parsed) {
    throw std::invalid_argument("invalid activity status '" + std::string(status) +
                                "' (expected success, warning or info)");
  }
  record(std::move(source), std::move(message), *parsed);
}

std::vector<ActivityEvent> ActivityLog::recent(size_t limit) const {
  std::lock_guard<std::mutex> lk(mu_);
  size_t n = std::min(limit, events_.size());
  return std::vector<ActivityEvent>(events_.begin(), events_.begin() + static_cast<std::ptrdiff_t>(n));
}

size_t ActivityLog::size() const {
  std::lock_guard<std::mutex> lk(mu_);
  return events_.size();
}

ActivityStats ActivityLog::stats() const {
  std::lock_guard<std::mutex> lk(mu_);
  ActivityStats s = counts_;
  s.retained = events_.size();
  s.capacity = capacity_;
  return s;
}

void ActivityLog::clear() {
  std::lock_guard<std::mutex> lk(mu_);
  events_.clear();
}

} // namespace vitals::app
