#include "model/Activity.hpp"

#include <cstdio>
#include <ctime>

namespace vitals::model {

const char* to_string(ActivityStatus s) {
  switch (s) {
    case ActivityStatus::Success: return "success";
    case ActivityStatus::Warning: return "warning";
    case ActivityStatus::Info:    return "info";
  }
  return "info";
}

std::optional<ActivityStatus> parse_activity_status(std::string_view s) {
  if (s == "success") return ActivityStatus::Success;
  if (s == "warning") return ActivityStatus::Warning;
  if (s == "info")    return ActivityStatus::Info;
  return std::nullopt;
}

std::string format_timestamp(std::chrono::system_clock::time_point tp) {
  using namespace std::chrono;
  auto ms = duration_cast<milliseconds>(tp.time_since_epoch()).count() % 1000;
  if (ms < 0) ms += 1000;
  std::time_t t = system_clock::to_time_t(tp);
  std::tm tm{};
  ::gmtime_r(&t, &tm);
  char buf[96]; // room for any int year, not just four digits
  int n = std::snprintf(buf, sizeof(buf), "%04d-%02d-%02dT%02d:%02d:%02d.%03dZ",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday,
                tm.tm_hour, tm.tm_min, tm.tm_sec, static_cast<int>(ms));
  if (n < 0) return std::string();
  return std::string(buf);
}

} // namespace vitals::model
