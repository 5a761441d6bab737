#pragma once
#include <chrono>
#include <optional>
#include <string>
#include <string_view>

namespace vitals::model {

enum class ActivityStatus { Success, Warning, Info };

struct ActivityEvent {
  std::string source;
  std::chrono::system_clock::time_point timestamp{};
  ActivityStatus status{ActivityStatus::Info};
  std::string message;
};

[[nodiscard]] const char* to_string(ActivityStatus s);

// Accepts exactly "success", "warning" or "info"
[[nodiscard]] std::optional<ActivityStatus> parse_activity_status(std::string_view s);

// UTC ISO-8601 with milliseconds, e.g. 2026-10-19T12:00:00.123Z
[[nodiscard]] std::string format_timestamp(std::chrono::system_clock::time_point tp);

} // namespace vitals::model
