#pragma once
#include "app/Config.hpp"
#include "model/Resource.hpp"
#include <chrono>
#include <string>
#include <vector>

namespace vitals::app {

struct Alert {
  std::string severity; // warn|crit
  std::string message;
};

class AlertEngine {
public:
  explicit AlertEngine(AlertConfig rules = {});
  // Evaluate snapshot; may return empty if healthy
  std::vector<Alert> evaluate(const vitals::model::ResourceSnapshot& s);
private:
  AlertConfig rules_;
  std::chrono::steady_clock::time_point cpu_high_since_{};
  std::chrono::steady_clock::time_point mem_high_since_{};
};

} // namespace vitals::app
