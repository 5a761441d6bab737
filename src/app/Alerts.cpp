#include "app/Alerts.hpp"
#include <cstdio>

namespace vitals::app {

AlertEngine::AlertEngine(AlertConfig rules) : rules_(rules) {}

static std::string pct_message(const char* what, double v) {
  char buf[96];
  std::snprintf(buf, sizeof(buf), "%s at %.1f%%", what, v);
  return std::string(buf);
}

std::vector<Alert> AlertEngine::evaluate(const vitals::model::ResourceSnapshot& s) {
  std::vector<Alert> out;
  // Sustain is measured on snapshot time so cached repeats do not extend it
  auto now = s.taken_at;
  // CPU sustained
  if (s.cpu_pct >= rules_.cpu_high_pct) {
    if (cpu_high_since_.time_since_epoch().count() == 0) cpu_high_since_ = now;
    if (now - cpu_high_since_ >= rules_.sustain) out.push_back({"crit", pct_message("Process CPU sustained high", s.cpu_pct)});
  } else { cpu_high_since_ = {}; }

  // Memory sustained
  if (s.memory_pct >= rules_.mem_high_pct) {
    if (mem_high_since_.time_since_epoch().count() == 0) mem_high_since_ = now;
    if (now - mem_high_since_ >= rules_.sustain) out.push_back({"crit", pct_message("Memory usage sustained high", s.memory_pct)});
  } else { mem_high_since_ = {}; }

  // Disk
  if (s.disk_pct >= rules_.disk_high_pct) out.push_back({"warn", pct_message("Disk busy", s.disk_pct)});
  return out;
}

} // namespace vitals::app
