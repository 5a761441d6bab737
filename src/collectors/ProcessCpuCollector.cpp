#include "collectors/ProcessCpuCollector.hpp"
#include "util/Procfs.hpp"

#include <unistd.h>

#include <algorithm>
#include <cstdlib>
#include <string_view>

namespace vitals::collectors {

ProcessCpuCollector::ProcessCpuCollector() {
  long hz = ::sysconf(_SC_CLK_TCK);
  if (hz > 0) ticks_per_sec_ = hz;
}

bool ProcessCpuCollector::parse_stat(const std::string& txt, vitals::model::CpuMark& out) {
  // comm may contain spaces and parens; fields resume after the last ')'
  auto rparen = txt.rfind(')');
  if (rparen == std::string::npos) return false;
  std::string_view rest(txt);
  rest.remove_prefix(rparen + 1);
  // rest: state(3) ppid(4) ... utime(14) stime(15)
  int field = 2;
  size_t start = 0;
  bool got_u = false, got_s = false;
  while (start < rest.size() && !(got_u && got_s)) {
    while (start < rest.size() && (rest[start] == ' ' || rest[start] == '\t')) ++start;
    if (start >= rest.size()) break;
    size_t end = start;
    while (end < rest.size() && rest[end] != ' ' && rest[end] != '\t' && rest[end] != '\n') ++end;
    ++field;
    if (field == 14 || field == 15) {
      std::string tok(rest.substr(start, end - start));
      char* endp = nullptr;
      uint64_t v = std::strtoull(tok.c_str(), &endp, 10);
      if (endp == tok.c_str()) return false;
      if (field == 14) { out.utime_ticks = v; got_u = true; }
      else { out.stime_ticks = v; got_s = true; }
    }
    start = end;
  }
  return got_u && got_s;
}

std::optional<vitals::model::CpuMark> ProcessCpuCollector::read_now() const {
  auto txt = vitals::util::read_file_string("/proc/self/stat");
  if (!txt) return std::nullopt;
  vitals::model::CpuMark m{};
  if (!parse_stat(*txt, m)) return std::nullopt;
  m.at = std::chrono::steady_clock::now();
  return m;
}

bool ProcessCpuCollector::mark() {
  auto now = read_now();
  if (!now) return false;
  last_ = now;
  return true;
}

std::optional<vitals::model::CpuDelta> ProcessCpuCollector::take_delta() {
  auto now = read_now();
  if (!now) return std::nullopt;
  vitals::model::CpuDelta d{};
  if (last_) {
    // counters only go backwards if the fixture or pid changed under us
    uint64_t dticks = now->ticks() >= last_->ticks() ? now->ticks() - last_->ticks() : 0;
    d.cpu_secs = static_cast<double>(dticks) / static_cast<double>(ticks_per_sec_);
    d.wall_secs = std::chrono::duration<double>(now->at - last_->at).count();
    if (d.wall_secs > 0.0) d.usage_pct = std::clamp(100.0 * d.cpu_secs / d.wall_secs, 0.0, 100.0);
  }
  last_ = now;
  return d;
}

} // namespace vitals::collectors
