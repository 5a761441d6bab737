#include "collectors/MemoryCollector.hpp"
#include "util/Procfs.hpp"

#include <charconv>
#include <string>
#include <string_view>

namespace vitals::collectors {

static inline uint64_t parse_kb(std::string_view sv) {
  uint64_t v = 0;
  // strip unit on the right (e.g., kB)
  while (!sv.empty() && (sv.back() < '0' || sv.back() > '9')) sv.remove_suffix(1);
  while (!sv.empty() && (sv.front() == ' ' || sv.front() == '\t')) sv.remove_prefix(1);
  std::from_chars(sv.data(), sv.data() + sv.size(), v);
  return v;
}

bool MemoryCollector::sample(vitals::model::Memory& out) const {
  auto txt_opt = vitals::util::read_file_string("/proc/meminfo");
  if (!txt_opt) return false;
  const std::string& txt = *txt_opt;

  uint64_t mem_total = 0, mem_free = 0, mem_avail = 0, buffers = 0, cached = 0;
  bool have_avail = false;
  size_t start = 0;
  while (start < txt.size()) {
    size_t end = txt.find('\n', start);
    if (end == std::string::npos) end = txt.size();
    std::string_view line(txt.data() + start, end - start);
    if (line.starts_with("MemTotal:")) mem_total = parse_kb(line.substr(9));
    else if (line.starts_with("MemFree:")) mem_free = parse_kb(line.substr(8));
    else if (line.starts_with("MemAvailable:")) { mem_avail = parse_kb(line.substr(13)); have_avail = true; }
    else if (line.starts_with("Buffers:")) buffers = parse_kb(line.substr(8));
    else if (line.starts_with("Cached:")) cached = parse_kb(line.substr(7));
    start = end + 1;
  }
  if (mem_total == 0) return false;

  out.total_kb = mem_total;
  out.free_kb = have_avail ? mem_avail : (mem_free + buffers + cached);
  out.used_kb = (mem_total > out.free_kb) ? (mem_total - out.free_kb) : 0;
  out.used_pct = 100.0 * static_cast<double>(out.used_kb) / static_cast<double>(out.total_kb);
  return true;
}

} // namespace vitals::collectors
