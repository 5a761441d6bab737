#include "collectors/DiskCollector.hpp"
#include "util/Procfs.hpp"
#include <algorithm>
#include <chrono>
#include <sstream>

using namespace std::chrono;

namespace vitals::collectors {

static double now_secs() {
  return duration_cast<duration<double>>(steady_clock::now().time_since_epoch()).count();
}

static bool is_virtual(const std::string& name) {
  return name.rfind("loop",0)==0 || name.rfind("ram",0)==0 || name.rfind("zram",0)==0;
}

bool DiskCollector::sample(vitals::model::DiskSnapshot& out) {
  auto txt_opt = vitals::util::read_file_string("/proc/diskstats");
  if (!txt_opt) return false;
  out.devices.clear(); out.total_read_bps = out.total_write_bps = 0.0; out.busiest_util_pct = 0.0;
  std::istringstream ss(*txt_opt); std::string line; double ts = now_secs();
  std::unordered_map<std::string, Prev> next;
  while (std::getline(ss, line)) {
    std::istringstream ls(line);
    unsigned major=0, minor=0; std::string name;
    uint64_t rd=0, rdmerge=0, rdsec=0, rdtm=0, wr=0, wrmerge=0, wrsec=0, wrtm=0, inprog=0, tios=0;
    if (!(ls>>major>>minor>>name>>rd>>rdmerge>>rdsec>>rdtm>>wr>>wrmerge>>wrsec>>wrtm>>inprog>>tios)) continue;
    if (is_virtual(name)) continue;
    vitals::model::DiskDev d; d.name=name; d.sectors_read=rdsec; d.sectors_written=wrsec; d.time_in_io_ms=tios;
    auto it = last_.find(name);
    if (it != last_.end()) {
      const auto& p = it->second; double dt = ts - p.ts; if (dt<=0.0) dt=1.0;
      double rbytes = rdsec >= p.rdsec ? static_cast<double>((rdsec - p.rdsec) * kSectorSize) : 0.0;
      double wbytes = wrsec >= p.wrsec ? static_cast<double>((wrsec - p.wrsec) * kSectorSize) : 0.0;
      d.read_bps = rbytes / dt; d.write_bps = wbytes / dt;
      double dioms = tios >= p.tios ? static_cast<double>(tios - p.tios) : 0.0; // ms spent doing I/O during interval
      d.util_pct = std::clamp((dioms / (dt * 1000.0)) * 100.0, 0.0, 100.0);
      out.total_read_bps += d.read_bps; out.total_write_bps += d.write_bps;
      out.busiest_util_pct = std::max(out.busiest_util_pct, d.util_pct);
    }
    next[name] = Prev{rdsec, wrsec, tios, ts};
    out.devices.push_back(std::move(d));
  }
  last_ = std::move(next);
  return true;
}

} // namespace vitals::collectors
