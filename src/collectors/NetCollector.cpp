#include "collectors/NetCollector.hpp"
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
  static const char* const kPrefixes[] = {
    "lo", "veth", "docker", "br-", "virbr", "ifb", "tun", "tap", "wg", "bond", "dummy",
  };
  for (const char* p : kPrefixes)
    if (name.rfind(p, 0) == 0) return true;
  return false;
}

NetCollector::NetCollector(double nominal_link_mbps)
    : nominal_link_mbps_(nominal_link_mbps > 0.0 ? nominal_link_mbps : 1000.0) {}

bool NetCollector::sample(vitals::model::NetSnapshot& out) {
  auto txt_opt = vitals::util::read_file_string("/proc/net/dev");
  if (!txt_opt) return false;
  out.interfaces.clear(); out.agg_rx_bps = out.agg_tx_bps = 0.0; out.util_pct = 0.0;
  std::istringstream ss(*txt_opt);
  std::string line; int line_no = 0; double ts = now_secs();
  std::vector<Prev> next;
  double capacity_bits = 0.0;
  double busy_bits = 0.0; // per link, the busier direction
  while (std::getline(ss, line)) {
    ++line_no; if (line_no <= 2) continue; // headers
    // format: iface: rx_bytes ... tx_bytes ...
    auto colon = line.find(':'); if (colon == std::string::npos) continue;
    std::string name = line.substr(0, colon);
    while (!name.empty() && name.front() == ' ') name.erase(name.begin());
    if (is_virtual(name)) continue;
    std::istringstream ns(line.substr(colon+1));
    uint64_t rx_bytes=0, tx_bytes=0; // positions: 1st and 9th numbers
    ns >> rx_bytes;
    for (int i=0;i<7;i++){ uint64_t tmp; ns >> tmp; }
    ns >> tx_bytes;
    if (!ns) continue;
    vitals::model::NetIf nif; nif.name = name; nif.rx_bytes = rx_bytes; nif.tx_bytes = tx_bytes;
    // sysfs reports -1 (or fails to read) for links that are down or virtual
    if (auto speed = vitals::util::read_file_int("/sys/class/net/" + name + "/speed"); speed && *speed > 0)
      nif.speed_mbps = static_cast<double>(*speed);
    capacity_bits += (nif.speed_mbps > 0.0 ? nif.speed_mbps : nominal_link_mbps_) * 1e6;
    auto p = std::find_if(last_.begin(), last_.end(), [&](const Prev& x){ return x.name == name; });
    if (p != last_.end()) {
      double dt = ts - p->ts; if (dt <= 0.0) dt = 1.0;
      // counters reset when an interface is re-created
      double dr = rx_bytes >= p->rx ? static_cast<double>(rx_bytes - p->rx) : 0.0;
      double dtb = tx_bytes >= p->tx ? static_cast<double>(tx_bytes - p->tx) : 0.0;
      nif.rx_bps = dr / dt; nif.tx_bps = dtb / dt;
    }
    out.agg_rx_bps += nif.rx_bps; out.agg_tx_bps += nif.tx_bps;
    busy_bits += std::max(nif.rx_bps, nif.tx_bps) * 8.0;
    next.push_back(Prev{name, rx_bytes, tx_bytes, ts});
    out.interfaces.push_back(std::move(nif));
  }
  if (capacity_bits > 0.0) {
    out.util_pct = std::clamp(100.0 * busy_bits / capacity_bits, 0.0, 100.0);
  }
  last_ = std::move(next);
  return true;
}

} // namespace vitals::collectors
