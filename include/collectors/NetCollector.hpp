#pragma once
#include "model/Net.hpp"

namespace vitals::collectors {

class NetCollector {
public:
  // Interfaces whose sysfs speed is unknown count at nominal_link_mbps
  explicit NetCollector(double nominal_link_mbps = 1000.0);
  bool sample(vitals::model::NetSnapshot& out);
private:
  struct Prev { std::string name; uint64_t rx{}, tx{}; double ts{}; };
  // keep previous by interface name for deltas
  std::vector<Prev> last_{};
  double nominal_link_mbps_;
};

} // namespace vitals::collectors
