#pragma once
#include <cstdint>
#include <string>
#include <vector>

namespace vitals::model {

struct NetIf {
  std::string name;
  uint64_t rx_bytes{};
  uint64_t tx_bytes{};
  double rx_bps{};      // bytes per second
  double tx_bps{};
  double speed_mbps{};  // link speed, 0 when sysfs does not report one
};

struct NetSnapshot {
  std::vector<NetIf> interfaces;
  double agg_rx_bps{};
  double agg_tx_bps{};
  double util_pct{};    // sum of max(rx,tx) bits/s per link / link capacity, 0..100 (full duplex)
};

} // namespace vitals::model
