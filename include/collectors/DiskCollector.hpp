#pragma once
#include "model/Disk.hpp"
#include <unordered_map>

namespace vitals::collectors {

class DiskCollector {
public:
  bool sample(vitals::model::DiskSnapshot& out);
private:
  struct Prev { uint64_t rdsec{}, wrsec{}, tios{}; double ts{}; };
  std::unordered_map<std::string, Prev> last_;
  static constexpr uint64_t kSectorSize = 512; // /proc/diskstats always counts 512-byte units
};

} // namespace vitals::collectors
