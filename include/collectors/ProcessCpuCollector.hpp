#pragma once
#include <optional>
#include <string>
#include "model/Cpu.hpp"

namespace vitals::collectors {

// CPU time consumed by this process, measured as a delta between marks.
// take_delta() is destructive: every successful call re-anchors the baseline
// to the reading it just took, so a collector must have a single consumer.
class ProcessCpuCollector {
public:
  ProcessCpuCollector();

  // Take the first baseline. Returns false if /proc/self/stat is unreadable;
  // take_delta() will then anchor on its first success.
  bool mark();

  // CPU usage since the previous mark. Returns std::nullopt when the counters
  // cannot be read; the baseline is left untouched in that case.
  std::optional<vitals::model::CpuDelta> take_delta();

  const std::optional<vitals::model::CpuMark>& baseline() const { return last_; }

  // Parse utime/stime (fields 14 and 15) from a /proc/<pid>/stat line
  static bool parse_stat(const std::string& txt, vitals::model::CpuMark& out);

private:
  std::optional<vitals::model::CpuMark> read_now() const;

  std::optional<vitals::model::CpuMark> last_{};
  long ticks_per_sec_{100};
};

} // namespace vitals::collectors
