#pragma once
#include "model/Memory.hpp"

namespace vitals::collectors {

class MemoryCollector {
public:
  bool sample(vitals::model::Memory& out) const; // returns true on success
};

} // namespace vitals::collectors
