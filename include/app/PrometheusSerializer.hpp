#pragma once

#include <string>
#include "app/ActivityLog.hpp"
#include "model/Resource.hpp"

namespace vitals::app {

// Prometheus text exposition format (version 0.0.4). Formatting only; the
// embedding service decides how the text is served.
[[nodiscard]] std::string snapshot_to_prometheus(const vitals::model::ResourceSnapshot& snap);
[[nodiscard]] std::string activity_to_prometheus(const ActivityStats& stats);

} // namespace vitals::app
