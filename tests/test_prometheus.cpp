#include "minitest.hpp"
#include "app/PrometheusSerializer.hpp"
#include <string>

TEST(prometheus_serializer_resource_gauges) {
  vitals::model::ResourceSnapshot snap{};
  snap.cpu_pct = 42.5; snap.memory_pct = 50; snap.network_pct = 12.25; snap.disk_pct = 7; snap.seq = 3;
  std::string out = vitals::app::snapshot_to_prometheus(snap);
  ASSERT_TRUE(out.find("# TYPE vitals_cpu_usage_percent gauge") != std::string::npos);
  ASSERT_TRUE(out.find("vitals_cpu_usage_percent 42.5\n") != std::string::npos);
  ASSERT_TRUE(out.find("vitals_memory_usage_percent 50\n") != std::string::npos);
  ASSERT_TRUE(out.find("vitals_network_usage_percent 12.25\n") != std::string::npos);
  ASSERT_TRUE(out.find("vitals_disk_usage_percent 7\n") != std::string::npos);
  ASSERT_TRUE(out.find("# TYPE vitals_sampler_refreshes_total counter") != std::string::npos);
  ASSERT_TRUE(out.find("vitals_sampler_refreshes_total 3\n") != std::string::npos);
}

TEST(prometheus_serializer_activity_counters) {
  vitals::app::ActivityLog log(2);
  log.record("a", "x", vitals::model::ActivityStatus::Success);
  log.record("a", "y", vitals::model::ActivityStatus::Warning);
  log.record("a", "z");
  std::string out = vitals::app::activity_to_prometheus(log.stats());
  ASSERT_TRUE(out.find("vitals_activity_events_total{status=\"success\"} 1\n") != std::string::npos);
  ASSERT_TRUE(out.find("vitals_activity_events_total{status=\"warning\"} 1\n") != std::string::npos);
  ASSERT_TRUE(out.find("vitals_activity_events_total{status=\"info\"} 1\n") != std::string::npos);
  ASSERT_TRUE(out.find("vitals_activity_retained 2\n") != std::string::npos);
  ASSERT_TRUE(out.find("vitals_activity_capacity 2\n") != std::string::npos);
}
