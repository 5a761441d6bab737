#include "minitest.hpp"
#include "fixtures.hpp"
#include "collectors/ProcessCpuCollector.hpp"
#include <chrono>
#include <thread>
#include <unistd.h>

using vitals::collectors::ProcessCpuCollector;

TEST(process_cpu_parse_stat_handles_parens_in_comm) {
  vitals::model::CpuMark m{};
  std::string line = "77 (odd) name) R 1 77 77 0 -1 0 0 0 0 0 1234 567 0 0 20 0 1 0 5 0 0\n";
  ASSERT_TRUE(ProcessCpuCollector::parse_stat(line, m));
  ASSERT_EQ(m.utime_ticks, 1234u);
  ASSERT_EQ(m.stime_ticks, 567u);
}

TEST(process_cpu_parse_stat_rejects_truncated_line) {
  vitals::model::CpuMark m{};
  ASSERT_TRUE(!ProcessCpuCollector::parse_stat("77 (short) R 1 2 3\n", m));
  ASSERT_TRUE(!ProcessCpuCollector::parse_stat("garbage without parens", m));
}

TEST(process_cpu_delta_is_share_of_wall_time) {
  auto root = fixtures::make_root("cpu_delta");
  long hz = ::sysconf(_SC_CLK_TCK); if (hz <= 0) hz = 100;
  fixtures::write_self_stat(root, 100, 50);
  ProcessCpuCollector c;
  ASSERT_TRUE(c.mark());
  std::this_thread::sleep_for(std::chrono::milliseconds(200));
  // 0.1s of CPU (user + system) over >= 0.2s of wall time
  fixtures::write_self_stat(root, 100 + static_cast<unsigned long long>(hz) / 20,
                                  50 + static_cast<unsigned long long>(hz) / 20);
  auto d = c.take_delta();
  ASSERT_TRUE(d.has_value());
  ASSERT_TRUE(d->wall_secs >= 0.2);
  ASSERT_TRUE(d->cpu_secs > 0.0);
  ASSERT_TRUE(d->usage_pct > 0.0 && d->usage_pct <= 50.0);
  fixtures::cleanup(root);
}

TEST(process_cpu_take_delta_reanchors_baseline) {
  auto root = fixtures::make_root("cpu_anchor");
  fixtures::write_self_stat(root, 100, 50);
  ProcessCpuCollector c;
  ASSERT_TRUE(c.mark());
  fixtures::write_self_stat(root, 300, 80);
  auto first = c.take_delta();
  ASSERT_TRUE(first.has_value() && first->cpu_secs > 0.0);
  ASSERT_EQ(c.baseline()->ticks(), 380u);
  // nothing consumed since the last call
  auto second = c.take_delta();
  ASSERT_TRUE(second.has_value());
  ASSERT_EQ(second->cpu_secs, 0.0);
  ASSERT_EQ(second->usage_pct, 0.0);
  fixtures::cleanup(root);
}

TEST(process_cpu_usage_clamped_to_100) {
  auto root = fixtures::make_root("cpu_clamp");
  long hz = ::sysconf(_SC_CLK_TCK); if (hz <= 0) hz = 100;
  fixtures::write_self_stat(root, 0, 0);
  ProcessCpuCollector c;
  ASSERT_TRUE(c.mark());
  std::this_thread::sleep_for(std::chrono::milliseconds(20));
  // many threads busy: 50s of CPU in a few ms
  fixtures::write_self_stat(root, static_cast<unsigned long long>(hz) * 50, 0);
  auto d = c.take_delta();
  ASSERT_TRUE(d.has_value());
  ASSERT_EQ(d->usage_pct, 100.0);
  fixtures::cleanup(root);
}

TEST(process_cpu_unreadable_keeps_baseline) {
  auto root = fixtures::make_root("cpu_missing");
  fixtures::write_self_stat(root, 10, 10);
  ProcessCpuCollector c;
  ASSERT_TRUE(c.mark());
  std::filesystem::remove(root / "proc/self/stat");
  ASSERT_TRUE(!c.take_delta().has_value());
  ASSERT_EQ(c.baseline()->ticks(), 20u);
  fixtures::cleanup(root);
}

TEST(process_cpu_read_error_keeps_baseline) {
  auto root = fixtures::make_root("cpu_eisdir");
  fixtures::write_self_stat(root, 30, 12);
  ProcessCpuCollector c;
  ASSERT_TRUE(c.mark());
  fixtures::make_unreadable(root / "proc/self/stat");
  ASSERT_TRUE(!c.take_delta().has_value());
  ASSERT_TRUE(!c.mark());
  ASSERT_EQ(c.baseline()->ticks(), 42u);
  fixtures::cleanup(root);
}

TEST(process_cpu_reads_live_proc) {
  ::unsetenv("VITALS_PROC_ROOT");
  ProcessCpuCollector c;
  ASSERT_TRUE(c.mark());
  auto d = c.take_delta();
  ASSERT_TRUE(d.has_value());
  ASSERT_TRUE(d->usage_pct >= 0.0 && d->usage_pct <= 100.0);
}
