#include "app/ActivityLog.hpp"
#include "app/Alerts.hpp"
#include "app/Config.hpp"
#include "app/PrometheusSerializer.hpp"
#include "app/ResourceSampler.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdio>
#include <iomanip>
#include <iostream>
#include <string>
#include <thread>

using vitals::model::ActivityStatus;

static std::atomic<bool> g_stop{false};
static void on_sigint(int){ g_stop.store(true); }

static void print_usage() {
  std::cout << "Usage: vitals [--iterations N] [--sleep-ms MS] [--recent N] [--prometheus]\n"
               "              [--simulate] [--config PATH]\n";
  std::cout << "Notes: runs until Ctrl+C unless --iterations is given.\n";
}

static void print_report(const vitals::model::ResourceSnapshot& s) {
  std::cout << "#" << s.seq << std::fixed << std::setprecision(1)
            << "  cpu " << std::setw(5) << s.cpu_pct << "%"
            << "  mem " << std::setw(5) << s.memory_pct << "%"
            << "  net " << std::setw(5) << s.network_pct << "%"
            << "  disk " << std::setw(5) << s.disk_pct << "%\n";
  std::cout.flush();
}

static void print_recent(const vitals::app::ActivityLog& log, size_t n) {
  auto events = log.recent(n);
  std::cout << "\nRecent activity (" << events.size() << " of " << log.size() << ")\n";
  for (const auto& e : events) {
    std::cout << "  " << vitals::model::format_timestamp(e.timestamp)
              << "  " << std::left << std::setw(8) << vitals::model::to_string(e.status) << std::right
              << "  " << e.source << ": " << e.message << "\n";
  }
}

int main(int argc, char** argv) {
  std::signal(SIGINT, on_sigint);
  int iterations = 0; // 0 or less => run until Ctrl+C
  int sleep_ms = 1000;
  int recent_n = 10;
  bool prometheus = false;
  bool simulate = false;
  std::string config_path;
  try {
    for (int i = 1; i < argc; ++i) {
      std::string a = argv[i];
      if (a == "--iterations" && i + 1 < argc) iterations = std::stoi(argv[++i]);
      else if (a == "--sleep-ms" && i + 1 < argc) sleep_ms = std::stoi(argv[++i]);
      else if (a == "--recent" && i + 1 < argc) recent_n = std::stoi(argv[++i]);
      else if (a == "--config" && i + 1 < argc) config_path = argv[++i];
      else if (a == "--prometheus") prometheus = true;
      else if (a == "--simulate") simulate = true;
      else if (a == "-h" || a == "--help") { print_usage(); return 0; }
      else {
        std::fprintf(stderr, "vitals: unknown or incomplete option: %s\n", a.c_str());
        print_usage();
        return 2;
      }
    }
  } catch (const std::exception& e) {
    std::fprintf(stderr, "vitals: bad numeric argument: %s\n", e.what());
    return 2;
  }
  if (sleep_ms < 10) sleep_ms = 10;
  if (recent_n < 0) recent_n = 0;

  auto cfg = vitals::app::load_config(config_path);
  if (simulate) cfg.sampler.mode = vitals::app::EstimateMode::Simulated;

  vitals::app::ResourceSampler sampler(cfg.sampler);
  vitals::app::ActivityLog activity(cfg.activity.capacity);
  vitals::app::AlertEngine alerts(cfg.alerts);

  activity.record("vitals", std::string("sampling started (") + vitals::app::to_string(sampler.mode()) +
                  ", cache " + std::to_string(sampler.cache_duration().count()) + "ms)");

  uint64_t last_seq = 0;
  for (int i = 0; (iterations <= 0 || i < iterations) && !g_stop.load(); ++i) {
    auto s = sampler.sample();
    // cached repeats carry the same seq; only report real measurements
    if (s.seq != last_seq) {
      last_seq = s.seq;
      if (prometheus) {
        std::cout << vitals::app::snapshot_to_prometheus(s)
                  << vitals::app::activity_to_prometheus(activity.stats()) << "\n";
        std::cout.flush();
      } else {
        print_report(s);
      }
      for (const auto& a : alerts.evaluate(s)) {
        activity.record("alerts", "[" + a.severity + "] " + a.message, ActivityStatus::Warning);
      }
    }
    if (iterations > 0 && i + 1 >= iterations) break;
    std::this_thread::sleep_for(std::chrono::milliseconds(sleep_ms));
  }

  activity.record("vitals", "sampling stopped after " + std::to_string(last_seq) + " measurement(s)",
                  ActivityStatus::Success);
  print_recent(activity, static_cast<size_t>(recent_n));
  return 0;
}
