#pragma once

#include <chrono>
#include <cstddef>
#include <string>

namespace vitals::app {

// How network and disk utilization are produced
enum class EstimateMode { Counters, Simulated };

struct SamplerConfig {
  std::chrono::milliseconds cache_duration{3000};
  EstimateMode mode{EstimateMode::Counters};
  double nominal_link_mbps{1000.0};
};

struct ActivityConfig {
  size_t capacity{50};
};

struct AlertConfig {
  double cpu_high_pct{90.0};
  double mem_high_pct{90.0};
  double disk_high_pct{95.0};
  std::chrono::milliseconds sustain{3000};
};

struct Config {
  SamplerConfig sampler{};
  ActivityConfig activity{};
  AlertConfig alerts{};
};

// Resolve every key from TOML -> env -> compiled default. An empty path means
// the default location ($XDG_CONFIG_HOME or ~/.config, vitals/config.toml).
// A missing file is not an error.
Config load_config(const std::string& path = "");

std::string config_file_path();

// Environment variable helpers; VITALS_X also matches vitals_X
const char* getenv_compat(const char* name);
int getenv_int(const char* name, int defv);

EstimateMode parse_estimate_mode(const std::string& s, EstimateMode defv);
const char* to_string(EstimateMode m);

} // namespace vitals::app
