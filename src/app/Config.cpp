#include "app/Config.hpp"
#include "util/TomlReader.hpp"
#include <algorithm>
#include <cctype>
#include <cstdio>
#include <cstdlib>
#include <stdexcept>
#include <string>

namespace vitals::app {

const char* getenv_compat(const char* name) {
  const char* v = std::getenv(name);
  if (v && *v) return v;
  std::string alt;
  std::string n(name);
  if (n.rfind("VITALS_", 0) == 0) {
    alt = std::string("vitals_") + n.substr(7);
  } else if (n.rfind("vitals_", 0) == 0) {
    alt = std::string("VITALS_") + n.substr(7);
  }
  if (!alt.empty()) {
    v = std::getenv(alt.c_str());
    if (v && *v) return v;
  }
  return nullptr;
}

int getenv_int(const char* name, int defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stoi(v); } catch (const std::exception&) { return defv; }
}

static double getenv_double(const char* name, double defv) {
  const char* v = getenv_compat(name);
  if (!v || !*v) return defv;
  try { return std::stod(v); } catch (const std::exception&) { return defv; }
}

EstimateMode parse_estimate_mode(const std::string& s, EstimateMode defv) {
  std::string l = s;
  for (auto& c : l) c = static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
  if (l == "counters" || l == "real") return EstimateMode::Counters;
  if (l == "simulated" || l == "demo" || l == "stub") return EstimateMode::Simulated;
  return defv;
}

const char* to_string(EstimateMode m) {
  return m == EstimateMode::Simulated ? "simulated" : "counters";
}

std::string config_file_path() {
  if (const char* xdg = std::getenv("XDG_CONFIG_HOME"); xdg && *xdg)
    return std::string(xdg) + "/vitals/config.toml";
  if (const char* home = std::getenv("HOME"); home && *home)
    return std::string(home) + "/.config/vitals/config.toml";
  return {};
}

// Resolve an int from TOML -> env -> compiled default
static int resolve_int(const vitals::util::TomlReader& toml, bool have_toml,
                       const char* section, const char* key,
                       const char* env_name, int def) {
  if (have_toml && toml.has(section, key))
    return toml.get_int(section, key, def);
  if (env_name)
    return getenv_int(env_name, def);
  return def;
}

static double resolve_double(const vitals::util::TomlReader& toml, bool have_toml,
                             const char* section, const char* key,
                             const char* env_name, double def) {
  if (have_toml && toml.has(section, key))
    return toml.get_double(section, key, def);
  if (env_name)
    return getenv_double(env_name, def);
  return def;
}

static std::string resolve_string(const vitals::util::TomlReader& toml, bool have_toml,
                                  const char* section, const char* key,
                                  const char* env_name, const std::string& def) {
  if (have_toml && toml.has(section, key))
    return toml.get_string(section, key, def);
  if (env_name) {
    const char* v = getenv_compat(env_name);
    if (v && *v) return std::string(v);
  }
  return def;
}

Config load_config(const std::string& path) {
  Config c{};
  vitals::util::TomlReader toml;
  auto p = path.empty() ? config_file_path() : path;
  bool have_toml = !p.empty() && toml.load(p);
  if (!path.empty() && !have_toml) {
    std::fprintf(stderr, "vitals: Config: cannot open %s, using defaults\n", path.c_str());
  }
  if (have_toml && toml.skipped_lines() > 0) {
    std::fprintf(stderr, "vitals: Config: ignored %d unsupported line(s) in %s\n",
                 toml.skipped_lines(), p.c_str());
  }

  // --- [sampler] ---
  int cache_ms = resolve_int(toml, have_toml, "sampler", "cache_ms", "VITALS_CACHE_MS", 3000);
  c.sampler.cache_duration = std::chrono::milliseconds(std::max(0, cache_ms));
  c.sampler.mode = parse_estimate_mode(
      resolve_string(toml, have_toml, "sampler", "mode", "VITALS_SAMPLER_MODE", "counters"),
      EstimateMode::Counters);
  c.sampler.nominal_link_mbps = std::max(1.0,
      resolve_double(toml, have_toml, "sampler", "nominal_link_mbps", "VITALS_NOMINAL_LINK_MBPS", 1000.0));

  // --- [activity] ---
  int cap = resolve_int(toml, have_toml, "activity", "capacity", "VITALS_ACTIVITY_CAPACITY", 50);
  c.activity.capacity = static_cast<size_t>(std::clamp(cap, 1, 10000));

  // --- [alerts] ---
  c.alerts.cpu_high_pct  = resolve_double(toml, have_toml, "alerts", "cpu_high_pct",  "VITALS_ALERT_CPU_PCT", 90.0);
  c.alerts.mem_high_pct  = resolve_double(toml, have_toml, "alerts", "mem_high_pct",  "VITALS_ALERT_MEM_PCT", 90.0);
  c.alerts.disk_high_pct = resolve_double(toml, have_toml, "alerts", "disk_high_pct", "VITALS_ALERT_DISK_PCT", 95.0);
  int sustain_ms = resolve_int(toml, have_toml, "alerts", "sustain_ms", "VITALS_ALERT_SUSTAIN_MS", 3000);
  c.alerts.sustain = std::chrono::milliseconds(std::max(0, sustain_ms));

  return c;
}

} // namespace vitals::app
