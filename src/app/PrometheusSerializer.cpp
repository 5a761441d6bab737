#include "app/PrometheusSerializer.hpp"
#include <charconv>
#include <string_view>

namespace {

void append_double(std::string& out, double v) {
  char buf[32];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  if (ec == std::errc{}) {
    out.append(buf, ptr);
  } else {
    out += '0';
  }
}

void append_uint(std::string& out, uint64_t v) {
  char buf[24];
  auto [ptr, ec] = std::to_chars(buf, buf + sizeof(buf), v);
  out.append(buf, ptr);
}

void emit_header(std::string& out, const char* name, const char* help, const char* type) {
  out += "# HELP ";  out += name;  out += ' ';  out += help;  out += '\n';
  out += "# TYPE ";  out += name;  out += ' ';  out += type;  out += '\n';
}

void emit_gauge_d(std::string& out, const char* name, double value) {
  out += name;  out += ' ';  append_double(out, value);  out += '\n';
}

void emit_gauge_u(std::string& out, const char* name, uint64_t value) {
  out += name;  out += ' ';  append_uint(out, value);  out += '\n';
}

// label values here are fixed identifiers, no escaping needed
void emit_labeled_u(std::string& out, const char* name,
                    const char* lk, std::string_view lv, uint64_t value) {
  out += name;  out += '{';  out += lk;  out += "=\"";  out += lv;
  out += "\"} ";  append_uint(out, value);  out += '\n';
}

} // anonymous namespace

namespace vitals::app {

std::string snapshot_to_prometheus(const vitals::model::ResourceSnapshot& s) {
  std::string out;
  out.reserve(1024);

  emit_header(out, "vitals_cpu_usage_percent", "CPU time used by this process over the last interval", "gauge");
  emit_gauge_d(out, "vitals_cpu_usage_percent", s.cpu_pct);
  emit_header(out, "vitals_memory_usage_percent", "Physical memory in use", "gauge");
  emit_gauge_d(out, "vitals_memory_usage_percent", s.memory_pct);
  emit_header(out, "vitals_network_usage_percent", "Network throughput relative to link capacity", "gauge");
  emit_gauge_d(out, "vitals_network_usage_percent", s.network_pct);
  emit_header(out, "vitals_disk_usage_percent", "Busiest block device I/O time", "gauge");
  emit_gauge_d(out, "vitals_disk_usage_percent", s.disk_pct);
  emit_header(out, "vitals_sampler_refreshes_total", "Resource measurements taken", "counter");
  emit_gauge_u(out, "vitals_sampler_refreshes_total", s.seq);
  return out;
}

std::string activity_to_prometheus(const ActivityStats& st) {
  std::string out;
  out.reserve(512);

  emit_header(out, "vitals_activity_events_total", "Activity events recorded by status", "counter");
  emit_labeled_u(out, "vitals_activity_events_total", "status", "success", st.success);
  emit_labeled_u(out, "vitals_activity_events_total", "status", "warning", st.warning);
  emit_labeled_u(out, "vitals_activity_events_total", "status", "info", st.info);
  emit_header(out, "vitals_activity_retained", "Activity events currently held", "gauge");
  emit_gauge_u(out, "vitals_activity_retained", st.retained);
  emit_header(out, "vitals_activity_capacity", "Activity log capacity", "gauge");
  emit_gauge_u(out, "vitals_activity_capacity", st.capacity);
  return out;
}

} // namespace vitals::app
