#include "util/Procfs.hpp"

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <stdexcept>

namespace vitals::util {

static std::string proc_root() {
  const char* env = std::getenv("VITALS_PROC_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string sys_root() {
  const char* env = std::getenv("VITALS_SYS_ROOT");
  if (env && *env) return std::string(env);
  return std::string();
}

static std::string remap(const std::string& abs, const std::string& root) {
  if (root.empty()) return abs;
  std::filesystem::path p(root);
  p /= std::filesystem::path(abs.substr(1)); // drop leading '/'
  return p.string();
}

auto map_proc_path(const std::string& abs) -> std::string {
  if (abs.rfind("/proc", 0) != 0) return abs; // not under /proc
  return remap(abs, proc_root());
}

auto map_sys_path(const std::string& abs) -> std::string {
  if (abs.rfind("/sys", 0) != 0) return abs; // not under /sys
  return remap(abs, sys_root());
}

static std::string map_any(const std::string& abs) {
  if (abs.rfind("/sys", 0) == 0) return map_sys_path(abs);
  return map_proc_path(abs);
}

auto read_file_string(const std::string& abs) -> std::optional<std::string> {
  std::ifstream in(map_any(abs));
  if (!in) return std::nullopt;
  try {
    std::string s((std::istreambuf_iterator<char>(in)), std::istreambuf_iterator<char>());
    return s;
  } catch (const std::exception&) {
    // opened but read() failed: EISDIR, or EINVAL from sysfs attrs of down/virtual links
    return std::nullopt;
  }
}

auto read_file_int(const std::string& abs) -> std::optional<long long> {
  auto txt = read_file_string(abs);
  if (!txt || txt->empty()) return std::nullopt;
  const char* begin = txt->c_str();
  char* end = nullptr;
  errno = 0;
  long long v = std::strtoll(begin, &end, 10);
  if (end == begin || errno == ERANGE) return std::nullopt;
  return v;
}

} // namespace vitals::util
