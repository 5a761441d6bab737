// Helpers for reading /proc and /sys with optional root remap
#pragma once
#include <optional>
#include <string>

namespace vitals::util {

// Map an absolute /proc path to an alternate root if VITALS_PROC_ROOT is set
auto map_proc_path(const std::string& abs) -> std::string;

// Map an absolute /sys path to an alternate root if VITALS_SYS_ROOT is set
auto map_sys_path(const std::string& abs) -> std::string;

// Read entire file as string. Returns std::nullopt on error, including a
// read that fails after open (directories, EINVAL sysfs attributes).
// Paths under /proc and /sys are remapped.
auto read_file_string(const std::string& abs) -> std::optional<std::string>;

// Read a file holding a single integer (sysfs style). Returns std::nullopt on
// error or when the content does not parse.
auto read_file_int(const std::string& abs) -> std::optional<long long>;

} // namespace vitals::util
