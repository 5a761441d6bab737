// Fake /proc and /sys trees for collector and sampler tests
#pragma once
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <string>
#include <unistd.h>

namespace fixtures {

namespace fs = std::filesystem;

inline fs::path make_root(const std::string& tag) {
  auto root = fs::temp_directory_path() / fs::path("vitals_test_" + tag + "_" + std::to_string(::getpid()));
  fs::remove_all(root);
  fs::create_directories(root / "proc/self");
  fs::create_directories(root / "proc/net");
  fs::create_directories(root / "sys/class/net");
  ::setenv("VITALS_PROC_ROOT", root.c_str(), 1);
  ::setenv("VITALS_SYS_ROOT", root.c_str(), 1);
  return root;
}

inline void write(const fs::path& p, const std::string& content) {
  fs::create_directories(p.parent_path());
  std::ofstream(p) << content;
}

inline void write_self_stat(const fs::path& root, unsigned long long utime, unsigned long long stime) {
  write(root / "proc/self/stat",
        "4242 (vitals worker) S 1 4242 4242 0 -1 4194304 100 0 0 0 " +
        std::to_string(utime) + " " + std::to_string(stime) + " 0 0 20 0 1 0 100 1000000 200\n");
}

inline void write_meminfo(const fs::path& root, unsigned long long total_kb, unsigned long long avail_kb) {
  write(root / "proc/meminfo",
        "MemTotal:       " + std::to_string(total_kb) + " kB\n"
        "MemFree:         100 kB\n"
        "MemAvailable:   " + std::to_string(avail_kb) + " kB\n");
}

inline void write_net_dev(const fs::path& root, unsigned long long rx, unsigned long long tx) {
  write(root / "proc/net/dev",
        "Inter-|   Receive                                                |  Transmit\n"
        " face |bytes    packets errs drop fifo frame compressed multicast|bytes    packets errs drop fifo colls carrier compressed\n"
        "    lo: 999999 0 0 0 0 0 0 0  999999 0 0 0 0 0 0 0\n"
        "  eth0: " + std::to_string(rx) + " 0 0 0 0 0 0 0  " + std::to_string(tx) + " 0 0 0 0 0 0 0\n");
}

inline void write_diskstats(const fs::path& root, unsigned long long rdsec, unsigned long long wrsec,
                            unsigned long long io_ms) {
  write(root / "proc/diskstats",
        "   7       0 loop0 10 0 10 0  0 0 0 0  0  900000 0\n"
        "   8       0 sda 100 0 " + std::to_string(rdsec) + " 0  200 0 " + std::to_string(wrsec) +
        " 0  0  " + std::to_string(io_ms) + " 0\n");
}

inline void write_full(const fs::path& root) {
  write_self_stat(root, 100, 50);
  write_meminfo(root, 2000000, 1500000);
  write_net_dev(root, 1000, 2000);
  write_diskstats(root, 1000, 2000, 100);
  write(root / "sys/class/net/eth0/speed", "1000\n");
}

// Replace a file with a directory: open() succeeds, read() fails with EISDIR
inline void make_unreadable(const fs::path& p) {
  fs::remove_all(p);
  fs::create_directories(p);
}

inline void cleanup(const fs::path& root) {
  ::unsetenv("VITALS_PROC_ROOT");
  ::unsetenv("VITALS_SYS_ROOT");
  std::error_code ec;
  fs::remove_all(root, ec);
}

} // namespace fixtures
