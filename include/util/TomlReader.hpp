#pragma once

#include <cctype>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace vitals::util {

// Minimal reader for the flat TOML subset used by the config file:
// [section] headers, key = value pairs, '#' comments, quoted strings.
// Arrays, inline tables and multi-line strings are not supported; such lines
// are counted in skipped_lines() and otherwise ignored.
class TomlReader {
public:
  bool load(const std::string& path) {
    sections_.clear();
    skipped_ = 0;
    std::ifstream in(path);
    if (!in.is_open()) return false;
    std::string current_section;
    std::string line;
    while (std::getline(in, line)) {
      auto sv = trim(strip_comment(line));
      if (sv.empty()) continue;
      if (sv.front() == '[') {
        if (sv.back() != ']' || sv.size() < 3) { ++skipped_; continue; }
        current_section = std::string(trim(sv.substr(1, sv.size() - 2)));
        ensure_section(current_section);
        continue;
      }
      auto eq = sv.find('=');
      if (eq == std::string_view::npos || eq == 0) { ++skipped_; continue; }
      std::string key(trim(sv.substr(0, eq)));
      std::string val(trim(sv.substr(eq + 1)));
      if (val.size() >= 2 && val.front() == '"' && val.back() == '"')
        val = val.substr(1, val.size() - 2);
      else if (!val.empty() && (val.front() == '[' || val.front() == '{')) { ++skipped_; continue; }
      ensure_section(current_section).set(key, val);
    }
    return true;
  }

  [[nodiscard]] bool has(std::string_view section, std::string_view key) const {
    const auto* s = find_section(section);
    return s && s->has(key);
  }

  [[nodiscard]] std::string get_string(std::string_view section, std::string_view key,
                                       const std::string& def = "") const {
    const auto* s = find_section(section);
    return s ? s->get(key, def) : def;
  }

  [[nodiscard]] int get_int(std::string_view section, std::string_view key, int def = 0) const {
    auto val = get_string(section, key);
    if (val.empty()) return def;
    try { return std::stoi(val); } catch (const std::exception&) { return def; }
  }

  [[nodiscard]] double get_double(std::string_view section, std::string_view key, double def = 0.0) const {
    auto val = get_string(section, key);
    if (val.empty()) return def;
    try { return std::stod(val); } catch (const std::exception&) { return def; }
  }

  [[nodiscard]] int skipped_lines() const { return skipped_; }

private:
  struct Section {
    std::vector<std::pair<std::string, std::string>> entries;

    [[nodiscard]] std::string get(std::string_view key, const std::string& def) const {
      for (const auto& [k, v] : entries)
        if (k == key) return v;
      return def;
    }

    void set(const std::string& key, const std::string& val) {
      for (auto& [k, v] : entries) {
        if (k == key) { v = val; return; }
      }
      entries.emplace_back(key, val);
    }

    [[nodiscard]] bool has(std::string_view key) const {
      for (const auto& [k, v] : entries)
        if (k == key) return true;
      return false;
    }
  };

  std::vector<std::pair<std::string, Section>> sections_;
  int skipped_{0};

  Section& ensure_section(const std::string& name) {
    for (auto& [n, s] : sections_)
      if (n == name) return s;
    sections_.emplace_back(name, Section{});
    return sections_.back().second;
  }

  [[nodiscard]] const Section* find_section(std::string_view name) const {
    for (const auto& [n, s] : sections_)
      if (n == name) return &s;
    return nullptr;
  }

  // Drop a trailing '# ...' comment unless the '#' sits inside quotes
  static std::string_view strip_comment(std::string_view sv) {
    bool in_quotes = false;
    for (size_t i = 0; i < sv.size(); ++i) {
      if (sv[i] == '"') in_quotes = !in_quotes;
      else if (sv[i] == '#' && !in_quotes) return sv.substr(0, i);
    }
    return sv;
  }

  static std::string_view trim(std::string_view sv) {
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.front()))) sv.remove_prefix(1);
    while (!sv.empty() && std::isspace(static_cast<unsigned char>(sv.back()))) sv.remove_suffix(1);
    return sv;
  }
};

} // namespace vitals::util
