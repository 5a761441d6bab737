#pragma once
#include <functional>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>
#include <cstdlib>

namespace mini {

struct TestCase { std::string name; std::function<void()> fn; };
inline std::vector<TestCase>& registry() { static std::vector<TestCase> r; return r; }

struct Registrar {
  Registrar(const std::string& name, std::function<void()> fn) { registry().push_back({name, std::move(fn)}); }
};

inline void json_escape(const std::string& s) {
  for (const char c : s) {
    if (c == '"' || c == '\\') std::cout << '\\' << c; else if (c == '\n') std::cout << "\\n"; else std::cout << c;
  }
}

inline int run_all() {
  const char* json_env = std::getenv("VITALS_TEST_JSON");
  bool json = json_env && (*json_env == '1' || *json_env == 't' || *json_env == 'T' || *json_env == 'y' || *json_env == 'Y');
  int failed = 0; int passed = 0;
  auto fail = [&](const std::string& name, const std::string& what) {
    ++failed;
    if (json) {
      std::cout << "{\"event\":\"test\",\"name\":\"" << name << "\",\"status\":\"fail\",\"error\":\"";
      json_escape(what);
      std::cout << "\"}" << "\n";
    } else {
      std::cerr << "[FAIL] " << name << ": " << what << "\n";
    }
  };
  for (auto& t : registry()) {
    try {
      t.fn();
      ++passed;
      if (json) {
        std::cout << "{\"event\":\"test\",\"name\":\"" << t.name << "\",\"status\":\"pass\"}" << "\n";
      } else {
        std::cout << "[PASS] " << t.name << "\n";
      }
    } catch (const std::exception& e) {
      fail(t.name, e.what());
    } catch (...) {
      fail(t.name, "unknown exception");
    }
  }
  if (json) {
    std::cout << "{\"event\":\"summary\",\"passed\":" << passed << ",\"failed\":" << failed << "}" << "\n";
  } else {
    std::cout << "\n" << passed << " passed, " << failed << " failed\n";
  }
  return failed == 0 ? 0 : 1;
}

struct AssertionError : public std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace mini

#define TEST(name) \
  static void name(); \
  static ::mini::Registrar name##_registrar{#name, name}; \
  static void name()

#define ASSERT_TRUE(expr) do { if(!(expr)) throw ::mini::AssertionError(std::string("ASSERT_TRUE failed: ") + #expr); } while(0)
#define ASSERT_EQ(a,b) do { if(!((a)==(b))) { throw ::mini::AssertionError(std::string("ASSERT_EQ failed: ") + #a " == " #b); } } while(0)
#define ASSERT_NE(a,b) do { if(!((a)!=(b))) { throw ::mini::AssertionError(std::string("ASSERT_NE failed: ") + #a " != " #b); } } while(0)
#define ASSERT_THROWS(expr, ExType) do { bool thrown_ = false; \
  try { (void)(expr); } catch (const ExType&) { thrown_ = true; } \
  if (!thrown_) throw ::mini::AssertionError(std::string("ASSERT_THROWS failed: ") + #expr + " did not throw " #ExType); } while(0)
