#pragma once

#include <iostream>
#include <string>

namespace etude::testing {

struct TestSuite {
  bool ok = true;
  void require(bool condition, const std::string& message) {
    if (!condition) {
      std::cerr << "[FAIL] " << message << std::endl;
      ok = false;
    }
  }
};

// Runs body and reports whether it threw an exception of type E.
template <typename E, typename Body>
bool throws(Body&& body) {
  try {
    body();
  } catch (const E&) {
    return true;
  }
  return false;
}

inline int finish(const TestSuite& suite, const std::string& name) {
  if (!suite.ok) {
    std::cerr << name << " tests FAILED" << std::endl;
    return 1;
  }
  std::cout << name << " tests passed" << std::endl;
  return 0;
}

} // namespace etude::testing
