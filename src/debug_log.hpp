#pragma once

#include <cstdlib>
#include <iostream>
#include <string>

namespace etude {

// Diagnostics go to stderr when ETUDE_DEBUG or ETUDE_DEBUG_<CHANNEL> is set.
// Each call site passes a string literal channel and caches the flag.
inline bool debug_flag_set(const char* variable) {
  const char* env = std::getenv(variable);
  if (!env) {
    return false;
  }
  std::string value(env);
  return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
}

inline bool debug_enabled(const std::string& channel) {
  if (debug_flag_set("ETUDE_DEBUG")) {
    return true;
  }
  std::string variable = "ETUDE_DEBUG_";
  for (char c : channel) {
    variable += static_cast<char>(c >= 'a' && c <= 'z' ? c - 'a' + 'A' : c);
  }
  return debug_flag_set(variable.c_str());
}

inline void debug_log(bool enabled, const char* channel, const std::string& message) {
  if (enabled) {
    std::cerr << "[" << channel << "] " << message << std::endl;
  }
}

} // namespace etude
