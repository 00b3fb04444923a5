#pragma once

#include <cstdlib>
#include <iostream>
#include <string>

namespace pigame::log {

inline bool debug_enabled() {
  static bool enabled = [] {
    const char* env = std::getenv("PIGAME_DEBUG");
    if (!env) {
      return false;
    }
    std::string value(env);
    return !(value.empty() || value == "0" || value == "false" || value == "FALSE");
  }();
  return enabled;
}

inline void debug(const char* tag, const std::string& message) {
  if (debug_enabled()) {
    std::cerr << "[" << tag << "] " << message << std::endl;
  }
}

inline void warning(const char* tag, const std::string& message) {
  std::cerr << "[" << tag << "] warning: " << message << std::endl;
}

} // namespace pigame::log
