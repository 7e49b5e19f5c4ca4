#pragma once
#include <iostream>
#include <sstream>
#include <utility>
#include "sg/core/config.hpp"

namespace sg { namespace log {

// Redirectable sink; defaults to std::cerr.
inline std::ostream*& _sink() {
  static std::ostream* s = &std::cerr;
  return s;
}
inline void set_sink(std::ostream* os) { _sink() = os ? os : &std::cerr; }

template <class... Args>
inline void _write(const char* tag, Args&&... args) {
  std::ostringstream oss;
  oss << "[sg:" << tag << "] ";
  (oss << ... << std::forward<Args>(args));
  oss << "\n";
  (*_sink()) << oss.str();
}

// Emitted only while tracing is on (SG_TRACE / config::set_trace).
template <class... Args>
inline void debug(Args&&... args) {
  if (!config::trace_enabled()) return;
  _write("debug", std::forward<Args>(args)...);
}

template <class... Args>
inline void warn(Args&&... args) {
  _write("warn", std::forward<Args>(args)...);
}

}} // namespace sg::log
