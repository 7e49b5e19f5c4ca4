#pragma once
#include <atomic>
#include <cstdlib>
#include <cstring>

namespace sg { namespace config {

// ---------- env parsing ----------
inline bool _env_bool(const char* name, bool def=false) {
  if (const char* s = std::getenv(name)) {
    if (!std::strcmp(s,"1") || !std::strcmp(s,"true") || !std::strcmp(s,"TRUE")) return true;
    if (!std::strcmp(s,"0") || !std::strcmp(s,"false")|| !std::strcmp(s,"FALSE")) return false;
  }
  return def;
}

// Non-negative decimal integer; anything else falls back to def.
inline int _env_int(const char* name, int def) {
  const char* s = std::getenv(name);
  if (!s || !*s) return def;
  int v = 0;
  for (const char* p = s; *p; ++p) {
    if (*p < '0' || *p > '9') return def;
    v = v * 10 + (*p - '0');
    if (v > 1000) return def;
  }
  return v;
}

// ---------- Backward trace logging ----------
//   Env: SG_TRACE=0|1
inline std::atomic<bool>& trace_flag() {
  static std::atomic<bool> v{ _env_bool("SG_TRACE", false) };
  return v;
}
inline void set_trace(bool on) { trace_flag().store(on, std::memory_order_relaxed); }
inline bool trace_enabled() { return trace_flag().load(std::memory_order_relaxed); }

// ---------- Non-finite gradient warning ----------
//   Env: SG_WARN_NONFINITE=0|1
inline std::atomic<bool>& warn_nonfinite_flag() {
  static std::atomic<bool> v{ _env_bool("SG_WARN_NONFINITE", false) };
  return v;
}
inline void set_warn_nonfinite(bool on) { warn_nonfinite_flag().store(on, std::memory_order_relaxed); }
inline bool warn_nonfinite() { return warn_nonfinite_flag().load(std::memory_order_relaxed); }

// ---------- DOT label precision (significant digits) ----------
//   Env: SG_DOT_PRECISION=<n>, clamped to [1, 17]
inline std::atomic<int>& _dot_precision() {
  static std::atomic<int> v{[]{
    int p = _env_int("SG_DOT_PRECISION", 4);
    if (p < 1) p = 1;
    if (p > 17) p = 17;
    return p;
  }()};
  return v;
}
inline void set_dot_precision(int p) {
  if (p < 1) p = 1;
  if (p > 17) p = 17;
  _dot_precision().store(p, std::memory_order_relaxed);
}
inline int dot_precision() { return _dot_precision().load(std::memory_order_relaxed); }

// Restores the trace flag on scope exit.
struct ScopedTracing {
  explicit ScopedTracing(bool on=true)
    : prev_(trace_enabled()) { set_trace(on); }
  ~ScopedTracing() { set_trace(prev_); }
  ScopedTracing(const ScopedTracing&) = delete;
  ScopedTracing& operator=(const ScopedTracing&) = delete;
private:
  bool prev_;
};

}} // namespace sg::config
