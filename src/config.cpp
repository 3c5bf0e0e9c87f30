#include "config.hpp"

#include "string_util.hpp"

#include <cerrno>
#include <cstdlib>
#include <limits>
#include <string>

namespace toolbridge {
namespace {

static std::string GetEnvStr(const char* name) {
  const char* v = std::getenv(name);
  return v ? std::string(v) : std::string();
}

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static bool TryParseBool(const std::string& s, bool* out) {
  if (!out) return false;
  const std::string v = ToLowerAscii(s);
  if (v == "1" || v == "true" || v == "yes" || v == "y" || v == "on") {
    *out = true;
    return true;
  }
  if (v == "0" || v == "false" || v == "no" || v == "n" || v == "off") {
    *out = false;
    return true;
  }
  return false;
}

static bool TryParseInt(const std::string& s, long long* out) {
  if (!out || s.empty()) return false;
  char* end = nullptr;
  errno = 0;
  const long long v = std::strtoll(s.c_str(), &end, 10);
  if (end == s.c_str() || *end != '\0' || errno == ERANGE) return false;
  *out = v;
  return true;
}

static bool TryParseDouble(const std::string& s, double* out) {
  if (!out || s.empty()) return false;
  char* end = nullptr;
  const double v = std::strtod(s.c_str(), &end);
  if (end == s.c_str() || *end != '\0') return false;
  *out = v;
  return true;
}

// Integers in [0, max_value] only; anything else leaves the default in place.
template <typename T>
static void ReadCount(const char* name, T* field,
                      unsigned long long max_value = static_cast<unsigned long long>(std::numeric_limits<T>::max())) {
  long long v = 0;
  if (!TryParseInt(GetEnvStr(name), &v) || v < 0) return;
  if (static_cast<unsigned long long>(v) > max_value) return;
  *field = static_cast<T>(v);
}

static void ReadRatio(const char* name, double* field) {
  double v = 0;
  if (TryParseDouble(GetEnvStr(name), &v) && v >= 0.0 && v <= 1.0) *field = v;
}

}  // namespace

RuntimeConfig LoadConfigFromEnv() {
  RuntimeConfig cfg;

  if (auto host = GetEnvStr("TOOLBRIDGE_LISTEN_HOST"); !host.empty()) cfg.listen.host = host;
  ReadCount("TOOLBRIDGE_LISTEN_PORT", &cfg.listen.port, 65535);
  ReadCount("TOOLBRIDGE_HTTP_THREADS", &cfg.listen.worker_threads);
  if (cfg.listen.worker_threads < 1) cfg.listen.worker_threads = 1;
  ReadCount("TOOLBRIDGE_SSE_PING_SECONDS", &cfg.listen.sse_ping_seconds);
  if (cfg.listen.sse_ping_seconds < 1) cfg.listen.sse_ping_seconds = 1;
  ReadCount("TOOLBRIDGE_MAX_SSE_SESSIONS", &cfg.listen.max_sse_sessions);

  ReadCount("TOOLBRIDGE_CB_FAILURE_THRESHOLD", &cfg.breaker.failure_threshold);
  ReadCount("TOOLBRIDGE_CB_OPEN_SECONDS", &cfg.breaker.open_duration_seconds);
  ReadCount("TOOLBRIDGE_CB_SUCCESS_THRESHOLD", &cfg.breaker.success_threshold);
  if (cfg.breaker.failure_threshold < 1) cfg.breaker.failure_threshold = 1;
  if (cfg.breaker.success_threshold < 1) cfg.breaker.success_threshold = 1;

  if (auto enabled = GetEnvStr("TOOLBRIDGE_CACHE_ENABLED"); !enabled.empty()) {
    bool b = true;
    if (TryParseBool(enabled, &b)) cfg.cache.enabled = b;
  }
  ReadCount("TOOLBRIDGE_CACHE_TTL_SECONDS", &cfg.cache.ttl_seconds);
  ReadCount("TOOLBRIDGE_CACHE_CAPACITY", &cfg.cache.capacity);

  ReadCount("TOOLBRIDGE_TICK_INTERVAL_MS", &cfg.executor.tick_interval_ms);
  if (cfg.executor.tick_interval_ms < 1) cfg.executor.tick_interval_ms = 1;
  ReadCount("TOOLBRIDGE_MAX_ITEMS_PER_TICK", &cfg.executor.max_items_per_tick);
  ReadCount("TOOLBRIDGE_MAX_HIGH_PER_TICK", &cfg.executor.max_high_priority_per_tick);
  ReadCount("TOOLBRIDGE_AFFINE_TIMEOUT_MS", &cfg.executor.affine_timeout_ms);

  ReadRatio("TOOLBRIDGE_HEALTH_ERROR_RATE", &cfg.health.error_rate_threshold);
  ReadRatio("TOOLBRIDGE_HEALTH_HIGH_ERROR_RATE", &cfg.health.high_error_rate_threshold);
  ReadCount("TOOLBRIDGE_HEALTH_OPEN_CIRCUITS", &cfg.health.open_circuits_threshold);
  ReadCount("TOOLBRIDGE_HEALTH_MEMORY_MB", &cfg.health.memory_threshold_mb);
  ReadCount("TOOLBRIDGE_HEALTH_QUEUE_BACKLOG", &cfg.health.queue_backlog_threshold);

  return cfg;
}

HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port) {
  HttpEndpoint ep;
  ep.port = 0;
  std::string s = url;
  if (StartsWith(s, "http://")) s = s.substr(7);

  auto slash_pos = s.find('/');
  if (slash_pos != std::string::npos) {
    ep.base_path = s.substr(slash_pos);
    s = s.substr(0, slash_pos);
  }

  auto colon_pos = s.rfind(':');
  if (colon_pos != std::string::npos) {
    ep.host = s.substr(0, colon_pos);
    long long port = 0;
    if (TryParseInt(s.substr(colon_pos + 1), &port) && port > 0 && port <= 65535) ep.port = static_cast<int>(port);
  } else if (!s.empty()) {
    ep.host = s;
  }
  if (ep.port == 0) ep.port = default_port;
  if (ep.host.empty()) ep.host = "127.0.0.1";
  return ep;
}

}  // namespace toolbridge
