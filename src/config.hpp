#pragma once

#include <cstddef>
#include <cstdint>
#include <string>

namespace toolbridge {

struct HttpListenConfig {
  std::string host = "127.0.0.1";
  int port = 8080;
  int worker_threads = 8;
  int sse_ping_seconds = 30;
  // Each open stream holds a worker; never more than worker_threads - 1.
  int max_sse_sessions = 4;
};

struct CircuitBreakerConfig {
  int failure_threshold = 5;
  int open_duration_seconds = 60;
  int success_threshold = 3;
};

struct CacheConfig {
  bool enabled = true;
  int ttl_seconds = 30;
  size_t capacity = 256;
};

struct ExecutorConfig {
  int tick_interval_ms = 10;
  int max_items_per_tick = 50;
  int max_high_priority_per_tick = 100;
  int affine_timeout_ms = 0;
};

struct HealthConfig {
  double error_rate_threshold = 0.10;
  double high_error_rate_threshold = 0.25;
  int open_circuits_threshold = 3;
  int64_t memory_threshold_mb = 500;
  size_t queue_backlog_threshold = 500;
};

struct RuntimeConfig {
  HttpListenConfig listen;
  CircuitBreakerConfig breaker;
  CacheConfig cache;
  ExecutorConfig executor;
  HealthConfig health;
};

RuntimeConfig LoadConfigFromEnv();

struct HttpEndpoint {
  std::string host = "127.0.0.1";
  int port = 8080;
  std::string base_path;
};

// Accepts "http://host:port/path", "host:port" or a bare host.
HttpEndpoint ParseHttpEndpoint(const std::string& url, int default_port);

}  // namespace toolbridge
