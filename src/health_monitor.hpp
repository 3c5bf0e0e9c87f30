#pragma once

#include "circuit_breaker.hpp"
#include "config.hpp"
#include "dispatch_queue.hpp"
#include "tool_registry.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

enum class HealthStatus {
  kHealthy,
  kDegraded,
  kUnhealthy,
};

const char* HealthStatusName(HealthStatus s);

struct HealthCheckResult {
  std::string component;
  HealthStatus status = HealthStatus::kHealthy;
  std::string message;
  nlohmann::json details = nlohmann::json::object();
  std::chrono::system_clock::time_point checked_at;

  nlohmann::json ToJson() const;
};

struct HealthMetrics {
  uint64_t total_requests = 0;
  uint64_t failed_requests = 0;
  uint64_t cache_hits = 0;
  double total_execution_ms = 0;

  double ErrorRate() const;
  double CacheHitRate() const;
  double AverageExecutionMs() const;
};

struct HealthReport {
  HealthStatus status = HealthStatus::kHealthy;
  double uptime_seconds = 0;
  std::optional<std::chrono::system_clock::time_point> last_request;
  HealthMetrics metrics;
  std::vector<HealthCheckResult> checks;

  nlohmann::json ToJson() const;
};

// Resident set size in MB, or nullopt when it cannot be read.
using MemoryProbe = std::function<std::optional<int64_t>()>;

std::optional<int64_t> ReadResidentMemoryMb();

// Folds sub-check statuses: any Unhealthy wins, then any Degraded.
HealthStatus CombineStatuses(const std::vector<HealthCheckResult>& checks);

class HealthMonitor : public ToolRegistryObserver {
 public:
  // Any collaborator may be null; the matching check then reports that it is
  // not configured. Subscribing to the registry is the owner's job
  // (ToolRegistry::AddObserver).
  HealthMonitor(ToolRegistry* registry,
                CircuitBreaker* breaker,
                DispatchQueue* queue,
                HealthConfig cfg = {},
                MemoryProbe memory_probe = nullptr);
  HealthMonitor(const HealthMonitor&) = delete;
  HealthMonitor& operator=(const HealthMonitor&) = delete;

  void OnToolExecuted(const std::string& tool_name, double execution_ms, bool is_error) override;
  void OnToolError(const std::string& tool_name, const std::string& message) override;
  void OnCacheHit(const std::string& tool_name) override;

  HealthStatus QuickStatus() const;
  HealthReport FullReport() const;
  HealthMetrics Metrics() const;
  void ResetMetrics();

  const HealthConfig& config() const { return cfg_; }

 private:
  HealthCheckResult CheckErrorRate(const HealthMetrics& m) const;
  HealthCheckResult CheckCircuitBreakers() const;
  HealthCheckResult CheckMemory() const;
  HealthCheckResult CheckToolRegistry() const;
  HealthCheckResult CheckResponseCache() const;
  HealthCheckResult CheckDispatchQueue() const;
  void MarkRequest();

  ToolRegistry* registry_;
  CircuitBreaker* breaker_;
  DispatchQueue* queue_;
  HealthConfig cfg_;
  MemoryProbe memory_probe_;

  mutable std::mutex mu_;
  HealthMetrics metrics_;
  std::chrono::steady_clock::time_point started_at_;
  std::optional<std::chrono::system_clock::time_point> last_request_;
};

}  // namespace toolbridge
