#include "health_monitor.hpp"

#include <cstdio>
#include <cstring>
#include <ctime>
#include <iomanip>
#include <sstream>
#include <utility>

namespace toolbridge {
namespace {

static std::string FormatPercent(double ratio) {
  std::ostringstream oss;
  oss << std::fixed << std::setprecision(1) << ratio * 100.0 << "%";
  return oss.str();
}

static std::string FormatUtc(std::chrono::system_clock::time_point tp) {
  const std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%SZ", &tm);
  return buf;
}

static HealthCheckResult MakeCheck(std::string component, HealthStatus status, std::string message) {
  HealthCheckResult r;
  r.component = std::move(component);
  r.status = status;
  r.message = std::move(message);
  r.checked_at = std::chrono::system_clock::now();
  return r;
}

}  // namespace

const char* HealthStatusName(HealthStatus s) {
  switch (s) {
    case HealthStatus::kHealthy:
      return "Healthy";
    case HealthStatus::kDegraded:
      return "Degraded";
    case HealthStatus::kUnhealthy:
      return "Unhealthy";
  }
  return "Healthy";
}

nlohmann::json HealthCheckResult::ToJson() const {
  return nlohmann::json{{"component", component},
                        {"status", HealthStatusName(status)},
                        {"message", message},
                        {"details", details},
                        {"checkedAt", FormatUtc(checked_at)}};
}

double HealthMetrics::ErrorRate() const {
  return total_requests > 0 ? static_cast<double>(failed_requests) / static_cast<double>(total_requests) : 0.0;
}

double HealthMetrics::CacheHitRate() const {
  return total_requests > 0 ? static_cast<double>(cache_hits) / static_cast<double>(total_requests) : 0.0;
}

double HealthMetrics::AverageExecutionMs() const {
  const auto executed = total_requests - cache_hits;
  return executed > 0 ? total_execution_ms / static_cast<double>(executed) : 0.0;
}

nlohmann::json HealthReport::ToJson() const {
  nlohmann::json j;
  j["status"] = HealthStatusName(status);
  j["uptime_seconds"] = uptime_seconds;
  j["last_request"] = last_request ? nlohmann::json(FormatUtc(*last_request)) : nlohmann::json(nullptr);
  j["metrics"] = {{"total_requests", metrics.total_requests},
                  {"failed_requests", metrics.failed_requests},
                  {"cache_hits", metrics.cache_hits},
                  {"error_rate", metrics.ErrorRate()},
                  {"cache_hit_rate", metrics.CacheHitRate()},
                  {"avg_execution_time_ms", metrics.AverageExecutionMs()}};
  j["checks"] = nlohmann::json::array();
  for (const auto& c : checks) j["checks"].push_back(c.ToJson());
  return j;
}

std::optional<int64_t> ReadResidentMemoryMb() {
  std::FILE* f = std::fopen("/proc/self/status", "r");
  if (f == nullptr) return std::nullopt;
  char line[256];
  std::optional<int64_t> out;
  while (std::fgets(line, sizeof(line), f) != nullptr) {
    if (std::strncmp(line, "VmRSS:", 6) != 0) continue;
    long long kb = 0;
    if (std::sscanf(line + 6, "%lld", &kb) == 1) out = static_cast<int64_t>(kb / 1024);
    break;
  }
  std::fclose(f);
  return out;
}

HealthStatus CombineStatuses(const std::vector<HealthCheckResult>& checks) {
  auto overall = HealthStatus::kHealthy;
  for (const auto& c : checks) {
    if (c.status == HealthStatus::kUnhealthy) return HealthStatus::kUnhealthy;
    if (c.status == HealthStatus::kDegraded) overall = HealthStatus::kDegraded;
  }
  return overall;
}

HealthMonitor::HealthMonitor(ToolRegistry* registry,
                             CircuitBreaker* breaker,
                             DispatchQueue* queue,
                             HealthConfig cfg,
                             MemoryProbe memory_probe)
    : registry_(registry),
      breaker_(breaker),
      queue_(queue),
      cfg_(cfg),
      memory_probe_(memory_probe ? std::move(memory_probe) : MemoryProbe(ReadResidentMemoryMb)),
      started_at_(std::chrono::steady_clock::now()) {}

void HealthMonitor::MarkRequest() {
  metrics_.total_requests++;
  last_request_ = std::chrono::system_clock::now();
}

void HealthMonitor::OnToolExecuted(const std::string& /*tool_name*/, double execution_ms, bool is_error) {
  std::lock_guard<std::mutex> lock(mu_);
  MarkRequest();
  metrics_.total_execution_ms += execution_ms;
  if (is_error) metrics_.failed_requests++;
}

void HealthMonitor::OnToolError(const std::string& /*tool_name*/, const std::string& /*message*/) {
  std::lock_guard<std::mutex> lock(mu_);
  MarkRequest();
  metrics_.failed_requests++;
}

void HealthMonitor::OnCacheHit(const std::string& /*tool_name*/) {
  std::lock_guard<std::mutex> lock(mu_);
  MarkRequest();
  metrics_.cache_hits++;
}

HealthMetrics HealthMonitor::Metrics() const {
  std::lock_guard<std::mutex> lock(mu_);
  return metrics_;
}

void HealthMonitor::ResetMetrics() {
  std::lock_guard<std::mutex> lock(mu_);
  metrics_ = HealthMetrics{};
  last_request_.reset();
  started_at_ = std::chrono::steady_clock::now();
}

HealthStatus HealthMonitor::QuickStatus() const {
  const double error_rate = Metrics().ErrorRate();
  if (error_rate >= cfg_.high_error_rate_threshold) return HealthStatus::kUnhealthy;
  if (error_rate >= cfg_.error_rate_threshold) return HealthStatus::kDegraded;
  if (breaker_ && cfg_.open_circuits_threshold > 0 &&
      breaker_->CountByState().open >= static_cast<size_t>(cfg_.open_circuits_threshold)) {
    return HealthStatus::kDegraded;
  }
  return HealthStatus::kHealthy;
}

HealthReport HealthMonitor::FullReport() const {
  HealthReport report;
  {
    std::lock_guard<std::mutex> lock(mu_);
    report.metrics = metrics_;
    report.last_request = last_request_;
    report.uptime_seconds =
        std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
  }
  report.checks.push_back(CheckErrorRate(report.metrics));
  report.checks.push_back(CheckCircuitBreakers());
  report.checks.push_back(CheckMemory());
  report.checks.push_back(CheckToolRegistry());
  report.checks.push_back(CheckResponseCache());
  report.checks.push_back(CheckDispatchQueue());
  report.status = CombineStatuses(report.checks);
  return report;
}

HealthCheckResult HealthMonitor::CheckErrorRate(const HealthMetrics& m) const {
  const double rate = m.ErrorRate();
  HealthCheckResult r;
  if (rate >= cfg_.high_error_rate_threshold) {
    r = MakeCheck("ErrorRate", HealthStatus::kUnhealthy, "High error rate: " + FormatPercent(rate));
  } else if (rate >= cfg_.error_rate_threshold) {
    r = MakeCheck("ErrorRate", HealthStatus::kDegraded, "Elevated error rate: " + FormatPercent(rate));
  } else {
    r = MakeCheck("ErrorRate", HealthStatus::kHealthy, "Error rate normal: " + FormatPercent(rate));
  }
  r.details = {{"total_requests", m.total_requests}, {"failed_requests", m.failed_requests}, {"error_rate", rate}};
  return r;
}

HealthCheckResult HealthMonitor::CheckCircuitBreakers() const {
  if (!breaker_) return MakeCheck("CircuitBreakers", HealthStatus::kHealthy, "Circuit breaker not configured");

  const auto open = breaker_->GetOpenCircuits();
  HealthCheckResult r;
  if (cfg_.open_circuits_threshold > 0 && open.size() >= static_cast<size_t>(cfg_.open_circuits_threshold)) {
    r = MakeCheck("CircuitBreakers", HealthStatus::kDegraded, std::to_string(open.size()) + " circuits open");
  } else if (!open.empty()) {
    r = MakeCheck("CircuitBreakers", HealthStatus::kHealthy,
                  std::to_string(open.size()) + " circuits open (below threshold)");
  } else {
    r = MakeCheck("CircuitBreakers", HealthStatus::kHealthy, "All circuits closed");
  }
  r.details = breaker_->GetStats();
  nlohmann::json open_list = nlohmann::json::array();
  for (const auto& c : open) open_list.push_back({{"tool", c.tool_name}, {"lastError", c.last_error}});
  r.details["open_circuits"] = std::move(open_list);
  return r;
}

HealthCheckResult HealthMonitor::CheckMemory() const {
  const auto used = memory_probe_ ? memory_probe_() : std::nullopt;
  if (!used) return MakeCheck("Memory", HealthStatus::kHealthy, "Memory usage unavailable");

  const auto threshold = cfg_.memory_threshold_mb;
  HealthCheckResult r;
  if (threshold > 0 && static_cast<double>(*used) >= static_cast<double>(threshold) * 1.5) {
    r = MakeCheck("Memory", HealthStatus::kUnhealthy, "Memory critical: " + std::to_string(*used) + "MB");
  } else if (threshold > 0 && *used >= threshold) {
    r = MakeCheck("Memory", HealthStatus::kDegraded, "Memory high: " + std::to_string(*used) + "MB");
  } else {
    r = MakeCheck("Memory", HealthStatus::kHealthy, "Memory normal: " + std::to_string(*used) + "MB");
  }
  r.details = {{"used_mb", *used}, {"threshold_mb", threshold}};
  return r;
}

HealthCheckResult HealthMonitor::CheckToolRegistry() const {
  if (!registry_) return MakeCheck("ToolRegistry", HealthStatus::kUnhealthy, "Tool registry not available");
  const auto count = registry_->ToolCount();
  auto r = MakeCheck("ToolRegistry", count > 0 ? HealthStatus::kHealthy : HealthStatus::kDegraded,
                     std::to_string(count) + " tools registered");
  r.details = {{"tool_count", count}};
  return r;
}

HealthCheckResult HealthMonitor::CheckResponseCache() const {
  auto* cache = registry_ ? registry_->cache() : nullptr;
  if (!cache) return MakeCheck("ResponseCache", HealthStatus::kHealthy, "Response cache not configured");
  auto stats = cache->GetStats();
  auto r = MakeCheck("ResponseCache", HealthStatus::kHealthy,
                     std::to_string(stats.value("total_entries", 0)) + " cached entries");
  r.details = std::move(stats);
  return r;
}

HealthCheckResult HealthMonitor::CheckDispatchQueue() const {
  if (!queue_) return MakeCheck("DispatchQueue", HealthStatus::kHealthy, "Dispatch queue not configured");
  const auto stats = queue_->GetStats();
  const auto pending = stats.TotalPending();
  HealthCheckResult r;
  if (cfg_.queue_backlog_threshold > 0 && pending > cfg_.queue_backlog_threshold) {
    r = MakeCheck("DispatchQueue", HealthStatus::kDegraded, std::to_string(pending) + " items pending (backlog)");
  } else {
    r = MakeCheck("DispatchQueue", HealthStatus::kHealthy, std::to_string(pending) + " items pending");
  }
  r.details = stats.ToJson();
  return r;
}

}  // namespace toolbridge
