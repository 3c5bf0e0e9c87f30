#pragma once

#include "circuit_breaker.hpp"
#include "config.hpp"
#include "cooperative_executor.hpp"
#include "dispatch_queue.hpp"
#include "health_monitor.hpp"
#include "resource_registry.hpp"
#include "response_cache.hpp"
#include "tool_registry.hpp"

#include <nlohmann/json.hpp>

namespace toolbridge {

// Owns one instance of every runtime component and wires them together.
// Members are declared in dependency order so destruction runs in reverse.
class RuntimeContext {
 public:
  explicit RuntimeContext(RuntimeConfig cfg = {}, MemoryProbe memory_probe = nullptr);
  ~RuntimeContext();
  RuntimeContext(const RuntimeContext&) = delete;
  RuntimeContext& operator=(const RuntimeContext&) = delete;

  const RuntimeConfig& config() const { return cfg_; }

  DispatchQueue& queue() { return queue_; }
  CircuitBreaker& breaker() { return breaker_; }
  ResponseCache& cache() { return cache_; }
  CooperativeExecutor& executor() { return executor_; }
  ToolRegistry& tools() { return tools_; }
  ResourceRegistry& resources() { return resources_; }
  HealthMonitor& health() { return health_; }

  // {tools, queue, circuits, cache, executor}
  nlohmann::json GetRuntimeStats();

  // Closes every circuit (or just one) and returns how many were reset.
  size_t ResetCircuits(const std::string& tool_name = {});

 private:
  void RegisterBuiltinResources();

  RuntimeConfig cfg_;
  DispatchQueue queue_;
  CircuitBreaker breaker_;
  ResponseCache cache_;
  CooperativeExecutor executor_;
  ToolRegistry tools_;
  ResourceRegistry resources_;
  HealthMonitor health_;
};

}  // namespace toolbridge
