#pragma once

#include "circuit_breaker.hpp"
#include "cooperative_executor.hpp"
#include "dispatch_queue.hpp"
#include "protocol.hpp"
#include "response_cache.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <cstdint>
#include <functional>
#include <future>
#include <memory>
#include <mutex>
#include <optional>
#include <shared_mutex>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolbridge {

using ToolHandler = std::function<ToolCallResult(const nlohmann::json& arguments)>;
using AsyncToolHandler = std::function<std::future<ToolCallResult>(const nlohmann::json& arguments)>;

struct ToolSpec {
  std::string name;
  std::string description;
  // null means DefaultInputSchema()
  nlohmann::json input_schema;
  std::string category = "general";
  // Must run on the cooperative executor.
  bool requires_main_thread = true;
  // Results may be served from the response cache.
  bool cacheable = true;
};

struct ToolRegistrationInfo {
  ToolSpec spec;
  std::chrono::system_clock::time_point registered_at;
  uint64_t call_count = 0;
  double total_execution_ms = 0;
};

class ToolRegistryObserver {
 public:
  virtual ~ToolRegistryObserver() = default;
  virtual void OnToolRegistered(const std::string& /*tool_name*/) {}
  virtual void OnToolExecuted(const std::string& /*tool_name*/, double /*execution_ms*/, bool /*is_error*/) {}
  virtual void OnToolError(const std::string& /*tool_name*/, const std::string& /*message*/) {}
  virtual void OnCacheHit(const std::string& /*tool_name*/) {}
};

struct BatchRequest {
  std::string name;
  nlohmann::json arguments = nlohmann::json::object();
  std::string id;
};

struct BatchResponse {
  std::string id;
  ToolCallResult result;
  double execution_time_ms = 0;

  nlohmann::json ToJson() const;
};

struct ToolRegistryOptions {
  // 0 waits forever for queued work.
  std::chrono::milliseconds affine_timeout{0};
};

class ToolRegistry {
 public:
  // Collaborators are borrowed and must outlive the registry. cache may be null.
  ToolRegistry(DispatchQueue* queue,
               CooperativeExecutor* executor,
               CircuitBreaker* breaker,
               ResponseCache* cache,
               ToolRegistryOptions options = {});
  ToolRegistry(const ToolRegistry&) = delete;
  ToolRegistry& operator=(const ToolRegistry&) = delete;

  void RegisterTool(ToolSpec spec, ToolHandler handler);
  void RegisterTool(const std::string& name,
                    const std::string& description,
                    ToolHandler handler,
                    nlohmann::json input_schema = nullptr,
                    const std::string& category = {});
  void RegisterAsyncTool(ToolSpec spec, AsyncToolHandler handler);
  bool UnregisterTool(const std::string& name);

  bool HasTool(const std::string& name) const;
  std::optional<ToolRegistrationInfo> GetTool(const std::string& name) const;
  size_t ToolCount() const;
  std::vector<std::string> ToolNames() const;
  std::vector<ToolInfo> ListTools() const;
  std::vector<ToolInfo> ListToolsByCategory(const std::string& category) const;
  nlohmann::json GetStats() const;

  // Never throws: every failure comes back as a result with is_error set.
  ToolCallResult Execute(const std::string& name,
                         const nlohmann::json& arguments,
                         Priority priority = Priority::kNormal);

  std::vector<BatchResponse> ExecuteBatch(const std::vector<BatchRequest>& requests, bool parallel = true);

  void AddObserver(ToolRegistryObserver* observer);
  void RemoveObserver(ToolRegistryObserver* observer);

  CircuitBreaker* breaker() const { return breaker_; }
  ResponseCache* cache() const { return cache_; }
  DispatchQueue* queue() const { return queue_; }

 private:
  struct Registration {
    ToolSpec spec;
    ToolHandler handler;
    AsyncToolHandler async_handler;
    std::chrono::system_clock::time_point registered_at;
    uint64_t call_count = 0;
    double total_execution_ms = 0;
  };

  void AddRegistration(std::shared_ptr<Registration> reg);
  std::shared_ptr<Registration> Find(const std::string& name) const;
  ToolCallResult InvokeHandler(const Registration& reg, const nlohmann::json& arguments) const;
  ToolCallResult DispatchToExecutor(const std::shared_ptr<Registration>& reg,
                                    const nlohmann::json& arguments,
                                    Priority priority);
  ToolCallResult RecordFault(const std::string& tool_name, const std::string& message, ToolCallResult result);
  void RecordCall(const std::shared_ptr<Registration>& reg, double elapsed_ms);

  std::vector<ToolRegistryObserver*> SnapshotObservers() const;

  DispatchQueue* queue_;
  CooperativeExecutor* executor_;
  CircuitBreaker* breaker_;
  ResponseCache* cache_;
  ToolRegistryOptions options_;

  mutable std::shared_mutex mu_;
  std::unordered_map<std::string, std::shared_ptr<Registration>> tools_;

  mutable std::mutex observers_mu_;
  std::vector<ToolRegistryObserver*> observers_;
};

}  // namespace toolbridge
