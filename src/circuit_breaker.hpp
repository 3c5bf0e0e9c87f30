#pragma once

#include "config.hpp"

#include <nlohmann/json.hpp>

#include <chrono>
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace toolbridge {

enum class CircuitState {
  kClosed,
  kOpen,
  kHalfOpen,
};

const char* CircuitStateName(CircuitState s);

using SteadyClock = std::chrono::steady_clock;
using ClockFn = std::function<SteadyClock::time_point()>;

// Per-tool state machine. Not synchronized on its own; CircuitBreaker holds
// its lock around every call.
class ToolCircuit {
 public:
  ToolCircuit(std::string tool_name, const CircuitBreakerConfig& cfg);

  bool AllowRequest(SteadyClock::time_point now);
  void RecordSuccess();
  void RecordFailure(const std::string& error, SteadyClock::time_point now);
  void Reset();

  const std::string& tool_name() const { return tool_name_; }
  CircuitState state() const { return state_; }
  int failure_count() const { return failure_count_; }
  int success_count() const { return success_count_; }
  const std::string& last_error() const { return last_error_; }
  std::optional<SteadyClock::time_point> last_failure() const { return last_failure_; }
  std::optional<SteadyClock::time_point> opened_at() const { return opened_at_; }

 private:
  std::string tool_name_;
  CircuitState state_ = CircuitState::kClosed;
  int failure_count_ = 0;
  int success_count_ = 0;
  std::optional<SteadyClock::time_point> last_failure_;
  std::optional<SteadyClock::time_point> opened_at_;
  std::string last_error_;

  int failure_threshold_;
  SteadyClock::duration open_duration_;
  int success_threshold_;
};

struct CircuitSnapshot {
  std::string tool_name;
  CircuitState state = CircuitState::kClosed;
  int failure_count = 0;
  int success_count = 0;
  std::string last_error;
  std::optional<SteadyClock::time_point> opened_at;
};

struct OpenCircuitInfo {
  std::string tool_name;
  std::string last_error;
  std::optional<SteadyClock::time_point> opened_at;
};

struct CircuitCounts {
  size_t closed = 0;
  size_t open = 0;
  size_t half_open = 0;

  size_t Total() const { return closed + open + half_open; }
};

class CircuitBreaker {
 public:
  explicit CircuitBreaker(CircuitBreakerConfig cfg = {}, ClockFn clock = nullptr);
  CircuitBreaker(const CircuitBreaker&) = delete;
  CircuitBreaker& operator=(const CircuitBreaker&) = delete;

  bool AllowRequest(const std::string& tool_name);
  void RecordSuccess(const std::string& tool_name);
  void RecordFailure(const std::string& tool_name, const std::string& error);

  // Closed for names never seen.
  CircuitState GetState(const std::string& tool_name) const;
  std::optional<CircuitSnapshot> GetRecord(const std::string& tool_name) const;
  bool HasRecord(const std::string& tool_name) const;

  bool Reset(const std::string& tool_name);
  void ResetAll();

  std::vector<OpenCircuitInfo> GetOpenCircuits() const;
  CircuitCounts CountByState() const;
  nlohmann::json GetStats() const;

  // Applies to circuits created after the call.
  void SetConfig(const CircuitBreakerConfig& cfg);
  CircuitBreakerConfig config() const;

 private:
  ToolCircuit& GetOrCreateLocked(const std::string& tool_name);
  SteadyClock::time_point Now() const;

  mutable std::mutex mu_;
  CircuitBreakerConfig cfg_;
  ClockFn clock_;
  std::unordered_map<std::string, ToolCircuit> circuits_;
};

}  // namespace toolbridge
