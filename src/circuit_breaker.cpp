#include "circuit_breaker.hpp"

#include "string_util.hpp"

#include <iostream>
#include <utility>

namespace toolbridge {

const char* CircuitStateName(CircuitState s) {
  switch (s) {
    case CircuitState::kClosed:
      return "Closed";
    case CircuitState::kOpen:
      return "Open";
    case CircuitState::kHalfOpen:
      return "HalfOpen";
  }
  return "Closed";
}

ToolCircuit::ToolCircuit(std::string tool_name, const CircuitBreakerConfig& cfg)
    : tool_name_(std::move(tool_name)),
      failure_threshold_(cfg.failure_threshold),
      open_duration_(std::chrono::seconds(cfg.open_duration_seconds)),
      success_threshold_(cfg.success_threshold) {}

bool ToolCircuit::AllowRequest(SteadyClock::time_point now) {
  switch (state_) {
    case CircuitState::kClosed:
      return true;
    case CircuitState::kOpen:
      if (opened_at_ && now - *opened_at_ > open_duration_) {
        // Successes reported while Open came from calls admitted earlier.
        state_ = CircuitState::kHalfOpen;
        success_count_ = 0;
        return true;
      }
      return false;
    case CircuitState::kHalfOpen:
      // Probes are not rate limited.
      return true;
  }
  return true;
}

void ToolCircuit::RecordSuccess() {
  success_count_++;
  switch (state_) {
    case CircuitState::kHalfOpen:
      if (success_count_ >= success_threshold_) {
        state_ = CircuitState::kClosed;
        failure_count_ = 0;
        success_count_ = 0;
        opened_at_.reset();
      }
      break;
    case CircuitState::kClosed:
      if (failure_count_ > 0) failure_count_--;
      break;
    case CircuitState::kOpen:
      break;
  }
}

void ToolCircuit::RecordFailure(const std::string& error, SteadyClock::time_point now) {
  failure_count_++;
  last_failure_ = now;
  last_error_ = error;
  success_count_ = 0;
  switch (state_) {
    case CircuitState::kClosed:
      if (failure_count_ >= failure_threshold_) {
        state_ = CircuitState::kOpen;
        opened_at_ = now;
      }
      break;
    case CircuitState::kHalfOpen:
      state_ = CircuitState::kOpen;
      opened_at_ = now;
      break;
    case CircuitState::kOpen:
      break;
  }
}

void ToolCircuit::Reset() {
  state_ = CircuitState::kClosed;
  failure_count_ = 0;
  success_count_ = 0;
  opened_at_.reset();
  last_error_.clear();
}

CircuitBreaker::CircuitBreaker(CircuitBreakerConfig cfg, ClockFn clock) : cfg_(cfg), clock_(std::move(clock)) {}

SteadyClock::time_point CircuitBreaker::Now() const {
  return clock_ ? clock_() : SteadyClock::now();
}

ToolCircuit& CircuitBreaker::GetOrCreateLocked(const std::string& tool_name) {
  auto key = ToLowerAscii(tool_name);
  auto it = circuits_.find(key);
  if (it == circuits_.end()) it = circuits_.emplace(key, ToolCircuit(tool_name, cfg_)).first;
  return it->second;
}

bool CircuitBreaker::AllowRequest(const std::string& tool_name) {
  const auto now = Now();
  std::lock_guard<std::mutex> lock(mu_);
  auto& c = GetOrCreateLocked(tool_name);
  const auto before = c.state();
  const bool allowed = c.AllowRequest(now);
  if (before != c.state()) {
    std::cout << "[breaker] tool=" << c.tool_name() << " state=" << CircuitStateName(before) << "->"
              << CircuitStateName(c.state()) << "\n";
  }
  return allowed;
}

void CircuitBreaker::RecordSuccess(const std::string& tool_name) {
  std::lock_guard<std::mutex> lock(mu_);
  auto& c = GetOrCreateLocked(tool_name);
  const auto before = c.state();
  c.RecordSuccess();
  if (before != c.state()) {
    std::cout << "[breaker] tool=" << c.tool_name() << " state=" << CircuitStateName(before) << "->"
              << CircuitStateName(c.state()) << "\n";
  }
}

void CircuitBreaker::RecordFailure(const std::string& tool_name, const std::string& error) {
  const auto now = Now();
  std::lock_guard<std::mutex> lock(mu_);
  auto& c = GetOrCreateLocked(tool_name);
  const auto before = c.state();
  c.RecordFailure(error, now);
  if (before != c.state()) {
    std::cout << "[breaker] tool=" << c.tool_name() << " state=" << CircuitStateName(before) << "->"
              << CircuitStateName(c.state()) << " failures=" << c.failure_count() << " error=" << error << "\n";
  }
}

CircuitState CircuitBreaker::GetState(const std::string& tool_name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = circuits_.find(ToLowerAscii(tool_name));
  if (it == circuits_.end()) return CircuitState::kClosed;
  return it->second.state();
}

std::optional<CircuitSnapshot> CircuitBreaker::GetRecord(const std::string& tool_name) const {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = circuits_.find(ToLowerAscii(tool_name));
  if (it == circuits_.end()) return std::nullopt;
  const auto& c = it->second;
  CircuitSnapshot s;
  s.tool_name = c.tool_name();
  s.state = c.state();
  s.failure_count = c.failure_count();
  s.success_count = c.success_count();
  s.last_error = c.last_error();
  s.opened_at = c.opened_at();
  return s;
}

bool CircuitBreaker::HasRecord(const std::string& tool_name) const {
  std::lock_guard<std::mutex> lock(mu_);
  return circuits_.find(ToLowerAscii(tool_name)) != circuits_.end();
}

bool CircuitBreaker::Reset(const std::string& tool_name) {
  std::lock_guard<std::mutex> lock(mu_);
  auto it = circuits_.find(ToLowerAscii(tool_name));
  if (it == circuits_.end()) return false;
  it->second.Reset();
  return true;
}

void CircuitBreaker::ResetAll() {
  std::lock_guard<std::mutex> lock(mu_);
  for (auto& [_, c] : circuits_) c.Reset();
}

std::vector<OpenCircuitInfo> CircuitBreaker::GetOpenCircuits() const {
  std::lock_guard<std::mutex> lock(mu_);
  std::vector<OpenCircuitInfo> out;
  for (const auto& [_, c] : circuits_) {
    if (c.state() != CircuitState::kOpen) continue;
    out.push_back({c.tool_name(), c.last_error(), c.opened_at()});
  }
  return out;
}

CircuitCounts CircuitBreaker::CountByState() const {
  std::lock_guard<std::mutex> lock(mu_);
  CircuitCounts counts;
  for (const auto& [_, c] : circuits_) {
    switch (c.state()) {
      case CircuitState::kClosed:
        counts.closed++;
        break;
      case CircuitState::kOpen:
        counts.open++;
        break;
      case CircuitState::kHalfOpen:
        counts.half_open++;
        break;
    }
  }
  return counts;
}

nlohmann::json CircuitBreaker::GetStats() const {
  std::lock_guard<std::mutex> lock(mu_);
  size_t closed = 0;
  size_t open = 0;
  size_t half_open = 0;
  nlohmann::json problematic = nlohmann::json::object();
  for (const auto& [_, c] : circuits_) {
    switch (c.state()) {
      case CircuitState::kClosed:
        closed++;
        break;
      case CircuitState::kOpen:
        open++;
        break;
      case CircuitState::kHalfOpen:
        half_open++;
        break;
    }
    if (c.state() != CircuitState::kClosed || c.failure_count() > 0) {
      problematic[c.tool_name()] = {{"state", CircuitStateName(c.state())},
                                    {"failures", c.failure_count()},
                                    {"successes", c.success_count()},
                                    {"lastError", c.last_error()}};
    }
  }
  nlohmann::json j;
  j["total_circuits"] = circuits_.size();
  j["closed"] = closed;
  j["open"] = open;
  j["half_open"] = half_open;
  j["problematic_tools"] = std::move(problematic);
  return j;
}

void CircuitBreaker::SetConfig(const CircuitBreakerConfig& cfg) {
  std::lock_guard<std::mutex> lock(mu_);
  cfg_ = cfg;
}

CircuitBreakerConfig CircuitBreaker::config() const {
  std::lock_guard<std::mutex> lock(mu_);
  return cfg_;
}

}  // namespace toolbridge
