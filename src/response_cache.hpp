#pragma once

#include "circuit_breaker.hpp"
#include "config.hpp"
#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <list>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>

namespace toolbridge {

// Memoizes tool results keyed by (tool name, serialized arguments). Entries
// expire after the configured TTL and the least recently used entry is evicted
// once the capacity is reached.
class ResponseCache {
 public:
  explicit ResponseCache(CacheConfig cfg = {}, ClockFn clock = nullptr);
  ResponseCache(const ResponseCache&) = delete;
  ResponseCache& operator=(const ResponseCache&) = delete;

  std::optional<ToolCallResult> TryGet(const std::string& tool_name, const nlohmann::json& arguments);
  void Put(const std::string& tool_name, const nlohmann::json& arguments, const ToolCallResult& result);

  size_t Invalidate(const std::string& tool_name);
  void Clear();
  size_t Size() const;
  bool enabled() const;

  nlohmann::json GetStats() const;

  static std::string MakeKey(const std::string& tool_name, const nlohmann::json& arguments);

 private:
  struct Entry {
    std::string tool;
    ToolCallResult result;
    SteadyClock::time_point created_at;
    SteadyClock::time_point last_access;
    uint64_t hits = 0;
    std::list<std::string>::iterator lru_pos;
  };

  SteadyClock::time_point Now() const;
  bool IsExpiredLocked(const Entry& e, SteadyClock::time_point now) const;
  void EraseLocked(std::unordered_map<std::string, Entry>::iterator it);

  mutable std::mutex mu_;
  CacheConfig cfg_;
  ClockFn clock_;
  std::unordered_map<std::string, Entry> entries_;
  // Front is most recently used.
  std::list<std::string> lru_;
  uint64_t hits_ = 0;
  uint64_t misses_ = 0;
  uint64_t evictions_ = 0;
  uint64_t expirations_ = 0;
};

}  // namespace toolbridge
