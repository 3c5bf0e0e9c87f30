#include "response_cache.hpp"

#include "string_util.hpp"

#include <utility>

namespace toolbridge {

ResponseCache::ResponseCache(CacheConfig cfg, ClockFn clock) : cfg_(cfg), clock_(std::move(clock)) {}

SteadyClock::time_point ResponseCache::Now() const {
  return clock_ ? clock_() : SteadyClock::now();
}

std::string ResponseCache::MakeKey(const std::string& tool_name, const nlohmann::json& arguments) {
  // The unit separator cannot appear in a tool name, so keys never collide
  // across tools.
  return ToLowerAscii(tool_name) + '\x1f' + (arguments.is_null() ? std::string("{}") : arguments.dump());
}

bool ResponseCache::IsExpiredLocked(const Entry& e, SteadyClock::time_point now) const {
  if (cfg_.ttl_seconds <= 0) return false;
  return now - e.created_at >= std::chrono::seconds(cfg_.ttl_seconds);
}

void ResponseCache::EraseLocked(std::unordered_map<std::string, Entry>::iterator it) {
  lru_.erase(it->second.lru_pos);
  entries_.erase(it);
}

std::optional<ToolCallResult> ResponseCache::TryGet(const std::string& tool_name, const nlohmann::json& arguments) {
  if (!cfg_.enabled) return std::nullopt;
  const auto key = MakeKey(tool_name, arguments);
  const auto now = Now();
  std::lock_guard<std::mutex> lock(mu_);
  auto it = entries_.find(key);
  if (it == entries_.end()) {
    misses_++;
    return std::nullopt;
  }
  if (IsExpiredLocked(it->second, now)) {
    EraseLocked(it);
    expirations_++;
    misses_++;
    return std::nullopt;
  }
  auto& e = it->second;
  e.hits++;
  e.last_access = now;
  lru_.splice(lru_.begin(), lru_, e.lru_pos);
  hits_++;
  return e.result;
}

void ResponseCache::Put(const std::string& tool_name, const nlohmann::json& arguments, const ToolCallResult& result) {
  if (!cfg_.enabled || cfg_.capacity == 0) return;
  const auto key = MakeKey(tool_name, arguments);
  const auto now = Now();
  std::lock_guard<std::mutex> lock(mu_);

  auto it = entries_.find(key);
  if (it != entries_.end()) {
    it->second.result = result;
    it->second.created_at = now;
    it->second.last_access = now;
    lru_.splice(lru_.begin(), lru_, it->second.lru_pos);
    return;
  }

  while (entries_.size() >= cfg_.capacity && !lru_.empty()) {
    auto victim = entries_.find(lru_.back());
    if (victim == entries_.end()) {
      lru_.pop_back();
      continue;
    }
    EraseLocked(victim);
    evictions_++;
  }

  lru_.push_front(key);
  Entry e;
  e.tool = ToLowerAscii(tool_name);
  e.result = result;
  e.created_at = now;
  e.last_access = now;
  e.lru_pos = lru_.begin();
  entries_.emplace(key, std::move(e));
}

size_t ResponseCache::Invalidate(const std::string& tool_name) {
  const auto tool = ToLowerAscii(tool_name);
  std::lock_guard<std::mutex> lock(mu_);
  size_t removed = 0;
  for (auto it = entries_.begin(); it != entries_.end();) {
    if (it->second.tool == tool) {
      lru_.erase(it->second.lru_pos);
      it = entries_.erase(it);
      removed++;
    } else {
      ++it;
    }
  }
  return removed;
}

void ResponseCache::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  entries_.clear();
  lru_.clear();
}

size_t ResponseCache::Size() const {
  std::lock_guard<std::mutex> lock(mu_);
  return entries_.size();
}

bool ResponseCache::enabled() const {
  return cfg_.enabled;
}

nlohmann::json ResponseCache::GetStats() const {
  std::lock_guard<std::mutex> lock(mu_);
  nlohmann::json j;
  j["enabled"] = cfg_.enabled;
  j["total_entries"] = entries_.size();
  j["capacity"] = cfg_.capacity;
  j["ttl_seconds"] = cfg_.ttl_seconds;
  j["hits"] = hits_;
  j["misses"] = misses_;
  j["evictions"] = evictions_;
  j["expirations"] = expirations_;
  const auto lookups = hits_ + misses_;
  j["hit_rate"] = lookups > 0 ? static_cast<double>(hits_) / static_cast<double>(lookups) : 0.0;
  return j;
}

}  // namespace toolbridge
