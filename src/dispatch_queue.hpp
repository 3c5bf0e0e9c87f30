#pragma once

#include <nlohmann/json.hpp>

#include <array>
#include <chrono>
#include <cstdint>
#include <deque>
#include <functional>
#include <mutex>
#include <optional>
#include <string>

namespace toolbridge {

// Lower value is more urgent.
enum class Priority : int {
  kHigh = 0,
  kNormal = 1,
  kLow = 2,
  kIdle = 3,
};

constexpr size_t kPriorityTierCount = 4;

const char* PriorityName(Priority p);
std::optional<Priority> ParsePriority(const std::string& name);

struct PriorityWorkItem {
  std::function<void()> action;
  Priority priority = Priority::kNormal;
  std::chrono::steady_clock::time_point queued_at;
  std::string tool_name;
};

struct DispatchQueueStats {
  std::array<size_t, kPriorityTierCount> pending{};
  std::array<uint64_t, kPriorityTierCount> processed{};
  uint64_t total_enqueued = 0;
  uint64_t total_processed = 0;

  size_t TotalPending() const;
  nlohmann::json ToJson() const;
};

// Four FIFO tiers behind one lock. Work is never cancelled once queued; only
// Clear() discards it.
class DispatchQueue {
 public:
  DispatchQueue() = default;
  DispatchQueue(const DispatchQueue&) = delete;
  DispatchQueue& operator=(const DispatchQueue&) = delete;

  void Enqueue(std::function<void()> action, Priority priority = Priority::kNormal, std::string tool_name = {});

  std::optional<PriorityWorkItem> Dequeue();

  // Only takes an item whose tier is max_priority or more urgent.
  std::optional<PriorityWorkItem> TryDequeueAtOrAbove(Priority max_priority);

  bool HasHighPriorityPending() const;
  size_t Count() const;
  void Clear();

  DispatchQueueStats GetStats() const;

 private:
  std::optional<PriorityWorkItem> PopTierLocked(size_t tier);

  mutable std::mutex mu_;
  std::array<std::deque<PriorityWorkItem>, kPriorityTierCount> tiers_;
  std::array<uint64_t, kPriorityTierCount> processed_{};
  uint64_t total_enqueued_ = 0;
  uint64_t total_processed_ = 0;
};

}  // namespace toolbridge
