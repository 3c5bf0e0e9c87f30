#include "dispatch_queue.hpp"

#include "string_util.hpp"

#include <utility>

namespace toolbridge {
namespace {

static size_t TierIndex(Priority p) {
  const auto i = static_cast<int>(p);
  if (i < 0) return 0;
  if (i >= static_cast<int>(kPriorityTierCount)) return kPriorityTierCount - 1;
  return static_cast<size_t>(i);
}

}  // namespace

const char* PriorityName(Priority p) {
  switch (p) {
    case Priority::kHigh:
      return "high";
    case Priority::kNormal:
      return "normal";
    case Priority::kLow:
      return "low";
    case Priority::kIdle:
      return "idle";
  }
  return "normal";
}

std::optional<Priority> ParsePriority(const std::string& name) {
  const auto v = ToLowerAscii(name);
  if (v == "high") return Priority::kHigh;
  if (v == "normal") return Priority::kNormal;
  if (v == "low") return Priority::kLow;
  if (v == "idle") return Priority::kIdle;
  return std::nullopt;
}

size_t DispatchQueueStats::TotalPending() const {
  size_t total = 0;
  for (auto n : pending) total += n;
  return total;
}

nlohmann::json DispatchQueueStats::ToJson() const {
  nlohmann::json j;
  j["pending_high"] = pending[0];
  j["pending_normal"] = pending[1];
  j["pending_low"] = pending[2];
  j["pending_idle"] = pending[3];
  j["total_pending"] = TotalPending();
  j["total_enqueued"] = total_enqueued;
  j["total_processed"] = total_processed;
  j["processed_by_priority"] = {
      {"high", processed[0]}, {"normal", processed[1]}, {"low", processed[2]}, {"idle", processed[3]}};
  return j;
}

void DispatchQueue::Enqueue(std::function<void()> action, Priority priority, std::string tool_name) {
  if (!action) return;
  PriorityWorkItem item;
  item.action = std::move(action);
  item.priority = priority;
  item.queued_at = std::chrono::steady_clock::now();
  item.tool_name = std::move(tool_name);

  std::lock_guard<std::mutex> lock(mu_);
  tiers_[TierIndex(priority)].push_back(std::move(item));
  total_enqueued_++;
}

std::optional<PriorityWorkItem> DispatchQueue::PopTierLocked(size_t tier) {
  auto& q = tiers_[tier];
  if (q.empty()) return std::nullopt;
  PriorityWorkItem item = std::move(q.front());
  q.pop_front();
  processed_[tier]++;
  total_processed_++;
  return item;
}

std::optional<PriorityWorkItem> DispatchQueue::Dequeue() {
  return TryDequeueAtOrAbove(Priority::kIdle);
}

std::optional<PriorityWorkItem> DispatchQueue::TryDequeueAtOrAbove(Priority max_priority) {
  std::lock_guard<std::mutex> lock(mu_);
  const size_t last = TierIndex(max_priority);
  for (size_t tier = 0; tier <= last; tier++) {
    if (auto item = PopTierLocked(tier)) return item;
  }
  return std::nullopt;
}

bool DispatchQueue::HasHighPriorityPending() const {
  std::lock_guard<std::mutex> lock(mu_);
  return !tiers_[0].empty();
}

size_t DispatchQueue::Count() const {
  std::lock_guard<std::mutex> lock(mu_);
  size_t total = 0;
  for (const auto& q : tiers_) total += q.size();
  return total;
}

void DispatchQueue::Clear() {
  std::lock_guard<std::mutex> lock(mu_);
  for (auto& q : tiers_) q.clear();
}

DispatchQueueStats DispatchQueue::GetStats() const {
  std::lock_guard<std::mutex> lock(mu_);
  DispatchQueueStats s;
  for (size_t i = 0; i < kPriorityTierCount; i++) {
    s.pending[i] = tiers_[i].size();
    s.processed[i] = processed_[i];
  }
  s.total_enqueued = total_enqueued_;
  s.total_processed = total_processed_;
  return s;
}

}  // namespace toolbridge
