#include "cooperative_executor.hpp"

#include <chrono>
#include <exception>
#include <iostream>
#include <utility>

namespace toolbridge {

CooperativeExecutor::CooperativeExecutor(DispatchQueue* queue, ExecutorConfig cfg) : queue_(queue), cfg_(cfg) {}

CooperativeExecutor::~CooperativeExecutor() {
  Stop();
}

void CooperativeExecutor::RunItem(PriorityWorkItem& item) {
  try {
    if (item.action) item.action();
  } catch (const std::exception& e) {
    action_failures_++;
    std::cout << "[executor] action failed priority=" << PriorityName(item.priority) << " tool="
              << (item.tool_name.empty() ? "<none>" : item.tool_name) << " error=" << e.what() << "\n";
  } catch (...) {
    action_failures_++;
    std::cout << "[executor] action failed priority=" << PriorityName(item.priority) << " tool="
              << (item.tool_name.empty() ? "<none>" : item.tool_name) << " error=unknown exception\n";
  }
}

size_t CooperativeExecutor::Tick() {
  if (!queue_) return 0;
  owner_thread_.store(std::this_thread::get_id());
  ticks_++;

  const size_t max_high = cfg_.max_high_priority_per_tick > 0 ? static_cast<size_t>(cfg_.max_high_priority_per_tick) : 0;
  const size_t max_items = cfg_.max_items_per_tick > 0 ? static_cast<size_t>(cfg_.max_items_per_tick) : 0;
  size_t processed = 0;

  // Urgent work first, then anything up to the general cap. Both loops share
  // one counter.
  while (processed < max_high && queue_->HasHighPriorityPending()) {
    auto item = queue_->TryDequeueAtOrAbove(Priority::kHigh);
    if (!item) break;
    RunItem(*item);
    processed++;
  }

  while (processed < max_items) {
    auto item = queue_->Dequeue();
    if (!item) break;
    RunItem(*item);
    processed++;
  }
  return processed;
}

void CooperativeExecutor::SetWakeHandler(std::function<void()> handler) {
  std::lock_guard<std::mutex> lock(wake_mu_);
  wake_handler_ = std::move(handler);
}

void CooperativeExecutor::RequestWake() {
  std::function<void()> handler;
  {
    std::lock_guard<std::mutex> lock(wake_mu_);
    wake_pending_ = true;
    handler = wake_handler_;
  }
  wake_cv_.notify_one();
  if (handler) handler();
}

bool CooperativeExecutor::IsExecutorThread() const {
  return owner_thread_.load() == std::this_thread::get_id();
}

void CooperativeExecutor::Start() {
  bool expected = false;
  if (!running_.compare_exchange_strong(expected, true)) return;
  worker_ = std::thread([this]() { WorkerLoop(); });
  std::cout << "[executor] started tick_interval_ms=" << cfg_.tick_interval_ms
            << " max_items_per_tick=" << cfg_.max_items_per_tick
            << " max_high_per_tick=" << cfg_.max_high_priority_per_tick << "\n";
}

void CooperativeExecutor::Stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) return;
  {
    std::lock_guard<std::mutex> lock(wake_mu_);
    wake_pending_ = true;
  }
  wake_cv_.notify_all();
  if (worker_.joinable()) worker_.join();
  std::cout << "[executor] stopped ticks=" << ticks_.load() << "\n";
}

void CooperativeExecutor::WorkerLoop() {
  owner_thread_.store(std::this_thread::get_id());
  const auto interval = std::chrono::milliseconds(cfg_.tick_interval_ms > 0 ? cfg_.tick_interval_ms : 1);
  while (running_.load()) {
    const size_t ran = Tick();
    // A full tick means more work is likely waiting; go again without sleeping.
    if (ran > 0 && queue_ && queue_->Count() > 0) continue;
    std::unique_lock<std::mutex> lock(wake_mu_);
    wake_cv_.wait_for(lock, interval, [this]() { return wake_pending_ || !running_.load(); });
    wake_pending_ = false;
  }
}

}  // namespace toolbridge
