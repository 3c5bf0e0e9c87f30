#pragma once

#include "config.hpp"
#include "dispatch_queue.hpp"

#include <atomic>
#include <condition_variable>
#include <functional>
#include <mutex>
#include <thread>

namespace toolbridge {

// The single context on which affine tool calls run. Either the embedding
// host calls Tick() from its own thread (and installs a wake handler), or
// Start() spins up one dedicated worker that ticks on its own.
class CooperativeExecutor {
 public:
  CooperativeExecutor(DispatchQueue* queue, ExecutorConfig cfg = {});
  ~CooperativeExecutor();
  CooperativeExecutor(const CooperativeExecutor&) = delete;
  CooperativeExecutor& operator=(const CooperativeExecutor&) = delete;

  // Runs one bounded batch of queued work; returns how many items ran.
  size_t Tick();

  // Safe from any thread.
  void RequestWake();

  // Called by RequestWake() in host-driven mode.
  void SetWakeHandler(std::function<void()> handler);

  void Start();
  void Stop();
  bool IsRunning() const { return running_.load(); }

  bool IsExecutorThread() const;

  uint64_t ticks() const { return ticks_.load(); }
  uint64_t action_failures() const { return action_failures_.load(); }
  const ExecutorConfig& config() const { return cfg_; }

 private:
  void RunItem(PriorityWorkItem& item);
  void WorkerLoop();

  DispatchQueue* queue_;
  ExecutorConfig cfg_;

  std::mutex wake_mu_;
  std::condition_variable wake_cv_;
  bool wake_pending_ = false;
  std::function<void()> wake_handler_;

  std::atomic<bool> running_{false};
  std::thread worker_;
  std::atomic<std::thread::id> owner_thread_{};

  std::atomic<uint64_t> ticks_{0};
  std::atomic<uint64_t> action_failures_{0};
};

}  // namespace toolbridge
