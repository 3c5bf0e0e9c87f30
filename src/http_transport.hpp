#pragma once

#include "config.hpp"
#include "protocol.hpp"

#include <httplib.h>
#include <nlohmann/json.hpp>

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>
#include <unordered_map>

namespace toolbridge {

class TransportError : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

// Returns nullopt for notifications.
using RpcRequestHandler = std::function<std::optional<JsonRpcResponse>(const JsonRpcRequest&)>;
// Extra fields merged into GET /health under "runtime".
using HealthExtension = std::function<nlohmann::json()>;

struct RpcHttpReply {
  int status = 200;
  // Empty for 202 (nothing but notifications).
  std::string body;
};

// JSON-RPC over HTTP POST plus a Server-Sent-Events side channel.
class HttpTransport {
 public:
  explicit HttpTransport(HttpListenConfig cfg);
  ~HttpTransport();
  HttpTransport(const HttpTransport&) = delete;
  HttpTransport& operator=(const HttpTransport&) = delete;

  // Must be called before Start().
  void SetRequestHandler(RpcRequestHandler handler);
  void SetHealthExtension(HealthExtension extension);

  // Throws TransportError when the port cannot be bound.
  void Start();
  void Stop();
  bool IsRunning() const { return running_.load(); }

  // Bound port; resolved after Start() when configured as 0.
  int Port() const { return port_.load(); }
  std::string Url() const;

  size_t ActiveSessions() const;
  // Streams beyond this get 503; one worker always stays free for requests.
  size_t MaxSessions() const;
  uint64_t TotalRequests() const { return total_requests_.load(); }
  double UptimeSeconds() const;

  // Queues one event on every open SSE session; returns how many got it.
  size_t Broadcast(const std::string& event, const nlohmann::json& payload);

  // Decodes a POST body, runs the handler and encodes the reply.
  RpcHttpReply HandleRpcBody(const std::string& body);

 private:
  struct SseSession {
    std::string id;
    std::mutex mu;
    std::condition_variable cv;
    std::deque<std::string> outbox;
    bool closed = false;
  };

  void RegisterRoutes();
  std::optional<JsonRpcResponse> Dispatch(const JsonRpcRequest& req);
  nlohmann::json HealthJson() const;
  // Returns nullptr when stopping or at the session limit.
  std::shared_ptr<SseSession> OpenSession();
  void CloseSession(const std::string& id);
  void CloseAllSessions();

  HttpListenConfig cfg_;
  RpcRequestHandler handler_;
  HealthExtension health_extension_;

  std::unique_ptr<httplib::Server> server_;
  std::thread listen_thread_;
  std::atomic<bool> running_{false};
  std::atomic<int> port_{0};
  std::atomic<uint64_t> total_requests_{0};
  std::chrono::steady_clock::time_point started_at_;

  mutable std::mutex sessions_mu_;
  std::unordered_map<std::string, std::shared_ptr<SseSession>> sessions_;
};

}  // namespace toolbridge
