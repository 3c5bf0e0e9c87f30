#include "http_transport.hpp"

#include <algorithm>
#include <cctype>
#include <ctime>
#include <exception>
#include <iomanip>
#include <iostream>
#include <random>
#include <sstream>
#include <utility>
#include <vector>

namespace toolbridge {
namespace {

constexpr size_t kSessionIdLength = 8;
constexpr auto kSsePollSlice = std::chrono::milliseconds(200);

static std::string NewSessionId() {
  static thread_local std::mt19937_64 rng(std::random_device{}());
  std::ostringstream oss;
  oss << std::hex << std::setw(16) << std::setfill('0') << rng();
  return oss.str().substr(0, kSessionIdLength);
}

static std::string NowIso8601() {
  const auto now = std::chrono::system_clock::now();
  const std::time_t t = std::chrono::system_clock::to_time_t(now);
  const auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(now.time_since_epoch()).count() % 1000;
  std::tm tm{};
  gmtime_r(&t, &tm);
  char buf[32];
  std::strftime(buf, sizeof(buf), "%Y-%m-%dT%H:%M:%S", &tm);
  std::ostringstream oss;
  oss << buf << "." << std::setw(3) << std::setfill('0') << ms << "Z";
  return oss.str();
}

static bool IsBlank(const std::string& s) {
  for (char c : s) {
    if (!std::isspace(static_cast<unsigned char>(c))) return false;
  }
  return true;
}

static std::string Encode(const nlohmann::json& j) {
  return j.dump(-1, ' ', false, nlohmann::json::error_handler_t::replace);
}

static std::string SseFrame(const std::string& event, const nlohmann::json& payload) {
  return "event: " + event + "\ndata: " + Encode(payload) + "\n\n";
}

static RpcHttpReply ErrorReply(int status, const nlohmann::json& id, const JsonRpcError& err) {
  return {status, Encode(JsonRpcResponse::Failure(id, err.code, err.message, err.data).ToJson())};
}

static void SendJson(httplib::Response* res, int status, const nlohmann::json& body) {
  res->status = status;
  res->set_content(Encode(body), "application/json");
}

}  // namespace

HttpTransport::HttpTransport(HttpListenConfig cfg) : cfg_(std::move(cfg)) {
  port_ = cfg_.port;
}

HttpTransport::~HttpTransport() {
  Stop();
}

void HttpTransport::SetRequestHandler(RpcRequestHandler handler) {
  handler_ = std::move(handler);
}

void HttpTransport::SetHealthExtension(HealthExtension extension) {
  health_extension_ = std::move(extension);
}

std::string HttpTransport::Url() const {
  return "http://" + cfg_.host + ":" + std::to_string(Port());
}

size_t HttpTransport::ActiveSessions() const {
  std::lock_guard<std::mutex> lock(sessions_mu_);
  return sessions_.size();
}

double HttpTransport::UptimeSeconds() const {
  if (!running_.load()) return 0;
  return std::chrono::duration<double>(std::chrono::steady_clock::now() - started_at_).count();
}

void HttpTransport::Start() {
  if (running_.load()) return;

  server_ = std::make_unique<httplib::Server>();
  const size_t threads = cfg_.worker_threads > 0 ? static_cast<size_t>(cfg_.worker_threads) : 8;
  server_->new_task_queue = [threads] { return new httplib::ThreadPool(threads); };
  server_->set_keep_alive_timeout(5);
  server_->set_read_timeout(60);
  server_->set_write_timeout(60);
  RegisterRoutes();

  int bound = cfg_.port;
  bool ok = false;
  if (cfg_.port == 0) {
    bound = server_->bind_to_any_port(cfg_.host);
    ok = bound > 0;
  } else {
    ok = server_->bind_to_port(cfg_.host, cfg_.port);
  }
  if (!ok) {
    std::cout << "[http] bind failed host=" << cfg_.host << " port=" << cfg_.port << "\n";
    server_.reset();
    throw TransportError("failed to bind " + cfg_.host + ":" + std::to_string(cfg_.port));
  }

  port_ = bound;
  started_at_ = std::chrono::steady_clock::now();
  running_ = true;
  listen_thread_ = std::thread([this] {
    const bool listened = server_->listen_after_bind();
    std::cout << "[http] listen returned ok=" << (listened ? 1 : 0) << "\n";
  });
  server_->wait_until_ready();
  std::cout << "[http] listen host=" << cfg_.host << " port=" << bound << " threads=" << threads << "\n";
}

void HttpTransport::Stop() {
  bool expected = true;
  if (!running_.compare_exchange_strong(expected, false)) return;
  // Stop accepting first so no stream opens after the sessions are closed.
  if (server_) server_->stop();
  CloseAllSessions();
  if (listen_thread_.joinable()) listen_thread_.join();
  server_.reset();
  std::cout << "[http] stopped\n";
}

void HttpTransport::RegisterRoutes() {
  auto& svr = *server_;

  svr.set_post_routing_handler([](const httplib::Request&, httplib::Response& res) {
    res.set_header("Access-Control-Allow-Origin", "*");
    res.set_header("Access-Control-Allow-Methods", "GET, POST, OPTIONS");
    res.set_header("Access-Control-Allow-Headers", "Content-Type, Accept");
    res.set_header("X-Server", kServerName);
    res.set_header("X-Version", kServerVersion);
  });

  svr.set_exception_handler([](const httplib::Request& req, httplib::Response& res, std::exception_ptr ep) {
    std::string message = "unknown exception";
    if (ep) {
      try {
        std::rethrow_exception(ep);
      } catch (const std::exception& e) {
        message = e.what();
      } catch (...) {
        message = "non-standard exception";
      }
    }
    std::cout << "[http] path=" << req.path << " error=" << message << "\n";
    SendJson(&res, 500, {{"error", message}});
  });

  svr.set_error_handler([](const httplib::Request& req, httplib::Response& res) {
    if (!res.body.empty()) return;
    if (res.status == 404) {
      SendJson(&res, 404, {{"error", "Not found"}, {"path", req.path}});
    } else if (res.status >= 400) {
      SendJson(&res, res.status, {{"error", "Request failed"}, {"status", res.status}});
    }
  });

  svr.Options(R"(.*)", [](const httplib::Request&, httplib::Response& res) { res.status = 204; });

  auto health = [this](const httplib::Request&, httplib::Response& res) { SendJson(&res, 200, HealthJson()); };
  svr.Get("/", health);
  svr.Get("/health", health);

  auto rpc = [this](const httplib::Request& req, httplib::Response& res) {
    auto reply = HandleRpcBody(req.body);
    res.status = reply.status;
    if (!reply.body.empty()) res.set_content(reply.body, "application/json");
  };
  svr.Post(R"(/mcp/?)", rpc);
  svr.Post("/message", rpc);
  svr.Post("/mcp/message", rpc);

  svr.Get(R"(/mcp/?)", [](const httplib::Request&, httplib::Response& res) {
    nlohmann::json j;
    j["name"] = kServerName;
    j["version"] = kServerVersion;
    j["protocol"] = std::string("MCP ") + kMcpProtocolVersion;
    j["transport"] = "HTTP + SSE";
    j["endpoints"] = {{"mcp", "/mcp (POST)"}, {"sse", "/sse (GET)"}, {"health", "/health (GET)"}};
    SendJson(&res, 200, j);
  });

  auto sse = [this](const httplib::Request&, httplib::Response& res) {
    auto session = OpenSession();
    if (!session) {
      SendJson(&res, 503, {{"error", "Too many streaming sessions"}, {"limit", MaxSessions()}});
      return;
    }
    const auto interval = std::chrono::seconds(cfg_.sse_ping_seconds > 0 ? cfg_.sse_ping_seconds : 30);
    res.status = 200;
    res.set_header("Cache-Control", "no-cache");
    res.set_header("X-Accel-Buffering", "no");
    res.set_header("X-Session-Id", session->id);
    res.set_chunked_content_provider(
        "text/event-stream",
        [session, interval, next_ping = std::chrono::steady_clock::now() + interval](size_t,
                                                                                     httplib::DataSink& sink) mutable {
          auto writable = [&] { return !sink.is_writable || sink.is_writable(); };
          auto write_bytes = [&](const std::string& s) -> bool {
            if (!writable() || !sink.write) return false;
            return sink.write(s.data(), s.size());
          };
          // A client that went away is noticed within one slice.
          if (!writable()) return false;

          std::deque<std::string> frames;
          {
            std::unique_lock<std::mutex> lock(session->mu);
            const auto wake = std::min(next_ping, std::chrono::steady_clock::now() + kSsePollSlice);
            session->cv.wait_until(lock, wake, [&] { return session->closed || !session->outbox.empty(); });
            if (session->closed) {
              lock.unlock();
              sink.done();
              return true;
            }
            frames.swap(session->outbox);
          }
          if (std::chrono::steady_clock::now() >= next_ping) {
            frames.push_back(SseFrame("ping", {{"timestamp", NowIso8601()}}));
            next_ping += interval;
          }
          for (const auto& f : frames) {
            if (!write_bytes(f)) return false;
          }
          return true;
        },
        [this, id = session->id](bool) { CloseSession(id); });
  };
  svr.Get("/sse", sse);
  svr.Get("/mcp/sse", sse);
}

nlohmann::json HttpTransport::HealthJson() const {
  nlohmann::json j;
  j["status"] = "healthy";
  j["server"] = kServerName;
  j["version"] = kServerVersion;
  j["uptime_seconds"] = UptimeSeconds();
  j["connections"] = ActiveSessions();
  j["requests"] = TotalRequests();
  if (health_extension_) j["runtime"] = health_extension_();
  return j;
}

RpcHttpReply HttpTransport::HandleRpcBody(const std::string& body) {
  total_requests_++;

  JsonRpcError err;
  if (IsBlank(body)) {
    err.code = JsonRpcError::kInvalidRequest;
    err.message = "Empty request body";
    return ErrorReply(400, nullptr, err);
  }

  auto parsed = ParseRequestBody(body, &err);
  if (!parsed) return ErrorReply(400, nullptr, err);

  if (parsed->is_array()) {
    if (parsed->empty()) {
      err.code = JsonRpcError::kInvalidRequest;
      err.message = "Empty batch";
      return ErrorReply(400, nullptr, err);
    }
    nlohmann::json out = nlohmann::json::array();
    for (const auto& item : *parsed) {
      JsonRpcRequest req;
      nlohmann::json id;
      if (!DecodeRequest(item, &req, &err, &id)) {
        out.push_back(JsonRpcResponse::Failure(id, err.code, err.message, err.data).ToJson());
        continue;
      }
      if (auto resp = Dispatch(req)) out.push_back(resp->ToJson());
    }
    if (out.empty()) return {202, {}};
    return {200, Encode(out)};
  }

  JsonRpcRequest req;
  nlohmann::json id;
  if (!DecodeRequest(*parsed, &req, &err, &id)) return ErrorReply(400, id, err);

  auto resp = Dispatch(req);
  if (!resp) return {202, {}};
  return {200, Encode(resp->ToJson())};
}

std::optional<JsonRpcResponse> HttpTransport::Dispatch(const JsonRpcRequest& req) {
  if (!handler_) {
    if (req.IsNotification()) return std::nullopt;
    return JsonRpcResponse::Failure(req.id, JsonRpcError::kInternalError, "No request handler configured");
  }
  try {
    return handler_(req);
  } catch (const std::exception& e) {
    std::cout << "[http] method=" << req.method << " handler error=" << e.what() << "\n";
    if (req.IsNotification()) return std::nullopt;
    return JsonRpcResponse::Failure(req.id, JsonRpcError::kInternalError, e.what());
  }
}

size_t HttpTransport::MaxSessions() const {
  const int spare_workers = (cfg_.worker_threads > 0 ? cfg_.worker_threads : 8) - 1;
  return static_cast<size_t>(std::max(0, std::min(cfg_.max_sse_sessions, spare_workers)));
}

std::shared_ptr<HttpTransport::SseSession> HttpTransport::OpenSession() {
  auto session = std::make_shared<SseSession>();
  {
    std::lock_guard<std::mutex> lock(sessions_mu_);
    if (!running_.load() || sessions_.size() >= MaxSessions()) {
      std::cout << "[sse] rejected sessions=" << sessions_.size() << " limit=" << MaxSessions() << "\n";
      return nullptr;
    }
    do {
      session->id = NewSessionId();
    } while (sessions_.count(session->id) > 0);
    session->outbox.push_back(SseFrame("connected", {{"sessionId", session->id}, {"server", kServerName}}));
    session->outbox.push_back(SseFrame("ping", {{"timestamp", NowIso8601()}}));
    sessions_[session->id] = session;
  }
  std::cout << "[sse] connected session=" << session->id << "\n";
  return session;
}

void HttpTransport::CloseSession(const std::string& id) {
  std::shared_ptr<SseSession> session;
  {
    std::lock_guard<std::mutex> lock(sessions_mu_);
    auto it = sessions_.find(id);
    if (it == sessions_.end()) return;
    session = it->second;
    sessions_.erase(it);
  }
  {
    std::lock_guard<std::mutex> lock(session->mu);
    session->closed = true;
  }
  session->cv.notify_all();
  std::cout << "[sse] disconnected session=" << id << "\n";
}

void HttpTransport::CloseAllSessions() {
  std::vector<std::string> ids;
  {
    std::lock_guard<std::mutex> lock(sessions_mu_);
    for (const auto& [id, _] : sessions_) ids.push_back(id);
  }
  for (const auto& id : ids) CloseSession(id);
}

size_t HttpTransport::Broadcast(const std::string& event, const nlohmann::json& payload) {
  std::vector<std::shared_ptr<SseSession>> targets;
  {
    std::lock_guard<std::mutex> lock(sessions_mu_);
    for (const auto& [_, s] : sessions_) targets.push_back(s);
  }
  const auto frame = SseFrame(event, payload);
  size_t delivered = 0;
  for (auto& s : targets) {
    {
      std::lock_guard<std::mutex> lock(s->mu);
      if (s->closed) continue;
      s->outbox.push_back(frame);
    }
    s->cv.notify_all();
    delivered++;
  }
  return delivered;
}

}  // namespace toolbridge
