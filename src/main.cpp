#include "builtin_tools.hpp"
#include "config.hpp"
#include "http_transport.hpp"
#include "rpc_client.hpp"
#include "rpc_router.hpp"
#include "runtime_context.hpp"

#include <chrono>
#include <condition_variable>
#include <csignal>
#include <cstring>
#include <exception>
#include <iostream>
#include <mutex>
#include <string>

namespace {

volatile std::sig_atomic_t g_shutdown_requested = 0;

void HandleShutdownSignal(int /*signal*/) {
  g_shutdown_requested = 1;
}

constexpr const char* kInstructions =
    "toolbridge exposes host operations as tools. Call tools/list to discover them and tools/call to run one.";

static void PrintUsage(const char* argv0) {
  std::cout << "usage: " << argv0 << " [--probe URL]\n"
            << "  (no args)    serve until SIGINT/SIGTERM; configured through TOOLBRIDGE_* variables\n"
            << "  --probe URL  initialize + tools/list against a running server, e.g. http://127.0.0.1:8080/mcp\n";
}

static int RunProbe(const std::string& url) {
  auto ep = toolbridge::ParseHttpEndpoint(url, 8080);
  toolbridge::RpcClient client(ep);
  client.SetTimeouts(5, 30, 30);

  std::string err;
  if (!client.Initialize(&err)) {
    std::cout << "[probe] initialize failed host=" << ep.host << " port=" << ep.port << " error=" << err << "\n";
    return 1;
  }
  auto tools = client.ListTools(&err);
  if (!err.empty()) {
    std::cout << "[probe] tools/list failed error=" << err << "\n";
    return 1;
  }
  std::cout << "[probe] host=" << ep.host << " port=" << ep.port << " tools=" << tools.size() << "\n";
  for (const auto& t : tools) std::cout << t.name << "\n";
  return 0;
}

static void LogConfig(const toolbridge::RuntimeConfig& cfg) {
  std::cout << "[config] listen=" << cfg.listen.host << ":" << cfg.listen.port
            << " http_threads=" << cfg.listen.worker_threads << " sse_ping_seconds=" << cfg.listen.sse_ping_seconds
            << "\n";
  std::cout << "[config] breaker failure_threshold=" << cfg.breaker.failure_threshold
            << " open_seconds=" << cfg.breaker.open_duration_seconds
            << " success_threshold=" << cfg.breaker.success_threshold << "\n";
  std::cout << "[config] cache enabled=" << (cfg.cache.enabled ? 1 : 0) << " ttl_seconds=" << cfg.cache.ttl_seconds
            << " capacity=" << cfg.cache.capacity << "\n";
  std::cout << "[config] executor tick_interval_ms=" << cfg.executor.tick_interval_ms
            << " max_items_per_tick=" << cfg.executor.max_items_per_tick
            << " max_high_per_tick=" << cfg.executor.max_high_priority_per_tick
            << " affine_timeout_ms=" << cfg.executor.affine_timeout_ms << "\n";
}

}  // namespace

int main(int argc, char** argv) {
  std::cout.setf(std::ios::unitbuf);

  for (int i = 1; i < argc; i++) {
    if (std::strcmp(argv[i], "--probe") == 0) {
      if (i + 1 >= argc) {
        PrintUsage(argv[0]);
        return 2;
      }
      return RunProbe(argv[i + 1]);
    }
    if (std::strcmp(argv[i], "--help") == 0 || std::strcmp(argv[i], "-h") == 0) {
      PrintUsage(argv[0]);
      return 0;
    }
    std::cout << "unknown argument: " << argv[i] << "\n";
    PrintUsage(argv[0]);
    return 2;
  }

  std::signal(SIGINT, HandleShutdownSignal);
  std::signal(SIGTERM, HandleShutdownSignal);

  auto cfg = toolbridge::LoadConfigFromEnv();
  LogConfig(cfg);

  toolbridge::RuntimeContext ctx(cfg);
  toolbridge::RegisterBuiltinTools(ctx);
  toolbridge::RpcRouter router(&ctx, kInstructions);

  toolbridge::HttpTransport transport(cfg.listen);
  transport.SetRequestHandler([&router](const toolbridge::JsonRpcRequest& req) { return router.Handle(req); });
  transport.SetHealthExtension([&ctx] {
    nlohmann::json j;
    j["status"] = toolbridge::HealthStatusName(ctx.health().QuickStatus());
    j["tools"] = ctx.tools().ToolCount();
    j["pending"] = ctx.queue().Count();
    return j;
  });

  try {
    transport.Start();
  } catch (const toolbridge::TransportError& e) {
    std::cout << "[main] transport failed to start error=" << e.what() << "\n";
    return 1;
  }
  std::cout << "[main] serving url=" << transport.Url() << "/mcp tools=" << ctx.tools().ToolCount() << "\n";

  // The main thread is the cooperative context: affine tool calls queued by
  // HTTP workers run here, between waits.
  std::mutex wake_mu;
  std::condition_variable wake_cv;
  bool wake_pending = false;
  ctx.executor().SetWakeHandler([&] {
    {
      std::lock_guard<std::mutex> lock(wake_mu);
      wake_pending = true;
    }
    wake_cv.notify_one();
  });

  const auto interval = std::chrono::milliseconds(cfg.executor.tick_interval_ms);
  while (g_shutdown_requested == 0) {
    const size_t ran = ctx.executor().Tick();
    if (ran > 0 && ctx.queue().Count() > 0) continue;
    std::unique_lock<std::mutex> lock(wake_mu);
    wake_cv.wait_for(lock, interval, [&] { return wake_pending; });
    wake_pending = false;
  }

  std::cout << "[main] shutdown signal received\n";
  // HTTP workers may still be blocked on queued work; hand the queue to a
  // worker thread while the listener drains.
  ctx.executor().SetWakeHandler(nullptr);
  ctx.executor().Start();
  transport.Stop();
  ctx.executor().Stop();
  return 0;
}
