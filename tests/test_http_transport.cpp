#include <gtest/gtest.h>

#include "builtin_tools.hpp"
#include "http_transport.hpp"
#include "rpc_client.hpp"
#include "rpc_router.hpp"

#include <arpa/inet.h>
#include <netinet/in.h>
#include <sys/socket.h>
#include <unistd.h>

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <stdexcept>
#include <string>
#include <thread>

using namespace toolbridge;

namespace {

HttpListenConfig LoopbackAnyPort() {
  HttpListenConfig cfg;
  cfg.host = "127.0.0.1";
  cfg.port = 0;
  cfg.worker_threads = 4;
  cfg.sse_ping_seconds = 1;
  return cfg;
}

template <typename Pred>
bool WaitFor(Pred pred, std::chrono::milliseconds timeout = std::chrono::milliseconds(3000)) {
  const auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return pred();
}

}  // namespace

class HttpTransportTest : public ::testing::Test {
 protected:
  HttpTransportTest()
      : ctx(RuntimeConfig{}, [] { return std::optional<int64_t>(16); }),
        router(&ctx),
        transport(LoopbackAnyPort()) {
    RegisterBuiltinTools(ctx);
    ctx.executor().Start();
    transport.SetRequestHandler([this](const JsonRpcRequest& req) { return router.Handle(req); });
    transport.SetHealthExtension([this] { return nlohmann::json{{"tools", ctx.tools().ToolCount()}}; });
    transport.Start();
  }

  ~HttpTransportTest() override {
    transport.Stop();
    ctx.executor().Stop();
  }

  std::unique_ptr<httplib::Client> Client() {
    auto cli = std::make_unique<httplib::Client>("127.0.0.1", transport.Port());
    cli->set_read_timeout(10);
    return cli;
  }

  httplib::Result PostRpc(const std::string& body, const std::string& path = "/mcp") {
    return Client()->Post(path, body, "application/json");
  }

  RuntimeContext ctx;
  RpcRouter router;
  HttpTransport transport;
};

TEST_F(HttpTransportTest, BindsEphemeralPort) {
  EXPECT_TRUE(transport.IsRunning());
  EXPECT_GT(transport.Port(), 0);
  EXPECT_EQ(transport.Url(), "http://127.0.0.1:" + std::to_string(transport.Port()));
}

TEST_F(HttpTransportTest, HealthEndpointAndHeaders) {
  auto cli = Client();
  auto res = cli->Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(res->get_header_value("X-Server"), "toolbridge");
  EXPECT_EQ(res->get_header_value("Access-Control-Allow-Origin"), "*");

  auto j = nlohmann::json::parse(res->body);
  EXPECT_EQ(j["status"], "healthy");
  EXPECT_EQ(j["server"], "toolbridge");
  EXPECT_EQ(j["connections"], 0);
  EXPECT_EQ(j["runtime"]["tools"], 7);

  auto root = cli->Get("/");
  ASSERT_TRUE(root);
  EXPECT_EQ(root->status, 200);
}

TEST_F(HttpTransportTest, ToolCallOverPost) {
  auto res = PostRpc(
      R"({"jsonrpc":"2.0","id":1,"method":"tools/call","params":{"name":"add","arguments":{"a":2,"b":3}}})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(res->get_header_value("Content-Type"), "application/json");
  const auto expected = nlohmann::json::parse(
      R"({"jsonrpc":"2.0","id":1,"result":{"content":[{"type":"text","text":"5"}],"isError":false}})");
  EXPECT_EQ(nlohmann::json::parse(res->body), expected);
  EXPECT_EQ(transport.TotalRequests(), 1u);
}

TEST_F(HttpTransportTest, AlternatePostPaths) {
  for (const char* path : {"/mcp/", "/message", "/mcp/message"}) {
    auto res = PostRpc(R"({"jsonrpc":"2.0","id":"p","method":"ping"})", path);
    ASSERT_TRUE(res) << path;
    EXPECT_EQ(res->status, 200) << path;
    EXPECT_EQ(nlohmann::json::parse(res->body)["id"], "p");
  }
}

TEST_F(HttpTransportTest, MalformedBodies) {
  auto empty = PostRpc("");
  ASSERT_TRUE(empty);
  EXPECT_EQ(empty->status, 400);
  EXPECT_EQ(nlohmann::json::parse(empty->body)["error"]["code"], JsonRpcError::kInvalidRequest);

  auto garbage = PostRpc("{oops");
  ASSERT_TRUE(garbage);
  EXPECT_EQ(garbage->status, 400);
  auto gj = nlohmann::json::parse(garbage->body);
  EXPECT_EQ(gj["error"]["code"], JsonRpcError::kParseError);
  EXPECT_TRUE(gj["id"].is_null());

  auto no_method = PostRpc(R"({"jsonrpc":"2.0","id":5})");
  ASSERT_TRUE(no_method);
  EXPECT_EQ(no_method->status, 400);
  auto nj = nlohmann::json::parse(no_method->body);
  EXPECT_EQ(nj["error"]["code"], JsonRpcError::kInvalidRequest);
  EXPECT_EQ(nj["id"], 5);

  auto empty_batch = PostRpc("[]");
  ASSERT_TRUE(empty_batch);
  EXPECT_EQ(empty_batch->status, 400);
}

TEST_F(HttpTransportTest, NotificationGets202) {
  auto res = PostRpc(R"({"jsonrpc":"2.0","method":"notifications/initialized"})");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 202);
  EXPECT_TRUE(res->body.empty());
}

TEST_F(HttpTransportTest, BatchBodyAnswersEachRequest) {
  auto res = PostRpc(R"([
    {"jsonrpc":"2.0","id":1,"method":"ping"},
    {"jsonrpc":"2.0","method":"notifications/initialized"},
    {"jsonrpc":"2.0","id":2,"method":"nope"},
    {"id":3}
  ])");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  auto j = nlohmann::json::parse(res->body);
  ASSERT_TRUE(j.is_array());
  ASSERT_EQ(j.size(), 3u);
  EXPECT_EQ(j[0]["id"], 1);
  EXPECT_TRUE(j[0].contains("result"));
  EXPECT_EQ(j[1]["error"]["code"], JsonRpcError::kMethodNotFound);
  EXPECT_EQ(j[2]["id"], 3);
  EXPECT_EQ(j[2]["error"]["code"], JsonRpcError::kInvalidRequest);

  auto quiet = PostRpc(R"([{"jsonrpc":"2.0","method":"notifications/initialized"}])");
  ASSERT_TRUE(quiet);
  EXPECT_EQ(quiet->status, 202);
}

TEST_F(HttpTransportTest, UnknownPathIs404WithPath) {
  auto cli = Client();
  auto res = cli->Get("/nowhere");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 404);
  auto j = nlohmann::json::parse(res->body);
  EXPECT_EQ(j["error"], "Not found");
  EXPECT_EQ(j["path"], "/nowhere");
}

TEST_F(HttpTransportTest, PreflightAndInfo) {
  auto cli = Client();
  auto pre = cli->Options("/mcp");
  ASSERT_TRUE(pre);
  EXPECT_EQ(pre->status, 204);
  EXPECT_EQ(pre->get_header_value("Access-Control-Allow-Methods"), "GET, POST, OPTIONS");

  auto info = cli->Get("/mcp");
  ASSERT_TRUE(info);
  EXPECT_EQ(info->status, 200);
  auto j = nlohmann::json::parse(info->body);
  EXPECT_EQ(j["transport"], "HTTP + SSE");
  EXPECT_EQ(j["protocol"], "MCP 2024-11-05");
  EXPECT_EQ(j["endpoints"]["sse"], "/sse (GET)");
}

TEST_F(HttpTransportTest, ClientRoundTrip) {
  RpcClient client(ParseHttpEndpoint(transport.Url() + "/mcp", 8080));
  std::string err;
  ASSERT_TRUE(client.Initialize(&err)) << err;
  EXPECT_TRUE(client.Ping(&err)) << err;

  auto tools = client.ListTools(&err);
  EXPECT_TRUE(err.empty()) << err;
  EXPECT_EQ(tools.size(), 7u);

  auto echoed = client.CallTool("echo", {{"text", "over the wire"}}, &err, "high");
  ASSERT_TRUE(echoed.has_value()) << err;
  EXPECT_EQ(echoed->FirstText(), "over the wire");

  int code = 0;
  EXPECT_FALSE(client.Call("no/such", nlohmann::json::object(), &err, &code).has_value());
  EXPECT_EQ(code, JsonRpcError::kMethodNotFound);
  EXPECT_EQ(err, "Method not found: no/such");
}

TEST_F(HttpTransportTest, SseStreamsConnectedAndBroadcastEvents) {
  std::mutex mu;
  std::string received;
  std::atomic<bool> done{false};

  std::thread reader([&] {
    httplib::Client cli("127.0.0.1", transport.Port());
    cli.set_read_timeout(10);
    cli.Get("/sse", [&](const char* data, size_t len) {
      std::lock_guard<std::mutex> lock(mu);
      received.append(data, len);
      return received.find("event: tools_changed") == std::string::npos;
    });
    done = true;
  });

  ASSERT_TRUE(WaitFor([&] {
    std::lock_guard<std::mutex> lock(mu);
    return received.find("event: connected") != std::string::npos;
  }));
  EXPECT_EQ(transport.ActiveSessions(), 1u);
  EXPECT_EQ(transport.Broadcast("tools_changed", {{"count", 7}}), 1u);

  EXPECT_TRUE(WaitFor([&] { return done.load(); }));
  reader.join();

  std::lock_guard<std::mutex> lock(mu);
  EXPECT_NE(received.find("event: ping"), std::string::npos);
  EXPECT_NE(received.find(R"(data: {"count":7})"), std::string::npos);
  EXPECT_NE(received.find(R"("server":"toolbridge")"), std::string::npos);
}

TEST_F(HttpTransportTest, SsePingsRepeatEveryInterval) {
  std::mutex mu;
  std::string received;

  std::thread reader([&] {
    httplib::Client cli("127.0.0.1", transport.Port());
    cli.set_read_timeout(10);
    cli.Get("/sse", [&](const char* data, size_t len) {
      std::lock_guard<std::mutex> lock(mu);
      received.append(data, len);
      size_t pings = 0;
      for (auto pos = received.find("event: ping"); pos != std::string::npos;
           pos = received.find("event: ping", pos + 1)) {
        pings++;
      }
      // One ping follows "connected"; the others come from the 1 s timer.
      return pings < 3;
    });
  });
  reader.join();

  std::lock_guard<std::mutex> lock(mu);
  size_t pings = 0;
  for (auto pos = received.find("event: ping"); pos != std::string::npos; pos = received.find("event: ping", pos + 1)) {
    pings++;
  }
  EXPECT_GE(pings, 3u);
}

TEST_F(HttpTransportTest, StopClosesOpenStreams) {
  std::mutex mu;
  std::string received;
  std::atomic<bool> done{false};

  std::thread reader([&] {
    httplib::Client cli("127.0.0.1", transport.Port());
    cli.set_read_timeout(10);
    cli.Get("/sse", [&](const char* data, size_t len) {
      std::lock_guard<std::mutex> lock(mu);
      received.append(data, len);
      return true;
    });
    done = true;
  });

  ASSERT_TRUE(WaitFor([&] {
    std::lock_guard<std::mutex> lock(mu);
    return received.find("event: connected") != std::string::npos;
  }));
  ASSERT_EQ(transport.ActiveSessions(), 1u);

  const auto started = std::chrono::steady_clock::now();
  transport.Stop();
  EXPECT_TRUE(WaitFor([&] { return done.load(); }));
  reader.join();
  EXPECT_LT(std::chrono::steady_clock::now() - started, std::chrono::seconds(3));
  EXPECT_EQ(transport.ActiveSessions(), 0u);
  EXPECT_EQ(transport.Broadcast("late", nlohmann::json::object()), 0u);
}

TEST(HttpTransportStandaloneTest, StreamsNeverTakeTheLastWorker) {
  HttpListenConfig cfg = LoopbackAnyPort();
  cfg.worker_threads = 2;
  HttpTransport transport(cfg);
  transport.SetRequestHandler([](const JsonRpcRequest& req) -> std::optional<JsonRpcResponse> {
    return JsonRpcResponse::Success(req.id, nlohmann::json::object());
  });
  transport.Start();
  ASSERT_EQ(transport.MaxSessions(), 1u);

  std::atomic<bool> connected{false};
  std::atomic<bool> done{false};
  std::thread reader([&] {
    httplib::Client cli("127.0.0.1", transport.Port());
    cli.set_read_timeout(10);
    cli.Get("/sse", [&](const char*, size_t) {
      connected = true;
      return true;
    });
    done = true;
  });
  ASSERT_TRUE(WaitFor([&] { return connected.load(); }));

  httplib::Client cli("127.0.0.1", transport.Port());
  cli.set_read_timeout(5);
  auto refused = cli.Get("/sse");
  ASSERT_TRUE(refused);
  EXPECT_EQ(refused->status, 503);
  EXPECT_EQ(nlohmann::json::parse(refused->body)["limit"], 1);

  auto rpc = cli.Post("/mcp", R"({"jsonrpc":"2.0","id":1,"method":"ping"})", "application/json");
  ASSERT_TRUE(rpc);
  EXPECT_EQ(rpc->status, 200);
  auto health = cli.Get("/health");
  ASSERT_TRUE(health);
  EXPECT_EQ(health->status, 200);

  transport.Stop();
  EXPECT_TRUE(WaitFor([&] { return done.load(); }));
  reader.join();
}

TEST(HttpTransportStandaloneTest, MissingHandlerAnswersInternalError) {
  HttpTransport transport(LoopbackAnyPort());
  auto reply = transport.HandleRpcBody(R"({"jsonrpc":"2.0","id":1,"method":"ping"})");
  EXPECT_EQ(reply.status, 200);
  auto j = nlohmann::json::parse(reply.body);
  EXPECT_EQ(j["error"]["code"], JsonRpcError::kInternalError);
  EXPECT_EQ(j["error"]["message"], "No request handler configured");

  EXPECT_EQ(transport.HandleRpcBody(R"({"jsonrpc":"2.0","method":"notify"})").status, 202);
  EXPECT_EQ(transport.HandleRpcBody("   ").status, 400);
}

TEST(HttpTransportStandaloneTest, HandlerExceptionBecomesInternalError) {
  HttpTransport transport(LoopbackAnyPort());
  transport.SetRequestHandler([](const JsonRpcRequest&) -> std::optional<JsonRpcResponse> {
    throw std::runtime_error("handler blew up");
  });
  auto reply = transport.HandleRpcBody(R"({"jsonrpc":"2.0","id":"x","method":"ping"})");
  EXPECT_EQ(reply.status, 200);
  auto j = nlohmann::json::parse(reply.body);
  EXPECT_EQ(j["id"], "x");
  EXPECT_EQ(j["error"]["message"], "handler blew up");
}

TEST(HttpTransportStandaloneTest, BindFailureThrows) {
  const int fd = ::socket(AF_INET, SOCK_STREAM, 0);
  ASSERT_GE(fd, 0);
  sockaddr_in addr{};
  addr.sin_family = AF_INET;
  addr.sin_port = 0;
  addr.sin_addr.s_addr = htonl(INADDR_LOOPBACK);
  ASSERT_EQ(::bind(fd, reinterpret_cast<sockaddr*>(&addr), sizeof(addr)), 0);
  ASSERT_EQ(::listen(fd, 1), 0);
  socklen_t len = sizeof(addr);
  ASSERT_EQ(::getsockname(fd, reinterpret_cast<sockaddr*>(&addr), &len), 0);

  HttpListenConfig cfg = LoopbackAnyPort();
  cfg.port = ntohs(addr.sin_port);
  HttpTransport transport(cfg);
  EXPECT_THROW(transport.Start(), TransportError);
  EXPECT_FALSE(transport.IsRunning());
  ::close(fd);
}

TEST(HttpTransportStandaloneTest, StopIsIdempotent) {
  HttpTransport transport(LoopbackAnyPort());
  transport.Start();
  EXPECT_TRUE(transport.IsRunning());
  transport.Stop();
  transport.Stop();
  EXPECT_FALSE(transport.IsRunning());
}
