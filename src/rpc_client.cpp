#include "rpc_client.hpp"

#include <httplib.h>

#include <memory>
#include <string>
#include <utility>

namespace toolbridge {
namespace {

static std::unique_ptr<httplib::Client> MakeClient(const HttpEndpoint& ep,
                                                   int connect_timeout_seconds,
                                                   int read_timeout_seconds,
                                                   int write_timeout_seconds) {
  auto cli = std::make_unique<httplib::Client>(ep.host, ep.port);
  cli->set_connection_timeout(connect_timeout_seconds);
  cli->set_read_timeout(read_timeout_seconds);
  cli->set_write_timeout(write_timeout_seconds);
  return cli;
}

static std::string ExtractJsonRpcError(const nlohmann::json& resp, int* code) {
  if (!resp.is_object()) return "invalid json-rpc response";
  if (!resp.contains("error") || !resp["error"].is_object()) return {};
  const auto& e = resp["error"];
  if (code && e.contains("code") && e["code"].is_number_integer()) *code = e["code"].get<int>();
  std::string msg;
  if (e.contains("message") && e["message"].is_string()) msg = e["message"].get<std::string>();
  if (msg.empty()) msg = "json-rpc error";
  return msg;
}

}  // namespace

RpcClient::RpcClient(HttpEndpoint endpoint) : endpoint_(std::move(endpoint)) {}

void RpcClient::SetTimeouts(int connect_seconds, int read_seconds, int write_seconds) {
  if (connect_seconds > 0) connect_timeout_seconds_ = connect_seconds;
  if (read_seconds > 0) read_timeout_seconds_ = read_seconds;
  if (write_seconds > 0) write_timeout_seconds_ = write_seconds;
}

bool RpcClient::Initialize(std::string* err) {
  nlohmann::json params;
  params["protocolVersion"] = kMcpProtocolVersion;
  params["capabilities"] = nlohmann::json::object();
  params["clientInfo"] = {{"name", std::string(kServerName) + "-client"}, {"version", kServerVersion}};
  return Call("initialize", params, err).has_value();
}

bool RpcClient::Ping(std::string* err) {
  return Call("ping", nlohmann::json::object(), err).has_value();
}

std::vector<ToolInfo> RpcClient::ListTools(std::string* err) {
  auto r = Call("tools/list", nlohmann::json::object(), err);
  if (!r) return {};
  std::vector<ToolInfo> out;
  if (!r->contains("tools") || !(*r)["tools"].is_array()) return out;
  for (const auto& t : (*r)["tools"]) {
    if (!t.is_object()) continue;
    ToolInfo info;
    if (t.contains("name") && t["name"].is_string()) info.name = t["name"].get<std::string>();
    if (t.contains("description") && t["description"].is_string()) info.description = t["description"].get<std::string>();
    if (t.contains("inputSchema") && t["inputSchema"].is_object()) info.input_schema = t["inputSchema"];
    if (!info.name.empty()) out.push_back(std::move(info));
  }
  return out;
}

std::optional<ToolCallResult> RpcClient::CallTool(const std::string& name,
                                                  const nlohmann::json& arguments,
                                                  std::string* err,
                                                  const std::string& priority) {
  nlohmann::json params;
  params["name"] = name;
  params["arguments"] = arguments;
  if (!priority.empty()) params["priority"] = priority;
  auto r = Call("tools/call", params, err);
  if (!r) return std::nullopt;
  auto result = ToolCallResult::FromJson(*r);
  if (!result && err) *err = "rpc: malformed tool result";
  return result;
}

std::optional<nlohmann::json> RpcClient::Call(const std::string& method,
                                              const nlohmann::json& params,
                                              std::string* err,
                                              int* error_code) {
  int64_t id = 0;
  {
    std::lock_guard<std::mutex> lock(mu_);
    id = next_id_++;
  }

  auto cli = MakeClient(endpoint_, connect_timeout_seconds_, read_timeout_seconds_, write_timeout_seconds_);
  nlohmann::json req;
  req["jsonrpc"] = kJsonRpcVersion;
  req["id"] = id;
  req["method"] = method;
  req["params"] = params;

  const auto path = endpoint_.base_path.empty() ? std::string("/mcp") : endpoint_.base_path;
  auto res = cli->Post(path, req.dump(), "application/json");
  if (!res) {
    if (err) *err = "rpc: failed to connect";
    return std::nullopt;
  }

  auto resp = nlohmann::json::parse(res->body, nullptr, false);
  if (resp.is_discarded()) {
    if (err) *err = "rpc: http " + std::to_string(res->status) + " invalid json response";
    return std::nullopt;
  }

  auto rpc_err = ExtractJsonRpcError(resp, error_code);
  if (!rpc_err.empty()) {
    if (err) *err = rpc_err;
    return std::nullopt;
  }
  if (res->status < 200 || res->status >= 300) {
    if (err) *err = "rpc: http " + std::to_string(res->status);
    return std::nullopt;
  }
  if (!resp.contains("result")) {
    if (err) *err = "rpc: missing result";
    return std::nullopt;
  }
  return resp["result"];
}

}  // namespace toolbridge
