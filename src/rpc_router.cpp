#include "rpc_router.hpp"

#include <cstring>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>
#include <vector>

namespace toolbridge {
namespace {

// Thrown by method handlers for malformed params; becomes InvalidParams.
class InvalidParams : public std::invalid_argument {
 public:
  using std::invalid_argument::invalid_argument;
};

static bool StartsWith(const std::string& s, const std::string& prefix) {
  return s.size() >= prefix.size() && s.compare(0, prefix.size(), prefix) == 0;
}

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

static const nlohmann::json& RequireObject(const nlohmann::json& params) {
  if (!params.is_object()) throw InvalidParams("params must be an object");
  return params;
}

static std::string RequireString(const nlohmann::json& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end() || !it->is_string()) throw InvalidParams(std::string(key) + " must be a string");
  return it->get<std::string>();
}

static std::string OptionalString(const nlohmann::json& params, const char* key) {
  auto it = params.find(key);
  if (it == params.end() || it->is_null()) return {};
  if (!it->is_string()) throw InvalidParams(std::string(key) + " must be a string");
  return it->get<std::string>();
}

static nlohmann::json OptionalArguments(const nlohmann::json& params) {
  auto it = params.find("arguments");
  if (it == params.end() || it->is_null()) return nlohmann::json::object();
  if (!it->is_object()) throw InvalidParams("arguments must be an object");
  return *it;
}

static Priority ReadPriority(const nlohmann::json& params) {
  const auto name = OptionalString(params, "priority");
  if (name.empty()) return Priority::kNormal;
  auto p = ParsePriority(name);
  if (!p) throw InvalidParams("priority must be one of high, normal, low, idle");
  return *p;
}

static std::string BatchIdToString(const nlohmann::json& id) {
  if (id.is_string()) return id.get<std::string>();
  if (id.is_number_integer() || id.is_number_unsigned()) return id.dump();
  if (id.is_null()) return {};
  throw InvalidParams("batch request id must be a string or an integer");
}

}  // namespace

RpcRouter::RpcRouter(RuntimeContext* ctx, std::string instructions)
    : ctx_(ctx), instructions_(std::move(instructions)) {}

std::optional<JsonRpcResponse> RpcRouter::Handle(const JsonRpcRequest& req) {
  const bool notification = req.IsNotification();
  if (StartsWith(req.method, "notifications/")) {
    std::cout << "[rpc] notification method=" << req.method << "\n";
    if (notification) return std::nullopt;
    return JsonRpcResponse::Success(req.id, nlohmann::json::object());
  }

  std::optional<JsonRpcResponse> resp;
  try {
    auto result = Dispatch(req.method, req.params);
    if (!result) {
      resp = JsonRpcResponse::Failure(req.id, JsonRpcError::kMethodNotFound, "Method not found: " + req.method);
    } else {
      resp = JsonRpcResponse::Success(req.id, std::move(*result));
    }
  } catch (const InvalidParams& e) {
    resp = JsonRpcResponse::Failure(req.id, JsonRpcError::kInvalidParams, e.what());
  } catch (const std::exception& e) {
    std::cout << "[rpc] method=" << req.method << " error=" << TruncateForLog(e.what(), 500) << "\n";
    resp = JsonRpcResponse::Failure(req.id, JsonRpcError::kInternalError, std::string("Internal error: ") + e.what());
  } catch (...) {
    std::cout << "[rpc] method=" << req.method << " error=unknown exception\n";
    resp = JsonRpcResponse::Failure(req.id, JsonRpcError::kInternalError, "Internal error: unknown exception");
  }

  if (notification) return std::nullopt;
  return resp;
}

std::optional<nlohmann::json> RpcRouter::Dispatch(const std::string& method, const nlohmann::json& params) {
  if (method == "initialize") return BuildInitializeResult(instructions_);
  if (method == "ping") return nlohmann::json::object();
  if (method == "tools/list") return HandleToolsList(params);
  if (method == "tools/call") return HandleToolsCall(params);
  if (method == "tools/batch") return HandleToolsBatch(params);
  if (method == "resources/list") return BuildResourcesListResult(ctx_->resources().ListResources());
  if (method == "resources/read") return HandleResourcesRead(params);
  if (method == "health/check") return ctx_->health().FullReport().ToJson();
  if (method == "runtime/stats") return ctx_->GetRuntimeStats();
  if (method == "runtime/resetCircuits") return HandleResetCircuits(params);
  return std::nullopt;
}

nlohmann::json RpcRouter::HandleToolsList(const nlohmann::json& params) const {
  std::string category;
  if (params.is_object()) category = OptionalString(params, "category");
  return BuildToolsListResult(ctx_->tools().ListToolsByCategory(category));
}

nlohmann::json RpcRouter::HandleToolsCall(const nlohmann::json& params) {
  const auto& p = RequireObject(params);
  const auto name = RequireString(p, "name");
  auto arguments = OptionalArguments(p);
  const auto priority = ReadPriority(p);
  return ctx_->tools().Execute(name, arguments, priority).ToJson();
}

nlohmann::json RpcRouter::HandleToolsBatch(const nlohmann::json& params) {
  const auto& p = RequireObject(params);
  auto it = p.find("requests");
  if (it == p.end() || !it->is_array()) throw InvalidParams("requests must be an array");

  bool parallel = true;
  auto par_it = p.find("parallel");
  if (par_it != p.end() && !par_it->is_null()) {
    if (!par_it->is_boolean()) throw InvalidParams("parallel must be a boolean");
    parallel = par_it->get<bool>();
  }

  std::vector<BatchRequest> requests;
  requests.reserve(it->size());
  for (const auto& r : *it) {
    const auto& item = RequireObject(r);
    BatchRequest br;
    br.name = RequireString(item, "name");
    br.arguments = OptionalArguments(item);
    auto id_it = item.find("id");
    if (id_it != item.end()) br.id = BatchIdToString(*id_it);
    requests.push_back(std::move(br));
  }

  nlohmann::json responses = nlohmann::json::array();
  for (const auto& r : ctx_->tools().ExecuteBatch(requests, parallel)) responses.push_back(r.ToJson());
  return nlohmann::json{{"responses", std::move(responses)}};
}

nlohmann::json RpcRouter::HandleResourcesRead(const nlohmann::json& params) {
  const auto& p = RequireObject(params);
  return BuildResourcesReadResult(ctx_->resources().ReadResource(RequireString(p, "uri")));
}

nlohmann::json RpcRouter::HandleResetCircuits(const nlohmann::json& params) {
  std::string name;
  if (params.is_object()) name = OptionalString(params, "name");
  return nlohmann::json{{"reset", ctx_->ResetCircuits(name)}};
}

}  // namespace toolbridge
