#pragma once

#include "protocol.hpp"
#include "runtime_context.hpp"

#include <nlohmann/json.hpp>

#include <optional>
#include <string>

namespace toolbridge {

// Maps JSON-RPC methods onto the runtime. This is the request handler the
// HTTP transport is given.
class RpcRouter {
 public:
  explicit RpcRouter(RuntimeContext* ctx, std::string instructions = {});

  // nullopt for notifications: the caller must not send anything back.
  std::optional<JsonRpcResponse> Handle(const JsonRpcRequest& req);

 private:
  // nullopt when the method is unknown.
  std::optional<nlohmann::json> Dispatch(const std::string& method, const nlohmann::json& params);

  nlohmann::json HandleToolsList(const nlohmann::json& params) const;
  nlohmann::json HandleToolsCall(const nlohmann::json& params);
  nlohmann::json HandleToolsBatch(const nlohmann::json& params);
  nlohmann::json HandleResourcesRead(const nlohmann::json& params);
  nlohmann::json HandleResetCircuits(const nlohmann::json& params);

  RuntimeContext* ctx_;
  std::string instructions_;
};

}  // namespace toolbridge
