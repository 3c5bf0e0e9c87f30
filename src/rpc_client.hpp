#pragma once

#include "config.hpp"
#include "protocol.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <mutex>
#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

// Blocking JSON-RPC client for a toolbridge server (POST to the endpoint's
// base path, "/mcp" when empty).
class RpcClient {
 public:
  explicit RpcClient(HttpEndpoint endpoint);

  bool Initialize(std::string* err);
  std::vector<ToolInfo> ListTools(std::string* err);
  std::optional<ToolCallResult> CallTool(const std::string& name,
                                         const nlohmann::json& arguments,
                                         std::string* err,
                                         const std::string& priority = {});
  bool Ping(std::string* err);

  // Raw call; JSON-RPC errors are reported through *err (and *error_code when given).
  std::optional<nlohmann::json> Call(const std::string& method,
                                     const nlohmann::json& params,
                                     std::string* err,
                                     int* error_code = nullptr);

  void SetTimeouts(int connect_seconds, int read_seconds, int write_seconds);

 private:
  HttpEndpoint endpoint_;
  int connect_timeout_seconds_ = 5;
  int read_timeout_seconds_ = 60;
  int write_timeout_seconds_ = 30;

  std::mutex mu_;
  int64_t next_id_ = 1;
};

}  // namespace toolbridge
