#pragma once

#include <nlohmann/json.hpp>

#include <optional>
#include <string>
#include <vector>

namespace toolbridge {

constexpr const char* kJsonRpcVersion = "2.0";
constexpr const char* kMcpProtocolVersion = "2024-11-05";
constexpr const char* kServerName = "toolbridge";
constexpr const char* kServerVersion = "0.3.0";

struct JsonRpcError {
  static constexpr int kParseError = -32700;
  static constexpr int kInvalidRequest = -32600;
  static constexpr int kMethodNotFound = -32601;
  static constexpr int kInvalidParams = -32602;
  static constexpr int kInternalError = -32603;

  int code = kInternalError;
  std::string message;
  std::optional<nlohmann::json> data;

  nlohmann::json ToJson() const;
};

struct JsonRpcRequest {
  std::string jsonrpc = kJsonRpcVersion;
  // null for notifications
  nlohmann::json id;
  std::string method;
  nlohmann::json params = nlohmann::json::object();

  bool IsNotification() const { return id.is_null(); }
};

struct JsonRpcResponse {
  nlohmann::json id;
  std::optional<nlohmann::json> result;
  std::optional<JsonRpcError> error;

  static JsonRpcResponse Success(nlohmann::json id, nlohmann::json result);
  static JsonRpcResponse Failure(nlohmann::json id,
                                 int code,
                                 std::string message,
                                 std::optional<nlohmann::json> data = std::nullopt);

  bool IsError() const { return error.has_value(); }
  nlohmann::json ToJson() const;
};

// Validates the shape of an already parsed JSON value. On failure fills *err with
// an InvalidRequest error and, when it could be read, the request id in *id_out.
bool DecodeRequest(const nlohmann::json& j, JsonRpcRequest* out, JsonRpcError* err, nlohmann::json* id_out = nullptr);

// Text -> JSON. Syntax errors produce ParseError.
std::optional<nlohmann::json> ParseRequestBody(const std::string& body, JsonRpcError* err);

struct ContentBlock {
  std::string type = "text";
  std::optional<std::string> text;
  std::optional<std::string> data;
  std::optional<std::string> mime_type;

  static ContentBlock Text(std::string text);
  static ContentBlock Image(std::string base64_data, std::string mime_type = "image/png");
  static ContentBlock Json(const nlohmann::json& value);

  nlohmann::json ToJson() const;
  static std::optional<ContentBlock> FromJson(const nlohmann::json& j);

  bool operator==(const ContentBlock& other) const;
};

struct ToolCallResult {
  std::vector<ContentBlock> content;
  bool is_error = false;

  static ToolCallResult Text(std::string text);
  static ToolCallResult Json(const nlohmann::json& value, bool is_error = false);
  static ToolCallResult Error(std::string message);

  // First text block, or empty.
  std::string FirstText() const;

  nlohmann::json ToJson() const;
  static std::optional<ToolCallResult> FromJson(const nlohmann::json& j);

  bool operator==(const ToolCallResult& other) const;
};

struct ToolInfo {
  std::string name;
  std::string description;
  nlohmann::json input_schema;

  nlohmann::json ToJson() const;
};

struct ResourceInfo {
  std::string uri;
  std::string name;
  std::optional<std::string> description;
  std::optional<std::string> mime_type;

  nlohmann::json ToJson() const;
};

struct ResourceContent {
  std::string uri;
  std::optional<std::string> mime_type;
  std::optional<std::string> text;
  std::optional<std::string> blob;

  nlohmann::json ToJson() const;
};

nlohmann::json DefaultInputSchema();
nlohmann::json BuildInitializeResult(const std::string& instructions = {});
nlohmann::json BuildToolsListResult(const std::vector<ToolInfo>& tools);
nlohmann::json BuildResourcesListResult(const std::vector<ResourceInfo>& resources);
nlohmann::json BuildResourcesReadResult(const std::vector<ResourceContent>& contents);

}  // namespace toolbridge
