#include "protocol.hpp"

#include <string>
#include <utility>

namespace toolbridge {
namespace {

static bool IsValidId(const nlohmann::json& id) {
  return id.is_null() || id.is_string() || id.is_number_integer() || id.is_number_unsigned();
}

static JsonRpcError MakeError(int code, std::string message) {
  JsonRpcError e;
  e.code = code;
  e.message = std::move(message);
  return e;
}

static std::optional<std::string> OptString(const nlohmann::json& j, const char* key) {
  auto it = j.find(key);
  if (it == j.end() || !it->is_string()) return std::nullopt;
  return it->get<std::string>();
}

}  // namespace

nlohmann::json JsonRpcError::ToJson() const {
  nlohmann::json j;
  j["code"] = code;
  j["message"] = message;
  if (data) j["data"] = *data;
  return j;
}

JsonRpcResponse JsonRpcResponse::Success(nlohmann::json id, nlohmann::json result) {
  JsonRpcResponse r;
  r.id = std::move(id);
  r.result = std::move(result);
  return r;
}

JsonRpcResponse JsonRpcResponse::Failure(nlohmann::json id,
                                         int code,
                                         std::string message,
                                         std::optional<nlohmann::json> data) {
  JsonRpcResponse r;
  r.id = std::move(id);
  JsonRpcError e;
  e.code = code;
  e.message = std::move(message);
  e.data = std::move(data);
  r.error = std::move(e);
  return r;
}

nlohmann::json JsonRpcResponse::ToJson() const {
  nlohmann::json j;
  j["jsonrpc"] = kJsonRpcVersion;
  j["id"] = id;
  if (error) {
    j["error"] = error->ToJson();
  } else {
    j["result"] = result ? *result : nlohmann::json(nullptr);
  }
  return j;
}

bool DecodeRequest(const nlohmann::json& j, JsonRpcRequest* out, JsonRpcError* err, nlohmann::json* id_out) {
  auto fail = [&](const std::string& message) {
    if (err) *err = MakeError(JsonRpcError::kInvalidRequest, message);
    return false;
  };

  if (!j.is_object()) return fail("request must be a JSON object");

  auto id_it = j.find("id");
  if (id_it != j.end()) {
    if (!IsValidId(*id_it)) return fail("id must be a string, an integer or null");
    if (id_out) *id_out = *id_it;
  }

  auto ver_it = j.find("jsonrpc");
  if (ver_it != j.end() && (!ver_it->is_string() || ver_it->get<std::string>() != kJsonRpcVersion)) {
    return fail("jsonrpc must be \"2.0\"");
  }

  auto method_it = j.find("method");
  if (method_it == j.end() || !method_it->is_string()) return fail("method must be a string");
  if (method_it->get_ref<const std::string&>().empty()) return fail("method must not be empty");

  auto params_it = j.find("params");
  if (params_it != j.end() && !params_it->is_null() && !params_it->is_object() && !params_it->is_array()) {
    return fail("params must be an object or an array");
  }

  if (!out) return true;
  out->jsonrpc = kJsonRpcVersion;
  out->id = id_it != j.end() ? *id_it : nlohmann::json(nullptr);
  out->method = method_it->get<std::string>();
  out->params = (params_it != j.end() && !params_it->is_null()) ? *params_it : nlohmann::json::object();
  return true;
}

std::optional<nlohmann::json> ParseRequestBody(const std::string& body, JsonRpcError* err) {
  auto j = nlohmann::json::parse(body, nullptr, false);
  if (j.is_discarded()) {
    if (err) *err = MakeError(JsonRpcError::kParseError, "Parse error: request body is not valid JSON");
    return std::nullopt;
  }
  return j;
}

ContentBlock ContentBlock::Text(std::string text) {
  ContentBlock b;
  b.type = "text";
  b.text = std::move(text);
  return b;
}

ContentBlock ContentBlock::Image(std::string base64_data, std::string mime_type) {
  ContentBlock b;
  b.type = "image";
  b.data = std::move(base64_data);
  b.mime_type = std::move(mime_type);
  return b;
}

ContentBlock ContentBlock::Json(const nlohmann::json& value) {
  return Text(value.dump(2));
}

nlohmann::json ContentBlock::ToJson() const {
  nlohmann::json j;
  j["type"] = type;
  if (text) j["text"] = *text;
  if (data) j["data"] = *data;
  if (mime_type) j["mimeType"] = *mime_type;
  return j;
}

std::optional<ContentBlock> ContentBlock::FromJson(const nlohmann::json& j) {
  if (!j.is_object()) return std::nullopt;
  auto type = OptString(j, "type");
  if (!type) return std::nullopt;
  ContentBlock b;
  b.type = *type;
  b.text = OptString(j, "text");
  b.data = OptString(j, "data");
  b.mime_type = OptString(j, "mimeType");
  return b;
}

bool ContentBlock::operator==(const ContentBlock& other) const {
  return type == other.type && text == other.text && data == other.data && mime_type == other.mime_type;
}

ToolCallResult ToolCallResult::Text(std::string text) {
  ToolCallResult r;
  r.content.push_back(ContentBlock::Text(std::move(text)));
  return r;
}

ToolCallResult ToolCallResult::Json(const nlohmann::json& value, bool is_error) {
  ToolCallResult r;
  r.content.push_back(ContentBlock::Json(value));
  r.is_error = is_error;
  return r;
}

ToolCallResult ToolCallResult::Error(std::string message) {
  ToolCallResult r;
  r.content.push_back(ContentBlock::Text(std::move(message)));
  r.is_error = true;
  return r;
}

std::string ToolCallResult::FirstText() const {
  for (const auto& b : content) {
    if (b.text) return *b.text;
  }
  return {};
}

nlohmann::json ToolCallResult::ToJson() const {
  nlohmann::json j;
  j["content"] = nlohmann::json::array();
  for (const auto& b : content) j["content"].push_back(b.ToJson());
  j["isError"] = is_error;
  return j;
}

std::optional<ToolCallResult> ToolCallResult::FromJson(const nlohmann::json& j) {
  if (!j.is_object()) return std::nullopt;
  ToolCallResult r;
  auto content_it = j.find("content");
  if (content_it != j.end()) {
    if (!content_it->is_array()) return std::nullopt;
    for (const auto& item : *content_it) {
      auto b = ContentBlock::FromJson(item);
      if (!b) return std::nullopt;
      r.content.push_back(std::move(*b));
    }
  }
  auto err_it = j.find("isError");
  if (err_it != j.end() && err_it->is_boolean()) r.is_error = err_it->get<bool>();
  return r;
}

bool ToolCallResult::operator==(const ToolCallResult& other) const {
  return is_error == other.is_error && content == other.content;
}

nlohmann::json ToolInfo::ToJson() const {
  return nlohmann::json{{"name", name}, {"description", description}, {"inputSchema", input_schema}};
}

nlohmann::json ResourceInfo::ToJson() const {
  nlohmann::json j;
  j["uri"] = uri;
  j["name"] = name;
  if (description) j["description"] = *description;
  if (mime_type) j["mimeType"] = *mime_type;
  return j;
}

nlohmann::json ResourceContent::ToJson() const {
  nlohmann::json j;
  j["uri"] = uri;
  if (mime_type) j["mimeType"] = *mime_type;
  if (text) j["text"] = *text;
  if (blob) j["blob"] = *blob;
  return j;
}

nlohmann::json DefaultInputSchema() {
  return nlohmann::json{{"type", "object"}, {"properties", nlohmann::json::object()}, {"additionalProperties", true}};
}

nlohmann::json BuildInitializeResult(const std::string& instructions) {
  nlohmann::json j;
  j["protocolVersion"] = kMcpProtocolVersion;
  j["capabilities"] = {{"tools", {{"listChanged", true}}},
                       {"resources", {{"subscribe", false}, {"listChanged", true}}},
                       {"logging", nlohmann::json::object()}};
  j["serverInfo"] = {{"name", kServerName}, {"version", kServerVersion}};
  if (!instructions.empty()) j["instructions"] = instructions;
  return j;
}

nlohmann::json BuildToolsListResult(const std::vector<ToolInfo>& tools) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& t : tools) arr.push_back(t.ToJson());
  return nlohmann::json{{"tools", std::move(arr)}};
}

nlohmann::json BuildResourcesListResult(const std::vector<ResourceInfo>& resources) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& r : resources) arr.push_back(r.ToJson());
  return nlohmann::json{{"resources", std::move(arr)}};
}

nlohmann::json BuildResourcesReadResult(const std::vector<ResourceContent>& contents) {
  nlohmann::json arr = nlohmann::json::array();
  for (const auto& c : contents) arr.push_back(c.ToJson());
  return nlohmann::json{{"contents", std::move(arr)}};
}

}  // namespace toolbridge
