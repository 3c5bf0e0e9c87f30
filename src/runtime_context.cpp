#include "runtime_context.hpp"

#include <chrono>
#include <iostream>
#include <string>
#include <utility>

namespace toolbridge {
namespace {

static ResourceContent JsonContent(const std::string& uri, const nlohmann::json& body) {
  ResourceContent c;
  c.uri = uri;
  c.mime_type = "application/json";
  c.text = body.dump(2);
  return c;
}

static ToolRegistryOptions MakeRegistryOptions(const ExecutorConfig& cfg) {
  ToolRegistryOptions opts;
  if (cfg.affine_timeout_ms > 0) opts.affine_timeout = std::chrono::milliseconds(cfg.affine_timeout_ms);
  return opts;
}

}  // namespace

RuntimeContext::RuntimeContext(RuntimeConfig cfg, MemoryProbe memory_probe)
    : cfg_(std::move(cfg)),
      breaker_(cfg_.breaker),
      cache_(cfg_.cache),
      executor_(&queue_, cfg_.executor),
      tools_(&queue_, &executor_, &breaker_, &cache_, MakeRegistryOptions(cfg_.executor)),
      health_(&tools_, &breaker_, &queue_, cfg_.health, std::move(memory_probe)) {
  tools_.AddObserver(&health_);
  RegisterBuiltinResources();
}

RuntimeContext::~RuntimeContext() {
  tools_.RemoveObserver(&health_);
  executor_.Stop();
}

nlohmann::json RuntimeContext::GetRuntimeStats() {
  nlohmann::json j;
  j["tools"] = tools_.GetStats();
  j["queue"] = queue_.GetStats().ToJson();
  j["circuits"] = breaker_.GetStats();
  j["cache"] = cache_.GetStats();
  j["executor"] = {{"running", executor_.IsRunning()},
                   {"ticks", executor_.ticks()},
                   {"action_failures", executor_.action_failures()}};
  return j;
}

size_t RuntimeContext::ResetCircuits(const std::string& tool_name) {
  if (!tool_name.empty()) return breaker_.Reset(tool_name) ? 1 : 0;
  const auto total = breaker_.CountByState().Total();
  breaker_.ResetAll();
  std::cout << "[breaker] reset_all count=" << total << "\n";
  return total;
}

void RuntimeContext::RegisterBuiltinResources() {
  resources_.RegisterResource({"runtime://health", "Runtime health", std::string("Full health report"), std::nullopt},
                              [this](const std::string& uri) { return JsonContent(uri, health_.FullReport().ToJson()); });
  resources_.RegisterResource({"runtime://tools", "Tool catalog", std::string("Registered tools and call statistics"),
                               std::nullopt},
                              [this](const std::string& uri) {
                                nlohmann::json j;
                                j["tools"] = BuildToolsListResult(tools_.ListTools())["tools"];
                                j["stats"] = tools_.GetStats();
                                return JsonContent(uri, j);
                              });
  resources_.RegisterResource({"runtime://queue", "Dispatch queue", std::string("Pending and processed work per tier"),
                               std::nullopt},
                              [this](const std::string& uri) { return JsonContent(uri, queue_.GetStats().ToJson()); });
  resources_.RegisterResource({"runtime://circuits", "Circuit breakers", std::string("Per-tool circuit states"),
                               std::nullopt},
                              [this](const std::string& uri) { return JsonContent(uri, breaker_.GetStats()); });

  resources_.RegisterPatternHandler("runtime://tools/*", [this](const std::string& uri) {
    const std::string prefix = "runtime://tools/";
    const auto name = uri.size() > prefix.size() ? uri.substr(prefix.size()) : std::string();
    auto info = tools_.GetTool(name);
    if (!info) {
      ResourceContent c;
      c.uri = uri;
      c.mime_type = "text/plain";
      c.text = "Tool not found: " + name;
      return c;
    }
    nlohmann::json j;
    j["name"] = info->spec.name;
    j["description"] = info->spec.description;
    j["category"] = info->spec.category;
    j["inputSchema"] = info->spec.input_schema;
    j["requiresMainThread"] = info->spec.requires_main_thread;
    j["cacheable"] = info->spec.cacheable;
    j["callCount"] = info->call_count;
    j["avgExecutionTimeMs"] =
        info->call_count > 0 ? info->total_execution_ms / static_cast<double>(info->call_count) : 0.0;
    j["circuit"] = CircuitStateName(breaker_.GetState(info->spec.name));
    return JsonContent(uri, j);
  });
}

}  // namespace toolbridge
