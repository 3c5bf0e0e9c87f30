#include "builtin_tools.hpp"

#include <chrono>
#include <cstdint>
#include <sstream>
#include <string>
#include <thread>

namespace toolbridge {
namespace {

constexpr int64_t kMaxSleepMs = 60000;

static std::string FormatNumber(double v) {
  if (v == static_cast<double>(static_cast<int64_t>(v)) && v > -1e15 && v < 1e15) {
    return std::to_string(static_cast<int64_t>(v));
  }
  std::ostringstream oss;
  oss << v;
  return oss.str();
}

static std::string OptionalName(const nlohmann::json& args) {
  if (args.is_object() && args.contains("name") && args["name"].is_string()) return args["name"].get<std::string>();
  return {};
}

}  // namespace

void RegisterBuiltinTools(RuntimeContext& ctx) {
  auto& tools = ctx.tools();

  {
    ToolSpec spec;
    spec.name = "echo";
    spec.description = "Returns the given text unchanged.";
    spec.input_schema = {{"type", "object"},
                         {"properties", {{"text", {{"type", "string"}, {"description", "Text to echo back"}}}}},
                         {"required", {"text"}}};
    spec.category = "utility";
    tools.RegisterTool(spec, [](const nlohmann::json& args) {
      if (!args.is_object() || !args.contains("text") || !args["text"].is_string()) {
        return ToolCallResult::Error("missing required field: text");
      }
      return ToolCallResult::Text(args["text"].get<std::string>());
    });
  }

  {
    ToolSpec spec;
    spec.name = "add";
    spec.description = "Adds two numbers.";
    spec.input_schema = {{"type", "object"},
                         {"properties", {{"a", {{"type", "number"}}}, {"b", {{"type", "number"}}}}},
                         {"required", {"a", "b"}}};
    spec.category = "utility";
    tools.RegisterTool(spec, [](const nlohmann::json& args) {
      if (!args.is_object() || !args.contains("a") || !args["a"].is_number() || !args.contains("b") ||
          !args["b"].is_number()) {
        return ToolCallResult::Error("fields a and b must be numbers");
      }
      if (args["a"].is_number_integer() && args["b"].is_number_integer()) {
        return ToolCallResult::Text(std::to_string(args["a"].get<int64_t>() + args["b"].get<int64_t>()));
      }
      return ToolCallResult::Text(FormatNumber(args["a"].get<double>() + args["b"].get<double>()));
    });
  }

  {
    ToolSpec spec;
    spec.name = "sleep";
    spec.description = "Blocks a worker thread for the given number of milliseconds.";
    spec.input_schema = {{"type", "object"},
                         {"properties", {{"ms", {{"type", "integer"}, {"minimum", 0}, {"maximum", kMaxSleepMs}}}}},
                         {"required", {"ms"}}};
    spec.category = "utility";
    spec.requires_main_thread = false;
    spec.cacheable = false;
    tools.RegisterTool(spec, [](const nlohmann::json& args) {
      if (!args.is_object() || !args.contains("ms") || !args["ms"].is_number_integer()) {
        return ToolCallResult::Error("missing required field: ms");
      }
      auto ms = args["ms"].get<int64_t>();
      if (ms < 0) ms = 0;
      if (ms > kMaxSleepMs) ms = kMaxSleepMs;
      std::this_thread::sleep_for(std::chrono::milliseconds(ms));
      return ToolCallResult::Text("slept " + std::to_string(ms) + "ms");
    });
  }

  {
    ToolSpec spec;
    spec.name = "runtime_stats";
    spec.description = "Registry, queue, circuit breaker and cache statistics.";
    spec.category = "runtime";
    spec.cacheable = false;
    tools.RegisterTool(spec, [&ctx](const nlohmann::json&) { return ToolCallResult::Json(ctx.GetRuntimeStats()); });
  }

  {
    ToolSpec spec;
    spec.name = "health_report";
    spec.description = "Full health report of the runtime.";
    spec.category = "runtime";
    spec.cacheable = false;
    tools.RegisterTool(spec,
                       [&ctx](const nlohmann::json&) { return ToolCallResult::Json(ctx.health().FullReport().ToJson()); });
  }

  {
    ToolSpec spec;
    spec.name = "reset_circuits";
    spec.description = "Closes the circuit of one tool, or of every tool when no name is given.";
    spec.input_schema = {{"type", "object"}, {"properties", {{"name", {{"type", "string"}}}}}};
    spec.category = "runtime";
    spec.cacheable = false;
    tools.RegisterTool(spec, [&ctx](const nlohmann::json& args) {
      return ToolCallResult::Json({{"reset", ctx.ResetCircuits(OptionalName(args))}});
    });
  }

  {
    ToolSpec spec;
    spec.name = "clear_cache";
    spec.description = "Drops cached results of one tool, or the whole response cache.";
    spec.input_schema = {{"type", "object"}, {"properties", {{"name", {{"type", "string"}}}}}};
    spec.category = "runtime";
    spec.cacheable = false;
    tools.RegisterTool(spec, [&ctx](const nlohmann::json& args) {
      const auto name = OptionalName(args);
      size_t removed = 0;
      if (name.empty()) {
        removed = ctx.cache().Size();
        ctx.cache().Clear();
      } else {
        removed = ctx.cache().Invalidate(name);
      }
      return ToolCallResult::Json({{"removed", removed}});
    });
  }
}

}  // namespace toolbridge
