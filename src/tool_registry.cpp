#include "tool_registry.hpp"

#include "string_util.hpp"

#include <algorithm>
#include <cstring>
#include <exception>
#include <iostream>
#include <stdexcept>
#include <utility>

namespace toolbridge {
namespace {

static std::string TruncateForLog(std::string s, size_t max_chars) {
  if (max_chars == 0) return {};
  if (s.size() <= max_chars) return s;
  constexpr const char* kSuffix = "...(truncated)";
  if (max_chars <= std::strlen(kSuffix)) return std::string(kSuffix).substr(0, max_chars);
  s.resize(max_chars - std::strlen(kSuffix));
  s += kSuffix;
  return s;
}

static double ElapsedMs(SteadyClock::time_point start) {
  return std::chrono::duration<double, std::milli>(SteadyClock::now() - start).count();
}

class AffineTimeout : public std::runtime_error {
 public:
  using std::runtime_error::runtime_error;
};

}  // namespace

nlohmann::json BatchResponse::ToJson() const {
  return nlohmann::json{{"id", id}, {"result", result.ToJson()}, {"executionTimeMs", execution_time_ms}};
}

ToolRegistry::ToolRegistry(DispatchQueue* queue,
                           CooperativeExecutor* executor,
                           CircuitBreaker* breaker,
                           ResponseCache* cache,
                           ToolRegistryOptions options)
    : queue_(queue), executor_(executor), breaker_(breaker), cache_(cache), options_(options) {}

void ToolRegistry::AddRegistration(std::shared_ptr<Registration> reg) {
  if (reg->spec.input_schema.is_null()) reg->spec.input_schema = DefaultInputSchema();
  if (reg->spec.category.empty()) reg->spec.category = "general";
  reg->registered_at = std::chrono::system_clock::now();
  const auto name = reg->spec.name;
  {
    std::unique_lock<std::shared_mutex> lock(mu_);
    tools_[ToLowerAscii(name)] = std::move(reg);
  }
  for (auto* o : SnapshotObservers()) o->OnToolRegistered(name);
}

void ToolRegistry::RegisterTool(ToolSpec spec, ToolHandler handler) {
  if (spec.name.empty() || !handler) return;
  auto reg = std::make_shared<Registration>();
  reg->spec = std::move(spec);
  reg->handler = std::move(handler);
  AddRegistration(std::move(reg));
}

void ToolRegistry::RegisterTool(const std::string& name,
                                const std::string& description,
                                ToolHandler handler,
                                nlohmann::json input_schema,
                                const std::string& category) {
  ToolSpec spec;
  spec.name = name;
  spec.description = description;
  spec.input_schema = std::move(input_schema);
  if (!category.empty()) spec.category = category;
  RegisterTool(std::move(spec), std::move(handler));
}

void ToolRegistry::RegisterAsyncTool(ToolSpec spec, AsyncToolHandler handler) {
  if (spec.name.empty() || !handler) return;
  auto reg = std::make_shared<Registration>();
  reg->spec = std::move(spec);
  reg->async_handler = std::move(handler);
  AddRegistration(std::move(reg));
}

bool ToolRegistry::UnregisterTool(const std::string& name) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  return tools_.erase(ToLowerAscii(name)) > 0;
}

std::shared_ptr<ToolRegistry::Registration> ToolRegistry::Find(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = tools_.find(ToLowerAscii(name));
  if (it == tools_.end()) return nullptr;
  return it->second;
}

bool ToolRegistry::HasTool(const std::string& name) const {
  return Find(name) != nullptr;
}

std::optional<ToolRegistrationInfo> ToolRegistry::GetTool(const std::string& name) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  auto it = tools_.find(ToLowerAscii(name));
  if (it == tools_.end()) return std::nullopt;
  const auto& r = *it->second;
  ToolRegistrationInfo info;
  info.spec = r.spec;
  info.registered_at = r.registered_at;
  info.call_count = r.call_count;
  info.total_execution_ms = r.total_execution_ms;
  return info;
}

size_t ToolRegistry::ToolCount() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  return tools_.size();
}

std::vector<std::string> ToolRegistry::ToolNames() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<std::string> out;
  out.reserve(tools_.size());
  for (const auto& [_, r] : tools_) out.push_back(r->spec.name);
  std::sort(out.begin(), out.end());
  return out;
}

std::vector<ToolInfo> ToolRegistry::ListTools() const {
  return ListToolsByCategory({});
}

std::vector<ToolInfo> ToolRegistry::ListToolsByCategory(const std::string& category) const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  std::vector<ToolInfo> out;
  for (const auto& [_, r] : tools_) {
    if (!category.empty() && r->spec.category != category) continue;
    out.push_back({r->spec.name, r->spec.description, r->spec.input_schema});
  }
  std::sort(out.begin(), out.end(), [](const ToolInfo& a, const ToolInfo& b) { return a.name < b.name; });
  return out;
}

nlohmann::json ToolRegistry::GetStats() const {
  std::shared_lock<std::shared_mutex> lock(mu_);
  uint64_t total_calls = 0;
  nlohmann::json categories = nlohmann::json::object();
  std::vector<const Registration*> by_use;
  by_use.reserve(tools_.size());
  for (const auto& [_, r] : tools_) {
    total_calls += r->call_count;
    const auto& cat = r->spec.category;
    categories[cat] = categories.value(cat, 0) + 1;
    by_use.push_back(r.get());
  }
  std::sort(by_use.begin(), by_use.end(), [](const Registration* a, const Registration* b) {
    if (a->call_count != b->call_count) return a->call_count > b->call_count;
    return a->spec.name < b->spec.name;
  });
  nlohmann::json most_used = nlohmann::json::array();
  for (size_t i = 0; i < by_use.size() && i < 10; i++) {
    const auto* r = by_use[i];
    if (r->call_count == 0) break;
    most_used.push_back({{"name", r->spec.name},
                         {"calls", r->call_count},
                         {"avg_execution_time_ms", r->total_execution_ms / static_cast<double>(r->call_count)}});
  }
  nlohmann::json j;
  j["total_tools"] = tools_.size();
  j["total_calls"] = total_calls;
  j["categories"] = std::move(categories);
  j["most_used"] = std::move(most_used);
  return j;
}

ToolCallResult ToolRegistry::InvokeHandler(const Registration& reg, const nlohmann::json& arguments) const {
  if (reg.handler) return reg.handler(arguments);
  if (reg.async_handler) return reg.async_handler(arguments).get();
  throw std::runtime_error("tool has no handler");
}

ToolCallResult ToolRegistry::DispatchToExecutor(const std::shared_ptr<Registration>& reg,
                                                const nlohmann::json& arguments,
                                                Priority priority) {
  // The executor only starts the handler; an async handler finishes on its own
  // and the caller waits on the inner future. The queued item holds the only
  // reference to the promise, so discarding it breaks the promise.
  auto promise = std::make_shared<std::promise<std::future<ToolCallResult>>>();
  auto outer = promise->get_future();

  queue_->Enqueue(
      [reg, arguments, promise = std::move(promise)]() {
        try {
          if (reg->async_handler) {
            promise->set_value(reg->async_handler(arguments));
            return;
          }
          std::promise<ToolCallResult> ready;
          ready.set_value(reg->handler(arguments));
          promise->set_value(ready.get_future());
        } catch (...) {
          promise->set_exception(std::current_exception());
        }
      },
      priority, reg->spec.name);
  if (executor_) executor_->RequestWake();

  const auto timeout = options_.affine_timeout;
  const auto deadline = SteadyClock::now() + timeout;
  auto timed_out = [&]() {
    return AffineTimeout("Tool '" + reg->spec.name + "' timed out after " + std::to_string(timeout.count()) + "ms");
  };

  try {
    if (timeout.count() > 0 && outer.wait_until(deadline) != std::future_status::ready) throw timed_out();
    auto inner = outer.get();
    if (timeout.count() > 0 && inner.wait_until(deadline) != std::future_status::ready) throw timed_out();
    return inner.get();
  } catch (const std::future_error& e) {
    if (e.code() == std::future_errc::broken_promise) {
      throw std::runtime_error("queued work was discarded before it ran");
    }
    throw;
  }
}

void ToolRegistry::RecordCall(const std::shared_ptr<Registration>& reg, double elapsed_ms) {
  std::unique_lock<std::shared_mutex> lock(mu_);
  reg->call_count++;
  reg->total_execution_ms += elapsed_ms;
}

ToolCallResult ToolRegistry::RecordFault(const std::string& tool_name, const std::string& message, ToolCallResult result) {
  std::cout << "[registry] tool=" << tool_name << " error=" << TruncateForLog(message, 512) << "\n";
  if (breaker_) breaker_->RecordFailure(tool_name, message);
  for (auto* o : SnapshotObservers()) o->OnToolError(tool_name, message);
  return result;
}

ToolCallResult ToolRegistry::Execute(const std::string& name, const nlohmann::json& arguments, Priority priority) {
  auto reg = Find(name);
  if (!reg) {
    std::cout << "[registry] tool not found name=" << name << "\n";
    return ToolCallResult::Error("Tool not found: " + name);
  }
  const auto& tool_name = reg->spec.name;
  const nlohmann::json args = arguments.is_null() ? nlohmann::json::object() : arguments;

  if (breaker_ && !breaker_->AllowRequest(tool_name)) {
    const auto state = breaker_->GetState(tool_name);
    return ToolCallResult::Error("Tool '" + tool_name + "' is temporarily unavailable (circuit " +
                                 CircuitStateName(state) + "). Please try again later.");
  }

  const bool use_cache = cache_ && reg->spec.cacheable;
  if (use_cache) {
    if (auto cached = cache_->TryGet(tool_name, args)) {
      if (breaker_) breaker_->RecordSuccess(tool_name);
      for (auto* o : SnapshotObservers()) o->OnCacheHit(tool_name);
      return *cached;
    }
  }

  const auto start = SteadyClock::now();
  try {
    ToolCallResult result;
    const bool affine = reg->spec.requires_main_thread && queue_ && executor_ && !executor_->IsExecutorThread();
    if (affine) {
      result = DispatchToExecutor(reg, args, priority);
    } else {
      result = InvokeHandler(*reg, args);
    }
    const double elapsed = ElapsedMs(start);
    RecordCall(reg, elapsed);

    // Failed results are not memoized so a retry reaches the handler again.
    if (use_cache && !result.is_error) cache_->Put(tool_name, args, result);

    if (breaker_) {
      if (result.is_error) {
        breaker_->RecordFailure(tool_name, "Tool returned error");
      } else {
        breaker_->RecordSuccess(tool_name);
      }
    }
    for (auto* o : SnapshotObservers()) o->OnToolExecuted(tool_name, elapsed, result.is_error);
    return result;
  } catch (const AffineTimeout& e) {
    return RecordFault(tool_name, e.what(), ToolCallResult::Error(e.what()));
  } catch (const std::exception& e) {
    return RecordFault(tool_name, e.what(), ToolCallResult::Error(std::string("Tool execution failed: ") + e.what()));
  } catch (...) {
    return RecordFault(tool_name, "unknown exception", ToolCallResult::Error("Tool execution failed: unknown exception"));
  }
}

std::vector<BatchResponse> ToolRegistry::ExecuteBatch(const std::vector<BatchRequest>& requests, bool parallel) {
  std::vector<BatchResponse> out;
  if (requests.empty()) return out;
  out.reserve(requests.size());

  auto run_one = [this](const BatchRequest& req) {
    const auto start = SteadyClock::now();
    BatchResponse resp;
    resp.id = req.id.empty() ? req.name : req.id;
    resp.result = Execute(req.name, req.arguments.is_null() ? nlohmann::json::object() : req.arguments);
    resp.execution_time_ms = ElapsedMs(start);
    return resp;
  };

  if (!parallel) {
    for (const auto& req : requests) out.push_back(run_one(req));
    return out;
  }

  std::vector<std::future<BatchResponse>> pending;
  pending.reserve(requests.size());
  for (const auto& req : requests) {
    pending.push_back(std::async(std::launch::async, run_one, std::cref(req)));
  }
  for (auto& f : pending) out.push_back(f.get());
  return out;
}

void ToolRegistry::AddObserver(ToolRegistryObserver* observer) {
  if (!observer) return;
  std::lock_guard<std::mutex> lock(observers_mu_);
  if (std::find(observers_.begin(), observers_.end(), observer) == observers_.end()) observers_.push_back(observer);
}

void ToolRegistry::RemoveObserver(ToolRegistryObserver* observer) {
  std::lock_guard<std::mutex> lock(observers_mu_);
  observers_.erase(std::remove(observers_.begin(), observers_.end(), observer), observers_.end());
}

std::vector<ToolRegistryObserver*> ToolRegistry::SnapshotObservers() const {
  std::lock_guard<std::mutex> lock(observers_mu_);
  return observers_;
}

}  // namespace toolbridge
