#include <gtest/gtest.h>

#include "tool_registry.hpp"

#include <atomic>
#include <chrono>
#include <future>
#include <mutex>
#include <stdexcept>
#include <string>
#include <thread>
#include <vector>

using namespace toolbridge;

namespace {

class RecordingObserver : public ToolRegistryObserver {
 public:
  void OnToolRegistered(const std::string& name) override {
    std::lock_guard<std::mutex> lock(mu);
    registered.push_back(name);
  }
  void OnToolExecuted(const std::string& name, double, bool is_error) override {
    std::lock_guard<std::mutex> lock(mu);
    executed.push_back(name);
    if (is_error) executed_with_error++;
  }
  void OnToolError(const std::string& name, const std::string& message) override {
    std::lock_guard<std::mutex> lock(mu);
    errors.push_back(name + ": " + message);
  }
  void OnCacheHit(const std::string& name) override {
    std::lock_guard<std::mutex> lock(mu);
    cache_hits.push_back(name);
  }

  std::mutex mu;
  std::vector<std::string> registered;
  std::vector<std::string> executed;
  std::vector<std::string> errors;
  std::vector<std::string> cache_hits;
  int executed_with_error = 0;
};

ToolSpec FreeSpec(const std::string& name, bool cacheable = true) {
  ToolSpec spec;
  spec.name = name;
  spec.description = name + " tool";
  spec.requires_main_thread = false;
  spec.cacheable = cacheable;
  return spec;
}

}  // namespace

class ToolRegistryTest : public ::testing::Test {
 protected:
  ToolRegistryTest() : executor(&queue), registry(&queue, &executor, &breaker, &cache) {
    executor.Start();
  }
  ~ToolRegistryTest() override { executor.Stop(); }

  DispatchQueue queue;
  CircuitBreaker breaker;
  ResponseCache cache;
  CooperativeExecutor executor;
  ToolRegistry registry;
};

TEST_F(ToolRegistryTest, RegistrationIsCaseInsensitiveAndOverwrites) {
  registry.RegisterTool(FreeSpec("Echo"), [](const nlohmann::json&) { return ToolCallResult::Text("v1"); });
  registry.RegisterTool(FreeSpec("echo"), [](const nlohmann::json&) { return ToolCallResult::Text("v2"); });

  EXPECT_EQ(registry.ToolCount(), 1u);
  EXPECT_TRUE(registry.HasTool("ECHO"));
  EXPECT_EQ(registry.Execute("eChO", {}).FirstText(), "v2");
}

TEST_F(ToolRegistryTest, DefaultsAreFilledIn) {
  registry.RegisterTool("plain", "no schema", [](const nlohmann::json&) { return ToolCallResult::Text("ok"); });
  auto info = registry.GetTool("plain");
  ASSERT_TRUE(info.has_value());
  EXPECT_EQ(info->spec.category, "general");
  EXPECT_EQ(info->spec.input_schema, DefaultInputSchema());
  EXPECT_TRUE(info->spec.requires_main_thread);
  EXPECT_TRUE(info->spec.cacheable);
}

TEST_F(ToolRegistryTest, UnknownToolIsAnErrorWithoutBreakerRecord) {
  auto result = registry.Execute("does_not_exist", nlohmann::json::object());
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.FirstText(), "Tool not found: does_not_exist");
  EXPECT_FALSE(breaker.HasRecord("does_not_exist"));
}

TEST_F(ToolRegistryTest, CacheableResultsAreServedFromCache) {
  std::atomic<int> calls{0};
  registry.RegisterTool(FreeSpec("echo"), [&](const nlohmann::json& args) {
    calls++;
    return ToolCallResult::Text(args.value("text", ""));
  });

  auto first = registry.Execute("echo", {{"text", "hi"}});
  auto second = registry.Execute("echo", {{"text", "hi"}});
  EXPECT_EQ(first, second);
  EXPECT_EQ(calls.load(), 1);

  registry.Execute("echo", {{"text", "other"}});
  EXPECT_EQ(calls.load(), 2);
}

TEST_F(ToolRegistryTest, CacheHitCountsAsBreakerSuccess) {
  std::atomic<int> calls{0};
  registry.RegisterTool(FreeSpec("lookup"), [&](const nlohmann::json&) {
    calls++;
    return ToolCallResult::Text("value");
  });
  ASSERT_EQ(registry.Execute("lookup", {{"key", "a"}}).FirstText(), "value");

  breaker.RecordFailure("lookup", "upstream hiccup");
  breaker.RecordFailure("lookup", "upstream hiccup");
  ASSERT_EQ(breaker.GetRecord("lookup")->failure_count, 2);

  EXPECT_EQ(registry.Execute("lookup", {{"key", "a"}}).FirstText(), "value");
  EXPECT_EQ(calls.load(), 1);
  EXPECT_EQ(breaker.GetRecord("lookup")->failure_count, 1);
}

TEST_F(ToolRegistryTest, NonCacheableToolsAlwaysRun) {
  std::atomic<int> calls{0};
  registry.RegisterTool(FreeSpec("counter", false), [&](const nlohmann::json&) {
    return ToolCallResult::Text(std::to_string(++calls));
  });
  EXPECT_EQ(registry.Execute("counter", {}).FirstText(), "1");
  EXPECT_EQ(registry.Execute("counter", {}).FirstText(), "2");
  EXPECT_EQ(cache.Size(), 0u);
}

TEST_F(ToolRegistryTest, ErrorResultsAreNotCachedAndCountAsFailures) {
  std::atomic<int> calls{0};
  registry.RegisterTool(FreeSpec("grumpy"), [&](const nlohmann::json&) {
    calls++;
    return ToolCallResult::Error("no");
  });

  EXPECT_TRUE(registry.Execute("grumpy", {}).is_error);
  EXPECT_TRUE(registry.Execute("grumpy", {}).is_error);
  EXPECT_EQ(calls.load(), 2);
  EXPECT_EQ(cache.Size(), 0u);

  auto rec = breaker.GetRecord("grumpy");
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->failure_count, 2);
  EXPECT_EQ(rec->last_error, "Tool returned error");
}

TEST_F(ToolRegistryTest, ThrowingHandlerBecomesErrorResult) {
  registry.RegisterTool(FreeSpec("explode"), [](const nlohmann::json&) -> ToolCallResult {
    throw std::runtime_error("boom");
  });
  auto result = registry.Execute("explode", {});
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.FirstText(), "Tool execution failed: boom");

  auto rec = breaker.GetRecord("explode");
  ASSERT_TRUE(rec.has_value());
  EXPECT_EQ(rec->last_error, "boom");
}

TEST_F(ToolRegistryTest, BreakerShortCircuitsAfterRepeatedFailures) {
  std::atomic<int> calls{0};
  registry.RegisterTool(FreeSpec("flaky"), [&](const nlohmann::json&) -> ToolCallResult {
    calls++;
    throw std::runtime_error("down");
  });
  for (int i = 0; i < 5; i++) registry.Execute("flaky", {});
  EXPECT_EQ(breaker.GetState("flaky"), CircuitState::kOpen);

  auto result = registry.Execute("flaky", {});
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.FirstText(),
            "Tool 'flaky' is temporarily unavailable (circuit Open). Please try again later.");
  EXPECT_EQ(calls.load(), 5);
}

TEST_F(ToolRegistryTest, AffineToolsRunOnTheExecutorThread) {
  ToolSpec spec = FreeSpec("affine", false);
  spec.requires_main_thread = true;
  registry.RegisterTool(spec, [&](const nlohmann::json&) {
    return ToolCallResult::Text(executor.IsExecutorThread() ? "executor" : "caller");
  });
  ToolSpec free_spec = FreeSpec("free", false);
  registry.RegisterTool(free_spec, [&](const nlohmann::json&) {
    return ToolCallResult::Text(executor.IsExecutorThread() ? "executor" : "caller");
  });

  EXPECT_EQ(registry.Execute("affine", {}, Priority::kHigh).FirstText(), "executor");
  EXPECT_EQ(registry.Execute("free", {}).FirstText(), "caller");
  EXPECT_GE(queue.GetStats().processed[0], 1u);
}

TEST_F(ToolRegistryTest, NestedAffineCallRunsInline) {
  ToolSpec inner = FreeSpec("inner", false);
  inner.requires_main_thread = true;
  registry.RegisterTool(inner, [&](const nlohmann::json&) {
    return ToolCallResult::Text(executor.IsExecutorThread() ? "inline" : "elsewhere");
  });
  ToolSpec outer = FreeSpec("outer", false);
  outer.requires_main_thread = true;
  registry.RegisterTool(outer, [&](const nlohmann::json&) {
    // Queuing here would wait on the thread that is running this handler.
    return registry.Execute("inner", {});
  });

  EXPECT_EQ(registry.Execute("outer", {}).FirstText(), "inline");
}

TEST_F(ToolRegistryTest, AsyncToolsResolveTheirFuture) {
  ToolSpec spec = FreeSpec("later", false);
  spec.requires_main_thread = true;
  registry.RegisterAsyncTool(spec, [](const nlohmann::json& args) {
    const int n = args.value("n", 0);
    return std::async(std::launch::async, [n] { return ToolCallResult::Text(std::to_string(n * 2)); });
  });
  EXPECT_EQ(registry.Execute("later", {{"n", 21}}).FirstText(), "42");
}

TEST_F(ToolRegistryTest, ObserversSeeEveryOutcome) {
  RecordingObserver obs;
  registry.AddObserver(&obs);
  registry.RegisterTool(FreeSpec("ok"), [](const nlohmann::json&) { return ToolCallResult::Text("fine"); });
  registry.RegisterTool(FreeSpec("bad"), [](const nlohmann::json&) -> ToolCallResult {
    throw std::runtime_error("nope");
  });

  registry.Execute("ok", {});
  registry.Execute("ok", {});
  registry.Execute("bad", {});
  registry.RemoveObserver(&obs);
  registry.Execute("ok", {{"x", 1}});

  EXPECT_EQ(obs.registered, (std::vector<std::string>{"ok", "bad"}));
  EXPECT_EQ(obs.executed, (std::vector<std::string>{"ok"}));
  EXPECT_EQ(obs.cache_hits, (std::vector<std::string>{"ok"}));
  EXPECT_EQ(obs.errors, (std::vector<std::string>{"bad: nope"}));
  EXPECT_EQ(obs.executed_with_error, 0);
}

TEST_F(ToolRegistryTest, StatsAndCategoryListing) {
  ToolSpec a = FreeSpec("alpha", false);
  a.category = "math";
  ToolSpec b = FreeSpec("beta", false);
  b.category = "text";
  ToolSpec c = FreeSpec("gamma", false);
  c.category = "math";
  for (const auto& s : {a, b, c}) {
    registry.RegisterTool(s, [](const nlohmann::json&) { return ToolCallResult::Text("x"); });
  }
  registry.Execute("gamma", {});
  registry.Execute("gamma", {});
  registry.Execute("alpha", {});

  auto math = registry.ListToolsByCategory("math");
  ASSERT_EQ(math.size(), 2u);
  EXPECT_EQ(math[0].name, "alpha");
  EXPECT_EQ(math[1].name, "gamma");
  EXPECT_EQ(registry.ListTools().size(), 3u);

  auto stats = registry.GetStats();
  EXPECT_EQ(stats["total_tools"], 3);
  EXPECT_EQ(stats["total_calls"], 3);
  EXPECT_EQ(stats["categories"]["math"], 2);
  ASSERT_EQ(stats["most_used"].size(), 2u);
  EXPECT_EQ(stats["most_used"][0]["name"], "gamma");
  EXPECT_EQ(stats["most_used"][0]["calls"], 2);
}

TEST_F(ToolRegistryTest, BatchKeepsOrderAndIsolatesFailures) {
  registry.RegisterTool(FreeSpec("echo"), [](const nlohmann::json& args) {
    return ToolCallResult::Text(args.value("text", ""));
  });
  registry.RegisterTool(FreeSpec("explode"), [](const nlohmann::json&) -> ToolCallResult {
    throw std::runtime_error("boom");
  });

  const std::vector<BatchRequest> requests = {
      {"echo", {{"text", "one"}}, "first"},
      {"explode", nlohmann::json::object(), ""},
      {"echo", {{"text", "three"}}, "third"},
  };
  for (bool parallel : {true, false}) {
    auto out = registry.ExecuteBatch(requests, parallel);
    ASSERT_EQ(out.size(), 3u);
    EXPECT_EQ(out[0].id, "first");
    EXPECT_EQ(out[0].result.FirstText(), "one");
    EXPECT_EQ(out[1].id, "explode");
    EXPECT_TRUE(out[1].result.is_error);
    EXPECT_EQ(out[2].id, "third");
    EXPECT_EQ(out[2].result.FirstText(), "three");
    EXPECT_TRUE(out[2].ToJson().contains("executionTimeMs"));
  }
  EXPECT_TRUE(registry.ExecuteBatch({}).empty());
}

TEST_F(ToolRegistryTest, UnregisterRemovesTool) {
  registry.RegisterTool(FreeSpec("gone"), [](const nlohmann::json&) { return ToolCallResult::Text("x"); });
  EXPECT_TRUE(registry.UnregisterTool("GONE"));
  EXPECT_FALSE(registry.UnregisterTool("gone"));
  EXPECT_TRUE(registry.Execute("gone", {}).is_error);
}

TEST(ToolRegistryTimeoutTest, AffineCallGivesUpWhenExecutorIsStalled) {
  DispatchQueue queue;
  CircuitBreaker breaker;
  CooperativeExecutor executor(&queue);  // never started
  ToolRegistryOptions options;
  options.affine_timeout = std::chrono::milliseconds(50);
  ToolRegistry registry(&queue, &executor, &breaker, nullptr, options);

  ToolSpec spec;
  spec.name = "stuck";
  registry.RegisterTool(spec, [](const nlohmann::json&) { return ToolCallResult::Text("late"); });

  auto result = registry.Execute("stuck", {});
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.FirstText(), "Tool 'stuck' timed out after 50ms");
  EXPECT_EQ(breaker.GetRecord("stuck")->failure_count, 1);

  // The queued work is not cancelled; it still runs on the next tick.
  EXPECT_EQ(queue.Count(), 1u);
  EXPECT_EQ(executor.Tick(), 1u);
}

TEST(ToolRegistryTimeoutTest, DiscardedWorkIsReported) {
  DispatchQueue queue;
  CooperativeExecutor executor(&queue);
  ToolRegistry registry(&queue, &executor, nullptr, nullptr);
  ToolSpec spec;
  spec.name = "dropped";
  registry.RegisterTool(spec, [](const nlohmann::json&) { return ToolCallResult::Text("never"); });
  executor.SetWakeHandler([&] { queue.Clear(); });

  auto result = registry.Execute("dropped", {});
  EXPECT_TRUE(result.is_error);
  EXPECT_EQ(result.FirstText(), "Tool execution failed: queued work was discarded before it ran");
}
