#include <gtest/gtest.h>

#include "health_monitor.hpp"

#include <optional>
#include <stdexcept>
#include <string>

using namespace toolbridge;

class HealthMonitorTest : public ::testing::Test {
 protected:
  HealthMonitorTest()
      : executor(&queue),
        registry(&queue, &executor, &breaker, &cache),
        monitor(&registry, &breaker, &queue, HealthConfig{}, [this] { return memory_mb; }) {
    registry.AddObserver(&monitor);
  }
  ~HealthMonitorTest() override { registry.RemoveObserver(&monitor); }

  void AddTool(const std::string& name) {
    ToolSpec spec;
    spec.name = name;
    spec.requires_main_thread = false;
    registry.RegisterTool(spec, [](const nlohmann::json&) { return ToolCallResult::Text("ok"); });
  }

  void Record(int ok, int failed) {
    for (int i = 0; i < ok; i++) monitor.OnToolExecuted("t", 2.0, false);
    for (int i = 0; i < failed; i++) monitor.OnToolExecuted("t", 2.0, true);
  }

  static const HealthCheckResult* FindCheck(const HealthReport& report, const std::string& component) {
    for (const auto& c : report.checks) {
      if (c.component == component) return &c;
    }
    return nullptr;
  }

  std::optional<int64_t> memory_mb = 100;
  DispatchQueue queue;
  CircuitBreaker breaker;
  ResponseCache cache;
  CooperativeExecutor executor;
  ToolRegistry registry;
  HealthMonitor monitor;
};

TEST_F(HealthMonitorTest, HealthyWhenIdle) {
  AddTool("echo");
  EXPECT_EQ(monitor.QuickStatus(), HealthStatus::kHealthy);

  auto report = monitor.FullReport();
  EXPECT_EQ(report.status, HealthStatus::kHealthy);
  ASSERT_EQ(report.checks.size(), 6u);
  EXPECT_EQ(report.checks[0].component, "ErrorRate");
  EXPECT_EQ(report.checks[1].component, "CircuitBreakers");
  EXPECT_EQ(report.checks[2].component, "Memory");
  EXPECT_EQ(report.checks[3].component, "ToolRegistry");
  EXPECT_EQ(report.checks[4].component, "ResponseCache");
  EXPECT_EQ(report.checks[5].component, "DispatchQueue");
  EXPECT_FALSE(report.last_request.has_value());
}

TEST_F(HealthMonitorTest, ErrorRateThresholds) {
  AddTool("echo");
  Record(9, 1);
  EXPECT_EQ(monitor.QuickStatus(), HealthStatus::kDegraded);
  auto report = monitor.FullReport();
  EXPECT_EQ(report.status, HealthStatus::kDegraded);
  EXPECT_EQ(report.checks[0].message, "Elevated error rate: 10.0%");

  Record(0, 2);  // 3 of 12
  EXPECT_EQ(monitor.QuickStatus(), HealthStatus::kUnhealthy);
  report = monitor.FullReport();
  EXPECT_EQ(report.status, HealthStatus::kUnhealthy);
  EXPECT_EQ(report.checks[0].status, HealthStatus::kUnhealthy);
}

TEST_F(HealthMonitorTest, LowErrorRateStaysHealthy) {
  AddTool("echo");
  Record(19, 1);
  EXPECT_EQ(monitor.QuickStatus(), HealthStatus::kHealthy);
  EXPECT_DOUBLE_EQ(monitor.Metrics().ErrorRate(), 0.05);
}

TEST_F(HealthMonitorTest, OpenCircuitsDegrade) {
  AddTool("echo");
  for (const char* tool : {"a", "b"}) {
    for (int i = 0; i < 5; i++) breaker.RecordFailure(tool, "down");
  }
  EXPECT_EQ(monitor.QuickStatus(), HealthStatus::kHealthy);
  EXPECT_EQ(FindCheck(monitor.FullReport(), "CircuitBreakers")->status, HealthStatus::kHealthy);

  for (int i = 0; i < 5; i++) breaker.RecordFailure("c", "down");
  EXPECT_EQ(monitor.QuickStatus(), HealthStatus::kDegraded);
  auto report = monitor.FullReport();
  const auto* check = FindCheck(report, "CircuitBreakers");
  ASSERT_NE(check, nullptr);
  EXPECT_EQ(check->status, HealthStatus::kDegraded);
  EXPECT_EQ(check->details["open_circuits"].size(), 3u);
  EXPECT_EQ(check->details["open"], 3);
}

TEST_F(HealthMonitorTest, MemoryThresholds) {
  AddTool("echo");
  memory_mb = 600;
  EXPECT_EQ(FindCheck(monitor.FullReport(), "Memory")->status, HealthStatus::kDegraded);
  memory_mb = 750;
  auto report = monitor.FullReport();
  EXPECT_EQ(FindCheck(report, "Memory")->status, HealthStatus::kUnhealthy);
  EXPECT_EQ(report.status, HealthStatus::kUnhealthy);
  memory_mb = std::nullopt;
  const auto* check = FindCheck(monitor.FullReport(), "Memory");
  EXPECT_EQ(check->status, HealthStatus::kHealthy);
  EXPECT_EQ(check->message, "Memory usage unavailable");
}

TEST_F(HealthMonitorTest, EmptyRegistryIsDegraded) {
  auto report = monitor.FullReport();
  const auto* check = FindCheck(report, "ToolRegistry");
  ASSERT_NE(check, nullptr);
  EXPECT_EQ(check->status, HealthStatus::kDegraded);
  EXPECT_EQ(check->message, "0 tools registered");
  EXPECT_EQ(report.status, HealthStatus::kDegraded);
}

TEST_F(HealthMonitorTest, MissingRegistryIsUnhealthy) {
  HealthMonitor bare(nullptr, nullptr, nullptr, HealthConfig{}, [] { return std::optional<int64_t>(1); });
  auto report = bare.FullReport();
  EXPECT_EQ(report.status, HealthStatus::kUnhealthy);
  EXPECT_EQ(report.checks[3].message, "Tool registry not available");
}

TEST_F(HealthMonitorTest, QueueBacklogDegrades) {
  AddTool("echo");
  for (int i = 0; i < 501; i++) queue.Enqueue([] {});
  const auto* check = FindCheck(monitor.FullReport(), "DispatchQueue");
  ASSERT_NE(check, nullptr);
  EXPECT_EQ(check->status, HealthStatus::kDegraded);
  EXPECT_EQ(check->details["total_pending"], 501);
}

TEST_F(HealthMonitorTest, CountsRegistryTrafficThroughObserver) {
  AddTool("echo");
  registry.Execute("echo", {{"text", "a"}});
  registry.Execute("echo", {{"text", "a"}});
  ToolSpec bad;
  bad.name = "bad";
  bad.requires_main_thread = false;
  registry.RegisterTool(bad, [](const nlohmann::json&) -> ToolCallResult { throw std::runtime_error("x"); });
  registry.Execute("bad", {});

  auto m = monitor.Metrics();
  EXPECT_EQ(m.total_requests, 3u);
  EXPECT_EQ(m.cache_hits, 1u);
  EXPECT_EQ(m.failed_requests, 1u);
  EXPECT_NEAR(m.CacheHitRate(), 1.0 / 3.0, 1e-9);
  EXPECT_TRUE(monitor.FullReport().last_request.has_value());
}

TEST_F(HealthMonitorTest, AverageExecutionExcludesCacheHits) {
  monitor.OnToolExecuted("t", 10.0, false);
  monitor.OnToolExecuted("t", 30.0, false);
  monitor.OnCacheHit("t");
  EXPECT_DOUBLE_EQ(monitor.Metrics().AverageExecutionMs(), 20.0);
}

TEST_F(HealthMonitorTest, ResetMetricsClearsCounters) {
  Record(1, 5);
  monitor.ResetMetrics();
  auto m = monitor.Metrics();
  EXPECT_EQ(m.total_requests, 0u);
  EXPECT_EQ(m.failed_requests, 0u);
  EXPECT_FALSE(monitor.FullReport().last_request.has_value());
}

TEST_F(HealthMonitorTest, ReportJsonShape) {
  AddTool("echo");
  Record(3, 1);
  auto j = monitor.FullReport().ToJson();
  EXPECT_EQ(j["status"], "Unhealthy");
  EXPECT_TRUE(j["uptime_seconds"].is_number());
  EXPECT_TRUE(j["last_request"].is_string());
  EXPECT_EQ(j["metrics"]["total_requests"], 4);
  EXPECT_DOUBLE_EQ(j["metrics"]["error_rate"].get<double>(), 0.25);
  ASSERT_EQ(j["checks"].size(), 6u);
  for (const auto& c : j["checks"]) {
    EXPECT_TRUE(c.contains("component"));
    EXPECT_TRUE(c.contains("status"));
    EXPECT_TRUE(c.contains("message"));
    EXPECT_TRUE(c.contains("details"));
    EXPECT_TRUE(c.contains("checkedAt"));
  }
}

TEST(CombineStatusesTest, WorstStatusWins) {
  HealthCheckResult healthy;
  HealthCheckResult degraded;
  degraded.status = HealthStatus::kDegraded;
  HealthCheckResult unhealthy;
  unhealthy.status = HealthStatus::kUnhealthy;

  EXPECT_EQ(CombineStatuses({}), HealthStatus::kHealthy);
  EXPECT_EQ(CombineStatuses({healthy, degraded}), HealthStatus::kDegraded);
  EXPECT_EQ(CombineStatuses({degraded, unhealthy, healthy}), HealthStatus::kUnhealthy);
  EXPECT_STREQ(HealthStatusName(HealthStatus::kDegraded), "Degraded");
}

TEST(ReadResidentMemoryTest, ReadsProcStatusOnLinux) {
  auto mb = ReadResidentMemoryMb();
  ASSERT_TRUE(mb.has_value());
  EXPECT_GE(*mb, 0);
}
