#include <gtest/gtest.h>

#include <memory>
#include <string>

#include "core/alert_evaluator.hpp"
#include "core/config.hpp"
#include "core/metrics_registry.hpp"
#include "httplib.h"
#include "io/state/memory_alert_store.hpp"
#include "io/web/web_server.hpp"
#include "nlohmann/json.hpp"

class WebServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    evaluator_.initialize();
    Config::AlertSettings settings;
    evaluator_.evaluate("cpu:host", true, 1000, settings,
                        MetricSnapshot{97.0, 90.0, "%"});
    evaluator_.evaluate("ram:host", false, 1000, settings);

    server_ = std::make_unique<WebServer>("127.0.0.1", 0,
                                          MetricsRegistry::instance(),
                                          evaluator_);
    server_->start();
    ASSERT_GT(server_->port(), 0);
    client_ = std::make_unique<httplib::Client>("127.0.0.1", server_->port());
  }

  void TearDown() override { server_->stop(); }

  MemoryAlertStore store_;
  AlertEvaluator evaluator_{store_};
  std::unique_ptr<WebServer> server_;
  std::unique_ptr<httplib::Client> client_;
};

TEST_F(WebServerTest, HealthEndpoint) {
  auto res = client_->Get("/health");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(nlohmann::json::parse(res->body)["status"], "ok");
}

TEST_F(WebServerTest, MetricsEndpointServesPrometheusText) {
  auto res = client_->Get("/metrics");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_NE(res->body.find("hostwatch_notifications_total"), std::string::npos);
}

TEST_F(WebServerTest, AlertsEndpointListsRecords) {
  auto res = client_->Get("/api/v1/alerts");
  ASSERT_TRUE(res);
  auto alerts = nlohmann::json::parse(res->body);
  ASSERT_TRUE(alerts.is_array());
  ASSERT_EQ(alerts.size(), 2u);
  EXPECT_EQ(alerts[0]["identity"], "cpu:host");
  EXPECT_TRUE(alerts[0]["active"].get<bool>());
  EXPECT_DOUBLE_EQ(alerts[0]["last_value"]["value"].get<double>(), 97.0);
  EXPECT_FALSE(alerts[1]["active"].get<bool>());
}

TEST_F(WebServerTest, ResetSingleAndUnknown) {
  auto unknown = client_->Post("/api/v1/alerts/reset?id=disk:/nope", "",
                               "application/json");
  ASSERT_TRUE(unknown);
  EXPECT_EQ(unknown->status, 404);

  auto res = client_->Post("/api/v1/alerts/reset?id=cpu:host", "",
                           "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(res->status, 200);
  EXPECT_EQ(evaluator_.active_count(), 0u);
}

TEST_F(WebServerTest, ResetAllWithoutId) {
  auto res = client_->Post("/api/v1/alerts/reset", "", "application/json");
  ASSERT_TRUE(res);
  EXPECT_EQ(nlohmann::json::parse(res->body)["reset"], 1);
  EXPECT_EQ(evaluator_.active_count(), 0u);
}
