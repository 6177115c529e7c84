#include "metrics_registry.hpp"

#include <prometheus/text_serializer.h>

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()) {}

prometheus::Counter &
MetricsRegistry::create_counter(const std::string &name,
                                const std::string &help,
                                const std::map<std::string, std::string> &labels) {

  auto &counter_family =
      prometheus::BuildCounter().Name(name).Help(help).Register(*registry_);

  return counter_family.Add(labels);
}

prometheus::Gauge &
MetricsRegistry::create_gauge(const std::string &name, const std::string &help,
                              const std::map<std::string, std::string> &labels) {

  auto &gauge_family =
      prometheus::BuildGauge().Name(name).Help(help).Register(*registry_);

  return gauge_family.Add(labels);
}

std::string MetricsRegistry::serialize() const {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry_->Collect());
}

namespace Metrics {

void notification_sent(const std::string &kind) {
  MetricsRegistry::instance()
      .create_counter("hostwatch_notifications_total",
                      "Notifications decided by the evaluator, by kind.",
                      {{"kind", kind}})
      .Increment();
}

void notification_suppressed(const std::string &alert_type) {
  MetricsRegistry::instance()
      .create_counter("hostwatch_notifications_suppressed_total",
                      "Evaluations of an active alert that sent nothing.",
                      {{"type", alert_type}})
      .Increment();
}

void dispatch_succeeded(const std::string &transport) {
  MetricsRegistry::instance()
      .create_counter("hostwatch_dispatch_success_total",
                      "Messages accepted by a transport.",
                      {{"transport", transport}})
      .Increment();
}

void dispatch_failed(const std::string &transport) {
  MetricsRegistry::instance()
      .create_counter("hostwatch_dispatch_failures_total",
                      "Messages a transport failed to deliver.",
                      {{"transport", transport}})
      .Increment();
}

void persistence_failed() {
  MetricsRegistry::instance()
      .create_counter("hostwatch_persistence_failures_total",
                      "Alert record writes the store rejected.")
      .Increment();
}

void collector_failed(const std::string &resource) {
  MetricsRegistry::instance()
      .create_counter("hostwatch_collector_errors_total",
                      "Samples skipped because the reading failed.",
                      {{"resource", resource}})
      .Increment();
}

void set_active_alerts(size_t count) {
  MetricsRegistry::instance()
      .create_gauge("hostwatch_active_alerts",
                    "Alert records currently active.")
      .Set(static_cast<double>(count));
}

void cycle_completed() {
  MetricsRegistry::instance()
      .create_counter("hostwatch_cycles_total",
                      "Completed evaluation cycles.")
      .Increment();
}

} // namespace Metrics
