#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include <map>
#include <memory>
#include <prometheus/counter.h>
#include <prometheus/gauge.h>
#include <prometheus/registry.h>
#include <string>

class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  // Families are merged by name, so repeated calls return the same series.
  prometheus::Counter &
  create_counter(const std::string &name, const std::string &help,
                 const std::map<std::string, std::string> &labels = {});

  prometheus::Gauge &
  create_gauge(const std::string &name, const std::string &help,
               const std::map<std::string, std::string> &labels = {});

  // Prometheus text exposition format
  std::string serialize() const;

private:
  MetricsRegistry();
  ~MetricsRegistry() = default;

  std::shared_ptr<prometheus::Registry> registry_;
};

namespace Metrics {
void notification_sent(const std::string &kind);
void notification_suppressed(const std::string &alert_type);
void dispatch_succeeded(const std::string &transport);
void dispatch_failed(const std::string &transport);
void persistence_failed();
void collector_failed(const std::string &resource);
void set_active_alerts(size_t count);
void cycle_completed();
} // namespace Metrics

#endif // METRICS_REGISTRY_HPP
