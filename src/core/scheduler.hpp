#ifndef SCHEDULER_HPP
#define SCHEDULER_HPP

#include "alert_evaluator.hpp"
#include "config.hpp"
#include "io/collectors/base_collector.hpp"
#include "io/collectors/reboot_detector.hpp"
#include "io/log_readers/auth_log_watcher.hpp"
#include "notification_dispatcher.hpp"

#include <atomic>
#include <condition_variable>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

enum class ThresholdDirection {
  ABOVE, // Problem when value >= threshold
  BELOW  // Problem when value < threshold
};

// One monitored condition: a collector bound to an alert identity and the
// threshold its readings are compared against.
struct MonitoredResource {
  std::string identity;
  double threshold = 0.0;
  ThresholdDirection direction = ThresholdDirection::ABOVE;
  std::unique_ptr<IMetricCollector> collector;

  bool is_problem(double value) const;
};

std::vector<MonitoredResource>
build_monitored_resources(const Config::AppConfig &config);

struct CycleSummary {
  size_t evaluated = 0;
  size_t skipped = 0;
  size_t notifications = 0;
  size_t persistence_failures = 0;
};

class MonitorScheduler {
public:
  MonitorScheduler(Config::ConfigManager &config_manager,
                   AlertEvaluator &evaluator,
                   NotificationDispatcher &dispatcher);
  ~MonitorScheduler();

  // Rebuilds resources, watchers, transports and log levels from config.
  void apply_config(const Config::AppConfig &config);

  void set_resources(std::vector<MonitoredResource> resources);
  void set_auth_log_watcher(std::unique_ptr<AuthLogWatcher> watcher);
  void set_reboot_detector(std::unique_ptr<RebootDetector> detector);

  CycleSummary run_cycle(uint64_t now_ms);

  // Blocking loop; returns after request_stop().
  void run();
  void start();
  void stop();
  void request_stop();
  void request_reload();

private:
  void check_ssh_logins(const Config::AppConfig &config, uint64_t now_ms);
  void check_reboot(const Config::AppConfig &config, uint64_t now_ms);
  void deliver(const Notification &notification);
  std::string local_hostname(const Config::AppConfig &config) const;
  std::string local_address(const Config::AppConfig &config) const;

  static constexpr const char *IP_INFO_URL = "https://ipinfo.io/";

  Config::ConfigManager &config_manager_;
  AlertEvaluator &evaluator_;
  NotificationDispatcher &dispatcher_;

  std::vector<MonitoredResource> resources_;
  std::unique_ptr<AuthLogWatcher> auth_log_watcher_;
  std::unique_ptr<RebootDetector> reboot_detector_;

  std::thread scheduler_thread_;
  std::mutex wait_mutex_;
  std::condition_variable wait_cv_;
  std::atomic<bool> stop_requested_{false};
  std::atomic<bool> reload_requested_{false};
};

#endif // SCHEDULER_HPP
