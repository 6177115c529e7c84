#include "scheduler.hpp"
#include "io/collectors/cpu_collector.hpp"
#include "io/collectors/disk_collector.hpp"
#include "io/collectors/internet_collector.hpp"
#include "io/collectors/memory_collector.hpp"
#include "io/collectors/temperature_collector.hpp"
#include "logger.hpp"
#include "metrics_registry.hpp"
#include "utils/utils.hpp"

#include <chrono>
#include <exception>
#include <sstream>

bool MonitoredResource::is_problem(double value) const {
  if (direction == ThresholdDirection::BELOW)
    return value < threshold;
  return value >= threshold;
}

std::vector<MonitoredResource>
build_monitored_resources(const Config::AppConfig &config) {
  std::vector<MonitoredResource> resources;

  if (config.cpu.enabled)
    resources.push_back({make_identity(Config::AlertTypes::CPU, "host"),
                         config.cpu.threshold_percent, ThresholdDirection::ABOVE,
                         std::make_unique<CpuCollector>(config.proc_root)});

  if (config.memory.enabled)
    resources.push_back({make_identity(Config::AlertTypes::RAM, "host"),
                         config.memory.threshold_percent,
                         ThresholdDirection::ABOVE,
                         std::make_unique<MemoryCollector>(config.proc_root)});

  if (config.disk.enabled)
    for (const auto &mp : config.disk.mount_points)
      resources.push_back({make_identity(Config::AlertTypes::DISK, mp.path),
                           mp.threshold_percent, ThresholdDirection::ABOVE,
                           std::make_unique<DiskCollector>(mp.path)});

  if (config.temperature.enabled)
    resources.push_back(
        {make_identity(Config::AlertTypes::TEMPERATURE, "host"),
         config.temperature.threshold_celsius, ThresholdDirection::ABOVE,
         std::make_unique<TemperatureCollector>(config.sys_root)});

  if (config.internet.enabled)
    resources.push_back(
        {make_identity(Config::AlertTypes::INTERNET, "connection"), 1.0,
         ThresholdDirection::BELOW,
         std::make_unique<InternetCollector>(config.internet)});

  return resources;
}

MonitorScheduler::MonitorScheduler(Config::ConfigManager &config_manager,
                                   AlertEvaluator &evaluator,
                                   NotificationDispatcher &dispatcher)
    : config_manager_(config_manager), evaluator_(evaluator),
      dispatcher_(dispatcher) {}

MonitorScheduler::~MonitorScheduler() { stop(); }

void MonitorScheduler::apply_config(const Config::AppConfig &config) {
  LogManager::instance().configure(config.logging);
  dispatcher_.reconfigure(config);

  set_resources(build_monitored_resources(config));

  if (config.ssh.enabled)
    set_auth_log_watcher(std::make_unique<AuthLogWatcher>(config.ssh));
  else
    set_auth_log_watcher(nullptr);

  if (config.reboot.enabled)
    set_reboot_detector(std::make_unique<RebootDetector>(
        config.proc_root, config.reboot.uptime_state_file));
  else
    set_reboot_detector(nullptr);

  LOG(LogLevel::INFO, LogComponent::SCHEDULER,
      "Scheduler configured with " << resources_.size()
                                   << " monitored resources, polling every "
                                   << config.poll_interval_seconds << "s");
}

void MonitorScheduler::set_resources(std::vector<MonitoredResource> resources) {
  resources_ = std::move(resources);
}

void MonitorScheduler::set_auth_log_watcher(
    std::unique_ptr<AuthLogWatcher> watcher) {
  auth_log_watcher_ = std::move(watcher);
}

void MonitorScheduler::set_reboot_detector(
    std::unique_ptr<RebootDetector> detector) {
  reboot_detector_ = std::move(detector);
}

std::string
MonitorScheduler::local_hostname(const Config::AppConfig &config) const {
  return config.hostname.empty() ? Utils::get_hostname() : config.hostname;
}

std::string
MonitorScheduler::local_address(const Config::AppConfig &config) const {
  return config.local_address.empty() ? Utils::get_local_ip()
                                      : config.local_address;
}

void MonitorScheduler::deliver(const Notification &notification) {
  if (notification.kind == NotificationKind::NONE)
    return;
  // Without a running worker (tests, --test-message) deliver inline
  if (dispatcher_.is_running())
    dispatcher_.enqueue(notification);
  else
    dispatcher_.dispatch(notification);
}

void MonitorScheduler::check_ssh_logins(const Config::AppConfig &config,
                                        uint64_t now_ms) {
  if (!auth_log_watcher_)
    return;

  const Config::AlertSettings settings =
      config.settings_for(Config::AlertTypes::SSH);
  for (const auto &login : auth_log_watcher_->poll()) {
    std::ostringstream text;
    text << "*SSH connection detected*\n"
         << "Connection from *" << login.source_ip << "* as *" << login.user
         << "* on *" << login.host << "* (" << local_address(config) << ")\n"
         << "Date: " << login.timestamp << "\n"
         << "More information: " << IP_INFO_URL << login.source_ip;

    deliver(evaluator_.notify_event(
        Config::AlertTypes::SSH,
        make_identity(Config::AlertTypes::SSH, login.source_ip), text.str(),
        now_ms, settings));
  }
}

void MonitorScheduler::check_reboot(const Config::AppConfig &config,
                                    uint64_t now_ms) {
  if (!reboot_detector_)
    return;

  std::optional<double> uptime;
  try {
    uptime = reboot_detector_->check();
  } catch (const TransientReadError &e) {
    LOG(LogLevel::WARN, LogComponent::SCHEDULER,
        "Reboot check skipped: " << e.what());
    Metrics::collector_failed(Config::AlertTypes::REBOOT);
    return;
  }
  if (!uptime)
    return;

  std::ostringstream text;
  text << "🔄 *Server rebooted*\n\n"
       << "Hostname: *" << local_hostname(config) << "* ("
       << local_address(config) << ")\n"
       << "Current uptime: "
       << Utils::format_duration(static_cast<uint64_t>(*uptime * 1000.0));

  deliver(evaluator_.notify_event(
      Config::AlertTypes::REBOOT,
      make_identity(Config::AlertTypes::REBOOT, "host"), text.str(), now_ms,
      config.settings_for(Config::AlertTypes::REBOOT)));
}

CycleSummary MonitorScheduler::run_cycle(uint64_t now_ms) {
  CycleSummary summary;

  bool reloaded = reload_requested_.exchange(false)
                      ? config_manager_.reload()
                      : config_manager_.reload_if_changed();
  if (reloaded)
    apply_config(*config_manager_.get_config());

  // Settings are read once per cycle so a reload takes effect as a whole
  std::shared_ptr<const Config::AppConfig> config = config_manager_.get_config();

  check_ssh_logins(*config, now_ms);
  check_reboot(*config, now_ms);

  for (auto &resource : resources_) {
    double value = 0.0;
    try {
      value = resource.collector->sample();
    } catch (const TransientReadError &e) {
      LOG(LogLevel::WARN, LogComponent::SCHEDULER,
          "No reading for " << resource.identity << " this cycle: "
                            << e.what());
      Metrics::collector_failed(resource.collector->resource());
      summary.skipped++;
      continue;
    }

    MetricSnapshot snapshot{value, resource.threshold,
                            resource.collector->unit()};
    bool problem = resource.is_problem(value);
    LOG(LogLevel::DEBUG, LogComponent::SCHEDULER,
        resource.identity << " = " << value << snapshot.unit
                          << (problem ? " (problem)" : ""));

    try {
      EvaluationResult result = evaluator_.evaluate(
          resource.identity, problem, now_ms,
          config->settings_for(alert_type_of(resource.identity)), snapshot);
      summary.evaluated++;
      if (!result.persisted)
        summary.persistence_failures++;
      if (result.should_notify()) {
        summary.notifications++;
        deliver(result.notification);
      }
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::SCHEDULER,
          "Evaluation of " << resource.identity << " failed: " << e.what());
      summary.skipped++;
    }
  }

  Metrics::set_active_alerts(evaluator_.active_count());
  Metrics::cycle_completed();

  LOG(LogLevel::DEBUG, LogComponent::SCHEDULER,
      "Cycle done: " << summary.evaluated << " evaluated, " << summary.skipped
                     << " skipped, " << summary.notifications
                     << " notifications");
  return summary;
}

void MonitorScheduler::run() {
  LOG(LogLevel::INFO, LogComponent::SCHEDULER, "Scheduler loop started");

  while (!stop_requested_) {
    run_cycle(Utils::get_current_time_ms());

    uint64_t interval = config_manager_.get_config()->poll_interval_seconds;
    std::unique_lock<std::mutex> lock(wait_mutex_);
    wait_cv_.wait_for(lock, std::chrono::seconds(interval), [this] {
      return stop_requested_.load() || reload_requested_.load();
    });
  }

  LOG(LogLevel::INFO, LogComponent::SCHEDULER, "Scheduler loop stopped");
}

void MonitorScheduler::start() {
  if (scheduler_thread_.joinable())
    return; // Already running
  stop_requested_ = false;
  scheduler_thread_ = std::thread(&MonitorScheduler::run, this);
}

void MonitorScheduler::stop() {
  request_stop();
  if (scheduler_thread_.joinable())
    scheduler_thread_.join();
}

void MonitorScheduler::request_stop() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    stop_requested_ = true;
  }
  wait_cv_.notify_all();
}

void MonitorScheduler::request_reload() {
  {
    std::lock_guard<std::mutex> lock(wait_mutex_);
    reload_requested_ = true;
  }
  wait_cv_.notify_all();
}
