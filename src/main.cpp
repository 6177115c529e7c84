#include "core/alert_evaluator.hpp"
#include "core/config.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "core/notification_dispatcher.hpp"
#include "core/scheduler.hpp"
#include "io/state/base_alert_store.hpp"
#include "io/state/json_file_alert_store.hpp"
#include "io/state/memory_alert_store.hpp"
#include "io/web/web_server.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <iostream>
#include <memory>
#include <string>
#include <thread>

// Global atomic flags for signal handling
std::atomic<bool> g_shutdown_requested = false;
std::atomic<bool> g_reload_config_requested = false;
std::atomic<bool> g_reset_alerts_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM) {
    g_shutdown_requested = true;
  } else if (signum == SIGHUP) {
    g_reload_config_requested = true;
  } else if (signum == SIGUSR1) {
    g_reset_alerts_requested = true;
  }
}

namespace {

constexpr const char *DEFAULT_CONFIG_PATH = "config/hostwatch.ini";

void print_usage(const char *program) {
  std::cout << "Usage: " << program << " [config.ini]\n"
            << "       " << program << " --test-message [config.ini]\n";
}

std::unique_ptr<IAlertStore> make_alert_store(const Config::AppConfig &config) {
  if (config.state_file_path.empty()) {
    LOG(LogLevel::WARN, LogComponent::STATE_PERSIST,
        "state_file_path is empty; alert state will not survive a restart");
    return std::make_unique<MemoryAlertStore>();
  }
  return std::make_unique<JsonFileAlertStore>(config.state_file_path);
}

int send_test_message(const Config::AppConfig &config) {
  NotificationDispatcher dispatcher;
  dispatcher.reconfigure(config);
  if (dispatcher.transport_count() == 0) {
    std::cerr << "No notification transport is configured." << std::endl;
    return 1;
  }

  std::string hostname =
      config.hostname.empty() ? Utils::get_hostname() : config.hostname;
  bool delivered = dispatcher.send_text("🧪 *Test message* from hostwatch on " +
                                        hostname);
  std::cout << (delivered ? "Test message delivered."
                          : "Test message could not be delivered.")
            << std::endl;
  return delivered ? 0 : 1;
}

} // namespace

int main(int argc, char *argv[]) {
  bool test_message_mode = false;
  std::string config_file_to_load = DEFAULT_CONFIG_PATH;
  for (int i = 1; i < argc; ++i) {
    std::string arg = argv[i];
    if (arg == "--test-message") {
      test_message_mode = true;
    } else if (arg == "-h" || arg == "--help") {
      print_usage(argv[0]);
      return 0;
    } else {
      config_file_to_load = arg;
    }
  }

  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;

  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);
  sigaction(SIGHUP, &action, NULL);
  sigaction(SIGUSR1, &action, NULL);

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  if (!config_manager.load_configuration(config_file_to_load))
    LOG(LogLevel::WARN, LogComponent::CONFIG,
        "Could not load " << config_file_to_load
                          << ", continuing with built-in defaults");

  auto current_config = config_manager.get_config();
  LogManager::instance().configure(current_config->logging);

  if (test_message_mode)
    return send_test_message(*current_config);

  // --- Initialize Core Components ---
  std::unique_ptr<IAlertStore> store = make_alert_store(*current_config);
  AlertEvaluator evaluator(*store);
  evaluator.initialize();

  NotificationDispatcher dispatcher;
  MonitorScheduler scheduler(config_manager, evaluator, dispatcher);
  scheduler.apply_config(*current_config);
  dispatcher.start();

  // --- Web Server Initialization ---
  std::unique_ptr<WebServer> web_server;
  if (current_config->web_server.enabled) {
    web_server = std::make_unique<WebServer>(
        current_config->web_server.host, current_config->web_server.port,
        MetricsRegistry::instance(), evaluator);
    web_server->start();
  }

  scheduler.start();
  LOG(LogLevel::INFO, LogComponent::CORE,
      "hostwatch started, polling every "
          << current_config->poll_interval_seconds << "s");

  while (!g_shutdown_requested) {
    if (g_reload_config_requested.exchange(false)) {
      LOG(LogLevel::INFO, LogComponent::CORE,
          "SIGHUP detected. Reloading configuration from "
              << config_file_to_load << "...");
      scheduler.request_reload();
    }

    if (g_reset_alerts_requested.exchange(false)) {
      LOG(LogLevel::WARN, LogComponent::CORE,
          "SIGUSR1 detected. Resetting all active alerts...");
      size_t count = evaluator.reset_all();
      Metrics::set_active_alerts(evaluator.active_count());
      LOG(LogLevel::INFO, LogComponent::CORE, count << " alerts reset");
    }

    std::this_thread::sleep_for(std::chrono::milliseconds(200));
  }

  LOG(LogLevel::INFO, LogComponent::CORE, "Shutdown requested, stopping...");
  scheduler.stop();
  if (web_server)
    web_server->stop();
  dispatcher.stop();

  LOG(LogLevel::INFO, LogComponent::CORE, "hostwatch finished.");
  return 0;
}
