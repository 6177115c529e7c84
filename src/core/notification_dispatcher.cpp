#include "notification_dispatcher.hpp"
#include "config.hpp"
#include "io/transport/file_transport.hpp"
#include "io/transport/stdout_transport.hpp"
#include "io/transport/syslog_transport.hpp"
#include "io/transport/telegram_transport.hpp"
#include "logger.hpp"
#include "metrics_registry.hpp"
#include "utils/utils.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>
#include <stdexcept>

std::string alert_title(const std::string &identity) {
  const std::string type = alert_type_of(identity);
  const std::string instance = alert_instance_of(identity);

  if (type == Config::AlertTypes::CPU)
    return "CPU";
  if (type == Config::AlertTypes::RAM)
    return "RAM";
  if (type == Config::AlertTypes::DISK)
    return instance.empty() ? "Disk" : "Disk " + instance;
  if (type == Config::AlertTypes::TEMPERATURE)
    return "Temperature";
  if (type == Config::AlertTypes::INTERNET)
    return "Internet connection";

  std::string title = type;
  if (!title.empty())
    title[0] = static_cast<char>(std::toupper(static_cast<unsigned char>(title[0])));
  return title;
}

NotificationDispatcher::NotificationDispatcher()
    : hostname_(Utils::get_hostname()) {}

NotificationDispatcher::~NotificationDispatcher() { stop(); }

void NotificationDispatcher::start() {
  if (running_.exchange(true))
    return;
  dispatcher_thread_ =
      std::thread(&NotificationDispatcher::dispatcher_loop, this);
}

void NotificationDispatcher::stop() {
  queue_.shutdown();
  if (dispatcher_thread_.joinable())
    dispatcher_thread_.join();
  running_ = false;
}

void NotificationDispatcher::reconfigure(const Config::AppConfig &config) {
  std::vector<std::shared_ptr<INotificationTransport>> transports;

  if (config.telegram.enabled) {
    try {
      transports.push_back(std::make_unique<TelegramTransport>(config.telegram));
      LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
          "TelegramTransport enabled for chat " << config.telegram.chat_id);
    } catch (const std::runtime_error &e) {
      LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
          "TelegramTransport disabled: " << e.what());
    }
  }

  if (config.alerting.file_enabled && !config.alerting.file_path.empty()) {
    transports.push_back(
        std::make_unique<FileTransport>(config.alerting.file_path));
    LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
        "FileTransport enabled, writing to " << config.alerting.file_path);
  }

  if (config.alerting.syslog_enabled) {
    transports.push_back(std::make_unique<SyslogTransport>());
    LOG(LogLevel::INFO, LogComponent::IO_DISPATCH, "SyslogTransport enabled");
  }

  if (config.alerts_to_stdout)
    transports.push_back(std::make_unique<StdoutTransport>());

  std::lock_guard<std::mutex> lock(transports_mutex_);
  transports_ = std::move(transports);
  hostname_ =
      config.hostname.empty() ? Utils::get_hostname() : config.hostname;

  LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
      "Dispatcher reconfigured. Active transports: " << transports_.size());
}

void NotificationDispatcher::add_transport(
    std::unique_ptr<INotificationTransport> transport) {
  std::lock_guard<std::mutex> lock(transports_mutex_);
  transports_.push_back(std::move(transport));
}

void NotificationDispatcher::set_hostname(const std::string &hostname) {
  std::lock_guard<std::mutex> lock(transports_mutex_);
  hostname_ = hostname;
}

size_t NotificationDispatcher::transport_count() const {
  std::lock_guard<std::mutex> lock(transports_mutex_);
  return transports_.size();
}

std::string
NotificationDispatcher::render_initial(const Notification &notification) const {
  std::ostringstream oss;
  oss << "⚠️ *" << alert_title(notification.identity) << " alert* on "
      << hostname_;

  if (notification.snapshot) {
    const MetricSnapshot &snap = *notification.snapshot;
    oss << std::fixed << std::setprecision(1);
    if (notification.alert_type == Config::AlertTypes::INTERNET)
      oss << "\nNo configured host answered";
    else
      oss << "\nCurrent: " << snap.value << snap.unit
          << " (threshold: " << snap.threshold << snap.unit << ")";
  }
  return oss.str();
}

std::string NotificationDispatcher::render(const Notification &notification) const {
  std::lock_guard<std::mutex> lock(transports_mutex_);
  switch (notification.kind) {
  case NotificationKind::INITIAL:
    return render_initial(notification);
  case NotificationKind::REMINDER:
    return "🔄 REMINDER (" + std::to_string(notification.reminder_count) +
           ") - " + render_initial(notification);
  case NotificationKind::RECOVERY:
    return "✅ RESOLVED - " + alert_title(notification.identity) + " on " +
           hostname_ +
           " (duration: " + Utils::format_duration(notification.duration_ms) +
           ")";
  case NotificationKind::EVENT:
    return notification.text;
  case NotificationKind::NONE:
  default:
    return "";
  }
}

void NotificationDispatcher::enqueue(const Notification &notification) {
  if (notification.kind == NotificationKind::NONE)
    return;
  queue_.push(notification);
}

bool NotificationDispatcher::send_text(const std::string &text) {
  std::vector<std::shared_ptr<INotificationTransport>> transports;
  {
    std::lock_guard<std::mutex> lock(transports_mutex_);
    transports = transports_;
  }

  if (transports.empty()) {
    LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
        "No transport configured, message dropped");
    return false;
  }

  bool any_success = false;
  for (const auto &transport : transports) {
    const std::string transport_type = transport->get_transport_type();
    if (transport->send(text)) {
      any_success = true;
      Metrics::dispatch_succeeded(transport_type);
    } else {
      LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
          transport->get_name() << " failed to deliver message");
      Metrics::dispatch_failed(transport_type);
    }
  }
  return any_success;
}

bool NotificationDispatcher::dispatch(const Notification &notification) {
  if (notification.kind == NotificationKind::NONE)
    return true;

  const std::string text = render(notification);
  LOG(LogLevel::DEBUG, LogComponent::IO_DISPATCH,
      "Dispatching " << notification_kind_to_string(notification.kind)
                     << " for " << notification.identity);

  bool delivered = send_text(text);
  if (!delivered)
    LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
        notification_kind_to_string(notification.kind)
            << " notification for " << notification.identity
            << " was not delivered");
  return delivered;
}

void NotificationDispatcher::dispatcher_loop() {
  while (true) {
    std::optional<Notification> notification = queue_.wait_and_pop();
    if (!notification)
      break;
    dispatch(*notification);
  }
  LOG(LogLevel::DEBUG, LogComponent::IO_DISPATCH, "Dispatcher worker exited");
}
