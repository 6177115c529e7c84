#ifndef NOTIFICATION_DISPATCHER_HPP
#define NOTIFICATION_DISPATCHER_HPP

#include "alert.hpp"
#include "io/transport/base_transport.hpp"
#include "utils/thread_safe_queue.hpp"

#include <atomic>
#include <cstddef>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace Config {
struct AppConfig;
}

// Renders notifications and fans them out to every configured transport.
// enqueue() hands the notification to a worker thread so the caller never
// waits on the network; dispatch() is the synchronous path the worker uses.
class NotificationDispatcher {
public:
  NotificationDispatcher();
  ~NotificationDispatcher();

  void start();
  void stop();
  bool is_running() const { return running_; }

  // Rebuilds the transport list from the configuration.
  void reconfigure(const Config::AppConfig &config);
  void add_transport(std::unique_ptr<INotificationTransport> transport);
  void set_hostname(const std::string &hostname);
  size_t transport_count() const;

  void enqueue(const Notification &notification);
  // True when at least one transport accepted the message.
  bool dispatch(const Notification &notification);
  // Sends raw text, bypassing the evaluator (used for test messages).
  bool send_text(const std::string &text);

  std::string render(const Notification &notification) const;

private:
  void dispatcher_loop();
  std::string render_initial(const Notification &notification) const;

  // Guards the list only; sends run on a copy so reconfigure() never waits
  // on a slow transport.
  mutable std::mutex transports_mutex_;
  std::vector<std::shared_ptr<INotificationTransport>> transports_;
  std::string hostname_;

  ThreadSafeQueue<Notification> queue_;
  std::thread dispatcher_thread_;
  std::atomic<bool> running_{false};
};

// Human title of an alert, e.g. "CPU", "Disk /data", "Internet connection".
std::string alert_title(const std::string &identity);

#endif // NOTIFICATION_DISPATCHER_HPP
