#ifndef WEB_SERVER_HPP
#define WEB_SERVER_HPP

#include "core/alert_evaluator.hpp"
#include "core/metrics_registry.hpp"
#include "httplib.h"

#include <atomic>
#include <memory>
#include <string>
#include <thread>

// Read-only admin surface plus the operator reset endpoint:
//   GET  /health
//   GET  /metrics
//   GET  /api/v1/alerts
//   POST /api/v1/alerts/reset[?id=<identity>]
class WebServer {
public:
  WebServer(const std::string &host, int port,
            MetricsRegistry &metrics_registry, AlertEvaluator &evaluator);
  ~WebServer();

  void start();
  void stop();

  // Port actually bound; differs from the configured one when it was 0.
  int port() const { return bound_port_; }

private:
  void run();

  std::unique_ptr<httplib::Server> server_;
  std::thread server_thread_;
  std::string host_;
  int port_;
  std::atomic<int> bound_port_{0};
  MetricsRegistry &metrics_registry_;
  AlertEvaluator &evaluator_;
};

#endif // WEB_SERVER_HPP
