#include "web_server.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"

#include "nlohmann/json.hpp"

WebServer::WebServer(const std::string &host, int port,
                     MetricsRegistry &metrics_registry,
                     AlertEvaluator &evaluator)
    : host_(host), port_(port), metrics_registry_(metrics_registry),
      evaluator_(evaluator) {
  server_ = std::make_unique<httplib::Server>();

  server_->Get("/health", [](const httplib::Request &, httplib::Response &res) {
    res.set_content(R"({"status":"ok"})", "application/json");
  });

  server_->Get("/metrics", [this](const httplib::Request &req,
                                  httplib::Response &res) {
    LOG(LogLevel::DEBUG, LogComponent::IO_WEB,
        "WebServer: Received request for /metrics from " << req.remote_addr);
    res.set_content(metrics_registry_.serialize(),
                    "text/plain; version=0.0.4");
  });

  server_->Get("/api/v1/alerts",
               [this](const httplib::Request &, httplib::Response &res) {
                 nlohmann::json j =
                     JsonFormatter::records_to_json_array(evaluator_.snapshot());
                 res.set_content(j.dump(2), "application/json");
               });

  server_->Post("/api/v1/alerts/reset", [this](const httplib::Request &req,
                                               httplib::Response &res) {
    nlohmann::json j;
    if (req.has_param("id")) {
      std::string identity = req.get_param_value("id");
      if (!evaluator_.reset(identity)) {
        res.status = 404;
        j["error"] = "unknown alert identity";
        j["identity"] = identity;
        res.set_content(j.dump(), "application/json");
        return;
      }
      j["reset"] = 1;
      j["identity"] = identity;
    } else {
      j["reset"] = evaluator_.reset_all();
    }
    LOG(LogLevel::INFO, LogComponent::IO_WEB,
        "WebServer: alert reset requested by " << req.remote_addr);
    res.set_content(j.dump(), "application/json");
  });

  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server initialized for " << host_ << ":" << port_);
}

WebServer::~WebServer() { stop(); }

void WebServer::start() {
  if (server_thread_.joinable())
    return; // Already running

  if (port_ == 0) {
    int port = server_->bind_to_any_port(host_.c_str());
    if (port < 0) {
      LOG(LogLevel::ERROR, LogComponent::IO_WEB,
          "Web server failed to bind " << host_);
      return;
    }
    bound_port_ = port;
  } else if (!server_->bind_to_port(host_.c_str(), port_)) {
    LOG(LogLevel::ERROR, LogComponent::IO_WEB,
        "Web server failed to bind " << host_ << ":" << port_);
    return;
  } else {
    bound_port_ = port_;
  }

  server_thread_ = std::thread(&WebServer::run, this);
  server_->wait_until_ready();
}

void WebServer::stop() {
  if (server_)
    server_->stop();
  if (server_thread_.joinable()) {
    server_thread_.join();
    LOG(LogLevel::INFO, LogComponent::IO_WEB, "Web server stopped");
  }
}

void WebServer::run() {
  LOG(LogLevel::INFO, LogComponent::IO_WEB,
      "Web server listening on " << host_ << ":" << bound_port_);
  if (!server_->listen_after_bind()) {
    LOG(LogLevel::ERROR, LogComponent::IO_WEB,
        "Web server on " << host_ << ":" << bound_port_
                         << " stopped listening unexpectedly");
  }
}
