#ifndef STDOUT_TRANSPORT_HPP
#define STDOUT_TRANSPORT_HPP

#include "base_transport.hpp"

#include <iostream>
#include <mutex>

class StdoutTransport : public INotificationTransport {
public:
  explicit StdoutTransport(std::ostream &out = std::cout) : out_(out) {}

  bool send(const std::string &text) override {
    std::lock_guard<std::mutex> lock(mutex_);
    out_ << "NOTIFICATION:\n" << text << "\n----------------------------------------"
         << std::endl;
    return out_.good();
  }
  const char *get_name() const override { return "StdoutTransport"; }
  std::string get_transport_type() const override { return "stdout"; }

private:
  std::ostream &out_;
  std::mutex mutex_;
};

#endif // STDOUT_TRANSPORT_HPP
