#ifndef SYSLOG_TRANSPORT_HPP
#define SYSLOG_TRANSPORT_HPP

#include "base_transport.hpp"

class SyslogTransport : public INotificationTransport {
public:
  SyslogTransport();
  ~SyslogTransport() override;

  bool send(const std::string &text) override;
  const char *get_name() const override { return "SyslogTransport"; }
  std::string get_transport_type() const override { return "syslog"; }
};

#endif // SYSLOG_TRANSPORT_HPP
