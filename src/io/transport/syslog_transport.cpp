#include "syslog_transport.hpp"
#include "core/logger.hpp"

#include <syslog.h>

SyslogTransport::SyslogTransport() {
  openlog("hostwatch", LOG_PID | LOG_CONS, LOG_USER);
}

SyslogTransport::~SyslogTransport() { closelog(); }

bool SyslogTransport::send(const std::string &text) {
  LOG(LogLevel::TRACE, LogComponent::IO_TRANSPORT,
      "Sending notification to syslog: " << text);
  // LOG_WARNING is a standard syslog level
  syslog(LOG_WARNING, "%s", text.c_str());
  return true;
}
