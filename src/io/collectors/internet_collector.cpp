#include "internet_collector.hpp"
#include "core/logger.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <netdb.h>
#include <poll.h>
#include <sys/socket.h>
#include <unistd.h>

InternetCollector::InternetCollector(const Config::InternetConfig &config)
    : hosts_(config.hosts), port_(config.port), timeout_ms_(config.timeout_ms) {}

bool InternetCollector::try_connect(const std::string &host, int port,
                                    uint32_t timeout_ms) {
  addrinfo hints{};
  hints.ai_family = AF_UNSPEC;
  hints.ai_socktype = SOCK_STREAM;
  hints.ai_flags = AI_NUMERICSERV;

  addrinfo *results = nullptr;
  const std::string port_str = std::to_string(port);
  if (getaddrinfo(host.c_str(), port_str.c_str(), &hints, &results) != 0)
    return false;

  bool connected = false;
  for (addrinfo *ai = results; ai != nullptr && !connected; ai = ai->ai_next) {
    int fd = socket(ai->ai_family, ai->ai_socktype | SOCK_NONBLOCK,
                    ai->ai_protocol);
    if (fd < 0)
      continue;

    int rc = connect(fd, ai->ai_addr, ai->ai_addrlen);
    if (rc == 0) {
      connected = true;
    } else if (errno == EINPROGRESS) {
      pollfd pfd{fd, POLLOUT, 0};
      if (poll(&pfd, 1, static_cast<int>(timeout_ms)) == 1) {
        int so_error = 0;
        socklen_t len = sizeof(so_error);
        if (getsockopt(fd, SOL_SOCKET, SO_ERROR, &so_error, &len) == 0 &&
            so_error == 0)
          connected = true;
      }
    }
    close(fd);
  }

  freeaddrinfo(results);
  return connected;
}

double InternetCollector::sample() {
  for (const auto &host : hosts_) {
    if (try_connect(host, port_, timeout_ms_)) {
      LOG(LogLevel::TRACE, LogComponent::IO_COLLECTOR,
          "Internet reachable via " << host << ":" << port_);
      return 1.0;
    }
    LOG(LogLevel::DEBUG, LogComponent::IO_COLLECTOR,
        "No TCP answer from " << host << ":" << port_);
  }
  return 0.0;
}
