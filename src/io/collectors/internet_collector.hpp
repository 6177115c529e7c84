#ifndef INTERNET_COLLECTOR_HPP
#define INTERNET_COLLECTOR_HPP

#include "base_collector.hpp"
#include "core/config.hpp"

#include <cstdint>
#include <string>
#include <vector>

// 1.0 when a TCP connection to any configured host succeeds within the
// timeout, 0.0 otherwise. The matching resource uses a "below" threshold.
class InternetCollector : public IMetricCollector {
public:
  explicit InternetCollector(const Config::InternetConfig &config);

  double sample() override;
  std::string resource() const override { return "internet"; }
  const char *unit() const override { return ""; }

  static bool try_connect(const std::string &host, int port,
                          uint32_t timeout_ms);

private:
  std::vector<std::string> hosts_;
  int port_;
  uint32_t timeout_ms_;
};

#endif // INTERNET_COLLECTOR_HPP
