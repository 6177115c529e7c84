#ifndef DISK_COLLECTOR_HPP
#define DISK_COLLECTOR_HPP

#include "base_collector.hpp"

#include <string>

// Used percentage of one mount point as df(1) reports it.
class DiskCollector : public IMetricCollector {
public:
  explicit DiskCollector(const std::string &mount_point);

  double sample() override;
  std::string resource() const override { return "disk:" + mount_point_; }
  const char *unit() const override { return "%"; }

private:
  std::string mount_point_;
};

#endif // DISK_COLLECTOR_HPP
