#ifndef MEMORY_COLLECTOR_HPP
#define MEMORY_COLLECTOR_HPP

#include "base_collector.hpp"

#include <string>

// (MemTotal - MemAvailable) / MemTotal from <proc_root>/meminfo
class MemoryCollector : public IMetricCollector {
public:
  explicit MemoryCollector(const std::string &proc_root);

  double sample() override;
  std::string resource() const override { return "ram"; }
  const char *unit() const override { return "%"; }

private:
  std::string meminfo_path_;
};

#endif // MEMORY_COLLECTOR_HPP
