#ifndef CPU_COLLECTOR_HPP
#define CPU_COLLECTOR_HPP

#include "base_collector.hpp"

#include <cstdint>
#include <string>

struct CpuTimes {
  uint64_t user = 0, nice = 0, system = 0, idle = 0;
  uint64_t iowait = 0, irq = 0, softirq = 0, steal = 0;

  uint64_t total() const {
    return user + nice + system + idle + iowait + irq + softirq + steal;
  }
  uint64_t busy() const { return total() - idle - iowait; }
};

// Busy percentage between two consecutive reads of the aggregate "cpu" line
// of <proc_root>/stat. The first sample only primes the counters and
// throws TransientReadError.
class CpuCollector : public IMetricCollector {
public:
  explicit CpuCollector(const std::string &proc_root);

  double sample() override;
  std::string resource() const override { return "cpu"; }
  const char *unit() const override { return "%"; }

  static bool parse_cpu_line(const std::string &line, CpuTimes &out);

private:
  std::string stat_path_;
  CpuTimes last_;
  bool has_last_ = false;
};

#endif // CPU_COLLECTOR_HPP
