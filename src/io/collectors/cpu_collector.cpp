#include "cpu_collector.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <sstream>

CpuCollector::CpuCollector(const std::string &proc_root)
    : stat_path_(proc_root + "/stat") {}

bool CpuCollector::parse_cpu_line(const std::string &line, CpuTimes &out) {
  std::istringstream iss(line);
  std::string label;
  iss >> label;
  if (label != "cpu")
    return false;

  uint64_t vals[8] = {0};
  int fields = 0;
  while (fields < 8 && iss >> vals[fields])
    fields++;
  // Kernels older than 2.6.11 report fewer columns
  if (fields < 4)
    return false;

  out.user = vals[0];
  out.nice = vals[1];
  out.system = vals[2];
  out.idle = vals[3];
  out.iowait = vals[4];
  out.irq = vals[5];
  out.softirq = vals[6];
  out.steal = vals[7];
  return true;
}

double CpuCollector::sample() {
  auto content = Utils::read_file_string(stat_path_);
  if (!content)
    throw TransientReadError("cannot read " + stat_path_);

  std::istringstream lines(*content);
  std::string first_line;
  std::getline(lines, first_line);

  CpuTimes current;
  if (!parse_cpu_line(first_line, current))
    throw TransientReadError("unexpected format in " + stat_path_);

  bool primed = has_last_;
  CpuTimes previous = last_;
  last_ = current;
  has_last_ = true;

  if (!primed)
    throw TransientReadError("CPU counters primed, no usage until next sample");

  double usage = 0.0;
  if (current.total() >= previous.total() &&
      current.busy() >= previous.busy()) {
    uint64_t total_delta = current.total() - previous.total();
    uint64_t busy_delta = current.busy() - previous.busy();
    if (total_delta > 0)
      usage = 100.0 * static_cast<double>(busy_delta) /
              static_cast<double>(total_delta);
  }

  LOG(LogLevel::TRACE, LogComponent::IO_COLLECTOR, "CPU usage " << usage << "%");
  return usage;
}
