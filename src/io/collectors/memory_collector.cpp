#include "memory_collector.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <cstdint>
#include <optional>
#include <sstream>

MemoryCollector::MemoryCollector(const std::string &proc_root)
    : meminfo_path_(proc_root + "/meminfo") {}

double MemoryCollector::sample() {
  auto content = Utils::read_file_string(meminfo_path_);
  if (!content)
    throw TransientReadError("cannot read " + meminfo_path_);

  std::optional<uint64_t> total_kb;
  std::optional<uint64_t> available_kb;

  std::istringstream lines(*content);
  std::string line;
  while (std::getline(lines, line)) {
    std::istringstream iss(line);
    std::string key;
    uint64_t value = 0;
    if (!(iss >> key >> value))
      continue;
    if (key == "MemTotal:")
      total_kb = value;
    else if (key == "MemAvailable:")
      available_kb = value;
  }

  if (!total_kb || !available_kb || *total_kb == 0)
    throw TransientReadError("MemTotal/MemAvailable missing in " +
                             meminfo_path_);

  uint64_t used_kb = *total_kb > *available_kb ? *total_kb - *available_kb : 0;
  double usage =
      100.0 * static_cast<double>(used_kb) / static_cast<double>(*total_kb);
  LOG(LogLevel::TRACE, LogComponent::IO_COLLECTOR,
      "Memory usage " << usage << "%");
  return usage;
}
