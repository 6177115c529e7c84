#include "temperature_collector.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <filesystem>
#include <optional>
#include <system_error>

TemperatureCollector::TemperatureCollector(const std::string &sys_root)
    : thermal_dir_(sys_root + "/class/thermal") {}

double TemperatureCollector::sample() {
  std::error_code ec;
  std::filesystem::directory_iterator it(thermal_dir_, ec);
  if (ec)
    throw TransientReadError("cannot list " + thermal_dir_ + ": " +
                             ec.message());

  std::optional<double> hottest;
  for (; it != std::filesystem::directory_iterator(); it.increment(ec)) {
    if (ec)
      break;
    const std::string name = it->path().filename().string();
    if (name.rfind("thermal_zone", 0) != 0)
      continue;

    auto content = Utils::read_file_string((it->path() / "temp").string());
    if (!content)
      continue;
    auto millidegrees = Utils::string_to_number<long>(Utils::trim_copy(*content));
    if (!millidegrees)
      continue;

    double celsius = static_cast<double>(*millidegrees) / 1000.0;
    if (!hottest || celsius > *hottest)
      hottest = celsius;
  }

  if (!hottest)
    throw TransientReadError("no readable thermal zone under " + thermal_dir_);

  LOG(LogLevel::TRACE, LogComponent::IO_COLLECTOR,
      "Temperature " << *hottest << " C");
  return *hottest;
}
