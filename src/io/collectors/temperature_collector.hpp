#ifndef TEMPERATURE_COLLECTOR_HPP
#define TEMPERATURE_COLLECTOR_HPP

#include "base_collector.hpp"

#include <string>

// Hottest <sys_root>/class/thermal/thermal_zone*/temp in degrees Celsius.
class TemperatureCollector : public IMetricCollector {
public:
  explicit TemperatureCollector(const std::string &sys_root);

  double sample() override;
  std::string resource() const override { return "temperature"; }
  const char *unit() const override { return "°C"; }

private:
  std::string thermal_dir_;
};

#endif // TEMPERATURE_COLLECTOR_HPP
