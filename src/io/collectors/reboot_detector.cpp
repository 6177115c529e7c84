#include "reboot_detector.hpp"
#include "base_collector.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <sstream>

RebootDetector::RebootDetector(const std::string &proc_root,
                               const std::string &state_file)
    : uptime_path_(proc_root + "/uptime"), state_file_(state_file) {
  if (state_file_.empty())
    return;

  if (auto content = Utils::read_file_string(state_file_)) {
    last_uptime_ = parse_uptime(*content);
    if (last_uptime_)
      LOG(LogLevel::DEBUG, LogComponent::IO_COLLECTOR,
          "Previous uptime " << *last_uptime_ << "s restored from "
                             << state_file_);
  }
}

std::optional<double> RebootDetector::parse_uptime(const std::string &content) {
  std::istringstream iss(content);
  double seconds = 0.0;
  if (!(iss >> seconds) || seconds < 0.0)
    return std::nullopt;
  return seconds;
}

double RebootDetector::read_uptime() const {
  auto content = Utils::read_file_string(uptime_path_);
  if (!content)
    throw TransientReadError("cannot read " + uptime_path_);

  auto uptime = parse_uptime(*content);
  if (!uptime)
    throw TransientReadError("unexpected format in " + uptime_path_);
  return *uptime;
}

void RebootDetector::persist(double uptime) const {
  if (state_file_.empty())
    return;
  std::ostringstream oss;
  oss << uptime << "\n";
  if (!Utils::write_file_atomically(state_file_, oss.str()))
    LOG(LogLevel::WARN, LogComponent::IO_COLLECTOR,
        "Could not persist uptime to " << state_file_);
}

std::optional<double> RebootDetector::check() {
  double current = read_uptime();

  bool rebooted = last_uptime_ && current < *last_uptime_ &&
                  *last_uptime_ > MIN_PREVIOUS_UPTIME_SECONDS;
  if (rebooted)
    LOG(LogLevel::INFO, LogComponent::IO_COLLECTOR,
        "Reboot detected: uptime went from " << *last_uptime_ << "s to "
                                             << current << "s");

  last_uptime_ = current;
  persist(current);

  if (rebooted)
    return current;
  return std::nullopt;
}
