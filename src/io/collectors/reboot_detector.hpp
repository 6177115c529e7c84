#ifndef REBOOT_DETECTOR_HPP
#define REBOOT_DETECTOR_HPP

#include <optional>
#include <string>

// Detects a reboot by watching <proc_root>/uptime go backwards. The last
// observed uptime is kept in a state file so that a reboot which also
// restarted this process is still noticed on the first check.
class RebootDetector {
public:
  RebootDetector(const std::string &proc_root, const std::string &state_file);

  // Returns the current uptime in seconds when a reboot was detected.
  // Throws TransientReadError when the uptime cannot be read.
  std::optional<double> check();

  std::optional<double> last_uptime() const { return last_uptime_; }

  static std::optional<double> parse_uptime(const std::string &content);

  // Uptimes at or below this are too young to compare against
  static constexpr double MIN_PREVIOUS_UPTIME_SECONDS = 10.0;

private:
  double read_uptime() const;
  void persist(double uptime) const;

  std::string uptime_path_;
  std::string state_file_;
  std::optional<double> last_uptime_;
};

#endif // REBOOT_DETECTOR_HPP
