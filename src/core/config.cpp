#include "config.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cstddef>
#include <cstdint>
#include <cstdlib>
#include <fstream>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <string>
#include <sys/stat.h>
#include <vector>

namespace Config {

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"evaluator", LogComponent::EVALUATOR},
    {"state.persist", LogComponent::STATE_PERSIST},
    {"scheduler", LogComponent::SCHEDULER},
    {"io.collector", LogComponent::IO_COLLECTOR},
    {"io.dispatch", LogComponent::IO_DISPATCH},
    {"io.transport", LogComponent::IO_TRANSPORT},
    {"io.ssh", LogComponent::IO_SSH},
    {"io.web", LogComponent::IO_WEB}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::to_lower_copy(Utils::trim_copy(val_str_raw));
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

std::vector<std::string> split_list(const std::string &value) {
  std::vector<std::string> items;
  for (const auto &item : Utils::split_string(value, ',')) {
    std::string trimmed = Utils::trim_copy(item);
    if (!trimmed.empty())
      items.push_back(trimmed);
  }
  return items;
}

// "/:90,/data:85" -> mount points. Entries without a threshold use 90.
std::vector<MountPointConfig> parse_mount_points(const std::string &value) {
  std::vector<MountPointConfig> mount_points;
  for (const auto &entry : split_list(value)) {
    MountPointConfig mp;
    size_t colon = entry.rfind(':');
    if (colon == std::string::npos) {
      mp.path = entry;
    } else {
      mp.path = Utils::trim_copy(entry.substr(0, colon));
      auto threshold =
          Utils::string_to_number<double>(Utils::trim_copy(entry.substr(colon + 1)));
      if (!threshold)
        throw std::invalid_argument("bad threshold in mount point '" + entry +
                                    "'");
      mp.threshold_percent = *threshold;
    }
    mount_points.push_back(mp);
  }
  return mount_points;
}

AlertSettings default_alert_settings(const std::string &alert_type) {
  if (alert_type == AlertTypes::SSH)
    return AlertSettings{true, 0, false};
  if (alert_type == AlertTypes::INTERNET)
    return AlertSettings{true, 0, true};
  return AlertSettings{};
}

AppConfig::AppConfig() {
  for (const char *type :
       {AlertTypes::CPU, AlertTypes::RAM, AlertTypes::DISK,
        AlertTypes::TEMPERATURE, AlertTypes::INTERNET, AlertTypes::SSH,
        AlertTypes::REBOOT})
    alert_settings[type] = default_alert_settings(type);
}

AlertSettings AppConfig::settings_for(const std::string &alert_type) const {
  auto it = alert_settings.find(alert_type);
  if (it != alert_settings.end())
    return it->second;
  return default_alert_settings(alert_type);
}

// Validation functions for configuration parameters
bool validate_percent(const std::string &name, double value,
                      std::vector<std::string> &errors) {
  if (value < 0.0 || value > 100.0) {
    errors.push_back(name + " threshold must be between 0 and 100 percent");
    return false;
  }
  return true;
}

bool validate_telegram_config(const TelegramConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;
  if (!config.enabled)
    return true;

  if (config.bot_token.empty()) {
    errors.push_back("Telegram is enabled but bot_token is empty");
    valid = false;
  }

  if (config.chat_id.empty()) {
    errors.push_back("Telegram is enabled but chat_id is empty");
    valid = false;
  }

  if (config.api_url.rfind("http://", 0) != 0 &&
      config.api_url.rfind("https://", 0) != 0) {
    errors.push_back("Telegram api_url must start with http:// or https://");
    valid = false;
  }

  if (config.max_retries < 1 || config.max_retries > 10) {
    errors.push_back("Telegram max_retries must be between 1 and 10");
    valid = false;
  }

  return valid;
}

bool validate_ssh_config(const SshConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;
  for (const auto &entry : config.excluded_ips) {
    if (!Utils::parse_cidr(entry)) {
      errors.push_back("SSH excluded_ips entry is not an IP or CIDR block: " +
                       entry);
      valid = false;
    }
  }
  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (config.poll_interval_seconds < 1 ||
      config.poll_interval_seconds > 86400) {
    errors.push_back("poll_interval_seconds must be between 1 and 86400");
    valid = false;
  }

  if (!validate_percent("CPU", config.cpu.threshold_percent, errors))
    valid = false;
  if (!validate_percent("Memory", config.memory.threshold_percent, errors))
    valid = false;
  for (const auto &mp : config.disk.mount_points) {
    if (mp.path.empty()) {
      errors.push_back("Disk mount point path must not be empty");
      valid = false;
    }
    if (!validate_percent("Disk " + mp.path, mp.threshold_percent, errors))
      valid = false;
  }

  if (config.internet.port < 1 || config.internet.port > 65535) {
    errors.push_back("Internet port must be between 1 and 65535");
    valid = false;
  }

  for (const auto &pair : config.alert_settings) {
    if (pair.second.reminder_interval_seconds >
        AlertSettings::MAX_REMINDER_INTERVAL_SECONDS) {
      errors.push_back("Alert." + pair.first +
                       " reminder_interval_seconds must not exceed " +
                       std::to_string(
                           AlertSettings::MAX_REMINDER_INTERVAL_SECONDS));
      valid = false;
    }
  }

  if (!validate_telegram_config(config.telegram, errors))
    valid = false;

  if (!validate_ssh_config(config.ssh, errors))
    valid = false;

  if (config.web_server.port < 1 || config.web_server.port > 65535) {
    errors.push_back("WebServer port must be between 1 and 65535");
    valid = false;
  }

  return valid;
}

void apply_environment_overrides(AppConfig &config) {
  if (config.telegram.bot_token.empty()) {
    if (const char *token = std::getenv("HOSTWATCH_BOT_TOKEN"))
      config.telegram.bot_token = token;
  }
  if (config.telegram.chat_id.empty()) {
    if (const char *chat_id = std::getenv("HOSTWATCH_CHAT_ID"))
      config.telegram.chat_id = chat_id;
  }
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map) {
    config.logging.log_levels[pair.second] = LogLevel::WARN;
  }
  // Except for CORE, which we want to see INFO messages from by default
  config.logging.log_levels[LogComponent::CORE] = LogLevel::INFO;

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    apply_environment_overrides(config);
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      // Global (non-section) keys
      if (current_section.empty()) {
        if (key == Keys::STATE_FILE_PATH)
          config.state_file_path = value;
        else if (key == Keys::POLL_INTERVAL_SECONDS)
          config.poll_interval_seconds =
              Utils::string_to_number<uint64_t>(value).value_or(
                  config.poll_interval_seconds);
        else if (key == Keys::PROC_ROOT)
          config.proc_root = value;
        else if (key == Keys::SYS_ROOT)
          config.sys_root = value;
        else if (key == Keys::HOSTNAME)
          config.hostname = value;
        else if (key == Keys::LOCAL_ADDRESS)
          config.local_address = value;
        else if (key == Keys::ALERTS_TO_STDOUT)
          config.alerts_to_stdout = string_to_bool(value);
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown key '" << key << "' ignored." << std::endl;

        // Resource sections
      } else if (current_section == "Cpu" || current_section == "Memory") {
        PercentResourceConfig &res =
            current_section == "Cpu" ? config.cpu : config.memory;
        if (key == Keys::RES_ENABLED)
          res.enabled = string_to_bool(value);
        else if (key == Keys::RES_THRESHOLD_PERCENT)
          res.threshold_percent =
              Utils::string_to_number<double>(value).value_or(
                  res.threshold_percent);

      } else if (current_section == "Disk") {
        if (key == Keys::RES_ENABLED)
          config.disk.enabled = string_to_bool(value);
        else if (key == Keys::DISK_MOUNT_POINTS)
          config.disk.mount_points = parse_mount_points(value);

      } else if (current_section == "Temperature") {
        if (key == Keys::RES_ENABLED)
          config.temperature.enabled = string_to_bool(value);
        else if (key == Keys::TEMP_THRESHOLD_CELSIUS)
          config.temperature.threshold_celsius =
              Utils::string_to_number<double>(value).value_or(
                  config.temperature.threshold_celsius);

      } else if (current_section == "Internet") {
        if (key == Keys::RES_ENABLED)
          config.internet.enabled = string_to_bool(value);
        else if (key == Keys::NET_HOSTS) {
          std::vector<std::string> hosts = split_list(value);
          if (!hosts.empty())
            config.internet.hosts = hosts;
        } else if (key == Keys::NET_PORT)
          config.internet.port = Utils::string_to_number<int>(value).value_or(
              config.internet.port);
        else if (key == Keys::NET_TIMEOUT_MS)
          config.internet.timeout_ms =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.internet.timeout_ms);

        // SSH Settings
      } else if (current_section == "Ssh") {
        if (key == Keys::SSH_ENABLED)
          config.ssh.enabled = string_to_bool(value);
        else if (key == Keys::SSH_AUTH_LOG_PATH)
          config.ssh.auth_log_path = value;
        else if (key == Keys::SSH_POSITION_FILE)
          config.ssh.position_file = value;
        else if (key == Keys::SSH_EXCLUDED_IPS)
          config.ssh.excluded_ips = split_list(value);

      } else if (current_section == "Reboot") {
        if (key == Keys::RB_ENABLED)
          config.reboot.enabled = string_to_bool(value);
        else if (key == Keys::RB_UPTIME_STATE_FILE)
          config.reboot.uptime_state_file = value;

        // Per-type alert policy, e.g. [Alert.disk]
      } else if (current_section.rfind("Alert.", 0) == 0) {
        std::string alert_type =
            Utils::to_lower_copy(current_section.substr(6));
        auto it = config.alert_settings.find(alert_type);
        if (it == config.alert_settings.end())
          it = config.alert_settings
                   .emplace(alert_type, default_alert_settings(alert_type))
                   .first;
        AlertSettings &settings = it->second;

        if (key == Keys::AS_ENABLED)
          settings.enabled = string_to_bool(value);
        else if (key == Keys::AS_REMINDER_INTERVAL_SECONDS)
          settings.reminder_interval_seconds =
              Utils::string_to_number<uint64_t>(value).value_or(
                  settings.reminder_interval_seconds);
        else if (key == Keys::AS_NOTIFY_RECOVERY)
          settings.notify_recovery = string_to_bool(value);

        // Telegram Settings
      } else if (current_section == "Telegram") {
        if (key == Keys::TG_ENABLED)
          config.telegram.enabled = string_to_bool(value);
        else if (key == Keys::TG_BOT_TOKEN)
          config.telegram.bot_token = value;
        else if (key == Keys::TG_CHAT_ID)
          config.telegram.chat_id = value;
        else if (key == Keys::TG_API_URL)
          config.telegram.api_url = value;
        else if (key == Keys::TG_PARSE_MODE)
          config.telegram.parse_mode = value;
        else if (key == Keys::TG_MAX_RETRIES)
          config.telegram.max_retries =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.telegram.max_retries);
        else if (key == Keys::TG_RETRY_DELAY_MS)
          config.telegram.retry_delay_ms =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.telegram.retry_delay_ms);
        else if (key == Keys::TG_TIMEOUT_SECONDS)
          config.telegram.timeout_seconds =
              Utils::string_to_number<uint32_t>(value).value_or(
                  config.telegram.timeout_seconds);

        // Alerting Settings
      } else if (current_section == "Alerting") {
        if (key == Keys::AL_FILE_ENABLED)
          config.alerting.file_enabled = string_to_bool(value);
        else if (key == Keys::AL_FILE_PATH)
          config.alerting.file_path = value;
        else if (key == Keys::AL_SYSLOG_ENABLED)
          config.alerting.syslog_enabled = string_to_bool(value);

      } else if (current_section == "WebServer") {
        if (key == Keys::WS_ENABLED)
          config.web_server.enabled = string_to_bool(value);
        else if (key == Keys::WS_HOST)
          config.web_server.host = value;
        else if (key == Keys::WS_PORT)
          config.web_server.port = Utils::string_to_number<int>(value).value_or(
              config.web_server.port);

        // Logging Settings
      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          LogLevel default_level = string_to_log_level(value);
          for (auto &pair : config.logging.log_levels)
            pair.second = default_level;
        } else {
          auto comp_it = key_to_component_map.find(key);
          if (comp_it != key_to_component_map.end())
            config.logging.log_levels[comp_it->second] =
                string_to_log_level(value);
          else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
            // Wildcard match, e.g., "io.* = DEBUG"
            std::string prefix = key.substr(0, key.length() - 1);
            for (const auto &pair : key_to_component_map) {
              if (pair.first.rfind(prefix, 0) == 0)
                config.logging.log_levels[pair.second] =
                    string_to_log_level(value);
            }
          }
        }
      }
    } catch (const std::invalid_argument &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid value for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    } catch (const std::out_of_range &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Value out of range for key '" << key << "': '" << value
                << "' - " << e.what() << std::endl;
    }
  }

  config_file.close();
  apply_environment_overrides(config);
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

std::time_t file_mtime(const std::string &filepath) {
  struct stat st;
  if (stat(filepath.c_str(), &st) != 0)
    return 0;
  return st.st_mtime;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  std::time_t mtime = file_mtime(filepath);
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    // Do not retry the same broken file on every cycle
    std::lock_guard<std::mutex> lock(config_mutex_);
    loaded_mtime_ = mtime;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  loaded_mtime_ = mtime;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

bool ConfigManager::reload_if_changed() {
  if (config_filepath_.empty())
    return false;

  std::time_t mtime = file_mtime(config_filepath_);
  {
    std::lock_guard<std::mutex> lock(config_mutex_);
    if (mtime == 0 || mtime == loaded_mtime_)
      return false;
  }

  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Configuration file " << config_filepath_ << " changed on disk, reloading");
  return load_configuration(config_filepath_);
}

bool ConfigManager::reload() {
  if (config_filepath_.empty())
    return false;
  LOG(LogLevel::INFO, LogComponent::CONFIG,
      "Reloading configuration from " << config_filepath_);
  return load_configuration(config_filepath_);
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
