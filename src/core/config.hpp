#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <ctime>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *STATE_FILE_PATH = "state_file_path";
constexpr const char *POLL_INTERVAL_SECONDS = "poll_interval_seconds";
constexpr const char *PROC_ROOT = "proc_root";
constexpr const char *SYS_ROOT = "sys_root";
constexpr const char *HOSTNAME = "hostname";
constexpr const char *LOCAL_ADDRESS = "local_address";
constexpr const char *ALERTS_TO_STDOUT = "alerts_to_stdout";

// Resource Settings (shared by the resource sections)
constexpr const char *RES_ENABLED = "enabled";
constexpr const char *RES_THRESHOLD_PERCENT = "threshold_percent";
constexpr const char *DISK_MOUNT_POINTS = "mount_points";
constexpr const char *TEMP_THRESHOLD_CELSIUS = "threshold_celsius";
constexpr const char *NET_HOSTS = "hosts";
constexpr const char *NET_PORT = "port";
constexpr const char *NET_TIMEOUT_MS = "timeout_ms";

// SSH Settings
constexpr const char *SSH_ENABLED = "enabled";
constexpr const char *SSH_AUTH_LOG_PATH = "auth_log_path";
constexpr const char *SSH_POSITION_FILE = "position_file";
constexpr const char *SSH_EXCLUDED_IPS = "excluded_ips";

// Reboot Settings
constexpr const char *RB_ENABLED = "enabled";
constexpr const char *RB_UPTIME_STATE_FILE = "uptime_state_file";

// Per-type Alert Settings ([Alert.<type>])
constexpr const char *AS_ENABLED = "enabled";
constexpr const char *AS_REMINDER_INTERVAL_SECONDS = "reminder_interval_seconds";
constexpr const char *AS_NOTIFY_RECOVERY = "notify_recovery";

// Telegram Settings
constexpr const char *TG_ENABLED = "enabled";
constexpr const char *TG_BOT_TOKEN = "bot_token";
constexpr const char *TG_CHAT_ID = "chat_id";
constexpr const char *TG_API_URL = "api_url";
constexpr const char *TG_PARSE_MODE = "parse_mode";
constexpr const char *TG_MAX_RETRIES = "max_retries";
constexpr const char *TG_RETRY_DELAY_MS = "retry_delay_ms";
constexpr const char *TG_TIMEOUT_SECONDS = "timeout_seconds";

// Alerting Settings
constexpr const char *AL_FILE_ENABLED = "file_enabled";
constexpr const char *AL_FILE_PATH = "file_path";
constexpr const char *AL_SYSLOG_ENABLED = "syslog_enabled";

// Web Server Settings
constexpr const char *WS_ENABLED = "enabled";
constexpr const char *WS_HOST = "host";
constexpr const char *WS_PORT = "port";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

// Alert type names; an identity is "<type>:<instance>"
namespace AlertTypes {
constexpr const char *CPU = "cpu";
constexpr const char *RAM = "ram";
constexpr const char *DISK = "disk";
constexpr const char *TEMPERATURE = "temperature";
constexpr const char *INTERNET = "internet";
constexpr const char *SSH = "ssh";
constexpr const char *REBOOT = "reboot";
} // namespace AlertTypes

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
};

// Policy for one alert type. Read-only at evaluation time.
struct AlertSettings {
  static constexpr uint64_t MAX_REMINDER_INTERVAL_SECONDS = 365ULL * 24 * 3600;

  bool enabled = true;
  uint64_t reminder_interval_seconds = 3600; // 0 = never remind
  bool notify_recovery = true;
};

struct PercentResourceConfig {
  bool enabled = true;
  double threshold_percent = 90.0;
};

struct MountPointConfig {
  std::string path;
  double threshold_percent = 90.0;
};

struct DiskConfig {
  bool enabled = true;
  std::vector<MountPointConfig> mount_points = {{"/", 90.0}};
};

struct TemperatureConfig {
  bool enabled = false;
  double threshold_celsius = 80.0;
};

struct InternetConfig {
  bool enabled = true;
  std::vector<std::string> hosts = {"8.8.8.8", "1.1.1.1", "208.67.222.222"};
  int port = 53;
  uint32_t timeout_ms = 3000;
};

struct SshConfig {
  bool enabled = true;
  std::string auth_log_path = "/var/log/auth.log";
  std::string position_file = "data/auth_log_position";
  std::vector<std::string> excluded_ips = {"127.0.0.1", "10.0.0.0/8",
                                           "172.16.0.0/12", "192.168.0.0/16"};
};

struct RebootConfig {
  bool enabled = true;
  std::string uptime_state_file = "data/last_uptime";
};

struct TelegramConfig {
  bool enabled = false;
  std::string bot_token;
  std::string chat_id;
  std::string api_url = "https://api.telegram.org";
  std::string parse_mode = "Markdown";
  uint32_t max_retries = 3;
  uint32_t retry_delay_ms = 2000;
  uint32_t timeout_seconds = 10;
};

struct AlertingConfig {
  bool file_enabled = false;
  std::string file_path = "data/notifications.jsonl";
  bool syslog_enabled = false;
};

struct WebServerConfig {
  bool enabled = true;
  std::string host = "127.0.0.1";
  int port = 9100;
};

struct AppConfig {
  std::string state_file_path = "data/active_alerts.json";
  uint64_t poll_interval_seconds = 10;
  std::string proc_root = "/proc";
  std::string sys_root = "/sys";
  std::string hostname;
  std::string local_address; // empty = first non-loopback IPv4
  bool alerts_to_stdout = false;

  PercentResourceConfig cpu;
  PercentResourceConfig memory;
  DiskConfig disk;
  TemperatureConfig temperature;
  InternetConfig internet;
  SshConfig ssh;
  RebootConfig reboot;
  TelegramConfig telegram;
  AlertingConfig alerting;
  WebServerConfig web_server;
  LoggingConfig logging;

  // Keyed by alert type. Types without an entry use default_alert_settings().
  std::map<std::string, AlertSettings> alert_settings;

  AppConfig();

  AlertSettings settings_for(const std::string &alert_type) const;
};

AlertSettings default_alert_settings(const std::string &alert_type);

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  // Reloads only when the file's modification time moved since the last
  // successful load. Returns true when a new snapshot was installed.
  bool reload_if_changed();
  // Unconditional reload of the last loaded file (SIGHUP).
  bool reload();
  const std::string &config_filepath() const { return config_filepath_; }
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::time_t loaded_mtime_ = 0;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
