#ifndef ALERT_HPP
#define ALERT_HPP

#include <cstdint>
#include <optional>
#include <string>

enum class NotificationKind {
  NONE = 0,     // Nothing to send (suppressed, disabled or no change)
  INITIAL = 1,  // Condition became active
  REMINDER = 2, // Condition still active after the reminder interval
  RECOVERY = 3, // Condition cleared
  EVENT = 4     // One-shot occurrence without a lifecycle (SSH login, reboot)
};

std::string notification_kind_to_string(NotificationKind kind);

struct MetricSnapshot {
  double value = 0.0;
  double threshold = 0.0;
  std::string unit;
};

bool operator==(const MetricSnapshot &lhs, const MetricSnapshot &rhs);

// Persisted lifecycle state of one alert identity.
struct AlertRecord {
  std::string alert_type;
  bool active = false;
  uint64_t first_triggered_at_ms = 0;
  uint64_t last_notified_at_ms = 0;
  uint32_t reminder_count = 0;
  std::optional<MetricSnapshot> last_value;
};

bool operator==(const AlertRecord &lhs, const AlertRecord &rhs);
bool operator!=(const AlertRecord &lhs, const AlertRecord &rhs);

struct Notification {
  NotificationKind kind = NotificationKind::NONE;
  std::string identity;
  std::string alert_type;
  uint64_t timestamp_ms = 0;

  std::optional<MetricSnapshot> snapshot; // INITIAL / REMINDER
  uint32_t reminder_count = 0;            // REMINDER
  uint64_t duration_ms = 0;               // RECOVERY
  std::string text;                       // EVENT
};

struct EvaluationResult {
  Notification notification;
  bool record_changed = false;
  // False when the store rejected the write; the in-memory state still moved.
  bool persisted = true;

  bool should_notify() const {
    return notification.kind != NotificationKind::NONE;
  }
};

// An identity is "<type>:<instance>", e.g. "disk:/data" or "cpu:host".
std::string make_identity(const std::string &alert_type,
                          const std::string &instance);
std::string alert_type_of(const std::string &identity);
std::string alert_instance_of(const std::string &identity);

#endif // ALERT_HPP
