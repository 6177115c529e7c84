#include "alert.hpp"

#include <string>

std::string notification_kind_to_string(NotificationKind kind) {
  switch (kind) {
  case NotificationKind::NONE:
    return "none";
  case NotificationKind::INITIAL:
    return "initial";
  case NotificationKind::REMINDER:
    return "reminder";
  case NotificationKind::RECOVERY:
    return "recovery";
  case NotificationKind::EVENT:
    return "event";
  default:
    return "unknown";
  }
}

bool operator==(const MetricSnapshot &lhs, const MetricSnapshot &rhs) {
  return lhs.value == rhs.value && lhs.threshold == rhs.threshold &&
         lhs.unit == rhs.unit;
}

bool operator==(const AlertRecord &lhs, const AlertRecord &rhs) {
  return lhs.alert_type == rhs.alert_type && lhs.active == rhs.active &&
         lhs.first_triggered_at_ms == rhs.first_triggered_at_ms &&
         lhs.last_notified_at_ms == rhs.last_notified_at_ms &&
         lhs.reminder_count == rhs.reminder_count &&
         lhs.last_value == rhs.last_value;
}

bool operator!=(const AlertRecord &lhs, const AlertRecord &rhs) {
  return !(lhs == rhs);
}

std::string make_identity(const std::string &alert_type,
                          const std::string &instance) {
  return alert_type + ":" + instance;
}

std::string alert_type_of(const std::string &identity) {
  size_t colon = identity.find(':');
  if (colon == std::string::npos)
    return identity;
  return identity.substr(0, colon);
}

std::string alert_instance_of(const std::string &identity) {
  size_t colon = identity.find(':');
  if (colon == std::string::npos)
    return "";
  return identity.substr(colon + 1);
}
