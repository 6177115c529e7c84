#include "json_formatter.hpp"

#include <string>

nlohmann::json
JsonFormatter::snapshot_to_json_object(const MetricSnapshot &snapshot) {
  return nlohmann::json{{"value", snapshot.value},
                        {"threshold", snapshot.threshold},
                        {"unit", snapshot.unit}};
}

nlohmann::json JsonFormatter::record_to_json_object(const AlertRecord &record) {
  nlohmann::json j;
  j["alert_type"] = record.alert_type;
  j["active"] = record.active;
  j["first_triggered_at_ms"] = record.first_triggered_at_ms;
  j["last_notified_at_ms"] = record.last_notified_at_ms;
  j["reminder_count"] = record.reminder_count;
  if (record.last_value)
    j["last_value"] = snapshot_to_json_object(*record.last_value);
  else
    j["last_value"] = nullptr;
  return j;
}

std::optional<AlertRecord>
JsonFormatter::record_from_json_object(const nlohmann::json &j) {
  if (!j.is_object() || !j.contains("active") || !j["active"].is_boolean())
    return std::nullopt;

  AlertRecord record;
  record.alert_type = j.value("alert_type", std::string());
  record.active = j["active"].get<bool>();
  record.first_triggered_at_ms = j.value("first_triggered_at_ms", uint64_t{0});
  record.last_notified_at_ms = j.value("last_notified_at_ms", uint64_t{0});
  record.reminder_count = j.value("reminder_count", uint32_t{0});

  auto it = j.find("last_value");
  if (it != j.end() && it->is_object()) {
    MetricSnapshot snapshot;
    snapshot.value = it->value("value", 0.0);
    snapshot.threshold = it->value("threshold", 0.0);
    snapshot.unit = it->value("unit", std::string());
    record.last_value = snapshot;
  }
  return record;
}

nlohmann::json JsonFormatter::records_to_json_array(
    const std::map<std::string, AlertRecord> &records) {
  nlohmann::json j = nlohmann::json::array();
  for (const auto &[identity, record] : records) {
    nlohmann::json entry = record_to_json_object(record);
    entry["identity"] = identity;
    j.push_back(entry);
  }
  return j;
}

std::string JsonFormatter::format_notification_line(uint64_t timestamp_ms,
                                                    const std::string &text) {
  nlohmann::json j;
  j["timestamp_ms"] = timestamp_ms;
  j["text"] = text;
  return j.dump();
}
