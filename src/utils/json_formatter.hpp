#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "core/alert.hpp"
#include "nlohmann/json.hpp"

#include <map>
#include <optional>
#include <string>

namespace JsonFormatter {

nlohmann::json snapshot_to_json_object(const MetricSnapshot &snapshot);
nlohmann::json record_to_json_object(const AlertRecord &record);
// Returns nullopt for objects missing the lifecycle fields.
std::optional<AlertRecord> record_from_json_object(const nlohmann::json &j);

nlohmann::json
records_to_json_array(const std::map<std::string, AlertRecord> &records);

// One JSON line as written by the file transport.
std::string format_notification_line(uint64_t timestamp_ms,
                                     const std::string &text);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
