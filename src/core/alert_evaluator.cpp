#include "alert_evaluator.hpp"
#include "logger.hpp"
#include "metrics_registry.hpp"

#include <limits>
#include <string>
#include <vector>

namespace {

// Saturates instead of wrapping for intervals beyond the uint64 ms range
uint64_t reminder_interval_ms(const Config::AlertSettings &settings) {
  constexpr uint64_t max_seconds = std::numeric_limits<uint64_t>::max() / 1000;
  if (settings.reminder_interval_seconds > max_seconds)
    return std::numeric_limits<uint64_t>::max();
  return settings.reminder_interval_seconds * 1000;
}

} // namespace

AlertEvaluator::AlertEvaluator(IAlertStore &store) : store_(store) {}

size_t AlertEvaluator::initialize() {
  AlertRecordMap loaded = store_.load_all();

  std::lock_guard<std::mutex> lock(table_mutex_);
  records_ = std::move(loaded);

  size_t active = 0;
  for (const auto &pair : records_)
    if (pair.second.active)
      active++;

  LOG(LogLevel::INFO, LogComponent::EVALUATOR,
      "Restored " << records_.size() << " alert records from "
                  << store_.get_name() << " (" << active << " active)");
  return records_.size();
}

std::mutex &AlertEvaluator::identity_lock(const std::string &identity) {
  std::lock_guard<std::mutex> lock(table_mutex_);
  auto &slot = identity_locks_[identity];
  if (!slot)
    slot = std::make_unique<std::mutex>();
  return *slot;
}

std::optional<AlertRecord>
AlertEvaluator::cached_record(const std::string &identity) const {
  std::lock_guard<std::mutex> lock(table_mutex_);
  auto it = records_.find(identity);
  if (it == records_.end())
    return std::nullopt;
  return it->second;
}

bool AlertEvaluator::commit(const std::string &identity,
                            const AlertRecord &record) {
  {
    std::lock_guard<std::mutex> lock(table_mutex_);
    records_[identity] = record;
  }

  if (!store_.save(identity, record)) {
    LOG(LogLevel::ERROR, LogComponent::EVALUATOR,
        "Could not persist alert record " << identity
                                          << "; keeping in-memory state");
    Metrics::persistence_failed();
    return false;
  }
  return true;
}

EvaluationResult
AlertEvaluator::evaluate(const std::string &identity, bool is_problem,
                         uint64_t now_ms, const Config::AlertSettings &settings,
                         const std::optional<MetricSnapshot> &snapshot) {
  EvaluationResult result;
  Notification &notification = result.notification;
  notification.identity = identity;
  notification.alert_type = alert_type_of(identity);
  notification.timestamp_ms = now_ms;
  notification.snapshot = snapshot;

  if (!settings.enabled) {
    LOG(LogLevel::TRACE, LogComponent::EVALUATOR,
        "Alert type " << notification.alert_type << " disabled, skipping "
                      << identity);
    return result;
  }

  std::lock_guard<std::mutex> guard(identity_lock(identity));

  std::optional<AlertRecord> existing = cached_record(identity);
  AlertRecord record = existing.value_or(AlertRecord{});
  if (record.alert_type.empty())
    record.alert_type = notification.alert_type;
  if (snapshot)
    record.last_value = snapshot;

  if (!is_problem) {
    if (existing && existing->active) {
      uint64_t duration_ms = now_ms >= record.first_triggered_at_ms
                                 ? now_ms - record.first_triggered_at_ms
                                 : 0;
      record.active = false;
      result.record_changed = true;

      if (settings.notify_recovery) {
        notification.kind = NotificationKind::RECOVERY;
        notification.duration_ms = duration_ms;
      }
      LOG(LogLevel::INFO, LogComponent::EVALUATOR,
          "Alert " << identity << " recovered after " << duration_ms << " ms"
                   << (settings.notify_recovery ? ""
                                                : " (recovery notice disabled)"));
    } else if (!existing) {
      // First sighting of a healthy identity
      result.record_changed = true;
    }
  } else if (!existing || !existing->active) {
    record.active = true;
    record.first_triggered_at_ms = now_ms;
    record.last_notified_at_ms = now_ms;
    record.reminder_count = 0;
    result.record_changed = true;
    notification.kind = NotificationKind::INITIAL;
    LOG(LogLevel::INFO, LogComponent::EVALUATOR,
        "Alert " << identity << " became active");
  } else {
    uint64_t interval_ms = reminder_interval_ms(settings);
    // A clock that moved backwards counts as "interval not elapsed"
    bool elapsed = interval_ms > 0 && now_ms >= record.last_notified_at_ms &&
                   now_ms - record.last_notified_at_ms >= interval_ms;
    if (elapsed) {
      record.last_notified_at_ms = now_ms;
      record.reminder_count++;
      result.record_changed = true;
      notification.kind = NotificationKind::REMINDER;
      notification.reminder_count = record.reminder_count;
      LOG(LogLevel::INFO, LogComponent::EVALUATOR,
          "Alert " << identity << " still active, reminder "
                   << record.reminder_count);
    } else {
      LOG(LogLevel::DEBUG, LogComponent::EVALUATOR,
          "Alert " << identity << " still active, notification suppressed");
      Metrics::notification_suppressed(notification.alert_type);
    }
  }

  if (result.record_changed) {
    result.persisted = commit(identity, record);
  } else {
    // Keep the latest reading for messages and the admin API
    std::lock_guard<std::mutex> lock(table_mutex_);
    records_[identity].last_value = record.last_value;
  }

  if (result.should_notify())
    Metrics::notification_sent(notification_kind_to_string(notification.kind));

  return result;
}

Notification AlertEvaluator::notify_event(const std::string &alert_type,
                                          const std::string &identity,
                                          const std::string &text,
                                          uint64_t now_ms,
                                          const Config::AlertSettings &settings) {
  Notification notification;
  notification.identity = identity;
  notification.alert_type = alert_type;
  notification.timestamp_ms = now_ms;

  if (!settings.enabled) {
    LOG(LogLevel::DEBUG, LogComponent::EVALUATOR,
        "Event " << identity << " dropped, alert type " << alert_type
                 << " is disabled");
    return notification;
  }

  notification.kind = NotificationKind::EVENT;
  notification.text = text;
  Metrics::notification_sent(notification_kind_to_string(notification.kind));
  return notification;
}

bool AlertEvaluator::reset(const std::string &identity) {
  std::lock_guard<std::mutex> guard(identity_lock(identity));

  std::optional<AlertRecord> record = cached_record(identity);
  if (!record) {
    LOG(LogLevel::WARN, LogComponent::EVALUATOR,
        "Reset requested for unknown alert " << identity);
    return false;
  }

  if (!record->active)
    return true;

  record->active = false;
  commit(identity, *record);
  LOG(LogLevel::INFO, LogComponent::EVALUATOR,
      "Alert " << identity << " reset by operator");
  return true;
}

size_t AlertEvaluator::reset_all() {
  std::vector<std::string> active_ids;
  {
    std::lock_guard<std::mutex> lock(table_mutex_);
    for (const auto &pair : records_)
      if (pair.second.active)
        active_ids.push_back(pair.first);
  }

  size_t count = 0;
  for (const auto &identity : active_ids)
    if (reset(identity))
      count++;
  return count;
}

AlertRecordMap AlertEvaluator::snapshot() const {
  std::lock_guard<std::mutex> lock(table_mutex_);
  return records_;
}

size_t AlertEvaluator::active_count() const {
  std::lock_guard<std::mutex> lock(table_mutex_);
  size_t count = 0;
  for (const auto &pair : records_)
    if (pair.second.active)
      count++;
  return count;
}
