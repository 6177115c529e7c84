#ifndef ALERT_EVALUATOR_HPP
#define ALERT_EVALUATOR_HPP

#include "alert.hpp"
#include "config.hpp"
#include "io/state/base_alert_store.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>

// Decides, for one alert identity per evaluation cycle, whether to send an
// initial notice, a reminder, a recovery notice or nothing, and commits the
// resulting record to the store before returning.
//
// Evaluations of the same identity are serialised by a per-identity mutex.
// Different identities never wait on each other's evaluation.
class AlertEvaluator {
public:
  explicit AlertEvaluator(IAlertStore &store);

  // Fills the in-memory table from the store. Call once before evaluating.
  size_t initialize();

  EvaluationResult
  evaluate(const std::string &identity, bool is_problem, uint64_t now_ms,
           const Config::AlertSettings &settings,
           const std::optional<MetricSnapshot> &snapshot = std::nullopt);

  // One-shot notification without a lifecycle. Returns a NONE notification
  // when the type is disabled.
  Notification notify_event(const std::string &alert_type,
                            const std::string &identity,
                            const std::string &text, uint64_t now_ms,
                            const Config::AlertSettings &settings);

  // Administrative reset: marks the record inactive without a recovery
  // notice. Returns false for an identity that was never evaluated.
  bool reset(const std::string &identity);
  size_t reset_all();

  AlertRecordMap snapshot() const;
  size_t active_count() const;

private:
  std::mutex &identity_lock(const std::string &identity);
  std::optional<AlertRecord> cached_record(const std::string &identity) const;
  bool commit(const std::string &identity, const AlertRecord &record);

  IAlertStore &store_;

  mutable std::mutex table_mutex_;
  AlertRecordMap records_;
  std::map<std::string, std::unique_ptr<std::mutex>> identity_locks_;
};

#endif // ALERT_EVALUATOR_HPP
