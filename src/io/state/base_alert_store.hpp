#ifndef BASE_ALERT_STORE_HPP
#define BASE_ALERT_STORE_HPP

#include "core/alert.hpp"

#include <map>
#include <optional>
#include <string>

using AlertRecordMap = std::map<std::string, AlertRecord>;

// Durable mapping from alert identity to its lifecycle record.
class IAlertStore {
public:
  virtual ~IAlertStore() = default;
  virtual std::optional<AlertRecord> load(const std::string &identity) = 0;
  // Returns false when the record could not be made durable.
  virtual bool save(const std::string &identity, const AlertRecord &record) = 0;
  virtual AlertRecordMap load_all() = 0;
  virtual const char *get_name() const = 0;
};

#endif // BASE_ALERT_STORE_HPP
