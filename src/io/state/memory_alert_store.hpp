#ifndef MEMORY_ALERT_STORE_HPP
#define MEMORY_ALERT_STORE_HPP

#include "base_alert_store.hpp"

#include <mutex>

// Process-lifetime store, used when state_file_path is empty.
class MemoryAlertStore : public IAlertStore {
public:
  std::optional<AlertRecord> load(const std::string &identity) override {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = records_.find(identity);
    if (it == records_.end())
      return std::nullopt;
    return it->second;
  }

  bool save(const std::string &identity, const AlertRecord &record) override {
    std::lock_guard<std::mutex> lock(mutex_);
    records_[identity] = record;
    return true;
  }

  AlertRecordMap load_all() override {
    std::lock_guard<std::mutex> lock(mutex_);
    return records_;
  }

  const char *get_name() const override { return "MemoryAlertStore"; }

private:
  std::mutex mutex_;
  AlertRecordMap records_;
};

#endif // MEMORY_ALERT_STORE_HPP
