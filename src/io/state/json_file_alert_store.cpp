#include "json_file_alert_store.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <cstdio>
#include <fstream>
#include <sstream>
#include <string>

JsonFileAlertStore::JsonFileAlertStore(const std::string &file_path)
    : file_path_(file_path) {
  read_from_disk();
}

void JsonFileAlertStore::read_from_disk() {
  records_.clear();

  std::ifstream in(file_path_);
  if (!in.is_open()) {
    LOG(LogLevel::INFO, LogComponent::STATE_PERSIST,
        "No alert state file at " << file_path_ << ", starting empty");
    return;
  }

  std::stringstream buffer;
  buffer << in.rdbuf();
  const std::string content = buffer.str();
  if (Utils::trim_copy(content).empty())
    return;

  try {
    nlohmann::json doc = nlohmann::json::parse(content);
    int version = doc.value("version", 0);
    if (version != FORMAT_VERSION) {
      LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
          "Alert state file " << file_path_ << " has unsupported version "
                              << version << ", starting empty");
      move_aside();
      return;
    }

    auto alerts_it = doc.find("alerts");
    if (alerts_it == doc.end() || !alerts_it->is_object())
      return;

    for (auto it = alerts_it->begin(); it != alerts_it->end(); ++it) {
      auto record = JsonFormatter::record_from_json_object(it.value());
      if (!record) {
        LOG(LogLevel::WARN, LogComponent::STATE_PERSIST,
            "Skipping malformed alert record '" << it.key() << "' in "
                                                << file_path_);
        continue;
      }
      if (record->alert_type.empty())
        record->alert_type = alert_type_of(it.key());
      records_[it.key()] = *record;
    }

    LOG(LogLevel::INFO, LogComponent::STATE_PERSIST,
        "Loaded " << records_.size() << " alert records from " << file_path_);
  } catch (const nlohmann::json::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
        "Alert state file " << file_path_
                            << " is corrupt, starting empty: " << e.what());
    records_.clear();
    move_aside();
  }
}

void JsonFileAlertStore::move_aside() const {
  const std::string target = file_path_ + CORRUPT_SUFFIX;
  if (std::rename(file_path_.c_str(), target.c_str()) != 0) {
    LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
        "Could not move " << file_path_ << " to " << target
                          << ", the next save will overwrite it");
    return;
  }
  LOG(LogLevel::WARN, LogComponent::STATE_PERSIST,
      "Previous alert state kept in " << target);
}

bool JsonFileAlertStore::write_to_disk() const {
  nlohmann::json doc;
  doc["version"] = FORMAT_VERSION;
  doc["alerts"] = nlohmann::json::object();
  for (const auto &[identity, record] : records_)
    doc["alerts"][identity] = JsonFormatter::record_to_json_object(record);

  std::string serialized;
  try {
    serialized = doc.dump(2);
  } catch (const nlohmann::json::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
        "Failed to serialise alert state: " << e.what());
    return false;
  }

  if (!Utils::write_file_atomically(file_path_, serialized + "\n")) {
    LOG(LogLevel::ERROR, LogComponent::STATE_PERSIST,
        "Failed to write alert state file " << file_path_);
    return false;
  }
  return true;
}

std::optional<AlertRecord>
JsonFileAlertStore::load(const std::string &identity) {
  std::lock_guard<std::mutex> lock(mutex_);
  auto it = records_.find(identity);
  if (it == records_.end())
    return std::nullopt;
  return it->second;
}

bool JsonFileAlertStore::save(const std::string &identity,
                              const AlertRecord &record) {
  std::lock_guard<std::mutex> lock(mutex_);
  records_[identity] = record;
  bool ok = write_to_disk();
  if (ok)
    LOG(LogLevel::TRACE, LogComponent::STATE_PERSIST,
        "Persisted alert record " << identity);
  return ok;
}

AlertRecordMap JsonFileAlertStore::load_all() {
  std::lock_guard<std::mutex> lock(mutex_);
  return records_;
}
