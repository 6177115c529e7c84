#ifndef JSON_FILE_ALERT_STORE_HPP
#define JSON_FILE_ALERT_STORE_HPP

#include "base_alert_store.hpp"

#include <mutex>
#include <string>

// Keeps every record in one JSON document:
//   {"version": 1, "alerts": {"<identity>": {...}, ...}}
// Each save rewrites the document through a temporary file and a rename, so a
// crash leaves either the previous or the new document on disk.
class JsonFileAlertStore : public IAlertStore {
public:
  explicit JsonFileAlertStore(const std::string &file_path);

  std::optional<AlertRecord> load(const std::string &identity) override;
  bool save(const std::string &identity, const AlertRecord &record) override;
  AlertRecordMap load_all() override;
  const char *get_name() const override { return "JsonFileAlertStore"; }

  static constexpr int FORMAT_VERSION = 1;
  // An unreadable document is renamed to "<path>.corrupt" before loading empty.
  static constexpr const char *CORRUPT_SUFFIX = ".corrupt";

private:
  void read_from_disk();
  void move_aside() const;
  bool write_to_disk() const;

  std::string file_path_;
  mutable std::mutex mutex_;
  AlertRecordMap records_;
};

#endif // JSON_FILE_ALERT_STORE_HPP
