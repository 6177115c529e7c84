#ifndef FILE_TRANSPORT_HPP
#define FILE_TRANSPORT_HPP

#include "base_transport.hpp"

#include <fstream>
#include <mutex>
#include <string>

// Appends one JSON object per message: {"timestamp_ms": ..., "text": "..."}
class FileTransport : public INotificationTransport {
public:
  explicit FileTransport(const std::string &file_path);
  ~FileTransport() override;

  bool send(const std::string &text) override;
  const char *get_name() const override { return "FileTransport"; }
  std::string get_transport_type() const override { return "file"; }

private:
  std::string output_path_;
  std::ofstream output_stream_;
  std::mutex stream_mutex_;
};

#endif // FILE_TRANSPORT_HPP
