#include "file_transport.hpp"
#include "core/logger.hpp"
#include "utils/json_formatter.hpp"
#include "utils/utils.hpp"

#include <string>

FileTransport::FileTransport(const std::string &file_path)
    : output_path_(file_path) {
  if (!output_path_.empty()) {
    Utils::create_directory_for_file(output_path_);
    output_stream_.open(output_path_, std::ios::app);
    if (!output_stream_.is_open())
      LOG(LogLevel::ERROR, LogComponent::IO_TRANSPORT,
          "FileTransport could not open notification file: " << output_path_);
  }
}

FileTransport::~FileTransport() {
  if (output_stream_.is_open()) {
    output_stream_.flush();
    output_stream_.close();
  }
}

bool FileTransport::send(const std::string &text) {
  std::lock_guard<std::mutex> lock(stream_mutex_);
  if (!output_stream_.is_open())
    return false;

  try {
    std::string line = JsonFormatter::format_notification_line(
        Utils::get_current_time_ms(), text);
    output_stream_ << line << std::endl; // endl also flushes

    if (output_stream_.good()) {
      LOG(LogLevel::TRACE, LogComponent::IO_TRANSPORT,
          "Notification written to file: " << output_path_);
      return true;
    }
    LOG(LogLevel::ERROR, LogComponent::IO_TRANSPORT,
        "Failed to write notification to file: " << output_path_);
    return false;
  } catch (const std::exception &e) {
    LOG(LogLevel::ERROR, LogComponent::IO_TRANSPORT,
        "Exception while writing notification to file: " << e.what());
    return false;
  }
}
