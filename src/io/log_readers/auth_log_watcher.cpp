#include "auth_log_watcher.hpp"
#include "core/logger.hpp"

#include <filesystem>
#include <fstream>
#include <regex>
#include <system_error>

AuthLogWatcher::AuthLogWatcher(const Config::SshConfig &config)
    : log_path_(config.auth_log_path), position_file_(config.position_file) {
  for (const auto &entry : config.excluded_ips) {
    if (auto block = Utils::parse_cidr(entry))
      excluded_blocks_.push_back(*block);
    else
      LOG(LogLevel::WARN, LogComponent::IO_SSH,
          "Ignoring invalid excluded_ips entry: " << entry);
  }
  load_position();
}

void AuthLogWatcher::load_position() {
  if (position_file_.empty())
    return;
  auto content = Utils::read_file_string(position_file_);
  if (!content)
    return;
  position_ =
      Utils::string_to_number<uint64_t>(Utils::trim_copy(*content)).value_or(0);
}

void AuthLogWatcher::save_position() const {
  if (position_file_.empty())
    return;
  if (!Utils::write_file_atomically(position_file_,
                                    std::to_string(position_) + "\n"))
    LOG(LogLevel::WARN, LogComponent::IO_SSH,
        "Could not save auth log position to " << position_file_);
}

std::optional<SshLogin> AuthLogWatcher::parse_line(const std::string &line) {
  static const std::regex ssh_pattern(
      R"((\w+\s+\d+\s+\d+:\d+:\d+)\s+(\S+)\s+sshd\[\d+\]:\s+Accepted\s+\S+\s+for\s+(\S+)\s+from\s+(\S+))");
  std::smatch match;
  if (!std::regex_search(line, match, ssh_pattern))
    return std::nullopt;
  return SshLogin{match[1].str(), match[2].str(), match[3].str(),
                  match[4].str()};
}

bool AuthLogWatcher::is_excluded(const std::string &ip) const {
  auto addr = Utils::ip_string_to_uint32(ip);
  if (!addr)
    return true; // Not an IPv4 address, nothing to report on
  for (const auto &block : excluded_blocks_)
    if (block.contains(*addr))
      return true;
  return false;
}

std::vector<SshLogin> AuthLogWatcher::poll() {
  std::vector<SshLogin> logins;

  std::error_code ec;
  uint64_t size = std::filesystem::file_size(log_path_, ec);
  if (ec) {
    LOG(LogLevel::WARN, LogComponent::IO_SSH,
        "Auth log " << log_path_ << " not readable: " << ec.message());
    return logins;
  }

  if (size < position_) {
    LOG(LogLevel::INFO, LogComponent::IO_SSH,
        "Auth log " << log_path_ << " shrank, reading from the start");
    position_ = 0;
  }
  if (size == position_)
    return logins;

  std::ifstream log_stream(log_path_, std::ios::binary);
  if (!log_stream.is_open()) {
    LOG(LogLevel::WARN, LogComponent::IO_SSH,
        "Could not open auth log " << log_path_);
    return logins;
  }
  log_stream.seekg(static_cast<std::streamoff>(position_));

  std::string line;
  uint64_t consumed = position_;
  while (std::getline(log_stream, line)) {
    // A line without its newline is still being written
    if (log_stream.eof())
      break;
    consumed += line.size() + 1;

    auto login = parse_line(line);
    if (!login)
      continue;
    if (is_excluded(login->source_ip)) {
      LOG(LogLevel::DEBUG, LogComponent::IO_SSH,
          "SSH login from " << login->source_ip << " excluded");
      continue;
    }
    LOG(LogLevel::INFO, LogComponent::IO_SSH,
        "SSH login detected: " << login->user << " from " << login->source_ip
                               << " on " << login->host);
    logins.push_back(*login);
  }

  position_ = consumed;
  save_position();
  return logins;
}
