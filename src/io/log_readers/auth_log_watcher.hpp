#ifndef AUTH_LOG_WATCHER_HPP
#define AUTH_LOG_WATCHER_HPP

#include "core/config.hpp"
#include "utils/utils.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <vector>

struct SshLogin {
  std::string timestamp; // As written by syslog, e.g. "Mar  3 10:15:42"
  std::string host;
  std::string user;
  std::string source_ip;
};

// Tails the sshd authentication log and reports accepted logins. The read
// offset survives restarts through a position file; a log that shrank
// (rotation or truncation) is read again from the start.
class AuthLogWatcher {
public:
  explicit AuthLogWatcher(const Config::SshConfig &config);

  // New logins since the previous call, excluded sources removed.
  std::vector<SshLogin> poll();

  static std::optional<SshLogin> parse_line(const std::string &line);
  bool is_excluded(const std::string &ip) const;

  uint64_t position() const { return position_; }

private:
  void load_position();
  void save_position() const;

  std::string log_path_;
  std::string position_file_;
  std::vector<Utils::CIDRBlock> excluded_blocks_;
  uint64_t position_ = 0;
};

#endif // AUTH_LOG_WATCHER_HPP
