#include "utils.hpp"

#include <cerrno>
#include <chrono>
#include <cstdint>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <optional>
#include <sstream>
#include <string>
#include <string_view>
#include <system_error>
#include <arpa/inet.h>
#include <fcntl.h>
#include <ifaddrs.h>
#include <net/if.h>
#include <netinet/in.h>
#include <unistd.h>
#include <vector>

namespace Utils {

std::vector<std::string> split_string(const std::string &text, char delimiter) {
  std::vector<std::string> tokens;
  std::string current_token;
  std::istringstream token_stream(text);

  while (std::getline(token_stream, current_token, delimiter)) {
    tokens.push_back(current_token);
  }
  return tokens;
}

uint64_t get_current_time_ms() {
  auto now = std::chrono::system_clock::now();
  auto epoch = now.time_since_epoch();
  auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(epoch);
  return ms.count();
}

std::string get_hostname() {
  char buffer[256] = {0};
  if (gethostname(buffer, sizeof(buffer) - 1) != 0)
    return "localhost";
  return buffer;
}

std::string get_local_ip() {
  struct ifaddrs *interfaces = nullptr;
  if (getifaddrs(&interfaces) != 0)
    return "unknown";

  std::string address = "unknown";
  for (struct ifaddrs *ifa = interfaces; ifa != nullptr; ifa = ifa->ifa_next) {
    if (ifa->ifa_addr == nullptr || ifa->ifa_addr->sa_family != AF_INET)
      continue;
    if ((ifa->ifa_flags & IFF_LOOPBACK) || !(ifa->ifa_flags & IFF_UP))
      continue;

    char buffer[INET_ADDRSTRLEN] = {0};
    const auto *sin = reinterpret_cast<const struct sockaddr_in *>(ifa->ifa_addr);
    if (inet_ntop(AF_INET, &sin->sin_addr, buffer, sizeof(buffer)) != nullptr) {
      address = buffer;
      break;
    }
  }
  freeifaddrs(interfaces);
  return address;
}

std::string format_duration(uint64_t duration_ms) {
  uint64_t total_seconds = duration_ms / 1000;
  uint64_t hours = total_seconds / 3600;
  uint64_t minutes = (total_seconds % 3600) / 60;
  uint64_t seconds = total_seconds % 60;

  std::ostringstream oss;
  if (hours > 0)
    oss << hours << "h " << minutes << "m " << seconds << "s";
  else if (minutes > 0)
    oss << minutes << "m " << seconds << "s";
  else
    oss << seconds << "s";
  return oss.str();
}

std::optional<std::string> read_file_string(const std::string &path) {
  std::ifstream in(path);
  if (!in.is_open())
    return std::nullopt;
  std::ostringstream buffer;
  buffer << in.rdbuf();
  if (in.bad())
    return std::nullopt;
  return buffer.str();
}

bool create_directory_for_file(const std::string &file_path) {
  std::filesystem::path parent = std::filesystem::path(file_path).parent_path();
  if (parent.empty())
    return true;

  std::error_code ec;
  std::filesystem::create_directories(parent, ec);
  return !ec;
}

bool write_file_atomically(const std::string &path,
                           const std::string &content) {
  if (!create_directory_for_file(path))
    return false;

  const std::string temp_path = path + ".tmp";
  int fd = ::open(temp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC,
                  0644);
  if (fd < 0)
    return false;

  const char *data = content.data();
  size_t remaining = content.size();
  bool ok = true;
  while (remaining > 0) {
    ssize_t written = ::write(fd, data, remaining);
    if (written < 0) {
      if (errno == EINTR)
        continue;
      ok = false;
      break;
    }
    data += written;
    remaining -= static_cast<size_t>(written);
  }
  // Data must be on disk before the rename makes it visible
  if (ok && ::fsync(fd) != 0)
    ok = false;
  if (::close(fd) != 0)
    ok = false;
  if (!ok) {
    std::remove(temp_path.c_str());
    return false;
  }

  if (std::rename(temp_path.c_str(), path.c_str()) != 0) {
    std::remove(temp_path.c_str());
    return false;
  }
  return true;
}

bool CIDRBlock::contains(uint32_t ip) const {
  return (ip & netmask) == network_address;
}

std::optional<uint32_t> ip_string_to_uint32(std::string_view ip_str) {
  uint32_t ip_uint = 0;
  int octets = 0;

  size_t start = 0;
  while (start <= ip_str.size()) {
    size_t end = ip_str.find('.', start);
    if (end == std::string_view::npos)
      end = ip_str.size();

    auto octet = string_to_number<unsigned int>(ip_str.substr(start, end - start));
    if (!octet || *octet > 255 || octets == 4)
      return std::nullopt;

    ip_uint = (ip_uint << 8) | *octet;
    octets++;
    start = end + 1;
  }
  if (octets != 4)
    return std::nullopt;
  return ip_uint;
}

std::optional<CIDRBlock> parse_cidr(std::string_view cidr_string) {
  size_t slash_pos = cidr_string.find('/');
  if (slash_pos == std::string_view::npos) {
    auto ip = ip_string_to_uint32(cidr_string);
    if (!ip)
      return std::nullopt;
    return CIDRBlock{*ip, 0xFFFFFFFF};
  }

  auto ip = ip_string_to_uint32(cidr_string.substr(0, slash_pos));
  if (!ip)
    return std::nullopt;

  auto mask_len = string_to_number<int>(cidr_string.substr(slash_pos + 1));
  if (!mask_len || *mask_len < 0 || *mask_len > 32)
    return std::nullopt;

  uint32_t netmask = (*mask_len == 0) ? 0 : (0xFFFFFFFF << (32 - *mask_len));

  return CIDRBlock{*ip & netmask, netmask};
}

} // namespace Utils
