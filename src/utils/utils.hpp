#ifndef UTILS_HPP
#define UTILS_HPP

#include <algorithm>
#include <cctype>
#include <charconv>
#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <vector>

namespace Utils {
std::vector<std::string> split_string(const std::string &text, char delimiter);
uint64_t get_current_time_ms();
std::string get_hostname();
// First non-loopback IPv4 address of an interface that is up, or "unknown".
std::string get_local_ip();

// "1h 2m 3s", "5m 0s", "42s"
std::string format_duration(uint64_t duration_ms);

std::optional<std::string> read_file_string(const std::string &path);

bool create_directory_for_file(const std::string &file_path);

// Writes and fsyncs "<path>.tmp", then renames it over path.
bool write_file_atomically(const std::string &path, const std::string &content);

struct CIDRBlock {
  uint32_t network_address = 0;
  uint32_t netmask = 0;

  bool contains(uint32_t ip) const;
};

std::optional<CIDRBlock> parse_cidr(std::string_view cidr_string);
std::optional<uint32_t> ip_string_to_uint32(std::string_view ip_str);

template <typename T> std::optional<T> string_to_number(std::string_view s) {
  if (s.empty())
    return std::nullopt;

  T value;
  auto [ptr, ec] = std::from_chars(s.data(), s.data() + s.size(), value);

  if (ec == std::errc() && ptr == s.data() + s.size())
    return value;
  return std::nullopt;
}

inline void ltrim_inplace(std::string &s) {
  s.erase(s.begin(), std::find_if(s.begin(), s.end(), [](unsigned char ch) {
            return !std::isspace(ch);
          }));
}

inline void rtrim_inplace(std::string &s) {
  s.erase(std::find_if(s.rbegin(), s.rend(),
                       [](unsigned char ch) { return !std::isspace(ch); })
              .base(),
          s.end());
}

inline void trim_inplace(std::string &s) {
  ltrim_inplace(s);
  rtrim_inplace(s);
}

inline std::string trim_copy(std::string_view sv) {
  std::string s{sv};
  trim_inplace(s);
  return s;
}

inline std::string to_lower_copy(std::string_view sv) {
  std::string s{sv};
  std::transform(s.begin(), s.end(), s.begin(),
                 [](unsigned char c) { return std::tolower(c); });
  return s;
}
} // namespace Utils

#endif // UTILS_HPP
