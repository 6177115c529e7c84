#ifndef TELEGRAM_TRANSPORT_HPP
#define TELEGRAM_TRANSPORT_HPP

#include "core/config.hpp"
#include "io/transport/base_transport.hpp"

#include <string>

// Sends messages through the Telegram Bot API sendMessage method.
class TelegramTransport : public INotificationTransport {
public:
  // Throws std::runtime_error when api_url is not an http(s) URL.
  explicit TelegramTransport(const Config::TelegramConfig &config);

  bool send(const std::string &text) override;
  const char *get_name() const override { return "TelegramTransport"; }
  std::string get_transport_type() const override { return "telegram"; }

  bool has_valid_credentials() const;
  const std::string &request_path() const { return path_; }

private:
  bool send_once(const std::string &body, uint32_t attempt);

  Config::TelegramConfig config_;
  std::string base_url_;
  std::string path_;
};

#endif // TELEGRAM_TRANSPORT_HPP
