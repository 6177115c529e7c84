#include "io/transport/telegram_transport.hpp"
#include "core/logger.hpp"
#include "httplib.h"
#include "nlohmann/json.hpp"

#include <chrono>
#include <regex>
#include <stdexcept>
#include <thread>

TelegramTransport::TelegramTransport(const Config::TelegramConfig &config)
    : config_(config) {
  // Group 1: scheme and authority, e.g. https://api.telegram.org
  // Group 2: optional path prefix, e.g. /proxy
  std::regex url_regex(R"(^(https?:\/\/[^\/]+)(\/.*)?$)");
  std::smatch match;

  if (!std::regex_match(config_.api_url, match, url_regex))
    throw std::runtime_error("Invalid Telegram api_url: " + config_.api_url);

  base_url_ = match[1].str();
  std::string prefix = match[2].matched ? match[2].str() : "";
  while (!prefix.empty() && prefix.back() == '/')
    prefix.pop_back();
  path_ = prefix + "/bot" + config_.bot_token + "/sendMessage";

  LOG(LogLevel::TRACE, LogComponent::IO_TRANSPORT,
      "TelegramTransport initialized for " << base_url_ << " | Chat: "
                                           << config_.chat_id);
}

bool TelegramTransport::has_valid_credentials() const {
  // "token" and "id" are the placeholders shipped in sample configs
  return !config_.bot_token.empty() && !config_.chat_id.empty() &&
         config_.bot_token != "token" && config_.chat_id != "id";
}

bool TelegramTransport::send_once(const std::string &body, uint32_t attempt) {
  httplib::Client client(base_url_);
  client.set_connection_timeout(config_.timeout_seconds, 0);
  client.set_read_timeout(config_.timeout_seconds, 0);
  client.set_write_timeout(config_.timeout_seconds, 0);

  auto res = client.Post(path_, body, "application/json");
  if (!res) {
    LOG(LogLevel::WARN, LogComponent::IO_TRANSPORT,
        "Telegram attempt " << attempt << " failed: "
                            << httplib::to_string(res.error()));
    return false;
  }

  if (res->status < 200 || res->status >= 300) {
    LOG(LogLevel::WARN, LogComponent::IO_TRANSPORT,
        "Telegram attempt " << attempt << " rejected | Status: "
                            << res->status << " | Body: " << res->body);
    return false;
  }

  nlohmann::json reply = nlohmann::json::parse(res->body, nullptr, false);
  if (reply.is_discarded() || !reply.value("ok", false)) {
    LOG(LogLevel::WARN, LogComponent::IO_TRANSPORT,
        "Telegram attempt " << attempt
                            << " returned a non-ok reply: " << res->body);
    return false;
  }
  return true;
}

bool TelegramTransport::send(const std::string &text) {
  if (!has_valid_credentials()) {
    LOG(LogLevel::ERROR, LogComponent::IO_TRANSPORT,
        "Telegram bot token or chat id missing, message not sent");
    return false;
  }

  nlohmann::json body;
  body["chat_id"] = config_.chat_id;
  body["text"] = text;
  if (!config_.parse_mode.empty())
    body["parse_mode"] = config_.parse_mode;
  const std::string payload = body.dump();

  uint32_t attempts = config_.max_retries > 0 ? config_.max_retries : 1;
  for (uint32_t attempt = 1; attempt <= attempts; ++attempt) {
    if (send_once(payload, attempt)) {
      LOG(LogLevel::DEBUG, LogComponent::IO_TRANSPORT,
          "Telegram message delivered on attempt " << attempt);
      return true;
    }
    if (attempt < attempts)
      std::this_thread::sleep_for(
          std::chrono::milliseconds(config_.retry_delay_ms));
  }

  LOG(LogLevel::ERROR, LogComponent::IO_TRANSPORT,
      "Telegram message not delivered after " << attempts << " attempts");
  return false;
}
