#include "notifier.h"
#include <format>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace wick {

namespace {

constexpr auto telegram_host = "https://api.telegram.org";
constexpr auto max_queued_messages = 200uz;

} // namespace

TelegramNotifier::TelegramNotifier(std::string token,
                                   std::vector<std::string> chat_ids)
    : token_{std::move(token)}, chat_ids_{std::move(chat_ids)} {
  if (configured())
    worker_ = std::jthread{[this](std::stop_token stoken) { run(stoken); }};
  else
    std::println("📵 Telegram not configured, messages go to stdout only");
}

TelegramNotifier::~TelegramNotifier() {
  worker_.request_stop();
  if (worker_.joinable())
    worker_.join();
}

std::expected<void, NotifyError> TelegramNotifier::send(std::string_view text) {
  if (not configured()) {
    std::println("📨 {}", text);
    return std::unexpected(NotifyError::NotConfigured);
  }

  {
    auto lock = std::scoped_lock{mutex_};
    if (queue_.size() >= max_queued_messages) {
      std::println(stderr, "⚠️  Telegram queue full, dropping message");
      return std::unexpected(NotifyError::QueueFull);
    }
    queue_.emplace_back(text);
  }
  ready_.notify_one();
  return {};
}

void TelegramNotifier::run(std::stop_token stoken) {
  while (true) {
    auto text = std::string{};
    {
      auto lock = std::unique_lock{mutex_};
      if (not ready_.wait(lock, stoken, [this] { return not queue_.empty(); }))
        return; // Stop requested with nothing queued
      text = std::move(queue_.front());
      queue_.pop_front();
    }

    for (const auto &chat_id : chat_ids_)
      if (auto result = post(chat_id, text); not result)
        std::println(stderr, "⚠️  Telegram send to {} failed: {}", chat_id,
                     to_string(result.error()));
  }
}

std::expected<void, NotifyError>
TelegramNotifier::post(const std::string &chat_id, const std::string &text) {
  auto client = httplib::Client{telegram_host};
  client.set_connection_timeout(5);
  client.set_read_timeout(10);

  auto body = json{{"chat_id", chat_id},
                   {"text", text},
                   {"parse_mode", "HTML"},
                   {"disable_web_page_preview", true}};

  auto res = client.Post(std::format("/bot{}/sendMessage", token_), body.dump(),
                         "application/json");

  if (not res)
    return std::unexpected(NotifyError::NetworkError);

  if (res->status != 200) {
    std::println(stderr, "Telegram API error: status={}, body={}", res->status,
                 res->body);
    return std::unexpected(NotifyError::Rejected);
  }

  return {};
}

std::string_view to_string(NotifyError e) {
  switch (e) {
  case NotifyError::NotConfigured: return "not configured";
  case NotifyError::QueueFull: return "queue full";
  case NotifyError::NetworkError: return "network error";
  case NotifyError::Rejected: return "rejected";
  }
  return "unknown";
}

} // namespace wick
