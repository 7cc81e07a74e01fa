#include "config.h"
#include <charconv>
#include <cstdlib>
#include <print>

namespace wick {

std::string get_env_or_default(std::string_view name,
                               std::string_view default_val) {
  if (const auto *val = std::getenv(std::string{name}.c_str()))
    return val;
  return std::string{default_val};
}

namespace {

std::vector<std::string> split_csv(std::string_view text) {
  auto parts = std::vector<std::string>{};
  while (not text.empty()) {
    auto comma = text.find(',');
    auto item = text.substr(0, comma);
    while (not item.empty() and item.front() == ' ')
      item.remove_prefix(1);
    while (not item.empty() and item.back() == ' ')
      item.remove_suffix(1);
    if (not item.empty())
      parts.emplace_back(item);
    if (comma == std::string_view::npos)
      break;
    text.remove_prefix(comma + 1);
  }
  return parts;
}

} // namespace

Config load_config() {
  auto config = Config{};

  auto strategy = get_env_or_default("WICK_STRATEGY", "wick_spike");
  if (strategy == "range_dca")
    config.strategy = Strategy::RangeDca;
  else if (strategy != "wick_spike")
    std::println(stderr, "⚠️  Unknown WICK_STRATEGY '{}', using wick_spike",
                 strategy);

  config.telegram_token = get_env_or_default("TELEGRAM_BOT_TOKEN", "");
  config.telegram_chat_ids =
      split_csv(get_env_or_default("TELEGRAM_CHAT_IDS", ""));
  config.state_file =
      get_env_or_default("WICK_STATE_FILE", "wickscan_state.json");
  config.trade_log_dir = get_env_or_default("WICK_TRADE_LOG_DIR", ".");
  config.control_host = get_env_or_default("WICK_CONTROL_HOST", "127.0.0.1");

  auto port_text = get_env_or_default("WICK_CONTROL_PORT", "8085");
  auto port = 0;
  auto [ptr, ec] = std::from_chars(port_text.data(),
                                   port_text.data() + port_text.size(), port);
  if (ec != std::errc{} or port <= 0 or port > 65535) {
    std::println(stderr, "⚠️  Invalid WICK_CONTROL_PORT '{}', using 8085",
                 port_text);
    port = 8085;
  }
  config.control_port = port;

  return config;
}

std::string_view to_string(Strategy strategy) {
  return strategy == Strategy::RangeDca ? "range_dca" : "wick_spike";
}

} // namespace wick
