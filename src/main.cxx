#include "config.h"
#include "control_server.h"
#include "engine.h"
#include "engine_state.h"
#include "mexc_client.h"
#include "notifier.h"
#include "trade_log.h"
#include <atomic>
#include <chrono>
#include <csignal>
#include <print>
#include <thread>

// wickscan - perpetuals wick scanner

namespace {
std::atomic<bool> quit{false};

void on_signal(int) { quit = true; }
} // namespace

int main() {
  using namespace std::chrono_literals;

  const auto config = wick::load_config();
  std::println("🚀 wickscan ({})", wick::to_string(config.strategy));

  std::signal(SIGINT, on_signal);
  std::signal(SIGTERM, on_signal);

  auto exchange = std::make_shared<wick::MexcClient>();
  auto notifier = wick::TelegramNotifier{config.telegram_token, config.telegram_chat_ids};
  auto trade_log = wick::CsvTradeLog{config.trade_log_dir};
  auto engine = wick::Engine{config.strategy, exchange, notifier, trade_log, config.state_file};

  // Resume a previous session
  auto enabled = true;
  if (auto state = wick::load_state(config.state_file)) {
    engine.restore(*state);
    enabled = state->enabled;
  } else if (state.error() != wick::StateError::NotFound) {
    std::println(stderr, "⚠️  {}: {}, starting fresh", config.state_file,
                 wick::to_string(state.error()));
  }

  if (enabled) {
    if (auto started = engine.start(); not started)
      std::println(stderr, "❌ Engine not started: {}", wick::to_string(started.error()));
  } else {
    std::println("⏸️  Engine disabled in saved state, POST /run to start");
  }

  auto control = wick::ControlServer{engine, config.control_host, config.control_port};
  if (not control.start())
    return 1;

  while (not quit)
    std::this_thread::sleep_for(200ms);

  std::println("\n👋 Shutting down");
  control.stop();
  engine.shutdown();
}
