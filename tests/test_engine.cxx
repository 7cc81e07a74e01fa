// Unit tests for the universe filter and the engine
#include "defs.h"
#include "engine.h"
#include "engine_state.h"
#include "fakes.h"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <filesystem>
#include <format>
#include <random>

using Catch::Matchers::WithinAbs;
using namespace wick;
using namespace std::chrono_literals;

namespace {

// Fresh directory under the system temp path, removed on scope exit
struct TempDir {
  std::filesystem::path path;

  TempDir() {
    auto rng = std::random_device{};
    path = std::filesystem::temp_directory_path() /
           std::format("wickscan-test-{:x}", rng());
    std::filesystem::create_directories(path);
  }
  ~TempDir() {
    auto ec = std::error_code{};
    std::filesystem::remove_all(path, ec);
  }
};

// Calm history closed by a high-volume shooting star
Series shooting_star(TimePoint now) {
  const auto t = test::last_closed_open(now);
  auto bars = test::quiet_bars(t, 59);
  bars.push_back(Bar{t, 100.0, 100.35, 99.98, 100.05, 5000.0});
  return bars;
}

// Listed, liquid symbols with calm history; ABC_USDT just printed a shooting star
void calm_market(test::FakeExchange &exchange, TimePoint now) {
  for (auto symbol : {"ABC_USDT", "DEF_USDT", "BTC_USDT"}) {
    exchange.add_market(symbol, 0.001);
    exchange.set_price(symbol, 100.0);
  }
  exchange.set_bars("DEF_USDT", timeframe, test::quiet_bars(test::last_closed_open(now), 60));
  exchange.set_bars("ABC_USDT", timeframe, shooting_star(now));
}

} // namespace

TEST_CASE("Universe keeps liquid USDT pairs", "[engine]") {
  auto tickers = std::map<std::string, Ticker>{};
  auto markets = std::map<std::string, MarketInfo>{};
  auto list = [&](std::string symbol, std::string base, std::string quote, double last,
                  double volume) {
    tickers[symbol] = Ticker{symbol, last, last, last, volume};
    markets[symbol] = MarketInfo{symbol, base, quote, 0.01};
  };

  list("SOL_USDT", "SOL", "USDT", 150.0, 5e6);
  list("ABC_USDT", "ABC", "USDT", 2.0, 400'000.0);
  list("USDC_USDT", "USDC", "USDT", 1.0, 9e7);
  list("EURC_USDT", "EURC", "USDT", 1.08, 9e7);
  list("THIN_USDT", "THIN", "USDT", 3.0, 299'999.0);
  list("DUST_USDT", "DUST", "USDT", 0.0009, 1e6);
  list("ETH_USDC", "ETH", "USDC", 3000.0, 1e8);
  markets["GHOST_USDT"] = MarketInfo{"GHOST_USDT", "GHOST", "USDT", 0.01};

  const auto universe = build_universe(tickers, markets);

  REQUIRE(universe.size() == 2);
  REQUIRE(universe[0].symbol == "ABC_USDT");
  REQUIRE(universe[1].symbol == "SOL_USDT");
  REQUIRE(universe[1].tick_size == 0.01);

  REQUIRE(is_stable_base("FDUSD"));
  REQUIRE_FALSE(is_stable_base("BTC"));
}

TEST_CASE("A scan opens the spike and skips the rest", "[engine]") {
  auto exchange = std::make_shared<test::FakeExchange>();
  auto notifier = test::RecordingNotifier{};
  auto trade_log = test::MemoryTradeLog{};
  auto engine = Engine{Strategy::WickSpike, exchange, notifier, trade_log, {},
                       test::quick_policy()};

  const auto now = Clock::now();
  calm_market(*exchange, now);
  exchange->add_market("USDC_USDT", 0.0001);
  exchange->set_price("USDC_USDT", 1.0);

  // Live price near the planned short entry
  exchange->set_price("ABC_USDT", 100.27);

  const auto report = engine.scan_once(now);
  engine.wait_for_openers();

  REQUIRE(report.universe == 3);
  REQUIRE(report.processed == 3);
  REQUIRE(report.passed == 1);
  REQUIRE(report.scored == 1);
  REQUIRE(report.vetoed == 0);
  REQUIRE(report.dispatched == 1);
  REQUIRE_FALSE(report.trade_cap_hit);
  REQUIRE_FALSE(report.budget_exhausted);

  REQUIRE(engine.positions().count() == 1);
  const auto pos = *engine.positions().find_symbol("ABC_USDT");
  REQUIRE(pos.side == Side::Short);
  REQUIRE(pos.target_price < pos.entry_price);
  REQUIRE(engine.reservations().size() == 0);
  REQUIRE(engine.cooldowns().is_active("ABC_USDT", Clock::now()));
  REQUIRE(trade_log.opens.size() == 1);

  const auto status = engine.status();
  REQUIRE(status.active == 1);
  REQUIRE(status.opened == 1);
  REQUIRE(status.rotation_offset == 0);

  // The open was still settling when the threshold moved
  REQUIRE_THAT(report.threshold, WithinAbs(threshold_base - explore_step, 1e-9));

  SECTION("The open symbol is not signalled again") {
    const auto again = engine.scan_once(now);
    REQUIRE(again.passed == 0);
    REQUIRE(again.dispatched == 0);

    // A confirmed open holds exploration back
    REQUIRE_THAT(again.threshold, WithinAbs(report.threshold, 1e-9));
  }

  SECTION("Manual close") {
    REQUIRE(engine.force_close("") == 0);
    REQUIRE(engine.force_close("ABC_USDT") == 1);
    REQUIRE(engine.positions().count() == 0);
    REQUIRE(trade_log.closes.size() == 1);
    REQUIRE(trade_log.closes[0].exit_reason == ExitReason::Manual);
  }
}

TEST_CASE("A dispatch without a touch does not hold exploration back", "[engine]") {
  auto exchange = std::make_shared<test::FakeExchange>();
  auto notifier = test::RecordingNotifier{};
  auto trade_log = test::MemoryTradeLog{};
  auto engine = Engine{Strategy::WickSpike, exchange, notifier, trade_log, {},
                       test::quick_policy()};

  const auto now = Clock::now();
  calm_market(*exchange, now);
  exchange->set_price("ABC_USDT", 101.5);

  const auto report = engine.scan_once(now);
  engine.wait_for_openers();
  REQUIRE(report.dispatched == 1);
  REQUIRE(engine.status().no_touch == 1);
  REQUIRE(engine.positions().count() == 0);
  REQUIRE_THAT(report.threshold, WithinAbs(threshold_base - explore_step, 1e-9));

  // Still nothing opened, so the next quiet scan explores further
  exchange->set_bars("ABC_USDT", timeframe, test::quiet_bars(test::last_closed_open(now), 60));
  const auto again = engine.scan_once(now);
  REQUIRE(again.dispatched == 0);
  REQUIRE_THAT(again.threshold, WithinAbs(threshold_base - 2 * explore_step, 1e-9));
}

TEST_CASE("A scan stops opening at the trade cap", "[engine]") {
  auto exchange = std::make_shared<test::FakeExchange>();
  auto notifier = test::RecordingNotifier{};
  auto trade_log = test::MemoryTradeLog{};
  auto engine = Engine{Strategy::WickSpike, exchange, notifier, trade_log, {},
                       test::quick_policy()};

  const auto now = Clock::now();
  const auto spikes = std::vector<std::string>{"AAA_USDT", "BBB_USDT", "CCC_USDT", "DDD_USDT"};
  for (const auto &symbol : spikes) {
    exchange->add_market(symbol, 0.001);
    exchange->set_price(symbol, 100.27);
    exchange->set_bars(symbol, timeframe, shooting_star(now));
  }

  const auto report = engine.scan_once(now);
  engine.wait_for_openers();

  REQUIRE(report.passed == spikes.size());
  REQUIRE(report.scored == spikes.size());
  REQUIRE(report.dispatched == max_trades_per_scan);
  REQUIRE(report.trade_cap_hit);

  // Regular update first (exploring, nothing confirmed yet), then the bump
  REQUIRE_THAT(report.threshold,
               WithinAbs(threshold_base - explore_step + trades_per_scan_bump, 1e-9));
  REQUIRE_THAT(engine.threshold().state().last_delta, WithinAbs(trades_per_scan_bump, 1e-9));

  REQUIRE(engine.positions().count() == max_trades_per_scan);
  REQUIRE(engine.reservations().size() == 0);
  REQUIRE(trade_log.opens.size() == max_trades_per_scan);
}

TEST_CASE("A scan stops at its time budget", "[engine]") {
  auto exchange = std::make_shared<test::FakeExchange>();
  auto notifier = test::RecordingNotifier{};
  auto trade_log = test::MemoryTradeLog{};
  auto policy = test::quick_policy();
  policy.concurrency = 1;
  auto engine = Engine{Strategy::WickSpike, exchange, notifier, trade_log, {},
                       policy, ScanPolicy{300ms}};

  const auto now = Clock::now();
  for (auto i = 0; i < 6; ++i) {
    const auto symbol = std::format("Q{}_USDT", i);
    exchange->add_market(symbol, 0.001);
    exchange->set_price(symbol, 100.0);
    exchange->set_bars(symbol, timeframe, test::quiet_bars(test::last_closed_open(now), 60));
  }

  // Every request takes 60ms, so the budget runs out inside the first chunk
  exchange->set_delay(60ms);
  const auto report = engine.scan_once(now);

  REQUIRE(report.universe == 6);
  REQUIRE(report.budget_exhausted);
  REQUIRE(report.processed >= 1);
  REQUIRE(report.processed < report.universe);

  // The next scan starts with the first symbol not yet processed
  REQUIRE(engine.status().rotation_offset == report.processed);
}

TEST_CASE("A scan without candidates still moves the threshold", "[engine]") {
  auto exchange = std::make_shared<test::FakeExchange>();
  auto notifier = test::RecordingNotifier{};
  auto trade_log = test::MemoryTradeLog{};
  auto engine = Engine{Strategy::WickSpike, exchange, notifier, trade_log, {},
                       test::quick_policy()};

  const auto now = Clock::now();
  calm_market(*exchange, now);
  exchange->set_bars("ABC_USDT", timeframe, test::quiet_bars(test::last_closed_open(now), 60));

  const auto report = engine.scan_once(now);
  REQUIRE(report.passed == 0);
  REQUIRE(report.dispatched == 0);
  REQUIRE_THAT(report.threshold, WithinAbs(threshold_base - explore_step, 1e-9));
  REQUIRE(engine.positions().count() == 0);
}

TEST_CASE("Rotation resumes where the last scan stopped", "[engine]") {
  auto exchange = std::make_shared<test::FakeExchange>();
  auto notifier = test::RecordingNotifier{};
  auto trade_log = test::MemoryTradeLog{};
  auto engine = Engine{Strategy::WickSpike, exchange, notifier, trade_log, {},
                       test::quick_policy()};

  const auto now = Clock::now();
  calm_market(*exchange, now);

  auto state = engine.snapshot();
  state.rotation_offset = 5;
  engine.restore(state);

  // Three symbols: offset 5 wraps to 2, and a full pass lands back on it
  engine.scan_once(now);
  REQUIRE(engine.status().rotation_offset == 2);
}

TEST_CASE("Start needs the reference symbol", "[engine]") {
  auto exchange = std::make_shared<test::FakeExchange>();
  auto notifier = test::RecordingNotifier{};
  auto trade_log = test::MemoryTradeLog{};
  auto dir = TempDir{};
  const auto state_file = dir.path / "state.json";

  SECTION("Missing") {
    auto engine = Engine{Strategy::WickSpike, exchange, notifier, trade_log, state_file,
                         test::quick_policy()};
    auto started = engine.start();
    REQUIRE_FALSE(started);
    REQUIRE(started.error() == EngineError::SymbolNotListed);
    REQUIRE_FALSE(engine.running());
  }

  SECTION("Range strategy needs its own symbol") {
    exchange->add_market("BTC_USDT", 0.1);
    auto engine = Engine{Strategy::RangeDca, exchange, notifier, trade_log, state_file,
                         test::quick_policy()};
    auto started = engine.start();
    REQUIRE_FALSE(started);
    REQUIRE(started.error() == EngineError::SymbolNotListed);
  }

  SECTION("Listed") {
    exchange->add_market("BTC_USDT", 0.1);
    auto engine = Engine{Strategy::WickSpike, exchange, notifier, trade_log, state_file,
                         test::quick_policy()};
    REQUIRE(engine.start());
    REQUIRE(engine.running());

    auto again = engine.start();
    REQUIRE_FALSE(again);
    REQUIRE(again.error() == EngineError::AlreadyRunning);

    SECTION("Stop persists as disabled") {
      engine.stop();
      REQUIRE_FALSE(engine.running());
      auto saved = load_state(state_file);
      REQUIRE(saved);
      REQUIRE_FALSE(saved->enabled);
    }

    SECTION("Shutdown resumes on restart") {
      engine.shutdown();
      auto saved = load_state(state_file);
      REQUIRE(saved);
      REQUIRE(saved->enabled);
    }
  }
}

TEST_CASE("Range strategy builds its ranges on scan", "[engine]") {
  auto exchange = std::make_shared<test::FakeExchange>();
  auto notifier = test::RecordingNotifier{};
  auto trade_log = test::MemoryTradeLog{};
  auto engine = Engine{Strategy::RangeDca, exchange, notifier, trade_log, {},
                       test::quick_policy()};

  const auto now = Clock::now();
  const auto hour = std::chrono::floor<std::chrono::hours>(now);
  exchange->set_bars(std::string{dca_symbol}, dca_range_timeframe,
                     test::quiet_bars(hour, 200, 1.08, 3600s));

  REQUIRE_FALSE(engine.status().ranges);
  engine.scan_once(now);

  const auto status = engine.status();
  REQUIRE(status.strategy == Strategy::RangeDca);
  REQUIRE(status.ranges);
  REQUIRE(status.ranges->tactical.valid());
  REQUIRE(status.ranges->strategic.valid());
  REQUIRE(engine.positions().count() == 0);
}

TEST_CASE("Closing everything", "[engine]") {
  auto exchange = std::make_shared<test::FakeExchange>();
  auto notifier = test::RecordingNotifier{};
  auto trade_log = test::MemoryTradeLog{};
  auto engine = Engine{Strategy::WickSpike, exchange, notifier, trade_log, {},
                       test::quick_policy()};

  auto state = EngineState{};
  for (auto symbol : {"ABC_USDT", "DEF_USDT"}) {
    auto pos = Position{};
    pos.signal_id = std::format("{}-S-1", symbol);
    pos.symbol = symbol;
    pos.side = Side::Short;
    pos.entry_price = 50.0;
    pos.stop_price = 50.1;
    pos.target_price = 49.85;
    pos.leverage = leverage;
    pos.size_usdt = position_size_usdt;
    pos.opened_at = Clock::now() - 5min;
    state.positions.push_back(pos);
  }
  engine.restore(state);
  exchange->set_price("ABC_USDT", 49.9);

  REQUIRE(engine.status().active == 2);
  REQUIRE(engine.force_close_all() == 2);
  REQUIRE(engine.status().active == 0);
  REQUIRE(engine.status().closed == 2);
  REQUIRE(trade_log.closes.size() == 2);
}
