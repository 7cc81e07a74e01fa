// Scan scheduler
//
// The loop thread runs the monitor on every tick and launches a scan on its
// own thread whenever the scan interval has elapsed and no scan is in flight.
// A scan walks the rotated universe in chunks until the time budget is spent;
// no symbol is fetched once the budget runs out, even mid-chunk.

#include "engine.h"
#include "defs.h"
#include "gate.h"
#include "lifecycle.h"
#include "scorer.h"
#include <algorithm>
#include <array>
#include <format>
#include <functional>
#include <print>

namespace wick {

namespace {

auto stamp(TimePoint t) { return std::chrono::floor<std::chrono::seconds>(t); }

} // namespace

bool is_stable_base(std::string_view base) {
  constexpr auto stables = std::array<std::string_view, 12>{
      "USDT", "USDC", "DAI",   "TUSD", "FDUSD", "USDE",
      "BUSD", "USDP", "PYUSD", "USD1", "EURC",  "EURT"};
  return std::ranges::find(stables, base) != stables.end();
}

std::vector<UniverseEntry>
build_universe(const std::map<std::string, Ticker> &tickers,
               const std::map<std::string, MarketInfo> &markets) {
  auto universe = std::vector<UniverseEntry>{};

  // Both maps are ordered by symbol, so the result is too
  for (const auto &[symbol, info] : markets) {
    if (info.quote != "USDT" or is_stable_base(info.base))
      continue;

    auto it = tickers.find(symbol);
    if (it == tickers.end())
      continue;

    const auto &ticker = it->second;
    if (ticker.quote_volume < min_quote_volume_usd or ticker.last < min_price)
      continue;

    universe.push_back(
        UniverseEntry{symbol, ticker.quote_volume, ticker.last, info.tick_size});
  }
  return universe;
}

Engine::Engine(Strategy strategy, std::shared_ptr<ExchangeGateway> exchange,
               Notifier &notifier, TradeLogStore &trade_log,
               std::filesystem::path state_file, FetchPolicy policy,
               ScanPolicy scan_policy)
    : strategy_{strategy}, scan_policy_{scan_policy},
      state_file_{std::move(state_file)},
      exchange_{std::move(exchange)}, fetcher_{exchange_, policy},
      ctx_{fetcher_, positions_, reservations_, cooldowns_,
           threshold_, notifier,   trade_log} {
  scan_policy_.chunk_size = std::max(scan_policy_.chunk_size, 1uz);
  if (strategy_ == Strategy::RangeDca)
    dca_.emplace(ctx_);
}

Engine::~Engine() { halt(true); }

std::expected<void, EngineError> Engine::start() {
  auto lock = std::scoped_lock{lifecycle_mutex_};
  if (running_)
    return std::unexpected(EngineError::AlreadyRunning);

  // The symbol the strategy depends on must be listed
  auto listed = false;
  if (dca_) {
    listed = dca_->symbol_listed();
  } else if (auto markets = fetcher_.markets()) {
    listed = markets->contains(std::string{reference_symbol});
  }

  if (not listed) {
    std::println(stderr, "❌ {} not listed, engine stays stopped",
                 dca_ ? dca_symbol : reference_symbol);
    return std::unexpected(EngineError::SymbolNotListed);
  }

  running_ = true;
  loop_ = std::jthread{[this](std::stop_token stoken) { run(stoken); }};

  std::println("▶️  Engine started ({})", to_string(strategy_));
  notify(ctx_, std::format("▶️ wickscan started ({})", to_string(strategy_)));
  return {};
}

void Engine::stop() { halt(false); }

void Engine::shutdown() { halt(true); }

void Engine::halt(bool keep_enabled) {
  auto lock = std::scoped_lock{lifecycle_mutex_};
  if (not running_)
    return;

  loop_.request_stop();
  if (loop_.joinable())
    loop_.join();

  openers_.stop_all();

  // Abandoned exchange calls must return before the gateway is released
  fetcher_.drain();
  running_ = false;

  auto state = snapshot();
  state.enabled = keep_enabled;
  if (not state_file_.empty() and not save_state(state_file_, state))
    std::println(stderr, "⚠️  State not saved on stop");

  std::println("⏹️  Engine stopped");
  notify(ctx_, "⏹️ wickscan stopped");
}

void Engine::run(std::stop_token stoken) {
  auto last_scan = TimePoint{};
  auto last_housekeeping = Clock::now();

  while (not stoken.stop_requested()) {
    try {
      const auto now = Clock::now();

      // Join a scan that has finished
      if (not scanning_ and scan_.joinable())
        scan_.join();

      if (not scanning_ and now - last_scan >= scan_interval) {
        last_scan = now;
        launch_scan(now);
      }

      // Never starved by an in-flight scan
      monitor_once(now, stoken);
      openers_.reap();

      if (now - last_housekeeping >= housekeeping_interval) {
        last_housekeeping = now;
        housekeeping(now);
      }

      sleep_for(monitor_interval, stoken);

    } catch (const std::exception &e) {
      std::println(stderr, "❌ Scheduler error: {}", e.what());
      sleep_for(error_sleep, stoken);
    }
  }

  // Cancel the scan before the loop exits
  scan_.request_stop();
  if (scan_.joinable())
    scan_.join();
}

void Engine::launch_scan(TimePoint now) {
  scanning_ = true;
  scan_ = std::jthread{[this, now](std::stop_token stoken) {
    try {
      scan_once(now, stoken);
    } catch (const std::exception &e) {
      std::println(stderr, "❌ Scan aborted: {}", e.what());
    }
    scanning_ = false;
  }};
}

ScanReport Engine::scan_once(TimePoint now, std::stop_token stoken) {
  if (dca_) {
    dca_->scan(now, stoken);
    return ScanReport{.threshold = threshold_.value()};
  }
  return scan_wick_spike(now, stoken);
}

ScanReport Engine::scan_wick_spike(TimePoint now, std::stop_token stoken) {
  const auto deadline = Clock::now() + scan_policy_.time_budget;
  auto report = ScanReport{};
  report.threshold = threshold_.value();

  auto tickers = fetcher_.tickers(stoken);
  auto markets = fetcher_.markets(stoken);
  if (not tickers or not markets) {
    std::println(stderr, "⚠️  Scan skipped: universe unavailable");
    return report;
  }

  auto universe = build_universe(*tickers, *markets);
  report.universe = universe.size();
  if (universe.empty())
    return report;

  const auto offset = rotation_offset_.load() % universe.size();
  std::ranges::rotate(universe, universe.begin() + static_cast<long>(offset));

  auto scores = std::vector<double>{};
  auto ref_move = std::optional<double>{};
  auto ref_fetched = false;

  for (auto begin = 0uz; begin < universe.size() and not report.trade_cap_hit and
                          not report.budget_exhausted;
       begin += scan_policy_.chunk_size) {
    if (stoken.stop_requested())
      break;
    if (Clock::now() >= deadline) {
      report.budget_exhausted = true;
      break;
    }

    const auto end = std::min(begin + scan_policy_.chunk_size, universe.size());
    auto symbols = std::vector<std::string>{};
    auto ticks = std::map<std::string, double>{};
    for (auto i = begin; i < end; ++i) {
      symbols.push_back(universe[i].symbol);
      ticks[universe[i].symbol] = universe[i].tick_size;
    }

    const auto batch =
        fetcher_.bars_batch_until(symbols, timeframe, bar_limit, deadline, stoken);
    const auto &bars = batch.bars;
    report.processed += batch.attempted;
    if (batch.attempted < symbols.size() and not stoken.stop_requested())
      report.budget_exhausted = true;

    // Gate
    auto passed = std::vector<GateResult>{};
    for (const auto &symbol : symbols) {
      auto it = bars.find(symbol);
      if (it == bars.end())
        continue;

      try {
        const auto state =
            SymbolState{cooldowns_.is_active(symbol, now),
                        positions_.count_for(symbol), reservations_.contains(symbol)};
        auto gate = evaluate_gate(symbol, it->second, now, state);
        if (gate.passed)
          passed.push_back(std::move(gate));
      } catch (const std::exception &e) {
        std::println(stderr, "⚠️  {}: gate skipped: {}", symbol, e.what());
      }
    }

    report.passed += passed.size();
    if (passed.empty())
      continue;

    // Market context, fetched once per scan
    if (not ref_fetched) {
      ref_fetched = true;
      if (auto ref = fetcher_.bars(reference_symbol, timeframe,
                                   ref_lookback_bars + 1, stoken))
        ref_move = reference_move(*ref);
    }

    auto htf_symbols = std::vector<std::string>{};
    for (const auto &gate : passed)
      htf_symbols.push_back(gate.symbol);
    const auto htf =
        fetcher_.bars_batch(htf_symbols, htf_timeframe, htf_bar_limit, stoken);

    // Score
    auto candidates = std::vector<CandidateSignal>{};
    for (const auto &gate : passed) {
      try {
        auto trend = TrendContext{};
        trend.ref_move = ref_move.value_or(0.0);
        if (auto it = htf.find(gate.symbol); it != htf.end())
          trend.htf_slope = htf_slope(it->second);

        auto candidate = score_candidate(gate, trend);
        scores.push_back(candidate.score);
        ++report.scored;

        if (candidate.veto != Veto::None) {
          ++report.vetoed;
          std::println("  ✋ {} {} vetoed: {}", to_string(candidate.side),
                       candidate.symbol, to_string(candidate.veto));
          continue;
        }
        candidates.push_back(std::move(candidate));
      } catch (const std::exception &e) {
        std::println(stderr, "⚠️  {}: scoring skipped: {}", gate.symbol, e.what());
      }
    }

    // Strongest first
    std::ranges::sort(candidates, std::greater{}, &CandidateSignal::score);

    // Accept
    for (const auto &candidate : candidates) {
      const auto side_threshold = threshold_.for_side(candidate.side);
      if (candidate.score < side_threshold)
        continue;

      auto dispatched = dispatch_open(ctx_, openers_, candidate, side_threshold,
                                      ticks[candidate.symbol]);
      if (not dispatched) {
        std::println("  ↪ {} not opened: {}", candidate.symbol,
                     to_string(dispatched.error()));
        continue;
      }

      ++report.dispatched;
      std::println("  ✅ {} {} score {:.2f} >= {:.2f}", to_string(candidate.side),
                   candidate.symbol, candidate.score, side_threshold);

      if (report.dispatched >= max_trades_per_scan) {
        report.trade_cap_hit = true;
        break;
      }
    }
  }

  // Opens confirmed since the last update; a dispatch still settling or one
  // that ended without a touch does not count
  const auto opened_total = ctx_.opened.load();
  const auto opened = opened_total - opened_mark_;
  opened_mark_ = opened_total;

  threshold_.update(scores, opened, report.vetoed, now);
  if (report.trade_cap_hit)
    threshold_.bump(now);
  report.threshold = threshold_.value();

  rotation_offset_ = (offset + report.processed) % universe.size();

  std::println("🔎 {:%H:%M:%S} scan {}/{} symbols | {} passed | {} scored | "
               "{} vetoed | {} opening | threshold {:.2f}{}",
               stamp(now), report.processed, report.universe, report.passed,
               report.scored, report.vetoed, report.dispatched, report.threshold,
               report.budget_exhausted ? " | budget spent" : "");
  return report;
}

void Engine::monitor_once(TimePoint now, std::stop_token stoken) {
  monitor_positions(ctx_, now, stoken);
  if (dca_)
    dca_->monitor(now, stoken);
}

void Engine::housekeeping(TimePoint now) {
  const auto purged = cooldowns_.purge(now);

  std::println("💓 {:%H:%M:%S} active {}/{} | reserved {} | cooldowns {} (-{}) | "
               "threshold {:.2f} | opened {} closed {} no-touch {}",
               stamp(now), positions_.count(), max_concurrent_positions,
               reservations_.size(), cooldowns_.size(), purged, threshold_.value(),
               ctx_.opened.load(), ctx_.closed.load(), ctx_.no_touch.load());

  if (not save())
    std::println(stderr, "⚠️  State snapshot failed");
}

EngineStatus Engine::status() const {
  auto s = EngineStatus{};
  s.running = running_;
  s.strategy = strategy_;
  s.active = positions_.count();
  s.capacity = max_concurrent_positions;
  s.reserved = reservations_.size();
  s.cooldowns = cooldowns_.size();
  s.threshold = threshold_.value();
  s.long_threshold = threshold_.for_side(Side::Long);
  s.opened = ctx_.opened;
  s.closed = ctx_.closed;
  s.no_touch = ctx_.no_touch;
  s.rotation_offset = rotation_offset_;
  if (dca_)
    s.ranges = dca_->ranges();
  return s;
}

std::size_t Engine::force_close(std::string_view symbol) {
  if (symbol.empty())
    return 0;
  return wick::force_close(ctx_, symbol, Clock::now());
}

std::size_t Engine::force_close_all() {
  return wick::force_close(ctx_, "", Clock::now());
}

EngineState Engine::snapshot() const {
  return EngineState{running_, threshold_.state(), positions_.snapshot(),
                     cooldowns_.snapshot(), rotation_offset_};
}

void Engine::restore(const EngineState &state) {
  threshold_.restore(state.threshold);
  positions_.restore(state.positions);
  cooldowns_.restore(state.cooldowns);
  rotation_offset_ = state.rotation_offset;

  std::println("♻️  Restored {} positions, {} cooldowns, threshold {:.2f}",
               state.positions.size(), state.cooldowns.size(),
               threshold_.value());
}

bool Engine::save() const {
  if (state_file_.empty())
    return true;

  auto saved = save_state(state_file_, snapshot());
  if (not saved)
    std::println(stderr, "❌ {}: {}", state_file_.string(), to_string(saved.error()));
  return saved.has_value();
}

std::string_view to_string(EngineError e) {
  switch (e) {
  case EngineError::SymbolNotListed: return "symbol not listed";
  case EngineError::AlreadyRunning: return "already running";
  }
  return "unknown";
}

} // namespace wick
