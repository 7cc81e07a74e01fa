// Symbol reservation and position opening
//
// A candidate that clears its side threshold is reserved on the scan thread
// and then opened on a background task, so the settle wait and the live touch
// check never hold up the scan.

#include "opener.h"
#include "defs.h"
#include "pct_utils.h"
#include <algorithm>
#include <cmath>
#include <format>
#include <iterator>
#include <print>

namespace wick {

double touch_band(double entry, double tick_size, double tail, double atr) {
  auto band = std::max({touch_ticks * tick_size, touch_wick_frac * tail,
                        touch_atr_frac * atr, touch_min_pct * entry});
  // Sub-dime coins move in coarse ticks
  if (entry < low_price_cutoff)
    band = std::max(band, touch_low_price_pct * entry);
  return band;
}

EntryPlan plan_entry(const CandidateSignal &candidate, double score_margin,
                     double tick_size) {
  auto plan = EntryPlan{};
  if (score_margin >= margin_strong) {
    plan.tail_frac = tail_frac_strong;
    plan.tp_pct = tp_pct_strong;
  } else if (score_margin >= margin_good) {
    plan.tail_frac = tail_frac_good;
    plan.tp_pct = tp_pct_good;
  } else {
    plan.tail_frac = tail_frac_base;
    plan.tp_pct = tp_pct_base;
  }

  const auto &bar = candidate.signal_bar;
  const auto body_high = std::max(bar.open, bar.close);
  const auto body_low = std::min(bar.open, bar.close);
  const auto sign = side_sign(candidate.side);

  auto tail = 0.0;
  if (candidate.side == Side::Long) {
    tail = body_low - bar.low;
    plan.entry = bar.low + plan.tail_frac * tail;
  } else {
    tail = bar.high - body_high;
    plan.entry = bar.high - plan.tail_frac * tail;
  }

  const auto stop_distance =
      std::max(sl_pct * plan.entry, sl_atr_mult * candidate.gate.atr);
  plan.stop = plan.entry - sign * stop_distance;
  plan.target = offset_price(plan.entry, plan.tp_pct, sign);
  plan.touch_band = touch_band(plan.entry, tick_size, tail, candidate.gate.atr);
  return plan;
}

bool has_capacity(const EngineContext &ctx) {
  return ctx.positions.count() + ctx.reservations.size() <
         max_concurrent_positions;
}

namespace {

// Open time of the bar containing `t`
TimePoint bar_open_time(TimePoint t, std::chrono::seconds period) {
  const auto secs =
      std::chrono::floor<std::chrono::seconds>(t.time_since_epoch());
  return TimePoint{secs - secs % period};
}

std::string open_message(const Position &pos, const EntryPlan &plan) {
  return std::format("🚀 <b>{} {}</b> score {:.2f}\n"
                     "Entry {} | SL {} | TP {} ({:.2f}%)\n"
                     "Size {:.0f} USDT x{:.0f}",
                     to_string(pos.side), pos.symbol, pos.score,
                     format_price(pos.entry_price),
                     format_price(pos.stop_price.value_or(0.0)),
                     format_price(pos.target_price), plan.tp_pct * 100.0,
                     pos.size_usdt, pos.leverage);
}

} // namespace

std::expected<Position, OpenError>
open_position(EngineContext &ctx, const CandidateSignal &candidate,
              double side_threshold, double tick_size, std::stop_token stoken) {

  // Give the exchange a moment to settle the bar after it closes
  const auto period = timeframe_duration(timeframe);
  const auto settle_at = candidate.signal_bar.time + period + entry_settle;
  const auto wait = std::chrono::duration_cast<std::chrono::milliseconds>(
      settle_at - Clock::now());
  if (not sleep_for(wait, stoken))
    return std::unexpected(OpenError::Cancelled);

  auto plan = plan_entry(candidate, candidate.score - side_threshold, tick_size);

  auto entry = ctx.fetcher.round_to_tick(candidate.symbol, plan.entry);
  auto stop = ctx.fetcher.round_to_tick(candidate.symbol, plan.stop);
  auto target = ctx.fetcher.round_to_tick(candidate.symbol, plan.target);
  if (not entry or not stop or not target) {
    std::println(stderr, "❌ {}: precision lookup failed, open abandoned",
                 candidate.symbol);
    return std::unexpected(OpenError::ExchangeError);
  }

  auto ticker = ctx.fetcher.ticker(candidate.symbol, stoken);
  if (not ticker) {
    if (ticker.error() == FetchError::Cancelled)
      return std::unexpected(OpenError::Cancelled);
    std::println(stderr, "❌ {}: no live price, open abandoned",
                 candidate.symbol);
    return std::unexpected(OpenError::ExchangeError);
  }

  // The market must still be near our entry
  const auto live = ticker->last;
  if (std::abs(live - *entry) > plan.touch_band) {
    ++ctx.no_touch;
    std::println("  ↪ {} no touch: live {} vs entry {} (band {})",
                 candidate.symbol, format_price(live), format_price(*entry),
                 format_price(plan.touch_band));
    return std::unexpected(OpenError::NoTouch);
  }

  const auto now = Clock::now();
  auto pos = Position{};
  pos.signal_id =
      make_signal_id(candidate.symbol, candidate.side, candidate.signal_bar.time);
  pos.symbol = candidate.symbol;
  pos.side = candidate.side;
  pos.entry_price = *entry;
  pos.stop_price = *stop;
  pos.target_price = *target;
  pos.leverage = leverage;
  pos.size_usdt = position_size_usdt;
  pos.score = candidate.score;
  pos.atr = candidate.gate.atr;
  pos.opened_at = now;
  pos.entry_bar_time = bar_open_time(now, period);
  pos.last_bar_checked = pos.entry_bar_time;
  pos.max_favorable_price = *entry;
  pos.max_adverse_price = *entry;

  ctx.positions.add(pos);
  ctx.cooldowns.set(pos.symbol, now + cooldown);
  ++ctx.opened;

  std::println("🚀 OPENED {} {} @ {} SL {} TP {} (score {:.2f})",
               to_string(pos.side), pos.symbol, format_price(pos.entry_price),
               format_price(*pos.stop_price), format_price(pos.target_price),
               pos.score);

  notify(ctx, open_message(pos, plan));
  if (auto logged = ctx.trade_log.record_open(pos); not logged)
    std::println(stderr, "⚠️  {}: open not journaled", pos.symbol);

  return pos;
}

std::expected<void, OpenError>
dispatch_open(EngineContext &ctx, TaskGroup &tasks,
              const CandidateSignal &candidate, double side_threshold,
              double tick_size) {
  if (not has_capacity(ctx))
    return std::unexpected(OpenError::Capacity);

  auto reservation = ctx.reservations.try_reserve(candidate.symbol);
  if (not reservation)
    return std::unexpected(OpenError::AlreadyReserved);

  tasks.spawn([&ctx, candidate, side_threshold, tick_size,
               token = std::move(*reservation)](std::stop_token stoken) mutable {
    // Released when this scope ends, on every path
    auto held = std::move(token);

    try {
      auto result =
          open_position(ctx, candidate, side_threshold, tick_size, stoken);
      if (not result and result.error() != OpenError::NoTouch and
          result.error() != OpenError::Cancelled)
        std::println(stderr, "❌ {}: open failed ({})", candidate.symbol,
                     to_string(result.error()));
    } catch (const std::exception &e) {
      std::println(stderr, "❌ {}: open threw: {}", candidate.symbol, e.what());
    }
  });

  return {};
}

TaskGroup::~TaskGroup() { stop_all(); }

void TaskGroup::spawn(std::move_only_function<void(std::stop_token)> work) {
  auto done = std::make_shared<std::atomic<bool>>(false);
  auto thread = std::jthread{
      [work = std::move(work), done](std::stop_token stoken) mutable {
        work(stoken);
        // Destroy captured resources before reporting completion
        work = nullptr;
        done->store(true);
      }};

  auto lock = std::scoped_lock{mutex_};
  tasks_.push_back(Task{std::move(thread), std::move(done)});
}

void TaskGroup::reap() {
  auto finished = std::vector<Task>{};
  {
    auto lock = std::scoped_lock{mutex_};
    auto it = std::ranges::partition(tasks_, [](const Task &t) {
                return not t.done->load();
              }).begin();
    std::move(it, tasks_.end(), std::back_inserter(finished));
    tasks_.erase(it, tasks_.end());
  } // Finished threads join outside the lock
}

std::size_t TaskGroup::running() const {
  auto lock = std::scoped_lock{mutex_};
  return static_cast<std::size_t>(std::ranges::count_if(
      tasks_, [](const Task &t) { return not t.done->load(); }));
}

void TaskGroup::stop_all() {
  auto all = std::vector<Task>{};
  {
    auto lock = std::scoped_lock{mutex_};
    all = std::move(tasks_);
    tasks_.clear();
  }
  for (auto &task : all)
    task.thread.request_stop();
  // jthread destructors join
}

void TaskGroup::wait_all() {
  auto all = std::vector<Task>{};
  {
    auto lock = std::scoped_lock{mutex_};
    all = std::move(tasks_);
    tasks_.clear();
  }
  for (auto &task : all)
    if (task.thread.joinable())
      task.thread.join();
}

std::string_view to_string(OpenError e) {
  switch (e) {
  case OpenError::Capacity: return "capacity";
  case OpenError::AlreadyReserved: return "already reserved";
  case OpenError::NoTouch: return "no touch";
  case OpenError::ExchangeError: return "exchange error";
  case OpenError::Cancelled: return "cancelled";
  }
  return "unknown";
}

} // namespace wick
