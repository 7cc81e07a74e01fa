// Position lifecycle: ACTIVE -> CLOSED
//
// Completed bars are bracketed (stop checked before target, since the order
// of extremes inside a bar is unknown) and exits fill at the bracket price.
// While the entry bar is still forming the live ticker is used instead.

#include "lifecycle.h"
#include "defs.h"
#include "pct_utils.h"
#include <algorithm>
#include <format>
#include <print>
#include <set>

namespace wick {

bool on_entry_bar(const Position &pos, TimePoint now) {
  return now < pos.entry_bar_time + timeframe_duration(timeframe);
}

namespace {

ExitReason stop_reason(const Position &pos) {
  return pos.trail_stage > 0 ? ExitReason::TrailingStop : ExitReason::StopLoss;
}

bool stop_hit(const Position &pos, double low, double high) {
  if (not pos.stop_price)
    return false;
  return pos.side == Side::Long ? low <= *pos.stop_price
                                : high >= *pos.stop_price;
}

bool target_hit(const Position &pos, double low, double high) {
  return pos.side == Side::Long ? high >= pos.target_price
                                : low <= pos.target_price;
}

std::string close_message(const Position &pos) {
  const auto held = std::chrono::duration_cast<std::chrono::minutes>(
      pos.closed_at - pos.opened_at);
  return std::format("{} <b>{} {}</b> {}\n"
                     "Entry {} | Exit {}\n"
                     "PnL {:+.2f} USDT ({:+.2f}%)\n"
                     "MFE {:+.2f}% | MAE {:+.2f}% | {} min",
                     pos.pnl_usd >= 0.0 ? "💰" : "🛑", to_string(pos.side),
                     pos.symbol, to_string(pos.exit_reason),
                     format_price(pos.reference_price()),
                     format_price(pos.exit_price), pos.pnl_usd,
                     pos.pnl_pct * pos.leverage * 100.0, mfe_pct(pos) * 100.0,
                     mae_pct(pos) * 100.0, held.count());
}

} // namespace

bool ratchet_trailing(Position &pos) {
  if (mfe_pct(pos) < trail_trigger_pct)
    return false;

  const auto sign = side_sign(pos.side);
  const auto locked = offset_price(pos.entry_price, trail_profit_lock_pct, sign);
  if (pos.stop_price and sign * (locked - *pos.stop_price) <= 0.0)
    return false;

  pos.stop_price = locked;
  pos.trail_stage = 1;
  return true;
}

std::optional<ExitDecision> bracket_bars(Position &pos, const Series &bars,
                                         TimePoint now) {
  const auto period = timeframe_duration(timeframe);

  for (const auto &bar : bars) {
    if (bar.time <= pos.last_bar_checked or not is_complete(bar, period, now))
      continue;

    pos.last_bar_checked = bar.time;

    if (stop_hit(pos, bar.low, bar.high)) {
      update_excursions(pos, bar.high, bar.low);
      return ExitDecision{stop_reason(pos), *pos.stop_price};
    }

    if (target_hit(pos, bar.low, bar.high)) {
      update_excursions(pos, bar.high, bar.low);
      return ExitDecision{ExitReason::TakeProfit, pos.target_price};
    }

    update_excursions(pos, bar.high, bar.low);
    ratchet_trailing(pos);
  }

  return std::nullopt;
}

std::optional<ExitDecision> check_live(Position &pos, double price) {
  update_excursions(pos, price, price);

  if (stop_hit(pos, price, price))
    return ExitDecision{stop_reason(pos), price};

  if (target_hit(pos, price, price))
    return ExitDecision{ExitReason::TakeProfit, price};

  ratchet_trailing(pos);
  return std::nullopt;
}

std::optional<Position> finalize_close(EngineContext &ctx,
                                       std::string_view signal_id,
                                       ExitReason reason, double price,
                                       TimePoint now) {
  auto closed = ctx.positions.close(signal_id, reason, price, now);
  if (not closed)
    return std::nullopt;

  ++ctx.closed;
  ctx.cooldowns.set(closed->symbol, now + cooldown);

  std::println("{} CLOSED {} {} {} @ {} PnL {:+.2f} USDT",
               closed->pnl_usd >= 0.0 ? "💰" : "🛑", to_string(closed->side),
               closed->symbol, to_string(closed->exit_reason),
               format_price(closed->exit_price), closed->pnl_usd);

  notify(ctx, close_message(*closed));
  if (auto logged = ctx.trade_log.record_close(*closed); not logged)
    std::println(stderr, "⚠️  {}: close not journaled", closed->symbol);

  return closed;
}

void monitor_positions(EngineContext &ctx, TimePoint now,
                       std::stop_token stoken) {
  auto positions = ctx.positions.snapshot();
  std::erase_if(positions, [](const Position &p) { return p.dca.has_value(); });
  if (positions.empty())
    return;

  auto bar_symbols = std::set<std::string>{};
  auto live_symbols = std::set<std::string>{};
  for (const auto &pos : positions)
    (on_entry_bar(pos, now) ? live_symbols : bar_symbols).insert(pos.symbol);

  const auto bars = ctx.fetcher.bars_batch({bar_symbols.begin(), bar_symbols.end()},
                                           timeframe, monitor_bar_limit, stoken);
  const auto tickers = ctx.fetcher.ticker_batch(
      {live_symbols.begin(), live_symbols.end()}, stoken);

  for (const auto &pos : positions) {
    try {
      auto decision = std::optional<ExitDecision>{};

      if (on_entry_bar(pos, now)) {
        auto it = tickers.find(pos.symbol);
        if (it == tickers.end())
          continue;
        ctx.positions.update(pos.signal_id, [&](Position &p) {
          decision = check_live(p, it->second.last);
        });
      } else {
        auto it = bars.find(pos.symbol);
        if (it == bars.end())
          continue;
        ctx.positions.update(pos.signal_id, [&](Position &p) {
          decision = bracket_bars(p, it->second, now);
        });
      }

      if (decision)
        finalize_close(ctx, pos.signal_id, decision->reason, decision->price, now);

    } catch (const std::exception &e) {
      std::println(stderr, "⚠️  {}: monitor skipped: {}", pos.symbol, e.what());
    }
  }
}

std::size_t force_close(EngineContext &ctx, std::string_view symbol,
                        TimePoint now) {
  auto closed = 0uz;
  for (const auto &pos : ctx.positions.snapshot()) {
    if (not symbol.empty() and pos.symbol != symbol)
      continue;

    auto price = pos.reference_price();
    if (auto ticker = ctx.fetcher.ticker(pos.symbol))
      price = ticker->last;
    else
      std::println(stderr, "⚠️  {}: no live price, closing at {}", pos.symbol,
                   format_price(price));

    if (finalize_close(ctx, pos.signal_id, ExitReason::Manual, price, now))
      ++closed;
  }
  return closed;
}

} // namespace wick
