#include "dca.h"
#include "defs.h"
#include "indicators.h"
#include "pct_utils.h"
#include <algorithm>
#include <cmath>
#include <format>
#include <print>

namespace wick {

// ═══════════════════════════════════════════════════════════════════════════
// Range construction
// ═══════════════════════════════════════════════════════════════════════════

std::optional<PriceRange> build_range(const Series &bars,
                                      std::size_t lookback) {
  if (lookback < 2 or bars.size() < lookback)
    return std::nullopt;

  auto window = Series{bars.end() - static_cast<long>(lookback), bars.end()};

  auto closes = std::vector<double>{};
  closes.reserve(window.size());
  for (const auto &bar : window)
    closes.push_back(bar.close);

  const auto lo = indicators::quantile(closes, range_q_lower);
  const auto hi = indicators::quantile(closes, range_q_upper);
  if (not lo or not hi)
    return std::nullopt;

  auto range = PriceRange{*lo, *hi, (*lo + *hi) / 2.0};

  // Too narrow a range gets widened around the trend mean
  const auto ema = indicators::ema_series(window, range_ema_period);
  const auto atr = indicators::atr(window, atr_period);
  if (not ema.empty() and atr) {
    range.mid = ema.back();
    range.lower = std::min(range.lower, range.mid - range_min_atr_mult * *atr);
    range.upper = std::max(range.upper, range.mid + range_min_atr_mult * *atr);
  }

  if (not range.valid())
    return std::nullopt;
  return range;
}

std::optional<DcaRanges> build_ranges(const Series &bars, TimePoint now) {
  const auto strategic_lookback = std::min(bars.size(), strategic_range_bars);
  auto tactical = build_range(bars, tactical_range_bars);
  auto strategic = build_range(bars, strategic_lookback);
  auto atr = indicators::atr(bars, atr_period);
  if (not tactical or not strategic or not atr)
    return std::nullopt;

  return DcaRanges{*tactical, *strategic, *atr, bars.back().close, now};
}

// ═══════════════════════════════════════════════════════════════════════════
// Margin plan and ladder
// ═══════════════════════════════════════════════════════════════════════════

std::vector<double> plan_margins(double bank, double deposit_frac,
                                 std::size_t levels, double growth) {
  if (levels == 0)
    return {};

  const auto total = bank * deposit_frac;
  const auto n = static_cast<double>(levels);
  auto margins = std::vector<double>{};
  margins.reserve(levels);

  if (std::abs(growth - 1.0) < 1e-12) {
    margins.assign(levels, total / n);
    return margins;
  }

  const auto first = total * (growth - 1.0) / (std::pow(growth, n) - 1.0);
  for (auto i = 0uz; i < levels; ++i)
    margins.push_back(first * std::pow(growth, static_cast<double>(i)));
  return margins;
}

double choose_growth(const DcaRanges &ranges) {
  if (ranges.strategic.width() > 0.0 and
      ranges.tactical.width() / ranges.strategic.width() < thin_range_ratio)
    return growth_thin;
  if (ranges.price > 0.0 and ranges.atr / ranges.price >= volatile_atr_pct)
    return growth_volatile;
  return growth_base;
}

std::vector<double> build_ladder(double entry, Side side,
                                 const PriceRange &tactical,
                                 const PriceRange &strategic,
                                 std::size_t max_steps) {
  constexpr double fractions[] = {0.10, 0.20, 0.35, 0.50, 0.70, 0.90};
  const auto sign = side_sign(side);

  auto prices = std::vector<double>{};
  for (const auto *range : {&tactical, &strategic})
    for (auto f : fractions) {
      auto p = entry - sign * f * range->width();
      if (p > 0.0 and sign * (entry - p) > 0.0)
        prices.push_back(p);
    }

  // Nearest to entry first
  std::ranges::sort(prices, [sign](double a, double b) {
    return sign > 0 ? a > b : a < b;
  });

  auto ladder = std::vector<double>{};
  for (auto p : prices) {
    const auto anchor = ladder.empty() ? entry : ladder.back();
    if (std::abs(p - anchor) / entry < ladder_min_gap_pct)
      continue;
    ladder.push_back(p);
    if (ladder.size() == max_steps)
      break;
  }
  return ladder;
}

void add_step(DcaState &dca, double price, double margin, TimePoint now) {
  const auto qty = margin * dca.leverage / price;
  const auto total_qty = dca.qty + qty;
  dca.avg_price = (dca.avg_price * dca.qty + price * qty) / total_qty;
  dca.qty = total_qty;
  dca.steps.push_back(DcaStep{price, qty, margin, now});
}

double dca_target(const DcaState &dca, Side side) {
  return offset_price(dca.avg_price, dca_tp_pct, side_sign(side));
}

double liquidation_price(const DcaState &dca, Side side, double equity,
                         double mmr) {
  if (dca.qty <= 0.0)
    return 0.0;
  if (side == Side::Long)
    return std::max(0.0, (dca.avg_price * dca.qty - equity) / (dca.qty * (1.0 - mmr)));
  return (dca.avg_price * dca.qty + equity) / (dca.qty * (1.0 + mmr));
}

// ═══════════════════════════════════════════════════════════════════════════
// Breakout, retest and trailing
// ═══════════════════════════════════════════════════════════════════════════

bool breakout(const Position &pos, double price) {
  if (not pos.dca)
    return false;
  return pos.side == Side::Long ? price < pos.dca->strategic_lower
                                : price > pos.dca->strategic_upper;
}

bool retest_confirmed(const Position &pos, double price,
                      const Series &closed_bars) {
  if (not pos.dca or closed_bars.size() < dca_ema_period + 2)
    return false;

  const auto &dca = *pos.dca;
  const auto back_inside =
      pos.side == Side::Long
          ? price >= dca.strategic_lower * (1.0 + retest_band_pct)
          : price <= dca.strategic_upper * (1.0 - retest_band_pct);
  if (not back_inside)
    return false;

  const auto ema = indicators::ema_series(closed_bars, dca_ema_period);
  const auto n = closed_bars.size();
  const auto sign = side_sign(pos.side);
  const auto before = sign * (closed_bars[n - 2].close - ema[n - 2]);
  const auto after = sign * (closed_bars[n - 1].close - ema[n - 1]);
  return before <= 0.0 and after > 0.0;
}

std::optional<double> ratchet_dca_stop(Position &pos, double price, double atr) {
  if (not pos.dca)
    return std::nullopt;

  const auto sign = side_sign(pos.side);
  const auto avg = pos.dca->avg_price;
  const auto distance = std::abs(pos.target_price - avg);
  const auto travelled = sign * (price - avg);
  if (distance <= 0.0 or travelled <= 0.0)
    return std::nullopt;

  const auto progress = travelled / distance;
  auto stage = 0uz;
  while (stage < trail_stage_count and progress >= trail_arm[stage])
    ++stage;
  if (stage == 0)
    return std::nullopt;

  const auto locked = avg + sign * trail_lock[stage - 1] * travelled;
  const auto chandelier = price - sign * chandelier_atr_mult * atr;
  const auto candidate = sign > 0 ? std::max(locked, chandelier)
                                  : std::min(locked, chandelier);

  // Never loosen, and skip moves smaller than the minimum step
  const auto min_step = trail_min_step_ticks * pos.dca->tick_size;
  if (pos.stop_price and sign * (candidate - *pos.stop_price) < std::max(min_step, 1e-12))
    return std::nullopt;

  pos.stop_price = candidate;
  pos.trail_stage = std::max(pos.trail_stage, static_cast<int>(stage));
  return candidate;
}

// ═══════════════════════════════════════════════════════════════════════════
// Entry signal
// ═══════════════════════════════════════════════════════════════════════════

std::optional<DcaSignal> evaluate_dca_entry(const Series &bars,
                                            const PriceRange &tactical) {
  const auto min_bars = std::max({dca_ema_period, dca_rsi_period, atr_period,
                                  vol_window}) + 1;
  if (not tactical.valid() or bars.size() < min_bars)
    return std::nullopt;

  const auto &last = bars.back();
  const auto px = last.close;

  auto side = Side::Long;
  auto border = tactical.lower;
  if (px <= tactical.lower * (1.0 + dca_entry_zone_pct)) {
    side = Side::Long;
    border = tactical.lower;
  } else if (px >= tactical.upper * (1.0 - dca_entry_zone_pct)) {
    side = Side::Short;
    border = tactical.upper;
  } else {
    return std::nullopt;
  }

  const auto sign = side_sign(side);
  const auto rsi = indicators::rsi(bars, dca_rsi_period);
  const auto atr = indicators::atr(bars, atr_period);
  const auto ema = indicators::ema_series(bars, dca_ema_period);
  const auto vol_z = indicators::volume_z(bars, vol_window, bars.size() - 1);
  if (not rsi or not atr or *atr <= 0.0 or ema.empty() or not vol_z)
    return std::nullopt;

  // Beyond the border counts as fully in the zone
  const auto overshoot = sign * (border - px);
  const auto s_border =
      overshoot >= 0.0 ? 1.0 : clamp01(1.0 + overshoot / (dca_entry_zone_pct * border));
  const auto s_rsi = clamp01(sign * (50.0 - *rsi) / 20.0);
  const auto s_ema = clamp01(sign * (ema.back() - px) / (2.0 * *atr));
  const auto s_reversal = sign * (last.close - last.open) > 0.0 ? 1.0 : 0.0;
  const auto s_volume = clamp01(*vol_z / vol_z_threshold);

  const auto score = dca_w_border * s_border + dca_w_rsi * s_rsi +
                     dca_w_ema_dev * s_ema + dca_w_reversal * s_reversal +
                     dca_w_volume * s_volume;

  return DcaSignal{side, score, px};
}

Position make_dca_position(std::string_view symbol, const DcaSignal &signal,
                           const DcaRanges &ranges, double tick_size,
                           TimePoint now) {
  auto dca = DcaState{};
  dca.leverage = dca_leverage;
  dca.growth = choose_growth(ranges);
  dca.margin_plan =
      plan_margins(dca_bank, cum_deposit_frac_at_full, dca_levels, dca.growth);
  dca.strategic_lower = ranges.strategic.lower;
  dca.strategic_upper = ranges.strategic.upper;
  dca.tick_size = tick_size;
  add_step(dca, signal.price, dca.margin_plan.front(), now);
  dca.ladder = build_ladder(signal.price, signal.side, ranges.tactical,
                            ranges.strategic, dca.margin_plan.size() - 1);

  auto pos = Position{};
  pos.signal_id = make_signal_id(symbol, signal.side, now);
  pos.symbol = std::string{symbol};
  pos.side = signal.side;
  pos.entry_price = signal.price;
  pos.target_price = dca_target(dca, signal.side);
  pos.leverage = dca_leverage;
  pos.size_usdt = dca.margin_plan.front();
  pos.score = signal.score;
  pos.atr = ranges.atr;
  pos.opened_at = now;
  pos.entry_bar_time = now;
  pos.last_bar_checked = now;
  pos.max_favorable_price = signal.price;
  pos.max_adverse_price = signal.price;
  pos.dca = std::move(dca);
  return pos;
}

// ═══════════════════════════════════════════════════════════════════════════
// Monitoring step
// ═══════════════════════════════════════════════════════════════════════════

DcaTick advance_dca(Position &pos, double price, const Series &closed_bars,
                    TimePoint now) {
  auto tick = DcaTick{};
  if (not pos.dca)
    return tick;

  auto &dca = *pos.dca;
  const auto sign = side_sign(pos.side);
  auto event = [&](std::string kind, double at, std::string detail) {
    tick.events.push_back(PositionEvent{pos.signal_id, pos.symbol,
                                        std::move(kind), at, std::move(detail),
                                        now});
  };

  update_excursions(pos, price, price);

  if (sign * (price - pos.target_price) >= 0.0) {
    tick.exit = ExitDecision{ExitReason::TakeProfit, pos.target_price};
    return tick;
  }
  if (pos.stop_price and sign * (price - *pos.stop_price) <= 0.0) {
    tick.exit = ExitDecision{ExitReason::TrailingStop, *pos.stop_price};
    return tick;
  }

  if (not dca.frozen and breakout(pos, price)) {
    dca.frozen = true;
    dca.ladder.clear();
    dca.reserved_final_step = dca.steps_left() > 0;
    event("FREEZE", price,
          std::format("breakout beyond {}, {} slot held",
                      format_price(pos.side == Side::Long ? dca.strategic_lower
                                                          : dca.strategic_upper),
                      dca.reserved_final_step ? 1 : 0));
  }

  auto filled = false;
  if (dca.frozen) {
    if (dca.reserved_final_step and retest_confirmed(pos, price, closed_bars)) {
      add_step(dca, price, dca.margin_plan[dca.steps.size()], now);
      dca.reserved_final_step = false;
      filled = true;
      event("RETEST", price, std::format("step {}", dca.steps.size()));
    }
  } else if (not dca.ladder.empty() and dca.steps_left() > 0 and
             sign * (price - dca.ladder.front()) <= 0.0) {
    // One ladder level per tick
    add_step(dca, price, dca.margin_plan[dca.steps.size()], now);
    dca.ladder.erase(dca.ladder.begin());
    filled = true;
    event("ADD", price, std::format("step {}", dca.steps.size()));
  }

  if (filled) {
    pos.target_price = dca_target(dca, pos.side);
    const auto liq = liquidation_price(dca, pos.side, dca_bank, maintenance_margin_ratio);
    tick.events.back().detail +=
        std::format(" avg {} qty {:.4f} margin {:.2f} liq~{}", format_price(dca.avg_price),
                    dca.qty, dca.committed_margin(), format_price(liq));
  }

  if (auto atr = indicators::atr(closed_bars, atr_period)) {
    const auto stage_before = pos.trail_stage;
    if (auto stop = ratchet_dca_stop(pos, price, *atr))
      event("TRAIL_SET", *stop,
            std::format("stage {}{}", pos.trail_stage,
                        pos.trail_stage > stage_before ? " armed" : ""));
  }

  return tick;
}

// ═══════════════════════════════════════════════════════════════════════════
// Runner
// ═══════════════════════════════════════════════════════════════════════════

namespace {

// Drop the bar still forming
Series closed_only(Series bars, std::string_view tf, TimePoint now) {
  if (not bars.empty() and not is_complete(bars.back(), timeframe_duration(tf), now))
    bars.pop_back();
  return bars;
}

std::string dca_open_message(const Position &pos) {
  const auto &dca = *pos.dca;
  return std::format("📐 <b>{} {}</b> range entry, score {:.2f}\n"
                     "Entry {} | TP {} | growth {:.2f}\n"
                     "Step 1/{} margin {:.2f} USDT x{:.0f}\n"
                     "Range {} - {}",
                     to_string(pos.side), pos.symbol, pos.score,
                     format_price(pos.entry_price), format_price(pos.target_price),
                     dca.growth, dca.margin_plan.size(), dca.margin_plan.front(),
                     dca.leverage, format_price(dca.strategic_lower),
                     format_price(dca.strategic_upper));
}

} // namespace

DcaRunner::DcaRunner(EngineContext &ctx) : ctx_{ctx} {}

std::optional<DcaRanges> DcaRunner::ranges() const {
  auto lock = std::scoped_lock{mutex_};
  return ranges_;
}

bool DcaRunner::symbol_listed(std::stop_token stoken) {
  auto markets = ctx_.fetcher.markets(stoken);
  if (not markets)
    return false;

  auto it = markets->find(std::string{dca_symbol});
  if (it == markets->end())
    return false;

  auto lock = std::scoped_lock{mutex_};
  tick_size_ = it->second.tick_size;
  return true;
}

void DcaRunner::scan(TimePoint now, std::stop_token stoken) {
  auto current = ranges();
  if (not current or now - current->built_at >= range_rebuild_interval) {
    auto range_bars = ctx_.fetcher.bars(dca_symbol, dca_range_timeframe,
                                        strategic_range_bars, stoken);
    if (not range_bars) {
      std::println(stderr, "⚠️  {}: range bars {}", dca_symbol,
                   to_string(range_bars.error()));
      return;
    }

    current = build_ranges(closed_only(std::move(*range_bars), dca_range_timeframe, now), now);
    if (not current) {
      std::println(stderr, "⚠️  {}: not enough history for ranges", dca_symbol);
      return;
    }

    std::println("📐 {} ranges: tactical {} - {} | strategic {} - {}", dca_symbol,
                 format_price(current->tactical.lower),
                 format_price(current->tactical.upper),
                 format_price(current->strategic.lower),
                 format_price(current->strategic.upper));

    auto lock = std::scoped_lock{mutex_};
    ranges_ = current;
  }

  if (ctx_.positions.count_for(dca_symbol) > 0 or
      ctx_.reservations.contains(dca_symbol))
    return;

  auto bars = ctx_.fetcher.bars(dca_symbol, dca_entry_timeframe,
                                dca_entry_bar_limit, stoken);
  if (not bars)
    return;

  auto closed = closed_only(std::move(*bars), dca_entry_timeframe, now);
  auto signal = evaluate_dca_entry(closed, current->tactical);
  if (not signal)
    return;

  std::println("  {} {} range score {:.2f} (need {:.2f})", dca_symbol,
               to_string(signal->side), signal->score, dca_score_threshold);
  if (signal->score < dca_score_threshold)
    return;

  auto reservation = ctx_.reservations.try_reserve(dca_symbol);
  if (not reservation)
    return;

  auto rounded = ctx_.fetcher.round_to_tick(dca_symbol, signal->price);
  if (not rounded) {
    std::println(stderr, "❌ {}: precision lookup failed, open abandoned", dca_symbol);
    return;
  }
  signal->price = *rounded;

  auto tick_size = 0.0;
  {
    auto lock = std::scoped_lock{mutex_};
    tick_size = tick_size_;
  }

  auto pos = make_dca_position(dca_symbol, *signal, *current, tick_size, now);
  ctx_.positions.add(pos);
  ++ctx_.opened;

  std::println("📐 OPENED {} {} @ {} TP {} ladder {}", to_string(pos.side),
               pos.symbol, format_price(pos.entry_price),
               format_price(pos.target_price), pos.dca->ladder.size());

  notify(ctx_, dca_open_message(pos));
  if (auto logged = ctx_.trade_log.record_open(pos); not logged)
    std::println(stderr, "⚠️  {}: open not journaled", pos.symbol);
}

void DcaRunner::monitor(TimePoint now, std::stop_token stoken) {
  for (const auto &pos : ctx_.positions.snapshot()) {
    if (not pos.dca)
      continue;

    try {
      auto ticker = ctx_.fetcher.ticker(pos.symbol, stoken);
      auto bars = ctx_.fetcher.bars(pos.symbol, dca_entry_timeframe,
                                    dca_entry_bar_limit, stoken);
      if (not ticker or not bars)
        continue;

      const auto closed = closed_only(std::move(*bars), dca_entry_timeframe, now);
      auto tick = DcaTick{};
      ctx_.positions.update(pos.signal_id, [&](Position &p) {
        tick = advance_dca(p, ticker->last, closed, now);
      });

      for (const auto &event : tick.events) {
        std::println("📐 {} {} @ {} {}", event.kind, event.symbol,
                     format_price(event.price), event.detail);
        if (event.kind != "TRAIL_SET" or event.detail.ends_with("armed"))
          notify(ctx_, std::format("📐 <b>{}</b> {} @ {}\n{}", event.kind,
                                   event.symbol, format_price(event.price),
                                   event.detail));
        if (auto logged = ctx_.trade_log.record_event(event); not logged)
          std::println(stderr, "⚠️  {}: event not journaled", event.symbol);
      }

      if (tick.exit)
        finalize_close(ctx_, pos.signal_id, tick.exit->reason, tick.exit->price, now);

    } catch (const std::exception &e) {
      std::println(stderr, "⚠️  {}: monitor skipped: {}", pos.symbol, e.what());
    }
  }
}

} // namespace wick
