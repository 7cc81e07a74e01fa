#pragma once

#include "pct_utils.h"
#include <chrono>
#include <string_view>

namespace wick {

using namespace std::chrono_literals;

// ═══════════════════════════════════════════════════════════════════════════
// Universe and position sizing
// ═══════════════════════════════════════════════════════════════════════════

constexpr auto timeframe = std::string_view{"1m"};
constexpr auto htf_timeframe = std::string_view{"15m"};
constexpr auto position_size_usdt = 10.0; // Nominal margin per trade
constexpr auto leverage = 20.0;
constexpr auto max_concurrent_positions = 10uz; // Active + reserved
constexpr auto max_positions_per_symbol = 1uz;
constexpr auto min_quote_volume_usd = 300'000.0; // 24h turnover floor
constexpr auto min_price = 0.001;
constexpr auto reference_symbol = std::string_view{"BTC_USDT"};

// ═══════════════════════════════════════════════════════════════════════════
// Market data fetching
// ═══════════════════════════════════════════════════════════════════════════

constexpr auto fetch_concurrency = 10uz; // Max requests in flight
constexpr auto fetch_timeout = 8s;
constexpr auto fetch_retries = 2;
constexpr auto fetch_backoff_base = 250ms;
constexpr auto fetch_slot_poll = 50ms; // Stop checks while waiting for a slot
constexpr auto bar_limit = 80uz;
constexpr auto fallback_limit_ratio = 0.75; // Smaller request after retries
constexpr auto htf_bar_limit = 80uz;
constexpr auto monitor_bar_limit = 5uz;

// ═══════════════════════════════════════════════════════════════════════════
// Gate
// ═══════════════════════════════════════════════════════════════════════════

constexpr auto atr_period = 14uz;
constexpr auto vol_window = 50uz;
constexpr auto sma_period = 20uz; // Mean reversion anchor
constexpr auto min_gate_bars = vol_window + 1;

constexpr auto vol_z_threshold = 2.0;
constexpr auto min_body_atr_frac = 0.05;
constexpr auto atr_spike_mult = 1.8; // Minimum (high - low) / ATR

// Longs require a deeper wick and a calmer spike than shorts
constexpr auto wick_ratio_short = 2.0;
constexpr auto wick_ratio_long = 2.4;
constexpr auto max_spike_mult_short = 6.0;
constexpr auto max_spike_mult_long = 4.0;
constexpr auto min_gate_passes = 2;

// ═══════════════════════════════════════════════════════════════════════════
// Scorer
// ═══════════════════════════════════════════════════════════════════════════

constexpr auto htf_sma_period = 50uz;
constexpr auto htf_slope_lookback = 5uz;
constexpr auto strong_trend_veto = 1.0; // Aligned slope in ATR units
constexpr auto ref_lookback_bars = 15uz;
constexpr auto ref_veto_pct = 0.8_pc; // Adverse move over lookback

constexpr auto base_score = 1.0;
constexpr auto w_wick = 0.6;
constexpr auto wick_excess_cap = 1.5;
constexpr auto w_spike = 0.5;
constexpr auto spike_excess_cap = 1.0;
constexpr auto w_counter_trend = 0.5;
constexpr auto trend_align_bonus = 0.1;
constexpr auto w_ref = 0.3;
constexpr auto w_mean_rev = 0.3;
constexpr auto missing_htf_penalty = 0.25;
constexpr auto pass_count_bonus = 0.15;
constexpr auto long_score_bias = 0.1;

// ═══════════════════════════════════════════════════════════════════════════
// Adaptive threshold
// ═══════════════════════════════════════════════════════════════════════════

constexpr auto score_min = 1.4;
constexpr auto score_max = 2.4;
constexpr auto threshold_base = 1.8;
constexpr auto threshold_pad = 0.02;
constexpr auto threshold_smoothing = 0.4;
constexpr auto threshold_max_jump = 0.15;
constexpr auto min_score_sample = 20uz;
constexpr auto explore_step = 0.05;
constexpr auto explore_max_vetoes = 3uz;
constexpr auto long_threshold_offset = 0.1;
constexpr auto max_trades_per_scan = 3uz;
constexpr auto trades_per_scan_bump = 0.05;

// Quantile level grows with sample size
constexpr double threshold_quantile_level(std::size_t n) {
  if (n < 40)
    return 0.90;
  if (n < 150)
    return 0.95;
  return 0.97;
}

// ═══════════════════════════════════════════════════════════════════════════
// Opener
// ═══════════════════════════════════════════════════════════════════════════

constexpr auto sl_pct = 0.20_pc;   // Minimum stop distance
constexpr auto sl_atr_mult = 0.5;  // ATR-scaled stop distance
constexpr auto tail_frac_base = 0.25;
constexpr auto tail_frac_good = 0.30;
constexpr auto tail_frac_strong = 0.35;
constexpr auto tp_pct_base = 0.30_pc;
constexpr auto tp_pct_good = 0.35_pc;
constexpr auto tp_pct_strong = 0.45_pc;
constexpr auto margin_good = 0.15;   // Score above side threshold
constexpr auto margin_strong = 0.30;

constexpr auto touch_ticks = 3.0;
constexpr auto touch_wick_frac = 0.25;
constexpr auto touch_atr_frac = 0.15;
constexpr auto touch_min_pct = 0.05_pc;
constexpr auto low_price_cutoff = 0.1;
constexpr auto touch_low_price_pct = 0.15_pc;
constexpr auto entry_settle = 2s; // After the signal bar closes

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle
// ═══════════════════════════════════════════════════════════════════════════

constexpr auto trail_trigger_pct = 0.20_pc; // Favourable excursion to arm
constexpr auto trail_profit_lock_pct = 0.05_pc;
constexpr auto cooldown = 120s;

// ═══════════════════════════════════════════════════════════════════════════
// Scheduler
// ═══════════════════════════════════════════════════════════════════════════

constexpr auto scan_interval = 30s;
constexpr auto monitor_interval = 5s;
constexpr auto scan_time_budget = 25s;
constexpr auto scan_chunk_size = 40uz;
constexpr auto housekeeping_interval = 60s;
constexpr auto error_sleep = 5s;

// ═══════════════════════════════════════════════════════════════════════════
// Range DCA
// ═══════════════════════════════════════════════════════════════════════════

constexpr auto dca_symbol = std::string_view{"EURC_USDT"};
constexpr auto dca_entry_timeframe = std::string_view{"5m"};
constexpr auto dca_range_timeframe = std::string_view{"1h"};
constexpr auto dca_entry_bar_limit = 120uz;
constexpr auto tactical_range_bars = 48uz;
constexpr auto strategic_range_bars = 720uz;
constexpr auto range_q_lower = 0.025;
constexpr auto range_q_upper = 0.975;
constexpr auto range_ema_period = 50uz;
constexpr auto range_min_atr_mult = 1.5;
constexpr auto range_rebuild_interval = 15min;

constexpr auto dca_bank = 1500.0;
constexpr auto dca_levels = 7uz;
constexpr auto cum_deposit_frac_at_full = 2.0 / 3.0;
constexpr auto dca_leverage = 20.0;
constexpr auto growth_thin = 1.5;
constexpr auto growth_base = 1.75;
constexpr auto growth_volatile = 2.0;
constexpr auto thin_range_ratio = 0.35;  // Tactical width / strategic width
constexpr auto volatile_atr_pct = 1_pc;  // ATR(1h) / price
constexpr auto maintenance_margin_ratio = 0.5_pc;

constexpr auto dca_tp_pct = 1_pc;
constexpr auto dca_entry_zone_pct = 0.15_pc;
constexpr auto dca_score_threshold = 0.55;
constexpr auto dca_ema_period = 20uz;
constexpr auto dca_rsi_period = 14uz;
constexpr auto ladder_min_gap_pct = 0.15_pc;
constexpr auto retest_band_pct = 0.20_pc;

constexpr auto chandelier_atr_mult = 3.0;
constexpr auto trail_min_step_ticks = 2.0;
constexpr auto trail_stage_count = 3uz;
constexpr double trail_arm[trail_stage_count] = {0.50, 0.75, 0.90};
constexpr double trail_lock[trail_stage_count] = {0.25, 0.45, 0.60};

// Weighted DCA entry score
constexpr auto dca_w_border = 0.45;
constexpr auto dca_w_rsi = 0.15;
constexpr auto dca_w_ema_dev = 0.20;
constexpr auto dca_w_reversal = 0.10;
constexpr auto dca_w_volume = 0.10;

// ═══════════════════════════════════════════════════════════════════════════
// Compile-time safety checks
// ═══════════════════════════════════════════════════════════════════════════

static_assert(position_size_usdt > 0.0, "Trade size must be positive");
static_assert(leverage >= 1.0 and leverage <= 125.0, "Leverage out of range");
static_assert(max_concurrent_positions > 0, "Must allow at least one position");
static_assert(fetch_concurrency > 0, "Fetcher needs at least one worker");
static_assert(fallback_limit_ratio > 0.0 and fallback_limit_ratio < 1.0,
              "Fallback must request fewer bars");
static_assert(bar_limit * fallback_limit_ratio >= min_gate_bars,
              "Fallback must still satisfy the gate history requirement");
static_assert(htf_bar_limit > htf_sma_period + htf_slope_lookback,
              "Not enough HTF bars for the slope");

static_assert(wick_ratio_long >= wick_ratio_short, "Longs need the deeper wick");
static_assert(max_spike_mult_long <= max_spike_mult_short,
              "Longs need the calmer spike");
static_assert(atr_spike_mult < max_spike_mult_long, "Empty spike range");

static_assert(score_min < threshold_base and threshold_base < score_max,
              "Base threshold must sit inside the clamp");
static_assert(threshold_smoothing > 0.0 and threshold_smoothing <= 1.0,
              "Smoothing is a blend weight");
static_assert(threshold_max_jump > 0.0, "Jump limit must be positive");
static_assert(explore_step < threshold_max_jump, "Exploration exceeds jump limit");
static_assert(trades_per_scan_bump < threshold_max_jump, "Bump exceeds jump limit");
static_assert(threshold_quantile_level(10) < threshold_quantile_level(60));
static_assert(threshold_quantile_level(60) < threshold_quantile_level(200));

static_assert(tail_frac_base < tail_frac_good and tail_frac_good < tail_frac_strong,
              "Better signals retrace deeper into the tail");
static_assert(tp_pct_base < tp_pct_good and tp_pct_good < tp_pct_strong,
              "Better signals get larger targets");
static_assert(margin_good < margin_strong);
static_assert(tp_pct_base > sl_pct, "Target must exceed the minimum stop");
static_assert(near(sl_pct, 0.002) and near(tp_pct_strong, 0.0045));
static_assert(near(dca_tp_pct, 0.01) and near(maintenance_margin_ratio, 0.005));

static_assert(trail_profit_lock_pct < trail_trigger_pct,
              "Trailing lock must sit below the trigger");
static_assert(trail_trigger_pct < tp_pct_base, "Trail must arm before target");
static_assert(scan_time_budget < scan_interval, "Scan would overlap itself");
static_assert(monitor_interval < scan_interval);

static_assert(tactical_range_bars < strategic_range_bars);
static_assert(range_q_lower < range_q_upper);
static_assert(cum_deposit_frac_at_full > 0.0 and cum_deposit_frac_at_full <= 1.0);
static_assert(growth_thin >= 1.0 and growth_base >= 1.0 and growth_volatile >= 1.0,
              "Geometric plan needs growth >= 1");
static_assert(dca_levels >= 2, "Need an initial step plus a reserve");
static_assert(trail_arm[0] < trail_arm[1] and trail_arm[1] < trail_arm[2]);
static_assert(trail_lock[0] < trail_lock[1] and trail_lock[1] < trail_lock[2]);
static_assert(trail_lock[2] < trail_arm[2], "Lock must trail the arm level");
static_assert(dca_w_border + dca_w_rsi + dca_w_ema_dev + dca_w_reversal +
                      dca_w_volume > 0.999 and
                  dca_w_border + dca_w_rsi + dca_w_ema_dev + dca_w_reversal +
                          dca_w_volume < 1.001,
              "DCA score weights must sum to one");

} // namespace wick
