#include "scorer.h"
#include "defs.h"
#include "indicators.h"
#include "pct_utils.h"
#include <cmath>

namespace wick {

std::optional<double> htf_slope(const Series &bars) {
  if (bars.size() < htf_sma_period + htf_slope_lookback)
    return std::nullopt;

  const auto end = bars.size() - 1;
  const auto now_sma = indicators::sma(bars, htf_sma_period, end);
  const auto then_sma =
      indicators::sma(bars, htf_sma_period, end - htf_slope_lookback);
  const auto atr = indicators::atr(bars, atr_period, end);

  if (not now_sma or not then_sma or not atr or *atr <= 0.0)
    return std::nullopt;

  auto slope = (*now_sma - *then_sma) / *atr;
  if (not std::isfinite(slope))
    return std::nullopt;
  return slope;
}

std::optional<double> reference_move(const Series &bars) {
  if (bars.size() < ref_lookback_bars + 1)
    return std::nullopt;

  const auto last = bars.back().close;
  const auto then = bars[bars.size() - 1 - ref_lookback_bars].close;
  if (then <= 0.0)
    return std::nullopt;

  auto move = (last - then) / then;
  if (not std::isfinite(move))
    return std::nullopt;
  return move;
}

CandidateSignal score_candidate(const GateResult &gate,
                                const TrendContext &trend) {
  auto candidate = CandidateSignal{};
  candidate.symbol = gate.symbol;
  candidate.side = gate.side;
  candidate.signal_bar = gate.signal_bar;
  candidate.gate = gate;
  candidate.trend = trend;

  const auto sign = side_sign(gate.side);
  const auto wick_min = min_wick_ratio(gate.side);

  auto score = base_score;
  score += w_wick * clamp01((gate.wick_ratio - wick_min) / wick_min,
                            wick_excess_cap);
  score += w_spike * clamp01((gate.spike_mult - atr_spike_mult) / atr_spike_mult,
                             spike_excess_cap);

  // Higher timeframe trend
  if (trend.htf_slope) {
    const auto aligned = *trend.htf_slope * sign;
    if (aligned <= -strong_trend_veto)
      candidate.veto = Veto::CounterTrend;
    else if (aligned < 0.0)
      score -= w_counter_trend * clamp01(-aligned / strong_trend_veto);
    else if (aligned > 0.0)
      score += trend_align_bonus;
  } else {
    score -= missing_htf_penalty;
  }

  // Market-wide move against the trade
  const auto adverse = -trend.ref_move * sign;
  if (adverse >= ref_veto_pct) {
    if (candidate.veto == Veto::None)
      candidate.veto = Veto::ReferenceAsset;
  } else if (adverse > 0.0) {
    score -= w_ref * clamp01(adverse / ref_veto_pct);
  }

  // Close already on the far side of the mean leaves little room to revert
  score -= w_mean_rev * clamp01(sign * gate.sma_distance_atr);

  score += pass_count_bonus * (gate.pass_count - min_gate_passes);

  if (gate.side == Side::Long)
    score -= long_score_bias;

  candidate.score = score;
  return candidate;
}

std::string_view to_string(Veto veto) {
  switch (veto) {
  case Veto::None: return "none";
  case Veto::CounterTrend: return "counter-trend";
  case Veto::ReferenceAsset: return "reference asset";
  }
  return "unknown";
}

} // namespace wick
