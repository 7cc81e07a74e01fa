#include "gate.h"
#include "defs.h"
#include "indicators.h"
#include <algorithm>
#include <cmath>

namespace wick {

double min_wick_ratio(Side side) {
  return side == Side::Long ? wick_ratio_long : wick_ratio_short;
}

double max_spike_mult(Side side) {
  return side == Side::Long ? max_spike_mult_long : max_spike_mult_short;
}

GateResult evaluate_gate(std::string_view symbol, const Series &bars,
                         TimePoint now, const SymbolState &state) {
  auto result = GateResult{};
  result.symbol = std::string{symbol};

  auto reject = [&](GateReject reason) {
    result.reject = reason;
    result.passed = false;
    return result;
  };

  // Engine-side exclusions first, they need no data
  if (state.on_cooldown)
    return reject(GateReject::Cooldown);

  if (state.reserved or state.open_positions >= max_positions_per_symbol)
    return reject(GateReject::PositionLimit);

  if (bars.size() < min_gate_bars)
    return reject(GateReject::InsufficientHistory);

  // Pick the last completed bar
  const auto period = timeframe_duration(timeframe);
  auto index = bars.size() - 1;
  if (not is_complete(bars[index], period, now)) {
    if (index < min_gate_bars)
      return reject(GateReject::StaleBar);
    --index;
  }

  // A completed bar more than one period old means the feed has stalled
  if (bars[index].time + 2 * period < now)
    return reject(GateReject::StaleBar);

  const auto &bar = bars[index];
  result.signal_bar = bar;

  if (bar.close < min_price)
    return reject(GateReject::PriceFloor);

  const auto atr = indicators::atr(bars, atr_period, index);
  const auto vol_z = indicators::volume_z(bars, vol_window, index);
  const auto sma = indicators::sma(bars, sma_period, index);
  if (not atr or not vol_z or not sma or *atr <= 0.0)
    return reject(GateReject::NonFinite);

  result.atr = *atr;
  result.volume_z = *vol_z;
  result.sma_distance_atr = (bar.close - *sma) / *atr;

  const auto body_high = std::max(bar.open, bar.close);
  const auto body_low = std::min(bar.open, bar.close);
  result.body = body_high - body_low;
  result.upper_wick = bar.high - body_high;
  result.lower_wick = body_low - bar.low;

  if (result.body < min_body_atr_frac * result.atr)
    return reject(GateReject::MicroBody);

  // Trade against the spike: a dominant lower wick is a rejected sell-off
  result.side = result.lower_wick > result.upper_wick ? Side::Long : Side::Short;
  const auto dominant = std::max(result.upper_wick, result.lower_wick);

  result.wick_ratio = dominant / result.body;
  result.spike_mult = (bar.high - bar.low) / result.atr;

  if (not std::isfinite(result.wick_ratio) or not std::isfinite(result.spike_mult) or
      not std::isfinite(result.sma_distance_atr))
    return reject(GateReject::NonFinite);

  result.wick_ok = result.wick_ratio >= min_wick_ratio(result.side);
  result.range_ok = result.spike_mult >= atr_spike_mult and
                    result.spike_mult <= max_spike_mult(result.side);
  result.volume_ok = result.volume_z >= vol_z_threshold;
  result.pass_count = static_cast<int>(result.wick_ok) +
                      static_cast<int>(result.range_ok) +
                      static_cast<int>(result.volume_ok);

  // Range test is mandatory, plus at least one of the other two
  result.passed = result.range_ok and result.pass_count >= min_gate_passes;
  if (not result.passed)
    result.reject = GateReject::Failed;

  return result;
}

std::string_view to_string(GateReject reason) {
  switch (reason) {
  case GateReject::None: return "none";
  case GateReject::InsufficientHistory: return "insufficient history";
  case GateReject::StaleBar: return "stale bar";
  case GateReject::PriceFloor: return "price floor";
  case GateReject::Cooldown: return "cooldown";
  case GateReject::PositionLimit: return "position limit";
  case GateReject::NonFinite: return "non-finite indicator";
  case GateReject::MicroBody: return "micro body";
  case GateReject::Failed: return "gate failed";
  }
  return "unknown";
}

} // namespace wick
