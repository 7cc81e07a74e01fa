#include "threshold.h"
#include "defs.h"
#include "indicators.h"
#include <algorithm>
#include <cmath>

namespace wick {

namespace {

double round_cents(double x) { return std::round(x * 100.0) / 100.0; }

// Round to 0.01, clamp, and keep the move within the jump limit
double settle(double current, double proposed) {
  auto value = std::clamp(round_cents(proposed), score_min, score_max);
  if (value - current > threshold_max_jump)
    value = current + threshold_max_jump;
  else if (current - value > threshold_max_jump)
    value = current - threshold_max_jump;
  return std::clamp(value, score_min, score_max);
}

} // namespace

double next_threshold(double current, const std::vector<double> &scores,
                      std::size_t opened, std::size_t vetoes) {

  // Too few scores to estimate a distribution: explore downwards when the
  // market was quiet and nothing blocked us
  if (scores.size() < min_score_sample) {
    if (opened == 0 and vetoes < explore_max_vetoes)
      return settle(current, current - explore_step);
    return std::clamp(current, score_min, score_max);
  }

  const auto level = threshold_quantile_level(scores.size());
  const auto q = indicators::quantile(scores, level);
  if (not q)
    return std::clamp(current, score_min, score_max);

  const auto target = std::clamp(*q + threshold_pad, score_min, score_max);
  auto proposed =
      (1.0 - threshold_smoothing) * current + threshold_smoothing * target;
  proposed = std::clamp(proposed, current - threshold_max_jump,
                        current + threshold_max_jump);

  return settle(current, proposed);
}

ThresholdController::ThresholdController()
    : state_{threshold_base, TimePoint{}, 0.0} {}

ThresholdController::ThresholdController(ThresholdState state) {
  restore(state);
}

double ThresholdController::value() const {
  auto lock = std::scoped_lock{mutex_};
  return state_.value;
}

double ThresholdController::for_side(Side side) const {
  auto lock = std::scoped_lock{mutex_};
  return side == Side::Long ? state_.value + long_threshold_offset
                            : state_.value;
}

ThresholdState ThresholdController::state() const {
  auto lock = std::scoped_lock{mutex_};
  return state_;
}

void ThresholdController::restore(ThresholdState state) {
  if (not std::isfinite(state.value))
    state.value = threshold_base;
  state.value = std::clamp(state.value, score_min, score_max);

  auto lock = std::scoped_lock{mutex_};
  state_ = state;
}

ThresholdState ThresholdController::commit(double proposed, TimePoint now) {
  auto lock = std::scoped_lock{mutex_};
  state_.last_delta = proposed - state_.value;
  state_.value = proposed;
  state_.updated_at = now;
  return state_;
}

ThresholdState ThresholdController::update(const std::vector<double> &scores,
                                           std::size_t opened,
                                           std::size_t vetoes, TimePoint now) {
  return commit(next_threshold(value(), scores, opened, vetoes), now);
}

ThresholdState ThresholdController::bump(TimePoint now) {
  const auto current = value();
  return commit(settle(current, current + trades_per_scan_bump), now);
}

} // namespace wick
