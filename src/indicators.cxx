#include "indicators.h"
#include <algorithm>
#include <cmath>
#include <numeric>

namespace wick::indicators {

double true_range(const Series &bars, std::size_t i) {
  const auto &bar = bars[i];
  if (i == 0)
    return bar.high - bar.low;
  const auto prev_close = bars[i - 1].close;
  return std::max({bar.high - bar.low, std::abs(bar.high - prev_close),
                   std::abs(bar.low - prev_close)});
}

std::optional<double> atr(const Series &bars, std::size_t period,
                          std::size_t end) {
  if (period == 0 or end >= bars.size() or end < period)
    return std::nullopt;

  // Seed with the mean of the first `period` true ranges, then Wilder smooth
  auto value = 0.0;
  for (auto i = 1uz; i <= period; ++i)
    value += true_range(bars, i);
  value /= static_cast<double>(period);

  for (auto i = period + 1; i <= end; ++i)
    value = (value * static_cast<double>(period - 1) + true_range(bars, i)) /
            static_cast<double>(period);

  if (not std::isfinite(value))
    return std::nullopt;
  return value;
}

std::optional<double> atr(const Series &bars, std::size_t period) {
  if (bars.empty())
    return std::nullopt;
  return atr(bars, period, bars.size() - 1);
}

std::optional<double> sma(const Series &bars, std::size_t period,
                          std::size_t end) {
  if (period == 0 or end >= bars.size() or end + 1 < period)
    return std::nullopt;

  auto sum = 0.0;
  for (auto i = end + 1 - period; i <= end; ++i)
    sum += bars[i].close;

  auto value = sum / static_cast<double>(period);
  if (not std::isfinite(value))
    return std::nullopt;
  return value;
}

std::vector<double> ema_series(const Series &bars, std::size_t period) {
  if (period == 0 or bars.size() < period)
    return {};

  auto out = std::vector<double>(bars.size(), 0.0);
  auto seed = 0.0;
  for (auto i = 0uz; i < period; ++i) {
    seed += bars[i].close;
    out[i] = seed / static_cast<double>(i + 1);
  }
  out[period - 1] = seed / static_cast<double>(period);

  const auto alpha = 2.0 / (static_cast<double>(period) + 1.0);
  for (auto i = period; i < bars.size(); ++i)
    out[i] = alpha * bars[i].close + (1.0 - alpha) * out[i - 1];

  return out;
}

std::optional<double> rsi(const Series &bars, std::size_t period) {
  if (period == 0 or bars.size() < period + 1)
    return std::nullopt;

  auto gain = 0.0;
  auto loss = 0.0;
  for (auto i = 1uz; i <= period; ++i) {
    auto change = bars[i].close - bars[i - 1].close;
    (change > 0.0 ? gain : loss) += std::abs(change);
  }
  gain /= static_cast<double>(period);
  loss /= static_cast<double>(period);

  for (auto i = period + 1; i < bars.size(); ++i) {
    auto change = bars[i].close - bars[i - 1].close;
    auto up = change > 0.0 ? change : 0.0;
    auto down = change < 0.0 ? -change : 0.0;
    gain = (gain * static_cast<double>(period - 1) + up) / static_cast<double>(period);
    loss = (loss * static_cast<double>(period - 1) + down) / static_cast<double>(period);
  }

  if (loss == 0.0)
    return gain == 0.0 ? 50.0 : 100.0;

  auto value = 100.0 - 100.0 / (1.0 + gain / loss);
  if (not std::isfinite(value))
    return std::nullopt;
  return value;
}

std::optional<MeanStd> mean_std(std::span<const double> values) {
  if (values.size() < 2)
    return std::nullopt;

  const auto n = static_cast<double>(values.size());
  const auto mean = std::accumulate(values.begin(), values.end(), 0.0) / n;

  auto sq = 0.0;
  for (auto v : values)
    sq += (v - mean) * (v - mean);

  auto result = MeanStd{mean, std::sqrt(sq / (n - 1.0))};
  if (not std::isfinite(result.mean) or not std::isfinite(result.stdev))
    return std::nullopt;
  return result;
}

std::optional<double> volume_z(const Series &bars, std::size_t window,
                               std::size_t end) {
  if (end >= bars.size() or end < window)
    return std::nullopt;

  auto volumes = std::vector<double>{};
  volumes.reserve(window);
  for (auto i = end - window; i < end; ++i)
    volumes.push_back(bars[i].volume);

  auto stats = mean_std(volumes);
  if (not stats)
    return std::nullopt;

  // Flat volume history carries no information
  if (stats->stdev <= 0.0)
    return 0.0;

  auto z = (bars[end].volume - stats->mean) / stats->stdev;
  if (not std::isfinite(z))
    return std::nullopt;
  return z;
}

std::optional<double> quantile(std::vector<double> values, double q) {
  if (values.empty() or q < 0.0 or q > 1.0)
    return std::nullopt;

  std::ranges::sort(values);
  const auto pos = q * static_cast<double>(values.size() - 1);
  const auto lo = static_cast<std::size_t>(std::floor(pos));
  const auto hi = std::min(lo + 1, values.size() - 1);
  const auto frac = pos - static_cast<double>(lo);
  return values[lo] + (values[hi] - values[lo]) * frac;
}

} // namespace wick::indicators
