#pragma once

#include "market_types.h"
#include <optional>
#include <span>
#include <vector>

namespace wick {

// Technical indicators over bar series
// Functions returning std::optional give nullopt when history is too short;
// every returned value is finite
namespace indicators {

// True range of bar i (needs i >= 1 for the previous close)
double true_range(const Series &, std::size_t i);

// Wilder ATR ending at bar `end` inclusive
std::optional<double> atr(const Series &, std::size_t period, std::size_t end);
std::optional<double> atr(const Series &, std::size_t period);

// Simple moving average of closes ending at bar `end` inclusive
std::optional<double> sma(const Series &, std::size_t period, std::size_t end);

// EMA of closes, one value per bar (seeded with the SMA of the first `period`)
std::vector<double> ema_series(const Series &, std::size_t period);

// Wilder RSI of closes at the last bar
std::optional<double> rsi(const Series &, std::size_t period);

struct MeanStd {
    double mean{};
    double stdev{}; // Sample standard deviation
};

std::optional<MeanStd> mean_std(std::span<const double>);

// Z-score of bar `end` volume against the `window` bars before it
std::optional<double> volume_z(const Series &, std::size_t window, std::size_t end);

// Empirical quantile with linear interpolation between order statistics
std::optional<double> quantile(std::vector<double>, double q);

} // namespace indicators

} // namespace wick
