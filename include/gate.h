#pragma once

#include "market_types.h"
#include <string>
#include <string_view>

namespace wick {

enum class GateReject {
    None,
    InsufficientHistory,
    StaleBar,
    PriceFloor,
    Cooldown,
    PositionLimit,
    NonFinite,
    MicroBody,
    Failed
};

// Metrics of the signal bar; recomputed every scan
struct GateResult {
    std::string symbol;
    Side side{Side::Short};
    Bar signal_bar;
    double atr{};
    double body{};
    double upper_wick{};
    double lower_wick{};
    double wick_ratio{};       // Dominant wick / body
    double spike_mult{};       // (high - low) / ATR
    double volume_z{};
    double sma_distance_atr{}; // (close - SMA20) / ATR, signed

    bool wick_ok{};
    bool range_ok{};
    bool volume_ok{};
    int pass_count{};

    bool passed{};
    GateReject reject{GateReject::None};
};

// Engine state relevant to one symbol at gate time
struct SymbolState {
    bool on_cooldown{};
    std::size_t open_positions{};
    bool reserved{};
};

// Filter one symbol's recent bars. The signal bar is the last completed bar:
// when the newest bar is still forming the previous one is used, provided
// enough history remains.
GateResult evaluate_gate(std::string_view symbol, const Series &, TimePoint now,
                         const SymbolState & = {});

// Long thresholds are stricter than short ones
double min_wick_ratio(Side);
double max_spike_mult(Side);

std::string_view to_string(GateReject);

} // namespace wick
