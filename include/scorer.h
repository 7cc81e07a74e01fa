#pragma once

#include "gate.h"
#include "market_types.h"
#include <optional>
#include <string>

namespace wick {

// Market context shared by all candidates of a scan
struct TrendContext {
    std::optional<double> htf_slope; // SMA50 slope in HTF ATR units, nullopt if missing
    double ref_move{};               // Reference asset move over the lookback
};

enum class Veto { None, CounterTrend, ReferenceAsset };

struct CandidateSignal {
    std::string symbol;
    Side side{Side::Short};
    double score{};
    Veto veto{Veto::None};
    Bar signal_bar;
    GateResult gate;
    TrendContext trend;
};

// (SMA50[t] - SMA50[t - lookback]) / ATR14 on the higher timeframe
std::optional<double> htf_slope(const Series &);

// Fractional close-to-close move over the reference lookback
std::optional<double> reference_move(const Series &);

// Deterministic score of a gate-passed symbol; vetoed candidates carry a
// score but must not be traded
CandidateSignal score_candidate(const GateResult &, const TrendContext &);

std::string_view to_string(Veto);

} // namespace wick
