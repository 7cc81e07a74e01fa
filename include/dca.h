#pragma once

#include "engine_context.h"
#include "lifecycle.h"
#include "position.h"
#include "trade_log.h"
#include <mutex>
#include <optional>
#include <stop_token>
#include <vector>

namespace wick {

// ═══════════════════════════════════════════════════════════════════════════
// Range-bound averaging: one symbol, a geometric margin plan, a ladder of
// averaging prices, breakout freeze with a single retest slot, and a staged
// trailing stop
// ═══════════════════════════════════════════════════════════════════════════

struct PriceRange {
    double lower{};
    double upper{};
    double mid{};

    double width() const { return upper - lower; }
    bool valid() const { return lower > 0.0 and upper > lower; }
};

struct DcaRanges {
    PriceRange tactical;
    PriceRange strategic;
    double atr{};   // ATR14 on the range timeframe
    double price{}; // Close of the last range bar
    TimePoint built_at{};
};

// Close quantiles over the last `lookback` bars, widened to EMA50 +- k ATR
std::optional<PriceRange> build_range(const Series &, std::size_t lookback);
std::optional<DcaRanges> build_ranges(const Series &, TimePoint now);

// m_i = total * g^i * (g - 1) / (g^N - 1); equal split when g == 1
std::vector<double> plan_margins(double bank, double deposit_frac, std::size_t levels,
                                 double growth);

// Thin ranges average gently, volatile markets aggressively
double choose_growth(const DcaRanges &);

// Averaging prices from both ranges, on the adverse side of entry, nearest
// first, at least ladder_min_gap_pct apart, at most `max_steps` of them
std::vector<double> build_ladder(double entry, Side, const PriceRange &tactical,
                                 const PriceRange &strategic, std::size_t max_steps);

// Fill one step at `price`, updating quantity and the volume-weighted average
void add_step(DcaState &, double price, double margin, TimePoint);

double dca_target(const DcaState &, Side);

// Estimated liquidation price for operator display only
double liquidation_price(const DcaState &, Side, double equity, double mmr);

// Price beyond the strategic boundary on the adverse side
bool breakout(const Position &, double price);

// Back inside the range by the retest band and the last closed bar crossed
// EMA20 in the position's direction
bool retest_confirmed(const Position &, double price, const Series &closed_bars);

// Staged trailing stop; returns the new stop when it moves
std::optional<double> ratchet_dca_stop(Position &, double price, double atr);

// Weighted range-entry signal on closed entry-timeframe bars
struct DcaSignal {
    Side side{Side::Long};
    double score{};
    double price{};
};

std::optional<DcaSignal> evaluate_dca_entry(const Series &closed_bars, const PriceRange &tactical);

// Fresh averaging position with its first step filled
Position make_dca_position(std::string_view symbol, const DcaSignal &, const DcaRanges &,
                           double tick_size, TimePoint now);

struct DcaTick {
    std::vector<PositionEvent> events;
    std::optional<ExitDecision> exit;
};

// One monitoring step for an averaging position at the live price
DcaTick advance_dca(Position &, double price, const Series &closed_bars, TimePoint now);

// Engine-side passes for the range_dca strategy
class DcaRunner {
public:
    explicit DcaRunner(EngineContext &);

    // Startup check: the configured symbol must be listed
    bool symbol_listed(std::stop_token = {});

    // Rebuild ranges when stale, then look for an entry
    void scan(TimePoint now, std::stop_token);

    void monitor(TimePoint now, std::stop_token = {});

    std::optional<DcaRanges> ranges() const;

private:
    EngineContext &ctx_;
    mutable std::mutex mutex_;
    std::optional<DcaRanges> ranges_;
    double tick_size_{};
};

} // namespace wick
