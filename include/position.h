#pragma once

#include "market_types.h"
#include <functional>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace wick {

enum class PositionStatus { Active, Closed };

enum class ExitReason { None, StopLoss, TakeProfit, TrailingStop, Manual };

struct DcaStep {
    double price{};
    double qty{};
    double margin{};
    TimePoint time{};
};

// Averaging state of a range position
struct DcaState {
    std::vector<double> margin_plan; // One planned margin per step
    std::vector<DcaStep> steps;      // Filled steps
    std::vector<double> ladder;      // Pending step prices, nearest first
    double qty{};
    double avg_price{};
    double leverage{};
    double growth{};
    double strategic_lower{};
    double strategic_upper{};
    double tick_size{};
    bool frozen{};              // Price broke out of the strategic range
    bool reserved_final_step{}; // One slot held back for a retest

    double committed_margin() const;
    std::size_t steps_left() const { return margin_plan.size() - steps.size(); }
};

struct Position {
    std::string signal_id;
    std::string symbol;
    Side side{Side::Long};
    PositionStatus status{PositionStatus::Active};

    double entry_price{};
    std::optional<double> stop_price;
    double target_price{};
    double leverage{};
    double size_usdt{}; // Nominal margin
    double score{};
    double atr{};

    TimePoint opened_at{};
    TimePoint entry_bar_time{};    // Open time of the bar the entry happened in
    TimePoint last_bar_checked{};  // Open time of the last bracketed bar

    double max_favorable_price{};
    double max_adverse_price{};
    int trail_stage{}; // 0 = not armed

    std::optional<DcaState> dca;

    // Filled on close
    ExitReason exit_reason{ExitReason::None};
    double exit_price{};
    TimePoint closed_at{};
    double pnl_pct{};  // Unleveraged price move
    double pnl_usd{};

    double reference_price() const { return dca ? dca->avg_price : entry_price; }
    double margin() const { return dca ? dca->committed_margin() : size_usdt; }
};

// Track the best and worst prices seen
void update_excursions(Position &, double high, double low);

// Excursions as signed fractions of the reference price
double mfe_pct(const Position &);
double mae_pct(const Position &);

// ACTIVE -> CLOSED with realised P&L; false if already closed
bool close_position(Position &, ExitReason, double exit_price, TimePoint now);

// Process-wide set of active positions. Each call is one atomic step.
class PositionBook {
public:
    void add(Position);
    std::vector<Position> snapshot() const;
    std::optional<Position> find(std::string_view signal_id) const;
    std::optional<Position> find_symbol(std::string_view symbol) const;
    std::size_t count() const;
    std::size_t count_for(std::string_view symbol) const;

    // Apply a mutation to one active position; false if it is gone
    bool update(std::string_view signal_id, const std::function<void(Position &)> &);

    // Close and remove; nullopt when already closed or unknown
    std::optional<Position> close(std::string_view signal_id, ExitReason,
                                  double exit_price, TimePoint now);

    void restore(std::vector<Position>);

private:
    mutable std::mutex mutex_;
    std::vector<Position> positions_;
};

std::string make_signal_id(std::string_view symbol, Side, TimePoint bar_time);

std::string_view to_string(PositionStatus);
std::string_view to_string(ExitReason);

} // namespace wick
