#include "position.h"
#include "pct_utils.h"
#include <algorithm>
#include <format>
#include <numeric>

namespace wick {

double DcaState::committed_margin() const {
  return std::accumulate(steps.begin(), steps.end(), 0.0,
                         [](double sum, const DcaStep &s) { return sum + s.margin; });
}

void update_excursions(Position &pos, double high, double low) {
  if (pos.side == Side::Long) {
    pos.max_favorable_price = std::max(pos.max_favorable_price, high);
    pos.max_adverse_price = pos.max_adverse_price > 0.0
                                ? std::min(pos.max_adverse_price, low)
                                : low;
  } else {
    pos.max_favorable_price = pos.max_favorable_price > 0.0
                                  ? std::min(pos.max_favorable_price, low)
                                  : low;
    pos.max_adverse_price = std::max(pos.max_adverse_price, high);
  }
}

double mfe_pct(const Position &pos) {
  if (pos.max_favorable_price <= 0.0)
    return 0.0;
  return std::max(0.0, move_pct(pos.reference_price(), pos.max_favorable_price,
                                side_sign(pos.side)));
}

double mae_pct(const Position &pos) {
  if (pos.max_adverse_price <= 0.0)
    return 0.0;
  return std::min(0.0, move_pct(pos.reference_price(), pos.max_adverse_price,
                                side_sign(pos.side)));
}

bool close_position(Position &pos, ExitReason reason, double exit_price,
                    TimePoint now) {
  if (pos.status == PositionStatus::Closed)
    return false;

  pos.status = PositionStatus::Closed;
  pos.exit_reason = reason;
  pos.exit_price = exit_price;
  pos.closed_at = now;
  pos.pnl_pct = move_pct(pos.reference_price(), exit_price, side_sign(pos.side));
  pos.pnl_usd = leveraged_pnl(pos.margin(), pos.leverage, pos.pnl_pct);
  return true;
}

void PositionBook::add(Position pos) {
  auto lock = std::scoped_lock{mutex_};
  positions_.push_back(std::move(pos));
}

std::vector<Position> PositionBook::snapshot() const {
  auto lock = std::scoped_lock{mutex_};
  return positions_;
}

std::optional<Position> PositionBook::find(std::string_view signal_id) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = std::ranges::find(positions_, signal_id, &Position::signal_id);
  if (it == positions_.end())
    return std::nullopt;
  return *it;
}

std::optional<Position> PositionBook::find_symbol(std::string_view symbol) const {
  auto lock = std::scoped_lock{mutex_};
  auto it = std::ranges::find(positions_, symbol, &Position::symbol);
  if (it == positions_.end())
    return std::nullopt;
  return *it;
}

std::size_t PositionBook::count() const {
  auto lock = std::scoped_lock{mutex_};
  return positions_.size();
}

std::size_t PositionBook::count_for(std::string_view symbol) const {
  auto lock = std::scoped_lock{mutex_};
  return static_cast<std::size_t>(
      std::ranges::count(positions_, symbol, &Position::symbol));
}

bool PositionBook::update(std::string_view signal_id,
                          const std::function<void(Position &)> &mutate) {
  auto lock = std::scoped_lock{mutex_};
  auto it = std::ranges::find(positions_, signal_id, &Position::signal_id);
  if (it == positions_.end() or it->status != PositionStatus::Active)
    return false;
  mutate(*it);
  return true;
}

std::optional<Position> PositionBook::close(std::string_view signal_id,
                                            ExitReason reason,
                                            double exit_price, TimePoint now) {
  auto lock = std::scoped_lock{mutex_};
  auto it = std::ranges::find(positions_, signal_id, &Position::signal_id);
  if (it == positions_.end())
    return std::nullopt;

  auto closed = std::move(*it);
  positions_.erase(it);
  if (not close_position(closed, reason, exit_price, now))
    return std::nullopt;
  return closed;
}

void PositionBook::restore(std::vector<Position> positions) {
  std::erase_if(positions, [](const Position &p) {
    return p.status != PositionStatus::Active;
  });
  auto lock = std::scoped_lock{mutex_};
  positions_ = std::move(positions);
}

std::string make_signal_id(std::string_view symbol, Side side,
                           TimePoint bar_time) {
  return std::format(
      "{}-{}-{}", symbol, side == Side::Long ? "L" : "S",
      std::chrono::duration_cast<std::chrono::seconds>(bar_time.time_since_epoch())
          .count());
}

std::string_view to_string(PositionStatus status) {
  return status == PositionStatus::Active ? "ACTIVE" : "CLOSED";
}

std::string_view to_string(ExitReason reason) {
  switch (reason) {
  case ExitReason::None: return "NONE";
  case ExitReason::StopLoss: return "STOP_LOSS";
  case ExitReason::TakeProfit: return "TAKE_PROFIT";
  case ExitReason::TrailingStop: return "TRAILING_STOP";
  case ExitReason::Manual: return "MANUAL";
  }
  return "NONE";
}

} // namespace wick
