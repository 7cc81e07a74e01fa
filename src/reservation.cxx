#include "reservation.h"
#include <utility>

namespace wick {

Reservation::Reservation(ReservationSet *owner, std::string symbol)
    : owner_{owner}, symbol_{std::move(symbol)} {}

Reservation::Reservation(Reservation &&other) noexcept
    : owner_{std::exchange(other.owner_, nullptr)},
      symbol_{std::move(other.symbol_)} {}

Reservation &Reservation::operator=(Reservation &&other) noexcept {
  if (this != &other) {
    release();
    owner_ = std::exchange(other.owner_, nullptr);
    symbol_ = std::move(other.symbol_);
  }
  return *this;
}

Reservation::~Reservation() { release(); }

void Reservation::release() {
  if (auto *owner = std::exchange(owner_, nullptr))
    owner->release(symbol_);
}

std::optional<Reservation> ReservationSet::try_reserve(std::string_view symbol) {
  auto lock = std::scoped_lock{mutex_};
  auto [it, inserted] = symbols_.emplace(symbol);
  if (not inserted)
    return std::nullopt;
  return Reservation{this, std::string{symbol}};
}

bool ReservationSet::contains(std::string_view symbol) const {
  auto lock = std::scoped_lock{mutex_};
  return symbols_.contains(symbol);
}

std::size_t ReservationSet::size() const {
  auto lock = std::scoped_lock{mutex_};
  return symbols_.size();
}

std::vector<std::string> ReservationSet::symbols() const {
  auto lock = std::scoped_lock{mutex_};
  return {symbols_.begin(), symbols_.end()};
}

void ReservationSet::release(const std::string &symbol) {
  auto lock = std::scoped_lock{mutex_};
  symbols_.erase(symbol);
}

} // namespace wick
