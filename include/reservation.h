#pragma once

#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <string_view>
#include <vector>

namespace wick {

class ReservationSet;

// Move-only claim on a symbol; releases it exactly once, on release() or
// destruction, whichever comes first
class Reservation {
public:
    Reservation() = default;
    Reservation(const Reservation &) = delete;
    Reservation &operator=(const Reservation &) = delete;
    Reservation(Reservation &&) noexcept;
    Reservation &operator=(Reservation &&) noexcept;
    ~Reservation();

    const std::string &symbol() const { return symbol_; }
    bool held() const { return owner_ != nullptr; }
    void release();

private:
    friend class ReservationSet;
    Reservation(ReservationSet *, std::string);

    ReservationSet *owner_{};
    std::string symbol_;
};

// Symbols with an open attempt in flight. The set must outlive its tokens.
class ReservationSet {
public:
    // nullopt when the symbol is already reserved
    std::optional<Reservation> try_reserve(std::string_view);

    bool contains(std::string_view) const;
    std::size_t size() const;
    std::vector<std::string> symbols() const;

private:
    friend class Reservation;
    void release(const std::string &);

    mutable std::mutex mutex_;
    std::set<std::string, std::less<>> symbols_;
};

} // namespace wick
