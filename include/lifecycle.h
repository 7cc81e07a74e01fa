#pragma once

#include "engine_context.h"
#include "position.h"
#include <optional>
#include <stop_token>
#include <string_view>

namespace wick {

struct ExitDecision {
    ExitReason reason{ExitReason::None};
    double price{};
};

// True while the bar the position was opened in is still forming
bool on_entry_bar(const Position &, TimePoint now);

// Bracket every completed bar after the last checked one: stop first, then
// target, exiting at the bracket price. Updates excursions and the trail.
std::optional<ExitDecision> bracket_bars(Position &, const Series &, TimePoint now);

// Entry-bar check against the live price; exits at that price
std::optional<ExitDecision> check_live(Position &, double price);

// Lock in profit once the favourable excursion passes the trigger; the stop
// only ever moves in the position's favour. True if the stop moved.
bool ratchet_trailing(Position &);

// Close, remove, notify, journal and start the cooldown; nullopt when the
// position was already closed
std::optional<Position> finalize_close(EngineContext &, std::string_view signal_id,
                                       ExitReason, double price, TimePoint now);

// One monitoring pass over every non-averaging position
void monitor_positions(EngineContext &, TimePoint now, std::stop_token = {});

// Manual close at the live price (reference price if unavailable);
// an empty symbol closes everything. Returns the number closed.
std::size_t force_close(EngineContext &, std::string_view symbol, TimePoint now);

} // namespace wick
