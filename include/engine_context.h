#pragma once

#include "cooldown.h"
#include "market_data.h"
#include "notifier.h"
#include "position.h"
#include "reservation.h"
#include "threshold.h"
#include "trade_log.h"
#include <atomic>
#include <string_view>

namespace wick {

// Shared state of one engine, handed to every component. Write rights:
// the opener inserts positions and owns reservations; the lifecycle monitor
// mutates and removes positions; the scan updates the threshold.
struct EngineContext {
    MarketDataFetcher &fetcher;
    PositionBook &positions;
    ReservationSet &reservations;
    CooldownRegistry &cooldowns;
    ThresholdController &threshold;
    Notifier &notifier;
    TradeLogStore &trade_log;

    std::atomic<std::size_t> opened{};
    std::atomic<std::size_t> closed{};
    std::atomic<std::size_t> no_touch{};
};

// Send and log failures; an unconfigured notifier is not a failure
void notify(EngineContext &, std::string_view text);

} // namespace wick
