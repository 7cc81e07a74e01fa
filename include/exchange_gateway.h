#pragma once

#include "market_types.h"
#include <expected>
#include <map>
#include <string>
#include <string_view>

namespace wick {

// Market data and precision services of a perpetuals exchange
class ExchangeGateway {
public:
    virtual ~ExchangeGateway() = default;

    // Most recent `limit` bars, oldest first; the last one may still be forming
    virtual std::expected<Series, ExchangeError>
    fetch_bars(std::string_view symbol, std::string_view timeframe, std::size_t limit) = 0;

    virtual std::expected<Ticker, ExchangeError> fetch_ticker(std::string_view symbol) = 0;

    virtual std::expected<std::map<std::string, Ticker>, ExchangeError> fetch_tickers() = 0;

    // Round a price to the instrument's tick size
    virtual std::expected<double, ExchangeError> round_to_tick(std::string_view symbol,
                                                               double price) = 0;

    virtual std::expected<std::map<std::string, MarketInfo>, ExchangeError> list_markets() = 0;
};

} // namespace wick
