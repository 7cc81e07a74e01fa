#pragma once

#include "exchange_gateway.h"
#include <mutex>

namespace wick {

// MEXC contract (USDT-M perpetuals) public REST API
class MexcClient : public ExchangeGateway {
public:
    MexcClient();

    std::expected<Series, ExchangeError>
    fetch_bars(std::string_view, std::string_view, std::size_t) override;

    std::expected<Ticker, ExchangeError> fetch_ticker(std::string_view) override;

    std::expected<std::map<std::string, Ticker>, ExchangeError> fetch_tickers() override;

    std::expected<double, ExchangeError> round_to_tick(std::string_view, double) override;

    std::expected<std::map<std::string, MarketInfo>, ExchangeError> list_markets() override;

private:
    std::string base_url_;

    // Contract details change rarely; cached after the first listing
    std::mutex markets_mutex_;
    std::map<std::string, MarketInfo> markets_;

    std::expected<std::string, ExchangeError> get(const std::string &);
};

// Exchange interval name for a timeframe ("1m" -> "Min1")
std::string_view mexc_interval(std::string_view);

} // namespace wick
