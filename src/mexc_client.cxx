#include "mexc_client.h"
#include "config.h"
#include <cmath>
#include <format>
#include <httplib.h>
#include <nlohmann/json.hpp>
#include <print>

using json = nlohmann::json;

namespace wick {

namespace {

// MEXC reports "requests too frequent" inside a 200 response
constexpr auto mexc_rate_limit_code = 510;

double as_double(const json &value) {
  if (value.is_number())
    return value.get<double>();
  if (value.is_string())
    return std::stod(value.get<std::string>());
  return 0.0;
}

} // namespace

std::string_view mexc_interval(std::string_view tf) {
  if (tf == "1m")
    return "Min1";
  if (tf == "5m")
    return "Min5";
  if (tf == "15m")
    return "Min15";
  if (tf == "30m")
    return "Min30";
  if (tf == "1h")
    return "Min60";
  if (tf == "4h")
    return "Hour4";
  if (tf == "1d")
    return "Day1";
  return "Min1";
}

MexcClient::MexcClient()
    : base_url_{get_env_or_default("MEXC_BASE_URL",
                                   "https://contract.mexc.com")} {}

std::expected<std::string, ExchangeError>
MexcClient::get(const std::string &path) {
  auto client = httplib::Client{base_url_};
  client.set_connection_timeout(5);
  client.set_read_timeout(10);

  auto res = client.Get(path);

  if (not res) {
    if (res.error() == httplib::Error::ConnectionTimeout or
        res.error() == httplib::Error::Read)
      return std::unexpected(ExchangeError::Timeout);
    return std::unexpected(ExchangeError::NetworkError);
  }

  if (res->status == 429)
    return std::unexpected(ExchangeError::RateLimitError);

  if (res->status == 404)
    return std::unexpected(ExchangeError::InvalidSymbol);

  if (res->status >= 500)
    return std::unexpected(ExchangeError::NetworkError);

  if (res->status != 200) {
    std::println(stderr, "MEXC API error: status={}, body={}", res->status,
                 res->body);
    return std::unexpected(ExchangeError::UnknownError);
  }

  return res->body;
}

namespace {

// Unwrap the {"success": .., "code": .., "data": ..} envelope
std::expected<json, ExchangeError> unwrap(const std::string &body) {
  auto j = json::parse(body, nullptr, false);
  if (j.is_discarded() or not j.is_object())
    return std::unexpected(ExchangeError::ParseError);

  if (not j.value("success", false)) {
    auto code = j.value("code", -1);
    if (code == mexc_rate_limit_code)
      return std::unexpected(ExchangeError::RateLimitError);
    return std::unexpected(ExchangeError::InvalidSymbol);
  }

  if (not j.contains("data"))
    return std::unexpected(ExchangeError::ParseError);

  return j["data"];
}

Ticker parse_ticker(const json &item) {
  auto ticker = Ticker{};
  ticker.symbol = item.value("symbol", "");
  ticker.last = as_double(item.value("lastPrice", json{}));
  ticker.bid = as_double(item.value("bid1", json{}));
  ticker.ask = as_double(item.value("ask1", json{}));
  ticker.quote_volume = as_double(item.value("amount24", json{}));
  return ticker;
}

} // namespace

std::expected<Series, ExchangeError>
MexcClient::fetch_bars(std::string_view symbol, std::string_view tf,
                       std::size_t limit) {

  // The kline endpoint is windowed by seconds, not by count
  const auto period = timeframe_duration(tf);
  const auto end = std::chrono::floor<std::chrono::seconds>(Clock::now());
  const auto start = end - period * static_cast<long>(limit + 1);

  auto path = std::format("/api/v1/contract/kline/{}?interval={}&start={}&end={}",
                          symbol, mexc_interval(tf),
                          start.time_since_epoch().count(),
                          end.time_since_epoch().count());

  auto body = get(path);
  if (not body)
    return std::unexpected(body.error());

  auto data = unwrap(body.value());
  if (not data)
    return std::unexpected(data.error());

  try {
    const auto &d = data.value();
    const auto &times = d.at("time");
    const auto &opens = d.at("open");
    const auto &highs = d.at("high");
    const auto &lows = d.at("low");
    const auto &closes = d.at("close");
    const auto &vols = d.at("vol");

    auto bars = Series{};
    bars.reserve(times.size());
    for (auto i = 0uz; i < times.size(); ++i) {
      auto bar = Bar{};
      bar.time = TimePoint{std::chrono::seconds{times[i].get<long long>()}};
      bar.open = as_double(opens.at(i));
      bar.high = as_double(highs.at(i));
      bar.low = as_double(lows.at(i));
      bar.close = as_double(closes.at(i));
      bar.volume = as_double(vols.at(i));
      bars.push_back(bar);
    }

    if (bars.size() > limit)
      bars.erase(bars.begin(), bars.end() - static_cast<long>(limit));

    return bars;

  } catch (const std::exception &) {
    return std::unexpected(ExchangeError::ParseError);
  }
}

std::expected<Ticker, ExchangeError>
MexcClient::fetch_ticker(std::string_view symbol) {
  auto body = get(std::format("/api/v1/contract/ticker?symbol={}", symbol));
  if (not body)
    return std::unexpected(body.error());

  auto data = unwrap(body.value());
  if (not data)
    return std::unexpected(data.error());

  try {
    auto ticker = parse_ticker(data.value());
    if (ticker.last <= 0.0)
      return std::unexpected(ExchangeError::ParseError);
    return ticker;
  } catch (const std::exception &) {
    return std::unexpected(ExchangeError::ParseError);
  }
}

std::expected<std::map<std::string, Ticker>, ExchangeError>
MexcClient::fetch_tickers() {
  auto body = get("/api/v1/contract/ticker");
  if (not body)
    return std::unexpected(body.error());

  auto data = unwrap(body.value());
  if (not data)
    return std::unexpected(data.error());

  if (not data->is_array())
    return std::unexpected(ExchangeError::ParseError);

  try {
    auto tickers = std::map<std::string, Ticker>{};
    for (const auto &item : data.value()) {
      auto ticker = parse_ticker(item);
      if (not ticker.symbol.empty())
        tickers[ticker.symbol] = ticker;
    }
    return tickers;
  } catch (const std::exception &) {
    return std::unexpected(ExchangeError::ParseError);
  }
}

std::expected<std::map<std::string, MarketInfo>, ExchangeError>
MexcClient::list_markets() {
  {
    auto lock = std::scoped_lock{markets_mutex_};
    if (not markets_.empty())
      return markets_;
  }

  auto body = get("/api/v1/contract/detail");
  if (not body)
    return std::unexpected(body.error());

  auto data = unwrap(body.value());
  if (not data)
    return std::unexpected(data.error());

  if (not data->is_array())
    return std::unexpected(ExchangeError::ParseError);

  auto markets = std::map<std::string, MarketInfo>{};
  try {
    for (const auto &item : data.value()) {
      // State 0 is an enabled contract
      if (item.value("state", 0) != 0)
        continue;

      auto info = MarketInfo{};
      info.symbol = item.value("symbol", "");
      info.base = item.value("baseCoin", "");
      info.quote = item.value("settleCoin", "");
      info.tick_size = as_double(item.value("priceUnit", json{}));
      if (not info.symbol.empty() and info.tick_size > 0.0)
        markets[info.symbol] = info;
    }
  } catch (const std::exception &) {
    return std::unexpected(ExchangeError::ParseError);
  }

  auto lock = std::scoped_lock{markets_mutex_};
  markets_ = markets;
  return markets;
}

std::expected<double, ExchangeError>
MexcClient::round_to_tick(std::string_view symbol, double price) {
  auto markets = list_markets();
  if (not markets)
    return std::unexpected(markets.error());

  auto it = markets->find(std::string{symbol});
  if (it == markets->end())
    return std::unexpected(ExchangeError::InvalidSymbol);

  const auto tick = it->second.tick_size;
  return std::round(price / tick) * tick;
}

} // namespace wick
