#pragma once

#include <chrono>
#include <format>
#include <string>
#include <string_view>
#include <vector>

namespace wick {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

struct Bar {
    TimePoint time; // Bar open time
    double open{};
    double high{};
    double low{};
    double close{};
    double volume{};
};

// Ordered oldest first, never modified once fetched
using Series = std::vector<Bar>;

struct Ticker {
    std::string symbol;
    double last{};
    double bid{};
    double ask{};
    double quote_volume{}; // 24h turnover in quote currency
};

struct MarketInfo {
    std::string symbol;
    std::string base;
    std::string quote;
    double tick_size{};
};

enum class Side { Long, Short };

enum class ExchangeError {
    NetworkError,
    Timeout,
    RateLimitError,
    InvalidSymbol,
    ParseError,
    UnknownError
};

// Transient errors are worth retrying
constexpr bool is_transient(ExchangeError e) {
    return e == ExchangeError::NetworkError or e == ExchangeError::Timeout or
           e == ExchangeError::RateLimitError;
}

constexpr int side_sign(Side side) { return side == Side::Long ? 1 : -1; }

constexpr std::string_view to_string(Side side) {
    return side == Side::Long ? "LONG" : "SHORT";
}

constexpr std::string_view to_string(ExchangeError e) {
    switch (e) {
    case ExchangeError::NetworkError: return "network error";
    case ExchangeError::Timeout: return "timeout";
    case ExchangeError::RateLimitError: return "rate limited";
    case ExchangeError::InvalidSymbol: return "invalid symbol";
    case ExchangeError::ParseError: return "parse error";
    case ExchangeError::UnknownError: return "unknown error";
    }
    return "unknown error";
}

// Bar duration for a timeframe string ("1m", "5m", "15m", "1h", "4h", "1d")
std::chrono::seconds timeframe_duration(std::string_view);

// A bar is complete once its close time has passed
inline bool is_complete(const Bar &bar, std::chrono::seconds period, TimePoint now) {
    return bar.time + period <= now;
}

// Price with precision scaled to magnitude
inline std::string format_price(double price) {
    if (price < 0.01)
        return std::format("{:.6f}", price);
    if (price < 1.0)
        return std::format("{:.5f}", price);
    return std::format("{:.4f}", price);
}

} // namespace wick
