#pragma once

#include "defs.h"
#include "exchange_gateway.h"
#include <chrono>
#include <condition_variable>
#include <expected>
#include <map>
#include <memory>
#include <mutex>
#include <semaphore>
#include <stop_token>
#include <string>
#include <vector>

namespace wick {

enum class FetchError { Unavailable, Cancelled };

struct FetchPolicy {
    std::chrono::milliseconds timeout{fetch_timeout};
    int retries{fetch_retries};
    std::chrono::milliseconds backoff_base{fetch_backoff_base};
    double fallback_ratio{fallback_limit_ratio};
    std::size_t concurrency{fetch_concurrency};
};

// Bars for the symbols taken up before a deadline. Symbols are taken in
// order, so the `attempted` count is always a prefix of the request.
struct BarsBatch {
    std::map<std::string, Series> bars;
    std::size_t attempted{};
};

// Single entry point for all market data access: every call is bounded by a
// shared concurrency cap and a timeout, retried with exponential backoff on
// transient errors, and (for bars) retried once with a smaller limit.
// A call that outlives its timeout keeps its slot until the exchange returns.
class MarketDataFetcher {
public:
    explicit MarketDataFetcher(std::shared_ptr<ExchangeGateway>, FetchPolicy = {});
    MarketDataFetcher(const MarketDataFetcher &) = delete;
    MarketDataFetcher &operator=(const MarketDataFetcher &) = delete;

    // Waits for abandoned calls to return
    ~MarketDataFetcher();

    std::expected<Series, FetchError>
    bars(std::string_view symbol, std::string_view tf, std::size_t limit,
         std::stop_token = {});

    std::expected<Ticker, FetchError> ticker(std::string_view symbol, std::stop_token = {});

    std::expected<std::map<std::string, Ticker>, FetchError> tickers(std::stop_token = {});

    std::expected<std::map<std::string, MarketInfo>, FetchError> markets(std::stop_token = {});

    std::expected<double, FetchError> round_to_tick(std::string_view symbol, double price);

    // Per-symbol results; unavailable symbols are simply absent
    std::map<std::string, Series> bars_batch(const std::vector<std::string> &,
                                             std::string_view tf, std::size_t limit,
                                             std::stop_token = {});

    // No symbol is started, retried or given a fallback after the deadline
    BarsBatch bars_batch_until(const std::vector<std::string> &, std::string_view tf,
                               std::size_t limit, TimePoint deadline, std::stop_token = {});

    std::map<std::string, Ticker> ticker_batch(const std::vector<std::string> &,
                                               std::stop_token = {});

    // Block until every exchange call in flight has returned, including
    // those the caller already gave up on
    void drain();

    // Exchange calls currently holding a slot
    std::size_t in_flight() const;

    const FetchPolicy &policy() const { return policy_; }

private:
    // Shared with the call threads, which may outlive the caller's wait
    struct Slots {
        explicit Slots(std::ptrdiff_t n) : free{n} {}
        std::counting_semaphore<> free;
        std::mutex mutex;
        std::condition_variable idle;
        std::size_t outstanding{};
    };

    std::shared_ptr<ExchangeGateway> exchange_;
    FetchPolicy policy_;
    std::shared_ptr<Slots> slots_;

    template <typename T, typename Call>
    std::expected<T, ExchangeError> attempt(Call, std::stop_token);

    template <typename T, typename Call>
    std::expected<T, ExchangeError> retrying(Call, std::stop_token, TimePoint deadline,
                                             bool &cancelled);

    std::expected<Series, FetchError> bars_until(std::string_view symbol, std::string_view tf,
                                                 std::size_t limit, TimePoint deadline,
                                                 std::stop_token);

    template <typename T, typename Fetch>
    std::map<std::string, T> batch(const std::vector<std::string> &, Fetch, TimePoint deadline,
                                   std::stop_token, std::size_t &attempted);
};

// Sleep that wakes early on stop; returns false when stopped
bool sleep_for(std::chrono::milliseconds, std::stop_token);

constexpr std::string_view to_string(FetchError e) {
    return e == FetchError::Cancelled ? "cancelled" : "unavailable";
}

} // namespace wick
