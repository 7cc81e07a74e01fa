#pragma once

// In-memory stand-ins for the exchange, notifier and trade log, plus helpers
// for building bar series

#include "cooldown.h"
#include "engine_context.h"
#include "exchange_gateway.h"
#include "market_data.h"
#include "notifier.h"
#include "position.h"
#include "reservation.h"
#include "threshold.h"
#include "trade_log.h"
#include <atomic>
#include <chrono>
#include <cmath>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace wick::test {

using namespace std::chrono_literals;

class FakeExchange : public ExchangeGateway {
public:
    void set_bars(const std::string &symbol, std::string_view tf, Series bars) {
        auto lock = std::scoped_lock{mutex_};
        bars_[key(symbol, tf)] = std::move(bars);
    }

    void set_price(const std::string &symbol, double last, double quote_volume = 1e6) {
        auto lock = std::scoped_lock{mutex_};
        tickers_[symbol] = Ticker{symbol, last, last, last, quote_volume};
    }

    void add_market(const std::string &symbol, double tick_size,
                    const std::string &quote = "USDT") {
        auto lock = std::scoped_lock{mutex_};
        auto base = symbol.substr(0, symbol.find('_'));
        markets_[symbol] = MarketInfo{symbol, base, quote, tick_size};
    }

    // The next `times` bar requests for the symbol fail with `error`
    void fail_bars(const std::string &symbol, ExchangeError error, int times) {
        auto lock = std::scoped_lock{mutex_};
        failures_[symbol] = {error, times};
    }

    // Bar requests above `limit` fail with a timeout
    void cap_limit(const std::string &symbol, std::size_t limit) {
        auto lock = std::scoped_lock{mutex_};
        limit_caps_[symbol] = limit;
    }

    void set_delay(std::chrono::milliseconds delay) { delay_ = delay; }

    std::expected<Series, ExchangeError> fetch_bars(std::string_view symbol,
                                                    std::string_view tf,
                                                    std::size_t limit) override {
        auto call = enter();
        auto lock = std::scoped_lock{mutex_};
        limits_seen_.push_back(limit);

        const auto sym = std::string{symbol};
        if (auto it = failures_.find(sym); it != failures_.end() and it->second.times > 0) {
            --it->second.times;
            return std::unexpected(it->second.error);
        }
        if (auto it = limit_caps_.find(sym); it != limit_caps_.end() and limit > it->second)
            return std::unexpected(ExchangeError::Timeout);

        auto it = bars_.find(key(sym, tf));
        if (it == bars_.end())
            return std::unexpected(ExchangeError::InvalidSymbol);

        const auto &all = it->second;
        const auto n = std::min(limit, all.size());
        return Series{all.end() - static_cast<long>(n), all.end()};
    }

    std::expected<Ticker, ExchangeError> fetch_ticker(std::string_view symbol) override {
        auto call = enter();
        auto lock = std::scoped_lock{mutex_};
        auto it = tickers_.find(std::string{symbol});
        if (it == tickers_.end())
            return std::unexpected(ExchangeError::InvalidSymbol);
        return it->second;
    }

    std::expected<std::map<std::string, Ticker>, ExchangeError> fetch_tickers() override {
        auto call = enter();
        auto lock = std::scoped_lock{mutex_};
        return tickers_;
    }

    std::expected<double, ExchangeError> round_to_tick(std::string_view symbol,
                                                       double price) override {
        auto lock = std::scoped_lock{mutex_};
        auto it = markets_.find(std::string{symbol});
        if (it == markets_.end())
            return std::unexpected(ExchangeError::InvalidSymbol);
        const auto tick = it->second.tick_size;
        return tick > 0.0 ? std::round(price / tick) * tick : price;
    }

    std::expected<std::map<std::string, MarketInfo>, ExchangeError> list_markets() override {
        auto lock = std::scoped_lock{mutex_};
        return markets_;
    }

    std::size_t calls() const { return calls_; }
    std::size_t peak_in_flight() const { return peak_; }
    std::size_t in_flight() const { return in_flight_; }

    std::vector<std::size_t> limits_seen() const {
        auto lock = std::scoped_lock{mutex_};
        return limits_seen_;
    }

private:
    struct Failure {
        ExchangeError error{};
        int times{};
    };

    // Counts a call as in flight for its whole duration
    struct InFlight {
        std::atomic<std::size_t> &count;
        ~InFlight() { --count; }
    };

    InFlight enter() {
        ++calls_;
        auto now = ++in_flight_;
        auto peak = peak_.load();
        while (now > peak and not peak_.compare_exchange_weak(peak, now)) {
        }
        if (delay_.count() > 0)
            std::this_thread::sleep_for(delay_);
        return InFlight{in_flight_};
    }

    static std::string key(const std::string &symbol, std::string_view tf) {
        return symbol + "|" + std::string{tf};
    }

    mutable std::mutex mutex_;
    std::map<std::string, Series> bars_;
    std::map<std::string, Ticker> tickers_;
    std::map<std::string, MarketInfo> markets_;
    std::map<std::string, Failure> failures_;
    std::map<std::string, std::size_t> limit_caps_;
    std::vector<std::size_t> limits_seen_;

    std::chrono::milliseconds delay_{0};
    std::atomic<std::size_t> calls_{};
    std::atomic<std::size_t> in_flight_{};
    std::atomic<std::size_t> peak_{};
};

class RecordingNotifier : public Notifier {
public:
    std::expected<void, NotifyError> send(std::string_view text) override {
        auto lock = std::scoped_lock{mutex_};
        messages.emplace_back(text);
        return {};
    }

    std::size_t count() const {
        auto lock = std::scoped_lock{mutex_};
        return messages.size();
    }

    std::vector<std::string> messages;

private:
    mutable std::mutex mutex_;
};

class MemoryTradeLog : public TradeLogStore {
public:
    std::expected<void, StoreError> record_open(const Position &pos) override {
        auto lock = std::scoped_lock{mutex_};
        opens.push_back(pos);
        return {};
    }

    std::expected<void, StoreError> record_close(const Position &pos) override {
        auto lock = std::scoped_lock{mutex_};
        closes.push_back(pos);
        return {};
    }

    std::expected<void, StoreError> record_event(const PositionEvent &event) override {
        auto lock = std::scoped_lock{mutex_};
        events.push_back(event);
        return {};
    }

    std::vector<Position> opens;
    std::vector<Position> closes;
    std::vector<PositionEvent> events;

private:
    std::mutex mutex_;
};

// Fast retry policy so failure paths finish quickly
inline FetchPolicy quick_policy() {
    auto policy = FetchPolicy{};
    policy.timeout = 2s;
    policy.backoff_base = 1ms;
    return policy;
}

// Every engine component wired to the fakes
struct Harness {
    std::shared_ptr<FakeExchange> exchange = std::make_shared<FakeExchange>();
    MarketDataFetcher fetcher{exchange, quick_policy()};
    PositionBook positions;
    ReservationSet reservations;
    CooldownRegistry cooldowns;
    ThresholdController threshold;
    RecordingNotifier notifier;
    MemoryTradeLog trade_log;
    EngineContext ctx{fetcher,   positions, reservations, cooldowns,
                      threshold, notifier,  trade_log};
};

// Calm bars at `price` ending the period before `next_open`: every bar has a
// true range of 0.12% and volume alternating 1000/1100
inline Series quiet_bars(TimePoint next_open, std::size_t count, double price = 100.0,
                         std::chrono::seconds period = 60s) {
    auto bars = Series{};
    for (auto i = 0uz; i < count; ++i) {
        const auto t = next_open - period * static_cast<long>(count - i);
        bars.push_back(Bar{t, price, price * 1.0007, price * 0.9995, price * 1.0002,
                           i % 2 == 0 ? 1000.0 : 1100.0});
    }
    return bars;
}

// Open time of the last completed 1m bar at `now`, one second after it closed
inline TimePoint last_closed_open(TimePoint now) { return now - 61s; }

} // namespace wick::test
