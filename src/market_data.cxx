#include "market_data.h"
#include <algorithm>
#include <atomic>
#include <future>
#include <print>
#include <system_error>
#include <thread>

namespace wick {

namespace {

constexpr auto no_deadline = TimePoint::max();

} // namespace

bool sleep_for(std::chrono::milliseconds duration, std::stop_token stoken) {
  if (duration <= std::chrono::milliseconds::zero())
    return not stoken.stop_requested();

  auto mutex = std::mutex{};
  auto cv = std::condition_variable_any{};
  auto lock = std::unique_lock{mutex};
  cv.wait_for(lock, stoken, duration, [] { return false; });
  return not stoken.stop_requested();
}

MarketDataFetcher::MarketDataFetcher(std::shared_ptr<ExchangeGateway> exchange,
                                     FetchPolicy policy)
    : exchange_{std::move(exchange)}, policy_{policy},
      slots_{std::make_shared<Slots>(
          static_cast<std::ptrdiff_t>(std::max(policy.concurrency, 1uz)))} {}

MarketDataFetcher::~MarketDataFetcher() { drain(); }

void MarketDataFetcher::drain() {
  auto lock = std::unique_lock{slots_->mutex};
  slots_->idle.wait(lock, [this] { return slots_->outstanding == 0; });
}

std::size_t MarketDataFetcher::in_flight() const {
  auto lock = std::scoped_lock{slots_->mutex};
  return slots_->outstanding;
}

// One call under the concurrency cap and the timeout. The call runs on its
// own thread which holds the slot until the exchange returns, so an abandoned
// request still counts against the cap.
template <typename T, typename Call>
std::expected<T, ExchangeError> MarketDataFetcher::attempt(Call call,
                                                           std::stop_token stoken) {
  using Result = std::expected<T, ExchangeError>;

  while (not slots_->free.try_acquire_for(fetch_slot_poll))
    if (stoken.stop_requested())
      return std::unexpected(ExchangeError::Timeout);

  {
    auto lock = std::scoped_lock{slots_->mutex};
    ++slots_->outstanding;
  }

  auto promise = std::make_shared<std::promise<Result>>();
  auto future = promise->get_future();

  try {
    std::thread([slots = slots_, promise, call = std::move(call)]() mutable {
      try {
        promise->set_value(call());
      } catch (const std::exception &e) {
        std::println(stderr, "⚠️  Exchange call threw: {}", e.what());
        promise->set_value(std::unexpected(ExchangeError::UnknownError));
      }

      slots->free.release();
      {
        auto lock = std::scoped_lock{slots->mutex};
        --slots->outstanding;
      }
      slots->idle.notify_all();
    }).detach();
  } catch (const std::system_error &e) {
    std::println(stderr, "❌ No thread for exchange call: {}", e.what());
    slots_->free.release();
    {
      auto lock = std::scoped_lock{slots_->mutex};
      --slots_->outstanding;
    }
    slots_->idle.notify_all();
    return std::unexpected(ExchangeError::UnknownError);
  }

  if (future.wait_for(policy_.timeout) == std::future_status::timeout)
    return std::unexpected(ExchangeError::Timeout);

  return future.get();
}

template <typename T, typename Call>
std::expected<T, ExchangeError>
MarketDataFetcher::retrying(Call call, std::stop_token stoken, TimePoint deadline,
                            bool &cancelled) {
  auto delay = policy_.backoff_base;

  for (auto tries = 0;; ++tries) {
    auto result = attempt<T>(call, stoken);
    if (result)
      return result;

    if (stoken.stop_requested()) {
      cancelled = true;
      return result;
    }

    if (not is_transient(result.error()) or tries >= policy_.retries or
        Clock::now() >= deadline)
      return result;

    if (not sleep_for(delay, stoken)) {
      cancelled = true;
      return result;
    }
    delay *= 2;
  }
}

std::expected<Series, FetchError>
MarketDataFetcher::bars_until(std::string_view symbol, std::string_view tf,
                              std::size_t limit, TimePoint deadline,
                              std::stop_token stoken) {
  auto fetch = [ex = exchange_, symbol = std::string{symbol},
                tf = std::string{tf}](std::size_t n) {
    return [ex, symbol, tf, n] { return ex->fetch_bars(symbol, tf, n); };
  };

  auto cancelled = false;
  auto result = retrying<Series>(fetch(limit), stoken, deadline, cancelled);
  if (result)
    return std::move(result.value());
  if (cancelled)
    return std::unexpected(FetchError::Cancelled);

  // Last resort: a single smaller request
  auto smaller = static_cast<std::size_t>(static_cast<double>(limit) *
                                          policy_.fallback_ratio);
  if (smaller > 0 and smaller < limit and Clock::now() < deadline and
      result.error() != ExchangeError::InvalidSymbol) {
    auto fallback = attempt<Series>(fetch(smaller), stoken);
    if (fallback)
      return std::move(fallback.value());
  }

  if (stoken.stop_requested())
    return std::unexpected(FetchError::Cancelled);
  return std::unexpected(FetchError::Unavailable);
}

std::expected<Series, FetchError>
MarketDataFetcher::bars(std::string_view symbol, std::string_view tf,
                        std::size_t limit, std::stop_token stoken) {
  return bars_until(symbol, tf, limit, no_deadline, stoken);
}

std::expected<Ticker, FetchError>
MarketDataFetcher::ticker(std::string_view symbol, std::stop_token stoken) {
  auto cancelled = false;
  auto result = retrying<Ticker>(
      [ex = exchange_, symbol = std::string{symbol}] {
        return ex->fetch_ticker(symbol);
      },
      stoken, no_deadline, cancelled);
  if (result)
    return result.value();
  return std::unexpected(cancelled ? FetchError::Cancelled
                                   : FetchError::Unavailable);
}

std::expected<std::map<std::string, Ticker>, FetchError>
MarketDataFetcher::tickers(std::stop_token stoken) {
  auto cancelled = false;
  auto result = retrying<std::map<std::string, Ticker>>(
      [ex = exchange_] { return ex->fetch_tickers(); }, stoken, no_deadline,
      cancelled);
  if (result)
    return std::move(result.value());
  std::println(stderr, "⚠️  Ticker listing failed: {}", to_string(result.error()));
  return std::unexpected(cancelled ? FetchError::Cancelled
                                   : FetchError::Unavailable);
}

std::expected<std::map<std::string, MarketInfo>, FetchError>
MarketDataFetcher::markets(std::stop_token stoken) {
  auto cancelled = false;
  auto result = retrying<std::map<std::string, MarketInfo>>(
      [ex = exchange_] { return ex->list_markets(); }, stoken, no_deadline,
      cancelled);
  if (result)
    return std::move(result.value());
  std::println(stderr, "⚠️  Market listing failed: {}", to_string(result.error()));
  return std::unexpected(cancelled ? FetchError::Cancelled
                                   : FetchError::Unavailable);
}

std::expected<double, FetchError>
MarketDataFetcher::round_to_tick(std::string_view symbol, double price) {
  auto cancelled = false;
  auto result = retrying<double>(
      [ex = exchange_, symbol = std::string{symbol}, price] {
        return ex->round_to_tick(symbol, price);
      },
      {}, no_deadline, cancelled);
  if (result)
    return result.value();
  return std::unexpected(FetchError::Unavailable);
}

template <typename T, typename Fetch>
std::map<std::string, T>
MarketDataFetcher::batch(const std::vector<std::string> &symbols, Fetch fetch,
                         TimePoint deadline, std::stop_token stoken,
                         std::size_t &attempted) {
  auto results = std::map<std::string, T>{};
  auto results_mutex = std::mutex{};
  auto next = std::atomic<std::size_t>{0};
  auto taken = std::atomic<std::size_t>{0};

  const auto workers = std::min(policy_.concurrency, symbols.size());
  {
    auto pool = std::vector<std::jthread>{};
    pool.reserve(workers);
    for (auto w = 0uz; w < workers; ++w)
      pool.emplace_back([&] {
        while (not stoken.stop_requested() and Clock::now() < deadline) {
          const auto i = next++;
          if (i >= symbols.size())
            return;
          ++taken;

          auto result = fetch(symbols[i]);
          if (result) {
            auto lock = std::scoped_lock{results_mutex};
            results.emplace(symbols[i], std::move(result.value()));
          }
        }
      });
  } // Workers join here

  attempted = taken;
  return results;
}

std::map<std::string, Series>
MarketDataFetcher::bars_batch(const std::vector<std::string> &symbols,
                              std::string_view tf, std::size_t limit,
                              std::stop_token stoken) {
  return bars_batch_until(symbols, tf, limit, no_deadline, stoken).bars;
}

BarsBatch MarketDataFetcher::bars_batch_until(const std::vector<std::string> &symbols,
                                              std::string_view tf, std::size_t limit,
                                              TimePoint deadline,
                                              std::stop_token stoken) {
  auto result = BarsBatch{};
  result.bars = batch<Series>(
      symbols,
      [&](const std::string &symbol) {
        return bars_until(symbol, tf, limit, deadline, stoken);
      },
      deadline, stoken, result.attempted);
  return result;
}

std::map<std::string, Ticker>
MarketDataFetcher::ticker_batch(const std::vector<std::string> &symbols,
                                std::stop_token stoken) {
  auto attempted = 0uz;
  return batch<Ticker>(
      symbols,
      [&](const std::string &symbol) { return ticker(symbol, stoken); },
      no_deadline, stoken, attempted);
}

} // namespace wick
