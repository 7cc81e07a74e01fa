#pragma once

#include "config.h"
#include "cooldown.h"
#include "dca.h"
#include "engine_context.h"
#include "engine_state.h"
#include "exchange_gateway.h"
#include "market_data.h"
#include "opener.h"
#include "position.h"
#include "reservation.h"
#include "threshold.h"
#include <atomic>
#include <chrono>
#include <expected>
#include <filesystem>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <stop_token>
#include <string>
#include <thread>
#include <vector>

namespace wick {

enum class EngineError { SymbolNotListed, AlreadyRunning };

struct UniverseEntry {
    std::string symbol;
    double quote_volume{};
    double last{};
    double tick_size{};
};

// Liquid USDT-settled non-stable symbols, ordered by symbol
std::vector<UniverseEntry> build_universe(const std::map<std::string, Ticker> &,
                                          const std::map<std::string, MarketInfo> &);

bool is_stable_base(std::string_view base);

// Summary of one scan
struct ScanReport {
    std::size_t universe{};
    std::size_t processed{};
    std::size_t passed{};
    std::size_t scored{};
    std::size_t vetoed{};
    std::size_t dispatched{};
    bool budget_exhausted{};
    bool trade_cap_hit{};
    double threshold{};
};

// Limits of one wick_spike scan
struct ScanPolicy {
    std::chrono::milliseconds time_budget{scan_time_budget};
    std::size_t chunk_size{scan_chunk_size};
};

struct EngineStatus {
    bool running{};
    Strategy strategy{Strategy::WickSpike};
    std::size_t active{};
    std::size_t capacity{};
    std::size_t reserved{};
    std::size_t cooldowns{};
    double threshold{};
    double long_threshold{};
    std::size_t opened{};
    std::size_t closed{};
    std::size_t no_touch{};
    std::size_t rotation_offset{};
    std::optional<DcaRanges> ranges;
};

// Owns every component of one scanner and drives the scheduler loop:
// scans on a background thread at the scan interval, monitors positions on
// every tick, housekeeping once a minute
class Engine {
public:
    Engine(Strategy, std::shared_ptr<ExchangeGateway>, Notifier &, TradeLogStore &,
           std::filesystem::path state_file, FetchPolicy = {}, ScanPolicy = {});
    Engine(const Engine &) = delete;
    Engine &operator=(const Engine &) = delete;
    ~Engine();

    std::expected<void, EngineError> start();

    // Stop and persist as disabled
    void stop();

    // Stop for process exit; a running engine resumes on restart
    void shutdown();
    bool running() const { return running_.load(); }

    // One pass of the wick_spike (or range_dca) scan
    ScanReport scan_once(TimePoint now, std::stop_token = {});

    void monitor_once(TimePoint now, std::stop_token = {});

    // Cooldown purge, heartbeat and state snapshot
    void housekeeping(TimePoint now);

    EngineStatus status() const;

    std::size_t force_close(std::string_view symbol);
    std::size_t force_close_all();

    // Block until every open attempt in flight has finished
    void wait_for_openers() { openers_.wait_all(); }

    EngineState snapshot() const;
    void restore(const EngineState &);
    bool save() const;

    const PositionBook &positions() const { return positions_; }
    const ReservationSet &reservations() const { return reservations_; }
    const CooldownRegistry &cooldowns() const { return cooldowns_; }
    const ThresholdController &threshold() const { return threshold_; }

private:
    Strategy strategy_;
    ScanPolicy scan_policy_;
    std::filesystem::path state_file_;

    // Declaration order is destruction order in reverse: threads stop before
    // the state they use goes away
    std::shared_ptr<ExchangeGateway> exchange_;
    MarketDataFetcher fetcher_;
    PositionBook positions_;
    ReservationSet reservations_;
    CooldownRegistry cooldowns_;
    ThresholdController threshold_;
    EngineContext ctx_;
    std::optional<DcaRunner> dca_;
    std::atomic<std::size_t> rotation_offset_{};
    std::size_t opened_mark_{};

    TaskGroup openers_;
    std::atomic<bool> running_{};
    std::atomic<bool> scanning_{};
    std::mutex lifecycle_mutex_;
    std::jthread scan_;
    std::jthread loop_;

    void halt(bool keep_enabled);
    void run(std::stop_token);
    void launch_scan(TimePoint now);
    ScanReport scan_wick_spike(TimePoint now, std::stop_token);
};

std::string_view to_string(EngineError);

} // namespace wick
