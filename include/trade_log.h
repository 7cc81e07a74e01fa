#pragma once

#include "position.h"
#include <expected>
#include <filesystem>
#include <mutex>
#include <set>
#include <string>

namespace wick {

enum class StoreError { IoError };

// Intermediate lifecycle event of a position (DCA add, trailing stop move)
struct PositionEvent {
    std::string signal_id;
    std::string symbol;
    std::string kind; // ADD, TRAIL_SET, FREEZE, RETEST
    double price{};
    std::string detail;
    TimePoint time{};

    std::string id() const;
};

// Append-only trade journal, idempotent on signal id (and event id)
class TradeLogStore {
public:
    virtual ~TradeLogStore() = default;
    virtual std::expected<void, StoreError> record_open(const Position &) = 0;
    virtual std::expected<void, StoreError> record_close(const Position &) = 0;
    virtual std::expected<void, StoreError> record_event(const PositionEvent &) = 0;
};

// Three CSV files in one directory: opens, closes and events
class CsvTradeLog : public TradeLogStore {
public:
    explicit CsvTradeLog(std::filesystem::path dir);

    std::expected<void, StoreError> record_open(const Position &) override;
    std::expected<void, StoreError> record_close(const Position &) override;
    std::expected<void, StoreError> record_event(const PositionEvent &) override;

    const std::filesystem::path &opens_file() const { return opens_; }
    const std::filesystem::path &closes_file() const { return closes_; }
    const std::filesystem::path &events_file() const { return events_; }

private:
    std::filesystem::path opens_;
    std::filesystem::path closes_;
    std::filesystem::path events_;

    std::mutex mutex_;
    std::set<std::string> opened_;
    std::set<std::string> closed_;
    std::set<std::string> events_seen_;

    std::expected<void, StoreError> append(const std::filesystem::path &,
                                           std::string_view header,
                                           const std::string &row);
};

} // namespace wick
