// Unit tests for the CSV trade journal
#include "defs.h"
#include "trade_log.h"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <format>
#include <fstream>
#include <random>
#include <string>
#include <vector>

using namespace wick;
using namespace std::chrono_literals;

namespace {

struct TempDir {
  std::filesystem::path path;

  TempDir() {
    auto rng = std::random_device{};
    path = std::filesystem::temp_directory_path() /
           std::format("wickscan-log-{:x}", rng());
    std::filesystem::create_directories(path);
  }
  ~TempDir() {
    auto ec = std::error_code{};
    std::filesystem::remove_all(path, ec);
  }
};

std::vector<std::string> lines(const std::filesystem::path &file) {
  auto result = std::vector<std::string>{};
  auto in = std::ifstream{file};
  auto line = std::string{};
  while (std::getline(in, line))
    result.push_back(line);
  return result;
}

Position closed_long() {
  auto pos = Position{};
  pos.signal_id = "ABC_USDT-L-1";
  pos.symbol = "ABC_USDT";
  pos.side = Side::Long;
  pos.entry_price = 100.0;
  pos.stop_price = 99.8;
  pos.target_price = 100.3;
  pos.leverage = leverage;
  pos.size_usdt = position_size_usdt;
  pos.opened_at = Clock::now() - 10min;
  pos.status = PositionStatus::Closed;
  pos.exit_reason = ExitReason::TakeProfit;
  pos.exit_price = 100.3;
  pos.closed_at = Clock::now();
  pos.pnl_pct = 0.003;
  pos.pnl_usd = 0.6;
  pos.max_favorable_price = 100.3;
  pos.max_adverse_price = 99.95;
  return pos;
}

} // namespace

TEST_CASE("Journal rows are written once per id", "[trade_log]") {
  auto dir = TempDir{};
  auto log = CsvTradeLog{dir.path};
  const auto pos = closed_long();

  REQUIRE(log.record_open(pos));
  REQUIRE(log.record_open(pos));
  REQUIRE(log.record_close(pos));
  REQUIRE(log.record_close(pos));

  const auto opens = lines(log.opens_file());
  REQUIRE(opens.size() == 2);
  REQUIRE(opens[0].starts_with("signal_id,"));
  REQUIRE(opens[1].starts_with("ABC_USDT-L-1,"));

  const auto closes = lines(log.closes_file());
  REQUIRE(closes.size() == 2);
  REQUIRE(closes[1].find("TAKE_PROFIT") != std::string::npos);
  REQUIRE(closes[1].find("0.6000") != std::string::npos);

  SECTION("A reopened journal remembers what it wrote") {
    auto reopened = CsvTradeLog{dir.path};
    REQUIRE(reopened.record_open(pos));
    REQUIRE(reopened.record_close(pos));
    REQUIRE(lines(reopened.opens_file()).size() == 2);
    REQUIRE(lines(reopened.closes_file()).size() == 2);

    auto other = pos;
    other.signal_id = "ABC_USDT-L-2";
    REQUIRE(reopened.record_open(other));
    REQUIRE(lines(reopened.opens_file()).size() == 3);
  }
}

TEST_CASE("Events are keyed by position, kind and second", "[trade_log]") {
  auto dir = TempDir{};
  auto log = CsvTradeLog{dir.path};
  const auto t = Clock::now();

  auto add = PositionEvent{"EURC_USDT-L-1", "EURC_USDT", "ADD", 1.0735, "step 2", t};
  auto trail = PositionEvent{"EURC_USDT-L-1", "EURC_USDT", "TRAIL_SET", 1.078, "stage 1 armed", t};

  REQUIRE(log.record_event(add));
  REQUIRE(log.record_event(add));
  REQUIRE(log.record_event(trail));

  auto later = add;
  later.time = t + 5min;
  REQUIRE(log.record_event(later));

  const auto rows = lines(log.events_file());
  REQUIRE(rows.size() == 4);
  REQUIRE(rows[0].starts_with("event_id,"));
  REQUIRE(rows[1].find(",ADD,") != std::string::npos);
  REQUIRE(rows[2].find("\"stage 1 armed\"") != std::string::npos);
}
