#include "trade_log.h"
#include <format>
#include <fstream>
#include <print>

namespace wick {

namespace {

constexpr auto opens_csv_header =
    "signal_id,opened_at,symbol,side,entry,stop,target,score,atr,leverage,size_usdt\n";
constexpr auto closes_csv_header =
    "signal_id,closed_at,symbol,side,entry,exit,reason,pnl_pct,pnl_usd,mfe_pct,"
    "mae_pct,holding_min\n";
constexpr auto events_csv_header = "event_id,time,signal_id,symbol,kind,price,detail\n";

// First column of every data row
std::set<std::string> load_ids(const std::filesystem::path &path) {
  auto ids = std::set<std::string>{};
  auto file = std::ifstream{path};
  auto line = std::string{};
  auto first = true;
  while (std::getline(file, line)) {
    if (first) {
      first = false;
      continue;
    }
    if (auto comma = line.find(','); comma != std::string::npos)
      ids.insert(line.substr(0, comma));
  }
  return ids;
}

auto seconds(TimePoint t) { return std::chrono::floor<std::chrono::seconds>(t); }

} // namespace

std::string PositionEvent::id() const {
  return std::format("{}:{}:{}", signal_id, kind,
                     seconds(time).time_since_epoch().count());
}

CsvTradeLog::CsvTradeLog(std::filesystem::path dir)
    : opens_{dir / "wickscan_opens.csv"}, closes_{dir / "wickscan_closes.csv"},
      events_{dir / "wickscan_events.csv"}, opened_{load_ids(opens_)},
      closed_{load_ids(closes_)}, events_seen_{load_ids(events_)} {}

std::expected<void, StoreError>
CsvTradeLog::append(const std::filesystem::path &path, std::string_view header,
                    const std::string &row) {

  // Check if file exists to determine if we need to write header
  auto file_exists = std::filesystem::exists(path);

  auto file = std::ofstream{path, std::ios::app};
  if (not file.is_open()) {
    std::println(stderr, "⚠️  Failed to write trade log: {}", path.string());
    return std::unexpected(StoreError::IoError);
  }

  if (not file_exists)
    file << header;

  file << row;
  if (not file) {
    std::println(stderr, "⚠️  Failed to append to trade log: {}", path.string());
    return std::unexpected(StoreError::IoError);
  }

  return {};
}

std::expected<void, StoreError> CsvTradeLog::record_open(const Position &pos) {
  auto lock = std::scoped_lock{mutex_};
  if (opened_.contains(pos.signal_id))
    return {};

  auto row = std::format("{},{:%Y-%m-%d %H:%M:%S},{},{},{},{},{},{:.3f},{},{:.0f},{:.2f}\n",
                         pos.signal_id, seconds(pos.opened_at), pos.symbol,
                         to_string(pos.side), format_price(pos.entry_price),
                         pos.stop_price ? format_price(*pos.stop_price) : "",
                         format_price(pos.target_price), pos.score,
                         format_price(pos.atr), pos.leverage, pos.margin());

  auto result = append(opens_, opens_csv_header, row);
  if (result)
    opened_.insert(pos.signal_id);
  return result;
}

std::expected<void, StoreError> CsvTradeLog::record_close(const Position &pos) {
  auto lock = std::scoped_lock{mutex_};
  if (closed_.contains(pos.signal_id))
    return {};

  const auto holding = std::chrono::duration<double, std::ratio<60>>(
      pos.closed_at - pos.opened_at);

  auto row = std::format(
      "{},{:%Y-%m-%d %H:%M:%S},{},{},{},{},{},{:.4f},{:.4f},{:.4f},{:.4f},{:.1f}\n",
      pos.signal_id, seconds(pos.closed_at), pos.symbol, to_string(pos.side),
      format_price(pos.reference_price()), format_price(pos.exit_price),
      to_string(pos.exit_reason), pos.pnl_pct * 100.0, pos.pnl_usd,
      mfe_pct(pos) * 100.0, mae_pct(pos) * 100.0, holding.count());

  auto result = append(closes_, closes_csv_header, row);
  if (result)
    closed_.insert(pos.signal_id);
  return result;
}

std::expected<void, StoreError>
CsvTradeLog::record_event(const PositionEvent &event) {
  auto lock = std::scoped_lock{mutex_};
  auto id = event.id();
  if (events_seen_.contains(id))
    return {};

  auto row = std::format("{},{:%Y-%m-%d %H:%M:%S},{},{},{},{},\"{}\"\n", id,
                         seconds(event.time), event.signal_id, event.symbol,
                         event.kind, format_price(event.price), event.detail);

  auto result = append(events_, events_csv_header, row);
  if (result)
    events_seen_.insert(id);
  return result;
}

} // namespace wick
