#include "engine_state.h"
#include <fstream>
#include <print>
#include <sstream>

namespace wick {

using json = nlohmann::json;

namespace {

// Times are stored as epoch milliseconds
std::int64_t to_ms(TimePoint t) {
  return std::chrono::duration_cast<std::chrono::milliseconds>(t.time_since_epoch())
      .count();
}

TimePoint from_ms(std::int64_t ms) {
  return TimePoint{std::chrono::duration_cast<Clock::duration>(
      std::chrono::milliseconds{ms})};
}

Side side_from_string(std::string_view s) {
  return s == "SHORT" ? Side::Short : Side::Long;
}

ExitReason exit_reason_from_string(std::string_view s) {
  if (s == "STOP_LOSS")
    return ExitReason::StopLoss;
  if (s == "TAKE_PROFIT")
    return ExitReason::TakeProfit;
  if (s == "TRAILING_STOP")
    return ExitReason::TrailingStop;
  if (s == "MANUAL")
    return ExitReason::Manual;
  return ExitReason::None;
}

} // namespace

void to_json(json &j, const DcaState &dca) {
  auto steps = json::array();
  for (const auto &step : dca.steps)
    steps.push_back({{"price", step.price},
                     {"qty", step.qty},
                     {"margin", step.margin},
                     {"time", to_ms(step.time)}});

  j = json{{"margin_plan", dca.margin_plan},
           {"steps", steps},
           {"ladder", dca.ladder},
           {"qty", dca.qty},
           {"avg_price", dca.avg_price},
           {"leverage", dca.leverage},
           {"growth", dca.growth},
           {"strategic_lower", dca.strategic_lower},
           {"strategic_upper", dca.strategic_upper},
           {"tick_size", dca.tick_size},
           {"frozen", dca.frozen},
           {"reserved_final_step", dca.reserved_final_step}};
}

void from_json(const json &j, DcaState &dca) {
  j.at("margin_plan").get_to(dca.margin_plan);
  j.at("ladder").get_to(dca.ladder);
  j.at("qty").get_to(dca.qty);
  j.at("avg_price").get_to(dca.avg_price);
  j.at("leverage").get_to(dca.leverage);
  j.at("growth").get_to(dca.growth);
  j.at("strategic_lower").get_to(dca.strategic_lower);
  j.at("strategic_upper").get_to(dca.strategic_upper);
  dca.tick_size = j.value("tick_size", 0.0);
  j.at("frozen").get_to(dca.frozen);
  j.at("reserved_final_step").get_to(dca.reserved_final_step);

  dca.steps.clear();
  for (const auto &step : j.at("steps"))
    dca.steps.push_back(DcaStep{step.at("price").get<double>(),
                                step.at("qty").get<double>(),
                                step.at("margin").get<double>(),
                                from_ms(step.at("time").get<std::int64_t>())});
}

void to_json(json &j, const Position &pos) {
  j = json{{"signal_id", pos.signal_id},
           {"symbol", pos.symbol},
           {"side", to_string(pos.side)},
           {"entry_price", pos.entry_price},
           {"target_price", pos.target_price},
           {"leverage", pos.leverage},
           {"size_usdt", pos.size_usdt},
           {"score", pos.score},
           {"atr", pos.atr},
           {"opened_at", to_ms(pos.opened_at)},
           {"entry_bar_time", to_ms(pos.entry_bar_time)},
           {"last_bar_checked", to_ms(pos.last_bar_checked)},
           {"max_favorable_price", pos.max_favorable_price},
           {"max_adverse_price", pos.max_adverse_price},
           {"trail_stage", pos.trail_stage},
           {"exit_reason", to_string(pos.exit_reason)}};

  j["stop_price"] = pos.stop_price ? json(*pos.stop_price) : json(nullptr);
  if (pos.dca)
    j["dca"] = *pos.dca;
}

void from_json(const json &j, Position &pos) {
  j.at("signal_id").get_to(pos.signal_id);
  j.at("symbol").get_to(pos.symbol);
  pos.side = side_from_string(j.at("side").get<std::string>());
  pos.status = PositionStatus::Active;
  j.at("entry_price").get_to(pos.entry_price);
  j.at("target_price").get_to(pos.target_price);
  j.at("leverage").get_to(pos.leverage);
  j.at("size_usdt").get_to(pos.size_usdt);
  j.at("score").get_to(pos.score);
  j.at("atr").get_to(pos.atr);
  pos.opened_at = from_ms(j.at("opened_at").get<std::int64_t>());
  pos.entry_bar_time = from_ms(j.at("entry_bar_time").get<std::int64_t>());
  pos.last_bar_checked = from_ms(j.at("last_bar_checked").get<std::int64_t>());
  j.at("max_favorable_price").get_to(pos.max_favorable_price);
  j.at("max_adverse_price").get_to(pos.max_adverse_price);
  j.at("trail_stage").get_to(pos.trail_stage);
  pos.exit_reason = exit_reason_from_string(j.value("exit_reason", ""));

  const auto &stop = j.at("stop_price");
  pos.stop_price = stop.is_null() ? std::nullopt : std::optional{stop.get<double>()};

  if (j.contains("dca") and not j["dca"].is_null())
    pos.dca = j["dca"].get<DcaState>();
  else
    pos.dca.reset();
}

void to_json(json &j, const EngineState &state) {
  auto cooldowns = json::object();
  for (const auto &[symbol, until] : state.cooldowns)
    cooldowns[symbol] = to_ms(until);

  j = json{{"version", 1},
           {"enabled", state.enabled},
           {"threshold",
            {{"value", state.threshold.value},
             {"updated_at", to_ms(state.threshold.updated_at)},
             {"last_delta", state.threshold.last_delta}}},
           {"positions", state.positions},
           {"cooldowns", cooldowns},
           {"rotation_offset", state.rotation_offset}};
}

void from_json(const json &j, EngineState &state) {
  j.at("enabled").get_to(state.enabled);

  const auto &thr = j.at("threshold");
  thr.at("value").get_to(state.threshold.value);
  state.threshold.updated_at = from_ms(thr.at("updated_at").get<std::int64_t>());
  state.threshold.last_delta = thr.value("last_delta", 0.0);

  j.at("positions").get_to(state.positions);

  state.cooldowns.clear();
  for (const auto &[symbol, until] : j.at("cooldowns").items())
    state.cooldowns[symbol] = from_ms(until.get<std::int64_t>());

  state.rotation_offset = j.value("rotation_offset", 0uz);
}

std::expected<void, StateError> save_state(const std::filesystem::path &file,
                                           const EngineState &state) {
  auto tmp = file;
  tmp += ".tmp";

  {
    auto out = std::ofstream{tmp, std::ios::trunc};
    if (not out)
      return std::unexpected(StateError::IoError);
    out << json(state).dump(2) << '\n';
    if (not out)
      return std::unexpected(StateError::IoError);
  }

  auto ec = std::error_code{};
  std::filesystem::rename(tmp, file, ec);
  if (ec) {
    std::println(stderr, "❌ State rename failed: {}", ec.message());
    return std::unexpected(StateError::IoError);
  }
  return {};
}

std::expected<EngineState, StateError> load_state(const std::filesystem::path &file) {
  if (not std::filesystem::exists(file))
    return std::unexpected(StateError::NotFound);

  auto in = std::ifstream{file};
  if (not in)
    return std::unexpected(StateError::IoError);

  auto buffer = std::stringstream{};
  buffer << in.rdbuf();

  const auto j = json::parse(buffer.str(), nullptr, false);
  if (j.is_discarded())
    return std::unexpected(StateError::ParseError);

  try {
    return j.get<EngineState>();
  } catch (const json::exception &e) {
    std::println(stderr, "❌ State file {} unreadable: {}", file.string(), e.what());
    return std::unexpected(StateError::ParseError);
  }
}

std::string_view to_string(StateError e) {
  switch (e) {
  case StateError::NotFound: return "not found";
  case StateError::IoError: return "I/O error";
  case StateError::ParseError: return "parse error";
  }
  return "unknown";
}

} // namespace wick
