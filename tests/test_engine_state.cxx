// Unit tests for the persisted engine state
#include "dca.h"
#include "defs.h"
#include "engine_state.h"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <format>
#include <fstream>
#include <random>

using namespace wick;
using namespace std::chrono_literals;

namespace {

std::filesystem::path temp_file(std::string_view stem) {
  auto rng = std::random_device{};
  return std::filesystem::temp_directory_path() / std::format("{}-{:x}.json", stem, rng());
}

// Millisecond precision survives the round trip
TimePoint at_ms(std::int64_t ms) {
  return TimePoint{std::chrono::duration_cast<Clock::duration>(std::chrono::milliseconds{ms})};
}

EngineState sample_state() {
  auto state = EngineState{};
  state.enabled = true;
  state.threshold = ThresholdState{1.93, at_ms(1'700'000'000'000), 0.13};
  state.rotation_offset = 42;
  state.cooldowns["ABC_USDT"] = at_ms(1'700'000'120'000);

  auto wick = Position{};
  wick.signal_id = "ABC_USDT-S-1700000000";
  wick.symbol = "ABC_USDT";
  wick.side = Side::Short;
  wick.entry_price = 100.26;
  wick.stop_price = 100.4;
  wick.target_price = 99.9;
  wick.leverage = leverage;
  wick.size_usdt = position_size_usdt;
  wick.score = 1.98;
  wick.atr = 0.14;
  wick.opened_at = at_ms(1'700'000'062'000);
  wick.entry_bar_time = at_ms(1'700'000'060'000);
  wick.last_bar_checked = at_ms(1'700'000'060'000);
  wick.max_favorable_price = 100.1;
  wick.max_adverse_price = 100.3;
  state.positions.push_back(wick);

  auto dca = DcaState{};
  dca.leverage = dca_leverage;
  dca.growth = growth_thin;
  dca.margin_plan = plan_margins(dca_bank, cum_deposit_frac_at_full, dca_levels, dca.growth);
  dca.strategic_lower = 1.07;
  dca.strategic_upper = 1.09;
  dca.tick_size = 0.0001;
  add_step(dca, 1.075, dca.margin_plan[0], at_ms(1'700'000'000'000));
  add_step(dca, 1.0735, dca.margin_plan[1], at_ms(1'700'000'300'000));
  dca.ladder = {1.072, 1.071};
  dca.frozen = false;
  dca.reserved_final_step = false;

  auto range = Position{};
  range.signal_id = "EURC_USDT-L-1700000000";
  range.symbol = "EURC_USDT";
  range.side = Side::Long;
  range.entry_price = 1.075;
  range.target_price = dca_target(dca, Side::Long);
  range.leverage = dca_leverage;
  range.size_usdt = dca.margin_plan[0];
  range.opened_at = at_ms(1'700'000'000'000);
  range.entry_bar_time = range.opened_at;
  range.last_bar_checked = range.opened_at;
  range.max_favorable_price = 1.076;
  range.max_adverse_price = 1.0735;
  range.dca = dca;
  state.positions.push_back(range);

  return state;
}

} // namespace

TEST_CASE("State survives a save and load", "[state]") {
  const auto file = temp_file("wickscan-state");
  const auto state = sample_state();

  REQUIRE(save_state(file, state));
  auto loaded = load_state(file);
  std::filesystem::remove(file);

  REQUIRE(loaded);
  REQUIRE(loaded->enabled);
  REQUIRE(loaded->rotation_offset == 42);
  REQUIRE(loaded->threshold.value == 1.93);
  REQUIRE(loaded->threshold.updated_at == state.threshold.updated_at);
  REQUIRE(loaded->cooldowns == state.cooldowns);
  REQUIRE(loaded->positions.size() == 2);

  const auto &wick = loaded->positions[0];
  REQUIRE(wick.signal_id == "ABC_USDT-S-1700000000");
  REQUIRE(wick.side == Side::Short);
  REQUIRE(wick.status == PositionStatus::Active);
  REQUIRE(wick.stop_price == 100.4);
  REQUIRE(wick.entry_bar_time == state.positions[0].entry_bar_time);
  REQUIRE(wick.last_bar_checked == state.positions[0].last_bar_checked);
  REQUIRE_FALSE(wick.dca);

  const auto &range = loaded->positions[1];
  REQUIRE_FALSE(range.stop_price);
  REQUIRE(range.dca);
  REQUIRE(range.dca->steps.size() == 2);
  REQUIRE(range.dca->steps[1].time == state.positions[1].dca->steps[1].time);
  REQUIRE(range.dca->margin_plan == state.positions[1].dca->margin_plan);
  REQUIRE(range.dca->ladder == state.positions[1].dca->ladder);
  REQUIRE(range.dca->avg_price == state.positions[1].dca->avg_price);
  REQUIRE(range.dca->tick_size == 0.0001);
}

TEST_CASE("Missing or damaged state files", "[state]") {
  SECTION("Missing") {
    auto loaded = load_state(temp_file("wickscan-absent"));
    REQUIRE_FALSE(loaded);
    REQUIRE(loaded.error() == StateError::NotFound);
  }

  SECTION("Not JSON") {
    const auto file = temp_file("wickscan-garbage");
    {
      auto out = std::ofstream{file};
      out << "{\"enabled\": tru";
    }
    auto loaded = load_state(file);
    std::filesystem::remove(file);
    REQUIRE_FALSE(loaded);
    REQUIRE(loaded.error() == StateError::ParseError);
  }

  SECTION("Wrong shape") {
    const auto file = temp_file("wickscan-shape");
    {
      auto out = std::ofstream{file};
      out << R"({"enabled": true, "positions": 7})";
    }
    auto loaded = load_state(file);
    std::filesystem::remove(file);
    REQUIRE_FALSE(loaded);
    REQUIRE(loaded.error() == StateError::ParseError);
  }

  SECTION("Unwritable directory") {
    const auto file = std::filesystem::path{"/nonexistent-dir/wickscan/state.json"};
    auto saved = save_state(file, sample_state());
    REQUIRE_FALSE(saved);
    REQUIRE(saved.error() == StateError::IoError);
  }
}

TEST_CASE("State JSON layout", "[state]") {
  const auto j = nlohmann::json(sample_state());
  REQUIRE(j.at("version") == 1);
  REQUIRE(j.at("positions")[0].at("side") == "SHORT");
  REQUIRE(j.at("positions")[1].at("stop_price").is_null());
  REQUIRE(j.at("cooldowns").at("ABC_USDT") == 1'700'000'120'000);
}
