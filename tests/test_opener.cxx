// Unit tests for entry planning and the position opener
#include "defs.h"
#include "fakes.h"
#include "opener.h"
#include <catch2/catch_test_macros.hpp>
#include <catch2/matchers/catch_matchers_floating_point.hpp>
#include <format>

using Catch::Matchers::WithinAbs;
using Catch::Matchers::WithinRel;
using namespace wick;

namespace {

// Lower wick 0.5 under a 0.1 body, long side
CandidateSignal long_candidate(TimePoint bar_time, double score = 2.0) {
  auto c = CandidateSignal{};
  c.symbol = "ABC_USDT";
  c.side = Side::Long;
  c.score = score;
  c.signal_bar = Bar{bar_time, 100.0, 100.15, 99.5, 100.1, 5000.0};
  c.gate.atr = 0.2;
  return c;
}

CandidateSignal short_candidate(TimePoint bar_time, double score = 2.0) {
  auto c = CandidateSignal{};
  c.symbol = "ABC_USDT";
  c.side = Side::Short;
  c.score = score;
  c.signal_bar = Bar{bar_time, 100.0, 100.6, 99.95, 100.1, 5000.0};
  c.gate.atr = 0.2;
  return c;
}

} // namespace

TEST_CASE("Entry retraces into the wick by score margin", "[opener]") {
  const auto c = long_candidate(TimePoint{});

  SECTION("Base tier") {
    const auto plan = plan_entry(c, 0.05, 0.01);
    REQUIRE_THAT(plan.tail_frac, WithinRel(tail_frac_base));
    REQUIRE_THAT(plan.entry, WithinRel(99.625, 1e-12));
    // 0.2% of entry beats half an ATR
    REQUIRE_THAT(plan.stop, WithinRel(99.625 * (1.0 - sl_pct), 1e-12));
    REQUIRE_THAT(plan.target, WithinRel(99.625 * (1.0 + tp_pct_base), 1e-12));
  }

  SECTION("Good tier") {
    const auto plan = plan_entry(c, 0.2, 0.01);
    REQUIRE_THAT(plan.entry, WithinRel(99.5 + 0.30 * 0.5, 1e-12));
    REQUIRE_THAT(plan.target, WithinRel(plan.entry * (1.0 + tp_pct_good), 1e-12));
  }

  SECTION("Strong tier") {
    const auto plan = plan_entry(c, 0.35, 0.01);
    REQUIRE_THAT(plan.entry, WithinRel(99.5 + 0.35 * 0.5, 1e-12));
    REQUIRE_THAT(plan.target, WithinRel(plan.entry * (1.0 + tp_pct_strong), 1e-12));
  }

  SECTION("Volatile symbols get an ATR stop") {
    auto wide = c;
    wide.gate.atr = 1.0;
    const auto plan = plan_entry(wide, 0.05, 0.01);
    REQUIRE_THAT(plan.entry - plan.stop, WithinRel(0.5, 1e-9));
  }

  SECTION("Shorts mirror longs") {
    const auto plan = plan_entry(short_candidate(TimePoint{}), 0.05, 0.01);
    REQUIRE_THAT(plan.entry, WithinRel(100.6 - 0.25 * 0.5, 1e-12));
    REQUIRE(plan.stop > plan.entry);
    REQUIRE(plan.target < plan.entry);
  }
}

TEST_CASE("Touch band", "[opener]") {
  SECTION("Wick fraction dominates") {
    REQUIRE_THAT(touch_band(100.0, 0.01, 0.5, 0.2), WithinRel(0.125));
  }

  SECTION("Sub-dime coins get a percentage floor") {
    REQUIRE_THAT(touch_band(0.05, 0.00001, 0.0001, 0.00005), WithinRel(0.000075, 1e-9));
  }

  SECTION("Never tighter than the tick floor") {
    REQUIRE_THAT(touch_band(100.0, 0.1, 0.0, 0.0), WithinRel(0.3, 1e-12));
  }
}

TEST_CASE("Opening a position", "[opener]") {
  auto h = test::Harness{};
  h.exchange->add_market("ABC_USDT", 0.001);
  auto tasks = TaskGroup{};
  const auto bar_time = Clock::now() - std::chrono::minutes{5};
  const auto candidate = long_candidate(bar_time);

  SECTION("Live price at the entry opens") {
    h.exchange->set_price("ABC_USDT", 99.63);
    REQUIRE(dispatch_open(h.ctx, tasks, candidate, 1.95, 0.001));
    tasks.wait_all();

    REQUIRE(h.positions.count() == 1);
    const auto pos = *h.positions.find_symbol("ABC_USDT");
    REQUIRE(pos.status == PositionStatus::Active);
    REQUIRE_THAT(pos.entry_price, WithinAbs(99.625, 0.0011));
    REQUIRE(pos.stop_price);
    REQUIRE(*pos.stop_price < pos.entry_price);
    REQUIRE(pos.target_price > pos.entry_price);
    REQUIRE(pos.size_usdt == position_size_usdt);
    REQUIRE(pos.last_bar_checked == pos.entry_bar_time);

    REQUIRE_FALSE(h.reservations.contains("ABC_USDT"));
    REQUIRE(h.cooldowns.is_active("ABC_USDT", Clock::now()));
    REQUIRE(h.trade_log.opens.size() == 1);
    REQUIRE(h.notifier.count() == 1);
    REQUIRE(h.ctx.opened.load() == 1u);
  }

  SECTION("Price gone away releases the reservation") {
    h.exchange->set_price("ABC_USDT", 101.0);
    REQUIRE(dispatch_open(h.ctx, tasks, candidate, 1.95, 0.001));
    tasks.wait_all();

    REQUIRE(h.positions.count() == 0);
    REQUIRE(h.ctx.no_touch.load() == 1u);
    REQUIRE_FALSE(h.reservations.contains("ABC_USDT"));
    REQUIRE(h.trade_log.opens.empty());
  }

  SECTION("Exchange failure releases the reservation") {
    // No ticker for the symbol
    REQUIRE(dispatch_open(h.ctx, tasks, candidate, 1.95, 0.001));
    tasks.wait_all();

    REQUIRE(h.positions.count() == 0);
    REQUIRE_FALSE(h.reservations.contains("ABC_USDT"));
  }

  SECTION("Symbol already being opened") {
    auto held = h.reservations.try_reserve("ABC_USDT");
    auto result = dispatch_open(h.ctx, tasks, candidate, 1.95, 0.001);
    REQUIRE_FALSE(result);
    REQUIRE(result.error() == OpenError::AlreadyReserved);
    REQUIRE(tasks.running() == 0);
  }

  SECTION("Reservations count against capacity") {
    auto held = std::vector<Reservation>{};
    for (auto i = 0uz; i < max_concurrent_positions; ++i)
      held.push_back(std::move(*h.reservations.try_reserve(std::format("S{}_USDT", i))));

    auto result = dispatch_open(h.ctx, tasks, candidate, 1.95, 0.001);
    REQUIRE_FALSE(result);
    REQUIRE(result.error() == OpenError::Capacity);
  }

  SECTION("Stopping cancels the settle wait") {
    auto fresh = long_candidate(Clock::now());
    h.exchange->set_price("ABC_USDT", 99.63);
    REQUIRE(dispatch_open(h.ctx, tasks, fresh, 1.95, 0.001));
    tasks.stop_all();

    REQUIRE(h.positions.count() == 0);
    REQUIRE_FALSE(h.reservations.contains("ABC_USDT"));
  }
}
