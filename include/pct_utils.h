#pragma once

// Percentage and price-distance helpers
// Percentages are stored as fractions: 0.3% = 0.003

// Constexpr tolerance helper for floating-point comparisons
constexpr bool near(double a, double b, double eps = 1e-12) {
  return (a > b ? a - b : b - a) <= eps;
}

// User-defined literal for percentages
constexpr double operator""_pc(long double x) { return x / 100.0; }
constexpr double operator""_pc(unsigned long long x) {
  return static_cast<double>(x) / 100.0;
}

// Signed move from entry to price as a fraction of entry (+1 long, -1 short)
constexpr double move_pct(double entry, double price, int side_sign) {
  return side_sign * (price - entry) / entry;
}

// Price at a signed percentage distance from a reference
constexpr double offset_price(double reference, double pct, int side_sign) {
  return reference * (1.0 + side_sign * pct);
}

// Realised P&L in quote currency for a leveraged nominal margin
constexpr double leveraged_pnl(double margin, double lev, double pct) {
  return margin * lev * pct;
}

constexpr double clamp01(double x, double hi = 1.0) {
  return x < 0.0 ? 0.0 : (x > hi ? hi : x);
}

// Compile-time tests
static_assert(near(1_pc, 0.01), "1% literal = 0.01");
static_assert(near(0.2_pc, 0.002), "0.2% literal = 0.002");
static_assert(near(move_pct(100.0, 101.0, 1), 0.01), "Long gains as price rises");
static_assert(near(move_pct(100.0, 101.0, -1), -0.01), "Short loses as price rises");
static_assert(near(move_pct(100.0, 99.8, 1), -0.002), "Long stop at -0.2%");
static_assert(near(offset_price(100.0, 0.003, 1), 100.3), "Long target above");
static_assert(near(offset_price(100.0, 0.003, -1), 99.7), "Short target below");
static_assert(near(leveraged_pnl(10.0, 20.0, 0.003), 0.6), "10 x 20 x 0.3% = 0.6");
static_assert(near(leveraged_pnl(10.0, 20.0, -0.002), -0.4), "10 x 20 x -0.2% = -0.4");
static_assert(near(clamp01(1.7), 1.0) and near(clamp01(-0.5), 0.0));
static_assert(near(clamp01(1.7, 1.5), 1.5), "Custom upper clamp");
