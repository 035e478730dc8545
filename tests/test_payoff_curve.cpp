#include <algorithm>
#include <cmath>
#include <cstdlib>
#include <iostream>

#include "bsm/payoff_curve.hpp"

namespace {

void assert_near(const char* label, double actual, double expected, double tolerance) {
  if (std::abs(actual - expected) > tolerance) {
    std::cerr << label << " expected " << expected << " but got " << actual << '\n';
    std::exit(EXIT_FAILURE);
  }
}

void assert_condition(bool condition, const char* message) {
  if (!condition) {
    std::cerr << message << '\n';
    std::exit(EXIT_FAILURE);
  }
}

bsm::MarketInputs inputs_with_spot(double spot) {
  return bsm::MarketInputs{
    .spot = spot,
    .strike = 100.0,
    .valuation_date = {.year = 2025, .month = 3, .day = 3},
    .exercise_date = {.year = 2025, .month = 9, .day = 1},
    .volatility_percent = 30.0,
    .rate_percent = 4.0,
    .dividend_percent = 1.0,
  };
}

}  // namespace

int main() {
  const bsm::MarketInputs inputs = inputs_with_spot(100.0);
  const auto entry = bsm::price_option(inputs);
  assert_condition(entry.status.ok(), "entry pricing must succeed");
  const double entry_call = entry.result->call.price;
  const double entry_put = entry.result->put.price;

  const auto long_curve = bsm::build_curve(inputs, bsm::PositionDirection::kLong, entry_call, entry_put);
  assert_condition(long_curve.status.ok(), "curve must build");
  const auto& points = long_curve.points;

  assert_condition(points.size() == 201, "sweep produces 201 points");
  assert_near("first spot", points.front().spot, 50.0, 1e-12);
  assert_condition(points.back().spot == 150.0, "last spot is exactly 1.5 * S");
  for (std::size_t i = 1; i < points.size(); ++i) {
    assert_near("equal spacing", points[i].spot - points[i - 1].spot, 0.5, 1e-9);
    assert_condition(points[i].call_intrinsic >= points[i - 1].call_intrinsic, "call intrinsic non-decreasing");
    assert_condition(points[i].put_intrinsic <= points[i - 1].put_intrinsic, "put intrinsic non-increasing");
    assert_condition(points[i].call_current >= points[i - 1].call_current, "long call marks up with spot");
  }

  // Index 100 sits on the entry spot, so the mark-to-market P&L is flat there.
  const bsm::CurvePoint& at_entry = points[100];
  assert_near("entry spot", at_entry.spot, 100.0, 1e-12);
  assert_near("call current at entry", at_entry.call_current, 0.0, 1e-9);
  assert_near("put current at entry", at_entry.put_current, 0.0, 1e-9);
  assert_near("call payoff at entry", at_entry.call_payoff, -entry_call, 1e-12);
  assert_near("put payoff at entry", at_entry.put_payoff, -entry_put, 1e-12);
  assert_near("call delta at entry", at_entry.call_delta, entry.result->call.delta, 1e-12);
  assert_near("gamma at entry", at_entry.gamma, entry.result->call.gamma, 1e-12);
  assert_near("vega at entry", at_entry.vega, entry.result->call.vega, 1e-12);

  const bsm::CurvePoint& deep = points.back();
  assert_near("call payoff deep in the money", deep.call_payoff, (150.0 - 100.0) - entry_call, 1e-9);
  assert_near("put intrinsic deep out of the money", deep.put_intrinsic, 0.0, 0.0);
  assert_near("put payoff deep out of the money", deep.put_payoff, -entry_put, 1e-12);
  assert_near("curve delta parity", deep.call_delta - deep.put_delta,
              std::exp(-0.01 * entry.result->time_to_expiry), 1e-12);

  const auto short_curve = bsm::build_curve(inputs, bsm::PositionDirection::kShort, entry_call, entry_put);
  assert_condition(short_curve.status.ok() && short_curve.points.size() == points.size(), "short curve builds");
  for (std::size_t i = 0; i < points.size(); ++i) {
    const bsm::CurvePoint& lhs = points[i];
    const bsm::CurvePoint& rhs = short_curve.points[i];
    assert_near("short payoff flips", rhs.call_payoff, -lhs.call_payoff, 1e-12);
    assert_near("short current flips", rhs.put_current, -lhs.put_current, 1e-12);
    assert_near("short intrinsic flips", rhs.call_intrinsic, -lhs.call_intrinsic, 1e-12);
    assert_condition(rhs.call_delta == lhs.call_delta && rhs.gamma == lhs.gamma && rhs.vega == lhs.vega,
                     "greeks are not direction-adjusted");
  }

  const auto small = bsm::build_curve(inputs_with_spot(1.5), bsm::PositionDirection::kLong, 0.0, 98.0);
  assert_condition(small.status.ok() && small.points.size() == 201, "small spot still sweeps 201 points");
  assert_condition(small.points.front().spot == 1.0, "sweep floor is 1");
  assert_condition(small.points.back().spot == 2.25, "sweep ceiling is 1.5 * S");

  const auto tiny = bsm::build_curve(inputs_with_spot(0.5), bsm::PositionDirection::kLong, 0.0, 99.0);
  assert_condition(tiny.status.ok() && tiny.points.empty(), "range entirely below the floor is empty");

  bsm::MarketInputs flat = inputs;
  flat.volatility_percent = 0.0;
  const auto rejected = bsm::build_curve(flat, bsm::PositionDirection::kLong, entry_call, entry_put);
  assert_condition(rejected.status.code == bsm::ErrorCode::kInvalidInput && rejected.points.empty(),
                   "zero volatility curve is rejected");

  const auto nan_entry = bsm::build_curve(inputs, bsm::PositionDirection::kLong, std::nan(""), entry_put);
  assert_condition(nan_entry.status.code == bsm::ErrorCode::kInvalidInput, "non-finite entry price is rejected");

  const auto puts = bsm::select_series(points, bsm::OptionSide::kPut);
  assert_condition(puts.size() == points.size(), "series keeps every point");
  assert_condition(puts[37].spot == points[37].spot, "series spot");
  assert_condition(puts[37].current_pnl == points[37].put_current, "series current P&L");
  assert_condition(puts[37].payoff_pnl == points[37].put_payoff, "series payoff P&L");
  assert_condition(puts[37].intrinsic == points[37].put_intrinsic, "series intrinsic");
  assert_condition(puts[37].delta == points[37].put_delta, "series delta");
  const auto calls = bsm::select_series(points, bsm::OptionSide::kCall);
  assert_condition(calls[150].delta == points[150].call_delta, "call series delta");

  bsm::SweepConfig coarse;
  coarse.steps = 10;
  coarse.range_fraction = 0.2;
  const auto custom = bsm::build_curve(inputs, bsm::PositionDirection::kLong, entry_call, entry_put, coarse);
  assert_condition(custom.points.size() == 11, "custom step count");
  assert_near("custom low", custom.points.front().spot, 80.0, 1e-12);
  assert_near("custom high", custom.points.back().spot, 120.0, 1e-12);

  return EXIT_SUCCESS;
}
