#pragma once

#include <cstddef>
#include <vector>

#include "bsm/black_scholes.hpp"

namespace bsm {

struct SweepConfig {
  std::size_t steps = 200;
  double range_fraction = 0.5;
  double min_spot = 1.0;
};

// P&L and intrinsic fields are direction-adjusted; Greeks are not.
struct CurvePoint {
  double spot;
  double call_payoff;
  double put_payoff;
  double call_current;
  double put_current;
  double call_intrinsic;
  double put_intrinsic;
  double call_delta;
  double put_delta;
  double gamma;
  double vega;
};

struct CurveOutcome {
  EngineStatus status;
  std::vector<CurvePoint> points;
};

// One side of the curve, as charted for the selected option type.
struct SeriesPoint {
  double spot;
  double current_pnl;
  double payoff_pnl;
  double intrinsic;
  double delta;
  double gamma;
  double vega;
};

// Sweeps spot over [max(min_spot, S - fS), S + fS] holding K, T, sigma, r, q fixed.
// `params` must be valid.
std::vector<CurvePoint> sweep_spot(
  const ModelParameters& params,
  PositionDirection direction,
  double entry_call_price,
  double entry_put_price,
  const SweepConfig& config = SweepConfig{});

CurveOutcome build_curve(
  const MarketInputs& inputs,
  PositionDirection direction,
  double entry_call_price,
  double entry_put_price,
  const SweepConfig& config = SweepConfig{});

std::vector<SeriesPoint> select_series(const std::vector<CurvePoint>& curve, OptionSide side);

}  // namespace bsm
