#include "bsm/payoff_curve.hpp"

#include <algorithm>
#include <cmath>

namespace bsm {

std::vector<CurvePoint> sweep_spot(
  const ModelParameters& params,
  PositionDirection direction,
  double entry_call_price,
  double entry_put_price,
  const SweepConfig& config) {
  const std::size_t steps = std::max<std::size_t>(config.steps, 1U);
  const double range = params.spot * config.range_fraction;
  const double low = std::max(config.min_spot, params.spot - range);
  const double high = params.spot + range;
  const double step = (high - low) / static_cast<double>(steps);
  const double sign = direction_sign(direction);
  const double K = params.strike;

  std::vector<CurvePoint> points;
  if (high < low) {
    // Spot so small that the whole range sits below the floor.
    return points;
  }
  points.reserve(steps + 1);

  for (std::size_t i = 0; i <= steps; ++i) {
    ModelParameters shifted = params;
    shifted.spot = i == steps ? high : low + step * static_cast<double>(i);
    const PricingResult value = black_scholes(shifted);

    const double call_intrinsic = std::max(0.0, shifted.spot - K);
    const double put_intrinsic = std::max(0.0, K - shifted.spot);

    points.push_back(CurvePoint{
      .spot = shifted.spot,
      .call_payoff = (call_intrinsic - entry_call_price) * sign,
      .put_payoff = (put_intrinsic - entry_put_price) * sign,
      .call_current = (value.call.price - entry_call_price) * sign,
      .put_current = (value.put.price - entry_put_price) * sign,
      .call_intrinsic = call_intrinsic * sign,
      .put_intrinsic = put_intrinsic * sign,
      .call_delta = value.call.delta,
      .put_delta = value.put.delta,
      .gamma = value.call.gamma,
      .vega = value.call.vega,
    });
  }

  return points;
}

CurveOutcome build_curve(
  const MarketInputs& inputs,
  PositionDirection direction,
  double entry_call_price,
  double entry_put_price,
  const SweepConfig& config) {
  EngineStatus status = validate_market_inputs(inputs);
  if (status.ok() && !(std::isfinite(entry_call_price) && std::isfinite(entry_put_price))) {
    status = invalid_input("entry prices must be finite numbers");
  }
  if (!status.ok()) {
    return CurveOutcome{.status = std::move(status), .points = {}};
  }
  return CurveOutcome{
    .status = EngineStatus{},
    .points = sweep_spot(to_model_parameters(inputs), direction, entry_call_price, entry_put_price, config),
  };
}

std::vector<SeriesPoint> select_series(const std::vector<CurvePoint>& curve, OptionSide side) {
  const bool call = side == OptionSide::kCall;
  std::vector<SeriesPoint> series;
  series.reserve(curve.size());
  for (const CurvePoint& point : curve) {
    series.push_back(SeriesPoint{
      .spot = point.spot,
      .current_pnl = call ? point.call_current : point.put_current,
      .payoff_pnl = call ? point.call_payoff : point.put_payoff,
      .intrinsic = call ? point.call_intrinsic : point.put_intrinsic,
      .delta = call ? point.call_delta : point.put_delta,
      .gamma = point.gamma,
      .vega = point.vega,
    });
  }
  return series;
}

}  // namespace bsm
