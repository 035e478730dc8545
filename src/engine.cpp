#include "bsm/engine.hpp"

#include <utility>

namespace bsm {

namespace {

EvaluationOutcome failed(EngineStatus status) {
  return EvaluationOutcome{.status = std::move(status), .evaluation = std::nullopt};
}

EvaluationOutcome evaluate(const PriceRequest& request, const EngineConfig& config) {
  PricingOutcome priced = price_option(request.inputs);
  if (!priced.status.ok()) {
    return failed(std::move(priced.status));
  }
  const PricingResult& pricing = *priced.result;
  std::vector<CurvePoint> curve = sweep_spot(
    to_model_parameters(request.inputs),
    request.direction,
    pricing.call.price,
    pricing.put.price,
    config.sweep);

  return EvaluationOutcome{
    .status = EngineStatus{},
    .evaluation = Evaluation{
      .pricing = pricing,
      .curve = std::move(curve),
      .volatility_percent = request.inputs.volatility_percent,
      .solver_iterations = 0,
      .position = make_position_view(pricing, request.side, request.direction),
    },
  };
}

EvaluationOutcome evaluate(const ImpliedVolatilityRequest& request, const EngineConfig& config) {
  ImpliedVolatilityOutcome solved = solve_implied_volatility(
    request.inputs, request.side, request.market_price, request.direction, config.solver, config.sweep);
  if (!solved.status.ok()) {
    return failed(std::move(solved.status));
  }
  ImpliedVolatilitySolution& solution = *solved.solution;
  const PositionView position = make_position_view(solution.pricing, request.side, request.direction);

  return EvaluationOutcome{
    .status = EngineStatus{},
    .evaluation = Evaluation{
      .pricing = solution.pricing,
      .curve = std::move(solution.curve),
      .volatility_percent = solution.volatility_percent,
      .solver_iterations = solution.iterations,
      .position = position,
    },
  };
}

}  // namespace

EvaluationOutcome recompute(const EngineRequest& request, const EngineConfig& config) {
  return std::visit([&config](const auto& mode) { return evaluate(mode, config); }, request);
}

}  // namespace bsm
