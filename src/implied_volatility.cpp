#include "bsm/implied_volatility.hpp"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <string>

namespace {

constexpr double kPercent = 100.0;

std::string format_price(double value) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.2f", value);
  return buffer;
}

}  // namespace

namespace bsm {

ImpliedVolatilityResult implied_volatility(
  const ModelParameters& params,
  OptionSide side,
  double target_price,
  const SolverConfig& config) {
  ModelParameters guess = params;
  guess.volatility = config.initial_volatility;

  for (std::size_t iteration = 0; iteration < config.max_iterations; ++iteration) {
    const BlackScholesTerms terms = black_scholes_terms(guess);
    const double diff = option_price(guess, terms, side) - target_price;

    if (std::abs(diff) < config.tolerance) {
      return ImpliedVolatilityResult{
        .implied_volatility = guess.volatility,
        .converged = true,
        .iterations = iteration + 1,
      };
    }

    const double vega = unscaled_vega(guess, terms);
    guess.volatility = std::clamp(guess.volatility - diff / vega, config.lower_bound, config.upper_bound);
  }

  return ImpliedVolatilityResult{
    .implied_volatility = guess.volatility,
    .converged = false,
    .iterations = config.max_iterations,
  };
}

ImpliedVolatilityOutcome solve_implied_volatility(
  const MarketInputs& inputs,
  OptionSide side,
  double market_price,
  PositionDirection direction,
  const SolverConfig& config,
  const SweepConfig& sweep) {
  const auto fail = [](EngineStatus status) {
    return ImpliedVolatilityOutcome{.status = std::move(status), .solution = std::nullopt};
  };

  if (!std::isfinite(market_price) || market_price <= 0.0) {
    return fail(invalid_input("market price must be a positive number"));
  }
  if (!is_valid(inputs.valuation_date) || !is_valid(inputs.exercise_date)) {
    return fail(invalid_input("valuation and exercise dates must be valid calendar dates"));
  }
  if (days_between(inputs.valuation_date, inputs.exercise_date) <= 0) {
    return fail(invalid_input("exercise date must be after valuation date"));
  }

  ModelParameters params = to_model_parameters(inputs);
  params.volatility = config.initial_volatility;
  EngineStatus status = validate_model_parameters(params);
  if (!status.ok()) {
    return fail(std::move(status));
  }

  const double intrinsic = discounted_intrinsic(params, side);
  if (market_price < intrinsic) {
    return fail(invalid_input(
      "price below intrinsic value (" + format_price(market_price) + " < " + format_price(intrinsic) + ")"));
  }

  const ImpliedVolatilityResult root = implied_volatility(params, side, market_price, config);
  if (!root.converged) {
    return fail(non_convergence(
      "did not converge after " + std::to_string(root.iterations) + " iterations"));
  }

  params.volatility = root.implied_volatility;
  PricingResult pricing = black_scholes(params);
  std::vector<CurvePoint> curve = sweep_spot(params, direction, pricing.call.price, pricing.put.price, sweep);

  return ImpliedVolatilityOutcome{
    .status = EngineStatus{},
    .solution = ImpliedVolatilitySolution{
      .volatility_percent = root.implied_volatility * kPercent,
      .iterations = root.iterations,
      .pricing = std::move(pricing),
      .curve = std::move(curve),
    },
  };
}

}  // namespace bsm
