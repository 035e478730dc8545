#pragma once

#include <cstddef>
#include <optional>
#include <vector>

#include "bsm/black_scholes.hpp"
#include "bsm/payoff_curve.hpp"

namespace bsm {

struct SolverConfig {
  double initial_volatility = 0.30;
  double lower_bound = 0.001;
  double upper_bound = 5.0;
  double tolerance = 1e-4;
  std::size_t max_iterations = 100;
};

struct ImpliedVolatilityResult {
  double implied_volatility;
  bool converged;
  std::size_t iterations;
};

struct ImpliedVolatilitySolution {
  double volatility_percent;
  std::size_t iterations;
  PricingResult pricing;
  std::vector<CurvePoint> curve;
};

struct ImpliedVolatilityOutcome {
  EngineStatus status;
  std::optional<ImpliedVolatilitySolution> solution;
};

// Newton-Raphson on sigma; `params.volatility` is ignored. No input validation.
ImpliedVolatilityResult implied_volatility(
  const ModelParameters& params,
  OptionSide side,
  double target_price,
  const SolverConfig& config = SolverConfig{});

// `inputs.volatility_percent` is ignored. The exercise date must follow the
// valuation date and the market price must not undercut discounted intrinsic.
ImpliedVolatilityOutcome solve_implied_volatility(
  const MarketInputs& inputs,
  OptionSide side,
  double market_price,
  PositionDirection direction = PositionDirection::kLong,
  const SolverConfig& config = SolverConfig{},
  const SweepConfig& sweep = SweepConfig{});

}  // namespace bsm
