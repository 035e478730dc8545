#pragma once

#include <cstddef>
#include <optional>
#include <variant>
#include <vector>

#include "bsm/black_scholes.hpp"
#include "bsm/implied_volatility.hpp"
#include "bsm/payoff_curve.hpp"
#include "bsm/position.hpp"

namespace bsm {

struct PriceRequest {
  MarketInputs inputs;
  OptionSide side = OptionSide::kCall;
  PositionDirection direction = PositionDirection::kLong;
};

struct ImpliedVolatilityRequest {
  MarketInputs inputs;
  OptionSide side = OptionSide::kCall;
  PositionDirection direction = PositionDirection::kLong;
  double market_price = 0.0;
};

using EngineRequest = std::variant<PriceRequest, ImpliedVolatilityRequest>;

// volatility_percent echoes the input in price mode and is the solved value in
// implied-volatility mode, where solver_iterations is also set.
struct Evaluation {
  PricingResult pricing;
  std::vector<CurvePoint> curve;
  double volatility_percent;
  std::size_t solver_iterations;
  PositionView position;
};

struct EvaluationOutcome {
  EngineStatus status;
  std::optional<Evaluation> evaluation;
};

struct EngineConfig {
  SolverConfig solver;
  SweepConfig sweep;
};

EvaluationOutcome recompute(const EngineRequest& request, const EngineConfig& config = EngineConfig{});

}  // namespace bsm
