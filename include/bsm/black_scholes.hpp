#pragma once

#include <optional>

#include "bsm/market_inputs.hpp"
#include "bsm/status.hpp"

namespace bsm {

// Decimal rates and volatility, time in years.
struct ModelParameters {
  double spot;
  double strike;
  double time_to_expiry;
  double volatility;
  double rate;
  double dividend_yield;
};

// vega is per 1 volatility point, theta per calendar day.
struct OptionGreeks {
  double price;
  double delta;
  double gamma;
  double vega;
  double theta;
};

struct PricingResult {
  OptionGreeks call;
  OptionGreeks put;
  double time_to_expiry;

  const OptionGreeks& side(OptionSide option_side) const {
    return option_side == OptionSide::kCall ? call : put;
  }
};

struct PricingOutcome {
  EngineStatus status;
  std::optional<PricingResult> result;
};

struct BlackScholesTerms {
  double d1;
  double d2;
  double sqrt_t;
  double spot_discount;    // e^{-qT}
  double strike_discount;  // e^{-rT}
};

ModelParameters to_model_parameters(const MarketInputs& inputs);

EngineStatus validate_market_inputs(const MarketInputs& inputs);

EngineStatus validate_model_parameters(const ModelParameters& params);

// Callers must have validated `params`.
BlackScholesTerms black_scholes_terms(const ModelParameters& params);

double option_price(const ModelParameters& params, const BlackScholesTerms& terms, OptionSide side);

// dV/dsigma per unit of volatility, not scaled to volatility points.
double unscaled_vega(const ModelParameters& params, const BlackScholesTerms& terms);

PricingResult black_scholes(const ModelParameters& params);

PricingOutcome price_option(const MarketInputs& inputs);

double discounted_intrinsic(const ModelParameters& params, OptionSide side);

// call - put - (S e^{-qT} - K e^{-rT}), zero up to rounding.
double put_call_parity_gap(const PricingResult& result, const ModelParameters& params);

}  // namespace bsm
