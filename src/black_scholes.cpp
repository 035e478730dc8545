#include "bsm/black_scholes.hpp"

#include <algorithm>
#include <cmath>

#include "bsm/normal.hpp"

namespace {

constexpr double kPercent = 100.0;
constexpr double kDaysPerThetaYear = 365.0;

bool positive_finite(double value) {
  return std::isfinite(value) && value > 0.0;
}

}  // namespace

namespace bsm {

ModelParameters to_model_parameters(const MarketInputs& inputs) {
  return ModelParameters{
    .spot = inputs.spot,
    .strike = inputs.strike,
    .time_to_expiry = year_fraction(inputs.valuation_date, inputs.exercise_date),
    .volatility = inputs.volatility_percent / kPercent,
    .rate = inputs.rate_percent / kPercent,
    .dividend_yield = inputs.dividend_percent / kPercent,
  };
}

EngineStatus validate_market_inputs(const MarketInputs& inputs) {
  if (!is_valid(inputs.valuation_date)) {
    return invalid_input("valuation date is not a valid calendar date");
  }
  if (!is_valid(inputs.exercise_date)) {
    return invalid_input("exercise date is not a valid calendar date");
  }
  return validate_model_parameters(to_model_parameters(inputs));
}

EngineStatus validate_model_parameters(const ModelParameters& params) {
  if (!positive_finite(params.spot)) {
    return invalid_input("spot price must be a positive number");
  }
  if (!positive_finite(params.strike)) {
    return invalid_input("strike price must be a positive number");
  }
  if (!positive_finite(params.time_to_expiry)) {
    return invalid_input("time to expiry must be positive");
  }
  if (!positive_finite(params.volatility)) {
    return invalid_input("volatility must be positive");
  }
  if (!std::isfinite(params.rate) || !std::isfinite(params.dividend_yield)) {
    return invalid_input("risk-free rate and dividend yield must be finite");
  }
  return EngineStatus{};
}

BlackScholesTerms black_scholes_terms(const ModelParameters& params) {
  const double S = params.spot;
  const double K = params.strike;
  const double T = params.time_to_expiry;
  const double sigma = params.volatility;
  const double r = params.rate;
  const double q = params.dividend_yield;

  const double sqrtT = std::sqrt(T);
  const double sigmaSqT = sigma * sqrtT;
  const double d1 = (std::log(S / K) + (r - q + 0.5 * sigma * sigma) * T) / sigmaSqT;

  return BlackScholesTerms{
    .d1 = d1,
    .d2 = d1 - sigmaSqT,
    .sqrt_t = sqrtT,
    .spot_discount = std::exp(-q * T),
    .strike_discount = std::exp(-r * T),
  };
}

double option_price(const ModelParameters& params, const BlackScholesTerms& terms, OptionSide side) {
  const double forward = params.spot * terms.spot_discount;
  const double pv_strike = params.strike * terms.strike_discount;
  if (side == OptionSide::kCall) {
    return forward * normal_cdf(terms.d1) - pv_strike * normal_cdf(terms.d2);
  }
  return pv_strike * normal_cdf(-terms.d2) - forward * normal_cdf(-terms.d1);
}

double unscaled_vega(const ModelParameters& params, const BlackScholesTerms& terms) {
  return params.spot * terms.spot_discount * normal_pdf(terms.d1) * terms.sqrt_t;
}

PricingResult black_scholes(const ModelParameters& params) {
  const double S = params.spot;
  const double K = params.strike;
  const double sigma = params.volatility;
  const double r = params.rate;
  const double q = params.dividend_yield;

  const BlackScholesTerms terms = black_scholes_terms(params);
  const double pdfD1 = normal_pdf(terms.d1);
  const double eqT = terms.spot_discount;
  const double erT = terms.strike_discount;

  const double gamma = eqT * pdfD1 / (S * sigma * terms.sqrt_t);
  const double vega = unscaled_vega(params, terms) / kPercent;
  const double decay = -(S * pdfD1 * sigma * eqT) / (2.0 * terms.sqrt_t);

  const OptionGreeks call{
    .price = option_price(params, terms, OptionSide::kCall),
    .delta = eqT * normal_cdf(terms.d1),
    .gamma = gamma,
    .vega = vega,
    .theta = (decay
              - r * K * erT * normal_cdf(terms.d2)
              + q * S * eqT * normal_cdf(terms.d1)) / kDaysPerThetaYear,
  };

  const OptionGreeks put{
    .price = option_price(params, terms, OptionSide::kPut),
    .delta = -eqT * normal_cdf(-terms.d1),
    .gamma = gamma,
    .vega = vega,
    .theta = (decay
              + r * K * erT * normal_cdf(-terms.d2)
              - q * S * eqT * normal_cdf(-terms.d1)) / kDaysPerThetaYear,
  };

  return PricingResult{
    .call = call,
    .put = put,
    .time_to_expiry = params.time_to_expiry,
  };
}

PricingOutcome price_option(const MarketInputs& inputs) {
  EngineStatus status = validate_market_inputs(inputs);
  if (!status.ok()) {
    return PricingOutcome{.status = std::move(status), .result = std::nullopt};
  }
  return PricingOutcome{
    .status = EngineStatus{},
    .result = black_scholes(to_model_parameters(inputs)),
  };
}

double discounted_intrinsic(const ModelParameters& params, OptionSide side) {
  const double T = params.time_to_expiry;
  const double forward = params.spot * std::exp(-params.dividend_yield * T);
  const double pv_strike = params.strike * std::exp(-params.rate * T);
  return side == OptionSide::kCall
    ? std::max(0.0, forward - pv_strike)
    : std::max(0.0, pv_strike - forward);
}

double put_call_parity_gap(const PricingResult& result, const ModelParameters& params) {
  const double T = params.time_to_expiry;
  const double forward = params.spot * std::exp(-params.dividend_yield * T);
  const double pv_strike = params.strike * std::exp(-params.rate * T);
  return result.call.price - result.put.price - (forward - pv_strike);
}

}  // namespace bsm
