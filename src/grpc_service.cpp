#include "bsm/grpc_service.hpp"

#include <cstdint>

#include <grpcpp/server_context.h>

namespace bsm {

namespace {

CalendarDate date_from_proto(const rpc::CalendarDate& proto) {
  return CalendarDate{
    .year = proto.year(),
    .month = proto.month(),
    .day = proto.day(),
  };
}

OptionSide side_from_proto(rpc::OptionSide side) {
  return side == rpc::OPTION_SIDE_PUT ? OptionSide::kPut : OptionSide::kCall;
}

PositionDirection direction_from_proto(rpc::PositionDirection direction) {
  return direction == rpc::POSITION_DIRECTION_SHORT ? PositionDirection::kShort : PositionDirection::kLong;
}

void fill_greeks(const OptionGreeks& greeks, rpc::OptionGreeks* out) {
  out->set_price(greeks.price);
  out->set_delta(greeks.delta);
  out->set_gamma(greeks.gamma);
  out->set_vega(greeks.vega);
  out->set_theta(greeks.theta);
}

void fill_pricing(const PricingResult& pricing, rpc::PricingResult* out) {
  fill_greeks(pricing.call, out->mutable_call());
  fill_greeks(pricing.put, out->mutable_put());
  out->set_time_to_expiry(pricing.time_to_expiry);
}

void fill_point(const CurvePoint& point, rpc::CurvePoint* out) {
  out->set_spot(point.spot);
  out->set_call_payoff(point.call_payoff);
  out->set_put_payoff(point.put_payoff);
  out->set_call_current(point.call_current);
  out->set_put_current(point.put_current);
  out->set_call_intrinsic(point.call_intrinsic);
  out->set_put_intrinsic(point.put_intrinsic);
  out->set_call_delta(point.call_delta);
  out->set_put_delta(point.put_delta);
  out->set_gamma(point.gamma);
  out->set_vega(point.vega);
}

template <typename Repeated>
void fill_curve(const std::vector<CurvePoint>& curve, Repeated* out) {
  out->Reserve(static_cast<int>(curve.size()));
  for (const CurvePoint& point : curve) {
    fill_point(point, out->Add());
  }
}

void fill_position(const PositionView& position, rpc::PositionView* out) {
  out->set_side(position.side == OptionSide::kPut ? rpc::OPTION_SIDE_PUT : rpc::OPTION_SIDE_CALL);
  out->set_direction(position.direction == PositionDirection::kShort
    ? rpc::POSITION_DIRECTION_SHORT
    : rpc::POSITION_DIRECTION_LONG);
  out->set_premium(position.premium);
  out->set_premium_flow(position.premium_flow == PremiumFlow::kReceive
    ? rpc::PREMIUM_FLOW_RECEIVE
    : rpc::PREMIUM_FLOW_PAY);
  out->set_delta(position.delta);
  out->set_gamma(position.gamma);
  out->set_vega(position.vega);
  out->set_theta(position.theta);
  out->set_days_to_expiry(position.days_to_expiry);
}

// A request without inputs prices the default at-the-money contract.
template <typename Request>
MarketInputs inputs_or_default(const Request& proto, const CalendarDate& today) {
  return proto.has_inputs() ? market_inputs_from_proto(proto.inputs(), today) : default_market_inputs(today);
}

PriceRequest price_request_from_proto(const rpc::PriceRequest& proto, const CalendarDate& today) {
  return PriceRequest{
    .inputs = inputs_or_default(proto, today),
    .side = side_from_proto(proto.side()),
    .direction = direction_from_proto(proto.direction()),
  };
}

ImpliedVolatilityRequest implied_vol_request_from_proto(
  const rpc::ImpliedVolRequest& proto,
  const CalendarDate& today) {
  return ImpliedVolatilityRequest{
    .inputs = inputs_or_default(proto, today),
    .side = side_from_proto(proto.side()),
    .direction = direction_from_proto(proto.direction()),
    .market_price = proto.market_price(),
  };
}

grpc::Status null_argument() {
  return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "request/response must not be null");
}

}  // namespace

MarketInputs market_inputs_from_proto(const rpc::MarketInputs& proto, const CalendarDate& today) {
  const CalendarDate valuation = proto.has_valuation_date() ? date_from_proto(proto.valuation_date()) : today;
  CalendarDate exercise = valuation;
  if (proto.has_exercise_date()) {
    exercise = date_from_proto(proto.exercise_date());
  } else if (is_valid(valuation)) {
    exercise = add_years(valuation, 1);
  }
  return MarketInputs{
    .spot = proto.spot(),
    .strike = proto.strike(),
    .valuation_date = valuation,
    .exercise_date = exercise,
    .volatility_percent = proto.volatility_percent(),
    .rate_percent = proto.rate_percent(),
    .dividend_percent = proto.dividend_percent(),
  };
}

grpc::Status to_grpc_status(const EngineStatus& status) {
  switch (status.code) {
    case ErrorCode::kOk:
      return grpc::Status::OK;
    case ErrorCode::kInvalidInput:
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, status.message);
    case ErrorCode::kNonConvergence:
      return grpc::Status(grpc::StatusCode::ABORTED, status.message);
  }
  return grpc::Status(grpc::StatusCode::UNKNOWN, status.message);
}

CalendarDate OptionEngineService::today() const {
  return valuation_date_.value_or(today_utc());
}

grpc::Status OptionEngineService::Price(
  grpc::ServerContext*,
  const rpc::PriceRequest* request,
  rpc::PriceResponse* response) {
  if (request == nullptr || response == nullptr) {
    return null_argument();
  }
  const PricingOutcome outcome = price_option(inputs_or_default(*request, today()));
  if (!outcome.status.ok()) {
    return to_grpc_status(outcome.status);
  }
  fill_pricing(*outcome.result, response->mutable_pricing());
  return grpc::Status::OK;
}

grpc::Status OptionEngineService::Curve(
  grpc::ServerContext*,
  const rpc::CurveRequest* request,
  rpc::CurveResponse* response) {
  if (request == nullptr || response == nullptr) {
    return null_argument();
  }
  const CurveOutcome outcome = build_curve(
    inputs_or_default(*request, today()),
    direction_from_proto(request->direction()),
    request->entry_call_price(),
    request->entry_put_price(),
    config_.sweep);
  if (!outcome.status.ok()) {
    return to_grpc_status(outcome.status);
  }
  fill_curve(outcome.points, response->mutable_points());
  return grpc::Status::OK;
}

grpc::Status OptionEngineService::ImpliedVol(
  grpc::ServerContext*,
  const rpc::ImpliedVolRequest* request,
  rpc::ImpliedVolResponse* response) {
  if (request == nullptr || response == nullptr) {
    return null_argument();
  }
  const ImpliedVolatilityRequest parsed = implied_vol_request_from_proto(*request, today());
  const ImpliedVolatilityOutcome outcome = solve_implied_volatility(
    parsed.inputs, parsed.side, parsed.market_price, parsed.direction, config_.solver, config_.sweep);
  if (!outcome.status.ok()) {
    return to_grpc_status(outcome.status);
  }
  const ImpliedVolatilitySolution& solution = *outcome.solution;
  response->set_volatility_percent(solution.volatility_percent);
  response->set_iterations(static_cast<std::uint32_t>(solution.iterations));
  fill_pricing(solution.pricing, response->mutable_pricing());
  fill_curve(solution.curve, response->mutable_curve());
  return grpc::Status::OK;
}

grpc::Status OptionEngineService::Evaluate(
  grpc::ServerContext*,
  const rpc::EvaluateRequest* request,
  rpc::EvaluateResponse* response) {
  if (request == nullptr || response == nullptr) {
    return null_argument();
  }

  EngineRequest engine_request;
  switch (request->mode_case()) {
    case rpc::EvaluateRequest::kPrice:
      engine_request = price_request_from_proto(request->price(), today());
      break;
    case rpc::EvaluateRequest::kImpliedVol:
      engine_request = implied_vol_request_from_proto(request->implied_vol(), today());
      break;
    case rpc::EvaluateRequest::MODE_NOT_SET:
      return grpc::Status(grpc::StatusCode::INVALID_ARGUMENT, "evaluation mode must be set");
  }

  const EvaluationOutcome outcome = recompute(engine_request, config_);
  if (!outcome.status.ok()) {
    return to_grpc_status(outcome.status);
  }
  const Evaluation& evaluation = *outcome.evaluation;
  fill_pricing(evaluation.pricing, response->mutable_pricing());
  fill_curve(evaluation.curve, response->mutable_curve());
  response->set_volatility_percent(evaluation.volatility_percent);
  response->set_solver_iterations(static_cast<std::uint32_t>(evaluation.solver_iterations));
  fill_position(evaluation.position, response->mutable_position());
  return grpc::Status::OK;
}

}  // namespace bsm
