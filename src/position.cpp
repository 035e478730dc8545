#include "bsm/position.hpp"

namespace bsm {

PositionView make_position_view(const PricingResult& pricing, OptionSide side, PositionDirection direction) {
  const OptionGreeks& greeks = pricing.side(side);
  const double sign = direction_sign(direction);
  return PositionView{
    .side = side,
    .direction = direction,
    .premium = greeks.price,
    .premium_flow = direction == PositionDirection::kLong ? PremiumFlow::kPay : PremiumFlow::kReceive,
    .delta = greeks.delta * sign,
    .gamma = greeks.gamma * sign,
    .vega = greeks.vega * sign,
    .theta = greeks.theta * sign,
    .days_to_expiry = days_to_expiry(pricing.time_to_expiry),
  };
}

}  // namespace bsm
