#pragma once

#include "bsm/black_scholes.hpp"

namespace bsm {

enum class PremiumFlow {
  kPay,
  kReceive,
};

// Greeks of the trade rather than the instrument: each is scaled by the
// direction sign, while `premium` stays the unsigned model price.
struct PositionView {
  OptionSide side;
  PositionDirection direction;
  double premium;
  PremiumFlow premium_flow;
  double delta;
  double gamma;
  double vega;
  double theta;
  int days_to_expiry;
};

PositionView make_position_view(const PricingResult& pricing, OptionSide side, PositionDirection direction);

}  // namespace bsm
