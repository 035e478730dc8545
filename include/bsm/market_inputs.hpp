#pragma once

#include "bsm/time_basis.hpp"

namespace bsm {

enum class OptionSide {
  kCall,
  kPut,
};

enum class PositionDirection {
  kLong,
  kShort,
};

// Percent fields are whole-number percentages: 25 means 0.25.
struct MarketInputs {
  double spot;
  double strike;
  CalendarDate valuation_date;
  CalendarDate exercise_date;
  double volatility_percent;
  double rate_percent;
  double dividend_percent;
};

inline double direction_sign(PositionDirection direction) {
  return direction == PositionDirection::kLong ? 1.0 : -1.0;
}

// At-the-money one-year contract valued today.
inline MarketInputs default_market_inputs(const CalendarDate& today) {
  return MarketInputs{
    .spot = 100.0,
    .strike = 100.0,
    .valuation_date = today,
    .exercise_date = add_years(today, 1),
    .volatility_percent = 25.0,
    .rate_percent = 5.0,
    .dividend_percent = 0.0,
  };
}

}  // namespace bsm
