#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace bsm {

struct CalendarDate {
  int year;
  unsigned month;
  unsigned day;
};

inline constexpr double kDaysPerYear = 365.25;
inline constexpr double kMinYearFraction = 0.001;

bool is_valid(const CalendarDate& date);

// Whole calendar days from `from` to `to`, negative when `to` precedes `from`.
long days_between(const CalendarDate& from, const CalendarDate& to);

// Actual/365.25 year fraction, floored at kMinYearFraction. An exercise date on
// or before the valuation date yields the floor rather than an error.
double year_fraction(const CalendarDate& valuation, const CalendarDate& exercise);

int days_to_expiry(double year_fraction);

// Feb 29 rolls forward to Mar 1 when the target year is not a leap year.
CalendarDate add_years(const CalendarDate& date, int years);

CalendarDate today_utc();

std::optional<CalendarDate> parse_calendar_date(std::string_view text);

std::string format_calendar_date(const CalendarDate& date);

}  // namespace bsm
