#include "bsm/time_basis.hpp"

#include <algorithm>
#include <charconv>
#include <chrono>
#include <cmath>
#include <cstdio>

namespace {

std::chrono::year_month_day to_ymd(const bsm::CalendarDate& date) {
  return std::chrono::year_month_day{
    std::chrono::year{date.year},
    std::chrono::month{date.month},
    std::chrono::day{date.day},
  };
}

bsm::CalendarDate from_ymd(const std::chrono::year_month_day& ymd) {
  return bsm::CalendarDate{
    .year = static_cast<int>(ymd.year()),
    .month = static_cast<unsigned>(ymd.month()),
    .day = static_cast<unsigned>(ymd.day()),
  };
}

template <typename T>
bool parse_field(std::string_view text, T& out) {
  if (text.empty()) {
    return false;
  }
  const auto* first = text.data();
  const auto* last = text.data() + text.size();
  const auto [ptr, ec] = std::from_chars(first, last, out);
  return ec == std::errc{} && ptr == last;
}

}  // namespace

namespace bsm {

bool is_valid(const CalendarDate& date) {
  // chrono::month and chrono::day hold 0-255 and chrono::year +-32767; wider
  // values wrap, so the raw fields are bounded before conversion.
  if (date.month < 1 || date.month > 12 || date.day < 1 || date.day > 31) {
    return false;
  }
  if (date.year < static_cast<int>(std::chrono::year::min()) ||
      date.year > static_cast<int>(std::chrono::year::max())) {
    return false;
  }
  return to_ymd(date).ok();
}

long days_between(const CalendarDate& from, const CalendarDate& to) {
  const std::chrono::sys_days start{to_ymd(from)};
  const std::chrono::sys_days end{to_ymd(to)};
  return static_cast<long>((end - start).count());
}

double year_fraction(const CalendarDate& valuation, const CalendarDate& exercise) {
  const double days = static_cast<double>(days_between(valuation, exercise));
  return std::max(days / kDaysPerYear, kMinYearFraction);
}

int days_to_expiry(double year_fraction) {
  return static_cast<int>(std::lround(year_fraction * kDaysPerYear));
}

CalendarDate add_years(const CalendarDate& date, int years) {
  const auto shifted = to_ymd(date) + std::chrono::years{years};
  if (shifted.ok()) {
    return from_ymd(shifted);
  }
  // An out-of-range day is carried into the following month.
  return from_ymd(std::chrono::year_month_day{std::chrono::sys_days{shifted}});
}

CalendarDate today_utc() {
  const auto now = std::chrono::floor<std::chrono::days>(std::chrono::system_clock::now());
  return from_ymd(std::chrono::year_month_day{now});
}

std::optional<CalendarDate> parse_calendar_date(std::string_view text) {
  // YYYY-MM-DD
  if (text.size() != 10 || text[4] != '-' || text[7] != '-') {
    return std::nullopt;
  }
  CalendarDate date{};
  if (!parse_field(text.substr(0, 4), date.year) ||
      !parse_field(text.substr(5, 2), date.month) ||
      !parse_field(text.substr(8, 2), date.day)) {
    return std::nullopt;
  }
  if (!is_valid(date)) {
    return std::nullopt;
  }
  return date;
}

std::string format_calendar_date(const CalendarDate& date) {
  char buffer[16];
  std::snprintf(buffer, sizeof(buffer), "%04d-%02u-%02u", date.year, date.month, date.day);
  return buffer;
}

}  // namespace bsm
