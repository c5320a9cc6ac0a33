#ifndef CALENDAR_HPP
#define CALENDAR_HPP

#include <cstddef>

namespace degree_hours {
namespace calendar {

constexpr size_t HOURS_PER_DAY = 24;
constexpr size_t HOURS_PER_WEEK = 168;

// All date arithmetic runs on one fixed leap year so that Feb 29 orders
// correctly and no record depends on its actual year
constexpr int days_in_month(int month) {
  constexpr int DAYS[12] = {31, 29, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (month >= 1 && month <= 12) ? DAYS[month - 1] : 0;
}

constexpr bool is_valid_date(int month, int day) {
  return month >= 1 && month <= 12 && day >= 1 && day <= days_in_month(month);
}

// 1-based ordinal of (month, day); 0 for an invalid date
constexpr int day_of_year(int month, int day) {
  if (!is_valid_date(month, day))
    return 0;
  int ordinal = day;
  for (int m = 1; m < month; ++m)
    ordinal += days_in_month(m);
  return ordinal;
}

} // namespace calendar
} // namespace degree_hours

#endif // CALENDAR_HPP
