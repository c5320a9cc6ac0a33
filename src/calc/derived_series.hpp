#ifndef DERIVED_SERIES_HPP
#define DERIVED_SERIES_HPP

#include "calc/season_classifier.hpp"

#include <cstddef>
#include <cstdint>
#include <optional>
#include <vector>

namespace degree_hours {

// Per-hour working columns of one (site, scenario) run.
// Built fresh for every run and dropped once the rows are aggregated.
struct DerivedSeries {
  std::vector<double> degree_hour;
  std::vector<double> daily_mean_temp;
  std::vector<double> weekly_mean_temp;

  // Per day (24-hour block); only filled by the cooling-degree-day gate
  std::vector<double> cdd_daily;
  std::vector<double> cdd_week;

  std::vector<uint8_t> keep; // 1 = degree-hours retained by the gate
  std::vector<Season> season;
  std::vector<std::optional<size_t>> bin; // empty where temperature is missing

  size_t size() const { return degree_hour.size(); }
};

} // namespace degree_hours

#endif // DERIVED_SERIES_HPP
