#include "calc/aggregator.hpp"
#include "core/logger.hpp"

#include <stdexcept>
#include <utility>

namespace degree_hours {

uint32_t AggregateRow::count_active_in(Season season) const {
  switch (season) {
  case Season::WINTER:
    return count_active_winter;
  case Season::SPRING:
    return count_active_spring;
  case Season::SUMMER:
    return count_active_summer;
  case Season::FALL:
    return count_active_fall;
  }
  return 0;
}

std::vector<AggregateRow>
Aggregator::aggregate(const TemperatureSeries &series,
                      const DerivedSeries &derived) const {
  const size_t hours = series.size();
  if (derived.degree_hour.size() != hours || derived.season.size() != hours ||
      derived.bin.size() != hours)
    throw std::invalid_argument(
        "Derived series length does not match the temperature series");

  const size_t bins = binner_.bin_count();
  const auto &temperatures = series.temperatures();

  // Group membership first, then each count filters that group's own hours
  std::vector<std::vector<size_t>> groups(HOURS_PER_DAY * bins);
  for (size_t i = 0; i < hours; ++i) {
    if (!derived.bin[i].has_value())
      continue;
    size_t hour = static_cast<size_t>(series.at(i).hour);
    groups[hour * bins + *derived.bin[i]].push_back(i);
  }

  std::vector<AggregateRow> rows;
  rows.reserve(groups.size());

  for (uint32_t hour = 0; hour < HOURS_PER_DAY; ++hour) {
    for (size_t b = 0; b < bins; ++b) {
      const auto &members = groups[hour * bins + b];

      AggregateRow row;
      row.hour_of_day = hour;
      row.bin = binner_.bin(b);
      row.city = series.site().city;
      row.state_province = series.site().state_province;

      double temperature_sum = 0.0;
      for (size_t i : members) {
        row.sum_degree_hour += derived.degree_hour[i];
        temperature_sum += temperatures[i];

        if (!(derived.degree_hour[i] > 0.0))
          continue;
        row.count_active_hours++;
        switch (derived.season[i]) {
        case Season::WINTER:
          row.count_active_winter++;
          break;
        case Season::SPRING:
          row.count_active_spring++;
          break;
        case Season::SUMMER:
          row.count_active_summer++;
          break;
        case Season::FALL:
          row.count_active_fall++;
          break;
        }
      }

      if (!members.empty())
        row.mean_temperature =
            temperature_sum / static_cast<double>(members.size());

      rows.push_back(std::move(row));
    }
  }

  LOG(LogLevel::DEBUG, LogComponent::AGGREGATE,
      "Aggregated " << hours << " hours into " << rows.size() << " rows for "
                    << series.site().display_name());
  return rows;
}

} // namespace degree_hours
