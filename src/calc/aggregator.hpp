#ifndef AGGREGATOR_HPP
#define AGGREGATOR_HPP

#include "calc/binner.hpp"
#include "calc/derived_series.hpp"
#include "series/temperature_series.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace degree_hours {

struct AggregateRow {
  uint32_t hour_of_day = 0;
  TemperatureBin bin;
  double sum_degree_hour = 0.0;
  double mean_temperature = 0.0;
  uint32_t count_active_hours = 0; // hours with degree_hour > 0
  uint32_t count_active_winter = 0;
  uint32_t count_active_spring = 0;
  uint32_t count_active_summer = 0;
  uint32_t count_active_fall = 0;
  std::string city;
  std::string state_province;

  uint32_t count_active_in(Season season) const;
};

/**
 * Groups one run's hours by (hour of day, bin).
 * Emits every combination, 24 x bin_count rows ordered by hour then bin;
 * a group without hours reports zeros. Hours without a temperature have no
 * bin and belong to no group.
 */
class Aggregator {
public:
  static constexpr uint32_t HOURS_PER_DAY = 24;

  explicit Aggregator(const Binner &binner) : binner_(binner) {}

  std::vector<AggregateRow> aggregate(const TemperatureSeries &series,
                                      const DerivedSeries &derived) const;

private:
  const Binner &binner_;
};

} // namespace degree_hours

#endif // AGGREGATOR_HPP
