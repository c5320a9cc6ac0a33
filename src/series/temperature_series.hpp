#ifndef TEMPERATURE_SERIES_HPP
#define TEMPERATURE_SERIES_HPP

#include "series/hourly_record.hpp"

#include <cstddef>
#include <vector>

namespace degree_hours {

/**
 * One site's hourly observations for one year.
 * Immutable once constructed; the constructor rejects any series that is not
 * a complete year of valid (month, day, hour) records.
 */
class TemperatureSeries {
public:
  static constexpr size_t HOURS_PER_YEAR = 8760;
  static constexpr size_t HOURS_PER_LEAP_YEAR = 8784;

  /**
   * @throws InputShapeError when the record count is not 8760 or 8784, or a
   * record carries a month, day or hour outside its calendar range
   */
  TemperatureSeries(SiteMetadata site, std::vector<HourlyRecord> records);

  size_t size() const { return records_.size(); }
  const SiteMetadata &site() const { return site_; }
  const std::vector<HourlyRecord> &records() const { return records_; }
  const HourlyRecord &at(size_t index) const { return records_.at(index); }

  // Air temperature per hour, quiet NaN where the record has none
  const std::vector<double> &temperatures() const { return temperatures_; }

  size_t missing_temperature_count() const { return missing_count_; }

private:
  SiteMetadata site_;
  std::vector<HourlyRecord> records_;
  std::vector<double> temperatures_;
  size_t missing_count_ = 0;

  void validate_shape() const;
};

} // namespace degree_hours

#endif // TEMPERATURE_SERIES_HPP
