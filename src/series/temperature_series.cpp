#include "series/temperature_series.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "series/calendar.hpp"

#include <limits>
#include <sstream>
#include <string>
#include <utility>

namespace degree_hours {

TemperatureSeries::TemperatureSeries(SiteMetadata site,
                                     std::vector<HourlyRecord> records)
    : site_(std::move(site)), records_(std::move(records)) {
  validate_shape();

  temperatures_.reserve(records_.size());
  for (const auto &record : records_) {
    if (record.has_temperature()) {
      temperatures_.push_back(*record.air_temperature_c);
    } else {
      temperatures_.push_back(std::numeric_limits<double>::quiet_NaN());
      missing_count_++;
    }
  }

  LOG(LogLevel::DEBUG, LogComponent::SERIES,
      "Loaded " << records_.size() << " hourly records for "
                << site_.display_name() << " (" << missing_count_
                << " missing temperatures)");
}

void TemperatureSeries::validate_shape() const {
  if (records_.size() != HOURS_PER_YEAR &&
      records_.size() != HOURS_PER_LEAP_YEAR) {
    std::ostringstream oss;
    oss << "expected " << HOURS_PER_YEAR << " or " << HOURS_PER_LEAP_YEAR
        << " hourly records for " << site_.display_name() << ", found "
        << records_.size();
    throw InputShapeError(oss.str());
  }

  for (size_t i = 0; i < records_.size(); ++i) {
    const auto &record = records_[i];
    if (!calendar::is_valid_date(record.month, record.day)) {
      std::ostringstream oss;
      oss << "record " << i << " has invalid date month=" << record.month
          << " day=" << record.day;
      throw InputShapeError(oss.str());
    }
    if (record.hour < 0 || record.hour > 23) {
      std::ostringstream oss;
      oss << "record " << i << " has hour " << record.hour
          << " outside 0-23";
      throw InputShapeError(oss.str());
    }
  }
}

} // namespace degree_hours
