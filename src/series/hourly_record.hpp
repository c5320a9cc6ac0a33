#ifndef HOURLY_RECORD_HPP
#define HOURLY_RECORD_HPP

#include <cstddef>
#include <optional>
#include <string>

namespace degree_hours {

struct HourlyRecord {
  int month = 0;
  int day = 0;
  int hour = 0; // 0-23, already shifted from the weather file's 1-24
  std::optional<double> air_temperature_c;

  HourlyRecord() = default;
  HourlyRecord(int month, int day, int hour,
               std::optional<double> air_temperature_c)
      : month(month), day(day), hour(hour),
        air_temperature_c(air_temperature_c) {}

  bool has_temperature() const;
};

// Station header fields, carried through to the output rows untouched
struct SiteMetadata {
  std::string location;
  std::string city;
  std::string state_province;
  std::string country;
  std::string data_type;
  std::string wmo_code;
  double latitude = 0.0;
  double longitude = 0.0;
  double time_zone = 0.0;
  double elevation_m = 0.0;

  std::string display_name() const;
};

// Non-fatal diagnostic for a single hour, never thrown
struct DataQualityWarning {
  size_t record_index = 0;
  int month = 0;
  int day = 0;
  int hour = 0;
  bool in_kept_period = false; // the hour's day/hour passed its gate
  std::string reason;
};

} // namespace degree_hours

#endif // HOURLY_RECORD_HPP
