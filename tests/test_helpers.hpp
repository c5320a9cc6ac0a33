#ifndef TEST_HELPERS_HPP
#define TEST_HELPERS_HPP

#include "series/hourly_record.hpp"
#include "series/temperature_series.hpp"

#include <cstddef>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace test_support {

using TemperatureFn =
    std::function<std::optional<double>(int month, int day, int hour,
                                         size_t index)>;

inline int days_in_month(int month, bool leap) {
  static const int days[] = {31, 28, 31, 30, 31, 30, 31, 31, 30, 31, 30, 31};
  return (month == 2 && leap) ? 29 : days[month - 1];
}

// Jan 1 00:00 through Dec 31 23:00, 8760 records (8784 when leap)
inline std::vector<degree_hours::HourlyRecord>
make_year_records(const TemperatureFn &temperature, bool leap = false) {
  std::vector<degree_hours::HourlyRecord> records;
  records.reserve(leap ? 8784 : 8760);
  for (int month = 1; month <= 12; ++month) {
    for (int day = 1; day <= days_in_month(month, leap); ++day) {
      for (int hour = 0; hour < 24; ++hour)
        records.emplace_back(month, day, hour,
                             temperature(month, day, hour, records.size()));
    }
  }
  return records;
}

inline degree_hours::SiteMetadata make_site(const std::string &city,
                                            const std::string &state = "ON") {
  degree_hours::SiteMetadata site;
  site.location = city;
  site.city = city;
  site.state_province = state;
  site.country = "CAN";
  site.data_type = "CWEC";
  site.wmo_code = "716240";
  site.latitude = 43.67;
  site.longitude = -79.63;
  site.time_zone = -5.0;
  site.elevation_m = 173.4;
  return site;
}

inline degree_hours::TemperatureSeries
make_constant_series(double temperature_c, const std::string &city = "Toronto",
                     bool leap = false) {
  return degree_hours::TemperatureSeries(
      make_site(city),
      make_year_records([temperature_c](int, int, int, size_t) {
        return std::optional<double>(temperature_c);
      },
                        leap));
}

} // namespace test_support

#endif // TEST_HELPERS_HPP
