#include "series/hourly_record.hpp"

#include <cmath>
#include <string>

namespace degree_hours {

bool HourlyRecord::has_temperature() const {
  return air_temperature_c.has_value() && std::isfinite(*air_temperature_c);
}

std::string SiteMetadata::display_name() const {
  if (city.empty() && state_province.empty())
    return location.empty() ? "<unnamed site>" : location;
  if (state_province.empty())
    return city;
  return city + ", " + state_province;
}

} // namespace degree_hours
