#include "calc/degree_hour_calculator.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>

namespace degree_hours {

double DegreeHourCalculator::degree_hour(double temperature_c) const {
  if (std::isnan(temperature_c))
    return 0.0;

  double difference = type_ == DegreeType::HEATING
                          ? threshold_ - temperature_c
                          : temperature_c - threshold_;
  return std::max(difference / HOURS_PER_DAY, 0.0);
}

std::vector<double>
DegreeHourCalculator::compute(const std::vector<double> &temperatures) const {
  std::vector<double> result;
  result.reserve(temperatures.size());
  for (double temperature : temperatures)
    result.push_back(degree_hour(temperature));

  LOG(LogLevel::TRACE, LogComponent::DEGREE_HOUR,
      "Computed " << result.size() << " "
                  << degree_type_to_string(type_) << " degree-hours against "
                  << threshold_ << " C");
  return result;
}

} // namespace degree_hours
