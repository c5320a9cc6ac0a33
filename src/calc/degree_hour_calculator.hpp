#ifndef DEGREE_HOUR_CALCULATOR_HPP
#define DEGREE_HOUR_CALCULATOR_HPP

#include "scenario/scenario_config.hpp"

#include <vector>

namespace degree_hours {

class DegreeHourCalculator {
public:
  static constexpr double HOURS_PER_DAY = 24.0;

  DegreeHourCalculator(DegreeType type, double threshold)
      : type_(type), threshold_(threshold) {}

  // Heating: max((threshold - t) / 24, 0); cooling: max((t - threshold) / 24, 0).
  // A NaN temperature yields 0.
  double degree_hour(double temperature_c) const;

  std::vector<double> compute(const std::vector<double> &temperatures) const;

private:
  DegreeType type_;
  double threshold_;
};

} // namespace degree_hours

#endif // DEGREE_HOUR_CALCULATOR_HPP
