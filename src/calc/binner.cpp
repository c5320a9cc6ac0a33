#include "calc/binner.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cmath>

namespace degree_hours {

namespace {
// Boundaries are snapped to this grid so that min + k * width lands on the
// decimal value a person would write (12.8, not 12.799999999999997)
constexpr double BOUNDARY_RESOLUTION = 1e9;
constexpr double STEP_TOLERANCE = 1e-9;

double snap(double value) {
  return std::round(value * BOUNDARY_RESOLUTION) / BOUNDARY_RESOLUTION;
}
} // namespace

std::string TemperatureBin::label() const {
  return "(" + Utils::format_decimal(lower) + ", " +
         Utils::format_decimal(upper) + "]";
}

Binner::Binner(TemperatureRange range, double bin_width) {
  if (!(bin_width > 0.0) || !std::isfinite(bin_width))
    throw ConfigError("bin width must be greater than 0");
  if (!(range.min < range.max))
    throw ConfigError("temperature range min must be less than max");
  if (range.min <= LOW_SENTINEL || range.max >= HIGH_SENTINEL)
    throw ConfigError("temperature range must lie strictly between the "
                      "overflow sentinels");

  const size_t steps = static_cast<size_t>(
      std::floor((range.max - range.min) / bin_width + STEP_TOLERANCE));

  boundaries_.reserve(steps + 3);
  boundaries_.push_back(LOW_SENTINEL);
  for (size_t k = 0; k <= steps; ++k)
    boundaries_.push_back(
        snap(range.min + static_cast<double>(k) * bin_width));
  boundaries_.push_back(HIGH_SENTINEL);

  LOG(LogLevel::DEBUG, LogComponent::BINNING,
      "Built " << bin_count() << " bins over [" << range.min << ", "
               << range.max << "] with width " << bin_width);
}

TemperatureBin Binner::bin(size_t index) const {
  TemperatureBin result;
  result.index = index;
  result.lower = boundaries_.at(index);
  result.upper = boundaries_.at(index + 1);
  result.is_overflow = index == 0 || index + 1 == bin_count();
  return result;
}

std::optional<size_t> Binner::assign(double temperature_c) const {
  if (std::isnan(temperature_c))
    return std::nullopt;

  // First upper edge >= t; values past either sentinel clamp to the end bins
  auto upper_edges_begin = boundaries_.begin() + 1;
  auto it = std::lower_bound(upper_edges_begin, boundaries_.end(),
                             temperature_c);
  if (it == boundaries_.end())
    return bin_count() - 1;
  return static_cast<size_t>(it - upper_edges_begin);
}

} // namespace degree_hours
