#ifndef BINNER_HPP
#define BINNER_HPP

#include "scenario/scenario_config.hpp"

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace degree_hours {

// Half-open temperature interval (lower, upper]
struct TemperatureBin {
  size_t index = 0;
  double lower = 0.0;
  double upper = 0.0;
  bool is_overflow = false;

  // Interval notation, e.g. "(-29.2, -26.4]"
  std::string label() const;
};

/**
 * Maps temperatures onto the scenario's bins.
 * Boundaries are the low sentinel, then range.min, range.min + w, ... up to
 * range.max, then the high sentinel. The first and last bins also absorb any
 * value beyond the sentinels, so every finite temperature has exactly one bin.
 */
class Binner {
public:
  static constexpr double LOW_SENTINEL = -100.0;
  static constexpr double HIGH_SENTINEL = 100.0;

  // @throws ConfigError for a non-positive width or an empty range
  Binner(TemperatureRange range, double bin_width);

  const std::vector<double> &boundaries() const { return boundaries_; }
  size_t bin_count() const { return boundaries_.size() - 1; }
  TemperatureBin bin(size_t index) const;

  // std::nullopt for NaN
  std::optional<size_t> assign(double temperature_c) const;

private:
  std::vector<double> boundaries_;
};

} // namespace degree_hours

#endif // BINNER_HPP
