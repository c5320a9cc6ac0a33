#ifndef GATE_EVALUATOR_HPP
#define GATE_EVALUATOR_HPP

#include "calc/derived_series.hpp"
#include "scenario/scenario_config.hpp"

#include <cstddef>
#include <memory>
#include <vector>

namespace degree_hours {

class IGateEvaluator {
public:
  virtual ~IGateEvaluator() = default;

  // Fills derived.keep with one flag per hour, reading the block means
  // already present in derived
  virtual void evaluate(DerivedSeries &derived) const = 0;

  virtual const char *name() const = 0;
};

// Zeroes degree_hour wherever keep is 0
void apply_gate(DerivedSeries &derived);

// Picks the evaluator matching the scenario's gate rule
std::unique_ptr<IGateEvaluator> make_gate_evaluator(const ScenarioConfig &config);

/**
 * Per-hour gate on the daily and weekly block means.
 * An hour is zeroed only when every enabled condition fails; with no
 * condition enabled every hour is kept.
 */
class SimpleGateEvaluator : public IGateEvaluator {
public:
  SimpleGateEvaluator(DegreeType type, double daily_threshold, SimpleGate gate);

  void evaluate(DerivedSeries &derived) const override;
  const char *name() const override { return "simple"; }

  bool keep_hour(double daily_mean, double weekly_mean) const;

private:
  DegreeType type_;
  double daily_threshold_;
  SimpleGate gate_;

  // Cooling favors means above the threshold, heating below; NaN never passes
  bool favorable(double mean, double threshold) const;
};

/**
 * Whole-day gate for cooling scenarios: all hours of day d are kept iff
 * daily_mean[d] > daily_threshold or cdd_week[d] > trigger.
 */
class CddGateEvaluator : public IGateEvaluator {
public:
  // @throws ConfigError when the gate has no trigger or a zero window
  CddGateEvaluator(double daily_threshold, CddGate gate);

  void evaluate(DerivedSeries &derived) const override;
  const char *name() const override { return "cdd"; }

  bool keep_day(double daily_mean, double cdd_week) const;

  // max(mean - base, 0) per day; a day with no temperature counts as 0
  static std::vector<double> cdd_daily(const std::vector<double> &daily_means,
                                       double base_temperature);

  // Mean of values[max(0, d - window + 1) .. d], dividing by the days present
  static std::vector<double> trailing_mean(const std::vector<double> &values,
                                           size_t window);

private:
  double daily_threshold_;
  double base_temperature_;
  double trigger_;
  size_t window_days_;
};

} // namespace degree_hours

#endif // GATE_EVALUATOR_HPP
