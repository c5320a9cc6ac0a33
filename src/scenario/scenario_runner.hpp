#ifndef SCENARIO_RUNNER_HPP
#define SCENARIO_RUNNER_HPP

#include "calc/aggregator.hpp"
#include "calc/binner.hpp"
#include "calc/derived_series.hpp"
#include "calc/gate_evaluator.hpp"
#include "scenario/scenario_config.hpp"
#include "series/hourly_record.hpp"
#include "series/temperature_series.hpp"

#include <memory>
#include <string>
#include <vector>

namespace degree_hours {

struct ScenarioResult {
  std::string scenario_name;
  SiteMetadata site;
  std::vector<AggregateRow> rows;
  std::vector<DataQualityWarning> warnings;
};

/**
 * Runs the full pipeline for one scenario: block means, degree-hours, gate,
 * seasons, bins, aggregation. Stateless between runs, so one runner may be
 * shared by several threads.
 */
class ScenarioRunner {
public:
  // @throws ConfigError if the scenario does not validate
  explicit ScenarioRunner(ScenarioConfig config);

  // Every per-hour column of the run, before aggregation
  DerivedSeries derive(const TemperatureSeries &series) const;

  // Either a complete result or an exception, never a partial table
  ScenarioResult run(const TemperatureSeries &series) const;

  const ScenarioConfig &config() const { return config_; }
  const Binner &binner() const { return binner_; }

private:
  ScenarioConfig config_;
  Binner binner_;
  std::unique_ptr<IGateEvaluator> gate_;

  std::vector<DataQualityWarning>
  collect_warnings(const TemperatureSeries &series,
                   const DerivedSeries &derived) const;
};

} // namespace degree_hours

#endif // SCENARIO_RUNNER_HPP
