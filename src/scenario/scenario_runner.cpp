#include "scenario/scenario_runner.hpp"
#include "calc/degree_hour_calculator.hpp"
#include "calc/season_classifier.hpp"
#include "core/logger.hpp"
#include "series/block_averager.hpp"
#include "series/calendar.hpp"

#include <utility>

namespace degree_hours {

namespace {
ScenarioConfig validated(ScenarioConfig config) {
  ensure_valid(config);
  return config;
}
} // namespace

ScenarioRunner::ScenarioRunner(ScenarioConfig config)
    : config_(validated(std::move(config))),
      binner_(config_.temperature_range, config_.bin_width),
      gate_(make_gate_evaluator(config_)) {}

DerivedSeries ScenarioRunner::derive(const TemperatureSeries &series) const {
  const auto &temperatures = series.temperatures();
  DerivedSeries derived;

  derived.daily_mean_temp =
      BlockAverager(calendar::HOURS_PER_DAY).per_index_means(temperatures);
  derived.weekly_mean_temp =
      BlockAverager(calendar::HOURS_PER_WEEK).per_index_means(temperatures);

  derived.degree_hour =
      DegreeHourCalculator(config_.degree_type, config_.daily_threshold)
          .compute(temperatures);

  gate_->evaluate(derived);
  apply_gate(derived);

  derived.season.reserve(series.size());
  derived.bin.reserve(series.size());
  for (size_t i = 0; i < series.size(); ++i) {
    const auto &record = series.at(i);
    derived.season.push_back(
        SeasonClassifier::classify(record.month, record.day));
    derived.bin.push_back(binner_.assign(temperatures[i]));
  }
  LOG(LogLevel::TRACE, LogComponent::SEASON,
      "Classified " << derived.season.size() << " hours by season");

  return derived;
}

std::vector<DataQualityWarning>
ScenarioRunner::collect_warnings(const TemperatureSeries &series,
                                 const DerivedSeries &derived) const {
  std::vector<DataQualityWarning> warnings;
  if (series.missing_temperature_count() == 0)
    return warnings;

  warnings.reserve(series.missing_temperature_count());
  for (size_t i = 0; i < series.size(); ++i) {
    const auto &record = series.at(i);
    if (record.has_temperature())
      continue;

    DataQualityWarning warning;
    warning.record_index = i;
    warning.month = record.month;
    warning.day = record.day;
    warning.hour = record.hour;
    warning.in_kept_period = derived.keep[i] != 0;
    warning.reason = warning.in_kept_period
                         ? "missing air temperature inside a gated-on period"
                         : "missing air temperature";
    warnings.push_back(std::move(warning));
  }
  return warnings;
}

ScenarioResult ScenarioRunner::run(const TemperatureSeries &series) const {
  LOG(LogLevel::DEBUG, LogComponent::SCENARIO,
      "Running scenario " << config_.name << " (" << gate_->name()
                          << " gate) for " << series.site().display_name());

  DerivedSeries derived = derive(series);

  ScenarioResult result;
  result.scenario_name = config_.name;
  result.site = series.site();
  result.rows = Aggregator(binner_).aggregate(series, derived);
  result.warnings = collect_warnings(series, derived);
  return result;
}

} // namespace degree_hours
