#include "calc/gate_evaluator.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "series/calendar.hpp"

#include <algorithm>
#include <cmath>
#include <type_traits>
#include <variant>

namespace degree_hours {

void apply_gate(DerivedSeries &derived) {
  size_t zeroed = 0;
  for (size_t i = 0; i < derived.size(); ++i) {
    if (derived.keep[i])
      continue;
    if (derived.degree_hour[i] > 0.0)
      zeroed++;
    derived.degree_hour[i] = 0.0;
  }
  LOG(LogLevel::TRACE, LogComponent::GATE,
      "Gate zeroed " << zeroed << " non-zero hours of " << derived.size());
}

std::unique_ptr<IGateEvaluator>
make_gate_evaluator(const ScenarioConfig &config) {
  return std::visit(
      [&config](const auto &rule) -> std::unique_ptr<IGateEvaluator> {
        using Rule = std::decay_t<decltype(rule)>;
        if constexpr (std::is_same_v<Rule, SimpleGate>)
          return std::make_unique<SimpleGateEvaluator>(
              config.degree_type, config.daily_threshold, rule);
        else
          return std::make_unique<CddGateEvaluator>(config.daily_threshold,
                                                    rule);
      },
      config.gate);
}

// --- SimpleGateEvaluator ---

SimpleGateEvaluator::SimpleGateEvaluator(DegreeType type,
                                         double daily_threshold,
                                         SimpleGate gate)
    : type_(type), daily_threshold_(daily_threshold), gate_(gate) {
  if (!gate_.daily_enabled && !gate_.weekly_enabled)
    throw ConfigError("simple gate requires a daily or weekly condition");
}

bool SimpleGateEvaluator::favorable(double mean, double threshold) const {
  return type_ == DegreeType::COOLING ? mean > threshold : mean < threshold;
}

bool SimpleGateEvaluator::keep_hour(double daily_mean,
                                    double weekly_mean) const {
  // The daily condition always takes part; weekly only adds to it
  bool daily_pass = favorable(daily_mean, daily_threshold_);
  bool weekly_pass =
      gate_.weekly_enabled && favorable(weekly_mean, gate_.weekly_threshold);
  return daily_pass || weekly_pass;
}

void SimpleGateEvaluator::evaluate(DerivedSeries &derived) const {
  derived.keep.assign(derived.size(), 0);
  for (size_t i = 0; i < derived.size(); ++i)
    derived.keep[i] =
        keep_hour(derived.daily_mean_temp[i], derived.weekly_mean_temp[i]) ? 1
                                                                           : 0;
}

// --- CddGateEvaluator ---

CddGateEvaluator::CddGateEvaluator(double daily_threshold, CddGate gate)
    : daily_threshold_(daily_threshold),
      base_temperature_(gate.base_temperature),
      trigger_(gate.trigger.value_or(0.0)), window_days_(gate.window_days) {
  if (!gate.trigger.has_value())
    throw ConfigError("cooling-degree-day gate requires a trigger");
  if (window_days_ == 0)
    throw ConfigError("cooling-degree-day window must be at least 1 day");
}

bool CddGateEvaluator::keep_day(double daily_mean, double cdd_week) const {
  return daily_mean > daily_threshold_ || cdd_week > trigger_;
}

std::vector<double>
CddGateEvaluator::cdd_daily(const std::vector<double> &daily_means,
                            double base_temperature) {
  std::vector<double> result;
  result.reserve(daily_means.size());
  for (double mean : daily_means)
    result.push_back(std::isnan(mean) ? 0.0
                                      : std::max(mean - base_temperature, 0.0));
  return result;
}

std::vector<double>
CddGateEvaluator::trailing_mean(const std::vector<double> &values,
                                size_t window) {
  std::vector<double> result(values.size(), 0.0);
  for (size_t d = 0; d < values.size(); ++d) {
    size_t first = d + 1 >= window ? d + 1 - window : 0;
    double sum = 0.0;
    for (size_t k = first; k <= d; ++k)
      sum += values[k];
    result[d] = sum / static_cast<double>(d - first + 1);
  }
  return result;
}

void CddGateEvaluator::evaluate(DerivedSeries &derived) const {
  const size_t hours = derived.size();
  const size_t days =
      (hours + calendar::HOURS_PER_DAY - 1) / calendar::HOURS_PER_DAY;

  std::vector<double> daily_means(days);
  for (size_t d = 0; d < days; ++d)
    daily_means[d] = derived.daily_mean_temp[d * calendar::HOURS_PER_DAY];

  derived.cdd_daily = cdd_daily(daily_means, base_temperature_);
  derived.cdd_week = trailing_mean(derived.cdd_daily, window_days_);

  derived.keep.assign(hours, 0);
  size_t kept_days = 0;
  for (size_t d = 0; d < days; ++d) {
    if (!keep_day(daily_means[d], derived.cdd_week[d]))
      continue;
    kept_days++;
    size_t end = std::min((d + 1) * calendar::HOURS_PER_DAY, hours);
    for (size_t i = d * calendar::HOURS_PER_DAY; i < end; ++i)
      derived.keep[i] = 1;
  }

  LOG(LogLevel::DEBUG, LogComponent::GATE,
      "Cooling-degree-day gate kept " << kept_days << " of " << days
                                      << " days");
}

} // namespace degree_hours
