#include "scenario/scenario_config.hpp"
#include "core/errors.hpp"
#include "utils/utils.hpp"

#include <cmath>
#include <sstream>
#include <utility>

namespace degree_hours {

namespace {
// Must stay strictly inside the overflow sentinels used by the binner
constexpr double RANGE_LIMIT_C = 100.0;
constexpr double MAX_INTERIOR_BINS = 10000.0;

std::map<std::string, ScenarioConfig> build_predefined_scenarios() {
  std::map<std::string, ScenarioConfig> scenarios;

  auto add = [&scenarios](std::string name, DegreeType type,
                          double daily_threshold, double weekly_threshold,
                          TemperatureRange range, bool daily, bool weekly) {
    ScenarioConfig config;
    config.name = name;
    config.degree_type = type;
    config.daily_threshold = daily_threshold;
    config.temperature_range = range;
    config.bin_width = 2.8;
    config.gate = SimpleGate{daily, weekly, weekly_threshold};
    scenarios.emplace(std::move(name), std::move(config));
  };

  add("hdh_sc1", DegreeType::HEATING, 18.3, 18.3, {-29.2, 12.8}, true, false);
  add("hdh_sc2", DegreeType::HEATING, 14.9, 18.3, {-29.2, 12.8}, true, false);
  add("hdh_sc3", DegreeType::HEATING, 14.9, 17.1, {-29.2, 12.8}, true, true);
  add("cdh_sc1", DegreeType::COOLING, 18.3, 18.3, {-29.2, 12.8}, true, false);
  add("cdh_sc2", DegreeType::COOLING, 22.8, 18.3, {-29.2, 12.8}, true, false);
  add("cdh_sc3", DegreeType::COOLING, 22.8, 19.5, {23.6, 43.2}, true, true);

  return scenarios;
}
} // namespace

const char *degree_type_to_string(DegreeType type) {
  switch (type) {
  case DegreeType::HEATING:
    return "heating";
  case DegreeType::COOLING:
    return "cooling";
  }
  return "unknown";
}

std::optional<DegreeType> degree_type_from_string(const std::string &value) {
  std::string lowered = Utils::to_lower_copy(Utils::trim_copy(value));
  if (lowered == "heating")
    return DegreeType::HEATING;
  if (lowered == "cooling")
    return DegreeType::COOLING;
  return std::nullopt;
}

bool validate_scenario_config(const ScenarioConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;
  const std::string prefix =
      "Scenario '" + (config.name.empty() ? "<unnamed>" : config.name) + "': ";

  if (config.name.empty()) {
    errors.push_back(prefix + "name must not be empty");
    valid = false;
  }

  if (!std::isfinite(config.daily_threshold)) {
    errors.push_back(prefix + "daily threshold must be a finite number");
    valid = false;
  }

  if (!std::isfinite(config.bin_width) || config.bin_width <= 0.0) {
    errors.push_back(prefix + "bin width must be greater than 0");
    valid = false;
  }

  const auto &range = config.temperature_range;
  if (!std::isfinite(range.min) || !std::isfinite(range.max) ||
      range.min >= range.max) {
    errors.push_back(prefix + "temperature range min must be less than max");
    valid = false;
  } else if (range.min <= -RANGE_LIMIT_C || range.max >= RANGE_LIMIT_C) {
    errors.push_back(prefix +
                     "temperature range must lie strictly between -100 and "
                     "100 C");
    valid = false;
  } else if (config.bin_width > 0.0 &&
             (range.max - range.min) / config.bin_width > MAX_INTERIOR_BINS) {
    errors.push_back(prefix + "bin width is too small for the range");
    valid = false;
  }

  if (const auto *simple = std::get_if<SimpleGate>(&config.gate)) {
    if (!simple->daily_enabled && !simple->weekly_enabled) {
      errors.push_back(prefix +
                       "simple gate requires a daily or weekly condition");
      valid = false;
    }
    if (simple->weekly_enabled && !std::isfinite(simple->weekly_threshold)) {
      errors.push_back(prefix + "weekly threshold must be a finite number");
      valid = false;
    }
  } else if (const auto *cdd = std::get_if<CddGate>(&config.gate)) {
    if (config.degree_type != DegreeType::COOLING) {
      errors.push_back(prefix +
                       "cooling-degree-day gate requires a cooling scenario");
      valid = false;
    }
    if (!cdd->trigger.has_value() || !std::isfinite(*cdd->trigger)) {
      errors.push_back(prefix + "cooling-degree-day gate requires a trigger");
      valid = false;
    }
    if (!std::isfinite(cdd->base_temperature)) {
      errors.push_back(prefix +
                       "cooling-degree-day base temperature must be finite");
      valid = false;
    }
    if (cdd->window_days == 0) {
      errors.push_back(prefix +
                       "cooling-degree-day window must be at least 1 day");
      valid = false;
    }
  }

  return valid;
}

void ensure_valid(const ScenarioConfig &config) {
  std::vector<std::string> errors;
  if (validate_scenario_config(config, errors))
    return;

  std::ostringstream oss;
  for (size_t i = 0; i < errors.size(); ++i) {
    if (i > 0)
      oss << "; ";
    oss << errors[i];
  }
  throw ConfigError(oss.str());
}

const std::map<std::string, ScenarioConfig> &predefined_scenarios() {
  static const std::map<std::string, ScenarioConfig> scenarios =
      build_predefined_scenarios();
  return scenarios;
}

const ScenarioConfig &predefined_scenario(const std::string &name) {
  const auto &scenarios = predefined_scenarios();
  auto it = scenarios.find(name);
  if (it == scenarios.end())
    throw ConfigError("unknown scenario '" + name + "'");
  return it->second;
}

ScenarioConfig make_cdd_scenario(std::string name, double daily_threshold,
                                 double cdd_trigger, TemperatureRange range,
                                 double bin_width,
                                 double cdd_base_temperature) {
  ScenarioConfig config;
  config.name = std::move(name);
  config.degree_type = DegreeType::COOLING;
  config.daily_threshold = daily_threshold;
  config.temperature_range = range;
  config.bin_width = bin_width;

  CddGate gate;
  gate.base_temperature = cdd_base_temperature;
  gate.trigger = cdd_trigger;
  config.gate = gate;
  return config;
}

} // namespace degree_hours
