#ifndef SCENARIO_CONFIG_HPP
#define SCENARIO_CONFIG_HPP

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace degree_hours {

enum class DegreeType { HEATING, COOLING };

const char *degree_type_to_string(DegreeType type);
std::optional<DegreeType> degree_type_from_string(const std::string &value);

namespace Defaults {
constexpr double CDD_BASE_TEMPERATURE_C = 19.44;
constexpr size_t CDD_WINDOW_DAYS = 7;
} // namespace Defaults

struct TemperatureRange {
  double min = 0.0;
  double max = 0.0;
};

// Daily and/or weekly block-mean thresholds, evaluated per hour
struct SimpleGate {
  bool daily_enabled = true;
  bool weekly_enabled = false;
  double weekly_threshold = 18.3;
};

// Daily block mean OR trailing cooling-degree-day mean, evaluated per day
struct CddGate {
  double base_temperature = Defaults::CDD_BASE_TEMPERATURE_C;
  std::optional<double> trigger;
  size_t window_days = Defaults::CDD_WINDOW_DAYS;
};

using GateRule = std::variant<SimpleGate, CddGate>;

struct ScenarioConfig {
  std::string name;
  DegreeType degree_type = DegreeType::HEATING;
  double daily_threshold = 18.3;
  TemperatureRange temperature_range{-29.2, 12.8};
  double bin_width = 2.8;
  GateRule gate = SimpleGate{};

  bool uses_cdd_gate() const { return std::holds_alternative<CddGate>(gate); }
};

// Collects every problem with the scenario into errors; true when valid
bool validate_scenario_config(const ScenarioConfig &config,
                              std::vector<std::string> &errors);

// @throws ConfigError listing every validation failure
void ensure_valid(const ScenarioConfig &config);

// The six design cases: hdh_sc1..3 and cdh_sc1..3
const std::map<std::string, ScenarioConfig> &predefined_scenarios();

// @throws ConfigError for an unknown name
const ScenarioConfig &predefined_scenario(const std::string &name);

// Caller-supplied cooling scenario gated on daily mean OR weekly CDD mean
ScenarioConfig make_cdd_scenario(
    std::string name, double daily_threshold, double cdd_trigger,
    TemperatureRange range, double bin_width,
    double cdd_base_temperature = Defaults::CDD_BASE_TEMPERATURE_C);

} // namespace degree_hours

#endif // SCENARIO_CONFIG_HPP
