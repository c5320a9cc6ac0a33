#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cstddef>
#include <cstdint>
#include <fstream>
#include <initializer_list>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <utility>
#include <variant>
#include <vector>

namespace Config {

namespace {

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"series", LogComponent::SERIES},
    {"calc.average", LogComponent::AVERAGE},
    {"calc.degree_hour", LogComponent::DEGREE_HOUR},
    {"calc.gate", LogComponent::GATE},
    {"calc.season", LogComponent::SEASON},
    {"calc.binning", LogComponent::BINNING},
    {"calc.aggregate", LogComponent::AGGREGATE},
    {"run.scenario", LogComponent::SCENARIO},
    {"run.batch", LogComponent::BATCH}};

constexpr uint32_t MAX_WORKER_COUNT = 256;

struct RawEntry {
  std::string value;
  int line_num = 0;
};

// Keys of one [Scenario:<name>] section, kept until the file is fully read
// so that the gate type may appear after the gate parameters
using ScenarioSection = std::map<std::string, RawEntry>;

std::string line_prefix(int line_num) {
  return "Line " + std::to_string(line_num) + ": ";
}

std::optional<double> read_double(const ScenarioSection &section,
                                  const std::string &key,
                                  std::vector<std::string> &errors) {
  auto it = section.find(key);
  if (it == section.end())
    return std::nullopt;
  auto parsed = Utils::string_to_number<double>(it->second.value);
  if (!parsed)
    errors.push_back(line_prefix(it->second.line_num) + "'" + key +
                     "' expects a number, got '" + it->second.value + "'");
  return parsed;
}

std::optional<bool> read_bool(const ScenarioSection &section,
                              const std::string &key,
                              std::vector<std::string> &errors) {
  auto it = section.find(key);
  if (it == section.end())
    return std::nullopt;
  auto parsed = Utils::parse_bool(it->second.value);
  if (!parsed)
    errors.push_back(line_prefix(it->second.line_num) + "'" + key +
                     "' expects a boolean, got '" + it->second.value + "'");
  return parsed;
}

void reject_keys(const ScenarioSection &section,
                 std::initializer_list<const char *> keys,
                 const std::string &gate_name,
                 std::vector<std::string> &errors) {
  for (const char *key : keys) {
    auto it = section.find(key);
    if (it == section.end())
      continue;
    errors.push_back(line_prefix(it->second.line_num) + "'" + key +
                     "' does not apply to a " + gate_name + " gate");
  }
}

void apply_simple_gate(const ScenarioSection &section,
                       degree_hours::SimpleGate &gate,
                       std::vector<std::string> &errors) {
  reject_keys(section,
              {Keys::SC_CDD_BASE_TEMPERATURE, Keys::SC_CDD_TRIGGER,
               Keys::SC_CDD_WINDOW_DAYS},
              "simple", errors);

  if (auto v = read_bool(section, Keys::SC_DAILY_GATE, errors))
    gate.daily_enabled = *v;
  if (auto v = read_bool(section, Keys::SC_WEEKLY_GATE, errors))
    gate.weekly_enabled = *v;
  if (auto v = read_double(section, Keys::SC_WEEKLY_THRESHOLD, errors))
    gate.weekly_threshold = *v;
}

void apply_cdd_gate(const ScenarioSection &section,
                    degree_hours::CddGate &gate,
                    std::vector<std::string> &errors) {
  reject_keys(section,
              {Keys::SC_DAILY_GATE, Keys::SC_WEEKLY_GATE,
               Keys::SC_WEEKLY_THRESHOLD},
              "cdd", errors);

  if (auto v = read_double(section, Keys::SC_CDD_BASE_TEMPERATURE, errors))
    gate.base_temperature = *v;
  if (auto v = read_double(section, Keys::SC_CDD_TRIGGER, errors))
    gate.trigger = *v;

  auto it = section.find(Keys::SC_CDD_WINDOW_DAYS);
  if (it != section.end()) {
    auto window = Utils::string_to_number<size_t>(it->second.value);
    if (window)
      gate.window_days = *window;
    else
      errors.push_back(line_prefix(it->second.line_num) + "'" +
                       Keys::SC_CDD_WINDOW_DAYS +
                       "' expects a whole number of days, got '" +
                       it->second.value + "'");
  }
}

// Starts from the preset of the same name when there is one
degree_hours::ScenarioConfig
build_scenario(const std::string &name, const ScenarioSection &section,
               const std::map<std::string, degree_hours::ScenarioConfig> &known,
               std::vector<std::string> &errors) {
  degree_hours::ScenarioConfig scenario;
  auto base = known.find(name);
  if (base != known.end())
    scenario = base->second;
  scenario.name = name;

  static const std::vector<std::string> accepted_keys = {
      Keys::SC_DEGREE_TYPE,          Keys::SC_DAILY_THRESHOLD,
      Keys::SC_WEEKLY_THRESHOLD,     Keys::SC_RANGE_MIN,
      Keys::SC_RANGE_MAX,            Keys::SC_BIN_WIDTH,
      Keys::SC_GATE,                 Keys::SC_DAILY_GATE,
      Keys::SC_WEEKLY_GATE,          Keys::SC_CDD_BASE_TEMPERATURE,
      Keys::SC_CDD_TRIGGER,          Keys::SC_CDD_WINDOW_DAYS};
  for (const auto &[key, entry] : section) {
    if (std::find(accepted_keys.begin(), accepted_keys.end(), key) ==
        accepted_keys.end())
      errors.push_back(line_prefix(entry.line_num) + "Unknown key '" + key +
                       "' in scenario '" + name + "'");
  }

  auto type_it = section.find(Keys::SC_DEGREE_TYPE);
  if (type_it != section.end()) {
    auto type = degree_hours::degree_type_from_string(type_it->second.value);
    if (type)
      scenario.degree_type = *type;
    else
      errors.push_back(line_prefix(type_it->second.line_num) +
                       "degree_type must be 'heating' or 'cooling', got '" +
                       type_it->second.value + "'");
  }

  if (auto v = read_double(section, Keys::SC_DAILY_THRESHOLD, errors))
    scenario.daily_threshold = *v;
  if (auto v = read_double(section, Keys::SC_RANGE_MIN, errors))
    scenario.temperature_range.min = *v;
  if (auto v = read_double(section, Keys::SC_RANGE_MAX, errors))
    scenario.temperature_range.max = *v;
  if (auto v = read_double(section, Keys::SC_BIN_WIDTH, errors))
    scenario.bin_width = *v;

  auto gate_it = section.find(Keys::SC_GATE);
  if (gate_it != section.end()) {
    std::string gate_kind = Utils::to_lower_copy(gate_it->second.value);
    if (gate_kind == "simple") {
      if (!std::holds_alternative<degree_hours::SimpleGate>(scenario.gate))
        scenario.gate = degree_hours::SimpleGate{};
    } else if (gate_kind == "cdd") {
      if (!std::holds_alternative<degree_hours::CddGate>(scenario.gate))
        scenario.gate = degree_hours::CddGate{};
    } else {
      errors.push_back(line_prefix(gate_it->second.line_num) +
                       "gate must be 'simple' or 'cdd', got '" +
                       gate_it->second.value + "'");
      return scenario;
    }
  }

  if (auto *simple = std::get_if<degree_hours::SimpleGate>(&scenario.gate))
    apply_simple_gate(section, *simple, errors);
  else if (auto *cdd = std::get_if<degree_hours::CddGate>(&scenario.gate))
    apply_cdd_gate(section, *cdd, errors);

  return scenario;
}

} // namespace

LoggingConfig LoggingConfig::defaults() {
  LoggingConfig config;
  // By default, everything is set to a high level (WARN)
  for (const auto &pair : key_to_component_map)
    config.log_levels[pair.second] = LogLevel::WARN;
  // Except for the outer layers, which report progress at INFO
  config.log_levels[LogComponent::CORE] = LogLevel::INFO;
  config.log_levels[LogComponent::BATCH] = LogLevel::INFO;
  return config;
}

const degree_hours::ScenarioConfig &
AppConfig::find_scenario(const std::string &name) const {
  auto it = scenarios.find(name);
  if (it == scenarios.end())
    throw degree_hours::ConfigError("Unknown scenario '" + name + "'");
  return it->second;
}

std::vector<std::string> AppConfig::selected_scenarios() const {
  if (!runner.scenarios.empty())
    return runner.scenarios;

  std::vector<std::string> names;
  names.reserve(scenarios.size());
  for (const auto &pair : scenarios)
    names.push_back(pair.first);
  return names;
}

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::to_upper_copy(Utils::trim_copy(level_str_raw));
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

bool validate_runner_config(const RunnerConfig &config,
                            const AppConfig &app_config,
                            std::vector<std::string> &errors) {
  bool valid = true;

  if (config.worker_count > MAX_WORKER_COUNT) {
    errors.push_back("Runner worker count must be between 0 and " +
                     std::to_string(MAX_WORKER_COUNT));
    valid = false;
  }

  for (const auto &name : config.scenarios) {
    if (app_config.scenarios.count(name) == 0) {
      errors.push_back("Runner selects unknown scenario '" + name + "'");
      valid = false;
    }
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = validate_runner_config(config.runner, config, errors);

  if (config.scenarios.empty()) {
    errors.push_back("At least one scenario must be configured");
    valid = false;
  }

  for (const auto &entry : config.scenarios) {
    if (!degree_hours::validate_scenario_config(entry.second, errors))
      valid = false;
  }

  return valid;
}

bool parse_config_into(const std::string &filepath, AppConfig &config,
                       std::vector<std::string> &errors) {
  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;
  std::vector<std::pair<std::string, ScenarioSection>> scenario_sections;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));

      const std::string prefix = Sections::SCENARIO_PREFIX;
      if (current_section.rfind(prefix, 0) == 0) {
        std::string name =
            Utils::trim_copy(current_section.substr(prefix.length()));
        if (name.empty())
          errors.push_back(line_prefix(line_num) +
                           "Scenario section without a name");
        scenario_sections.emplace_back(std::move(name), ScenarioSection{});
      } else if (current_section != Sections::LOGGING &&
                 current_section != Sections::RUNNER) {
        std::cerr << "Warning (Config Line " << line_num
                  << "): Ignoring unknown section [" << current_section << "]"
                  << std::endl;
      }
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      errors.push_back(line_prefix(line_num) +
                       "Invalid format (missing '='): " + trimmed_line);
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      errors.push_back(line_prefix(line_num) + "Empty key found");
      continue;
    }

    if (current_section == Sections::LOGGING) {
      if (key == Keys::LOGGING_DEFAULT_LEVEL) {
        LogLevel default_level = string_to_log_level(value);
        for (auto &pair : config.logging.log_levels)
          pair.second = default_level;
      } else {
        auto comp_it = key_to_component_map.find(key);
        if (comp_it != key_to_component_map.end())
          config.logging.log_levels[comp_it->second] =
              string_to_log_level(value);
        else if (key.length() > 2 && key.substr(key.length() - 2) == ".*") {
          // Wildcard match, e.g., "calc.* = DEBUG"
          std::string prefix = key.substr(0, key.length() - 1);
          for (const auto &pair : key_to_component_map) {
            if (pair.first.rfind(prefix, 0) == 0)
              config.logging.log_levels[pair.second] =
                  string_to_log_level(value);
          }
        } else {
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown logging component '" << key << "'"
                    << std::endl;
        }
      }

    } else if (current_section == Sections::RUNNER) {
      if (key == Keys::RUNNER_WORKER_COUNT) {
        auto count = Utils::string_to_number<uint32_t>(value);
        if (count)
          config.runner.worker_count = *count;
        else
          errors.push_back(line_prefix(line_num) +
                           "worker_count expects a non-negative integer, got '" +
                           value + "'");
      } else if (key == Keys::RUNNER_SCENARIOS) {
        config.runner.scenarios.clear();
        for (const auto &name : Utils::split_string(value, ',')) {
          std::string trimmed = Utils::trim_copy(name);
          if (!trimmed.empty())
            config.runner.scenarios.push_back(trimmed);
        }
      } else if (key == Keys::RUNNER_FAIL_FAST) {
        auto flag = Utils::parse_bool(value);
        if (flag)
          config.runner.fail_fast = *flag;
        else
          errors.push_back(line_prefix(line_num) +
                           "fail_fast expects a boolean, got '" + value + "'");
      } else {
        errors.push_back(line_prefix(line_num) + "Unknown key '" + key +
                         "' in [Runner]");
      }

    } else if (!scenario_sections.empty() &&
               current_section.rfind(Sections::SCENARIO_PREFIX, 0) == 0) {
      auto &section = scenario_sections.back().second;
      if (section.count(key) != 0)
        errors.push_back(line_prefix(line_num) + "Duplicate key '" + key +
                         "' in scenario '" + scenario_sections.back().first +
                         "'");
      section[key] = RawEntry{value, line_num};

    } else if (current_section.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Key '" << key
                << "' outside of any section is ignored" << std::endl;
    }
  }

  for (const auto &[name, section] : scenario_sections) {
    if (name.empty())
      continue;
    config.scenarios[name] =
        build_scenario(name, section, config.scenarios, errors);
  }

  std::cout << "Configuration read from " << filepath << std::endl;
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  std::vector<std::string> errors;
  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config, errors)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Malformed entries and invalid values are reported together
  bool valid = validate_app_config(*new_config, errors);
  if (!valid || !errors.empty()) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
