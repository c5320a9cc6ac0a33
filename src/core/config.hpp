#ifndef CONFIG_HPP
#define CONFIG_HPP

#include "scenario/scenario_config.hpp"

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";

// Runner Settings
constexpr const char *RUNNER_WORKER_COUNT = "worker_count";
constexpr const char *RUNNER_SCENARIOS = "scenarios";
constexpr const char *RUNNER_FAIL_FAST = "fail_fast";

// Scenario Settings
constexpr const char *SC_DEGREE_TYPE = "degree_type";
constexpr const char *SC_DAILY_THRESHOLD = "daily_threshold";
constexpr const char *SC_WEEKLY_THRESHOLD = "weekly_threshold";
constexpr const char *SC_RANGE_MIN = "range_min";
constexpr const char *SC_RANGE_MAX = "range_max";
constexpr const char *SC_BIN_WIDTH = "bin_width";
constexpr const char *SC_GATE = "gate";
constexpr const char *SC_DAILY_GATE = "daily_gate";
constexpr const char *SC_WEEKLY_GATE = "weekly_gate";
constexpr const char *SC_CDD_BASE_TEMPERATURE = "cdd_base_temperature";
constexpr const char *SC_CDD_TRIGGER = "cdd_trigger";
constexpr const char *SC_CDD_WINDOW_DAYS = "cdd_window_days";
} // namespace Keys

namespace Sections {
constexpr const char *LOGGING = "Logging";
constexpr const char *RUNNER = "Runner";
constexpr const char *SCENARIO_PREFIX = "Scenario:";
} // namespace Sections

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;

  // WARN everywhere except CORE and BATCH, which log at INFO
  static LoggingConfig defaults();
};

struct RunnerConfig {
  uint32_t worker_count = 0; // 0 = one per hardware thread
  std::vector<std::string> scenarios; // empty = every configured scenario
  bool fail_fast = false;
};

struct AppConfig {
  LoggingConfig logging = LoggingConfig::defaults();
  RunnerConfig runner;

  // Presets first, then any [Scenario:<name>] section adds or overrides
  std::map<std::string, degree_hours::ScenarioConfig> scenarios =
      degree_hours::predefined_scenarios();

  AppConfig() = default;

  // @throws degree_hours::ConfigError for an unknown name
  const degree_hours::ScenarioConfig &
  find_scenario(const std::string &name) const;

  // Runner selection, or every scenario in name order when none is selected
  std::vector<std::string> selected_scenarios() const;
};

LogLevel string_to_log_level(const std::string &level_str_raw);

// Validation functions for configuration parameters
bool validate_runner_config(const RunnerConfig &config,
                            const AppConfig &app_config,
                            std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Parses an INI file into config; errors collects every malformed entry.
// Returns false only when the file cannot be opened.
bool parse_config_into(const std::string &filepath, AppConfig &config,
                       std::vector<std::string> &errors);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
