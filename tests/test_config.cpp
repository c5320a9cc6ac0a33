#include <gtest/gtest.h>
#include <filesystem>
#include <fstream>
#include <memory>
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

using degree_hours::CddGate;
using degree_hours::DegreeType;
using degree_hours::SimpleGate;

class ConfigTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Create a temporary directory for test files
        test_dir = std::filesystem::temp_directory_path() / "degree_hours_config_test";
        std::filesystem::create_directories(test_dir);
    }

    void TearDown() override {
        // Clean up test files
        if (std::filesystem::exists(test_dir)) {
            std::filesystem::remove_all(test_dir);
        }
    }

    std::string createTestConfigFile(const std::string& content,
                                     const std::string& name = "test_config.ini") {
        auto config_path = test_dir / name;
        std::ofstream file(config_path);
        file << content;
        file.close();
        return config_path.string();
    }

    std::filesystem::path test_dir;
};

TEST_F(ConfigTest, DefaultsCarryEveryPreset) {
    Config::ConfigManager manager;
    auto config = manager.get_config();
    ASSERT_NE(config, nullptr);

    EXPECT_EQ(config->scenarios.size(), 6u);
    EXPECT_EQ(config->runner.worker_count, 0u);
    EXPECT_FALSE(config->runner.fail_fast);
    EXPECT_EQ(config->logging.log_levels.at(LogComponent::CORE), LogLevel::INFO);
    EXPECT_EQ(config->logging.log_levels.at(LogComponent::BATCH), LogLevel::INFO);
    EXPECT_EQ(config->logging.log_levels.at(LogComponent::GATE), LogLevel::WARN);

    // No explicit selection runs every scenario in name order
    auto selected = config->selected_scenarios();
    ASSERT_EQ(selected.size(), 6u);
    EXPECT_EQ(selected.front(), "cdh_sc1");
    EXPECT_EQ(selected.back(), "hdh_sc3");
}

TEST_F(ConfigTest, RunnerAndLoggingSections) {
    std::string config_content = R"(
# batch settings
[Runner]
worker_count = 4
scenarios = hdh_sc1, cdh_sc3
fail_fast = yes

[Logging]
default_level = ERROR
run.batch = DEBUG
calc.* = TRACE
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->runner.worker_count, 4u);
    EXPECT_TRUE(config->runner.fail_fast);
    ASSERT_EQ(config->runner.scenarios.size(), 2u);
    EXPECT_EQ(config->runner.scenarios[0], "hdh_sc1");
    EXPECT_EQ(config->runner.scenarios[1], "cdh_sc3");
    EXPECT_EQ(config->selected_scenarios(), config->runner.scenarios);

    EXPECT_EQ(config->logging.log_levels.at(LogComponent::CORE), LogLevel::ERROR);
    EXPECT_EQ(config->logging.log_levels.at(LogComponent::BATCH), LogLevel::DEBUG);
    EXPECT_EQ(config->logging.log_levels.at(LogComponent::GATE), LogLevel::TRACE);
    EXPECT_EQ(config->logging.log_levels.at(LogComponent::BINNING), LogLevel::TRACE);
    EXPECT_EQ(config->logging.log_levels.at(LogComponent::SCENARIO), LogLevel::ERROR);
}

TEST_F(ConfigTest, ScenarioSectionOverridesPreset) {
    std::string config_content = R"(
[Scenario:hdh_sc2]
daily_threshold = 15.5
bin_width = 2.0
weekly_gate = true
weekly_threshold = 16.0
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    const auto &scenario = manager.get_config()->find_scenario("hdh_sc2");
    EXPECT_EQ(scenario.degree_type, DegreeType::HEATING);
    EXPECT_DOUBLE_EQ(scenario.daily_threshold, 15.5);
    EXPECT_DOUBLE_EQ(scenario.bin_width, 2.0);
    EXPECT_DOUBLE_EQ(scenario.temperature_range.min, -29.2);

    const auto &gate = std::get<SimpleGate>(scenario.gate);
    EXPECT_TRUE(gate.daily_enabled);
    EXPECT_TRUE(gate.weekly_enabled);
    EXPECT_DOUBLE_EQ(gate.weekly_threshold, 16.0);
}

TEST_F(ConfigTest, ScenarioSectionDeclaresCoolingDegreeDayCase) {
    std::string config_content = R"(
[Scenario:cdh_cdd]
cdd_trigger = 1.5
cdd_window_days = 5
degree_type = cooling
daily_threshold = 22.8
range_min = 23.6
range_max = 43.2
bin_width = 2.8
gate = cdd
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(config_file));

    auto config = manager.get_config();
    EXPECT_EQ(config->scenarios.size(), 7u);
    const auto &scenario = config->find_scenario("cdh_cdd");
    EXPECT_EQ(scenario.degree_type, DegreeType::COOLING);
    ASSERT_TRUE(scenario.uses_cdd_gate());

    const auto &gate = std::get<CddGate>(scenario.gate);
    ASSERT_TRUE(gate.trigger.has_value());
    EXPECT_DOUBLE_EQ(*gate.trigger, 1.5);
    EXPECT_EQ(gate.window_days, 5u);
    EXPECT_DOUBLE_EQ(gate.base_temperature, 19.44);
}

TEST_F(ConfigTest, CoolingDegreeDayGateWithoutTriggerIsRejected) {
    std::string config_content = R"(
[Scenario:cdh_cdd]
degree_type = cooling
range_min = 23.6
range_max = 43.2
gate = cdd
)";

    std::string config_file = createTestConfigFile(config_content);
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration(config_file));
    EXPECT_EQ(manager.get_config()->scenarios.count("cdh_cdd"), 0u);
}

TEST_F(ConfigTest, GateKeysMustMatchGateType) {
    std::string config_content = R"(
[Scenario:cdh_sc2]
cdd_trigger = 2.0
)";

    Config::AppConfig config;
    std::vector<std::string> errors;
    ASSERT_TRUE(Config::parse_config_into(createTestConfigFile(config_content),
                                          config, errors));
    ASSERT_EQ(errors.size(), 1u);
    EXPECT_NE(errors[0].find("does not apply to a simple gate"),
              std::string::npos);
}

TEST_F(ConfigTest, InvalidValuesKeepPreviousConfiguration) {
    Config::ConfigManager manager;
    ASSERT_TRUE(manager.load_configuration(createTestConfigFile(R"(
[Runner]
worker_count = 2
)", "good.ini")));

    std::string bad_content = R"(
[Runner]
worker_count = many
scenarios = hdh_sc1, nope

[Scenario:hdh_sc1]
bin_width = 0
range_min = abc
)";

    Config::AppConfig parsed;
    std::vector<std::string> errors;
    std::string bad_file = createTestConfigFile(bad_content, "bad.ini");
    ASSERT_TRUE(Config::parse_config_into(bad_file, parsed, errors));
    EXPECT_EQ(errors.size(), 2u) << "worker_count and range_min do not parse";
    EXPECT_FALSE(Config::validate_app_config(parsed, errors));

    EXPECT_FALSE(manager.load_configuration(bad_file));
    EXPECT_EQ(manager.get_config()->runner.worker_count, 2u);
    EXPECT_DOUBLE_EQ(manager.get_config()->find_scenario("hdh_sc1").bin_width,
                     2.8);
}

TEST_F(ConfigTest, ScenarioWithoutGateConditionFailsValidation) {
    std::string config_content = R"(
[Scenario:hdh_open]
degree_type = heating
daily_threshold = 18.3
range_min = -29.2
range_max = 12.8
daily_gate = false
weekly_gate = false
)";

    Config::AppConfig config;
    std::vector<std::string> errors;
    ASSERT_TRUE(Config::parse_config_into(createTestConfigFile(config_content),
                                          config, errors));
    ASSERT_TRUE(errors.empty());
    EXPECT_FALSE(Config::validate_app_config(config, errors));
    ASSERT_EQ(errors.size(), 1u);

    const std::string prefix = "Scenario 'hdh_open': ";
    EXPECT_EQ(errors[0].rfind(prefix, 0), 0u);
    EXPECT_EQ(errors[0].find(prefix, prefix.size()), std::string::npos)
        << "Scenario name appears once: " << errors[0];

    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration(createTestConfigFile(config_content)));
    EXPECT_EQ(manager.get_config()->scenarios.count("hdh_open"), 0u);
}

TEST_F(ConfigTest, MissingFileKeepsDefaults) {
    Config::ConfigManager manager;
    EXPECT_FALSE(manager.load_configuration((test_dir / "absent.ini").string()));
    EXPECT_EQ(manager.get_config()->scenarios.size(), 6u);
}

TEST_F(ConfigTest, UnknownScenarioLookupThrows) {
    Config::AppConfig config;
    EXPECT_THROW(config.find_scenario("missing"), degree_hours::ConfigError);
}

TEST_F(ConfigTest, ValidatorRejectsTooManyWorkers) {
    Config::AppConfig config;
    config.runner.worker_count = 1000;
    std::vector<std::string> errors;
    EXPECT_FALSE(Config::validate_runner_config(config.runner, config, errors));
    ASSERT_EQ(errors.size(), 1u);
}

TEST(LogLevelParsingTest, ParsesNamesCaseInsensitively) {
    EXPECT_EQ(Config::string_to_log_level(" debug "), LogLevel::DEBUG);
    EXPECT_EQ(Config::string_to_log_level("Warn"), LogLevel::WARN);
    EXPECT_EQ(Config::string_to_log_level("loud"), LogLevel::INFO);
}
