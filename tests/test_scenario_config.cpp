#include "core/errors.hpp"
#include "scenario/scenario_config.hpp"

#include <gtest/gtest.h>

#include <string>
#include <vector>

using namespace degree_hours;

TEST(ScenarioConfigTest, PresetsMatchTheDesignCases) {
  const auto &presets = predefined_scenarios();
  ASSERT_EQ(presets.size(), 6u);

  const auto &hdh3 = predefined_scenario("hdh_sc3");
  EXPECT_EQ(hdh3.degree_type, DegreeType::HEATING);
  EXPECT_DOUBLE_EQ(hdh3.daily_threshold, 14.9);
  const auto &hdh3_gate = std::get<SimpleGate>(hdh3.gate);
  EXPECT_TRUE(hdh3_gate.daily_enabled);
  EXPECT_TRUE(hdh3_gate.weekly_enabled);
  EXPECT_DOUBLE_EQ(hdh3_gate.weekly_threshold, 17.1);

  const auto &cdh3 = predefined_scenario("cdh_sc3");
  EXPECT_EQ(cdh3.degree_type, DegreeType::COOLING);
  EXPECT_DOUBLE_EQ(cdh3.daily_threshold, 22.8);
  EXPECT_DOUBLE_EQ(cdh3.temperature_range.min, 23.6);
  EXPECT_DOUBLE_EQ(cdh3.temperature_range.max, 43.2);
  EXPECT_DOUBLE_EQ(std::get<SimpleGate>(cdh3.gate).weekly_threshold, 19.5);

  const auto &cdh1 = predefined_scenario("cdh_sc1");
  EXPECT_DOUBLE_EQ(cdh1.daily_threshold, 18.3);
  EXPECT_FALSE(std::get<SimpleGate>(cdh1.gate).weekly_enabled);

  for (const auto &[name, config] : presets) {
    EXPECT_EQ(name, config.name);
    EXPECT_DOUBLE_EQ(config.bin_width, 2.8);
    std::vector<std::string> errors;
    EXPECT_TRUE(validate_scenario_config(config, errors)) << name;
  }
}

TEST(ScenarioConfigTest, UnknownPresetIsAConfigError) {
  EXPECT_THROW(predefined_scenario("hdh_sc9"), ConfigError);
}

TEST(ScenarioConfigTest, ValidationCollectsEveryProblem) {
  ScenarioConfig config;
  config.name = "broken";
  config.bin_width = -1.0;
  config.temperature_range = TemperatureRange{5.0, 5.0};

  std::vector<std::string> errors;
  EXPECT_FALSE(validate_scenario_config(config, errors));
  EXPECT_EQ(errors.size(), 2u);

  try {
    ensure_valid(config);
    FAIL() << "Expected ConfigError";
  } catch (const ConfigError &e) {
    std::string message = e.what();
    EXPECT_NE(message.find("bin width"), std::string::npos);
    EXPECT_NE(message.find("range"), std::string::npos);
  }
}

TEST(ScenarioConfigTest, RangeMustStayInsideOverflowSentinels) {
  ScenarioConfig config;
  config.name = "wide";
  config.temperature_range = TemperatureRange{-100.0, 10.0};
  std::vector<std::string> errors;
  EXPECT_FALSE(validate_scenario_config(config, errors));
}

TEST(ScenarioConfigTest, CoolingDegreeDayGateRules) {
  auto config = make_cdd_scenario("cdd", 22.8, 1.5,
                                  TemperatureRange{23.6, 43.2}, 2.8);
  EXPECT_TRUE(config.uses_cdd_gate());
  EXPECT_EQ(config.degree_type, DegreeType::COOLING);
  const auto &gate = std::get<CddGate>(config.gate);
  EXPECT_DOUBLE_EQ(gate.base_temperature, 19.44);
  EXPECT_EQ(gate.window_days, 7u);
  EXPECT_NO_THROW(ensure_valid(config));

  auto heating = config;
  heating.degree_type = DegreeType::HEATING;
  EXPECT_THROW(ensure_valid(heating), ConfigError);

  auto unset = config;
  std::get<CddGate>(unset.gate).trigger.reset();
  EXPECT_THROW(ensure_valid(unset), ConfigError);
}

TEST(ScenarioConfigTest, SimpleGateNeedsAnEnabledCondition) {
  auto config = predefined_scenario("hdh_sc1");
  config.gate = SimpleGate{false, false, 18.3};

  std::vector<std::string> errors;
  EXPECT_FALSE(validate_scenario_config(config, errors));
  ASSERT_EQ(errors.size(), 1u);
  EXPECT_NE(errors[0].find("daily or weekly condition"), std::string::npos);
  EXPECT_THROW(ensure_valid(config), ConfigError);

  config.gate = SimpleGate{false, true, 17.1};
  EXPECT_NO_THROW(ensure_valid(config)) << "Weekly-only is a valid gate";
}

TEST(ScenarioConfigTest, DegreeTypeNames) {
  EXPECT_EQ(degree_type_from_string(" Cooling"), DegreeType::COOLING);
  EXPECT_EQ(degree_type_from_string("HEATING"), DegreeType::HEATING);
  EXPECT_FALSE(degree_type_from_string("both").has_value());
  EXPECT_STREQ(degree_type_to_string(DegreeType::HEATING), "heating");
}
