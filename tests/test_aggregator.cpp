#include "calc/aggregator.hpp"
#include "scenario/scenario_config.hpp"
#include "scenario/scenario_runner.hpp"
#include "test_helpers.hpp"

#include <gtest/gtest.h>

#include <optional>
#include <stdexcept>

using namespace degree_hours;

namespace {
// Mornings at 5 C, afternoons at 30 C; daily mean 17.5 keeps every hdh_sc1 day
TemperatureSeries split_day_series() {
  return TemperatureSeries(
      test_support::make_site("Toronto", "ON"),
      test_support::make_year_records([](int, int, int hour, size_t) {
        return std::optional<double>(hour < 12 ? 5.0 : 30.0);
      }));
}
} // namespace

TEST(AggregatorTest, EmitsFullGridOrderedByHourThenBin) {
  auto series = split_day_series();
  ScenarioRunner runner(predefined_scenario("hdh_sc1"));
  auto derived = runner.derive(series);

  auto rows = Aggregator(runner.binner()).aggregate(series, derived);
  const size_t bins = runner.binner().bin_count();
  ASSERT_EQ(rows.size(), 24 * bins);

  for (size_t i = 0; i < rows.size(); ++i) {
    EXPECT_EQ(rows[i].hour_of_day, i / bins);
    EXPECT_EQ(rows[i].bin.index, i % bins);
    EXPECT_EQ(rows[i].city, "Toronto");
    EXPECT_EQ(rows[i].state_province, "ON");
  }
}

TEST(AggregatorTest, SumsCountsAndMeansPerGroup) {
  auto series = split_day_series();
  ScenarioRunner runner(predefined_scenario("hdh_sc1"));
  auto derived = runner.derive(series);
  auto rows = Aggregator(runner.binner()).aggregate(series, derived);

  const size_t bins = runner.binner().bin_count();
  const size_t cold_bin = *runner.binner().assign(5.0);
  const size_t hot_bin = *runner.binner().assign(30.0);
  EXPECT_EQ(hot_bin, bins - 1) << "30 C lies above the hdh range";

  const auto &cold = rows[3 * bins + cold_bin];
  EXPECT_NEAR(cold.sum_degree_hour, 365 * (18.3 - 5.0) / 24.0, 1e-9);
  EXPECT_DOUBLE_EQ(cold.mean_temperature, 5.0);
  EXPECT_EQ(cold.count_active_hours, 365u);
  EXPECT_EQ(cold.count_active_winter, 90u);
  EXPECT_EQ(cold.count_active_spring, 92u);
  EXPECT_EQ(cold.count_active_summer, 92u);
  EXPECT_EQ(cold.count_active_fall, 91u);
  EXPECT_EQ(cold.count_active_in(Season::SPRING), 92u);

  const auto &hot = rows[15 * bins + hot_bin];
  EXPECT_DOUBLE_EQ(hot.sum_degree_hour, 0.0);
  EXPECT_DOUBLE_EQ(hot.mean_temperature, 30.0);
  EXPECT_EQ(hot.count_active_hours, 0u);

  const auto &empty = rows[3 * bins + hot_bin];
  EXPECT_DOUBLE_EQ(empty.sum_degree_hour, 0.0);
  EXPECT_DOUBLE_EQ(empty.mean_temperature, 0.0);
  EXPECT_EQ(empty.count_active_hours, 0u);
  EXPECT_EQ(empty.count_active_winter, 0u);
}

TEST(AggregatorTest, RejectsMismatchedDerivedColumns) {
  auto series = split_day_series();
  ScenarioRunner runner(predefined_scenario("hdh_sc1"));
  auto derived = runner.derive(series);
  derived.bin.pop_back();

  EXPECT_THROW(Aggregator(runner.binner()).aggregate(series, derived),
               std::invalid_argument);
}
