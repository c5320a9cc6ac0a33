#ifndef BATCH_RUNNER_HPP
#define BATCH_RUNNER_HPP

#include "calc/aggregator.hpp"
#include "core/config.hpp"
#include "scenario/scenario_config.hpp"
#include "series/hourly_record.hpp"
#include "series/temperature_series.hpp"

#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>
#include <vector>

namespace degree_hours {

enum class SiteRunStatus { SUCCEEDED, FAILED, SKIPPED };

const char *site_run_status_to_string(SiteRunStatus status);

// One site as read from its weather file, not yet shape-checked
struct SiteInput {
  SiteMetadata site;
  std::vector<HourlyRecord> records;
};

struct SiteOutcome {
  size_t site_index = 0;
  std::string site_name;
  SiteRunStatus status = SiteRunStatus::SKIPPED;
  std::string error; // set when FAILED
  std::vector<DataQualityWarning> warnings;
};

// All sites of one scenario; rows are concatenated in site input order
struct ScenarioTable {
  std::string scenario_name;
  std::vector<AggregateRow> rows;
  std::vector<SiteOutcome> sites;

  size_t count(SiteRunStatus status) const;
  size_t warning_count() const;
};

struct BatchSummary {
  std::vector<ScenarioTable> tables;
  uint64_t started_at_ms = 0;
  uint64_t finished_at_ms = 0;

  size_t count(SiteRunStatus status) const;
  size_t warning_count() const;
  const ScenarioTable *find_table(const std::string &scenario_name) const;
};

/**
 * Runs scenarios over many sites on a pool of worker threads.
 * Each worker builds its site's TemperatureSeries itself, so a malformed
 * site fails alone. A site that fails is logged and recorded in its SiteOutcome; the remaining
 * sites still run unless the runner is configured to fail fast, in which case
 * sites not yet started are reported as SKIPPED.
 */
class BatchRunner {
public:
  explicit BatchRunner(std::shared_ptr<const Config::AppConfig> config);

  // @throws ConfigError for an unknown scenario name
  ScenarioTable run_scenario(const std::string &scenario_name,
                             const std::vector<SiteInput> &sites) const;

  // @throws ConfigError if the scenario does not validate
  ScenarioTable run_scenario(const ScenarioConfig &scenario,
                             const std::vector<SiteInput> &sites) const;

  // Every scenario the runner configuration selects, in selection order
  BatchSummary run_all(const std::vector<SiteInput> &sites) const;

  // Threads used for n sites, never more than there are sites
  size_t worker_count_for(size_t site_count) const;

private:
  std::shared_ptr<const Config::AppConfig> config_;
};

} // namespace degree_hours

#endif // BATCH_RUNNER_HPP
