#include "batch/batch_runner.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "scenario/scenario_runner.hpp"
#include "utils/scoped_timer.hpp"
#include "utils/thread_safe_queue.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <atomic>
#include <exception>
#include <iterator>
#include <optional>
#include <thread>
#include <utility>

namespace degree_hours {

namespace {

struct RunMetrics {
  prometheus::Family<prometheus::Counter> &runs;
  prometheus::Counter &data_quality_warnings;
  prometheus::Histogram &run_duration;

  static RunMetrics &instance() {
    static RunMetrics metrics{
        MetricsRegistry::instance().create_counter_family(
            "degree_hours_runs_total",
            "Site runs per scenario, labelled by outcome"),
        MetricsRegistry::instance().create_counter(
            "degree_hours_data_quality_warnings_total",
            "Hours reported without an air temperature"),
        MetricsRegistry::instance().create_histogram(
            "degree_hours_run_duration_seconds",
            "Wall time of a single (site, scenario) run",
            {0.005, 0.01, 0.025, 0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0})};
    return metrics;
  }

  void record_run(const std::string &scenario, SiteRunStatus status) {
    runs.Add({{"scenario", scenario},
              {"status", Utils::to_lower_copy(site_run_status_to_string(status))}})
        .Increment();
  }
};

size_t count_kept(const std::vector<DataQualityWarning> &warnings) {
  return static_cast<size_t>(
      std::count_if(warnings.begin(), warnings.end(),
                    [](const DataQualityWarning &w) { return w.in_kept_period; }));
}

} // namespace

const char *site_run_status_to_string(SiteRunStatus status) {
  switch (status) {
  case SiteRunStatus::SUCCEEDED:
    return "SUCCEEDED";
  case SiteRunStatus::FAILED:
    return "FAILED";
  case SiteRunStatus::SKIPPED:
    return "SKIPPED";
  }
  return "UNKNOWN";
}

size_t ScenarioTable::count(SiteRunStatus status) const {
  return static_cast<size_t>(
      std::count_if(sites.begin(), sites.end(),
                    [status](const SiteOutcome &s) { return s.status == status; }));
}

size_t ScenarioTable::warning_count() const {
  size_t total = 0;
  for (const auto &site : sites)
    total += site.warnings.size();
  return total;
}

size_t BatchSummary::count(SiteRunStatus status) const {
  size_t total = 0;
  for (const auto &table : tables)
    total += table.count(status);
  return total;
}

size_t BatchSummary::warning_count() const {
  size_t total = 0;
  for (const auto &table : tables)
    total += table.warning_count();
  return total;
}

const ScenarioTable *
BatchSummary::find_table(const std::string &scenario_name) const {
  for (const auto &table : tables) {
    if (table.scenario_name == scenario_name)
      return &table;
  }
  return nullptr;
}

BatchRunner::BatchRunner(std::shared_ptr<const Config::AppConfig> config)
    : config_(std::move(config)) {
  if (!config_)
    throw ConfigError("BatchRunner requires a configuration");
  LogManager::instance().configure(config_->logging);
}

size_t BatchRunner::worker_count_for(size_t site_count) const {
  size_t workers = config_->runner.worker_count;
  if (workers == 0)
    workers = std::max<size_t>(1, std::thread::hardware_concurrency());
  return std::max<size_t>(1, std::min(workers, site_count));
}

ScenarioTable
BatchRunner::run_scenario(const std::string &scenario_name,
                          const std::vector<SiteInput> &sites) const {
  return run_scenario(config_->find_scenario(scenario_name), sites);
}

ScenarioTable
BatchRunner::run_scenario(const ScenarioConfig &scenario,
                          const std::vector<SiteInput> &sites) const {
  const ScenarioRunner runner(scenario);
  const std::string &name = runner.config().name;
  auto &metrics = RunMetrics::instance();

  ScenarioTable table;
  table.scenario_name = name;
  table.sites.resize(sites.size());
  for (size_t i = 0; i < sites.size(); ++i) {
    table.sites[i].site_index = i;
    table.sites[i].site_name = sites[i].site.display_name();
  }
  if (sites.empty())
    return table;

  // Each worker writes only the slots of the indices it popped
  std::vector<std::optional<ScenarioResult>> results(sites.size());
  ThreadSafeQueue<size_t> jobs;
  for (size_t i = 0; i < sites.size(); ++i)
    jobs.push(i);
  jobs.close();

  const bool fail_fast = config_->runner.fail_fast;
  std::atomic<bool> stop_requested{false};

  auto worker = [&]() {
    while (auto job = jobs.wait_and_pop()) {
      const size_t index = *job;
      if (stop_requested.load())
        continue;

      SiteOutcome &outcome = table.sites[index];
      try {
        ScopedTimer timer(metrics.run_duration);
        const TemperatureSeries series(sites[index].site,
                                       sites[index].records);
        results[index] = runner.run(series);
        outcome.status = SiteRunStatus::SUCCEEDED;
        outcome.warnings = results[index]->warnings;
      } catch (const DegreeHourError &e) {
        outcome.status = SiteRunStatus::FAILED;
        outcome.error = e.what();
      } catch (const std::exception &e) {
        outcome.status = SiteRunStatus::FAILED;
        outcome.error = std::string("Unexpected failure: ") + e.what();
      }
      metrics.record_run(name, outcome.status);

      if (outcome.status == SiteRunStatus::FAILED) {
        LOG(LogLevel::ERROR, LogComponent::BATCH,
            "Scenario " << name << " failed for site " << outcome.site_name
                        << ": " << outcome.error);
        if (fail_fast && !stop_requested.exchange(true)) {
          size_t dropped = jobs.clear();
          LOG(LogLevel::WARN, LogComponent::BATCH,
              "fail_fast set, skipping " << dropped
                                         << " remaining site(s) of scenario "
                                         << name);
        }
        continue;
      }

      if (!outcome.warnings.empty()) {
        metrics.data_quality_warnings.Increment(
            static_cast<double>(outcome.warnings.size()));
        LOG(LogLevel::WARN, LogComponent::BATCH,
            "Site " << outcome.site_name << ", scenario " << name << ": "
                    << outcome.warnings.size()
                    << " hour(s) without air temperature, "
                    << count_kept(outcome.warnings)
                    << " inside gated-on periods");
      }
    }
  };

  const size_t worker_count = worker_count_for(sites.size());
  LOG(LogLevel::INFO, LogComponent::BATCH,
      "Running scenario " << name << " over " << sites.size()
                          << " site(s) on " << worker_count << " worker(s)");

  std::vector<std::thread> workers;
  workers.reserve(worker_count);
  for (size_t i = 0; i < worker_count; ++i)
    workers.emplace_back(worker);
  for (auto &t : workers)
    t.join();

  for (auto &result : results) {
    if (!result)
      continue;
    table.rows.insert(table.rows.end(),
                      std::make_move_iterator(result->rows.begin()),
                      std::make_move_iterator(result->rows.end()));
  }

  LOG(LogLevel::INFO, LogComponent::BATCH,
      "Scenario " << name << " finished: "
                  << table.count(SiteRunStatus::SUCCEEDED) << " succeeded, "
                  << table.count(SiteRunStatus::FAILED) << " failed, "
                  << table.count(SiteRunStatus::SKIPPED) << " skipped");
  return table;
}

BatchSummary
BatchRunner::run_all(const std::vector<SiteInput> &sites) const {
  BatchSummary summary;
  summary.started_at_ms = Utils::get_current_time_ms();

  for (const auto &name : config_->selected_scenarios()) {
    summary.tables.push_back(run_scenario(name, sites));
    if (config_->runner.fail_fast &&
        summary.tables.back().count(SiteRunStatus::FAILED) > 0) {
      LOG(LogLevel::WARN, LogComponent::BATCH,
          "fail_fast set, not running the scenarios after " << name);
      break;
    }
  }

  summary.finished_at_ms = Utils::get_current_time_ms();
  return summary;
}

} // namespace degree_hours
