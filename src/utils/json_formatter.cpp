#include "json_formatter.hpp"
#include "calc/season_classifier.hpp"

#include <initializer_list>
#include <string>

nlohmann::json
JsonFormatter::row_to_json_object(const degree_hours::AggregateRow &row) {
  nlohmann::json j;
  j["hour_of_day"] = row.hour_of_day;

  nlohmann::json j_bin;
  j_bin["index"] = row.bin.index;
  j_bin["label"] = row.bin.label();
  j_bin["lower"] = row.bin.lower;
  j_bin["upper"] = row.bin.upper;
  j_bin["overflow"] = row.bin.is_overflow;
  j["bin"] = j_bin;

  j["sum_degree_hour"] = row.sum_degree_hour;
  j["mean_temperature"] = row.mean_temperature;
  j["count_active_hours"] = row.count_active_hours;
  for (auto season : {degree_hours::Season::WINTER, degree_hours::Season::SPRING,
                      degree_hours::Season::SUMMER, degree_hours::Season::FALL})
    j[std::string("count_active_") + degree_hours::season_to_string(season)] =
        row.count_active_in(season);
  j["city"] = row.city;
  j["state_province"] = row.state_province;
  return j;
}

nlohmann::json JsonFormatter::warning_to_json_object(
    const degree_hours::DataQualityWarning &warning) {
  return {{"record_index", warning.record_index},
          {"month", warning.month},
          {"day", warning.day},
          {"hour", warning.hour},
          {"in_kept_period", warning.in_kept_period},
          {"reason", warning.reason}};
}

nlohmann::json
JsonFormatter::table_to_json_object(const degree_hours::ScenarioTable &table,
                                    bool include_rows) {
  using degree_hours::SiteRunStatus;

  nlohmann::json j;
  j["scenario"] = table.scenario_name;
  j["row_count"] = table.rows.size();
  j["succeeded"] = table.count(SiteRunStatus::SUCCEEDED);
  j["failed"] = table.count(SiteRunStatus::FAILED);
  j["skipped"] = table.count(SiteRunStatus::SKIPPED);
  j["warning_count"] = table.warning_count();

  nlohmann::json j_sites = nlohmann::json::array();
  for (const auto &site : table.sites) {
    nlohmann::json j_site;
    j_site["index"] = site.site_index;
    j_site["site"] = site.site_name;
    j_site["status"] = degree_hours::site_run_status_to_string(site.status);
    if (site.status == SiteRunStatus::FAILED)
      j_site["error"] = site.error;

    nlohmann::json j_warnings = nlohmann::json::array();
    for (const auto &warning : site.warnings)
      j_warnings.push_back(warning_to_json_object(warning));
    j_site["warnings"] = j_warnings;

    j_sites.push_back(j_site);
  }
  j["sites"] = j_sites;

  if (include_rows) {
    nlohmann::json j_rows = nlohmann::json::array();
    for (const auto &row : table.rows)
      j_rows.push_back(row_to_json_object(row));
    j["rows"] = j_rows;
  }
  return j;
}

nlohmann::json
JsonFormatter::summary_to_json_object(const degree_hours::BatchSummary &summary,
                                      bool include_rows) {
  using degree_hours::SiteRunStatus;

  nlohmann::json j;
  j["started_at_ms"] = summary.started_at_ms;
  j["finished_at_ms"] = summary.finished_at_ms;
  j["succeeded"] = summary.count(SiteRunStatus::SUCCEEDED);
  j["failed"] = summary.count(SiteRunStatus::FAILED);
  j["skipped"] = summary.count(SiteRunStatus::SKIPPED);
  j["warning_count"] = summary.warning_count();

  nlohmann::json j_tables = nlohmann::json::array();
  for (const auto &table : summary.tables)
    j_tables.push_back(table_to_json_object(table, include_rows));
  j["scenarios"] = j_tables;
  return j;
}

std::string
JsonFormatter::format_summary(const degree_hours::BatchSummary &summary,
                              bool include_rows, int indent) {
  return summary_to_json_object(summary, include_rows).dump(indent);
}
