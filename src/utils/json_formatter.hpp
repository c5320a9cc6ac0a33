#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "batch/batch_runner.hpp"
#include "calc/aggregator.hpp"
#include "series/hourly_record.hpp"
#include "nlohmann/json.hpp"

#include <string>

namespace JsonFormatter {

nlohmann::json row_to_json_object(const degree_hours::AggregateRow &row);
nlohmann::json
warning_to_json_object(const degree_hours::DataQualityWarning &warning);
nlohmann::json table_to_json_object(const degree_hours::ScenarioTable &table,
                                    bool include_rows);
nlohmann::json summary_to_json_object(const degree_hours::BatchSummary &summary,
                                      bool include_rows = false);

// indent < 0 renders a single line
std::string format_summary(const degree_hours::BatchSummary &summary,
                           bool include_rows = false, int indent = -1);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
