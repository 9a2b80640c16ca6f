#ifndef JSON_FORMATTER_HPP
#define JSON_FORMATTER_HPP

#include "core/anomaly_record.hpp"
#include "nlohmann/json.hpp"

#include <string>

namespace JsonFormatter {

nlohmann::json anomaly_record_to_json_object(const AnomalyRecord &record);

// Single-line JSON, one record per line in the alert file.
std::string format_anomaly_record_to_json(const AnomalyRecord &record);

} // namespace JsonFormatter

#endif // JSON_FORMATTER_HPP
