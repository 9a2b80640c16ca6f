#include "json_formatter.hpp"
#include "utils.hpp"

nlohmann::json
JsonFormatter::anomaly_record_to_json_object(const AnomalyRecord &record) {
  nlohmann::json j;

  // === Identity ===
  j["timestamp"] = Utils::format_time_iso8601(record.timestamp);
  j["timestamp_s"] = Utils::to_unix_seconds(record.timestamp);
  j["metric"] = metric_kind_to_string(record.metric_kind);
  j["source"] = record.source;
  j["detector"] = record.detector;

  // === Classification ===
  j["anomaly_type"] = anomaly_kind_to_string(record.kind);
  j["severity"] = anomaly_severity_to_string(record.severity);

  // === Figures ===
  j["observed_value"] = record.observed_value;
  j["baseline_mean"] = record.baseline_mean;
  j["threshold"] = record.threshold;

  j["summary"] = format_anomaly_summary(record);
  return j;
}

std::string
JsonFormatter::format_anomaly_record_to_json(const AnomalyRecord &record) {
  return anomaly_record_to_json_object(record).dump();
}
