#ifndef ANOMALY_RECORD_HPP
#define ANOMALY_RECORD_HPP

#include "time_series.hpp"

#include <string>

enum class AnomalySeverity { MEDIUM, HIGH };

enum class AnomalyKind {
  SPIKE, // Observed value above the computed threshold
  DROP   // Observed value far below the long-run average
};

std::string anomaly_severity_to_string(AnomalySeverity severity);
std::string anomaly_kind_to_string(AnomalyKind kind);

// One flagged evaluation point. Built per analysis run and handed straight to
// the alert dispatcher; the engine never stores it.
struct AnomalyRecord {
  MetricKind metric_kind = MetricKind::COST;
  std::string source;
  TimePoint timestamp;
  double observed_value = 0.0;
  double baseline_mean = 0.0;
  double threshold = 0.0;
  AnomalySeverity severity = AnomalySeverity::MEDIUM;
  AnomalyKind kind = AnomalyKind::SPIKE;
  std::string detector; // e.g. "cost", "log_error", "log_volume"
};

// "[HIGH] cost spike on 'ec2': observed 250.00, threshold 104.32, mean 100.00"
std::string format_anomaly_summary(const AnomalyRecord &record);

#endif // ANOMALY_RECORD_HPP
