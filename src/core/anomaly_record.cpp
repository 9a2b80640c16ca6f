#include "anomaly_record.hpp"

#include <cctype>
#include <iomanip>
#include <sstream>

std::string anomaly_severity_to_string(AnomalySeverity severity) {
  switch (severity) {
  case AnomalySeverity::MEDIUM:
    return "medium";
  case AnomalySeverity::HIGH:
    return "high";
  }
  return "unknown";
}

std::string anomaly_kind_to_string(AnomalyKind kind) {
  switch (kind) {
  case AnomalyKind::SPIKE:
    return "spike";
  case AnomalyKind::DROP:
    return "drop";
  }
  return "unknown";
}

std::string format_anomaly_summary(const AnomalyRecord &record) {
  std::string severity = anomaly_severity_to_string(record.severity);
  for (auto &c : severity)
    c = static_cast<char>(std::toupper(static_cast<unsigned char>(c)));

  std::ostringstream ss;
  ss << std::fixed << std::setprecision(2);
  ss << "[" << severity << "] " << metric_kind_to_string(record.metric_kind)
     << " " << anomaly_kind_to_string(record.kind) << " on '" << record.source
     << "': observed " << record.observed_value << ", threshold "
     << record.threshold << ", mean " << record.baseline_mean;
  return ss.str();
}
