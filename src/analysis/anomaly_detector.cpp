#include "anomaly_detector.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <utility>

namespace analysis {

namespace {

std::vector<double> values_of(const std::vector<TimeSeriesPoint> &points) {
  std::vector<double> out;
  out.reserve(points.size());
  for (const auto &p : points)
    out.push_back(p.value);
  return out;
}

} // namespace

AnomalyDetector::AnomalyDetector(DetectorPolicy policy)
    : policy_(std::move(policy)) {
  if (!std::isfinite(policy_.drop_ratio) || policy_.drop_ratio < 0.0 ||
      policy_.drop_ratio > 1.0)
    throw InvalidInputError("drop_ratio must be within [0, 1], got " +
                            std::to_string(policy_.drop_ratio));
  if (!std::isfinite(policy_.high_severity_multiplier) ||
      policy_.high_severity_multiplier < 1.0)
    throw InvalidInputError("high_severity_multiplier must be >= 1, got " +
                            std::to_string(policy_.high_severity_multiplier));
  if (policy_.evaluation_points == 0)
    throw InvalidInputError("evaluation_points must be at least 1");
  if (policy_.seasonal_period_hours <= 0)
    throw InvalidInputError("seasonal_period_hours must be positive");
}

stats::ThresholdResult AnomalyDetector::threshold_for(
    const TimeSeriesPoint &point, const std::vector<TimeSeriesPoint> &history,
    const stats::ThresholdResult &global, bool seasonal,
    double sensitivity) const {
  if (!seasonal)
    return global;

  auto hour = hour_of_day(point.timestamp);
  auto same_hour = same_hour_values(history, hour);
  if (same_hour.size() < std::max<size_t>(policy_.min_seasonal_samples, 2))
    return global;

  auto local = stats::compute_threshold(same_hour, sensitivity);
  if (local.insufficient_data)
    return global;

  LOG(LogLevel::TRACE, LogComponent::ANALYSIS_DETECTOR,
      "Seasonal baseline for hour " << hour << ": mean " << local.mean
                                    << ", threshold " << local.threshold
                                    << " (global " << global.threshold
                                    << ")");
  return local;
}

std::vector<AnomalyRecord>
AnomalyDetector::detect(const TimeSeries &series, size_t baseline_window,
                        double sensitivity, double min_absolute_value) const {
  if (!std::isfinite(sensitivity) || sensitivity < 0.0)
    throw InvalidInputError("Sensitivity must be a non-negative number, got " +
                            std::to_string(sensitivity));

  std::vector<AnomalyRecord> records;
  const auto &points = series.get_points();
  if (points.empty())
    return records;

  size_t eval_count = std::min(policy_.evaluation_points, points.size());
  size_t eval_begin = points.size() - eval_count;
  size_t baseline_begin =
      (baseline_window == 0 || baseline_window >= eval_begin)
          ? 0
          : eval_begin - baseline_window;

  std::vector<TimeSeriesPoint> baseline(points.begin() + baseline_begin,
                                        points.begin() + eval_begin);

  auto global = stats::compute_threshold(values_of(baseline), sensitivity);
  if (global.insufficient_data) {
    LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_DETECTOR,
        "[" << policy_.detector_name << "] '" << series.get_source()
            << "': baseline of " << baseline.size()
            << " point(s) is too small, nothing evaluated");
    return records;
  }

  bool seasonal = policy_.seasonal_adjustment &&
                  seasonality_.is_seasonal(series,
                                           policy_.seasonal_period_hours);

  // A trailing window shorter than a period holds no earlier sample of the
  // evaluated hour, so same-hour baselines come from the whole history.
  std::vector<TimeSeriesPoint> history;
  if (seasonal)
    history.assign(points.begin(), points.begin() + eval_begin);

  for (size_t i = eval_begin; i < points.size(); ++i) {
    const auto &point = points[i];
    auto th = threshold_for(point, history, global, seasonal, sensitivity);

    AnomalyRecord record;
    record.metric_kind = series.get_kind();
    record.source = series.get_source();
    record.timestamp = point.timestamp;
    record.observed_value = point.value;
    record.baseline_mean = th.mean;
    record.threshold = th.threshold;
    record.detector = policy_.detector_name;

    if (point.value > th.threshold && point.value > min_absolute_value) {
      record.kind = AnomalyKind::SPIKE;
      record.severity =
          point.value > th.threshold * policy_.high_severity_multiplier
              ? AnomalySeverity::HIGH
              : AnomalySeverity::MEDIUM;
    } else if (policy_.detect_drops &&
               th.mean >= policy_.min_baseline_for_drop &&
               point.value < th.mean * policy_.drop_ratio) {
      record.kind = AnomalyKind::DROP;
      // A source that went completely silent is the worst case.
      record.severity = point.value <= 0.0 ? AnomalySeverity::HIGH
                                           : AnomalySeverity::MEDIUM;
    } else {
      continue;
    }

    LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_DETECTOR,
        format_anomaly_summary(record));
    records.push_back(std::move(record));
  }

  return records;
}

} // namespace analysis
