#ifndef ANOMALY_DETECTOR_HPP
#define ANOMALY_DETECTOR_HPP

#include "core/anomaly_record.hpp"
#include "core/time_series.hpp"
#include "seasonality_analyzer.hpp"
#include "statistics.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace analysis {

struct DetectorPolicy {
  std::string detector_name = "default";

  // Drop check: flag values below mean * drop_ratio once the baseline mean
  // is at least min_baseline_for_drop.
  bool detect_drops = true;
  double drop_ratio = 0.1;
  double min_baseline_for_drop = 10.0;

  // Spikes above threshold * multiplier are HIGH, others MEDIUM.
  double high_severity_multiplier = 1.5;

  // Trailing points under test; everything before them is baseline.
  size_t evaluation_points = 1;

  bool seasonal_adjustment = false;
  int seasonal_period_hours = 24;
  size_t min_seasonal_samples = 2;
};

/**
 * Threshold-based spike and drop detector.
 *
 * Stateless between calls: every detect() computes its baseline from the
 * series it is given, so one instance may be shared by worker threads.
 */
class AnomalyDetector {
public:
  /**
   * @throws InvalidInputError if drop_ratio is outside [0, 1], the severity
   * multiplier is below 1 or evaluation_points / seasonal period are zero
   */
  explicit AnomalyDetector(DetectorPolicy policy);

  /**
   * Evaluates the trailing `evaluation_points` of `series` against the
   * `baseline_window` points before them (0 means all earlier points).
   * A baseline too small to yield a threshold produces no records. With
   * seasonal adjustment on a seasonal series, each point is instead judged
   * against all earlier samples from the same hour of day.
   *
   * @throws InvalidInputError for negative or non-finite sensitivity
   */
  std::vector<AnomalyRecord> detect(const TimeSeries &series,
                                    size_t baseline_window, double sensitivity,
                                    double min_absolute_value) const;

  const DetectorPolicy &get_policy() const { return policy_; }

private:
  stats::ThresholdResult
  threshold_for(const TimeSeriesPoint &point,
                const std::vector<TimeSeriesPoint> &history,
                const stats::ThresholdResult &global, bool seasonal,
                double sensitivity) const;

  DetectorPolicy policy_;
  SeasonalityAnalyzer seasonality_;
};

} // namespace analysis

#endif // ANOMALY_DETECTOR_HPP
