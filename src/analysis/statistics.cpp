#include "statistics.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"

#include <algorithm>
#include <cmath>
#include <numeric>

namespace analysis::stats {

std::string trend_direction_to_string(TrendDirection direction) {
  switch (direction) {
  case TrendDirection::INCREASING:
    return "increasing";
  case TrendDirection::DECREASING:
    return "decreasing";
  case TrendDirection::STABLE:
    return "stable";
  }
  return "unknown";
}

double mean(const std::vector<double> &values) {
  if (values.empty())
    return 0.0;
  return std::accumulate(values.begin(), values.end(), 0.0) /
         static_cast<double>(values.size());
}

double sample_stddev(const std::vector<double> &values) {
  if (values.size() < 2)
    return 0.0;

  double m = mean(values);
  double sum_sq = 0.0;
  for (double v : values) {
    double d = v - m;
    sum_sq += d * d;
  }
  return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

double coefficient_of_variation(const std::vector<double> &values) {
  double m = mean(values);
  if (m == 0.0)
    return 0.0;
  return sample_stddev(values) / m;
}

ThresholdResult compute_threshold(const std::vector<double> &baseline,
                                  double sensitivity) {
  if (!std::isfinite(sensitivity) || sensitivity < 0.0)
    throw InvalidInputError("Sensitivity must be a non-negative number, got " +
                            std::to_string(sensitivity));

  ThresholdResult result;
  result.sensitivity = sensitivity;

  if (baseline.size() < 2) {
    LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_STATS,
        "Baseline of " << baseline.size()
                       << " value(s) is too small for a threshold");
    return result;
  }

  result.mean = mean(baseline);
  result.stddev = sample_stddev(baseline);
  result.threshold = result.mean + sensitivity * result.stddev;
  result.insufficient_data = false;
  return result;
}

TrendResult detect_trend(const std::vector<double> &values,
                         size_t window_size) {
  if (window_size == 0)
    throw InvalidInputError("Trend window size must be at least 1");

  TrendResult result;
  if (values.size() < window_size)
    return result;

  auto recent_begin = values.end() - static_cast<std::ptrdiff_t>(window_size);
  auto older_begin = values.size() >= 2 * window_size
                         ? recent_begin - static_cast<std::ptrdiff_t>(window_size)
                         : values.begin();

  if (older_begin == recent_begin)
    return result;

  std::vector<double> recent(recent_begin, values.end());
  std::vector<double> older(older_begin, recent_begin);

  double recent_avg = mean(recent);
  double older_avg = mean(older);

  // A zero older average has no meaningful relative change.
  result.change_percent =
      older_avg != 0.0 ? (recent_avg - older_avg) / older_avg * 100.0 : 0.0;

  if (result.change_percent > TREND_CHANGE_THRESHOLD_PERCENT)
    result.direction = TrendDirection::INCREASING;
  else if (result.change_percent < -TREND_CHANGE_THRESHOLD_PERCENT)
    result.direction = TrendDirection::DECREASING;

  return result;
}

double percentile_of_sorted(const std::vector<double> &sorted_values,
                            double percentile) {
  if (sorted_values.empty())
    return 0.0;

  double rank = (percentile / 100.0) *
                static_cast<double>(sorted_values.size() - 1);
  double lower = std::floor(rank);
  auto lower_index = static_cast<size_t>(lower);

  if (rank == lower)
    return sorted_values[lower_index];

  size_t upper_index = lower_index + 1;
  if (upper_index >= sorted_values.size())
    return sorted_values.back();

  // Linear interpolation
  double weight = rank - lower;
  return sorted_values[lower_index] * (1.0 - weight) +
         sorted_values[upper_index] * weight;
}

PercentileSet compute_percentiles(const std::vector<double> &values) {
  PercentileSet result;
  if (values.empty())
    return result;

  std::vector<double> sorted_values(values);
  std::sort(sorted_values.begin(), sorted_values.end());

  // The median is taken directly so p50 matches it bit for bit.
  size_t n = sorted_values.size();
  result["p50"] = n % 2 == 1 ? sorted_values[n / 2]
                             : (sorted_values[n / 2 - 1] + sorted_values[n / 2]) /
                                   2.0;
  result["p90"] = percentile_of_sorted(sorted_values, 90.0);
  result["p95"] = percentile_of_sorted(sorted_values, 95.0);
  result["p99"] = percentile_of_sorted(sorted_values, 99.0);
  return result;
}

} // namespace analysis::stats
