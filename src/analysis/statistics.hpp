#ifndef STATISTICS_HPP
#define STATISTICS_HPP

#include <cstddef>
#include <map>
#include <string>
#include <vector>

namespace analysis::stats {

/**
 * Baseline statistics for threshold-based detection.
 * threshold = mean + sensitivity * stddev, always computed from a baseline
 * that excludes the point under test.
 */
struct ThresholdResult {
  double mean = 0.0;
  double stddev = 0.0;
  double threshold = 0.0;
  double sensitivity = 0.0;
  // Set when the baseline held fewer than two values; all statistics are 0.
  bool insufficient_data = true;
};

enum class TrendDirection { INCREASING, DECREASING, STABLE };

std::string trend_direction_to_string(TrendDirection direction);

struct TrendResult {
  TrendDirection direction = TrendDirection::STABLE;
  double change_percent = 0.0; // older half-window avg -> recent half-window
};

// Keyed by "p50", "p90", "p95", "p99".
using PercentileSet = std::map<std::string, double>;

// Changes strictly beyond +/- this many percent are classified as a trend.
constexpr double TREND_CHANGE_THRESHOLD_PERCENT = 10.0;

// Arithmetic mean; 0 for an empty input.
double mean(const std::vector<double> &values);

// Sample standard deviation (n - 1 denominator); 0 for fewer than two values.
double sample_stddev(const std::vector<double> &values);

// stddev / mean, defined as 0 when the mean is 0.
double coefficient_of_variation(const std::vector<double> &values);

/**
 * @param baseline historical values, excluding the value being evaluated
 * @param sensitivity number of standard deviations above the mean
 * @throws InvalidInputError if sensitivity is negative or not finite
 */
ThresholdResult compute_threshold(const std::vector<double> &baseline,
                                  double sensitivity);

/**
 * Compares the average of the last `window_size` values with the average of
 * the `window_size` values before them (or all earlier values if fewer).
 * Too little data yields STABLE.
 * @throws InvalidInputError if window_size is 0
 */
TrendResult detect_trend(const std::vector<double> &values,
                         size_t window_size = 5);

// p50/p90/p95/p99 by linear interpolation; empty input gives an empty set.
PercentileSet compute_percentiles(const std::vector<double> &values);

// `percentile` in [0, 100] over an ascending-sorted, non-empty input.
double percentile_of_sorted(const std::vector<double> &sorted_values,
                            double percentile);

} // namespace analysis::stats

#endif // STATISTICS_HPP
