#ifndef TIME_SERIES_HPP
#define TIME_SERIES_HPP

#include <chrono>
#include <cstddef>
#include <string>
#include <vector>

using TimePoint = std::chrono::system_clock::time_point;

enum class MetricKind { COST, ERROR_COUNT, LOG_VOLUME, CPU_PERCENT };

std::string metric_kind_to_string(MetricKind kind);

struct TimeSeriesPoint {
  TimePoint timestamp;
  double value = 0.0;
};

/**
 * Immutable, timestamp-ordered series for one source and metric kind.
 * Missing samples are simply absent; the series never zero-fills gaps.
 */
class TimeSeries {
public:
  /**
   * @throws InvalidInputError when timestamps are not strictly ascending
   * (this also rejects duplicates) or a value is not finite
   */
  TimeSeries(std::string source, MetricKind kind,
             std::vector<TimeSeriesPoint> points);

  const std::string &get_source() const { return source_; }
  MetricKind get_kind() const { return kind_; }
  const std::vector<TimeSeriesPoint> &get_points() const { return points_; }

  size_t size() const { return points_.size(); }
  bool empty() const { return points_.empty(); }

  std::vector<double> values() const;
  std::vector<TimePoint> timestamps() const;

  // Time between the first and last sample; zero for fewer than two points.
  std::chrono::seconds span() const;

private:
  std::string source_;
  MetricKind kind_;
  std::vector<TimeSeriesPoint> points_;
};

#endif // TIME_SERIES_HPP
