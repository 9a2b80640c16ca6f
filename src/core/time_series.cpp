#include "time_series.hpp"
#include "errors.hpp"

#include <cmath>
#include <utility>

std::string metric_kind_to_string(MetricKind kind) {
  switch (kind) {
  case MetricKind::COST:
    return "cost";
  case MetricKind::ERROR_COUNT:
    return "error_count";
  case MetricKind::LOG_VOLUME:
    return "log_volume";
  case MetricKind::CPU_PERCENT:
    return "cpu_percent";
  }
  return "unknown";
}

TimeSeries::TimeSeries(std::string source, MetricKind kind,
                       std::vector<TimeSeriesPoint> points)
    : source_(std::move(source)), kind_(kind), points_(std::move(points)) {
  for (size_t i = 0; i < points_.size(); ++i) {
    if (!std::isfinite(points_[i].value))
      throw InvalidInputError("Series '" + source_ +
                              "' contains a non-finite value at index " +
                              std::to_string(i));
    if (i > 0 && points_[i].timestamp <= points_[i - 1].timestamp)
      throw InvalidInputError("Series '" + source_ +
                              "' timestamps must be strictly ascending (index " +
                              std::to_string(i) + ")");
  }
}

std::vector<double> TimeSeries::values() const {
  std::vector<double> out;
  out.reserve(points_.size());
  for (const auto &p : points_)
    out.push_back(p.value);
  return out;
}

std::vector<TimePoint> TimeSeries::timestamps() const {
  std::vector<TimePoint> out;
  out.reserve(points_.size());
  for (const auto &p : points_)
    out.push_back(p.timestamp);
  return out;
}

std::chrono::seconds TimeSeries::span() const {
  if (points_.size() < 2)
    return std::chrono::seconds(0);
  return std::chrono::duration_cast<std::chrono::seconds>(
      points_.back().timestamp - points_.front().timestamp);
}
