#ifndef BASE_METRICS_SOURCE_HPP
#define BASE_METRICS_SOURCE_HPP

#include "core/time_series.hpp"

#include <chrono>
#include <string>

struct MetricsQuery {
  std::string source; // service name or log group
  MetricKind kind = MetricKind::COST;
  TimePoint start;
  TimePoint end;
  std::chrono::seconds resolution{3600};
  std::chrono::milliseconds timeout{10000};
};

// Where the jobs read their time series from.
class IMetricsSource {
public:
  virtual ~IMetricsSource() = default;

  /**
   * Returns the samples for `q.source` between start and end inclusive.
   * Gaps stay gaps; an empty series is a valid answer.
   * @throws CollaboratorError on transport, parse or timeout failure
   */
  virtual TimeSeries query(const MetricsQuery &q) = 0;

  virtual std::string get_source_type() const = 0;
};

#endif // BASE_METRICS_SOURCE_HPP
