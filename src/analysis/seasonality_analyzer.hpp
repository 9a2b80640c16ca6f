#ifndef SEASONALITY_ANALYZER_HPP
#define SEASONALITY_ANALYZER_HPP

#include "core/time_series.hpp"

#include <cstddef>
#include <map>
#include <vector>

namespace analysis {

struct SeasonalityVerdict {
  bool is_seasonal = false;
  std::map<int, double> hourly_cv; // hour of day (UTC) -> coefficient of variation
  size_t sample_count = 0;
  double low_cv_share = 0.0;
};

/**
 * Hour-of-day bucket heuristic for recurring daily patterns.
 *
 * Samples are grouped by their UTC hour. A series is called seasonal when
 * enough hours are populated and most of them are internally consistent
 * (low coefficient of variation) from one day to the next. This is a cheap
 * gate for suppressing expected daily swings, not a spectral test.
 */
class SeasonalityAnalyzer {
public:
  static constexpr size_t MIN_CV_BUCKETS = 12;
  static constexpr double LOW_CV_LIMIT = 0.5;
  static constexpr double MIN_LOW_CV_SHARE = 0.6;

  /**
   * @throws InvalidInputError if the vectors differ in length or
   * period_hours is not positive
   */
  SeasonalityVerdict analyze(const std::vector<double> &values,
                             const std::vector<TimePoint> &timestamps,
                             int period_hours = 24) const;

  bool is_seasonal(const std::vector<double> &values,
                   const std::vector<TimePoint> &timestamps,
                   int period_hours = 24) const;

  bool is_seasonal(const TimeSeries &series, int period_hours = 24) const;
};

// UTC hour of day, 0-23.
int hour_of_day(TimePoint tp);

// Values of the points whose UTC hour equals `hour`, in series order.
std::vector<double> same_hour_values(const std::vector<TimeSeriesPoint> &points,
                                     int hour);

} // namespace analysis

#endif // SEASONALITY_ANALYZER_HPP
