#include "seasonality_analyzer.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "statistics.hpp"

#include <ctime>
#include <string>

namespace analysis {

int hour_of_day(TimePoint tp) {
  std::time_t t = std::chrono::system_clock::to_time_t(tp);
  std::tm tm_utc{};
  gmtime_r(&t, &tm_utc);
  return tm_utc.tm_hour;
}

std::vector<double> same_hour_values(const std::vector<TimeSeriesPoint> &points,
                                     int hour) {
  std::vector<double> out;
  for (const auto &point : points) {
    if (hour_of_day(point.timestamp) == hour)
      out.push_back(point.value);
  }
  return out;
}

SeasonalityVerdict
SeasonalityAnalyzer::analyze(const std::vector<double> &values,
                             const std::vector<TimePoint> &timestamps,
                             int period_hours) const {
  if (values.size() != timestamps.size())
    throw InvalidInputError("Seasonality input length mismatch: " +
                            std::to_string(values.size()) + " values, " +
                            std::to_string(timestamps.size()) + " timestamps");
  if (period_hours <= 0)
    throw InvalidInputError("Seasonal period must be positive, got " +
                            std::to_string(period_hours));

  SeasonalityVerdict verdict;
  verdict.sample_count = values.size();

  // Need at least two full periods to compare an hour against itself.
  if (values.size() < 2 * static_cast<size_t>(period_hours))
    return verdict;

  std::map<int, std::vector<double>> buckets;
  for (size_t i = 0; i < values.size(); ++i)
    buckets[hour_of_day(timestamps[i])].push_back(values[i]);

  size_t low_cv_count = 0;
  for (const auto &[hour, bucket] : buckets) {
    if (bucket.size() < 2)
      continue;
    double cv = stats::coefficient_of_variation(bucket);
    verdict.hourly_cv[hour] = cv;
    if (cv < LOW_CV_LIMIT)
      ++low_cv_count;
  }

  if (verdict.hourly_cv.size() < MIN_CV_BUCKETS) {
    LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_SEASONALITY,
        "Only " << verdict.hourly_cv.size()
                << " hour bucket(s) with repeat samples; not seasonal");
    return verdict;
  }

  verdict.low_cv_share = static_cast<double>(low_cv_count) /
                         static_cast<double>(verdict.hourly_cv.size());
  verdict.is_seasonal = verdict.low_cv_share >= MIN_LOW_CV_SHARE;

  LOG(LogLevel::DEBUG, LogComponent::ANALYSIS_SEASONALITY,
      "Seasonality check over " << verdict.sample_count << " samples: "
                                << low_cv_count << "/"
                                << verdict.hourly_cv.size()
                                << " consistent hours, seasonal="
                                << (verdict.is_seasonal ? "yes" : "no"));
  return verdict;
}

bool SeasonalityAnalyzer::is_seasonal(const std::vector<double> &values,
                                      const std::vector<TimePoint> &timestamps,
                                      int period_hours) const {
  return analyze(values, timestamps, period_hours).is_seasonal;
}

bool SeasonalityAnalyzer::is_seasonal(const TimeSeries &series,
                                      int period_hours) const {
  return is_seasonal(series.values(), series.timestamps(), period_hours);
}

} // namespace analysis
