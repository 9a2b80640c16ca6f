#ifndef LOG_ANOMALY_JOB_HPP
#define LOG_ANOMALY_JOB_HPP

#include "analysis/anomaly_detector.hpp"
#include "analysis_job.hpp"
#include "core/config.hpp"

namespace jobs {

/**
 * Hourly log health per log group. Two checks run on the current hour:
 *  - error count spikes against the trailing baseline (drops are normal)
 *  - total volume spikes, and drops that suggest a source went quiet
 * A failed query for either metric fails the whole source.
 */
class LogAnomalyJob : public AnalysisJob {
public:
  /**
   * @throws ConfigurationError if `config` fails validation or a
   * collaborator is missing
   */
  LogAnomalyJob(std::shared_ptr<IMetricsSource> metrics_source,
                std::shared_ptr<IAlertDispatcher> dispatcher,
                Config::LogJobConfig config,
                std::shared_ptr<JobMetrics> metrics = nullptr);

  const Config::LogJobConfig &get_config() const { return config_; }

protected:
  const std::vector<std::string> &sources() const override {
    return config_.log_sources;
  }
  size_t max_workers() const override { return config_.max_workers; }
  SourceOutcome analyze_source(const std::string &log_source,
                               const RunContext &ctx) const override;

private:
  static analysis::DetectorPolicy
  make_error_policy(const Config::LogJobConfig &config);
  static analysis::DetectorPolicy
  make_volume_policy(const Config::LogJobConfig &config);

  MetricsQuery make_query(const std::string &log_source, MetricKind kind,
                          const RunContext &ctx) const;
  bool has_history(const TimeSeries &series) const;

  Config::LogJobConfig config_;
  analysis::AnomalyDetector error_detector_;
  analysis::AnomalyDetector volume_detector_;
};

} // namespace jobs

#endif // LOG_ANOMALY_JOB_HPP
