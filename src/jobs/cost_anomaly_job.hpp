#ifndef COST_ANOMALY_JOB_HPP
#define COST_ANOMALY_JOB_HPP

#include "analysis/anomaly_detector.hpp"
#include "analysis_job.hpp"
#include "core/config.hpp"

namespace jobs {

// Daily spend per service: flags the latest day when it breaks out of the
// trailing baseline, or collapses far below it.
class CostAnomalyJob : public AnalysisJob {
public:
  /**
   * @throws ConfigurationError if `config` fails validation or a
   * collaborator is missing
   */
  CostAnomalyJob(std::shared_ptr<IMetricsSource> metrics_source,
                 std::shared_ptr<IAlertDispatcher> dispatcher,
                 Config::CostJobConfig config,
                 std::shared_ptr<JobMetrics> metrics = nullptr);

  const Config::CostJobConfig &get_config() const { return config_; }

protected:
  const std::vector<std::string> &sources() const override {
    return config_.services;
  }
  size_t max_workers() const override { return config_.max_workers; }
  SourceOutcome analyze_source(const std::string &service,
                               const RunContext &ctx) const override;

private:
  static analysis::DetectorPolicy
  make_policy(const Config::CostJobConfig &config);

  Config::CostJobConfig config_;
  analysis::AnomalyDetector detector_;
};

} // namespace jobs

#endif // COST_ANOMALY_JOB_HPP
