#include "cost_anomaly_job.hpp"

#include <utility>

namespace jobs {

namespace {

constexpr std::chrono::hours ONE_DAY{24};

// Validation has to run before the detector member is built from the config.
const Config::CostJobConfig &validated(const Config::CostJobConfig &config) {
  Config::require_valid(config);
  return config;
}

} // namespace

analysis::DetectorPolicy
CostAnomalyJob::make_policy(const Config::CostJobConfig &config) {
  analysis::DetectorPolicy policy;
  policy.detector_name = "cost";
  policy.detect_drops = true;
  policy.drop_ratio = config.drop_ratio;
  policy.min_baseline_for_drop = config.min_baseline_for_drop;
  policy.high_severity_multiplier = config.high_severity_multiplier;
  policy.evaluation_points = 1;
  policy.seasonal_adjustment = config.seasonal_adjustment;
  return policy;
}

CostAnomalyJob::CostAnomalyJob(std::shared_ptr<IMetricsSource> metrics_source,
                               std::shared_ptr<IAlertDispatcher> dispatcher,
                               Config::CostJobConfig config,
                               std::shared_ptr<JobMetrics> metrics)
    : AnalysisJob("cost", LogComponent::JOBS_COST, std::move(metrics_source),
                  std::move(dispatcher), std::move(metrics)),
      config_(validated(config)), detector_(make_policy(config_)) {}

AnalysisJob::SourceOutcome
CostAnomalyJob::analyze_source(const std::string &service,
                               const RunContext &ctx) const {
  MetricsQuery query;
  query.source = service;
  query.kind = MetricKind::COST;
  query.end = ctx.now;
  query.start = ctx.now - ONE_DAY * config_.lookback_days;
  query.resolution = ONE_DAY;
  query.timeout = std::chrono::milliseconds(config_.query_timeout_ms);

  TimeSeries series = metrics_source().query(query);

  SourceOutcome outcome;
  if (series.size() < config_.min_data_points) {
    LOG(LogLevel::INFO, LogComponent::JOBS_COST,
        "Skipping '" << service << "': " << series.size() << " day(s) of data, "
                     << config_.min_data_points << " required");
    outcome.skipped = true;
    return outcome;
  }

  outcome.records =
      detector_.detect(series, config_.baseline_window_days,
                       config_.sensitivity, config_.min_absolute_value);
  outcome.summaries.push_back(summarize(series, config_.trend_window));

  const auto &summary = outcome.summaries.back();
  LOG(LogLevel::DEBUG, LogComponent::JOBS_COST,
      "'" << service << "': latest " << summary.latest_value << ", trend "
          << analysis::stats::trend_direction_to_string(summary.trend.direction)
          << " (" << summary.trend.change_percent << "%), "
          << outcome.records.size() << " anomaly(ies)");
  return outcome;
}

} // namespace jobs
