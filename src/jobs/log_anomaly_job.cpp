#include "log_anomaly_job.hpp"

#include <utility>

namespace jobs {

namespace {

constexpr std::chrono::hours ONE_HOUR{1};

const Config::LogJobConfig &validated(const Config::LogJobConfig &config) {
  Config::require_valid(config);
  return config;
}

} // namespace

analysis::DetectorPolicy
LogAnomalyJob::make_error_policy(const Config::LogJobConfig &config) {
  analysis::DetectorPolicy policy;
  policy.detector_name = "log_error";
  policy.detect_drops = false;
  policy.high_severity_multiplier = config.error_high_severity_multiplier;
  policy.evaluation_points = 1;
  policy.seasonal_adjustment = config.seasonal_adjustment;
  return policy;
}

analysis::DetectorPolicy
LogAnomalyJob::make_volume_policy(const Config::LogJobConfig &config) {
  analysis::DetectorPolicy policy;
  policy.detector_name = "log_volume";
  policy.detect_drops = true;
  policy.drop_ratio = config.volume_drop_ratio;
  policy.min_baseline_for_drop = config.volume_min_baseline_for_drop;
  policy.high_severity_multiplier = config.volume_high_severity_multiplier;
  policy.evaluation_points = 1;
  policy.seasonal_adjustment = config.seasonal_adjustment;
  return policy;
}

LogAnomalyJob::LogAnomalyJob(std::shared_ptr<IMetricsSource> metrics_source,
                             std::shared_ptr<IAlertDispatcher> dispatcher,
                             Config::LogJobConfig config,
                             std::shared_ptr<JobMetrics> metrics)
    : AnalysisJob("logs", LogComponent::JOBS_LOG, std::move(metrics_source),
                  std::move(dispatcher), std::move(metrics)),
      config_(validated(config)), error_detector_(make_error_policy(config_)),
      volume_detector_(make_volume_policy(config_)) {}

MetricsQuery LogAnomalyJob::make_query(const std::string &log_source,
                                       MetricKind kind,
                                       const RunContext &ctx) const {
  MetricsQuery query;
  query.source = log_source;
  query.kind = kind;
  query.end = ctx.now;
  query.start = ctx.now - ONE_HOUR * config_.lookback_hours;
  query.resolution = ONE_HOUR;
  query.timeout = std::chrono::milliseconds(config_.query_timeout_ms);
  return query;
}

bool LogAnomalyJob::has_history(const TimeSeries &series) const {
  return series.size() >= 2 &&
         series.span() >= ONE_HOUR * config_.min_history_hours;
}

AnalysisJob::SourceOutcome
LogAnomalyJob::analyze_source(const std::string &log_source,
                              const RunContext &ctx) const {
  // Both queries must succeed before anything is evaluated.
  TimeSeries errors = metrics_source().query(
      make_query(log_source, MetricKind::ERROR_COUNT, ctx));
  TimeSeries volume = metrics_source().query(
      make_query(log_source, MetricKind::LOG_VOLUME, ctx));

  SourceOutcome outcome;
  bool evaluated = false;

  if (has_history(errors)) {
    auto found =
        error_detector_.detect(errors, config_.baseline_window_hours,
                               config_.error_sensitivity,
                               config_.error_min_absolute_value);
    outcome.records.insert(outcome.records.end(), found.begin(), found.end());
    outcome.summaries.push_back(summarize(errors, config_.trend_window));
    evaluated = true;
  } else {
    LOG(LogLevel::DEBUG, LogComponent::JOBS_LOG,
        "'" << log_source << "': error series spans "
            << errors.span().count() / 3600 << "h, "
            << config_.min_history_hours << "h required");
  }

  if (has_history(volume)) {
    auto found =
        volume_detector_.detect(volume, config_.baseline_window_hours,
                                config_.volume_sensitivity,
                                config_.volume_min_absolute_value);
    outcome.records.insert(outcome.records.end(), found.begin(), found.end());
    outcome.summaries.push_back(summarize(volume, config_.trend_window));
    evaluated = true;
  } else {
    LOG(LogLevel::DEBUG, LogComponent::JOBS_LOG,
        "'" << log_source << "': volume series spans "
            << volume.span().count() / 3600 << "h, "
            << config_.min_history_hours << "h required");
  }

  if (!evaluated) {
    LOG(LogLevel::INFO, LogComponent::JOBS_LOG,
        "Skipping '" << log_source << "': not enough hourly history");
    outcome.skipped = true;
    return outcome;
  }

  LOG(LogLevel::DEBUG, LogComponent::JOBS_LOG,
      "'" << log_source << "': " << outcome.records.size()
          << " anomaly(ies) across error and volume checks");
  return outcome;
}

} // namespace jobs
