#ifndef ANALYSIS_JOB_HPP
#define ANALYSIS_JOB_HPP

#include "analysis/statistics.hpp"
#include "core/anomaly_record.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "core/time_series.hpp"
#include "io/alert_dispatch/base_dispatcher.hpp"
#include "io/metrics_query/base_metrics_source.hpp"

#include <atomic>
#include <chrono>
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace jobs {

struct RunContext {
  TimePoint now = std::chrono::system_clock::now();
  // Checked before each source starts; sources already running finish.
  const std::atomic<bool> *cancel_requested = nullptr;

  bool is_cancelled() const {
    return cancel_requested != nullptr && cancel_requested->load();
  }
};

struct SourceFailure {
  std::string source;
  std::string reason;
};

// Descriptive statistics for one analyzed series, reported alongside any
// anomalies.
struct SourceSummary {
  std::string source;
  MetricKind kind = MetricKind::COST;
  size_t sample_count = 0;
  double latest_value = 0.0;
  analysis::stats::TrendResult trend;
  analysis::stats::PercentileSet percentiles;
  bool is_seasonal = false;
};

struct JobResult {
  std::string job_name;
  size_t sources_analyzed = 0;
  size_t sources_skipped = 0; // not enough data, not an error
  std::vector<SourceFailure> failures;
  std::vector<AnomalyRecord> records;
  std::vector<SourceSummary> summaries;
  size_t dispatch_failures = 0;
  bool cancelled = false;
};

/**
 * Shared run loop of the anomaly jobs. Sources are analyzed concurrently on
 * a bounded worker pool; results are collected in configuration order and
 * every record is then handed to the dispatcher exactly once.
 */
class AnalysisJob {
public:
  AnalysisJob(std::string job_name, LogComponent log_component,
              std::shared_ptr<IMetricsSource> metrics_source,
              std::shared_ptr<IAlertDispatcher> dispatcher,
              std::shared_ptr<JobMetrics> metrics);
  virtual ~AnalysisJob() = default;

  AnalysisJob(const AnalysisJob &) = delete;
  AnalysisJob &operator=(const AnalysisJob &) = delete;

  JobResult run(const RunContext &ctx);

  const std::string &get_name() const { return job_name_; }

protected:
  struct SourceOutcome {
    bool skipped = false;
    std::vector<AnomalyRecord> records;
    std::vector<SourceSummary> summaries;
  };

  virtual const std::vector<std::string> &sources() const = 0;
  virtual size_t max_workers() const = 0;

  // Runs on a worker thread. @throws CollaboratorError when a query fails
  virtual SourceOutcome analyze_source(const std::string &source,
                                       const RunContext &ctx) const = 0;

  SourceSummary summarize(const TimeSeries &series,
                          size_t trend_window) const;

  IMetricsSource &metrics_source() const { return *metrics_source_; }
  LogComponent log_component() const { return log_component_; }

private:
  size_t dispatch_records(const std::vector<AnomalyRecord> &records);

  std::string job_name_;
  LogComponent log_component_;
  std::shared_ptr<IMetricsSource> metrics_source_;
  std::shared_ptr<IAlertDispatcher> dispatcher_;
  std::shared_ptr<JobMetrics> metrics_;
};

} // namespace jobs

#endif // ANALYSIS_JOB_HPP
