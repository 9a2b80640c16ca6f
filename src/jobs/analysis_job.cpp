#include "analysis_job.hpp"
#include "analysis/seasonality_analyzer.hpp"
#include "core/errors.hpp"
#include "utils/worker_pool.hpp"

#include <algorithm>
#include <exception>
#include <iterator>
#include <utility>

namespace jobs {

namespace {

enum class SlotState { NOT_STARTED, ANALYZED, SKIPPED, FAILED };

struct SourceSlot {
  SlotState state = SlotState::NOT_STARTED;
  std::string error;
};

} // namespace

AnalysisJob::AnalysisJob(std::string job_name, LogComponent log_component,
                         std::shared_ptr<IMetricsSource> metrics_source,
                         std::shared_ptr<IAlertDispatcher> dispatcher,
                         std::shared_ptr<JobMetrics> metrics)
    : job_name_(std::move(job_name)), log_component_(log_component),
      metrics_source_(std::move(metrics_source)),
      dispatcher_(std::move(dispatcher)), metrics_(std::move(metrics)) {
  if (!metrics_source_)
    throw ConfigurationError(job_name_ + " job requires a metrics source");
  if (!dispatcher_)
    throw ConfigurationError(job_name_ + " job requires an alert dispatcher");
}

SourceSummary AnalysisJob::summarize(const TimeSeries &series,
                                     size_t trend_window) const {
  SourceSummary summary;
  summary.source = series.get_source();
  summary.kind = series.get_kind();
  summary.sample_count = series.size();

  auto values = series.values();
  if (!values.empty())
    summary.latest_value = values.back();
  summary.trend = analysis::stats::detect_trend(values, trend_window);
  summary.percentiles = analysis::stats::compute_percentiles(values);
  summary.is_seasonal = analysis::SeasonalityAnalyzer().is_seasonal(series);
  return summary;
}

size_t AnalysisJob::dispatch_records(const std::vector<AnomalyRecord> &records) {
  size_t failures = 0;
  for (const auto &record : records) {
    if (metrics_)
      metrics_->record_anomaly(record);

    bool delivered = false;
    try {
      delivered = dispatcher_->dispatch(record);
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, log_component_,
          dispatcher_->get_name() << " threw for '" << record.source
                                  << "': " << e.what());
    }

    if (!delivered) {
      ++failures;
      if (metrics_)
        metrics_->record_dispatch_failure();
      LOG(LogLevel::WARN, log_component_,
          "Alert not delivered: " << format_anomaly_summary(record));
    }
  }
  return failures;
}

JobResult AnalysisJob::run(const RunContext &ctx) {
  auto started = std::chrono::steady_clock::now();
  const auto &source_names = sources();

  JobResult result;
  result.job_name = job_name_;

  LOG(LogLevel::INFO, log_component_,
      "Starting " << job_name_ << " run over " << source_names.size()
                  << " source(s)");

  std::vector<SourceSlot> slots(source_names.size());
  std::vector<SourceOutcome> outcomes(source_names.size());

  if (!source_names.empty()) {
    size_t workers =
        std::min(source_names.size(), std::max<size_t>(1, max_workers()));
    Utils::WorkerPool pool(workers);

    for (size_t i = 0; i < source_names.size(); ++i) {
      pool.submit([this, &ctx, &source_names, &slots, &outcomes, i] {
        if (ctx.is_cancelled())
          return;

        const auto &source = source_names[i];
        try {
          outcomes[i] = analyze_source(source, ctx);
          slots[i].state =
              outcomes[i].skipped ? SlotState::SKIPPED : SlotState::ANALYZED;
        } catch (const CollaboratorError &e) {
          slots[i].state = SlotState::FAILED;
          slots[i].error = e.what();
        } catch (const std::exception &e) {
          slots[i].state = SlotState::FAILED;
          slots[i].error = std::string("unexpected error: ") + e.what();
        }
      });
    }
    pool.join();
  }

  for (size_t i = 0; i < source_names.size(); ++i) {
    const auto &source = source_names[i];
    auto &outcome = outcomes[i];

    switch (slots[i].state) {
    case SlotState::NOT_STARTED:
      result.cancelled = true;
      break;
    case SlotState::FAILED:
      LOG(LogLevel::ERROR, log_component_,
          "Skipping '" << source << "': " << slots[i].error);
      result.failures.push_back({source, slots[i].error});
      if (metrics_)
        metrics_->record_source_failed();
      break;
    case SlotState::SKIPPED:
      ++result.sources_skipped;
      if (metrics_)
        metrics_->record_source_skipped();
      break;
    case SlotState::ANALYZED:
      ++result.sources_analyzed;
      if (metrics_)
        metrics_->record_source_analyzed();
      result.dispatch_failures += dispatch_records(outcome.records);
      std::move(outcome.records.begin(), outcome.records.end(),
                std::back_inserter(result.records));
      std::move(outcome.summaries.begin(), outcome.summaries.end(),
                std::back_inserter(result.summaries));
      break;
    }
  }

  std::chrono::duration<double> elapsed =
      std::chrono::steady_clock::now() - started;
  if (metrics_)
    metrics_->observe_run_duration(elapsed);

  if (result.cancelled)
    LOG(LogLevel::WARN, log_component_,
        job_name_ << " run cancelled before all sources were analyzed");

  LOG(LogLevel::INFO, log_component_,
      job_name_ << " run finished in " << elapsed.count() << "s: "
                << result.sources_analyzed << " analyzed, "
                << result.sources_skipped << " skipped, "
                << result.failures.size() << " failed, "
                << result.records.size() << " anomalies, "
                << result.dispatch_failures << " undelivered");
  return result;
}

} // namespace jobs
