#include "metrics_registry.hpp"
#include "logger.hpp"

#include <cstdio>
#include <fstream>
#include <prometheus/text_serializer.h>
#include <utility>

namespace {

const prometheus::Histogram::BucketBoundaries &run_duration_buckets() {
  static const prometheus::Histogram::BucketBoundaries buckets = {
      0.05, 0.1, 0.25, 0.5, 1.0, 2.5, 5.0, 10.0, 30.0, 60.0, 120.0};
  return buckets;
}

} // namespace

MetricsRegistry &MetricsRegistry::instance() {
  static MetricsRegistry instance;
  return instance;
}

MetricsRegistry::MetricsRegistry()
    : registry_(std::make_shared<prometheus::Registry>()),
      sources_family_(prometheus::BuildCounter()
                          .Name("metric_analyzer_sources_total")
                          .Help("Sources processed per job run, by outcome")
                          .Register(*registry_)),
      anomalies_family_(prometheus::BuildCounter()
                            .Name("metric_analyzer_anomalies_total")
                            .Help("Anomaly records produced, by kind and "
                                  "severity")
                            .Register(*registry_)),
      dispatch_failures_family_(
          prometheus::BuildCounter()
              .Name("metric_analyzer_dispatch_failures_total")
              .Help("Anomaly records the alert dispatcher did not accept")
              .Register(*registry_)),
      run_duration_family_(prometheus::BuildHistogram()
                               .Name("metric_analyzer_run_duration_seconds")
                               .Help("Wall-clock duration of a job run")
                               .Register(*registry_)) {}

std::shared_ptr<prometheus::Registry> MetricsRegistry::get_registry() {
  return registry_;
}

std::shared_ptr<JobMetrics>
MetricsRegistry::create_job_metrics(const std::string &job_name) {
  return std::make_shared<JobMetrics>(job_name, sources_family_,
                                      anomalies_family_,
                                      dispatch_failures_family_,
                                      run_duration_family_);
}

std::string MetricsRegistry::serialize() const {
  prometheus::TextSerializer serializer;
  return serializer.Serialize(registry_->Collect());
}

bool MetricsRegistry::write_textfile(const std::string &path) const {
  std::string tmp_path = path + ".tmp";
  {
    std::ofstream out(tmp_path, std::ios::trunc);
    if (!out.is_open()) {
      LOG(LogLevel::ERROR, LogComponent::METRICS,
          "Cannot open metrics textfile " << tmp_path);
      return false;
    }
    out << serialize();
    if (!out) {
      LOG(LogLevel::ERROR, LogComponent::METRICS,
          "Failed writing metrics textfile " << tmp_path);
      return false;
    }
  }

  if (std::rename(tmp_path.c_str(), path.c_str()) != 0) {
    LOG(LogLevel::ERROR, LogComponent::METRICS,
        "Cannot move metrics textfile into place at " << path);
    return false;
  }
  LOG(LogLevel::DEBUG, LogComponent::METRICS, "Metrics written to " << path);
  return true;
}

JobMetrics::JobMetrics(
    std::string job_name,
    prometheus::Family<prometheus::Counter> &sources_family,
    prometheus::Family<prometheus::Counter> &anomalies_family,
    prometheus::Family<prometheus::Counter> &dispatch_failures_family,
    prometheus::Family<prometheus::Histogram> &run_duration_family)
    : job_name_(std::move(job_name)),
      sources_analyzed_(
          sources_family.Add({{"job", job_name_}, {"outcome", "analyzed"}})),
      sources_skipped_(
          sources_family.Add({{"job", job_name_}, {"outcome", "skipped"}})),
      sources_failed_(
          sources_family.Add({{"job", job_name_}, {"outcome", "failed"}})),
      anomalies_family_(anomalies_family),
      dispatch_failures_(dispatch_failures_family.Add({{"job", job_name_}})),
      run_duration_(run_duration_family.Add({{"job", job_name_}},
                                            run_duration_buckets())) {}

void JobMetrics::record_anomaly(const AnomalyRecord &record) {
  anomalies_family_
      .Add({{"job", job_name_},
            {"kind", anomaly_kind_to_string(record.kind)},
            {"severity", anomaly_severity_to_string(record.severity)}})
      .Increment();
}

void JobMetrics::observe_run_duration(std::chrono::duration<double> elapsed) {
  run_duration_.Observe(elapsed.count());
}
