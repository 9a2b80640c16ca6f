#ifndef METRICS_REGISTRY_HPP
#define METRICS_REGISTRY_HPP

#include "anomaly_record.hpp"

#include <chrono>
#include <memory>
#include <prometheus/counter.h>
#include <prometheus/family.h>
#include <prometheus/histogram.h>
#include <prometheus/registry.h>
#include <string>

class JobMetrics;

// Owns the prometheus registry and the metric families shared by all jobs.
// The CLI uses the process-wide instance(); tests build their own.
class MetricsRegistry {
public:
  static MetricsRegistry &instance();

  MetricsRegistry();
  MetricsRegistry(const MetricsRegistry &) = delete;
  MetricsRegistry &operator=(const MetricsRegistry &) = delete;

  std::shared_ptr<prometheus::Registry> get_registry();

  // Children labelled job=<job_name> in every family.
  std::shared_ptr<JobMetrics> create_job_metrics(const std::string &job_name);

  // Text exposition format of everything registered so far.
  std::string serialize() const;

  // Writes serialize() to `path` via a temporary file and rename, for the
  // node_exporter textfile collector. Returns false on I/O failure.
  bool write_textfile(const std::string &path) const;

private:
  std::shared_ptr<prometheus::Registry> registry_;

  prometheus::Family<prometheus::Counter> &sources_family_;
  prometheus::Family<prometheus::Counter> &anomalies_family_;
  prometheus::Family<prometheus::Counter> &dispatch_failures_family_;
  prometheus::Family<prometheus::Histogram> &run_duration_family_;
};

class JobMetrics {
public:
  JobMetrics(std::string job_name,
             prometheus::Family<prometheus::Counter> &sources_family,
             prometheus::Family<prometheus::Counter> &anomalies_family,
             prometheus::Family<prometheus::Counter> &dispatch_failures_family,
             prometheus::Family<prometheus::Histogram> &run_duration_family);

  void record_source_analyzed() { sources_analyzed_.Increment(); }
  void record_source_skipped() { sources_skipped_.Increment(); }
  void record_source_failed() { sources_failed_.Increment(); }
  void record_dispatch_failure() { dispatch_failures_.Increment(); }
  void record_anomaly(const AnomalyRecord &record);
  void observe_run_duration(std::chrono::duration<double> elapsed);

  const std::string &get_job_name() const { return job_name_; }

private:
  std::string job_name_;
  prometheus::Counter &sources_analyzed_;
  prometheus::Counter &sources_skipped_;
  prometheus::Counter &sources_failed_;
  prometheus::Family<prometheus::Counter> &anomalies_family_;
  prometheus::Counter &dispatch_failures_;
  prometheus::Histogram &run_duration_;
};

#endif // METRICS_REGISTRY_HPP
