#ifndef PROMETHEUS_METRICS_SOURCE_HPP
#define PROMETHEUS_METRICS_SOURCE_HPP

#include "base_metrics_source.hpp"
#include "core/config.hpp"
#include "prometheus_client.hpp"

#include <map>
#include <memory>
#include <string>

// IMetricsSource backed by the Prometheus range-query API. Each metric kind
// maps to a PromQL template in which "{{source}}" names the service or log
// group being analyzed.
class PrometheusMetricsSource : public IMetricsSource {
public:
  PrometheusMetricsSource(std::shared_ptr<PrometheusClient> client,
                          const Config::PrometheusSourceConfig &config);

  TimeSeries query(const MetricsQuery &q) override;
  std::string get_source_type() const override { return "prometheus"; }

  // PromQL for `kind` with the source substituted (quotes and backslashes
  // in the source are escaped). @throws CollaboratorError if no template
  std::string build_promql(MetricKind kind, const std::string &source) const;

  /**
   * Parses a query_range response into a series. Multiple result streams
   * are summed per timestamp; NaN or infinite samples are dropped as gaps.
   * @throws CollaboratorError for an error status or malformed JSON
   */
  static TimeSeries parse_range_response(const std::string &body,
                                         const std::string &source,
                                         MetricKind kind);

private:
  std::shared_ptr<PrometheusClient> client_;
  std::map<MetricKind, std::string> templates_;
};

#endif // PROMETHEUS_METRICS_SOURCE_HPP
