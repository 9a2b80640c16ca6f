#include "prometheus_metrics_source.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

#include <cmath>
#include <cstdint>
#include <nlohmann/json.hpp>
#include <optional>
#include <set>
#include <utility>
#include <vector>

namespace {

constexpr const char *SOURCE_PLACEHOLDER = "{{source}}";

std::string escape_label_value(const std::string &value) {
  std::string out;
  out.reserve(value.size());
  for (char c : value) {
    if (c == '"' || c == '\\')
      out.push_back('\\');
    out.push_back(c);
  }
  return out;
}

// Prometheus encodes sample values as strings, including "NaN" and "+Inf".
std::optional<double> parse_sample_value(const std::string &text) {
  if (text == "NaN" || text == "+Inf" || text == "-Inf" || text == "Inf")
    return std::nullopt;
  auto value = Utils::string_to_number<double>(text);
  if (!value)
    throw CollaboratorError("Malformed sample value '" + text + "'");
  if (!std::isfinite(*value))
    return std::nullopt;
  return value;
}

} // namespace

PrometheusMetricsSource::PrometheusMetricsSource(
    std::shared_ptr<PrometheusClient> client,
    const Config::PrometheusSourceConfig &config)
    : client_(std::move(client)) {
  if (!client_)
    throw ConfigurationError("PrometheusMetricsSource requires a client");

  templates_[MetricKind::COST] = config.cost_query;
  templates_[MetricKind::ERROR_COUNT] = config.error_count_query;
  templates_[MetricKind::LOG_VOLUME] = config.log_volume_query;
  templates_[MetricKind::CPU_PERCENT] = config.cpu_percent_query;
}

std::string PrometheusMetricsSource::build_promql(MetricKind kind,
                                                  const std::string &source) const {
  auto it = templates_.find(kind);
  if (it == templates_.end() || it->second.empty())
    throw CollaboratorError("No PromQL template configured for metric '" +
                            metric_kind_to_string(kind) + "'");

  std::string promql = it->second;
  std::string escaped = escape_label_value(source);
  std::string placeholder = SOURCE_PLACEHOLDER;
  size_t pos = 0;
  while ((pos = promql.find(placeholder, pos)) != std::string::npos) {
    promql.replace(pos, placeholder.size(), escaped);
    pos += escaped.size();
  }
  return promql;
}

TimeSeries PrometheusMetricsSource::query(const MetricsQuery &q) {
  std::string promql = build_promql(q.kind, q.source);
  LOG(LogLevel::DEBUG, LogComponent::IO_QUERY,
      "Range query for '" << q.source << "' ("
                          << metric_kind_to_string(q.kind)
                          << "): " << promql);

  std::string body =
      client_->query_range(promql, q.start, q.end, q.resolution, q.timeout);
  auto series = parse_range_response(body, q.source, q.kind);

  LOG(LogLevel::DEBUG, LogComponent::IO_QUERY,
      "Received " << series.size() << " sample(s) for '" << q.source << "'");
  return series;
}

TimeSeries PrometheusMetricsSource::parse_range_response(
    const std::string &body, const std::string &source, MetricKind kind) {
  nlohmann::json json;
  try {
    json = nlohmann::json::parse(body);
  } catch (const nlohmann::json::parse_error &e) {
    throw CollaboratorError(std::string("Invalid JSON from Prometheus: ") +
                            e.what());
  }

  // Samples keyed by epoch milliseconds, summed across result streams.
  std::map<int64_t, double> samples;
  try {
    if (!json.is_object() || json.value("status", "") != "success") {
      throw CollaboratorError(
          "Prometheus query failed: " +
          (json.is_object() ? json.value("errorType", std::string("unknown")) +
                                  ": " + json.value("error", std::string(""))
                            : std::string("response is not an object")));
    }

    const auto &data = json.at("data");
    if (data.value("resultType", "") != "matrix")
      throw CollaboratorError("Expected a matrix result, got '" +
                              data.value("resultType", std::string("")) + "'");

    const auto &result = data.at("result");
    if (result.size() > 1)
      LOG(LogLevel::WARN, LogComponent::IO_QUERY,
          result.size() << " series returned for '" << source
                        << "'; summing them per timestamp");

    for (const auto &stream : result) {
      std::set<int64_t> seen;
      for (const auto &pair : stream.at("values")) {
        double ts = pair.at(0).get<double>();
        auto ms = static_cast<int64_t>(std::llround(ts * 1000.0));
        if (!seen.insert(ms).second)
          throw CollaboratorError("Duplicate sample timestamp " +
                                  std::to_string(ts) + " for '" + source +
                                  "'");

        auto value = parse_sample_value(pair.at(1).get<std::string>());
        if (value)
          samples[ms] += *value;
      }
    }
  } catch (const nlohmann::json::exception &e) {
    throw CollaboratorError(std::string("Malformed Prometheus response: ") +
                            e.what());
  }

  std::vector<TimeSeriesPoint> points;
  points.reserve(samples.size());
  for (const auto &[ms, value] : samples)
    points.push_back(
        {Utils::time_point_from_unix_seconds(static_cast<double>(ms) / 1000.0),
         value});

  try {
    return TimeSeries(source, kind, std::move(points));
  } catch (const InvalidInputError &e) {
    throw CollaboratorError(std::string("Unusable series from Prometheus: ") +
                            e.what());
  }
}
