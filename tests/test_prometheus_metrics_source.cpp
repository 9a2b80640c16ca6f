#include "core/errors.hpp"
#include "io/metrics_query/prometheus_metrics_source.hpp"
#include "utils/utils.hpp"

#include <gtest/gtest.h>
#include <memory>
#include <string>

namespace {

std::string matrix_body(const std::string &result) {
  return R"({"status":"success","data":{"resultType":"matrix","result":)" +
         result + "}}";
}

class PrometheusMetricsSourceTest : public ::testing::Test {
protected:
  void SetUp() override {
    PrometheusClientConfig cfg;
    cfg.endpoint_url = "http://127.0.0.1:1";
    client_ = std::make_shared<PrometheusClient>(cfg);
  }

  std::shared_ptr<PrometheusClient> client_;
  Config::PrometheusSourceConfig source_config_;
};

} // namespace

TEST_F(PrometheusMetricsSourceTest, ParsesMatrixResult) {
  auto body = matrix_body(
      R"([{"metric":{"service":"ec2"},"values":[[1704067200,"100.5"],[1704153600,"98"]]}])");
  auto series = PrometheusMetricsSource::parse_range_response(
      body, "ec2", MetricKind::COST);

  ASSERT_EQ(series.size(), 2u);
  EXPECT_EQ(series.get_source(), "ec2");
  EXPECT_EQ(series.get_kind(), MetricKind::COST);
  EXPECT_EQ(Utils::to_unix_seconds(series.get_points()[0].timestamp), 1704067200);
  EXPECT_DOUBLE_EQ(series.get_points()[0].value, 100.5);
  EXPECT_DOUBLE_EQ(series.get_points()[1].value, 98.0);
}

TEST_F(PrometheusMetricsSourceTest, EmptyResultGivesEmptySeries) {
  auto series = PrometheusMetricsSource::parse_range_response(
      matrix_body("[]"), "ec2", MetricKind::COST);
  EXPECT_TRUE(series.empty());
}

TEST_F(PrometheusMetricsSourceTest, NonFiniteSamplesBecomeGaps) {
  auto body = matrix_body(
      R"([{"metric":{},"values":[[1704067200,"1"],[1704070800,"NaN"],[1704074400,"+Inf"],[1704078000,"4"]]}])");
  auto series = PrometheusMetricsSource::parse_range_response(
      body, "api", MetricKind::ERROR_COUNT);

  ASSERT_EQ(series.size(), 2u);
  EXPECT_DOUBLE_EQ(series.get_points()[0].value, 1.0);
  EXPECT_DOUBLE_EQ(series.get_points()[1].value, 4.0);
}

TEST_F(PrometheusMetricsSourceTest, SumsMultipleStreamsPerTimestamp) {
  auto body = matrix_body(
      R"([{"metric":{"az":"a"},"values":[[1704067200,"1"],[1704070800,"2"]]},)"
      R"({"metric":{"az":"b"},"values":[[1704067200,"10"],[1704074400,"5"]]}])");
  auto series = PrometheusMetricsSource::parse_range_response(
      body, "api", MetricKind::LOG_VOLUME);

  ASSERT_EQ(series.size(), 3u);
  EXPECT_DOUBLE_EQ(series.get_points()[0].value, 11.0);
  EXPECT_DOUBLE_EQ(series.get_points()[1].value, 2.0);
  EXPECT_DOUBLE_EQ(series.get_points()[2].value, 5.0);
}

TEST_F(PrometheusMetricsSourceTest, RejectsErrorResponses) {
  EXPECT_THROW(PrometheusMetricsSource::parse_range_response(
                   R"({"status":"error","errorType":"bad_data","error":"parse error"})",
                   "ec2", MetricKind::COST),
               CollaboratorError);
  EXPECT_THROW(PrometheusMetricsSource::parse_range_response(
                   "not json", "ec2", MetricKind::COST),
               CollaboratorError);
  EXPECT_THROW(PrometheusMetricsSource::parse_range_response(
                   "[]", "ec2", MetricKind::COST),
               CollaboratorError);
  EXPECT_THROW(
      PrometheusMetricsSource::parse_range_response(
          R"({"status":"success","data":{"resultType":"vector","result":[]}})",
          "ec2", MetricKind::COST),
      CollaboratorError);
}

TEST_F(PrometheusMetricsSourceTest, RejectsMalformedSamples) {
  EXPECT_THROW(PrometheusMetricsSource::parse_range_response(
                   matrix_body(R"([{"values":[[1704067200,"abc"]]}])"), "ec2",
                   MetricKind::COST),
               CollaboratorError);
  EXPECT_THROW(PrometheusMetricsSource::parse_range_response(
                   matrix_body(R"([{"values":[[1704067200]]}])"), "ec2",
                   MetricKind::COST),
               CollaboratorError);
  EXPECT_THROW(PrometheusMetricsSource::parse_range_response(
                   matrix_body(R"([{"metric":{}}])"), "ec2", MetricKind::COST),
               CollaboratorError);
}

TEST_F(PrometheusMetricsSourceTest, RejectsDuplicateTimestampsWithinStream) {
  auto body = matrix_body(
      R"([{"values":[[1704067200,"1"],[1704067200,"2"]]}])");
  EXPECT_THROW(PrometheusMetricsSource::parse_range_response(
                   body, "ec2", MetricKind::COST),
               CollaboratorError);
}

TEST_F(PrometheusMetricsSourceTest, BuildsPromqlFromTemplates) {
  PrometheusMetricsSource source(client_, source_config_);
  EXPECT_EQ(source.get_source_type(), "prometheus");
  EXPECT_EQ(
      source.build_promql(MetricKind::COST, "ec2"),
      "sum(increase(cloud_cost_dollars_total{service=\"ec2\"}[1d]))");
  EXPECT_EQ(source.build_promql(MetricKind::LOG_VOLUME, "/aws/lambda/api"),
            "sum(increase(log_events_total{log_group=\"/aws/lambda/api\"}[1h]))");
}

TEST_F(PrometheusMetricsSourceTest, EscapesSourceInLabelValues) {
  source_config_.cost_query = "cost{a=\"{{source}}\",b=\"{{source}}\"}";
  PrometheusMetricsSource source(client_, source_config_);
  EXPECT_EQ(source.build_promql(MetricKind::COST, "x\"y\\z"),
            "cost{a=\"x\\\"y\\\\z\",b=\"x\\\"y\\\\z\"}");
}

TEST_F(PrometheusMetricsSourceTest, MissingTemplateIsCollaboratorError) {
  source_config_.cpu_percent_query.clear();
  PrometheusMetricsSource source(client_, source_config_);
  EXPECT_THROW(source.build_promql(MetricKind::CPU_PERCENT, "i-1"),
               CollaboratorError);
}

TEST_F(PrometheusMetricsSourceTest, RequiresClient) {
  EXPECT_THROW(PrometheusMetricsSource(nullptr, source_config_),
               ConfigurationError);
}

TEST_F(PrometheusMetricsSourceTest, UnreachableServerFailsQuery) {
  PrometheusClientConfig cfg;
  cfg.endpoint_url = "http://127.0.0.1:1";
  cfg.timeout = std::chrono::milliseconds(200);
  cfg.max_retries = 0;
  PrometheusMetricsSource source(std::make_shared<PrometheusClient>(cfg),
                                 source_config_);

  MetricsQuery q;
  q.source = "ec2";
  q.kind = MetricKind::COST;
  q.end = std::chrono::system_clock::now();
  q.start = q.end - std::chrono::hours(24);
  q.timeout = std::chrono::milliseconds(500);
  EXPECT_THROW(source.query(q), CollaboratorError);
}
