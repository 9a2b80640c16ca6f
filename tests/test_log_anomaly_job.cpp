#include "core/errors.hpp"
#include "jobs/log_anomaly_job.hpp"
#include "test_helpers.hpp"

#include <atomic>
#include <gtest/gtest.h>
#include <memory>
#include <vector>

using jobs::LogAnomalyJob;
using jobs::RunContext;
using test_support::base_time;
using test_support::FakeMetricsSource;
using test_support::hourly_series;
using test_support::RecordingDispatcher;

namespace {

// 24 hours alternating between 0 and 2 errors, then `last`.
std::vector<double> error_counts(double last) {
  std::vector<double> values;
  for (int h = 0; h < 24; ++h)
    values.push_back(h % 2 == 0 ? 0.0 : 2.0);
  values.push_back(last);
  return values;
}

// 24 hours of steady volume, then `last`.
std::vector<double> volumes(double last) {
  std::vector<double> values(24, 1000.0);
  values.push_back(last);
  return values;
}

// Hourly volume from 00:00 on day one to 16:00 on day three. 16:00 is the
// daily batch peak at 400 events, every other hour carries 100; the final
// 16:00 sample is `last`.
std::vector<double> daily_peak_volumes(double last) {
  std::vector<double> values;
  for (int h = 0; h <= 2 * 24 + 16; ++h)
    values.push_back(h % 24 == 16 ? 400.0 : 100.0);
  values.back() = last;
  return values;
}

} // namespace

class LogAnomalyJobTest : public ::testing::Test {
protected:
  void SetUp() override {
    source_ = std::make_shared<FakeMetricsSource>();
    dispatcher_ = std::make_shared<RecordingDispatcher>();
    ctx_.now = base_time() + std::chrono::hours(24);
  }

  void add_source(const std::string &name, const std::vector<double> &errors,
                  const std::vector<double> &volume) {
    source_->add(hourly_series(name, MetricKind::ERROR_COUNT, errors));
    source_->add(hourly_series(name, MetricKind::LOG_VOLUME, volume));
  }

  std::shared_ptr<FakeMetricsSource> source_;
  std::shared_ptr<RecordingDispatcher> dispatcher_;
  Config::LogJobConfig config_;
  RunContext ctx_;
};

TEST_F(LogAnomalyJobTest, ErrorBurstIsFlagged) {
  config_.log_sources = {"api"};
  add_source("api", error_counts(40.0), volumes(1000.0));
  LogAnomalyJob job(source_, dispatcher_, config_);
  auto result = job.run(ctx_);

  EXPECT_EQ(result.job_name, "logs");
  EXPECT_EQ(result.sources_analyzed, 1u);
  ASSERT_EQ(result.records.size(), 1u);
  const auto &r = result.records[0];
  EXPECT_EQ(r.source, "api");
  EXPECT_EQ(r.metric_kind, MetricKind::ERROR_COUNT);
  EXPECT_EQ(r.kind, AnomalyKind::SPIKE);
  EXPECT_EQ(r.severity, AnomalySeverity::HIGH);
  EXPECT_EQ(r.detector, "log_error");
  EXPECT_EQ(r.timestamp, base_time() + std::chrono::hours(24));
  EXPECT_EQ(dispatcher_->records().size(), 1u);
}

TEST_F(LogAnomalyJobTest, SmallErrorCountsStayBelowMinimum) {
  config_.log_sources = {"api"};
  // Well above the statistical threshold, below error_min_absolute_value.
  add_source("api", error_counts(8.0), volumes(1000.0));
  LogAnomalyJob job(source_, dispatcher_, config_);
  auto result = job.run(ctx_);

  EXPECT_EQ(result.sources_analyzed, 1u);
  EXPECT_TRUE(result.records.empty());
}

TEST_F(LogAnomalyJobTest, SilencedLogGroupIsAHighDrop) {
  config_.log_sources = {"api"};
  add_source("api", error_counts(0.0), volumes(0.0));
  LogAnomalyJob job(source_, dispatcher_, config_);
  auto result = job.run(ctx_);

  ASSERT_EQ(result.records.size(), 1u);
  const auto &r = result.records[0];
  EXPECT_EQ(r.metric_kind, MetricKind::LOG_VOLUME);
  EXPECT_EQ(r.kind, AnomalyKind::DROP);
  EXPECT_EQ(r.severity, AnomalySeverity::HIGH);
  EXPECT_EQ(r.detector, "log_volume");
  EXPECT_DOUBLE_EQ(r.baseline_mean, 1000.0);
}

TEST_F(LogAnomalyJobTest, PartialDropIsMedium) {
  config_.log_sources = {"api"};
  add_source("api", error_counts(0.0), volumes(50.0));
  LogAnomalyJob job(source_, dispatcher_, config_);
  auto result = job.run(ctx_);

  ASSERT_EQ(result.records.size(), 1u);
  EXPECT_EQ(result.records[0].kind, AnomalyKind::DROP);
  EXPECT_EQ(result.records[0].severity, AnomalySeverity::MEDIUM);
}

TEST_F(LogAnomalyJobTest, BothChecksReportInOrder) {
  config_.log_sources = {"api"};
  add_source("api", error_counts(40.0), volumes(0.0));
  LogAnomalyJob job(source_, dispatcher_, config_);
  auto result = job.run(ctx_);

  ASSERT_EQ(result.records.size(), 2u);
  EXPECT_EQ(result.records[0].detector, "log_error");
  EXPECT_EQ(result.records[1].detector, "log_volume");
  ASSERT_EQ(result.summaries.size(), 2u);
  EXPECT_EQ(result.summaries[0].kind, MetricKind::ERROR_COUNT);
  EXPECT_EQ(result.summaries[1].kind, MetricKind::LOG_VOLUME);
}

TEST_F(LogAnomalyJobTest, DailyPeakIsNotAnAnomaly) {
  config_.log_sources = {"batch"};
  add_source("batch", std::vector<double>(65, 0.0), daily_peak_volumes(400.0));
  LogAnomalyJob job(source_, dispatcher_, config_);
  auto result = job.run(ctx_);

  EXPECT_EQ(result.sources_analyzed, 1u);
  EXPECT_TRUE(result.records.empty());
  EXPECT_TRUE(dispatcher_->records().empty());
  ASSERT_EQ(result.summaries.size(), 2u);
  EXPECT_TRUE(result.summaries[1].is_seasonal);
}

TEST_F(LogAnomalyJobTest, SpikeAboveDailyPeakIsFlagged) {
  config_.log_sources = {"batch"};
  add_source("batch", std::vector<double>(65, 0.0), daily_peak_volumes(900.0));
  LogAnomalyJob job(source_, dispatcher_, config_);
  auto result = job.run(ctx_);

  ASSERT_EQ(result.records.size(), 1u);
  const auto &r = result.records[0];
  EXPECT_EQ(r.detector, "log_volume");
  EXPECT_EQ(r.kind, AnomalyKind::SPIKE);
  EXPECT_EQ(r.severity, AnomalySeverity::HIGH);
  EXPECT_DOUBLE_EQ(r.baseline_mean, 400.0);
}

TEST_F(LogAnomalyJobTest, ShortHistoryIsSkipped) {
  config_.log_sources = {"batch"};
  add_source("batch", std::vector<double>(10, 1.0),
             std::vector<double>(10, 500.0));
  LogAnomalyJob job(source_, dispatcher_, config_);
  auto result = job.run(ctx_);

  EXPECT_EQ(result.sources_analyzed, 0u);
  EXPECT_EQ(result.sources_skipped, 1u);
  EXPECT_TRUE(result.failures.empty());
  EXPECT_TRUE(result.records.empty());
}

TEST_F(LogAnomalyJobTest, ChecksRunIndependently) {
  config_.log_sources = {"api"};
  // Error series too short, volume series long enough to evaluate.
  add_source("api", {1.0, 2.0, 1.0}, volumes(0.0));
  LogAnomalyJob job(source_, dispatcher_, config_);
  auto result = job.run(ctx_);

  EXPECT_EQ(result.sources_analyzed, 1u);
  ASSERT_EQ(result.records.size(), 1u);
  EXPECT_EQ(result.records[0].detector, "log_volume");
  ASSERT_EQ(result.summaries.size(), 1u);
  EXPECT_EQ(result.summaries[0].kind, MetricKind::LOG_VOLUME);
}

TEST_F(LogAnomalyJobTest, EitherQueryFailingFailsTheSource) {
  config_.log_sources = {"errors-down", "volume-down", "api"};
  add_source("errors-down", error_counts(40.0), volumes(1000.0));
  source_->fail("errors-down", MetricKind::ERROR_COUNT);
  add_source("volume-down", error_counts(40.0), volumes(1000.0));
  source_->fail("volume-down", MetricKind::LOG_VOLUME);
  add_source("api", error_counts(40.0), volumes(1000.0));

  LogAnomalyJob job(source_, dispatcher_, config_);
  auto result = job.run(ctx_);

  ASSERT_EQ(result.failures.size(), 2u);
  EXPECT_EQ(result.failures[0].source, "errors-down");
  EXPECT_EQ(result.failures[1].source, "volume-down");
  EXPECT_EQ(result.sources_analyzed, 1u);
  ASSERT_EQ(result.records.size(), 1u);
  EXPECT_EQ(result.records[0].source, "api");
}

TEST_F(LogAnomalyJobTest, QueriesHourlyResolution) {
  config_.log_sources = {"api"};
  config_.lookback_hours = 48;
  config_.baseline_window_hours = 47;
  add_source("api", error_counts(0.0), volumes(1000.0));
  LogAnomalyJob job(source_, dispatcher_, config_);
  job.run(ctx_);

  auto queries = source_->queries();
  ASSERT_EQ(queries.size(), 2u);
  EXPECT_EQ(queries[0].kind, MetricKind::ERROR_COUNT);
  EXPECT_EQ(queries[1].kind, MetricKind::LOG_VOLUME);
  for (const auto &q : queries) {
    EXPECT_EQ(q.source, "api");
    EXPECT_EQ(q.resolution, std::chrono::hours(1));
    EXPECT_EQ(q.end, ctx_.now);
    EXPECT_EQ(q.end - q.start, std::chrono::hours(48));
  }
}

TEST_F(LogAnomalyJobTest, CancelledBeforeStart) {
  config_.log_sources = {"api"};
  add_source("api", error_counts(40.0), volumes(1000.0));
  std::atomic<bool> cancel{true};
  ctx_.cancel_requested = &cancel;

  LogAnomalyJob job(source_, dispatcher_, config_);
  auto result = job.run(ctx_);

  EXPECT_TRUE(result.cancelled);
  EXPECT_TRUE(result.records.empty());
  EXPECT_TRUE(source_->queries().empty());
}

TEST_F(LogAnomalyJobTest, RejectsInvalidConfiguration) {
  auto bad = config_;
  bad.volume_drop_ratio = 2.0;
  EXPECT_THROW(LogAnomalyJob(source_, dispatcher_, bad), ConfigurationError);

  bad = config_;
  bad.min_history_hours = bad.lookback_hours + 1;
  EXPECT_THROW(LogAnomalyJob(source_, dispatcher_, bad), ConfigurationError);
}
