#include "io/metrics_query/prometheus_client.hpp"

#include <atomic>
#include <chrono>
#include <gtest/gtest.h>
#include <httplib.h>
#include <string>
#include <thread>

namespace {

constexpr const char *RANGE_OK_BODY =
    R"({"status":"success","data":{"resultType":"matrix","result":[]}})";

PrometheusClientConfig local_config(int port) {
  PrometheusClientConfig cfg;
  cfg.endpoint_url = "http://127.0.0.1:" + std::to_string(port);
  cfg.timeout = std::chrono::milliseconds(2000);
  cfg.max_retries = 0;
  cfg.connection_pool_size = 2;
  return cfg;
}

} // namespace

// Serves canned Prometheus responses on a loopback port.
class PrometheusClientServerTest : public ::testing::Test {
protected:
  void SetUp() override {
    server_.Get("/api/v1/query_range",
                [this](const httplib::Request &req, httplib::Response &res) {
                  int n = ++hits_;
                  last_query_ = req.get_param_value("query");
                  last_step_ = req.get_param_value("step");
                  last_auth_ = req.get_header_value("Authorization");
                  if (n <= failures_before_success_) {
                    res.status = failure_status_;
                    res.set_content("{}", "application/json");
                    return;
                  }
                  res.set_content(RANGE_OK_BODY, "application/json");
                });

    port_ = server_.bind_to_any_port("127.0.0.1");
    ASSERT_GT(port_, 0);
    server_thread_ = std::thread([this] { server_.listen_after_bind(); });
    for (int i = 0; i < 200 && !server_.is_running(); ++i)
      std::this_thread::sleep_for(std::chrono::milliseconds(5));
    ASSERT_TRUE(server_.is_running());
  }

  void TearDown() override {
    server_.stop();
    if (server_thread_.joinable())
      server_thread_.join();
  }

  std::string range_query(PrometheusClient &client,
                          std::chrono::milliseconds timeout =
                              std::chrono::milliseconds(5000)) {
    auto end = std::chrono::system_clock::now();
    return client.query_range("sum(cost)", end - std::chrono::hours(24), end,
                              std::chrono::seconds(3600), timeout);
  }

  httplib::Server server_;
  std::thread server_thread_;
  int port_ = 0;
  std::atomic<int> hits_{0};
  int failures_before_success_ = 0;
  int failure_status_ = 503;
  std::string last_query_;
  std::string last_step_;
  std::string last_auth_;
};

TEST_F(PrometheusClientServerTest, RangeQueryReturnsBody) {
  PrometheusClient client(local_config(port_));
  EXPECT_EQ(range_query(client), RANGE_OK_BODY);
  EXPECT_EQ(hits_.load(), 1);
  EXPECT_EQ(last_query_, "sum(cost)");
  EXPECT_EQ(last_step_, "3600");
}

TEST_F(PrometheusClientServerTest, SendsBearerToken) {
  auto cfg = local_config(port_);
  cfg.bearer_token = "testtoken";
  PrometheusClient client(cfg);
  range_query(client);
  EXPECT_EQ(last_auth_, "Bearer testtoken");
}

TEST_F(PrometheusClientServerTest, RetriesServerErrorsUntilSuccess) {
  failures_before_success_ = 2;
  auto cfg = local_config(port_);
  cfg.max_retries = 3;
  PrometheusClient client(cfg);

  EXPECT_EQ(range_query(client), RANGE_OK_BODY);
  EXPECT_EQ(hits_.load(), 3);
  EXPECT_FALSE(client.is_circuit_open());
}

TEST_F(PrometheusClientServerTest, GivesUpAfterMaxRetries) {
  failures_before_success_ = 100;
  auto cfg = local_config(port_);
  cfg.max_retries = 2;
  cfg.circuit_breaker_threshold = 10;
  PrometheusClient client(cfg);

  EXPECT_THROW(range_query(client), PrometheusClient::PrometheusClientError);
  EXPECT_EQ(hits_.load(), 3);
}

TEST_F(PrometheusClientServerTest, ClientErrorsAreNotRetried) {
  failures_before_success_ = 100;
  failure_status_ = 400;
  auto cfg = local_config(port_);
  cfg.max_retries = 3;
  PrometheusClient client(cfg);

  EXPECT_THROW(range_query(client), PrometheusClient::PrometheusClientError);
  EXPECT_EQ(hits_.load(), 1);
  EXPECT_FALSE(client.is_circuit_open());
}

TEST_F(PrometheusClientServerTest, CircuitOpensAfterConsecutiveFailures) {
  failures_before_success_ = 100;
  auto cfg = local_config(port_);
  cfg.circuit_breaker_threshold = 2;
  PrometheusClient client(cfg);

  EXPECT_THROW(range_query(client), PrometheusClient::PrometheusClientError);
  EXPECT_FALSE(client.is_circuit_open());
  EXPECT_THROW(range_query(client), PrometheusClient::PrometheusClientError);
  EXPECT_TRUE(client.is_circuit_open());

  // Rejected without contacting the server.
  EXPECT_THROW(range_query(client), PrometheusClient::PrometheusClientError);
  EXPECT_EQ(hits_.load(), 2);
}

TEST_F(PrometheusClientServerTest, CircuitClosesAfterCooldown) {
  failures_before_success_ = 1;
  auto cfg = local_config(port_);
  cfg.circuit_breaker_threshold = 1;
  cfg.circuit_cooldown = std::chrono::seconds(0);
  PrometheusClient client(cfg);

  EXPECT_THROW(range_query(client), PrometheusClient::PrometheusClientError);
  std::this_thread::sleep_for(std::chrono::milliseconds(10));
  EXPECT_FALSE(client.is_circuit_open());
  EXPECT_EQ(range_query(client), RANGE_OK_BODY);
}

TEST(PrometheusClientTest, ConnectionFailureIsCollaboratorError) {
  PrometheusClientConfig cfg;
  cfg.endpoint_url = "http://127.0.0.1:1"; // Nothing listens here
  cfg.timeout = std::chrono::milliseconds(300);
  cfg.max_retries = 1;
  PrometheusClient client(cfg);
  auto now = std::chrono::system_clock::now();
  EXPECT_THROW(client.query_range("up", now - std::chrono::hours(1), now,
                                  std::chrono::seconds(60),
                                  std::chrono::milliseconds(1000)),
               CollaboratorError);
}

TEST(PrometheusClientTest, RejectsInvertedRange) {
  PrometheusClientConfig cfg;
  cfg.endpoint_url = "http://127.0.0.1:1";
  PrometheusClient client(cfg);
  auto now = std::chrono::system_clock::now();
  EXPECT_THROW(client.query_range("up", now, now - std::chrono::hours(1),
                                  std::chrono::seconds(60),
                                  std::chrono::milliseconds(100)),
               PrometheusClient::PrometheusClientError);
  EXPECT_THROW(client.query_range("up", now - std::chrono::hours(1), now,
                                  std::chrono::seconds(0),
                                  std::chrono::milliseconds(100)),
               PrometheusClient::PrometheusClientError);
}

TEST(PrometheusClientTest, ConfigFromSourceSettings) {
  Config::PrometheusSourceConfig source;
  source.endpoint_url = "http://prom:9090";
  source.bearer_token = "abc";
  source.timeout_ms = 1500;
  source.max_retries = 5;
  source.circuit_breaker_threshold = 7;
  source.connection_pool_size = 3;

  auto cfg = make_prometheus_client_config(source);
  EXPECT_EQ(cfg.endpoint_url, "http://prom:9090");
  EXPECT_EQ(cfg.bearer_token, "abc");
  EXPECT_EQ(cfg.timeout.count(), 1500);
  EXPECT_EQ(cfg.max_retries, 5);
  EXPECT_EQ(cfg.circuit_breaker_threshold, 7);
  EXPECT_EQ(cfg.connection_pool_size, 3);

  PrometheusClient client(cfg);
  EXPECT_EQ(client.get_config().endpoint_url, "http://prom:9090");
}
