#ifndef PROMETHEUS_CLIENT_HPP
#define PROMETHEUS_CLIENT_HPP

#include "core/config.hpp"
#include "core/errors.hpp"

#include <chrono>
#include <condition_variable>
#include <httplib.h>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

// PrometheusClient configuration structure
struct PrometheusClientConfig {
  std::string endpoint_url; // e.g. "https://prometheus.example.com"
  std::string username;     // For basic auth
  std::string password;     // For basic auth
  std::string bearer_token; // For bearer token auth
  std::chrono::milliseconds timeout{5000}; // Per-request socket timeout
  int max_retries{3};                      // Retries after the first attempt
  int circuit_breaker_threshold{5};        // Failures before opening circuit
  int connection_pool_size{4};             // Number of pooled connections
  std::chrono::seconds circuit_cooldown{30};
};

PrometheusClientConfig
make_prometheus_client_config(const Config::PrometheusSourceConfig &source);

// PrometheusClient: HTTP client for the PromQL query API. Safe to share
// between worker threads; each request borrows a pooled connection.
class PrometheusClient {
public:
  explicit PrometheusClient(const PrometheusClientConfig &config);
  ~PrometheusClient();

  PrometheusClient(const PrometheusClient &) = delete;
  PrometheusClient &operator=(const PrometheusClient &) = delete;

  // Raised for transport failures, non-success status codes, an open
  // circuit and deadline expiry.
  class PrometheusClientError : public CollaboratorError {
  public:
    explicit PrometheusClientError(const std::string &msg)
        : CollaboratorError(msg) {}
  };

  /**
   * Range query over [start, end] at `step` resolution. Failed attempts are
   * retried with backoff until max_retries is used up or `timeout` elapses.
   * @return raw JSON response body
   * @throws PrometheusClientError
   */
  std::string query_range(const std::string &promql,
                          std::chrono::system_clock::time_point start,
                          std::chrono::system_clock::time_point end,
                          std::chrono::seconds step,
                          std::chrono::milliseconds timeout);

  const PrometheusClientConfig &get_config() const;

  bool is_circuit_open();

private:
  // Returns a borrowed connection to the pool on destruction.
  class PooledClient {
  public:
    PooledClient(PrometheusClient &owner, httplib::Client *client)
        : owner_(owner), client_(client) {}
    ~PooledClient() { owner_.release_client(client_); }
    PooledClient(const PooledClient &) = delete;
    PooledClient &operator=(const PooledClient &) = delete;
    httplib::Client *operator->() const { return client_; }

  private:
    PrometheusClient &owner_;
    httplib::Client *client_;
  };

  std::string get_with_retries(const std::string &path,
                               const httplib::Params &params,
                               std::chrono::milliseconds timeout);

  PrometheusClientConfig config_;
  // HTTP client pool for connection reuse
  std::vector<std::unique_ptr<httplib::Client>> client_pool_;
  std::vector<httplib::Client *> idle_clients_;
  std::mutex pool_mutex_;
  std::condition_variable pool_cond_;
  // Circuit breaker state
  std::mutex circuit_mutex_;
  int consecutive_failures_ = 0;
  bool circuit_open_ = false;
  std::chrono::steady_clock::time_point circuit_open_time_;
  // Helper: get a client from the pool, waiting until `deadline` at most
  httplib::Client *acquire_client(std::chrono::steady_clock::time_point deadline);
  void release_client(httplib::Client *client);
  // Helper: setup authentication headers
  void setup_auth(httplib::Client &client);
  // Helper: check and update circuit breaker
  bool check_circuit();
  void record_failure();
  void reset_circuit();
};

#endif // PROMETHEUS_CLIENT_HPP
