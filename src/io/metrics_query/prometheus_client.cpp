#include "prometheus_client.hpp"
#include "core/logger.hpp"
#include "utils/backoff.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <optional>

PrometheusClientConfig
make_prometheus_client_config(const Config::PrometheusSourceConfig &source) {
  PrometheusClientConfig cfg;
  cfg.endpoint_url = source.endpoint_url;
  cfg.username = source.username;
  cfg.password = source.password;
  cfg.bearer_token = source.bearer_token;
  cfg.timeout = std::chrono::milliseconds(source.timeout_ms);
  cfg.max_retries = source.max_retries;
  cfg.circuit_breaker_threshold = source.circuit_breaker_threshold;
  cfg.connection_pool_size = source.connection_pool_size;
  return cfg;
}

PrometheusClient::PrometheusClient(const PrometheusClientConfig &config)
    : config_(config) {
  int pool_size = std::max(1, config_.connection_pool_size);
  for (int i = 0; i < pool_size; ++i) {
    auto client = std::make_unique<httplib::Client>(config_.endpoint_url);
    client->set_connection_timeout(config_.timeout);
    client->set_read_timeout(config_.timeout);
    setup_auth(*client);
    idle_clients_.push_back(client.get());
    client_pool_.push_back(std::move(client));
  }
  LOG(LogLevel::DEBUG, LogComponent::IO_QUERY,
      "PrometheusClient for " << config_.endpoint_url << " with " << pool_size
                              << " pooled connection(s)");
}

PrometheusClient::~PrometheusClient() = default;

httplib::Client *PrometheusClient::acquire_client(
    std::chrono::steady_clock::time_point deadline) {
  std::unique_lock<std::mutex> lock(pool_mutex_);
  if (!pool_cond_.wait_until(lock, deadline,
                             [this] { return !idle_clients_.empty(); }))
    throw PrometheusClientError("No HTTP connection became available for " +
                                config_.endpoint_url + " before the deadline");

  httplib::Client *client = idle_clients_.back();
  idle_clients_.pop_back();
  return client;
}

void PrometheusClient::release_client(httplib::Client *client) {
  {
    std::lock_guard<std::mutex> lock(pool_mutex_);
    idle_clients_.push_back(client);
  }
  pool_cond_.notify_one();
}

void PrometheusClient::setup_auth(httplib::Client &client) {
  if (!config_.bearer_token.empty()) {
    client.set_bearer_token_auth(config_.bearer_token);
  } else if (!config_.username.empty() && !config_.password.empty()) {
    client.set_basic_auth(config_.username, config_.password);
  }
}

bool PrometheusClient::check_circuit() {
  std::lock_guard<std::mutex> lock(circuit_mutex_);
  if (circuit_open_) {
    auto now = std::chrono::steady_clock::now();
    if (now - circuit_open_time_ > config_.circuit_cooldown) {
      LOG(LogLevel::INFO, LogComponent::IO_QUERY,
          "Circuit breaker for " << config_.endpoint_url
                                 << " closed after cooldown");
      circuit_open_ = false;
      consecutive_failures_ = 0;
    }
  }
  return circuit_open_;
}

bool PrometheusClient::is_circuit_open() { return check_circuit(); }

void PrometheusClient::record_failure() {
  std::lock_guard<std::mutex> lock(circuit_mutex_);
  ++consecutive_failures_;
  if (!circuit_open_ &&
      consecutive_failures_ >= config_.circuit_breaker_threshold) {
    circuit_open_ = true;
    circuit_open_time_ = std::chrono::steady_clock::now();
    LOG(LogLevel::WARN, LogComponent::IO_QUERY,
        "Circuit breaker for " << config_.endpoint_url << " opened after "
                               << consecutive_failures_
                               << " consecutive failures");
  }
}

void PrometheusClient::reset_circuit() {
  std::lock_guard<std::mutex> lock(circuit_mutex_);
  consecutive_failures_ = 0;
  circuit_open_ = false;
}

std::string PrometheusClient::get_with_retries(const std::string &path,
                                               const httplib::Params &params,
                                               std::chrono::milliseconds timeout) {
  if (check_circuit())
    throw PrometheusClientError("Circuit breaker open for " +
                                config_.endpoint_url);

  auto deadline = std::chrono::steady_clock::now() + timeout;
  int attempts = 0;
  std::string last_error = "no attempt completed";

  auto attempt = [&]() -> std::optional<std::string> {
    if (check_circuit())
      throw PrometheusClientError("Circuit breaker opened for " +
                                  config_.endpoint_url + " (last error: " +
                                  last_error + ")");

    PooledClient client(*this, acquire_client(deadline));
    auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
        deadline - std::chrono::steady_clock::now());
    auto request_timeout = std::max(std::chrono::milliseconds(1),
                                    std::min(remaining, config_.timeout));
    client->set_connection_timeout(request_timeout);
    client->set_read_timeout(request_timeout);

    auto res = client->Get(path, params, httplib::Headers{});
    ++attempts;
    if (res && res->status >= 200 && res->status < 300) {
      reset_circuit();
      return res->body;
    }

    if (res && res->status >= 400 && res->status < 500) {
      // The query itself was rejected; repeating it cannot succeed.
      throw PrometheusClientError(
          "Prometheus rejected request to " + path + " (HTTP " +
          std::to_string(res->status) + "): " + res->body.substr(0, 256));
    }

    record_failure();
    last_error = res ? "HTTP " + std::to_string(res->status)
                     : httplib::to_string(res.error());
    LOG(LogLevel::DEBUG, LogComponent::IO_QUERY,
        "Attempt " << attempts << " against " << config_.endpoint_url << path
                   << " failed: " << last_error);

    if (attempts > config_.max_retries)
      throw PrometheusClientError("Prometheus request to " + path +
                                  " failed after " + std::to_string(attempts) +
                                  " attempt(s): " + last_error);
    return std::nullopt;
  };

  auto body = Utils::poll_with_backoff(attempt, deadline);
  if (!body)
    throw PrometheusClientError("Prometheus request to " + path +
                                " timed out after " +
                                std::to_string(timeout.count()) + " ms (" +
                                last_error + ")");
  return *body;
}

std::string PrometheusClient::query_range(
    const std::string &promql, std::chrono::system_clock::time_point start,
    std::chrono::system_clock::time_point end, std::chrono::seconds step,
    std::chrono::milliseconds timeout) {
  if (end < start)
    throw PrometheusClientError("Range query end precedes start");
  if (step.count() <= 0)
    throw PrometheusClientError("Range query step must be positive");

  httplib::Params params = {{"query", promql},
                            {"start", Utils::format_time_iso8601(start)},
                            {"end", Utils::format_time_iso8601(end)},
                            {"step", std::to_string(step.count())}};
  return get_with_retries("/api/v1/query_range", params, timeout);
}

const PrometheusClientConfig &PrometheusClient::get_config() const {
  return config_;
}
