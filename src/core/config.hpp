#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstddef>
#include <cstdint>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

enum class LogLevel;
enum class LogComponent;

namespace Config {

namespace Keys {

// General Settings
constexpr const char *METRICS_TEXTFILE_PATH = "metrics_textfile_path";

// Shared detector settings (CostJob)
constexpr const char *JOB_ENABLED = "enabled";
constexpr const char *JOB_SENSITIVITY = "sensitivity";
constexpr const char *JOB_MIN_ABSOLUTE_VALUE = "min_absolute_value";
constexpr const char *JOB_DROP_RATIO = "drop_ratio";
constexpr const char *JOB_MIN_BASELINE_FOR_DROP = "min_baseline_for_drop";
constexpr const char *JOB_HIGH_SEVERITY_MULTIPLIER = "high_severity_multiplier";
constexpr const char *JOB_TREND_WINDOW = "trend_window";
constexpr const char *JOB_SEASONAL_ADJUSTMENT = "seasonal_adjustment";
constexpr const char *JOB_QUERY_TIMEOUT_MS = "query_timeout_ms";
constexpr const char *JOB_MAX_WORKERS = "max_workers";

// CostJob Settings
constexpr const char *CJ_SERVICES = "services";
constexpr const char *CJ_LOOKBACK_DAYS = "lookback_days";
constexpr const char *CJ_BASELINE_WINDOW_DAYS = "baseline_window_days";
constexpr const char *CJ_MIN_DATA_POINTS = "min_data_points";

// LogJob Settings
constexpr const char *LJ_LOG_SOURCES = "log_sources";
constexpr const char *LJ_LOOKBACK_HOURS = "lookback_hours";
constexpr const char *LJ_BASELINE_WINDOW_HOURS = "baseline_window_hours";
constexpr const char *LJ_MIN_HISTORY_HOURS = "min_history_hours";
constexpr const char *LJ_ERROR_SENSITIVITY = "error_sensitivity";
constexpr const char *LJ_ERROR_MIN_ABSOLUTE_VALUE = "error_min_absolute_value";
constexpr const char *LJ_ERROR_HIGH_SEVERITY_MULTIPLIER =
    "error_high_severity_multiplier";
constexpr const char *LJ_VOLUME_SENSITIVITY = "volume_sensitivity";
constexpr const char *LJ_VOLUME_MIN_ABSOLUTE_VALUE =
    "volume_min_absolute_value";
constexpr const char *LJ_VOLUME_DROP_RATIO = "volume_drop_ratio";
constexpr const char *LJ_VOLUME_MIN_BASELINE_FOR_DROP =
    "volume_min_baseline_for_drop";
constexpr const char *LJ_VOLUME_HIGH_SEVERITY_MULTIPLIER =
    "volume_high_severity_multiplier";

// Prometheus (metrics query) Settings
constexpr const char *PR_ENDPOINT_URL = "endpoint_url";
constexpr const char *PR_USERNAME = "username";
constexpr const char *PR_PASSWORD = "password";
constexpr const char *PR_BEARER_TOKEN = "bearer_token";
constexpr const char *PR_TIMEOUT_MS = "timeout_ms";
constexpr const char *PR_MAX_RETRIES = "max_retries";
constexpr const char *PR_CIRCUIT_BREAKER_THRESHOLD =
    "circuit_breaker_threshold";
constexpr const char *PR_CONNECTION_POOL_SIZE = "connection_pool_size";
constexpr const char *PR_COST_QUERY = "cost_query";
constexpr const char *PR_ERROR_COUNT_QUERY = "error_count_query";
constexpr const char *PR_LOG_VOLUME_QUERY = "log_volume_query";
constexpr const char *PR_CPU_PERCENT_QUERY = "cpu_percent_query";

// Alerting Settings
constexpr const char *AL_STDOUT_ENABLED = "stdout_enabled";
constexpr const char *AL_FILE_ENABLED = "file_enabled";
constexpr const char *AL_FILE_PATH = "file_path";
constexpr const char *AL_SYSLOG_ENABLED = "syslog_enabled";
constexpr const char *AL_HTTP_ENABLED = "http_enabled";
constexpr const char *AL_HTTP_WEBHOOK_URL = "http_webhook_url";

// Pricing Settings
constexpr const char *PC_REQUEST_PRICE = "request_price";
constexpr const char *PC_GB_SECOND_PRICE = "gb_second_price";
constexpr const char *PC_METRIC_PRICE = "metric_price";
constexpr const char *PC_ALARM_PRICE = "alarm_price";
constexpr const char *PC_LOG_INGESTION_PRICE = "log_ingestion_price_per_gb";
constexpr const char *PC_LOG_STORAGE_PRICE = "log_storage_price_per_gb";
// "instance_hourly.<type> = <price>", e.g. instance_hourly.t3.micro = 0.0104
constexpr const char *PC_INSTANCE_HOURLY_PREFIX = "instance_hourly.";

// Logging Settings
constexpr const char *LOGGING_DEFAULT_LEVEL = "default_level";
} // namespace Keys

struct LoggingConfig {
  std::map<LogComponent, LogLevel> log_levels;
  std::optional<LogLevel> default_level;
};

struct CostJobConfig {
  bool enabled = true;
  std::vector<std::string> services;
  uint32_t lookback_days = 30;
  uint32_t baseline_window_days = 29;
  uint32_t min_data_points = 7;

  double sensitivity = 2.0; // stddev multiplier
  double min_absolute_value = 1.0;
  double drop_ratio = 0.1;
  double min_baseline_for_drop = 10.0;
  double high_severity_multiplier = 1.5;

  uint32_t trend_window = 7;
  bool seasonal_adjustment = false;
  uint32_t query_timeout_ms = 10000;
  uint32_t max_workers = 8;
};

struct LogJobConfig {
  bool enabled = true;
  std::vector<std::string> log_sources;
  uint32_t lookback_hours = 72; // seasonal checks need two full days
  uint32_t baseline_window_hours = 23;
  uint32_t min_history_hours = 23;

  // Error-count spike check
  double error_sensitivity = 2.0;
  double error_min_absolute_value = 10.0;
  double error_high_severity_multiplier = 2.0;

  // Total volume spike/drop check
  double volume_sensitivity = 2.0;
  double volume_min_absolute_value = 100.0;
  double volume_drop_ratio = 0.1;
  double volume_min_baseline_for_drop = 10.0;
  double volume_high_severity_multiplier = 2.0;

  uint32_t trend_window = 6;
  bool seasonal_adjustment = true;
  uint32_t query_timeout_ms = 10000;
  uint32_t max_workers = 8;
};

struct PrometheusSourceConfig {
  std::string endpoint_url = "http://localhost:9090";
  std::string username;
  std::string password;
  std::string bearer_token;
  uint32_t timeout_ms = 5000;
  int max_retries = 3;
  int circuit_breaker_threshold = 5;
  int connection_pool_size = 4;

  // PromQL templates; "{{source}}" is replaced by the service or log group.
  std::string cost_query =
      "sum(increase(cloud_cost_dollars_total{service=\"{{source}}\"}[1d]))";
  std::string error_count_query = "sum(increase(log_events_total{log_group="
                                  "\"{{source}}\",level=\"error\"}[1h]))";
  std::string log_volume_query =
      "sum(increase(log_events_total{log_group=\"{{source}}\"}[1h]))";
  std::string cpu_percent_query =
      "avg(cpu_utilization_percent{instance=\"{{source}}\"})";
};

struct AlertingConfig {
  bool stdout_enabled = true;
  bool file_enabled = false;
  std::string file_path = "alerts.json";
  bool syslog_enabled = false;
  bool http_enabled = false;
  std::string http_webhook_url;
};

// Simplified list prices used by analysis::CostEstimator.
struct PricingConfig {
  double request_price = 0.0000002;       // per request
  double gb_second_price = 0.0000166667;  // per GB-second
  double metric_price = 0.30;             // per metric per month
  double alarm_price = 0.10;              // per alarm per month
  double log_ingestion_price_per_gb = 0.50;
  double log_storage_price_per_gb = 0.03; // per GB per month
  std::map<std::string, double> instance_hourly_prices = {
      {"t3.micro", 0.0104},
      {"t3.small", 0.0208},
      {"t3.medium", 0.0416},
      {"t3.large", 0.0832}};
};

struct AppConfig {
  std::string metrics_textfile_path;

  CostJobConfig cost_job;
  LogJobConfig log_job;
  PrometheusSourceConfig prometheus;
  AlertingConfig alerting;
  PricingConfig pricing;
  LoggingConfig logging;

  std::unordered_map<std::string, std::string> custom_settings;

  AppConfig() = default;
};

// Validation functions for configuration parameters. Each appends a message
// per violation and returns false if any were found.
bool validate_cost_job_config(const CostJobConfig &config,
                              std::vector<std::string> &errors);
bool validate_log_job_config(const LogJobConfig &config,
                             std::vector<std::string> &errors);
bool validate_prometheus_source_config(const PrometheusSourceConfig &config,
                                       std::vector<std::string> &errors);
bool validate_alerting_config(const AlertingConfig &config,
                              std::vector<std::string> &errors);
bool validate_pricing_config(const PricingConfig &config,
                             std::vector<std::string> &errors);
bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors);

// Throwing variants used at job construction. @throws ConfigurationError
void require_valid(const CostJobConfig &config);
void require_valid(const LogJobConfig &config);

bool parse_config_into(const std::string &filepath, AppConfig &config);

class ConfigManager {
public:
  ConfigManager() = default;
  bool load_configuration(const std::string &filepath);
  std::shared_ptr<const AppConfig> get_config() const;

private:
  std::string config_filepath_;
  std::shared_ptr<const AppConfig> current_config_ =
      std::make_shared<AppConfig>();
  mutable std::mutex config_mutex_;
};

} // namespace Config

#endif // CONFIG_HPP
