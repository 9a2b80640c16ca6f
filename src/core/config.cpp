#include "config.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include "utils/utils.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <iostream>
#include <memory>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

namespace Config {

namespace {

// The seasonality gate needs two full daily periods of hourly samples.
constexpr uint32_t MIN_SEASONAL_LOOKBACK_HOURS = 48;

LogLevel string_to_log_level(const std::string &level_str_raw) {
  std::string level_str = Utils::trim_copy(level_str_raw);
  std::transform(level_str.begin(), level_str.end(), level_str.begin(),
                 ::toupper);
  if (level_str == "TRACE")
    return LogLevel::TRACE;
  if (level_str == "DEBUG")
    return LogLevel::DEBUG;
  if (level_str == "INFO")
    return LogLevel::INFO;
  if (level_str == "WARN")
    return LogLevel::WARN;
  if (level_str == "ERROR")
    return LogLevel::ERROR;
  if (level_str == "FATAL")
    return LogLevel::FATAL;
  return LogLevel::INFO; // A safe default
}

const std::map<std::string, LogComponent> key_to_component_map = {
    {"core", LogComponent::CORE},
    {"config", LogComponent::CONFIG},
    {"io.query", LogComponent::IO_QUERY},
    {"io.dispatch", LogComponent::IO_DISPATCH},
    {"analysis.stats", LogComponent::ANALYSIS_STATS},
    {"analysis.seasonality", LogComponent::ANALYSIS_SEASONALITY},
    {"analysis.detector", LogComponent::ANALYSIS_DETECTOR},
    {"jobs.cost", LogComponent::JOBS_COST},
    {"jobs.log", LogComponent::JOBS_LOG},
    {"metrics", LogComponent::METRICS}};

// Convert string to boolean using common truthy values
bool string_to_bool(const std::string &val_str_raw) {
  std::string val_str = Utils::trim_copy(val_str_raw);
  std::transform(val_str.begin(), val_str.end(), val_str.begin(), ::tolower);
  return (val_str == "true" || val_str == "1" || val_str == "yes" ||
          val_str == "on");
}

std::vector<std::string> string_to_list(const std::string &value) {
  std::vector<std::string> items;
  for (const auto &item : Utils::split_string(value, ',')) {
    std::string trimmed = Utils::trim_copy(item);
    if (!trimmed.empty())
      items.push_back(trimmed);
  }
  return items;
}

bool in_range(double value, double lo, double hi) {
  return std::isfinite(value) && value >= lo && value <= hi;
}

std::string join_errors(const std::string &prefix,
                        const std::vector<std::string> &errors) {
  std::ostringstream oss;
  oss << prefix;
  for (const auto &e : errors)
    oss << "\n  - " << e;
  return oss.str();
}

} // namespace

bool validate_cost_job_config(const CostJobConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  if (!in_range(config.sensitivity, 0.0, 10.0)) {
    errors.push_back("CostJob sensitivity must be between 0 and 10");
    valid = false;
  }

  if (!in_range(config.min_absolute_value, 0.0, 1e12)) {
    errors.push_back("CostJob min_absolute_value must be non-negative");
    valid = false;
  }

  if (!in_range(config.drop_ratio, 0.0, 1.0)) {
    errors.push_back("CostJob drop_ratio must be between 0.0 and 1.0");
    valid = false;
  }

  if (!in_range(config.min_baseline_for_drop, 0.0, 1e12)) {
    errors.push_back("CostJob min_baseline_for_drop must be non-negative");
    valid = false;
  }

  if (!in_range(config.high_severity_multiplier, 1.0, 10.0)) {
    errors.push_back(
        "CostJob high_severity_multiplier must be between 1.0 and 10.0");
    valid = false;
  }

  if (config.lookback_days < 2 || config.lookback_days > 365) {
    errors.push_back("CostJob lookback_days must be between 2 and 365");
    valid = false;
  }

  if (config.baseline_window_days < 2 ||
      config.baseline_window_days >= config.lookback_days) {
    errors.push_back("CostJob baseline_window_days must be at least 2 and "
                     "smaller than lookback_days");
    valid = false;
  }

  // Two baseline points plus the day under test
  if (config.min_data_points < 3) {
    errors.push_back("CostJob min_data_points must be at least 3");
    valid = false;
  }

  if (config.trend_window < 1) {
    errors.push_back("CostJob trend_window must be at least 1");
    valid = false;
  }

  if (config.query_timeout_ms < 100 || config.query_timeout_ms > 300000) {
    errors.push_back("CostJob query_timeout_ms must be between 100 and 300000");
    valid = false;
  }

  if (config.max_workers < 1 || config.max_workers > 256) {
    errors.push_back("CostJob max_workers must be between 1 and 256");
    valid = false;
  }

  return valid;
}

bool validate_log_job_config(const LogJobConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  if (!in_range(config.error_sensitivity, 0.0, 10.0) ||
      !in_range(config.volume_sensitivity, 0.0, 10.0)) {
    errors.push_back("LogJob sensitivities must be between 0 and 10");
    valid = false;
  }

  if (!in_range(config.error_min_absolute_value, 0.0, 1e12) ||
      !in_range(config.volume_min_absolute_value, 0.0, 1e12)) {
    errors.push_back("LogJob min_absolute_value settings must be non-negative");
    valid = false;
  }

  if (!in_range(config.volume_drop_ratio, 0.0, 1.0)) {
    errors.push_back("LogJob volume_drop_ratio must be between 0.0 and 1.0");
    valid = false;
  }

  if (!in_range(config.volume_min_baseline_for_drop, 0.0, 1e12)) {
    errors.push_back(
        "LogJob volume_min_baseline_for_drop must be non-negative");
    valid = false;
  }

  if (!in_range(config.error_high_severity_multiplier, 1.0, 10.0) ||
      !in_range(config.volume_high_severity_multiplier, 1.0, 10.0)) {
    errors.push_back("LogJob high severity multipliers must be between 1.0 "
                     "and 10.0");
    valid = false;
  }

  if (config.lookback_hours < 2 || config.lookback_hours > 720) {
    errors.push_back("LogJob lookback_hours must be between 2 and 720");
    valid = false;
  }

  if (config.baseline_window_hours < 2 ||
      config.baseline_window_hours >= config.lookback_hours) {
    errors.push_back("LogJob baseline_window_hours must be at least 2 and "
                     "smaller than lookback_hours");
    valid = false;
  }

  if (config.min_history_hours < 1 ||
      config.min_history_hours >= config.lookback_hours) {
    errors.push_back("LogJob min_history_hours must be at least 1 and "
                     "smaller than lookback_hours");
    valid = false;
  }

  if (config.seasonal_adjustment &&
      config.lookback_hours < MIN_SEASONAL_LOOKBACK_HOURS) {
    errors.push_back("LogJob seasonal_adjustment requires lookback_hours of "
                     "at least " +
                     std::to_string(MIN_SEASONAL_LOOKBACK_HOURS));
    valid = false;
  }

  if (config.trend_window < 1) {
    errors.push_back("LogJob trend_window must be at least 1");
    valid = false;
  }

  if (config.query_timeout_ms < 100 || config.query_timeout_ms > 300000) {
    errors.push_back("LogJob query_timeout_ms must be between 100 and 300000");
    valid = false;
  }

  if (config.max_workers < 1 || config.max_workers > 256) {
    errors.push_back("LogJob max_workers must be between 1 and 256");
    valid = false;
  }

  return valid;
}

bool validate_prometheus_source_config(const PrometheusSourceConfig &config,
                                       std::vector<std::string> &errors) {
  bool valid = true;

  if (config.endpoint_url.rfind("http://", 0) != 0 &&
      config.endpoint_url.rfind("https://", 0) != 0) {
    errors.push_back("Prometheus endpoint_url must start with http:// or "
                     "https://");
    valid = false;
  }

  if (config.timeout_ms < 100 || config.timeout_ms > 300000) {
    errors.push_back("Prometheus timeout_ms must be between 100 and 300000");
    valid = false;
  }

  if (config.max_retries < 0 || config.max_retries > 10) {
    errors.push_back("Prometheus max_retries must be between 0 and 10");
    valid = false;
  }

  if (config.circuit_breaker_threshold < 1) {
    errors.push_back("Prometheus circuit_breaker_threshold must be positive");
    valid = false;
  }

  if (config.connection_pool_size < 1 || config.connection_pool_size > 64) {
    errors.push_back("Prometheus connection_pool_size must be between 1 and "
                     "64");
    valid = false;
  }

  if (config.cost_query.empty() || config.error_count_query.empty() ||
      config.log_volume_query.empty() || config.cpu_percent_query.empty()) {
    errors.push_back("Prometheus query templates must not be empty");
    valid = false;
  }

  return valid;
}

bool validate_alerting_config(const AlertingConfig &config,
                              std::vector<std::string> &errors) {
  bool valid = true;

  if (config.file_enabled && config.file_path.empty()) {
    errors.push_back("Alerting file_path must be set when file_enabled");
    valid = false;
  }

  if (config.http_enabled && config.http_webhook_url.empty()) {
    errors.push_back(
        "Alerting http_webhook_url must be set when http_enabled");
    valid = false;
  }

  return valid;
}

bool validate_pricing_config(const PricingConfig &config,
                             std::vector<std::string> &errors) {
  bool valid = true;

  for (double price :
       {config.request_price, config.gb_second_price, config.metric_price,
        config.alarm_price, config.log_ingestion_price_per_gb,
        config.log_storage_price_per_gb}) {
    if (!in_range(price, 0.0, 1e6)) {
      errors.push_back("Pricing values must be non-negative");
      valid = false;
      break;
    }
  }

  for (const auto &[type, price] : config.instance_hourly_prices) {
    if (type.empty() || !in_range(price, 0.0, 1e6)) {
      errors.push_back("Pricing instance_hourly." + type +
                       " must name a type and be non-negative");
      valid = false;
    }
  }

  return valid;
}

bool validate_app_config(const AppConfig &config,
                         std::vector<std::string> &errors) {
  bool valid = true;

  if (!validate_cost_job_config(config.cost_job, errors))
    valid = false;

  if (!validate_log_job_config(config.log_job, errors))
    valid = false;

  if (!validate_prometheus_source_config(config.prometheus, errors))
    valid = false;

  if (!validate_alerting_config(config.alerting, errors))
    valid = false;

  if (!validate_pricing_config(config.pricing, errors))
    valid = false;

  // Cross-component validation
  if (config.cost_job.enabled && config.cost_job.services.empty()) {
    errors.push_back("CostJob is enabled but no services are configured");
    valid = false;
  }

  if (config.log_job.enabled && config.log_job.log_sources.empty()) {
    errors.push_back("LogJob is enabled but no log_sources are configured");
    valid = false;
  }

  return valid;
}

void require_valid(const CostJobConfig &config) {
  std::vector<std::string> errors;
  if (!validate_cost_job_config(config, errors))
    throw ConfigurationError(
        join_errors("Invalid cost job configuration:", errors));
}

void require_valid(const LogJobConfig &config) {
  std::vector<std::string> errors;
  if (!validate_log_job_config(config, errors))
    throw ConfigurationError(
        join_errors("Invalid log job configuration:", errors));
}

bool parse_config_into(const std::string &filepath, AppConfig &config) {
  config.logging.default_level = LogLevel::INFO;

  std::cout << "Attempting to load configuration from " << filepath
            << std::endl;
  std::ifstream config_file(filepath);

  if (!config_file.is_open()) {
    std::cerr << "Warning: Could not open config file '" << filepath
              << "'. Using default configuration values." << std::endl;
    return false;
  }

  std::string line;
  std::string current_section;

  int line_num = 0;
  while (std::getline(config_file, line)) {
    line_num++;
    std::string trimmed_line = Utils::trim_copy(line);

    // Skip empty lines and comments
    if (trimmed_line.empty() || trimmed_line[0] == '#' ||
        trimmed_line[0] == ';')
      continue;

    // Section header [SectionName]
    if (trimmed_line[0] == '[' && trimmed_line.back() == ']') {
      current_section =
          Utils::trim_copy(trimmed_line.substr(1, trimmed_line.length() - 2));
      continue;
    }

    // Key-value pair parsing
    size_t delimiter_pos = trimmed_line.find('=');
    if (delimiter_pos == std::string::npos) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Invalid format (missing '='): " << trimmed_line
                << std::endl;
      continue;
    }

    std::string key = Utils::trim_copy(trimmed_line.substr(0, delimiter_pos));
    std::string value =
        Utils::trim_copy(trimmed_line.substr(delimiter_pos + 1));

    if (key.empty()) {
      std::cerr << "Warning (Config Line " << line_num << "): Empty key found."
                << std::endl;
      continue;
    }

    try {
      // Global (non-section) keys
      if (current_section.empty() || current_section == "General") {
        if (key == Keys::METRICS_TEXTFILE_PATH)
          config.metrics_textfile_path = value;
        else
          config.custom_settings[key] = value;

      } else if (current_section == "CostJob") {
        auto &cj = config.cost_job;
        if (key == Keys::JOB_ENABLED)
          cj.enabled = string_to_bool(value);
        else if (key == Keys::CJ_SERVICES)
          cj.services = string_to_list(value);
        else if (key == Keys::CJ_LOOKBACK_DAYS)
          cj.lookback_days = Utils::string_to_number<uint32_t>(value).value_or(
              cj.lookback_days);
        else if (key == Keys::CJ_BASELINE_WINDOW_DAYS)
          cj.baseline_window_days =
              Utils::string_to_number<uint32_t>(value).value_or(
                  cj.baseline_window_days);
        else if (key == Keys::CJ_MIN_DATA_POINTS)
          cj.min_data_points =
              Utils::string_to_number<uint32_t>(value).value_or(
                  cj.min_data_points);
        else if (key == Keys::JOB_SENSITIVITY)
          cj.sensitivity =
              Utils::string_to_number<double>(value).value_or(cj.sensitivity);
        else if (key == Keys::JOB_MIN_ABSOLUTE_VALUE)
          cj.min_absolute_value = Utils::string_to_number<double>(value)
                                      .value_or(cj.min_absolute_value);
        else if (key == Keys::JOB_DROP_RATIO)
          cj.drop_ratio =
              Utils::string_to_number<double>(value).value_or(cj.drop_ratio);
        else if (key == Keys::JOB_MIN_BASELINE_FOR_DROP)
          cj.min_baseline_for_drop = Utils::string_to_number<double>(value)
                                         .value_or(cj.min_baseline_for_drop);
        else if (key == Keys::JOB_HIGH_SEVERITY_MULTIPLIER)
          cj.high_severity_multiplier =
              Utils::string_to_number<double>(value).value_or(
                  cj.high_severity_multiplier);
        else if (key == Keys::JOB_TREND_WINDOW)
          cj.trend_window = Utils::string_to_number<uint32_t>(value).value_or(
              cj.trend_window);
        else if (key == Keys::JOB_SEASONAL_ADJUSTMENT)
          cj.seasonal_adjustment = string_to_bool(value);
        else if (key == Keys::JOB_QUERY_TIMEOUT_MS)
          cj.query_timeout_ms =
              Utils::string_to_number<uint32_t>(value).value_or(
                  cj.query_timeout_ms);
        else if (key == Keys::JOB_MAX_WORKERS)
          cj.max_workers = Utils::string_to_number<uint32_t>(value).value_or(
              cj.max_workers);
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown CostJob key '" << key << "'" << std::endl;

      } else if (current_section == "LogJob") {
        auto &lj = config.log_job;
        if (key == Keys::JOB_ENABLED)
          lj.enabled = string_to_bool(value);
        else if (key == Keys::LJ_LOG_SOURCES)
          lj.log_sources = string_to_list(value);
        else if (key == Keys::LJ_LOOKBACK_HOURS)
          lj.lookback_hours = Utils::string_to_number<uint32_t>(value).value_or(
              lj.lookback_hours);
        else if (key == Keys::LJ_BASELINE_WINDOW_HOURS)
          lj.baseline_window_hours =
              Utils::string_to_number<uint32_t>(value).value_or(
                  lj.baseline_window_hours);
        else if (key == Keys::LJ_MIN_HISTORY_HOURS)
          lj.min_history_hours =
              Utils::string_to_number<uint32_t>(value).value_or(
                  lj.min_history_hours);
        else if (key == Keys::LJ_ERROR_SENSITIVITY)
          lj.error_sensitivity = Utils::string_to_number<double>(value)
                                     .value_or(lj.error_sensitivity);
        else if (key == Keys::LJ_ERROR_MIN_ABSOLUTE_VALUE)
          lj.error_min_absolute_value =
              Utils::string_to_number<double>(value).value_or(
                  lj.error_min_absolute_value);
        else if (key == Keys::LJ_ERROR_HIGH_SEVERITY_MULTIPLIER)
          lj.error_high_severity_multiplier =
              Utils::string_to_number<double>(value).value_or(
                  lj.error_high_severity_multiplier);
        else if (key == Keys::LJ_VOLUME_SENSITIVITY)
          lj.volume_sensitivity = Utils::string_to_number<double>(value)
                                      .value_or(lj.volume_sensitivity);
        else if (key == Keys::LJ_VOLUME_MIN_ABSOLUTE_VALUE)
          lj.volume_min_absolute_value =
              Utils::string_to_number<double>(value).value_or(
                  lj.volume_min_absolute_value);
        else if (key == Keys::LJ_VOLUME_DROP_RATIO)
          lj.volume_drop_ratio = Utils::string_to_number<double>(value)
                                     .value_or(lj.volume_drop_ratio);
        else if (key == Keys::LJ_VOLUME_MIN_BASELINE_FOR_DROP)
          lj.volume_min_baseline_for_drop =
              Utils::string_to_number<double>(value).value_or(
                  lj.volume_min_baseline_for_drop);
        else if (key == Keys::LJ_VOLUME_HIGH_SEVERITY_MULTIPLIER)
          lj.volume_high_severity_multiplier =
              Utils::string_to_number<double>(value).value_or(
                  lj.volume_high_severity_multiplier);
        else if (key == Keys::JOB_TREND_WINDOW)
          lj.trend_window = Utils::string_to_number<uint32_t>(value).value_or(
              lj.trend_window);
        else if (key == Keys::JOB_SEASONAL_ADJUSTMENT)
          lj.seasonal_adjustment = string_to_bool(value);
        else if (key == Keys::JOB_QUERY_TIMEOUT_MS)
          lj.query_timeout_ms =
              Utils::string_to_number<uint32_t>(value).value_or(
                  lj.query_timeout_ms);
        else if (key == Keys::JOB_MAX_WORKERS)
          lj.max_workers = Utils::string_to_number<uint32_t>(value).value_or(
              lj.max_workers);
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown LogJob key '" << key << "'" << std::endl;

      } else if (current_section == "Prometheus") {
        auto &pr = config.prometheus;
        if (key == Keys::PR_ENDPOINT_URL)
          pr.endpoint_url = value;
        else if (key == Keys::PR_USERNAME)
          pr.username = value;
        else if (key == Keys::PR_PASSWORD)
          pr.password = value;
        else if (key == Keys::PR_BEARER_TOKEN)
          pr.bearer_token = value;
        else if (key == Keys::PR_TIMEOUT_MS)
          pr.timeout_ms =
              Utils::string_to_number<uint32_t>(value).value_or(pr.timeout_ms);
        else if (key == Keys::PR_MAX_RETRIES)
          pr.max_retries =
              Utils::string_to_number<int>(value).value_or(pr.max_retries);
        else if (key == Keys::PR_CIRCUIT_BREAKER_THRESHOLD)
          pr.circuit_breaker_threshold = Utils::string_to_number<int>(value)
                                             .value_or(
                                                 pr.circuit_breaker_threshold);
        else if (key == Keys::PR_CONNECTION_POOL_SIZE)
          pr.connection_pool_size = Utils::string_to_number<int>(value)
                                        .value_or(pr.connection_pool_size);
        else if (key == Keys::PR_COST_QUERY)
          pr.cost_query = value;
        else if (key == Keys::PR_ERROR_COUNT_QUERY)
          pr.error_count_query = value;
        else if (key == Keys::PR_LOG_VOLUME_QUERY)
          pr.log_volume_query = value;
        else if (key == Keys::PR_CPU_PERCENT_QUERY)
          pr.cpu_percent_query = value;
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown Prometheus key '" << key << "'"
                    << std::endl;

      } else if (current_section == "Alerting") {
        auto &al = config.alerting;
        if (key == Keys::AL_STDOUT_ENABLED)
          al.stdout_enabled = string_to_bool(value);
        else if (key == Keys::AL_FILE_ENABLED)
          al.file_enabled = string_to_bool(value);
        else if (key == Keys::AL_FILE_PATH)
          al.file_path = value;
        else if (key == Keys::AL_SYSLOG_ENABLED)
          al.syslog_enabled = string_to_bool(value);
        else if (key == Keys::AL_HTTP_ENABLED)
          al.http_enabled = string_to_bool(value);
        else if (key == Keys::AL_HTTP_WEBHOOK_URL)
          al.http_webhook_url = value;
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown Alerting key '" << key << "'" << std::endl;

      } else if (current_section == "Metrics") {
        if (key == Keys::METRICS_TEXTFILE_PATH)
          config.metrics_textfile_path = value;
        else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown Metrics key '" << key << "'" << std::endl;

      } else if (current_section == "Pricing") {
        auto &pc = config.pricing;
        if (key == Keys::PC_REQUEST_PRICE)
          pc.request_price = Utils::string_to_number<double>(value).value_or(
              pc.request_price);
        else if (key == Keys::PC_GB_SECOND_PRICE)
          pc.gb_second_price = Utils::string_to_number<double>(value).value_or(
              pc.gb_second_price);
        else if (key == Keys::PC_METRIC_PRICE)
          pc.metric_price = Utils::string_to_number<double>(value).value_or(
              pc.metric_price);
        else if (key == Keys::PC_ALARM_PRICE)
          pc.alarm_price =
              Utils::string_to_number<double>(value).value_or(pc.alarm_price);
        else if (key == Keys::PC_LOG_INGESTION_PRICE)
          pc.log_ingestion_price_per_gb =
              Utils::string_to_number<double>(value).value_or(
                  pc.log_ingestion_price_per_gb);
        else if (key == Keys::PC_LOG_STORAGE_PRICE)
          pc.log_storage_price_per_gb =
              Utils::string_to_number<double>(value).value_or(
                  pc.log_storage_price_per_gb);
        else if (key.rfind(Keys::PC_INSTANCE_HOURLY_PREFIX, 0) == 0) {
          std::string type =
              key.substr(std::string(Keys::PC_INSTANCE_HOURLY_PREFIX).size());
          auto price = Utils::string_to_number<double>(value);
          if (price)
            pc.instance_hourly_prices[type] = *price;
          else
            std::cerr << "Warning (Config Line " << line_num
                      << "): Unparsable price for instance type '" << type
                      << "'" << std::endl;
        } else
          std::cerr << "Warning (Config Line " << line_num
                    << "): Unknown Pricing key '" << key << "'" << std::endl;

      } else if (current_section == "Logging") {
        if (key == Keys::LOGGING_DEFAULT_LEVEL) {
          config.logging.default_level = string_to_log_level(value);
        } else {
          auto it = key_to_component_map.find(key);
          if (it != key_to_component_map.end())
            config.logging.log_levels[it->second] = string_to_log_level(value);
          else
            std::cerr << "Warning (Config Line " << line_num
                      << "): Unknown logging component '" << key << "'"
                      << std::endl;
        }

      } else {
        std::cerr << "Warning (Config Line " << line_num
                  << "): Unknown section '" << current_section << "'"
                  << std::endl;
      }
    } catch (const std::exception &e) {
      std::cerr << "Warning (Config Line " << line_num
                << "): Failed to parse value for key '" << key << "' - "
                << e.what() << std::endl;
    }
  }

  config_file.close();
  std::cout << "Configuration loaded successfully from " << filepath
            << std::endl;
  return true;
}

bool ConfigManager::load_configuration(const std::string &filepath) {
  config_filepath_ = filepath;
  auto new_config = std::make_shared<AppConfig>();

  // Use the parsing logic to fill the new config object
  if (!parse_config_into(filepath, *new_config)) {
    std::cerr << "Failed to parse configuration file: " << filepath
              << ". Keeping existing settings." << std::endl;
    return false;
  }

  // Validate the configuration
  std::vector<std::string> validation_errors;
  if (!validate_app_config(*new_config, validation_errors)) {
    std::cerr << "Configuration validation failed:" << std::endl;
    for (const auto &error : validation_errors) {
      std::cerr << "  - " << error << std::endl;
    }
    std::cerr << "Keeping existing settings." << std::endl;
    return false;
  }

  // Atomically swap the pointer
  std::lock_guard<std::mutex> lock(config_mutex_);
  current_config_ = new_config;
  std::cout << "Configuration loaded and validated successfully from "
            << config_filepath_ << std::endl;
  return true;
}

std::shared_ptr<const AppConfig> ConfigManager::get_config() const {
  std::lock_guard<std::mutex> lock(config_mutex_);
  return current_config_;
}

} // namespace Config
