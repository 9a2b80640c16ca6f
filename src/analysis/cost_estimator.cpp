#include "cost_estimator.hpp"
#include "core/errors.hpp"

#include <cmath>
#include <string>

namespace analysis {

namespace {
constexpr double HOURS_PER_MONTH = 730.0;
}

CostEstimator::CostEstimator(Config::PricingConfig pricing)
    : pricing_(pricing) {}

FunctionCostEstimate
CostEstimator::estimate_function_cost(uint64_t invocations,
                                      double avg_duration_ms, double memory_mb,
                                      uint32_t days) const {
  if (days == 0)
    throw InvalidInputError("Cost estimate period must be at least one day");
  if (!std::isfinite(avg_duration_ms) || avg_duration_ms < 0.0)
    throw InvalidInputError("Average duration must be non-negative, got " +
                            std::to_string(avg_duration_ms));
  if (!std::isfinite(memory_mb) || memory_mb < 0.0)
    throw InvalidInputError("Memory size must be non-negative, got " +
                            std::to_string(memory_mb));

  FunctionCostEstimate estimate;
  auto calls = static_cast<double>(invocations);
  estimate.request_cost = calls * pricing_.request_price;

  double duration_seconds = (avg_duration_ms / 1000.0) * calls;
  double gb_seconds = (memory_mb / 1024.0) * duration_seconds;
  estimate.duration_cost = gb_seconds * pricing_.gb_second_price;

  estimate.total_cost = estimate.request_cost + estimate.duration_cost;
  estimate.monthly_estimate =
      estimate.total_cost * (30.0 / static_cast<double>(days));
  return estimate;
}

MonitoringCostEstimate
CostEstimator::estimate_monitoring_cost(uint64_t num_metrics,
                                        uint64_t num_alarms,
                                        double log_volume_gb) const {
  if (!std::isfinite(log_volume_gb) || log_volume_gb < 0.0)
    throw InvalidInputError("Log volume must be non-negative, got " +
                            std::to_string(log_volume_gb));

  MonitoringCostEstimate estimate;
  estimate.metrics_cost = static_cast<double>(num_metrics) * pricing_.metric_price;
  estimate.alarms_cost = static_cast<double>(num_alarms) * pricing_.alarm_price;
  estimate.log_ingestion_cost =
      log_volume_gb * pricing_.log_ingestion_price_per_gb;
  estimate.log_storage_cost = log_volume_gb * pricing_.log_storage_price_per_gb;
  estimate.total_cost = estimate.metrics_cost + estimate.alarms_cost +
                        estimate.log_ingestion_cost + estimate.log_storage_cost;
  return estimate;
}

InstanceCostEstimate
CostEstimator::estimate_instance_cost(const std::string &instance_type,
                                      double hours, uint32_t count) const {
  auto it = pricing_.instance_hourly_prices.find(instance_type);
  if (it == pricing_.instance_hourly_prices.end())
    throw InvalidInputError("No hourly price configured for instance type '" +
                            instance_type + "'");
  if (!std::isfinite(hours) || hours < 0.0)
    throw InvalidInputError("Running hours must be non-negative, got " +
                            std::to_string(hours));

  InstanceCostEstimate estimate;
  estimate.hourly_rate = it->second * static_cast<double>(count);
  estimate.total_cost = estimate.hourly_rate * hours;
  estimate.monthly_estimate = estimate.hourly_rate * HOURS_PER_MONTH;
  return estimate;
}

} // namespace analysis
