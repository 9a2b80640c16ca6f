#ifndef COST_ESTIMATOR_HPP
#define COST_ESTIMATOR_HPP

#include "core/config.hpp"

#include <cstdint>
#include <string>

namespace analysis {

struct FunctionCostEstimate {
  double request_cost = 0.0;
  double duration_cost = 0.0;
  double total_cost = 0.0;
  double monthly_estimate = 0.0; // total scaled to a 30-day month
};

struct MonitoringCostEstimate {
  double metrics_cost = 0.0;
  double alarms_cost = 0.0;
  double log_ingestion_cost = 0.0;
  double log_storage_cost = 0.0;
  double total_cost = 0.0;
};

struct InstanceCostEstimate {
  double hourly_rate = 0.0; // for all instances together
  double total_cost = 0.0;
  double monthly_estimate = 0.0; // hourly_rate over a 730-hour month
};

// Back-of-the-envelope cost figures from a flat price list. Region and tier
// differences are ignored.
class CostEstimator {
public:
  explicit CostEstimator(Config::PricingConfig pricing = {});

  /**
   * Serverless function cost over `days` days of traffic.
   * @throws InvalidInputError for negative inputs or days == 0
   */
  FunctionCostEstimate estimate_function_cost(uint64_t invocations,
                                              double avg_duration_ms,
                                              double memory_mb,
                                              uint32_t days = 30) const;

  // Monthly cost of metrics, alarms and one month of logs.
  MonitoringCostEstimate estimate_monitoring_cost(uint64_t num_metrics,
                                                  uint64_t num_alarms,
                                                  double log_volume_gb) const;

  /**
   * On-demand compute cost of `count` instances of `instance_type` running
   * for `hours`.
   * @throws InvalidInputError for an unpriced type or negative hours
   */
  InstanceCostEstimate estimate_instance_cost(const std::string &instance_type,
                                              double hours,
                                              uint32_t count = 1) const;

  const Config::PricingConfig &get_pricing() const { return pricing_; }

private:
  Config::PricingConfig pricing_;
};

} // namespace analysis

#endif // COST_ESTIMATOR_HPP
