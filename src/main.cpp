#include "analysis/cost_estimator.hpp"
#include "core/config.hpp"
#include "core/errors.hpp"
#include "core/logger.hpp"
#include "core/metrics_registry.hpp"
#include "core/run_guard.hpp"
#include "io/alert_dispatch/dispatcher_factory.hpp"
#include "io/metrics_query/prometheus_client.hpp"
#include "io/metrics_query/prometheus_metrics_source.hpp"
#include "jobs/cost_anomaly_job.hpp"
#include "jobs/log_anomaly_job.hpp"
#include "utils/utils.hpp"

#include <atomic>
#include <chrono>
#include <csignal>
#include <cstdint>
#include <iomanip>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace {

// Exit codes for the external scheduler.
constexpr int EXIT_OK = 0;
constexpr int EXIT_USAGE = 1;
constexpr int EXIT_SOURCE_FAILURES = 2;

std::atomic<bool> g_shutdown_requested = false;

void signal_handler(int signum) {
  if (signum == SIGINT || signum == SIGTERM)
    g_shutdown_requested = true;
}

void print_usage(const char *argv0) {
  std::cerr
      << "Usage:\n"
      << "  " << argv0 << " <config.ini> [cost|logs|all]\n"
      << "  " << argv0
      << " <config.ini> estimate function <invocations> <avg_duration_ms> "
         "<memory_mb> [days]\n"
      << "  " << argv0
      << " <config.ini> estimate monitoring <metrics> <alarms> <log_gb>\n"
      << "  " << argv0
      << " <config.ini> estimate instance <type> <hours> [count]\n";
}

template <typename T>
std::optional<T> arg_as(const std::vector<std::string> &args, size_t index) {
  if (index >= args.size())
    return std::nullopt;
  return Utils::string_to_number<T>(args[index]);
}

int run_estimate(const Config::AppConfig &config,
                 const std::vector<std::string> &args) {
  analysis::CostEstimator estimator(config.pricing);
  std::cout << std::fixed << std::setprecision(4);

  if (args.size() >= 2 && args[1] == "function") {
    auto invocations = arg_as<uint64_t>(args, 2);
    auto duration_ms = arg_as<double>(args, 3);
    auto memory_mb = arg_as<double>(args, 4);
    auto days = args.size() > 5 ? arg_as<uint32_t>(args, 5)
                                : std::optional<uint32_t>(30);
    if (!invocations || !duration_ms || !memory_mb || !days)
      return EXIT_USAGE;

    auto e = estimator.estimate_function_cost(*invocations, *duration_ms,
                                              *memory_mb, *days);
    std::cout << "request_cost     " << e.request_cost << "\n"
              << "duration_cost    " << e.duration_cost << "\n"
              << "total_cost       " << e.total_cost << "\n"
              << "monthly_estimate " << e.monthly_estimate << std::endl;
    return EXIT_OK;
  }

  if (args.size() >= 2 && args[1] == "monitoring") {
    auto metrics = arg_as<uint64_t>(args, 2);
    auto alarms = arg_as<uint64_t>(args, 3);
    auto log_gb = arg_as<double>(args, 4);
    if (!metrics || !alarms || !log_gb)
      return EXIT_USAGE;

    auto e = estimator.estimate_monitoring_cost(*metrics, *alarms, *log_gb);
    std::cout << "metrics_cost       " << e.metrics_cost << "\n"
              << "alarms_cost        " << e.alarms_cost << "\n"
              << "log_ingestion_cost " << e.log_ingestion_cost << "\n"
              << "log_storage_cost   " << e.log_storage_cost << "\n"
              << "total_cost         " << e.total_cost << std::endl;
    return EXIT_OK;
  }

  if (args.size() >= 3 && args[1] == "instance") {
    auto hours = arg_as<double>(args, 3);
    auto count = args.size() > 4 ? arg_as<uint32_t>(args, 4)
                                 : std::optional<uint32_t>(1);
    if (!hours || !count)
      return EXIT_USAGE;

    auto e = estimator.estimate_instance_cost(args[2], *hours, *count);
    std::cout << "hourly_rate      " << e.hourly_rate << "\n"
              << "total_cost       " << e.total_cost << "\n"
              << "monthly_estimate " << e.monthly_estimate << std::endl;
    return EXIT_OK;
  }

  return EXIT_USAGE;
}

void print_result(const jobs::JobResult &result) {
  std::cout << "== " << result.job_name << ": " << result.sources_analyzed
            << " analyzed, " << result.sources_skipped << " skipped, "
            << result.failures.size() << " failed, " << result.records.size()
            << " anomalies\n";
  for (const auto &summary : result.summaries) {
    std::cout << "   " << summary.source << " ["
              << metric_kind_to_string(summary.kind) << "] latest "
              << summary.latest_value << ", trend "
              << analysis::stats::trend_direction_to_string(
                     summary.trend.direction)
              << " (" << summary.trend.change_percent << "%)";
    auto p95 = summary.percentiles.find("p95");
    if (p95 != summary.percentiles.end())
      std::cout << ", p95 " << p95->second;
    if (summary.is_seasonal)
      std::cout << ", seasonal";
    std::cout << "\n";
  }
  for (const auto &failure : result.failures)
    std::cout << "   FAILED " << failure.source << ": " << failure.reason
              << "\n";
  std::cout << std::flush;
}

} // namespace

int main(int argc, char *argv[]) {
  struct sigaction action;
  action.sa_handler = signal_handler;
  sigemptyset(&action.sa_mask);
  action.sa_flags = 0;
  sigaction(SIGINT, &action, NULL);
  sigaction(SIGTERM, &action, NULL);

  if (argc < 2) {
    print_usage(argv[0]);
    return EXIT_USAGE;
  }

  std::vector<std::string> args(argv + 2, argv + argc);
  std::string command = args.empty() ? "all" : args[0];

  // --- Load Configuration ---
  Config::ConfigManager config_manager;
  if (!config_manager.load_configuration(argv[1])) {
    std::cerr << "Refusing to run without a valid configuration." << std::endl;
    return EXIT_USAGE;
  }
  auto config = config_manager.get_config();

  // --- Initialize Logging ---
  LogManager::instance().configure(config->logging);
  LOG(LogLevel::INFO, LogComponent::CORE,
      "metric_analyzer starting, command '" << command << "'");

  return run_guarded(EXIT_USAGE, [&]() -> int {
    if (command == "estimate") {
      int rc = run_estimate(*config, args);
      if (rc == EXIT_USAGE)
        print_usage(argv[0]);
      return rc;
    }

    bool run_cost = command == "cost" || command == "all";
    bool run_logs = command == "logs" || command == "all";
    if (!run_cost && !run_logs) {
      print_usage(argv[0]);
      return EXIT_USAGE;
    }

    auto client = std::make_shared<PrometheusClient>(
        make_prometheus_client_config(config->prometheus));
    auto source =
        std::make_shared<PrometheusMetricsSource>(client, config->prometheus);
    auto dispatcher = create_alert_dispatcher(config->alerting);
    auto &registry = MetricsRegistry::instance();

    jobs::RunContext ctx;
    ctx.now = std::chrono::system_clock::now();
    ctx.cancel_requested = &g_shutdown_requested;

    std::vector<jobs::JobResult> results;
    if (run_cost && config->cost_job.enabled) {
      jobs::CostAnomalyJob job(source, dispatcher, config->cost_job,
                               registry.create_job_metrics("cost"));
      results.push_back(job.run(ctx));
    }
    if (run_logs && config->log_job.enabled && !ctx.is_cancelled()) {
      jobs::LogAnomalyJob job(source, dispatcher, config->log_job,
                              registry.create_job_metrics("logs"));
      results.push_back(job.run(ctx));
    }

    if (!config->metrics_textfile_path.empty() &&
        !registry.write_textfile(config->metrics_textfile_path))
      LOG(LogLevel::WARN, LogComponent::METRICS,
          "Run metrics were not exported");

    bool any_failures = false;
    for (const auto &result : results) {
      print_result(result);
      if (!result.failures.empty() || result.cancelled)
        any_failures = true;
    }

    LOG(LogLevel::INFO, LogComponent::CORE, "metric_analyzer finished");
    return any_failures ? EXIT_SOURCE_FAILURES : EXIT_OK;
  });
}
