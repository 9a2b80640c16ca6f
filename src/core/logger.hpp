#ifndef LOGGER_HPP
#define LOGGER_HPP

#include "config.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <iostream>
#include <map>
#include <mutex>
#include <sstream>
#include <string>

// Enum for standard log severity levels
enum class LogLevel { TRACE, DEBUG, INFO, WARN, ERROR, FATAL };

// Enum for all granular application components
enum class LogComponent {
  CORE,
  CONFIG,

  // IO sub-components
  IO_QUERY,
  IO_DISPATCH,

  // Analysis sub-components
  ANALYSIS_STATS,
  ANALYSIS_SEASONALITY,
  ANALYSIS_DETECTOR,

  // Jobs
  JOBS_COST,
  JOBS_LOG,

  METRICS
};

class LogManager {
public:
  static LogManager &instance() {
    static LogManager instance;
    return instance;
  }

  inline void configure(const Config::LoggingConfig &config) {
    std::lock_guard<std::mutex> lock(mutex_);
    log_levels_ = config.log_levels;
    default_level_ = config.default_level.value_or(LogLevel::INFO);
  }

  bool should_log(LogLevel level, LogComponent component) const {
    std::lock_guard<std::mutex> lock(mutex_);
    auto it = log_levels_.find(component);
    if (it == log_levels_.end())
      return level >= default_level_;

    return level >= it->second;
  }

  // Worker threads log concurrently; whole lines are written under the lock.
  void write(const std::string &line) {
    std::lock_guard<std::mutex> lock(mutex_);
    std::cout << line << std::endl;
  }

private:
  LogManager() = default; // Private constructor for singleton
  mutable std::mutex mutex_;
  std::map<LogComponent, LogLevel> log_levels_;
  LogLevel default_level_ = LogLevel::INFO;
};

// --- The Core Logging Macro ---
// A macro so that the message expression is only evaluated when the level is
// enabled for the component.
#define LOG(level, component, message)                                         \
  do {                                                                         \
    if (LogManager::instance().should_log(level, component)) {                 \
      auto now = std::chrono::system_clock::now();                             \
      auto time_t_now = std::chrono::system_clock::to_time_t(now);             \
      auto ms = std::chrono::duration_cast<std::chrono::milliseconds>(         \
                    now.time_since_epoch()) %                                  \
                1000;                                                          \
      std::tm tm_utc{};                                                        \
      gmtime_r(&time_t_now, &tm_utc);                                          \
      std::ostringstream oss;                                                  \
      oss << std::put_time(&tm_utc, "%Y-%m-%dT%H:%M:%S") << '.'                \
          << std::setw(3) << std::setfill('0') << ms.count() << "Z ";          \
      oss << "[" << level_to_string(level) << "] ";                            \
      oss << "[" << component_to_string(component) << "] ";                    \
      oss << "[" << __FILE__ << ":" << __LINE__ << "] ";                       \
      oss << message;                                                          \
      LogManager::instance().write(oss.str());                                 \
    }                                                                          \
  } while (0)

// --- Helper Functions to Convert Enums to Strings for Printing ---

inline const char *level_to_string(LogLevel level) {
  switch (level) {
  case LogLevel::TRACE:
    return "TRACE";
  case LogLevel::DEBUG:
    return "DEBUG";
  case LogLevel::INFO:
    return "INFO";
  case LogLevel::WARN:
    return "WARN";
  case LogLevel::ERROR:
    return "ERROR";
  case LogLevel::FATAL:
    return "FATAL";
  }
  return "UNKNOWN";
}

inline const char *component_to_string(LogComponent component) {
  switch (component) {
  case LogComponent::CORE:
    return "CORE";
  case LogComponent::CONFIG:
    return "CONFIG";
  case LogComponent::IO_QUERY:
    return "IO.QUERY";
  case LogComponent::IO_DISPATCH:
    return "IO.DISPATCH";
  case LogComponent::ANALYSIS_STATS:
    return "ANALYSIS.STATS";
  case LogComponent::ANALYSIS_SEASONALITY:
    return "ANALYSIS.SEASONALITY";
  case LogComponent::ANALYSIS_DETECTOR:
    return "ANALYSIS.DETECTOR";
  case LogComponent::JOBS_COST:
    return "JOBS.COST";
  case LogComponent::JOBS_LOG:
    return "JOBS.LOG";
  case LogComponent::METRICS:
    return "METRICS";
  }
  return "GENERAL";
}

#endif // LOGGER_HPP
