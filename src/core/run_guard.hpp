#ifndef RUN_GUARD_HPP
#define RUN_GUARD_HPP

#include "errors.hpp"
#include "logger.hpp"

#include <exception>

/**
 * Runs `body` and returns its exit code. Any exception escaping it is logged
 * as FATAL and turned into `failure_code`, so the process never ends through
 * std::terminate.
 */
template <typename Body> int run_guarded(int failure_code, Body &&body) {
  try {
    return body();
  } catch (const AnalysisError &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE, "Aborting: " << e.what());
  } catch (const std::exception &e) {
    LOG(LogLevel::FATAL, LogComponent::CORE,
        "Aborting on unexpected error: " << e.what());
  }
  return failure_code;
}

#endif // RUN_GUARD_HPP
