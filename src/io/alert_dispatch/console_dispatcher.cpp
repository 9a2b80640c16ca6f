#include "console_dispatcher.hpp"
#include "core/logger.hpp"
#include "utils/utils.hpp"

ConsoleDispatcher::ConsoleDispatcher(std::ostream &out) : out_(out) {}

bool ConsoleDispatcher::dispatch(const AnomalyRecord &record) {
  std::lock_guard<std::mutex> lock(out_mutex_);
  out_ << Utils::format_time_iso8601(record.timestamp) << " ALERT "
       << format_anomaly_summary(record) << std::endl;
  if (!out_.good()) {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Failed to write alert to console stream");
    return false;
  }
  return true;
}
