#include "syslog_dispatcher.hpp"
#include "core/logger.hpp"

#include <syslog.h>

SyslogDispatcher::SyslogDispatcher() {
  openlog("metric_analyzer", LOG_PID | LOG_CONS, LOG_USER);
}

SyslogDispatcher::~SyslogDispatcher() { closelog(); }

bool SyslogDispatcher::dispatch(const AnomalyRecord &record) {
  std::string line = "ALERT: " + format_anomaly_summary(record) +
                     " | detector: " + record.detector;

  LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
      "Dispatching alert to syslog: " << line);
  int priority =
      record.severity == AnomalySeverity::HIGH ? LOG_ERR : LOG_WARNING;
  syslog(priority, "%s", line.c_str());
  return true;
}
