#include "dispatcher_factory.hpp"
#include "console_dispatcher.hpp"
#include "core/logger.hpp"
#include "fan_out_dispatcher.hpp"
#include "file_dispatcher.hpp"
#include "http_dispatcher.hpp"
#include "syslog_dispatcher.hpp"

std::vector<std::shared_ptr<IAlertDispatcher>>
create_dispatchers(const Config::AlertingConfig &config) {
  std::vector<std::shared_ptr<IAlertDispatcher>> dispatchers;

  if (config.stdout_enabled)
    dispatchers.push_back(std::make_shared<ConsoleDispatcher>());
  if (config.file_enabled)
    dispatchers.push_back(std::make_shared<FileDispatcher>(config.file_path));
  if (config.syslog_enabled)
    dispatchers.push_back(std::make_shared<SyslogDispatcher>());
  if (config.http_enabled)
    dispatchers.push_back(
        std::make_shared<HttpDispatcher>(config.http_webhook_url));

  for (const auto &d : dispatchers)
    LOG(LogLevel::INFO, LogComponent::IO_DISPATCH,
        "Alert channel enabled: " << d->get_dispatcher_type());
  if (dispatchers.empty())
    LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
        "No alert channels enabled; anomalies will only be logged");

  return dispatchers;
}

std::shared_ptr<IAlertDispatcher>
create_alert_dispatcher(const Config::AlertingConfig &config) {
  return std::make_shared<FanOutDispatcher>(create_dispatchers(config));
}
