#ifndef DISPATCHER_FACTORY_HPP
#define DISPATCHER_FACTORY_HPP

#include "base_dispatcher.hpp"
#include "core/config.hpp"

#include <memory>
#include <vector>

// One dispatcher per enabled channel in [Alerting], in the order stdout,
// file, syslog, http.
std::vector<std::shared_ptr<IAlertDispatcher>>
create_dispatchers(const Config::AlertingConfig &config);

// All enabled channels behind a single FanOutDispatcher.
std::shared_ptr<IAlertDispatcher>
create_alert_dispatcher(const Config::AlertingConfig &config);

#endif // DISPATCHER_FACTORY_HPP
