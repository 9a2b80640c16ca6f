#include "fan_out_dispatcher.hpp"
#include "core/logger.hpp"

#include <exception>
#include <utility>

FanOutDispatcher::FanOutDispatcher(
    std::vector<std::shared_ptr<IAlertDispatcher>> dispatchers)
    : dispatchers_(std::move(dispatchers)) {}

bool FanOutDispatcher::dispatch(const AnomalyRecord &record) {
  bool all_ok = true;
  for (const auto &dispatcher : dispatchers_) {
    bool ok = false;
    try {
      ok = dispatcher->dispatch(record);
    } catch (const std::exception &e) {
      LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
          dispatcher->get_name() << " threw while dispatching: " << e.what());
    }
    if (!ok) {
      LOG(LogLevel::WARN, LogComponent::IO_DISPATCH,
          dispatcher->get_name() << " did not deliver alert for '"
                                 << record.source << "'");
      all_ok = false;
    }
  }
  return all_ok;
}
