#ifndef FAN_OUT_DISPATCHER_HPP
#define FAN_OUT_DISPATCHER_HPP

#include "base_dispatcher.hpp"

#include <memory>
#include <vector>

// Forwards every record to all children. Succeeds only if each child did;
// one failing child never stops delivery to the others.
class FanOutDispatcher : public IAlertDispatcher {
public:
  explicit FanOutDispatcher(
      std::vector<std::shared_ptr<IAlertDispatcher>> dispatchers);

  bool dispatch(const AnomalyRecord &record) override;
  const char *get_name() const override { return "FanOutDispatcher"; }
  std::string get_dispatcher_type() const override { return "fan_out"; }

  size_t size() const { return dispatchers_.size(); }

private:
  std::vector<std::shared_ptr<IAlertDispatcher>> dispatchers_;
};

#endif // FAN_OUT_DISPATCHER_HPP
