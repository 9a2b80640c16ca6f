#ifndef BASE_DISPATCHER_HPP
#define BASE_DISPATCHER_HPP

#include "core/anomaly_record.hpp"

#include <string>

// Fire-and-forget sink for anomaly records. A false return means the record
// was not delivered; callers count it and move on without retrying.
class IAlertDispatcher {
public:
  virtual ~IAlertDispatcher() = default;
  virtual bool dispatch(const AnomalyRecord &record) = 0;
  virtual const char *get_name() const = 0;
  virtual std::string get_dispatcher_type() const = 0;
};

#endif // BASE_DISPATCHER_HPP
