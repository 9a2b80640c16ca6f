#ifndef CONSOLE_DISPATCHER_HPP
#define CONSOLE_DISPATCHER_HPP

#include "base_dispatcher.hpp"

#include <iostream>
#include <mutex>

class ConsoleDispatcher : public IAlertDispatcher {
public:
  explicit ConsoleDispatcher(std::ostream &out = std::cout);

  bool dispatch(const AnomalyRecord &record) override;
  const char *get_name() const override { return "ConsoleDispatcher"; }
  std::string get_dispatcher_type() const override { return "stdout"; }

private:
  std::ostream &out_;
  std::mutex out_mutex_;
};

#endif // CONSOLE_DISPATCHER_HPP
