#ifndef HTTP_DISPATCHER_HPP
#define HTTP_DISPATCHER_HPP

#include "io/alert_dispatch/base_dispatcher.hpp"

#include <chrono>
#include <string>

// POSTs each record as JSON to a webhook.
class HttpDispatcher : public IAlertDispatcher {
public:
  explicit HttpDispatcher(const std::string &webhook_url,
                          std::chrono::milliseconds timeout =
                              std::chrono::milliseconds(5000));

  bool dispatch(const AnomalyRecord &record) override;
  const char *get_name() const override { return "HttpDispatcher"; }
  std::string get_dispatcher_type() const override { return "http"; }

  bool is_valid() const { return !host_.empty(); }

private:
  std::string scheme_host_;
  std::string host_;
  std::string path_;
  std::chrono::milliseconds timeout_;
};

#endif // HTTP_DISPATCHER_HPP
