#include "io/alert_dispatch/http_dispatcher.hpp"
#include "core/logger.hpp"
#include "httplib.h"
#include "utils/json_formatter.hpp"

#include <regex>

HttpDispatcher::HttpDispatcher(const std::string &webhook_url,
                               std::chrono::milliseconds timeout)
    : timeout_(timeout) {
  // Group 1: scheme, group 2: host[:port], group 3: path
  std::regex url_regex(R"(^(https?):\/\/([^\/]+)(\/.*)?$)");
  std::smatch match;

  if (std::regex_match(webhook_url, match, url_regex)) {
    host_ = match[2].str();
    path_ = match[3].matched ? match[3].str() : "/";
    scheme_host_ = match[1].str() + "://" + host_;
    LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
        "HttpDispatcher initialized with URL: "
            << webhook_url << " | Host: " << host_ << " | Path: " << path_);
  } else {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Invalid webhook URL format provided to HttpDispatcher: "
            << webhook_url);
  }
}

bool HttpDispatcher::dispatch(const AnomalyRecord &record) {
  if (!is_valid()) {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "Cannot dispatch alert: invalid webhook URL in HttpDispatcher");
    return false;
  }

  httplib::Client client(scheme_host_);
  if (!client.is_valid()) {
    LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
        "HTTP client unavailable for " << scheme_host_
                                       << " (TLS support not built in?)");
    return false;
  }
  client.set_connection_timeout(timeout_);
  client.set_read_timeout(timeout_);
  client.set_write_timeout(timeout_);

  std::string json_body = JsonFormatter::format_anomaly_record_to_json(record);
  auto res = client.Post(path_, json_body, "application/json");

  if (res && res->status < 400) {
    LOG(LogLevel::TRACE, LogComponent::IO_DISPATCH,
        "Dispatched alert via HTTP to " << scheme_host_ << path_
                                        << " | Status: " << res->status);
    return true;
  }

  LOG(LogLevel::ERROR, LogComponent::IO_DISPATCH,
      "Failed to dispatch alert via HTTP to "
          << scheme_host_ << path_ << " | Status: "
          << (res ? std::to_string(res->status)
                  : httplib::to_string(res.error())));
  return false;
}
