#include "hooktunnel/observability/log_observer.hpp"

#include <iostream>
#include <type_traits>

namespace hooktunnel::observability {

LogObserver::LogObserver() : out_(&std::cerr) {}

LogObserver::LogObserver(std::ostream &out) : out_(&out) {}

void LogObserver::log_line(const std::string_view level, const std::string &message) {
  *out_ << "[" << level << "] " << message << "\n";
}

void LogObserver::record_event(const ObserverEvent &event) {
  std::visit(
      [this](auto &&evt) {
        using T = std::decay_t<decltype(evt)>;
        if constexpr (std::is_same_v<T, StateTransitionEvent>) {
          log_line("DEBUG", "lifecycle.transition from=" + evt.from + " to=" + evt.to);
        } else if constexpr (std::is_same_v<T, TunnelStartedEvent>) {
          log_line("INFO", "tunnel.start provider=" + evt.provider + " command=" + evt.command);
        } else if constexpr (std::is_same_v<T, TunnelUrlEvent>) {
          log_line("INFO", "tunnel.url provider=" + evt.provider + " url=" + evt.url);
        } else if constexpr (std::is_same_v<T, WebhookRegisteredEvent>) {
          log_line("INFO", "webhook.registered id=" + evt.id + " url=" + evt.url);
        } else if constexpr (std::is_same_v<T, WebhookDeletedEvent>) {
          log_line(evt.success ? "INFO" : "WARN",
                   "webhook.deleted id=" + evt.id +
                       " success=" + (evt.success ? std::string("true") : std::string("false")));
        } else if constexpr (std::is_same_v<T, RequestForwardedEvent>) {
          log_line("DEBUG", "tunnel.request method=" + evt.method + " uri=" + evt.uri +
                                " status=" + std::to_string(evt.status));
        } else if constexpr (std::is_same_v<T, HttpRetryEvent>) {
          log_line("WARN", "http.retry method=" + evt.method + " url=" + evt.url +
                               " attempt=" + std::to_string(evt.attempt) + " reason=" + evt.reason);
        } else if constexpr (std::is_same_v<T, ErrorEvent>) {
          log_line("ERROR", evt.component + ": " + evt.message);
        }
      },
      event);
}

void LogObserver::record_metric(const ObserverMetric &metric) {
  std::visit(
      [this](auto &&m) {
        using T = std::decay_t<decltype(m)>;
        if constexpr (std::is_same_v<T, RequestLatencyMetric>) {
          log_line("DEBUG", "metric.request_latency_ms=" + std::to_string(m.latency.count()));
        } else if constexpr (std::is_same_v<T, WebhooksCleanedMetric>) {
          log_line("DEBUG", "metric.webhooks_cleaned=" + std::to_string(m.count));
        }
      },
      metric);
}

void LogObserver::flush() { out_->flush(); }

} // namespace hooktunnel::observability
