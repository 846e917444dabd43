#pragma once

#include <chrono>
#include <cstdint>
#include <string>
#include <string_view>
#include <variant>

namespace hooktunnel::observability {

struct StateTransitionEvent {
  std::string from;
  std::string to;
};

struct TunnelStartedEvent {
  std::string provider;
  std::string command;
};

struct TunnelUrlEvent {
  std::string provider;
  std::string url;
};

struct WebhookRegisteredEvent {
  std::string id;
  std::string url;
};

struct WebhookDeletedEvent {
  std::string id;
  bool success = false;
};

struct RequestForwardedEvent {
  std::string method;
  std::string uri;
  std::uint16_t status = 0;
};

struct HttpRetryEvent {
  std::string method;
  std::string url;
  std::uint32_t attempt = 0;
  std::string reason;
};

struct ErrorEvent {
  std::string component;
  std::string message;
};

using ObserverEvent =
    std::variant<StateTransitionEvent, TunnelStartedEvent, TunnelUrlEvent, WebhookRegisteredEvent,
                 WebhookDeletedEvent, RequestForwardedEvent, HttpRetryEvent, ErrorEvent>;

struct RequestLatencyMetric {
  std::chrono::milliseconds latency{0};
};

struct WebhooksCleanedMetric {
  std::uint64_t count = 0;
};

using ObserverMetric = std::variant<RequestLatencyMetric, WebhooksCleanedMetric>;

class IObserver {
public:
  virtual ~IObserver() = default;

  virtual void record_event(const ObserverEvent &event) = 0;
  virtual void record_metric(const ObserverMetric &metric) = 0;
  virtual void flush() {}
  [[nodiscard]] virtual std::string_view name() const = 0;
};

} // namespace hooktunnel::observability
