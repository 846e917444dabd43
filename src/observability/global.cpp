#include "hooktunnel/observability/global.hpp"

#include <mutex>

namespace hooktunnel::observability {

namespace {

std::mutex g_observer_mutex;
std::unique_ptr<IObserver> g_observer;

} // namespace

void set_global_observer(std::unique_ptr<IObserver> observer) {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  g_observer = std::move(observer);
}

IObserver *get_global_observer() {
  std::lock_guard<std::mutex> lock(g_observer_mutex);
  return g_observer.get();
}

void record_event(const ObserverEvent &event) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_event(event);
  }
}

void record_metric(const ObserverMetric &metric) {
  if (auto *observer = get_global_observer(); observer != nullptr) {
    observer->record_metric(metric);
  }
}

void record_transition(const std::string &from, const std::string &to) {
  record_event(StateTransitionEvent{.from = from, .to = to});
}

void record_tunnel_started(const std::string &provider, const std::string &command) {
  record_event(TunnelStartedEvent{.provider = provider, .command = command});
}

void record_tunnel_url(const std::string &provider, const std::string &url) {
  record_event(TunnelUrlEvent{.provider = provider, .url = url});
}

void record_webhook_registered(const std::string &id, const std::string &url) {
  record_event(WebhookRegisteredEvent{.id = id, .url = url});
}

void record_webhook_deleted(const std::string &id, const bool success) {
  record_event(WebhookDeletedEvent{.id = id, .success = success});
}

void record_request_forwarded(const std::string &method, const std::string &uri,
                              const std::uint16_t status) {
  record_event(RequestForwardedEvent{.method = method, .uri = uri, .status = status});
}

void record_http_retry(const std::string &method, const std::string &url,
                       const std::uint32_t attempt, const std::string &reason) {
  record_event(
      HttpRetryEvent{.method = method, .url = url, .attempt = attempt, .reason = reason});
}

void record_error(const std::string &component, const std::string &message) {
  record_event(ErrorEvent{.component = component, .message = message});
}

} // namespace hooktunnel::observability
