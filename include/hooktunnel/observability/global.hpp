#pragma once

#include "hooktunnel/observability/observer.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace hooktunnel::observability {

void set_global_observer(std::unique_ptr<IObserver> observer);
IObserver *get_global_observer();

void record_event(const ObserverEvent &event);
void record_metric(const ObserverMetric &metric);

void record_transition(const std::string &from, const std::string &to);
void record_tunnel_started(const std::string &provider, const std::string &command);
void record_tunnel_url(const std::string &provider, const std::string &url);
void record_webhook_registered(const std::string &id, const std::string &url);
void record_webhook_deleted(const std::string &id, bool success);
void record_request_forwarded(const std::string &method, const std::string &uri,
                              std::uint16_t status);
void record_http_retry(const std::string &method, const std::string &url, std::uint32_t attempt,
                       const std::string &reason);
void record_error(const std::string &component, const std::string &message);

} // namespace hooktunnel::observability
