#pragma once

#include "hooktunnel/billing/webhook_registry.hpp"
#include "hooktunnel/cli/console.hpp"
#include "hooktunnel/config/schema.hpp"
#include "hooktunnel/http/client.hpp"
#include "hooktunnel/lifecycle/cancellation.hpp"

#include <optional>
#include <string>
#include <string_view>
#include <unordered_set>

namespace hooktunnel::lifecycle {

enum class Service { Expose, Ngrok, Custom, Test };

[[nodiscard]] std::optional<Service> parse_service(std::string_view name);
[[nodiscard]] std::string_view service_name(Service service);

enum class LifecycleState {
  Idle,
  EnvironmentChecked,
  Cleaning,
  ServiceSelected,
  TunnelStarting,
  TunnelUrlDiscovered,
  WebhookRegistered,
  Listening,
  Teardown,
  Done,
};

[[nodiscard]] std::string_view state_name(LifecycleState state);

struct ListenOptions {
  std::string service;
  std::optional<std::string> url;
  bool cleanup = false;
  bool verbose = false;
  bool isolated = false;
};

/// State of one listen invocation. Created by the controller, passed to the
/// provider and dropped when the run returns.
struct RunContext {
  const config::Config &config;
  ListenOptions options;
  cli::Console &console;
  const CancellationFlag &cancel;
  billing::WebhookRegistry &registry;
  /// Carries the discovery retry policy.
  http::HttpClient &discovery_http;
  /// Single attempt; used for the request log.
  http::HttpClient &inspect_http;

  LifecycleState state = LifecycleState::Idle;
  std::optional<std::string> tunnel_url;
  std::optional<std::string> active_webhook_id;
  std::unordered_set<std::string> seen_requests;
  bool torn_down = false;
};

void advance(RunContext &ctx, LifecycleState next);

/// Registers the callback for `tunnel_url` and records the webhook id on success.
[[nodiscard]] common::Status register_webhook(RunContext &ctx, const std::string &tunnel_url);

/// Deletes the active webhook, at most once per run. Nothing is deleted when no
/// webhook was registered; the id is kept if the delete fails.
void teardown_webhook(RunContext &ctx);

} // namespace hooktunnel::lifecycle
