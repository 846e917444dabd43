#include "hooktunnel/lifecycle/context.hpp"

#include "hooktunnel/observability/global.hpp"

namespace hooktunnel::lifecycle {

std::optional<Service> parse_service(const std::string_view name) {
  if (name == "expose") {
    return Service::Expose;
  }
  if (name == "ngrok") {
    return Service::Ngrok;
  }
  if (name == "custom") {
    return Service::Custom;
  }
  if (name == "test") {
    return Service::Test;
  }
  return std::nullopt;
}

std::string_view service_name(const Service service) {
  switch (service) {
  case Service::Expose:
    return "expose";
  case Service::Ngrok:
    return "ngrok";
  case Service::Custom:
    return "custom";
  case Service::Test:
    return "test";
  }
  return "unknown";
}

std::string_view state_name(const LifecycleState state) {
  switch (state) {
  case LifecycleState::Idle:
    return "idle";
  case LifecycleState::EnvironmentChecked:
    return "environment_checked";
  case LifecycleState::Cleaning:
    return "cleaning";
  case LifecycleState::ServiceSelected:
    return "service_selected";
  case LifecycleState::TunnelStarting:
    return "tunnel_starting";
  case LifecycleState::TunnelUrlDiscovered:
    return "tunnel_url_discovered";
  case LifecycleState::WebhookRegistered:
    return "webhook_registered";
  case LifecycleState::Listening:
    return "listening";
  case LifecycleState::Teardown:
    return "teardown";
  case LifecycleState::Done:
    return "done";
  }
  return "unknown";
}

void advance(RunContext &ctx, const LifecycleState next) {
  if (ctx.state == next) {
    return;
  }
  observability::record_transition(std::string(state_name(ctx.state)),
                                   std::string(state_name(next)));
  ctx.state = next;
}

common::Status register_webhook(RunContext &ctx, const std::string &tunnel_url) {
  ctx.tunnel_url = tunnel_url;
  advance(ctx, LifecycleState::TunnelUrlDiscovered);

  ctx.console.note("Found webhook endpoint: " + tunnel_url);
  ctx.console.note("Sending webhook to Lemon Squeezy...");

  auto created = ctx.registry.create(tunnel_url);
  if (!created.ok()) {
    ctx.console.error("Failed to setup webhook.");
    return created.status();
  }

  ctx.active_webhook_id = created.value();
  advance(ctx, LifecycleState::WebhookRegistered);

  ctx.console.info("✅ Webhook setup successfully.");
  ctx.console.note("Listening for webhooks...");
  advance(ctx, LifecycleState::Listening);
  return common::Status::success();
}

void teardown_webhook(RunContext &ctx) {
  if (ctx.torn_down) {
    return;
  }
  ctx.torn_down = true;
  advance(ctx, LifecycleState::Teardown);

  if (!ctx.active_webhook_id.has_value()) {
    return;
  }

  ctx.console.note("Cleaning up webhook on Lemon Squeezy...");
  const auto removed = ctx.registry.remove(*ctx.active_webhook_id);
  if (!removed.ok()) {
    ctx.console.error("Failed to remove webhook, use --cleanup to remove all " +
                      ctx.options.service + " domains.");
    return;
  }

  ctx.active_webhook_id.reset();
  ctx.console.info("✅ Webhook removed successfully.");
}

} // namespace hooktunnel::lifecycle
