#include "hooktunnel/lifecycle/providers.hpp"

#include "hooktunnel/common/fs.hpp"
#include "hooktunnel/config/config.hpp"
#include "hooktunnel/observability/global.hpp"
#include "hooktunnel/tunnel/process.hpp"
#include "hooktunnel/tunnel/request_log.hpp"
#include "hooktunnel/tunnel/resolver.hpp"

#include <chrono>
#include <ctime>
#include <iomanip>
#include <sstream>

#include <openssl/sha.h>

namespace hooktunnel::lifecycle {

namespace {

std::string join_command(const std::vector<std::string> &argv) {
  std::string out;
  for (const auto &arg : argv) {
    if (!out.empty()) {
      out.push_back(' ');
    }
    out += arg;
  }
  return out;
}

tunnel::OutputCallback echo_output(RunContext &ctx) {
  return [&ctx](const std::string_view chunk) {
    if (!ctx.options.verbose && !ctx.active_webhook_id.has_value()) {
      return;
    }
    const std::string text = common::trim(std::string(chunk));
    if (!text.empty()) {
      ctx.console.note(text);
    }
  };
}

std::chrono::milliseconds poll_interval(const RunContext &ctx) {
  return std::chrono::milliseconds(ctx.config.reliability.poll_interval_ms);
}

/// One tick per poll interval: cancellation, liveness, URL discovery, request log.
common::Result<StopReason> supervise(RunContext &ctx, const std::string_view provider,
                                     const std::vector<std::string> &argv,
                                     tunnel::ITunnelUrlResolver &resolver,
                                     tunnel::RequestLogTail *request_log) {
  advance(ctx, LifecycleState::TunnelStarting);

  tunnel::TunnelProcess process;
  std::optional<std::chrono::seconds> timeout;
  if (ctx.config.reliability.process_timeout_secs > 0) {
    timeout = std::chrono::seconds(ctx.config.reliability.process_timeout_secs);
  }
  if (auto started = process.start(argv, echo_output(ctx), timeout); !started.ok()) {
    ctx.console.error("Failed to start " + std::string(provider) + ": " + started.error());
    return common::Result<StopReason>::failure(started);
  }
  observability::record_tunnel_started(std::string(provider), join_command(argv));

  while (true) {
    if (ctx.cancel.requested()) {
      return common::Result<StopReason>::success(StopReason::Interrupted);
    }
    if (!process.is_running()) {
      if (process.timed_out()) {
        observability::record_error(std::string(provider),
                                    "no public url within " +
                                        std::to_string(ctx.config.reliability.process_timeout_secs) +
                                        "s");
      }
      return common::Result<StopReason>::success(StopReason::TunnelExited);
    }

    if (!ctx.tunnel_url.has_value()) {
      if (auto url = resolver.poll(process); url.has_value()) {
        process.disarm_timeout();
        observability::record_tunnel_url(std::string(provider), *url);
        if (auto registered = register_webhook(ctx, *url); !registered.ok()) {
          return common::Result<StopReason>::failure(registered);
        }
      }
    }

    if (ctx.tunnel_url.has_value() && request_log != nullptr) {
      for (const auto &line : request_log->poll(ctx.seen_requests)) {
        ctx.console.note(line);
      }
    }

    if (ctx.cancel.sleep_for(poll_interval(ctx))) {
      return common::Result<StopReason>::success(StopReason::Interrupted);
    }
  }
}

} // namespace

std::string normalize_custom_url(const std::string &url) {
  return common::rtrim_chars(common::trim(url), "/");
}

std::string subdomain_hint() {
  const std::string seed = std::to_string(std::time(nullptr));
  unsigned char digest[SHA_DIGEST_LENGTH];
  SHA1(reinterpret_cast<const unsigned char *>(seed.data()), seed.size(), digest);

  std::ostringstream out;
  out << std::hex << std::setfill('0');
  for (const unsigned char byte : digest) {
    out << std::setw(2) << static_cast<int>(byte);
  }
  return out.str();
}

std::vector<std::string> ExposeProvider::command(const RunContext &ctx) const {
  return {ctx.config.expose.command, "share", config::local_webhook_route(ctx.config),
          "--subdomain=" + subdomain_hint(), "--no-interaction"};
}

common::Result<StopReason> ExposeProvider::run(RunContext &ctx) const {
  tunnel::OutputScrapeResolver resolver;
  return supervise(ctx, "expose", command(ctx), resolver, nullptr);
}

std::vector<std::string> NgrokProvider::command(const RunContext &ctx) const {
  return {ctx.config.ngrok.command, "http", config::local_webhook_route(ctx.config),
          "--host-header=rewrite"};
}

common::Result<StopReason> NgrokProvider::run(RunContext &ctx) const {
  tunnel::LocalApiResolver resolver(ctx.discovery_http, ctx.config.ngrok.api_base);
  tunnel::RequestLogTail request_log(ctx.inspect_http, ctx.config.ngrok.api_base,
                                     ctx.config.reliability.request_log_limit);
  return supervise(ctx, "ngrok", command(ctx), resolver, &request_log);
}

common::Result<StopReason> CustomProvider::run(RunContext &ctx) const {
  if (auto registered = register_webhook(ctx, base_url); !registered.ok()) {
    return common::Result<StopReason>::failure(registered);
  }
  while (!ctx.cancel.sleep_for(poll_interval(ctx))) {
  }
  return common::Result<StopReason>::success(StopReason::Interrupted);
}

common::Result<StopReason> TestProvider::run(RunContext &ctx) const {
  ctx.console.info("hooktunnel listen is using the test service.");
  return common::Result<StopReason>::success(StopReason::Completed);
}

Provider make_provider(const Service service, const std::string &custom_url) {
  switch (service) {
  case Service::Expose:
    return ExposeProvider{};
  case Service::Ngrok:
    return NgrokProvider{};
  case Service::Custom:
    return CustomProvider{.base_url = custom_url};
  case Service::Test:
    return TestProvider{};
  }
  return TestProvider{};
}

common::Result<StopReason> run_provider(const Provider &provider, RunContext &ctx) {
  return std::visit([&ctx](const auto &strategy) { return strategy.run(ctx); }, provider);
}

std::string provider_domain(const Service service, const config::Config &config,
                            const std::string &custom_url) {
  switch (service) {
  case Service::Expose:
    return config.expose.domain;
  case Service::Ngrok:
    return config.ngrok.domain;
  case Service::Custom:
    return custom_url;
  case Service::Test:
    return "";
  }
  return "";
}

} // namespace hooktunnel::lifecycle
