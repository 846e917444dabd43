#include "hooktunnel/lifecycle/controller.hpp"

#include "hooktunnel/billing/webhook_registry.hpp"
#include "hooktunnel/common/fs.hpp"
#include "hooktunnel/config/config.hpp"
#include "hooktunnel/http/retry.hpp"
#include "hooktunnel/lifecycle/cleanup.hpp"
#include "hooktunnel/lifecycle/instance_lock.hpp"
#include "hooktunnel/lifecycle/providers.hpp"
#include "hooktunnel/observability/global.hpp"

#include <memory>

namespace hooktunnel::lifecycle {

namespace {

constexpr const char *LOCK_FILENAME = "listen.pid";

bool is_http_url(const std::string &url) {
  const std::string lowered = common::to_lower(common::trim(url));
  for (const std::string scheme : {"http://", "https://"}) {
    if (common::starts_with(lowered, scheme) && lowered.size() > scheme.size()) {
      return true;
    }
  }
  return false;
}

http::RetryPolicy registry_policy(const config::Config &config) {
  return http::RetryPolicy{
      .max_attempts = config.reliability.registry_retries,
      .delay = std::chrono::milliseconds(config.reliability.registry_backoff_ms),
  };
}

http::RetryPolicy discovery_policy(const config::Config &config) {
  return http::RetryPolicy{
      .max_attempts = config.reliability.discovery_retries,
      .delay = std::chrono::milliseconds(config.reliability.discovery_backoff_ms),
  };
}

} // namespace

LifecycleController::LifecycleController(const config::Config &config, cli::Console &console,
                                         http::HttpClient &transport, CancellationFlag &cancel,
                                         ControllerOptions options)
    : config_(config), console_(console), transport_(transport), cancel_(cancel),
      options_(std::move(options)) {}

bool LifecycleController::is_local_environment(const std::string &environment) {
  const std::string env = common::to_lower(common::trim(environment));
  return env == "local" || env == "development" || env == "dev";
}

std::vector<std::string> LifecycleController::validate(const config::Config &config,
                                                       const ListenOptions &options) {
  std::vector<std::string> errors = config::validate_config(config);

  const auto service = parse_service(options.service);
  if (options.service.empty()) {
    errors.emplace_back("The service field is required.");
  } else if (!service.has_value()) {
    errors.emplace_back("The selected service is invalid.");
  }

  if (options.url.has_value() && !is_http_url(*options.url)) {
    errors.emplace_back("The url field must be a valid URL.");
  }
  if (service == Service::Custom && !options.url.has_value()) {
    errors.emplace_back("The url field is required when service is custom.");
  }
  return errors;
}

void LifecycleController::transition(const LifecycleState next) {
  observability::record_transition(std::string(state_name(state_)), std::string(state_name(next)));
  state_ = next;
}

int LifecycleController::fail(const std::string &message) {
  console_.error(message);
  return EXIT_FAILURE_STATUS;
}

int LifecycleController::run(const ListenOptions &options) {
  state_ = LifecycleState::Idle;
  last_webhook_id_.reset();

  const auto errors = validate(config_, options);
  if (!errors.empty()) {
    for (const auto &message : errors) {
      observability::record_error("config", message);
      console_.error(message);
    }
    return EXIT_FAILURE_STATUS;
  }
  const Service service = *parse_service(options.service);

  transition(LifecycleState::EnvironmentChecked);

  if (service != Service::Test && !is_local_environment(config_.app.environment)) {
    return fail("hooktunnel listen can only be used in local environment.");
  }

  const std::string custom_url =
      service == Service::Custom ? normalize_custom_url(*options.url) : std::string();

  std::unique_ptr<InstanceLock> lock;
  if (options.isolated && service != Service::Test) {
    std::filesystem::path lock_path;
    if (options_.lock_path.has_value()) {
      lock_path = *options_.lock_path;
    } else {
      auto dir = config::config_dir();
      if (!dir.ok()) {
        return fail(dir.error());
      }
      lock_path = dir.value() / LOCK_FILENAME;
    }
    lock = std::make_unique<InstanceLock>(lock_path);
    if (auto acquired = lock->acquire(); !acquired.ok()) {
      return fail(acquired.error());
    }
  }

  if (options.cleanup && service != Service::Test) {
    return run_cleanup(service, custom_url);
  }
  return run_listen(service, options, custom_url);
}

int LifecycleController::run_cleanup(const Service service, const std::string &custom_url) {
  transition(LifecycleState::Cleaning);

  console_.note("Cleaning up webhooks for '" + std::string(service_name(service)) +
                "' service...");

  http::RetryingHttpClient registry_http(transport_, registry_policy(config_));
  billing::WebhookRegistry registry(registry_http, config_.billing);
  CleanupJob job(registry, console_);

  auto report = job.run(config_.billing.store_id,
                        provider_domain(service, config_, custom_url));

  transition(LifecycleState::Done);

  if (!report.ok()) {
    observability::record_error("cleanup", report.error());
    return fail("Failed to list webhooks: " + report.error());
  }
  if (report.value().matched == 0) {
    console_.info("No webhooks found to clean.");
  }
  return EXIT_OK;
}

int LifecycleController::run_listen(const Service service, const ListenOptions &options,
                                    const std::string &custom_url) {
  http::RetryingHttpClient registry_http(transport_, registry_policy(config_));
  http::RetryingHttpClient discovery_http(transport_, discovery_policy(config_));
  billing::WebhookRegistry registry(registry_http, config_.billing);

  RunContext ctx{
      .config = config_,
      .options = options,
      .console = console_,
      .cancel = cancel_,
      .registry = registry,
      .discovery_http = discovery_http,
      .inspect_http = transport_,
      .state = state_,
  };

  std::unique_ptr<ScopedInterruptHandler> interrupts;
  if (options_.install_signal_handlers && service != Service::Test) {
    interrupts = std::make_unique<ScopedInterruptHandler>(cancel_);
  }

  if (service != Service::Test) {
    advance(ctx, LifecycleState::ServiceSelected);
    console_.note("Setting up webhooks domain with " + std::string(service_name(service)) +
                  "...");
  }

  const Provider provider = make_provider(service, custom_url);
  auto outcome = run_provider(provider, ctx);

  int status = EXIT_OK;
  if (!outcome.ok()) {
    status = EXIT_FAILURE_STATUS;
  } else if (outcome.value() == StopReason::Interrupted) {
    teardown_webhook(ctx);
  } else if (outcome.value() == StopReason::TunnelExited) {
    status = EXIT_FAILURE_STATUS;
    if (ctx.active_webhook_id.has_value()) {
      console_.error("tunnel process exited; webhook " + *ctx.active_webhook_id +
                     " is still registered, run with --cleanup");
    } else if (!ctx.tunnel_url.has_value()) {
      console_.error("tunnel process exited before a public URL was found.");
    } else {
      console_.error("tunnel process exited.");
    }
  }

  last_webhook_id_ = ctx.active_webhook_id;
  advance(ctx, LifecycleState::Done);
  state_ = ctx.state;
  return status;
}

} // namespace hooktunnel::lifecycle
