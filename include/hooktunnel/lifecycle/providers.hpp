#pragma once

#include "hooktunnel/common/result.hpp"
#include "hooktunnel/lifecycle/context.hpp"

#include <string>
#include <variant>
#include <vector>

namespace hooktunnel::lifecycle {

/// Why a provider stopped without failing.
enum class StopReason {
  Interrupted,
  TunnelExited,
  Completed,
};

/// `expose share <route> --subdomain=<hint> --no-interaction`, URL scraped from its output.
struct ExposeProvider {
  [[nodiscard]] common::Result<StopReason> run(RunContext &ctx) const;
  [[nodiscard]] std::vector<std::string> command(const RunContext &ctx) const;
};

/// `ngrok http <route> --host-header=rewrite`, URL and request log read from its local API.
struct NgrokProvider {
  [[nodiscard]] common::Result<StopReason> run(RunContext &ctx) const;
  [[nodiscard]] std::vector<std::string> command(const RunContext &ctx) const;
};

/// No subprocess; `base_url` stands in for a discovered tunnel.
struct CustomProvider {
  std::string base_url;

  [[nodiscard]] common::Result<StopReason> run(RunContext &ctx) const;
};

struct TestProvider {
  [[nodiscard]] common::Result<StopReason> run(RunContext &ctx) const;
};

using Provider = std::variant<ExposeProvider, NgrokProvider, CustomProvider, TestProvider>;

[[nodiscard]] Provider make_provider(Service service, const std::string &custom_url);
[[nodiscard]] common::Result<StopReason> run_provider(const Provider &provider, RunContext &ctx);

/// Suffix that identifies this provider's webhooks during cleanup.
[[nodiscard]] std::string provider_domain(Service service, const config::Config &config,
                                          const std::string &custom_url);

/// Trimmed, with trailing '/' removed.
[[nodiscard]] std::string normalize_custom_url(const std::string &url);

/// 40 hex chars derived from the current time.
[[nodiscard]] std::string subdomain_hint();

} // namespace hooktunnel::lifecycle
