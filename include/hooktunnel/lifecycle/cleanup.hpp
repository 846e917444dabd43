#pragma once

#include "hooktunnel/billing/webhook_registry.hpp"
#include "hooktunnel/cli/console.hpp"
#include "hooktunnel/common/result.hpp"

#include <cstddef>
#include <string>

namespace hooktunnel::lifecycle {

struct CleanupReport {
  std::size_t matched = 0;
  std::size_t deleted = 0;
  std::size_t failed = 0;
};

/// True when the callback url, or its host, ends with `domain_suffix`. A suffix that is
/// itself a URL also matches every callback underneath it.
[[nodiscard]] bool callback_matches_domain(const std::string &url,
                                           const std::string &domain_suffix);

/// Deletes every webhook of a store whose callback matches a domain suffix.
class CleanupJob {
public:
  CleanupJob(billing::WebhookRegistry &registry, cli::Console &console);

  /// `matched` counts webhooks selected for deletion, whether or not the delete succeeded.
  [[nodiscard]] common::Result<CleanupReport> run(const std::string &store_id,
                                                  const std::string &domain_suffix);

private:
  billing::WebhookRegistry &registry_;
  cli::Console &console_;
};

} // namespace hooktunnel::lifecycle
