#include "hooktunnel/lifecycle/cleanup.hpp"

#include "hooktunnel/common/fs.hpp"
#include "hooktunnel/observability/global.hpp"

#include <vector>

namespace hooktunnel::lifecycle {

namespace {

std::string callback_host(const std::string &url) {
  const auto scheme = url.find("://");
  const std::size_t start = scheme == std::string::npos ? 0 : scheme + 3;
  const auto end = url.find_first_of("/:?#", start);
  return common::to_lower(url.substr(start, end == std::string::npos ? std::string::npos : end - start));
}

} // namespace

bool callback_matches_domain(const std::string &url, const std::string &domain_suffix) {
  if (domain_suffix.empty()) {
    return false;
  }
  if (common::ends_with(url, domain_suffix)) {
    return true;
  }
  if (domain_suffix.find("://") != std::string::npos) {
    return common::starts_with(url, domain_suffix + "/");
  }
  return common::ends_with(callback_host(url), common::to_lower(domain_suffix));
}

CleanupJob::CleanupJob(billing::WebhookRegistry &registry, cli::Console &console)
    : registry_(registry), console_(console) {}

common::Result<CleanupReport> CleanupJob::run(const std::string &store_id,
                                              const std::string &domain_suffix) {
  if (domain_suffix.empty()) {
    // An empty suffix would match every webhook of the store.
    return common::Result<CleanupReport>::failure(common::ErrorKind::ConfigValidation,
                                                  "cleanup domain must not be empty");
  }

  auto listed = registry_.list(store_id);
  if (!listed.ok()) {
    return common::Result<CleanupReport>::failure(listed.status());
  }

  std::vector<std::string> matches;
  for (const auto &[id, url] : listed.value()) {
    if (callback_matches_domain(url, domain_suffix)) {
      matches.push_back(id);
    }
  }

  CleanupReport report;
  report.matched = matches.size();
  for (const auto &id : matches) {
    const auto removed = registry_.remove(id);
    if (removed.ok()) {
      ++report.deleted;
      console_.info("✅ Webhook " + id + " removed successfully.");
    } else {
      ++report.failed;
      console_.error("Failed to remove webhook " + id + ".");
    }
  }

  observability::record_metric(observability::WebhooksCleanedMetric{.count = report.deleted});
  return common::Result<CleanupReport>::success(report);
}

} // namespace hooktunnel::lifecycle
