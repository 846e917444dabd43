#pragma once

#include "hooktunnel/common/result.hpp"
#include "hooktunnel/config/schema.hpp"
#include "hooktunnel/http/client.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <map>
#include <string>
#include <string_view>

namespace hooktunnel::billing {

/// Every webhook is subscribed to exactly this set at creation.
inline constexpr std::array<std::string_view, 16> WEBHOOK_EVENTS = {
    "order_created",
    "order_refunded",
    "subscription_created",
    "subscription_updated",
    "subscription_cancelled",
    "subscription_resumed",
    "subscription_expired",
    "subscription_paused",
    "subscription_unpaused",
    "subscription_payment_success",
    "subscription_payment_failed",
    "subscription_payment_recovered",
    "subscription_payment_refunded",
    "subscription_plan_changed",
    "license_key_created",
    "license_key_updated",
};

inline constexpr std::size_t GENERATED_SECRET_LENGTH = 32;

/// Webhook id -> callback url.
using WebhookIndex = std::map<std::string, std::string>;

struct WebhookPage {
  WebhookIndex webhooks;
  std::uint32_t current_page = 0;
  std::uint32_t last_page = 0;
};

/// Alphanumeric secret drawn from the OpenSSL CSPRNG.
[[nodiscard]] common::Result<std::string> generate_secret(std::size_t length = GENERATED_SECRET_LENGTH);

/// `tunnel_url/path/webhook`, with a trailing '/' on the tunnel url dropped.
[[nodiscard]] std::string webhook_callback_url(const std::string &tunnel_url,
                                               const std::string &path);

[[nodiscard]] common::Result<WebhookPage> parse_webhook_page(const std::string &body);

/// Client for the `/webhooks` collection of the billing API. The HttpClient it is
/// given decides the retry behaviour; the registry itself never loops on a request.
class WebhookRegistry {
public:
  WebhookRegistry(http::HttpClient &http, config::BillingConfig config);

  [[nodiscard]] common::Result<std::string> create(const std::string &tunnel_url);
  /// Walks every page of the store's webhooks.
  [[nodiscard]] common::Result<WebhookIndex> list(const std::string &store_id);
  [[nodiscard]] common::Status remove(const std::string &id);

  [[nodiscard]] std::string build_payload(const std::string &callback_url,
                                          const std::string &secret) const;
  [[nodiscard]] const config::BillingConfig &config() const { return config_; }

private:
  [[nodiscard]] std::string endpoint(const std::string &suffix) const;

  http::HttpClient &http_;
  config::BillingConfig config_;
};

} // namespace hooktunnel::billing
