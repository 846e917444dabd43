#include "hooktunnel/billing/webhook_registry.hpp"

#include "hooktunnel/common/fs.hpp"
#include "hooktunnel/common/json_util.hpp"
#include "hooktunnel/observability/global.hpp"

#include <openssl/rand.h>

#include <sstream>

namespace hooktunnel::billing {

namespace {

constexpr std::string_view SECRET_ALPHABET =
    "abcdefghijklmnopqrstuvwxyzABCDEFGHIJKLMNOPQRSTUVWXYZ0123456789";

std::string describe_failure(const http::HttpResponse &response) {
  if (response.network_error) {
    return response.network_error_message;
  }
  std::string message = "HTTP " + std::to_string(response.status);
  const auto errors = common::json_array_elements(common::json_member(response.body, "errors"));
  std::string detail;
  if (!errors.empty()) {
    detail = common::json_scalar(common::json_member(errors.front(), "detail"));
  }
  if (!detail.empty()) {
    message += ": " + detail;
  }
  return message;
}

} // namespace

common::Result<std::string> generate_secret(const std::size_t length) {
  // 62 * 4 = 248: bytes at or above it are rejected so every symbol is equally likely.
  constexpr unsigned int accept_below = 248;
  std::string secret;
  secret.reserve(length);

  unsigned char buf[64];
  while (secret.size() < length) {
    if (RAND_bytes(buf, static_cast<int>(sizeof(buf))) != 1) {
      return common::Result<std::string>::failure("random number generator unavailable");
    }
    for (const unsigned char byte : buf) {
      if (byte >= accept_below || secret.size() == length) {
        continue;
      }
      secret.push_back(SECRET_ALPHABET[byte % SECRET_ALPHABET.size()]);
    }
  }
  return common::Result<std::string>::success(std::move(secret));
}

std::string webhook_callback_url(const std::string &tunnel_url, const std::string &path) {
  return common::rtrim_chars(common::trim(tunnel_url), "/") + "/" + path + "/webhook";
}

common::Result<WebhookPage> parse_webhook_page(const std::string &body) {
  const auto page = common::json_path(body, "meta.page");
  const auto current = common::json_integer(common::json_member(page, "currentPage"));
  const auto last = common::json_integer(common::json_member(page, "lastPage"));
  if (!current.has_value() || !last.has_value() || *current < 0 || *last < 0) {
    return common::Result<WebhookPage>::failure(common::ErrorKind::InvalidResponse,
                                                "webhook listing is missing meta.page");
  }

  WebhookPage result;
  result.current_page = static_cast<std::uint32_t>(*current);
  result.last_page = static_cast<std::uint32_t>(*last);
  for (const auto &item : common::json_array_elements(common::json_member(body, "data"))) {
    const std::string id = common::json_scalar(common::json_member(item, "id"));
    if (id.empty()) {
      continue;
    }
    result.webhooks[id] = common::json_scalar(common::json_path(item, "attributes.url"));
  }
  return common::Result<WebhookPage>::success(std::move(result));
}

WebhookRegistry::WebhookRegistry(http::HttpClient &http, config::BillingConfig config)
    : http_(http), config_(std::move(config)) {}

std::string WebhookRegistry::endpoint(const std::string &suffix) const {
  return common::rtrim_chars(config_.api_base, "/") + suffix;
}

std::string WebhookRegistry::build_payload(const std::string &callback_url,
                                           const std::string &secret) const {
  std::ostringstream body;
  body << "{\"data\":{";
  body << "\"type\":\"webhooks\",";
  body << "\"attributes\":{";
  body << "\"url\":\"" << common::json_escape(callback_url) << "\",";
  body << "\"events\":[";
  for (std::size_t i = 0; i < WEBHOOK_EVENTS.size(); ++i) {
    if (i > 0) {
      body << ',';
    }
    body << '"' << WEBHOOK_EVENTS[i] << '"';
  }
  body << "],";
  body << "\"secret\":\"" << common::json_escape(secret) << "\"";
  body << "},";
  body << "\"relationships\":{\"store\":{\"data\":{";
  body << "\"type\":\"stores\",";
  body << "\"id\":\"" << common::json_escape(config_.store_id) << "\"";
  body << "}}}";
  body << "}}";
  return body.str();
}

common::Result<std::string> WebhookRegistry::create(const std::string &tunnel_url) {
  std::string secret = config_.signing_secret;
  if (common::trim(secret).empty()) {
    auto generated = generate_secret();
    if (!generated.ok()) {
      return common::Result<std::string>::failure(common::ErrorKind::RegistrationFailed,
                                                  generated.error());
    }
    secret = std::move(generated.value());
  }

  const std::string callback_url = webhook_callback_url(tunnel_url, config_.path);
  const auto response = http_.post_json(endpoint("/webhooks"), http::bearer_headers(config_.api_key),
                                        build_payload(callback_url, secret));
  if (response.status != 201) {
    const std::string message = describe_failure(response);
    observability::record_error("webhook-registry", "create failed: " + message);
    return common::Result<std::string>::failure(common::ErrorKind::RegistrationFailed, message);
  }

  const std::string id = common::json_scalar(common::json_path(response.body, "data.id"));
  if (id.empty()) {
    return common::Result<std::string>::failure(common::ErrorKind::RegistrationFailed,
                                                "created webhook has no id");
  }
  observability::record_webhook_registered(id, callback_url);
  return common::Result<std::string>::success(id);
}

common::Result<WebhookIndex> WebhookRegistry::list(const std::string &store_id) {
  WebhookIndex webhooks;
  const std::string base =
      endpoint("/webhooks?filter%5Bstore_id%5D=" + http::url_encode(store_id));
  std::uint32_t requested = 0;
  std::uint32_t previous = 0;

  while (true) {
    const std::string url =
        requested > 0 ? base + "&page%5Bnumber%5D=" + std::to_string(requested) : base;
    const auto response = http_.get(url, http::bearer_headers(config_.api_key));
    if (response.network_error) {
      return common::Result<WebhookIndex>::failure(common::ErrorKind::TransientNetwork,
                                                   response.network_error_message);
    }
    if (response.status != 200) {
      return common::Result<WebhookIndex>::failure(common::ErrorKind::InvalidResponse,
                                                   "listing webhooks failed: " +
                                                       describe_failure(response));
    }

    auto page = parse_webhook_page(response.body);
    if (!page.ok()) {
      return common::Result<WebhookIndex>::failure(page.status());
    }
    const auto &current = page.value();
    webhooks.insert(current.webhooks.begin(), current.webhooks.end());

    if (current.current_page >= current.last_page) {
      break;
    }
    if (current.current_page <= previous) {
      return common::Result<WebhookIndex>::failure(common::ErrorKind::InvalidResponse,
                                                   "webhook pagination did not advance past page " +
                                                       std::to_string(current.current_page));
    }
    previous = current.current_page;
    requested = current.current_page + 1;
  }

  return common::Result<WebhookIndex>::success(std::move(webhooks));
}

common::Status WebhookRegistry::remove(const std::string &id) {
  const auto response =
      http_.del(endpoint("/webhooks/" + http::url_encode(id)),
                http::bearer_headers(config_.api_key));
  const bool deleted = response.status == 204;
  observability::record_webhook_deleted(id, deleted);
  if (!deleted) {
    return common::Status::error(common::ErrorKind::DeletionFailed,
                                 "failed to remove webhook " + id + " (" +
                                     describe_failure(response) + ")");
  }
  return common::Status::success();
}

} // namespace hooktunnel::billing
