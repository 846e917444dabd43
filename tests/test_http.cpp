#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "hooktunnel/http/client.hpp"
#include "hooktunnel/http/retry.hpp"

#include <chrono>

void register_http_tests(std::vector<hooktunnel::tests::TestCase> &tests) {
  using hooktunnel::tests::require;
  namespace http = hooktunnel::http;
  namespace ht = hooktunnel::testing;

  tests.push_back({"http_retryable_statuses", [] {
                     http::HttpResponse response;
                     response.status = 503;
                     require(http::is_retryable(response), "5xx should retry");
                     response.status = 429;
                     require(http::is_retryable(response), "429 should retry");
                     response.status = 404;
                     require(!http::is_retryable(response), "404 is final");
                     response.status = 201;
                     require(!http::is_retryable(response), "201 is final");
                     response.status = 0;
                     response.network_error = true;
                     require(http::is_retryable(response), "transport errors retry");
                   }});

  tests.push_back({"http_retry_stops_after_max_attempts", [] {
                     ht::FakeHttpClient fake;
                     fake.set_fallback(500, "oops");
                     http::RetryingHttpClient client(
                         fake, http::RetryPolicy{.max_attempts = 3, .delay = std::chrono::milliseconds(0)});
                     const auto response = client.post_json("https://billing.test/v1/webhooks", {}, "{}");
                     require(response.status == 500, "final response returned as is");
                     require(fake.requests().size() == 3, "exactly three attempts");
                   }});

  tests.push_back({"http_retry_returns_first_success", [] {
                     ht::FakeHttpClient fake;
                     fake.enqueue_network_error();
                     fake.enqueue(502);
                     fake.enqueue(200, R"({"tunnels":[]})");
                     http::RetryingHttpClient client(
                         fake, http::RetryPolicy{.max_attempts = 5, .delay = std::chrono::milliseconds(0)});
                     const auto response = client.get("http://127.0.0.1:4040/api/tunnels");
                     require(response.status == 200, "should recover");
                     require(fake.requests().size() == 3, "stops once successful");
                   }});

  tests.push_back({"http_retry_does_not_repeat_client_errors", [] {
                     ht::FakeHttpClient fake;
                     fake.enqueue(404);
                     http::RetryingHttpClient client(
                         fake, http::RetryPolicy{.max_attempts = 3, .delay = std::chrono::milliseconds(0)});
                     const auto response = client.del("https://billing.test/v1/webhooks/9");
                     require(response.status == 404, "404 passed through");
                     require(fake.requests().size() == 1, "single attempt");
                   }});

  tests.push_back({"http_retry_waits_between_attempts", [] {
                     ht::FakeHttpClient fake;
                     fake.set_fallback(503);
                     http::RetryingHttpClient client(
                         fake, http::RetryPolicy{.max_attempts = 3, .delay = std::chrono::milliseconds(20)});
                     const auto started = std::chrono::steady_clock::now();
                     (void)client.get("https://billing.test/v1/webhooks");
                     const auto elapsed = std::chrono::steady_clock::now() - started;
                     require(elapsed >= std::chrono::milliseconds(40),
                             "two delays expected between three attempts");
                   }});

  tests.push_back({"http_zero_attempts_still_sends_once", [] {
                     ht::FakeHttpClient fake;
                     fake.set_fallback(500);
                     http::RetryingHttpClient client(
                         fake, http::RetryPolicy{.max_attempts = 0, .delay = std::chrono::milliseconds(0)});
                     (void)client.get("https://billing.test/v1/webhooks");
                     require(fake.requests().size() == 1, "one attempt minimum");
                   }});

  tests.push_back({"http_bearer_headers_use_json_api", [] {
                     const auto headers = http::bearer_headers("secret-token");
                     require(headers.at("Authorization") == "Bearer secret-token", "auth header");
                     require(headers.at("Accept") == "application/vnd.api+json", "accept header");
                     require(headers.at("Content-Type") == "application/vnd.api+json",
                             "content type header");
                   }});

  tests.push_back({"http_url_encode_escapes_reserved_characters", [] {
                     require(http::url_encode("4242") == "4242", "plain digits unchanged");
                     require(http::url_encode("a b&c=d/e") == "a%20b%26c%3Dd%2Fe", "reserved escaped");
                   }});

  tests.push_back({"http_curl_reports_connection_refused", [] {
                     http::CurlHttpClient client;
                     http::HttpRequest request;
                     request.url = "http://127.0.0.1:1/unreachable";
                     request.timeout_ms = 2000;
                     const auto response = client.send(request);
                     require(response.network_error, "refused connection is a network error");
                     require(!response.network_error_message.empty(), "message expected");
                   }});
}
