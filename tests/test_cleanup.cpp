#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "hooktunnel/billing/webhook_registry.hpp"
#include "hooktunnel/lifecycle/cleanup.hpp"

void register_cleanup_tests(std::vector<hooktunnel::tests::TestCase> &tests) {
  using hooktunnel::tests::require;
  namespace bl = hooktunnel::billing;
  namespace lc = hooktunnel::lifecycle;
  namespace ht = hooktunnel::testing;
  namespace http = hooktunnel::http;

  tests.push_back({"cleanup_matches_on_callback_host", [] {
                     require(lc::callback_matches_domain(
                                 "https://aa.ngrok-free.app/lemon-squeezy/webhook", "ngrok-free.app"),
                             "host suffix");
                     require(lc::callback_matches_domain("https://bb.ngrok-free.app", "ngrok-free.app"),
                             "bare url suffix");
                     require(!lc::callback_matches_domain(
                                 "https://shop.example.com/ngrok-free.app/x", "ngrok-free.app"),
                             "path is not the host");
                     require(lc::callback_matches_domain("https://example.com/lemon-squeezy/webhook",
                                                         "https://example.com"),
                             "custom base url");
                     require(!lc::callback_matches_domain("https://example.com.evil/x",
                                                          "https://example.com"),
                             "custom base must be followed by a path");
                     require(!lc::callback_matches_domain("https://x.test", ""), "empty suffix");
                   }});

  tests.push_back({"cleanup_matches_literal_url_suffix", [] {
                     require(lc::callback_matches_domain("https://relay.test/forward/ngrok-free.app",
                                                         "ngrok-free.app"),
                             "url ending in the domain matches even off-host");
                     require(!lc::callback_matches_domain("https://relay.test/forward",
                                                          "ngrok-free.app"),
                             "unrelated url");
                   }});

  tests.push_back({"cleanup_deletes_only_matching_domain", [] {
                     ht::FakeHttpClient fake;
                     fake.enqueue(200, ht::webhook_page_body(
                                           {{"10", "https://aa.ngrok-free.app/lemon-squeezy/webhook"},
                                            {"11", "https://shop.example.com/lemon-squeezy/webhook"},
                                            {"12", "https://bb.ngrok-free.app"}},
                                           1, 1));
                     fake.enqueue(204);
                     fake.enqueue(204);
                     bl::WebhookRegistry registry(fake, ht::mock_config().billing);
                     ht::RecordingConsole console;

                     lc::CleanupJob job(registry, console);
                     const auto report = job.run("4242", "ngrok-free.app");
                     require(report.ok(), report.error());
                     require(report.value().matched == 2, "two matches");
                     require(fake.count(http::HttpMethod::Delete) == 2, "one delete per match");
                     require(fake.requests()[1].url == "https://billing.test/v1/webhooks/10",
                             "id 10 deleted");
                     require(fake.requests()[2].url == "https://billing.test/v1/webhooks/12",
                             "id 12 deleted");
                   }});

  tests.push_back({"cleanup_three_webhooks_two_matches", [] {
                     ht::FakeHttpClient fake;
                     fake.enqueue(200, ht::webhook_page_body(
                                           {{"1", "https://one.sharedwithexpose.com"},
                                            {"2", "https://other.example"},
                                            {"3", "https://two.sharedwithexpose.com"}},
                                           1, 1));
                     fake.enqueue(204);
                     fake.enqueue(204);
                     bl::WebhookRegistry registry(fake, ht::mock_config().billing);
                     ht::RecordingConsole console;

                     const auto report = lc::CleanupJob(registry, console).run("4242", "sharedwithexpose.com");
                     require(report.ok(), report.error());
                     require(report.value().matched == 2, "two matches");
                     require(report.value().deleted == 2, "two deletions");
                     require(fake.count(http::HttpMethod::Delete) == 2, "exactly two deletes");
                     require(fake.requests()[1].url == "https://billing.test/v1/webhooks/1", "id 1");
                     require(fake.requests()[2].url == "https://billing.test/v1/webhooks/3", "id 3");
                     require(console.saw("Webhook 1 removed successfully."), "per-item report");
                     require(console.saw("Webhook 3 removed successfully."), "per-item report");
                   }});

  tests.push_back({"cleanup_with_no_matches_deletes_nothing", [] {
                     ht::FakeHttpClient fake;
                     fake.enqueue(200, ht::webhook_page_body({{"1", "https://shop.example"}}, 1, 1));
                     bl::WebhookRegistry registry(fake, ht::mock_config().billing);
                     ht::RecordingConsole console;

                     const auto report = lc::CleanupJob(registry, console).run("4242", "ngrok-free.app");
                     require(report.ok(), report.error());
                     require(report.value().matched == 0, "count 0");
                     require(fake.count(http::HttpMethod::Delete) == 0, "no deletes");
                   }});

  tests.push_back({"cleanup_reports_failed_deletes_and_continues", [] {
                     ht::FakeHttpClient fake;
                     fake.enqueue(200, ht::webhook_page_body({{"1", "https://a.ngrok-free.app"},
                                                              {"2", "https://b.ngrok-free.app"}},
                                                             1, 1));
                     fake.enqueue(404);
                     fake.enqueue(204);
                     bl::WebhookRegistry registry(fake, ht::mock_config().billing);
                     ht::RecordingConsole console;

                     const auto report = lc::CleanupJob(registry, console).run("4242", "ngrok-free.app");
                     require(report.ok(), report.error());
                     require(report.value().matched == 2, "both matched");
                     require(report.value().failed == 1 && report.value().deleted == 1, "split");
                     require(console.errors.size() == 1 &&
                                 console.errors[0] == "Failed to remove webhook 1.",
                             "failure reported");
                   }});

  tests.push_back({"cleanup_refuses_empty_domain", [] {
                     ht::FakeHttpClient fake;
                     bl::WebhookRegistry registry(fake, ht::mock_config().billing);
                     ht::RecordingConsole console;
                     const auto report = lc::CleanupJob(registry, console).run("4242", "");
                     require(!report.ok(), "empty suffix would match everything");
                     require(fake.requests().empty(), "no listing attempted");
                   }});

  tests.push_back({"cleanup_propagates_listing_failure", [] {
                     ht::FakeHttpClient fake;
                     fake.enqueue(401, R"({"errors":[{"detail":"Unauthenticated."}]})");
                     bl::WebhookRegistry registry(fake, ht::mock_config().billing);
                     ht::RecordingConsole console;
                     const auto report = lc::CleanupJob(registry, console).run("4242", "ngrok-free.app");
                     require(!report.ok(), "listing failure surfaces");
                     require(fake.count(http::HttpMethod::Delete) == 0, "no deletes");
                   }});
}
