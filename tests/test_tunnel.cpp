#include "test_framework.hpp"

#include "tests/helpers/test_helpers.hpp"

#include "hooktunnel/tunnel/process.hpp"
#include "hooktunnel/tunnel/resolver.hpp"

#include <chrono>
#include <string>
#include <thread>

namespace {

namespace tn = hooktunnel::tunnel;

/// Polls until the process exits or `limit` passes.
bool wait_for_exit(tn::TunnelProcess &process, std::chrono::milliseconds limit) {
  const auto deadline = std::chrono::steady_clock::now() + limit;
  while (std::chrono::steady_clock::now() < deadline) {
    if (!process.is_running()) {
      return true;
    }
    std::this_thread::sleep_for(std::chrono::milliseconds(10));
  }
  return false;
}

} // namespace

void register_tunnel_tests(std::vector<hooktunnel::tests::TestCase> &tests) {
  using hooktunnel::tests::require;
  namespace ht = hooktunnel::testing;

  tests.push_back({"tunnel_process_captures_merged_output", [] {
                     std::string streamed;
                     tn::TunnelProcess process;
                     auto started = process.start(
                         {"/bin/sh", "-c", "echo out-line; echo err-line 1>&2"},
                         [&streamed](std::string_view chunk) { streamed.append(chunk); });
                     require(started.ok(), started.error());
                     require(wait_for_exit(process, std::chrono::milliseconds(3000)),
                             "short script should exit");

                     const std::string output = process.latest_output();
                     require(output.find("out-line") != std::string::npos, "stdout captured");
                     require(output.find("err-line") != std::string::npos, "stderr captured");
                     require(streamed == output, "callback sees the same bytes");
                     require(process.latest_output().empty(), "output is consumed once read");
                     require(process.exit_code() == 0, "exit code recorded");
                   }});

  tests.push_back({"tunnel_process_reports_exit_status", [] {
                     tn::TunnelProcess process;
                     auto started = process.start({"/bin/sh", "-c", "exit 3"}, nullptr);
                     require(started.ok(), started.error());
                     require(wait_for_exit(process, std::chrono::milliseconds(3000)),
                             "should exit");
                     require(process.exit_code() == 3, "exit code mismatch");
                     require(!process.timed_out(), "not a timeout");
                   }});

  tests.push_back({"tunnel_process_missing_binary_exits_127", [] {
                     tn::TunnelProcess process;
                     auto started =
                         process.start({"hooktunnel-definitely-not-installed"}, nullptr);
                     require(started.ok(), "fork succeeds even when exec fails");
                     require(wait_for_exit(process, std::chrono::milliseconds(3000)),
                             "should exit");
                     require(process.exit_code() == 127, "exec failure exit code");
                   }});

  tests.push_back({"tunnel_process_terminate_stops_long_runner", [] {
                     tn::TunnelProcess process;
                     auto started = process.start({"/bin/sh", "-c", "sleep 30"}, nullptr);
                     require(started.ok(), started.error());
                     require(process.is_running(), "should be running");
                     process.terminate();
                     require(!process.is_running(), "should be stopped");
                   }});

  tests.push_back({"tunnel_process_startup_timeout_kills_child", [] {
                     tn::TunnelProcess process;
                     auto started = process.start({"/bin/sh", "-c", "sleep 30"}, nullptr,
                                                  std::chrono::seconds(1));
                     require(started.ok(), started.error());
                     require(wait_for_exit(process, std::chrono::milliseconds(4000)),
                             "timeout should stop the process");
                     require(process.timed_out(), "timed_out flag expected");
                   }});

  tests.push_back({"tunnel_process_disarmed_timeout_keeps_running", [] {
                     tn::TunnelProcess process;
                     auto started = process.start({"/bin/sh", "-c", "sleep 30"}, nullptr,
                                                  std::chrono::seconds(1));
                     require(started.ok(), started.error());
                     process.disarm_timeout();
                     std::this_thread::sleep_for(std::chrono::milliseconds(1200));
                     require(process.is_running(), "disarmed process keeps running");
                     process.terminate();
                   }});

  tests.push_back({"tunnel_process_rejects_empty_command", [] {
                     tn::TunnelProcess process;
                     auto started = process.start({}, nullptr);
                     require(!started.ok(), "empty argv must fail");
                     require(started.kind() == hooktunnel::common::ErrorKind::Process,
                             "process error kind");
                   }});

  tests.push_back({"scrape_resolver_takes_first_public_url", [] {
                     tn::OutputScrapeResolver resolver;
                     require(!resolver.feed("Thank you for using expose.\nLocal-URL: x\n")
                                  .has_value(),
                             "no url yet");
                     const auto first = resolver.feed(
                         "Public HTTP:   http://abc.sharedwithexpose.com\n"
                         "Public HTTPS:  https://abc.sharedwithexpose.com\n");
                     require(first == "https://abc.sharedwithexpose.com", "first https url");
                     const auto later = resolver.feed("Public HTTPS:  https://other.example\n");
                     require(later == first, "later lines are ignored");
                   }});

  tests.push_back({"scrape_resolver_joins_split_reads", [] {
                     tn::OutputScrapeResolver resolver;
                     require(!resolver.feed("Public HT").has_value(), "partial label");
                     const auto url = resolver.feed("TPS:   https://split.sharedwithexpose.com\n");
                     require(url == "https://split.sharedwithexpose.com", "split label should match");
                   }});

  tests.push_back({"scrape_resolver_waits_for_complete_url", [] {
                     tn::OutputScrapeResolver resolver;
                     require(!resolver.feed("Public HTTPS:   https://abc12.shar").has_value(),
                             "url cut by a read must not resolve");
                     const auto url = resolver.feed("edwithexpose.com\n");
                     require(url == "https://abc12.sharedwithexpose.com", "joined url");
                     require(resolver.feed("Public HTTPS:   https://late.example\n") == url,
                             "first complete url stays");
                   }});

  tests.push_back({"scrape_resolver_reads_process_output", [] {
                     tn::TunnelProcess process;
                     auto started = process.start(
                         {"/bin/sh", "-c", "echo 'Public HTTPS:   https://proc.sharedwithexpose.com'; sleep 5"},
                         nullptr);
                     require(started.ok(), started.error());

                     tn::OutputScrapeResolver resolver;
                     std::optional<std::string> url;
                     const auto deadline = std::chrono::steady_clock::now() + std::chrono::seconds(3);
                     while (!url.has_value() && std::chrono::steady_clock::now() < deadline) {
                       url = resolver.poll(process);
                       std::this_thread::sleep_for(std::chrono::milliseconds(10));
                     }
                     process.terminate();
                     require(url == "https://proc.sharedwithexpose.com", "url from process");
                   }});

  tests.push_back({"local_api_resolver_parses_first_tunnel", [] {
                     const auto url = tn::LocalApiResolver::parse_public_url(
                         R"({"tunnels":[{"name":"command_line","public_url":"https://a1b2.ngrok-free.app","proto":"https"},)"
                         R"({"public_url":"https://second.ngrok-free.app"}],"uri":"/api/tunnels"})");
                     require(url == "https://a1b2.ngrok-free.app", "first tunnel url");
                     require(!tn::LocalApiResolver::parse_public_url(R"({"tunnels":[]})").has_value(),
                             "no tunnels yet");
                     require(!tn::LocalApiResolver::parse_public_url(
                                  R"({"tunnels":[{"public_url":"tcp://0.tcp.ngrok.io:1"}]})")
                                  .has_value(),
                             "non-http urls are ignored");
                   }});

  tests.push_back({"local_api_resolver_polls_tunnels_endpoint", [] {
                     ht::FakeHttpClient fake;
                     fake.enqueue_network_error();
                     fake.enqueue(200, R"({"tunnels":[{"public_url":"https://z.ngrok-free.app"}]})");
                     tn::LocalApiResolver resolver(fake, "http://127.0.0.1:4040/api/");
                     tn::TunnelProcess idle;

                     require(!resolver.poll(idle).has_value(), "unreachable api yields nothing");
                     require(resolver.poll(idle) == "https://z.ngrok-free.app", "url on success");
                     require(fake.requests().back().url == "http://127.0.0.1:4040/api/tunnels",
                             "tunnels endpoint");
                   }});
}
