#pragma once

#include "hooktunnel/cli/console.hpp"
#include "hooktunnel/config/schema.hpp"
#include "hooktunnel/http/client.hpp"

#include <cstdint>
#include <deque>
#include <filesystem>
#include <functional>
#include <optional>
#include <string>
#include <vector>

namespace hooktunnel::testing {

/// Config that passes validation, points at local environment and never sleeps.
config::Config mock_config();

/// Replays queued responses in order and records every request it sees. When the
/// queue is empty the fallback response is returned.
class FakeHttpClient final : public http::HttpClient {
public:
  void enqueue(std::uint16_t status, std::string body = "");
  void enqueue_network_error(std::string message = "connection refused");
  void set_fallback(std::uint16_t status, std::string body = "");
  /// Called after each request is recorded, before the response is returned.
  void on_request(std::function<void(const http::HttpRequest &)> hook);

  [[nodiscard]] http::HttpResponse send(const http::HttpRequest &request) override;

  [[nodiscard]] const std::vector<http::HttpRequest> &requests() const { return requests_; }
  [[nodiscard]] std::size_t count(http::HttpMethod method) const;

private:
  std::deque<http::HttpResponse> queue_;
  http::HttpResponse fallback_{.status = 404};
  std::vector<http::HttpRequest> requests_;
  std::function<void(const http::HttpRequest &)> hook_;
};

class RecordingConsole final : public cli::Console {
public:
  void note(const std::string &message) override { notes.push_back(message); }
  void info(const std::string &message) override { infos.push_back(message); }
  void error(const std::string &message) override { errors.push_back(message); }

  [[nodiscard]] bool saw(const std::string &needle) const;

  std::vector<std::string> notes;
  std::vector<std::string> infos;
  std::vector<std::string> errors;
};

struct EnvGuard {
  std::string key;
  std::optional<std::string> old_value;

  EnvGuard(std::string key_, std::optional<std::string> value);
  ~EnvGuard();

  EnvGuard(const EnvGuard &) = delete;
  EnvGuard &operator=(const EnvGuard &) = delete;
};

class TempWorkspace {
public:
  TempWorkspace();
  ~TempWorkspace();

  TempWorkspace(const TempWorkspace &) = delete;
  TempWorkspace &operator=(const TempWorkspace &) = delete;

  [[nodiscard]] const std::filesystem::path &path() const { return path_; }
  void create_file(const std::string &name, const std::string &content) const;

private:
  std::filesystem::path path_;
};

/// `{"data":{"type":"webhooks","id":"<id>",...}}`
std::string created_webhook_body(const std::string &id);

/// One page of a webhook listing.
std::string webhook_page_body(const std::vector<std::pair<std::string, std::string>> &webhooks,
                              std::uint32_t current_page, std::uint32_t last_page);

} // namespace hooktunnel::testing
