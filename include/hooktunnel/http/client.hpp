#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <unordered_map>

namespace hooktunnel::http {

using HttpHeaders = std::unordered_map<std::string, std::string>;

enum class HttpMethod { Get, Post, Delete };

[[nodiscard]] std::string_view method_name(HttpMethod method);

struct HttpRequest {
  HttpMethod method = HttpMethod::Get;
  std::string url;
  HttpHeaders headers;
  std::optional<std::string> body;
  std::uint64_t timeout_ms = 10'000;
};

struct HttpResponse {
  std::uint16_t status = 0;
  std::string body;
  /// Header names are lower-cased; a repeated header keeps its last value.
  HttpHeaders headers;
  bool timeout = false;
  bool network_error = false;
  std::string network_error_message;
};

class HttpClient {
public:
  virtual ~HttpClient() = default;

  [[nodiscard]] virtual HttpResponse send(const HttpRequest &request) = 0;

  [[nodiscard]] HttpResponse get(const std::string &url, const HttpHeaders &headers = {});
  [[nodiscard]] HttpResponse post_json(const std::string &url, const HttpHeaders &headers,
                                       const std::string &body);
  [[nodiscard]] HttpResponse del(const std::string &url, const HttpHeaders &headers = {});
};

class CurlHttpClient final : public HttpClient {
public:
  CurlHttpClient();
  ~CurlHttpClient() override;

  CurlHttpClient(const CurlHttpClient &) = delete;
  CurlHttpClient &operator=(const CurlHttpClient &) = delete;

  [[nodiscard]] HttpResponse send(const HttpRequest &request) override;
};

/// Headers for the billing API: bearer auth plus JSON:API content negotiation.
[[nodiscard]] HttpHeaders bearer_headers(const std::string &token);

/// Percent-encodes a single query value or path segment.
[[nodiscard]] std::string url_encode(const std::string &value);

} // namespace hooktunnel::http
