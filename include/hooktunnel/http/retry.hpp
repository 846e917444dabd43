#pragma once

#include "hooktunnel/http/client.hpp"

#include <chrono>
#include <cstdint>

namespace hooktunnel::http {

struct RetryPolicy {
  /// Total attempts, including the first one.
  std::uint32_t max_attempts = 3;
  std::chrono::milliseconds delay{250};
};

/// Transport failures, 429 and 5xx are worth another attempt; everything else is final.
[[nodiscard]] bool is_retryable(const HttpResponse &response);

class RetryingHttpClient final : public HttpClient {
public:
  RetryingHttpClient(HttpClient &inner, RetryPolicy policy);

  [[nodiscard]] HttpResponse send(const HttpRequest &request) override;
  [[nodiscard]] const RetryPolicy &policy() const { return policy_; }

private:
  HttpClient &inner_;
  RetryPolicy policy_;
};

} // namespace hooktunnel::http
