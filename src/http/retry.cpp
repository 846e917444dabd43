#include "hooktunnel/http/retry.hpp"

#include "hooktunnel/observability/global.hpp"

#include <thread>

namespace hooktunnel::http {

bool is_retryable(const HttpResponse &response) {
  if (response.network_error || response.timeout) {
    return true;
  }
  return response.status == 429 || response.status >= 500;
}

RetryingHttpClient::RetryingHttpClient(HttpClient &inner, RetryPolicy policy)
    : inner_(inner), policy_(policy) {
  if (policy_.max_attempts == 0) {
    policy_.max_attempts = 1;
  }
}

HttpResponse RetryingHttpClient::send(const HttpRequest &request) {
  HttpResponse response;
  for (std::uint32_t attempt = 1; attempt <= policy_.max_attempts; ++attempt) {
    response = inner_.send(request);
    if (!is_retryable(response) || attempt == policy_.max_attempts) {
      break;
    }

    const std::string reason = response.network_error
                                   ? response.network_error_message
                                   : "status " + std::to_string(response.status);
    observability::record_http_retry(std::string(method_name(request.method)), request.url,
                                     attempt, reason);
    if (policy_.delay.count() > 0) {
      std::this_thread::sleep_for(policy_.delay);
    }
  }
  return response;
}

} // namespace hooktunnel::http
