#include "hooktunnel/http/client.hpp"

#include "hooktunnel/common/fs.hpp"
#include "hooktunnel/observability/global.hpp"

#include <curl/curl.h>

#include <chrono>

namespace hooktunnel::http {

namespace {

size_t write_callback(char *ptr, size_t size, size_t nmemb, void *userdata) {
  const auto total = size * nmemb;
  static_cast<std::string *>(userdata)->append(ptr, total);
  return total;
}

size_t header_callback(char *buffer, size_t size, size_t nitems, void *userdata) {
  const auto total = size * nitems;
  const std::string header(buffer, total);
  auto *headers = static_cast<HttpHeaders *>(userdata);

  const auto separator = header.find(':');
  if (separator != std::string::npos) {
    const std::string key = common::to_lower(common::trim(header.substr(0, separator)));
    (*headers)[key] = common::trim(header.substr(separator + 1));
  }
  return total;
}

} // namespace

std::string_view method_name(const HttpMethod method) {
  switch (method) {
  case HttpMethod::Get:
    return "GET";
  case HttpMethod::Post:
    return "POST";
  case HttpMethod::Delete:
    return "DELETE";
  }
  return "GET";
}

HttpResponse HttpClient::get(const std::string &url, const HttpHeaders &headers) {
  return send(HttpRequest{.method = HttpMethod::Get, .url = url, .headers = headers});
}

HttpResponse HttpClient::post_json(const std::string &url, const HttpHeaders &headers,
                                   const std::string &body) {
  return send(
      HttpRequest{.method = HttpMethod::Post, .url = url, .headers = headers, .body = body});
}

HttpResponse HttpClient::del(const std::string &url, const HttpHeaders &headers) {
  return send(HttpRequest{.method = HttpMethod::Delete, .url = url, .headers = headers});
}

CurlHttpClient::CurlHttpClient() { curl_global_init(CURL_GLOBAL_DEFAULT); }

CurlHttpClient::~CurlHttpClient() { curl_global_cleanup(); }

HttpResponse CurlHttpClient::send(const HttpRequest &request) {
  HttpResponse response;

  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    response.network_error = true;
    response.network_error_message = "curl_easy_init failed";
    return response;
  }

  const auto started = std::chrono::steady_clock::now();

  curl_easy_setopt(curl, CURLOPT_URL, request.url.c_str());
  curl_easy_setopt(curl, CURLOPT_TIMEOUT_MS, static_cast<long>(request.timeout_ms));
  curl_easy_setopt(curl, CURLOPT_WRITEFUNCTION, write_callback);
  curl_easy_setopt(curl, CURLOPT_WRITEDATA, &response.body);
  curl_easy_setopt(curl, CURLOPT_HEADERFUNCTION, header_callback);
  curl_easy_setopt(curl, CURLOPT_HEADERDATA, &response.headers);
  curl_easy_setopt(curl, CURLOPT_USERAGENT, "hooktunnel/0.1");

  switch (request.method) {
  case HttpMethod::Get:
    curl_easy_setopt(curl, CURLOPT_HTTPGET, 1L);
    break;
  case HttpMethod::Post:
    curl_easy_setopt(curl, CURLOPT_POST, 1L);
    break;
  case HttpMethod::Delete:
    curl_easy_setopt(curl, CURLOPT_CUSTOMREQUEST, "DELETE");
    break;
  }
  if (request.body.has_value()) {
    curl_easy_setopt(curl, CURLOPT_POSTFIELDS, request.body->c_str());
    curl_easy_setopt(curl, CURLOPT_POSTFIELDSIZE, static_cast<long>(request.body->size()));
  }

  struct curl_slist *header_list = nullptr;
  for (const auto &[key, value] : request.headers) {
    const std::string line = key + ": " + value;
    header_list = curl_slist_append(header_list, line.c_str());
  }
  if (header_list != nullptr) {
    curl_easy_setopt(curl, CURLOPT_HTTPHEADER, header_list);
  }

  const CURLcode code = curl_easy_perform(curl);
  if (code != CURLE_OK) {
    response.network_error = true;
    response.network_error_message = curl_easy_strerror(code);
    response.timeout = code == CURLE_OPERATION_TIMEDOUT;
  } else {
    long status = 0;
    curl_easy_getinfo(curl, CURLINFO_RESPONSE_CODE, &status);
    response.status = static_cast<std::uint16_t>(status);
  }

  if (header_list != nullptr) {
    curl_slist_free_all(header_list);
  }
  curl_easy_cleanup(curl);

  observability::record_metric(observability::RequestLatencyMetric{
      .latency = std::chrono::duration_cast<std::chrono::milliseconds>(
          std::chrono::steady_clock::now() - started)});
  return response;
}

HttpHeaders bearer_headers(const std::string &token) {
  return {{"Authorization", "Bearer " + token},
          {"Accept", "application/vnd.api+json"},
          {"Content-Type", "application/vnd.api+json"}};
}

std::string url_encode(const std::string &value) {
  CURL *curl = curl_easy_init();
  if (curl == nullptr) {
    return value;
  }
  char *encoded = curl_easy_escape(curl, value.c_str(), static_cast<int>(value.size()));
  std::string result = encoded != nullptr ? encoded : value;
  curl_free(encoded);
  curl_easy_cleanup(curl);
  return result;
}

} // namespace hooktunnel::http
