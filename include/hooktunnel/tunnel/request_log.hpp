#pragma once

#include "hooktunnel/http/client.hpp"

#include <cstdint>
#include <string>
#include <unordered_set>
#include <vector>

namespace hooktunnel::tunnel {

struct RequestLogEntry {
  std::string id;
  std::uint16_t status_code = 0;
  std::string method;
  std::string uri;
  /// Raw value of the response `Date` header.
  std::string date;
};

inline constexpr std::size_t REQUEST_URI_COLUMN = 48;

[[nodiscard]] std::vector<RequestLogEntry> parse_request_log(const std::string &body);

/// "Mon, 19 Oct 2026 14:03:27 GMT" -> "14:03:27"; "--:--:--" when unparseable.
[[nodiscard]] std::string format_clock(const std::string &http_date);

/// `<status> <method> <uri cut/padded with '.' to 48 columns> <HH:MM:SS>`
[[nodiscard]] std::string format_request_line(const RequestLogEntry &entry);

/// Polls the inspection API for forwarded requests and yields each one once.
class RequestLogTail {
public:
  RequestLogTail(http::HttpClient &http, std::string api_base, std::uint32_t limit = 50);

  /// Lines for entries whose id is not yet in `seen`, in API order. Ids are added to `seen`.
  [[nodiscard]] std::vector<std::string> poll(std::unordered_set<std::string> &seen);

private:
  http::HttpClient &http_;
  std::string api_base_;
  std::uint32_t limit_;
};

} // namespace hooktunnel::tunnel
