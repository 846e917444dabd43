#include "hooktunnel/tunnel/request_log.hpp"

#include "hooktunnel/common/fs.hpp"
#include "hooktunnel/common/json_util.hpp"
#include "hooktunnel/observability/global.hpp"

#include <ctime>
#include <iomanip>
#include <locale>
#include <sstream>

namespace hooktunnel::tunnel {

std::vector<RequestLogEntry> parse_request_log(const std::string &body) {
  std::vector<RequestLogEntry> entries;
  for (const auto &raw : common::json_array_elements(common::json_member(body, "requests"))) {
    const auto members = common::json_object_members(raw);
    const auto id = members.find("id");
    if (id == members.end()) {
      continue;
    }

    RequestLogEntry entry;
    entry.id = common::json_scalar(id->second);
    if (entry.id.empty()) {
      continue;
    }

    if (const auto request = members.find("request"); request != members.end()) {
      entry.method = common::json_scalar(common::json_member(request->second, "method"));
      entry.uri = common::json_scalar(common::json_member(request->second, "uri"));
    }
    if (const auto response = members.find("response"); response != members.end()) {
      if (const auto status = common::json_integer(common::json_member(response->second, "status_code"));
          status.has_value()) {
        entry.status_code = static_cast<std::uint16_t>(*status);
      }
      const auto dates =
          common::json_string_array(common::json_path(response->second, "headers.Date"));
      if (!dates.empty()) {
        entry.date = dates.front();
      }
    }
    entries.push_back(std::move(entry));
  }
  return entries;
}

std::string format_clock(const std::string &http_date) {
  std::tm tm{};
  std::istringstream in(common::trim(http_date));
  in.imbue(std::locale::classic());
  in >> std::get_time(&tm, "%a, %d %b %Y %H:%M:%S");
  if (in.fail()) {
    return "--:--:--";
  }

  std::ostringstream out;
  out << std::put_time(&tm, "%H:%M:%S");
  return out.str();
}

std::string format_request_line(const RequestLogEntry &entry) {
  std::ostringstream line;
  line << entry.status_code << ' ' << entry.method << ' '
       << common::truncate_pad(entry.uri, REQUEST_URI_COLUMN, REQUEST_URI_COLUMN, '.') << ' '
       << format_clock(entry.date);
  return line.str();
}

RequestLogTail::RequestLogTail(http::HttpClient &http, std::string api_base,
                               const std::uint32_t limit)
    : http_(http), api_base_(common::rtrim_chars(std::move(api_base), "/")), limit_(limit) {}

std::vector<std::string> RequestLogTail::poll(std::unordered_set<std::string> &seen) {
  std::vector<std::string> lines;
  const auto response =
      http_.get(api_base_ + "/requests/http?limit=" + std::to_string(limit_));
  if (response.network_error || response.status < 200 || response.status >= 300) {
    observability::record_error("request-log", response.network_error
                                                   ? response.network_error_message
                                                   : "status " + std::to_string(response.status));
    return lines;
  }

  for (const auto &entry : parse_request_log(response.body)) {
    if (!seen.insert(entry.id).second) {
      continue;
    }
    observability::record_request_forwarded(entry.method, entry.uri, entry.status_code);
    lines.push_back(format_request_line(entry));
  }
  return lines;
}

} // namespace hooktunnel::tunnel
