#include "hooktunnel/tunnel/resolver.hpp"

#include "hooktunnel/common/fs.hpp"
#include "hooktunnel/common/json_util.hpp"
#include "hooktunnel/observability/global.hpp"

namespace hooktunnel::tunnel {

LocalApiResolver::LocalApiResolver(http::HttpClient &http, std::string api_base)
    : http_(http), api_base_(common::rtrim_chars(std::move(api_base), "/")) {}

std::optional<std::string> LocalApiResolver::poll(TunnelProcess &process) {
  (void)process;
  const auto response = http_.get(api_base_ + "/tunnels");
  if (response.network_error) {
    observability::record_error("tunnel", "inspection api unreachable: " +
                                              response.network_error_message);
    return std::nullopt;
  }
  if (response.status < 200 || response.status >= 300) {
    return std::nullopt;
  }
  return parse_public_url(response.body);
}

std::optional<std::string> LocalApiResolver::parse_public_url(const std::string &body) {
  const auto tunnels = common::json_array_elements(common::json_member(body, "tunnels"));
  if (tunnels.empty()) {
    return std::nullopt;
  }
  const std::string url = common::json_scalar(common::json_member(tunnels.front(), "public_url"));
  if (common::starts_with(url, "https://") || common::starts_with(url, "http://")) {
    return url;
  }
  return std::nullopt;
}

} // namespace hooktunnel::tunnel
