#pragma once

#include "hooktunnel/http/client.hpp"
#include "hooktunnel/tunnel/process.hpp"

#include <optional>
#include <regex>
#include <string>
#include <string_view>

namespace hooktunnel::tunnel {

/// Discovers the public endpoint of a running tunnel. `poll` is called once per
/// supervision tick; the first URL returned is final for the run.
class ITunnelUrlResolver {
public:
  virtual ~ITunnelUrlResolver() = default;

  [[nodiscard]] virtual std::string_view name() const = 0;
  [[nodiscard]] virtual std::optional<std::string> poll(TunnelProcess &process) = 0;
};

/// Best effort: scrapes the provider's own console output, whose format is not a contract.
class OutputScrapeResolver final : public ITunnelUrlResolver {
public:
  OutputScrapeResolver();
  explicit OutputScrapeResolver(std::regex pattern);

  [[nodiscard]] std::string_view name() const override { return "output-scrape"; }
  [[nodiscard]] std::optional<std::string> poll(TunnelProcess &process) override;

  /// Scan `output` as if it had been read from the process.
  [[nodiscard]] std::optional<std::string> feed(const std::string &output);

private:
  std::regex pattern_;
  std::string buffer_;
  std::optional<std::string> found_;
};

/// Asks the provider's local inspection API (`GET {api_base}/tunnels`).
class LocalApiResolver final : public ITunnelUrlResolver {
public:
  /// `http` should already carry the discovery retry policy.
  LocalApiResolver(http::HttpClient &http, std::string api_base);

  [[nodiscard]] std::string_view name() const override { return "local-api"; }
  [[nodiscard]] std::optional<std::string> poll(TunnelProcess &process) override;

  [[nodiscard]] static std::optional<std::string> parse_public_url(const std::string &body);

private:
  http::HttpClient &http_;
  std::string api_base_;
};

} // namespace hooktunnel::tunnel
