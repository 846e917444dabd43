#include "hooktunnel/tunnel/resolver.hpp"

namespace hooktunnel::tunnel {

namespace {

constexpr std::size_t MAX_BUFFERED_OUTPUT = 16 * 1024;

} // namespace

OutputScrapeResolver::OutputScrapeResolver()
    : OutputScrapeResolver(std::regex(R"(Public HTTPS:\s+(https?://\S+)\s)")) {}

OutputScrapeResolver::OutputScrapeResolver(std::regex pattern) : pattern_(std::move(pattern)) {}

std::optional<std::string> OutputScrapeResolver::poll(TunnelProcess &process) {
  if (found_.has_value()) {
    return found_;
  }
  return feed(process.latest_output());
}

std::optional<std::string> OutputScrapeResolver::feed(const std::string &output) {
  if (found_.has_value()) {
    return found_;
  }

  buffer_ += output;
  std::smatch match;
  if (std::regex_search(buffer_, match, pattern_)) {
    found_ = match.size() > 1 ? match[1].str() : match[0].str();
    buffer_.clear();
    return found_;
  }

  // A URL is only complete once whitespace follows it; keep the tail so a
  // label or URL split across reads still matches next time.
  if (buffer_.size() > MAX_BUFFERED_OUTPUT) {
    buffer_.erase(0, buffer_.size() - MAX_BUFFERED_OUTPUT / 2);
  }
  return std::nullopt;
}

} // namespace hooktunnel::tunnel
