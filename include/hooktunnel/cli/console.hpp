#pragma once

#include <iosfwd>
#include <string>
#include <vector>

namespace hooktunnel::cli {

/// User-facing progress output. Diagnostics go through observability instead.
class Console {
public:
  virtual ~Console() = default;

  virtual void note(const std::string &message) = 0;
  virtual void info(const std::string &message) = 0;
  virtual void error(const std::string &message) = 0;
};

class TerminalConsole final : public Console {
public:
  TerminalConsole();
  TerminalConsole(std::ostream &out, std::ostream &err, bool color);

  void note(const std::string &message) override;
  void info(const std::string &message) override;
  void error(const std::string &message) override;

private:
  std::ostream *out_;
  std::ostream *err_;
  bool color_;
};

/// Numbered menu on `out`, answer read from `in`. Falls back to `default_value`
/// on empty input, EOF or an out-of-range number.
[[nodiscard]] std::string prompt_choice(std::istream &in, std::ostream &out,
                                        const std::string &label,
                                        const std::vector<std::string> &options,
                                        const std::string &default_value);

} // namespace hooktunnel::cli
