#include "hooktunnel/cli/console.hpp"

#include "hooktunnel/common/fs.hpp"

#include <charconv>
#include <cstdio>
#include <cstdlib>
#include <iostream>

#include <unistd.h>

namespace hooktunnel::cli {

namespace {

constexpr const char *RST = "\033[0m";
constexpr const char *BOLD = "\033[1m";
constexpr const char *DIM = "\033[2m";
constexpr const char *GREEN = "\033[32m";
constexpr const char *RED = "\033[31m";

bool stdout_supports_color() {
  if (std::getenv("NO_COLOR") != nullptr) {
    return false;
  }
  return isatty(fileno(stdout)) != 0;
}

} // namespace

TerminalConsole::TerminalConsole()
    : out_(&std::cout), err_(&std::cerr), color_(stdout_supports_color()) {}

TerminalConsole::TerminalConsole(std::ostream &out, std::ostream &err, const bool color)
    : out_(&out), err_(&err), color_(color) {}

void TerminalConsole::note(const std::string &message) {
  if (color_) {
    *out_ << DIM << message << RST << "\n";
  } else {
    *out_ << message << "\n";
  }
  out_->flush();
}

void TerminalConsole::info(const std::string &message) {
  if (color_) {
    *out_ << GREEN << message << RST << "\n";
  } else {
    *out_ << message << "\n";
  }
  out_->flush();
}

void TerminalConsole::error(const std::string &message) {
  if (color_) {
    *err_ << BOLD << RED << message << RST << "\n";
  } else {
    *err_ << "ERROR: " << message << "\n";
  }
  err_->flush();
}

std::string prompt_choice(std::istream &in, std::ostream &out, const std::string &label,
                          const std::vector<std::string> &options,
                          const std::string &default_value) {
  std::size_t default_index = 1;
  out << label << "\n";
  for (std::size_t i = 0; i < options.size(); ++i) {
    const bool is_default = options[i] == default_value;
    if (is_default) {
      default_index = i + 1;
    }
    out << "  " << (i + 1) << ") " << options[i] << (is_default ? " *" : "") << "\n";
  }
  out << "Enter number [" << default_index << "]: ";
  out.flush();

  std::string input;
  if (!std::getline(in, input)) {
    return default_value;
  }
  const std::string trimmed = common::trim(input);
  if (trimmed.empty()) {
    return default_value;
  }

  std::size_t choice = 0;
  const auto *first = trimmed.data();
  const auto *last = first + trimmed.size();
  auto [ptr, ec] = std::from_chars(first, last, choice);
  if (ec == std::errc() && ptr == last) {
    return choice >= 1 && choice <= options.size() ? options[choice - 1] : default_value;
  }
  for (const auto &option : options) {
    if (common::to_lower(trimmed) == option) {
      return option;
    }
  }
  return default_value;
}

} // namespace hooktunnel::cli
