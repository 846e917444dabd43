#include "hooktunnel/common/toml.hpp"

#include "hooktunnel/common/fs.hpp"
#include "hooktunnel/common/json_util.hpp"

#include <charconv>
#include <sstream>

namespace hooktunnel::common {

namespace {

std::string strip_comment(const std::string &line) {
  char quote = '\0';
  for (std::size_t i = 0; i < line.size(); ++i) {
    const char ch = line[i];
    if (quote != '\0') {
      if (ch == quote && (quote == '\'' || line[i - 1] != '\\')) {
        quote = '\0';
      }
      continue;
    }
    if (ch == '"' || ch == '\'') {
      quote = ch;
    } else if (ch == '#') {
      return line.substr(0, i);
    }
  }
  return line;
}

std::string unquote(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.size() >= 2 && value.front() == '\'' && value.back() == '\'') {
    return value.substr(1, value.size() - 2);
  }
  if (value.size() >= 2 && value.front() == '"' && value.back() == '"') {
    return json_unescape(value.substr(1, value.size() - 2));
  }
  return value;
}

} // namespace

bool TomlDocument::has(const std::string &key) const { return values.contains(key); }

std::string TomlDocument::get_string(const std::string &key, const std::string &fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  return unquote(it->second);
}

bool TomlDocument::get_bool(const std::string &key, const bool fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }
  const std::string normalized = to_lower(trim(it->second));
  if (normalized == "true") {
    return true;
  }
  if (normalized == "false") {
    return false;
  }
  return fallback;
}

std::uint64_t TomlDocument::get_u64(const std::string &key, const std::uint64_t fallback) const {
  const auto it = values.find(key);
  if (it == values.end()) {
    return fallback;
  }

  std::string digits;
  for (const char ch : trim(it->second)) {
    if (ch != '_') {
      digits.push_back(ch);
    }
  }
  std::uint64_t parsed = 0;
  const auto *first = digits.data();
  const auto *last = first + digits.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (digits.empty() || ec != std::errc() || ptr != last) {
    return fallback;
  }
  return parsed;
}

Result<TomlDocument> parse_toml(const std::string &content) {
  TomlDocument document;
  std::istringstream stream(content);
  std::string line;
  std::string section;
  std::size_t line_number = 0;

  while (std::getline(stream, line)) {
    ++line_number;
    const std::string clean = trim(strip_comment(line));
    if (clean.empty()) {
      continue;
    }

    if (clean.front() == '[') {
      if (clean.back() != ']' || clean.size() < 3) {
        return Result<TomlDocument>::failure(ErrorKind::ConfigValidation,
                                             "invalid section header at line " +
                                                 std::to_string(line_number));
      }
      section = trim(clean.substr(1, clean.size() - 2));
      continue;
    }

    const auto equals = clean.find('=');
    if (equals == std::string::npos) {
      return Result<TomlDocument>::failure(ErrorKind::ConfigValidation,
                                           "expected key = value at line " +
                                               std::to_string(line_number));
    }

    std::string key = unquote(clean.substr(0, equals));
    if (key.empty()) {
      return Result<TomlDocument>::failure(ErrorKind::ConfigValidation,
                                           "missing key at line " + std::to_string(line_number));
    }
    if (!section.empty()) {
      key = section + "." + key;
    }
    document.values[key] = trim(clean.substr(equals + 1));
  }

  return Result<TomlDocument>::success(std::move(document));
}

} // namespace hooktunnel::common
