#include "hooktunnel/common/json_util.hpp"

#include "hooktunnel/common/fs.hpp"

#include <cctype>
#include <charconv>
#include <cstdio>

namespace hooktunnel::common {

namespace {

std::size_t string_end(const std::string &json, const std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (escaped) {
      escaped = false;
    } else if (ch == '\\') {
      escaped = true;
    } else if (ch == '"') {
      return i;
    }
  }
  return std::string::npos;
}

std::size_t container_end(const std::string &json, const std::size_t open_pos) {
  std::size_t depth = 0;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      i = string_end(json, i);
      if (i == std::string::npos) {
        return std::string::npos;
      }
      continue;
    }
    if (ch == '{' || ch == '[') {
      ++depth;
    } else if (ch == '}' || ch == ']') {
      if (depth == 0) {
        return std::string::npos;
      }
      if (--depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

void append_utf8(std::string &out, const unsigned int code) {
  if (code < 0x80) {
    out.push_back(static_cast<char>(code));
  } else if (code < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (code >> 6)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  } else {
    out.push_back(static_cast<char>(0xE0 | (code >> 12)));
    out.push_back(static_cast<char>(0x80 | ((code >> 6) & 0x3F)));
    out.push_back(static_cast<char>(0x80 | (code & 0x3F)));
  }
}

} // namespace

std::string json_escape(const std::string &value) {
  std::string escaped;
  escaped.reserve(value.size() + 8);
  for (const char ch : value) {
    switch (ch) {
    case '"':
      escaped += "\\\"";
      break;
    case '\\':
      escaped += "\\\\";
      break;
    case '\n':
      escaped += "\\n";
      break;
    case '\r':
      escaped += "\\r";
      break;
    case '\t':
      escaped += "\\t";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        char buf[8];
        std::snprintf(buf, sizeof(buf), "\\u%04x", static_cast<unsigned int>(ch));
        escaped += buf;
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_unescape(const std::string &raw) {
  std::string out;
  out.reserve(raw.size());
  for (std::size_t i = 0; i < raw.size(); ++i) {
    const char ch = raw[i];
    if (ch != '\\' || i + 1 >= raw.size()) {
      out.push_back(ch);
      continue;
    }
    const char next = raw[++i];
    switch (next) {
    case 'n':
      out.push_back('\n');
      break;
    case 'r':
      out.push_back('\r');
      break;
    case 't':
      out.push_back('\t');
      break;
    case 'b':
      out.push_back('\b');
      break;
    case 'f':
      out.push_back('\f');
      break;
    case 'u': {
      unsigned int code = 0;
      if (i + 4 < raw.size()) {
        const auto *first = raw.data() + i + 1;
        auto [ptr, ec] = std::from_chars(first, first + 4, code, 16);
        if (ec == std::errc() && ptr == first + 4) {
          append_utf8(out, code);
          i += 4;
          break;
        }
      }
      out.push_back('u');
      break;
    }
    default:
      out.push_back(next);
      break;
    }
  }
  return out;
}

std::size_t json_skip_ws(const std::string &text, std::size_t pos) {
  while (pos < text.size() && std::isspace(static_cast<unsigned char>(text[pos])) != 0) {
    ++pos;
  }
  return pos;
}

std::size_t json_value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = container_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t end = pos;
  while (end < json.size() && json[end] != ',' && json[end] != '}' && json[end] != ']' &&
         std::isspace(static_cast<unsigned char>(json[end])) == 0) {
    ++end;
  }
  return end > pos ? end : std::string::npos;
}

JsonMembers json_object_members(const std::string &object_json) {
  JsonMembers members;
  std::size_t pos = json_skip_ws(object_json, 0);
  if (pos >= object_json.size() || object_json[pos] != '{') {
    return members;
  }
  ++pos;

  while (true) {
    pos = json_skip_ws(object_json, pos);
    if (pos >= object_json.size() || object_json[pos] == '}') {
      break;
    }
    if (object_json[pos] == ',') {
      ++pos;
      continue;
    }
    if (object_json[pos] != '"') {
      break;
    }
    const auto key_end = string_end(object_json, pos);
    if (key_end == std::string::npos) {
      break;
    }
    std::string key = json_unescape(object_json.substr(pos + 1, key_end - pos - 1));

    pos = json_skip_ws(object_json, key_end + 1);
    if (pos >= object_json.size() || object_json[pos] != ':') {
      break;
    }
    pos = json_skip_ws(object_json, pos + 1);
    const auto value_end = json_value_end(object_json, pos);
    if (value_end == std::string::npos) {
      break;
    }
    members[std::move(key)] = object_json.substr(pos, value_end - pos);
    pos = value_end;
  }

  return members;
}

std::string json_member(const std::string &object_json, const std::string &key) {
  const auto members = json_object_members(object_json);
  const auto it = members.find(key);
  return it == members.end() ? std::string() : it->second;
}

std::string json_path(const std::string &json, const std::string &dotted) {
  std::string current = json;
  std::size_t start = 0;
  while (start <= dotted.size()) {
    const auto dot = dotted.find('.', start);
    const std::string key =
        dotted.substr(start, dot == std::string::npos ? std::string::npos : dot - start);
    current = json_member(current, key);
    if (current.empty() || dot == std::string::npos) {
      break;
    }
    start = dot + 1;
  }
  return current;
}

std::vector<std::string> json_array_elements(const std::string &array_json) {
  std::vector<std::string> elements;
  std::size_t pos = json_skip_ws(array_json, 0);
  if (pos >= array_json.size() || array_json[pos] != '[') {
    return elements;
  }
  ++pos;

  while (true) {
    pos = json_skip_ws(array_json, pos);
    if (pos >= array_json.size() || array_json[pos] == ']') {
      break;
    }
    if (array_json[pos] == ',') {
      ++pos;
      continue;
    }
    const auto end = json_value_end(array_json, pos);
    if (end == std::string::npos) {
      break;
    }
    elements.push_back(array_json.substr(pos, end - pos));
    pos = end;
  }

  return elements;
}

std::string json_scalar(const std::string &raw) {
  const std::string value = trim(raw);
  if (value.empty() || value == "null" || value.front() == '{' || value.front() == '[') {
    return "";
  }
  if (value.front() == '"') {
    if (value.size() < 2 || value.back() != '"') {
      return "";
    }
    return json_unescape(value.substr(1, value.size() - 2));
  }
  return value;
}

std::optional<long long> json_integer(const std::string &raw) {
  const std::string value = json_scalar(raw);
  if (value.empty()) {
    return std::nullopt;
  }
  long long parsed = 0;
  const auto *first = value.data();
  const auto *last = first + value.size();
  auto [ptr, ec] = std::from_chars(first, last, parsed);
  if (ec != std::errc() || ptr != last) {
    return std::nullopt;
  }
  return parsed;
}

std::vector<std::string> json_string_array(const std::string &array_json) {
  std::vector<std::string> out;
  for (const auto &element : json_array_elements(array_json)) {
    if (!element.empty() && element.front() == '"') {
      out.push_back(json_scalar(element));
    }
  }
  return out;
}

} // namespace hooktunnel::common
