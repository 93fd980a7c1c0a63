#include "tapbridge/common/json_util.hpp"

#include <cctype>
#include <cstdint>

namespace tapbridge::common {

namespace {

void append_utf8(std::string &out, const std::uint32_t code_point) {
  if (code_point < 0x80u) {
    out.push_back(static_cast<char>(code_point));
  } else if (code_point < 0x800u) {
    out.push_back(static_cast<char>(0xC0u | (code_point >> 6u)));
    out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
  } else {
    out.push_back(static_cast<char>(0xE0u | (code_point >> 12u)));
    out.push_back(static_cast<char>(0x80u | ((code_point >> 6u) & 0x3Fu)));
    out.push_back(static_cast<char>(0x80u | (code_point & 0x3Fu)));
  }
}

int hex_value(const char ch) {
  if (ch >= '0' && ch <= '9') {
    return ch - '0';
  }
  if (ch >= 'a' && ch <= 'f') {
    return ch - 'a' + 10;
  }
  if (ch >= 'A' && ch <= 'F') {
    return ch - 'A' + 10;
  }
  return -1;
}

// End (exclusive) of the JSON value starting at pos, npos when it is unterminated.
std::size_t value_end(const std::string &json, const std::size_t pos) {
  if (pos >= json.size()) {
    return std::string::npos;
  }
  const char ch = json[pos];
  if (ch == '"') {
    const auto end = json_find_string_end(json, pos);
    return end == std::string::npos ? end : end + 1;
  }
  if (ch == '{' || ch == '[') {
    const auto end = json_find_matching_token(json, pos, ch, ch == '{' ? '}' : ']');
    return end == std::string::npos ? end : end + 1;
  }
  std::size_t cursor = pos;
  while (cursor < json.size()) {
    const char c = json[cursor];
    if (c == ',' || c == '}' || c == ']' || std::isspace(static_cast<unsigned char>(c)) != 0) {
      break;
    }
    ++cursor;
  }
  return cursor;
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
      if (static_cast<unsigned char>(ch) < 0x20u) {
        static constexpr char kHex[] = "0123456789abcdef";
        escaped += "\\u00";
        escaped.push_back(kHex[(static_cast<unsigned char>(ch) >> 4u) & 0x0Fu]);
        escaped.push_back(kHex[static_cast<unsigned char>(ch) & 0x0Fu]);
      } else {
        escaped.push_back(ch);
      }
      break;
    }
  }
  return escaped;
}

std::string json_quote(const std::string &value) { return "\"" + json_escape(value) + "\""; }

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
      if (i + 4 >= raw.size()) {
        out.push_back(next);
        break;
      }
      std::uint32_t code_point = 0;
      bool valid = true;
      for (std::size_t k = 1; k <= 4; ++k) {
        const int digit = hex_value(raw[i + k]);
        if (digit < 0) {
          valid = false;
          break;
        }
        code_point = (code_point << 4u) | static_cast<std::uint32_t>(digit);
      }
      if (!valid) {
        out.push_back(next);
        break;
      }
      append_utf8(out, code_point);
      i += 4;
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

std::size_t json_find_string_end(const std::string &json, std::size_t quote_pos) {
  bool escaped = false;
  for (std::size_t i = quote_pos + 1; i < json.size(); ++i) {
    const char ch = json[i];
    if (!escaped && ch == '"') {
      return i;
    }
    if (!escaped && ch == '\\') {
      escaped = true;
      continue;
    }
    escaped = false;
  }
  return std::string::npos;
}

std::size_t json_find_matching_token(const std::string &json, std::size_t open_pos,
                                      const char open_ch, const char close_ch) {
  if (open_pos >= json.size() || json[open_pos] != open_ch) {
    return std::string::npos;
  }
  std::size_t depth = 0;
  bool in_string = false;
  bool escaped = false;
  for (std::size_t i = open_pos; i < json.size(); ++i) {
    const char ch = json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == open_ch) {
      ++depth;
    } else if (ch == close_ch) {
      if (depth == 0) {
        return std::string::npos;
      }
      --depth;
      if (depth == 0) {
        return i;
      }
    }
  }
  return std::string::npos;
}

std::optional<std::string> json_get_raw(const std::string &json, const std::string &field) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return std::nullopt;
  }
  ++pos;

  while (pos < json.size()) {
    pos = json_skip_ws(json, pos);
    if (pos >= json.size() || json[pos] == '}') {
      break;
    }
    if (json[pos] == ',') {
      ++pos;
      continue;
    }
    if (json[pos] != '"') {
      return std::nullopt;
    }
    const auto key_end = json_find_string_end(json, pos);
    if (key_end == std::string::npos) {
      return std::nullopt;
    }
    const std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1);
    if (pos >= json.size() || json[pos] != ':') {
      return std::nullopt;
    }
    pos = json_skip_ws(json, pos + 1);
    const auto end = value_end(json, pos);
    if (end == std::string::npos || end <= pos) {
      return std::nullopt;
    }
    if (key == field) {
      return json.substr(pos, end - pos);
    }
    pos = end;
  }
  return std::nullopt;
}

bool json_has(const std::string &json, const std::string &field) {
  return json_get_raw(json, field).has_value();
}

std::optional<std::string> json_get_optional_string(const std::string &json,
                                                    const std::string &field) {
  const auto raw = json_get_raw(json, field);
  if (!raw.has_value() || raw->size() < 2 || raw->front() != '"') {
    return std::nullopt;
  }
  return json_unescape(raw->substr(1, raw->size() - 2));
}

std::string json_get_string(const std::string &json, const std::string &field) {
  return json_get_optional_string(json, field).value_or("");
}

std::string json_get_number(const std::string &json, const std::string &field) {
  const auto raw = json_get_raw(json, field);
  if (!raw.has_value() || raw->empty()) {
    return "";
  }
  const char first = raw->front();
  if (first != '-' && std::isdigit(static_cast<unsigned char>(first)) == 0) {
    return "";
  }
  return *raw;
}

std::optional<bool> json_get_bool(const std::string &json, const std::string &field) {
  const auto raw = json_get_raw(json, field);
  if (!raw.has_value()) {
    return std::nullopt;
  }
  if (*raw == "true") {
    return true;
  }
  if (*raw == "false") {
    return false;
  }
  return std::nullopt;
}

std::string json_get_object(const std::string &json, const std::string &field) {
  const auto raw = json_get_raw(json, field);
  if (!raw.has_value() || raw->front() != '{') {
    return "";
  }
  return *raw;
}

std::string json_get_array(const std::string &json, const std::string &field) {
  const auto raw = json_get_raw(json, field);
  if (!raw.has_value() || raw->front() != '[') {
    return "";
  }
  return *raw;
}

std::vector<std::string> json_get_string_array(const std::string &json, const std::string &field) {
  const std::string array_str = json_get_array(json, field);
  if (array_str.empty()) {
    return {};
  }

  std::vector<std::string> out;
  std::size_t pos = 1; // skip opening [
  while (pos < array_str.size()) {
    pos = json_skip_ws(array_str, pos);
    if (pos >= array_str.size() || array_str[pos] == ']') {
      break;
    }
    if (array_str[pos] == ',') {
      ++pos;
      continue;
    }
    if (array_str[pos] == '"') {
      const auto end = json_find_string_end(array_str, pos);
      if (end == std::string::npos || end <= pos) {
        break;
      }
      out.push_back(json_unescape(array_str.substr(pos + 1, end - pos - 1)));
      pos = end + 1;
    } else {
      ++pos;
    }
  }
  return out;
}

std::vector<std::string> json_split_top_level_objects(const std::string &array_json) {
  std::vector<std::string> out;
  if (array_json.size() < 2 || array_json.front() != '[' || array_json.back() != ']') {
    return out;
  }

  bool in_string = false;
  bool escaped = false;
  std::size_t depth = 0;
  std::size_t current_start = std::string::npos;
  for (std::size_t i = 1; i + 1 < array_json.size(); ++i) {
    const char ch = array_json[i];
    if (in_string) {
      if (!escaped && ch == '"') {
        in_string = false;
      } else if (!escaped && ch == '\\') {
        escaped = true;
        continue;
      }
      escaped = false;
      continue;
    }
    if (ch == '"') {
      in_string = true;
      escaped = false;
      continue;
    }
    if (ch == '{') {
      if (depth == 0) {
        current_start = i;
      }
      ++depth;
      continue;
    }
    if (ch == '}') {
      if (depth == 0) {
        continue;
      }
      --depth;
      if (depth == 0 && current_start != std::string::npos) {
        out.push_back(array_json.substr(current_start, i - current_start + 1));
        current_start = std::string::npos;
      }
    }
  }
  return out;
}

} // namespace tapbridge::common
