#include "convlog/common/json_util.hpp"

#include <cctype>
#include <cstdint>

namespace convlog::common {

namespace {

constexpr std::size_t MAX_NESTING_DEPTH = 512;
constexpr const char *HEX_DIGITS = "0123456789abcdef";

bool is_hex(const char ch) { return std::isxdigit(static_cast<unsigned char>(ch)) != 0; }

bool is_digit(const char ch) { return ch >= '0' && ch <= '9'; }

std::uint32_t parse_hex4(const std::string &text, const std::size_t pos) {
  std::uint32_t value = 0;
  for (std::size_t i = pos; i < pos + 4; ++i) {
    const char ch = text[i];
    value <<= 4U;
    if (ch >= '0' && ch <= '9') {
      value |= static_cast<std::uint32_t>(ch - '0');
    } else if (ch >= 'a' && ch <= 'f') {
      value |= static_cast<std::uint32_t>(ch - 'a' + 10);
    } else {
      value |= static_cast<std::uint32_t>(ch - 'A' + 10);
    }
  }
  return value;
}

void append_utf8(std::string &out, const std::uint32_t cp) {
  if (cp < 0x80) {
    out.push_back(static_cast<char>(cp));
  } else if (cp < 0x800) {
    out.push_back(static_cast<char>(0xC0 | (cp >> 6U)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3FU)));
  } else if (cp < 0x10000) {
    out.push_back(static_cast<char>(0xE0 | (cp >> 12U)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3FU)));
  } else {
    out.push_back(static_cast<char>(0xF0 | (cp >> 18U)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 12U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80 | ((cp >> 6U) & 0x3FU)));
    out.push_back(static_cast<char>(0x80 | (cp & 0x3FU)));
  }
}

std::size_t scan_string(const std::string &text, std::size_t pos) {
  if (pos >= text.size() || text[pos] != '"') {
    return std::string::npos;
  }
  for (std::size_t i = pos + 1; i < text.size(); ++i) {
    const auto ch = static_cast<unsigned char>(text[i]);
    if (ch == '"') {
      return i + 1;
    }
    if (ch < 0x20) {
      return std::string::npos;
    }
    if (ch != '\\') {
      continue;
    }
    if (i + 1 >= text.size()) {
      return std::string::npos;
    }
    const char esc = text[i + 1];
    if (esc == 'u') {
      if (i + 5 >= text.size() || !is_hex(text[i + 2]) || !is_hex(text[i + 3]) ||
          !is_hex(text[i + 4]) || !is_hex(text[i + 5])) {
        return std::string::npos;
      }
      i += 5;
      continue;
    }
    if (esc != '"' && esc != '\\' && esc != '/' && esc != 'b' && esc != 'f' && esc != 'n' &&
        esc != 'r' && esc != 't') {
      return std::string::npos;
    }
    ++i;
  }
  return std::string::npos;
}

std::size_t scan_number(const std::string &text, std::size_t pos) {
  if (pos < text.size() && text[pos] == '-') {
    ++pos;
  }
  if (pos >= text.size()) {
    return std::string::npos;
  }
  if (text[pos] == '0') {
    ++pos;
  } else if (is_digit(text[pos])) {
    while (pos < text.size() && is_digit(text[pos])) {
      ++pos;
    }
  } else {
    return std::string::npos;
  }
  if (pos < text.size() && text[pos] == '.') {
    ++pos;
    if (pos >= text.size() || !is_digit(text[pos])) {
      return std::string::npos;
    }
    while (pos < text.size() && is_digit(text[pos])) {
      ++pos;
    }
  }
  if (pos < text.size() && (text[pos] == 'e' || text[pos] == 'E')) {
    ++pos;
    if (pos < text.size() && (text[pos] == '+' || text[pos] == '-')) {
      ++pos;
    }
    if (pos >= text.size() || !is_digit(text[pos])) {
      return std::string::npos;
    }
    while (pos < text.size() && is_digit(text[pos])) {
      ++pos;
    }
  }
  return pos;
}

std::size_t scan_literal(const std::string &text, std::size_t pos, const std::string &word) {
  if (text.compare(pos, word.size(), word) != 0) {
    return std::string::npos;
  }
  return pos + word.size();
}

std::size_t scan_value(const std::string &text, std::size_t pos, std::size_t depth);

std::size_t scan_object(const std::string &text, std::size_t pos, const std::size_t depth) {
  pos = json_skip_ws(text, pos + 1);
  if (pos < text.size() && text[pos] == '}') {
    return pos + 1;
  }
  while (pos < text.size()) {
    pos = scan_string(text, pos);
    if (pos == std::string::npos) {
      return pos;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size() || text[pos] != ':') {
      return std::string::npos;
    }
    pos = scan_value(text, json_skip_ws(text, pos + 1), depth + 1);
    if (pos == std::string::npos) {
      return pos;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return std::string::npos;
    }
    if (text[pos] == '}') {
      return pos + 1;
    }
    if (text[pos] != ',') {
      return std::string::npos;
    }
    pos = json_skip_ws(text, pos + 1);
  }
  return std::string::npos;
}

std::size_t scan_array(const std::string &text, std::size_t pos, const std::size_t depth) {
  pos = json_skip_ws(text, pos + 1);
  if (pos < text.size() && text[pos] == ']') {
    return pos + 1;
  }
  while (pos < text.size()) {
    pos = scan_value(text, pos, depth + 1);
    if (pos == std::string::npos) {
      return pos;
    }
    pos = json_skip_ws(text, pos);
    if (pos >= text.size()) {
      return std::string::npos;
    }
    if (text[pos] == ']') {
      return pos + 1;
    }
    if (text[pos] != ',') {
      return std::string::npos;
    }
    pos = json_skip_ws(text, pos + 1);
  }
  return std::string::npos;
}

std::size_t scan_value(const std::string &text, std::size_t pos, const std::size_t depth) {
  if (depth > MAX_NESTING_DEPTH || pos >= text.size()) {
    return std::string::npos;
  }
  switch (text[pos]) {
  case '{':
    return scan_object(text, pos, depth);
  case '[':
    return scan_array(text, pos, depth);
  case '"':
    return scan_string(text, pos);
  case 't':
    return scan_literal(text, pos, "true");
  case 'f':
    return scan_literal(text, pos, "false");
  case 'n':
    return scan_literal(text, pos, "null");
  default:
    return scan_number(text, pos);
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
    case '\b':
      escaped += "\\b";
      break;
    case '\f':
      escaped += "\\f";
      break;
    default:
      if (static_cast<unsigned char>(ch) < 0x20) {
        const auto byte = static_cast<unsigned char>(ch);
        escaped += "\\u00";
        escaped.push_back(HEX_DIGITS[byte >> 4U]);
        escaped.push_back(HEX_DIGITS[byte & 0x0FU]);
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
    const char esc = raw[++i];
    switch (esc) {
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
      if (i + 4 >= raw.size() || !is_hex(raw[i + 1]) || !is_hex(raw[i + 2]) ||
          !is_hex(raw[i + 3]) || !is_hex(raw[i + 4])) {
        out += "\\u";
        break;
      }
      std::uint32_t cp = parse_hex4(raw, i + 1);
      i += 4;
      if (cp >= 0xD800 && cp <= 0xDBFF && i + 6 < raw.size() && raw[i + 1] == '\\' &&
          raw[i + 2] == 'u' && is_hex(raw[i + 3]) && is_hex(raw[i + 4]) && is_hex(raw[i + 5]) &&
          is_hex(raw[i + 6])) {
        const std::uint32_t low = parse_hex4(raw, i + 3);
        if (low >= 0xDC00 && low <= 0xDFFF) {
          cp = 0x10000 + ((cp - 0xD800) << 10U) + (low - 0xDC00);
          i += 6;
        }
      }
      if (cp >= 0xD800 && cp <= 0xDFFF) {
        cp = 0xFFFD;
      }
      append_utf8(out, cp);
      break;
    }
    default:
      out.push_back(esc);
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

std::size_t json_scan_value(const std::string &text, std::size_t pos) {
  return scan_value(text, pos, 0);
}

bool json_is_valid(const std::string &text) {
  const std::size_t start = json_skip_ws(text, 0);
  const std::size_t end = json_scan_value(text, start);
  if (end == std::string::npos) {
    return false;
  }
  return json_skip_ws(text, end) == text.size();
}

std::string json_compact(const std::string &json) {
  std::string out;
  out.reserve(json.size());
  for (std::size_t i = 0; i < json.size(); ++i) {
    const char ch = json[i];
    if (ch == '"') {
      const std::size_t end = json_find_string_end(json, i);
      if (end == std::string::npos) {
        out.append(json, i, std::string::npos);
        break;
      }
      out.append(json, i, end - i + 1);
      i = end;
      continue;
    }
    if (ch == ' ' || ch == '\t' || ch == '\n' || ch == '\r') {
      continue;
    }
    out.push_back(ch);
  }
  return out;
}

std::optional<JsonMembers> json_object_members(const std::string &json) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '{') {
    return std::nullopt;
  }
  const std::size_t end = json_scan_value(json, pos);
  if (end == std::string::npos || json_skip_ws(json, end) != json.size()) {
    return std::nullopt;
  }

  // The object is well-formed from here on, so the walk below only has to slice it.
  JsonMembers members;
  pos = json_skip_ws(json, pos + 1);
  while (pos < end && json[pos] != '}') {
    const std::size_t key_end = json_find_string_end(json, pos);
    std::string key = json_unescape(json.substr(pos + 1, key_end - pos - 1));
    pos = json_skip_ws(json, key_end + 1) + 1; // past ':'
    pos = json_skip_ws(json, pos);
    const std::size_t value_end = json_scan_value(json, pos);
    members.emplace_back(std::move(key), json.substr(pos, value_end - pos));
    pos = json_skip_ws(json, value_end);
    if (json[pos] == ',') {
      pos = json_skip_ws(json, pos + 1);
    }
  }
  return members;
}

std::optional<std::vector<std::string>> json_array_elements(const std::string &json) {
  std::size_t pos = json_skip_ws(json, 0);
  if (pos >= json.size() || json[pos] != '[') {
    return std::nullopt;
  }
  const std::size_t end = json_scan_value(json, pos);
  if (end == std::string::npos || json_skip_ws(json, end) != json.size()) {
    return std::nullopt;
  }

  std::vector<std::string> elements;
  pos = json_skip_ws(json, pos + 1);
  while (pos < end && json[pos] != ']') {
    const std::size_t value_end = json_scan_value(json, pos);
    elements.push_back(json.substr(pos, value_end - pos));
    pos = json_skip_ws(json, value_end);
    if (json[pos] == ',') {
      pos = json_skip_ws(json, pos + 1);
    }
  }
  return elements;
}

std::optional<std::string> json_string_value(const std::string &raw) {
  const std::size_t start = json_skip_ws(raw, 0);
  const std::size_t end = scan_string(raw, start);
  if (end == std::string::npos || json_skip_ws(raw, end) != raw.size()) {
    return std::nullopt;
  }
  return json_unescape(raw.substr(start + 1, end - start - 2));
}

const std::string *json_find_member(const JsonMembers &members, const std::string &key) {
  for (const auto &[name, value] : members) {
    if (name == key) {
      return &value;
    }
  }
  return nullptr;
}

} // namespace convlog::common
