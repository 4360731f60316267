/**
 * Zeroconf Service Advertisement Daemon
 * Copyright (C) 2024 The zeroconfd authors
 *
 * This program is free software: you can redistribute it and/or modify
 * it under the terms of the GNU General Public License as published by
 * the Free Software Foundation, either version 3 of the License, or
 * (at your option) any later version.
 *
 * This program is distributed in the hope that it will be useful,
 * but WITHOUT ANY WARRANTY; without even the implied warranty of
 * MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE.  See the
 * GNU General Public License for more details.
 *
 * You should have received a copy of the GNU General Public License
 * along with this program.  If not, see <https://www.gnu.org/licenses/>.
 */

#include "json.hpp"
#include <cerrno>
#include <cstdlib>
#include <string_view>

namespace zeroconfd {

enum class token_type_t {
  string = 1,
  number_int,
  number_double,
  boolean,
  null,
  lbracket = 10,
  rbracket,
  lbrace = 20,
  rbrace,
  comma = 30,
  colon,
  eof = 50,
};

struct token_t {
  std::string value;
  token_type_t type = token_type_t::eof;
};

constexpr int MAX_DEPTH = 256;

static bool is_digit(char c) { return c >= '0' && c <= '9'; }

class tokenizer_t {
public:
  const std::string &m_json;
  size_t m_pos = 0;
  int m_line = 1;
  size_t m_line_start_pos = 0;
  // where the last token returned by next_token starts
  size_t m_token_pos = 0;
  int m_token_line = 1;
  size_t m_token_line_start_pos = 0;

  tokenizer_t(const std::string &json) : m_json(json) {}

  token_t next_token();
  token_t peek_token();

  /// Error at the current read position
  [[noreturn]] void error(const std::string &msg) const {
    throw json_exception(m_line, int(m_pos - m_line_start_pos) + 1, msg);
  }
  /// Error at the start of the last token
  [[noreturn]] void token_error(const std::string &msg) const {
    throw json_exception(m_token_line,
                         int(m_token_pos - m_token_line_start_pos) + 1, msg);
  }

private:
  bool at_end() const { return m_pos >= m_json.size(); }
  char current() const { return at_end() ? '\0' : m_json[m_pos]; }
  void skip_whitespace();
  void read_literal(const char *literal, token_type_t type, token_t &ret);
  void read_string(token_t &ret);
  void read_number(token_t &ret);
  uint32_t read_hex4();
};

static void append_utf8(std::string &out, uint32_t codepoint) {
  if (codepoint < 0x80) {
    out += char(codepoint);
  } else if (codepoint < 0x800) {
    out += char(0xC0 | (codepoint >> 6));
    out += char(0x80 | (codepoint & 0x3F));
  } else if (codepoint < 0x10000) {
    out += char(0xE0 | (codepoint >> 12));
    out += char(0x80 | ((codepoint >> 6) & 0x3F));
    out += char(0x80 | (codepoint & 0x3F));
  } else {
    out += char(0xF0 | (codepoint >> 18));
    out += char(0x80 | ((codepoint >> 12) & 0x3F));
    out += char(0x80 | ((codepoint >> 6) & 0x3F));
    out += char(0x80 | (codepoint & 0x3F));
  }
}

void tokenizer_t::skip_whitespace() {
  while (!at_end()) {
    char c = m_json[m_pos];
    if (c == '\n') {
      m_line++;
      m_line_start_pos = m_pos + 1;
    } else if (c != ' ' && c != '\t' && c != '\r') {
      return;
    }
    m_pos++;
  }
}

void tokenizer_t::read_literal(const char *literal, token_type_t type,
                               token_t &ret) {
  std::string_view expected(literal);
  if (m_json.compare(m_pos, expected.size(), expected) != 0) {
    error(FMT::format("Invalid literal, expected {}", literal));
  }
  ret.type = type;
  ret.value = literal;
  m_pos += expected.size();
}

uint32_t tokenizer_t::read_hex4() {
  uint32_t value = 0;
  for (int i = 0; i < 4; i++) {
    char c = current();
    value <<= 4;
    if (c >= '0' && c <= '9') {
      value |= c - '0';
    } else if (c >= 'a' && c <= 'f') {
      value |= c - 'a' + 10;
    } else if (c >= 'A' && c <= 'F') {
      value |= c - 'A' + 10;
    } else {
      error("Invalid \\u escape");
    }
    m_pos++;
  }
  return value;
}

void tokenizer_t::read_string(token_t &ret) {
  ret.type = token_type_t::string;
  m_pos++; // opening quote
  while (true) {
    if (at_end()) {
      error("Unterminated string");
    }
    char c = m_json[m_pos];
    if (c == '"') {
      m_pos++;
      return;
    }
    if ((unsigned char)c < 0x20) {
      error("Control character in string");
    }
    if (c != '\\') {
      ret.value += c;
      m_pos++;
      continue;
    }

    m_pos++;
    char escaped = current();
    m_pos++;
    switch (escaped) {
    case '"':
      ret.value += '"';
      break;
    case '\\':
      ret.value += '\\';
      break;
    case '/':
      ret.value += '/';
      break;
    case 'b':
      ret.value += '\b';
      break;
    case 'f':
      ret.value += '\f';
      break;
    case 'n':
      ret.value += '\n';
      break;
    case 'r':
      ret.value += '\r';
      break;
    case 't':
      ret.value += '\t';
      break;
    case 'u': {
      uint32_t codepoint = read_hex4();
      if (codepoint >= 0xD800 && codepoint <= 0xDBFF) {
        // high surrogate, the low one must follow
        if (current() != '\\' || m_pos + 1 >= m_json.size() ||
            m_json[m_pos + 1] != 'u') {
          error("Unpaired surrogate in \\u escape");
        }
        m_pos += 2;
        uint32_t low = read_hex4();
        if (low < 0xDC00 || low > 0xDFFF) {
          error("Invalid low surrogate in \\u escape");
        }
        codepoint = 0x10000 + ((codepoint - 0xD800) << 10) + (low - 0xDC00);
      } else if (codepoint >= 0xDC00 && codepoint <= 0xDFFF) {
        error("Unpaired surrogate in \\u escape");
      }
      append_utf8(ret.value, codepoint);
    } break;
    default:
      m_pos--;
      error(FMT::format("Invalid escape \\{}", escaped));
    }
  }
}

void tokenizer_t::read_number(token_t &ret) {
  size_t start = m_pos;
  ret.type = token_type_t::number_int;

  if (current() == '-') {
    m_pos++;
  }
  if (!is_digit(current())) {
    error("Invalid number");
  }
  // no leading zeros
  if (current() == '0') {
    m_pos++;
  } else {
    while (is_digit(current())) {
      m_pos++;
    }
  }
  if (current() == '.') {
    ret.type = token_type_t::number_double;
    m_pos++;
    if (!is_digit(current())) {
      error("Invalid number, digits expected after '.'");
    }
    while (is_digit(current())) {
      m_pos++;
    }
  }
  if (current() == 'e' || current() == 'E') {
    ret.type = token_type_t::number_double;
    m_pos++;
    if (current() == '+' || current() == '-') {
      m_pos++;
    }
    if (!is_digit(current())) {
      error("Invalid number, digits expected in exponent");
    }
    while (is_digit(current())) {
      m_pos++;
    }
  }
  ret.value = m_json.substr(start, m_pos - start);
}

token_t tokenizer_t::next_token() {
  token_t ret;
  skip_whitespace();
  m_token_pos = m_pos;
  m_token_line = m_line;
  m_token_line_start_pos = m_line_start_pos;
  if (at_end()) {
    ret.type = token_type_t::eof;
    return ret;
  }

  char c = m_json[m_pos];
  switch (c) {
  case '[':
    ret.type = token_type_t::lbracket;
    break;
  case ']':
    ret.type = token_type_t::rbracket;
    break;
  case '{':
    ret.type = token_type_t::lbrace;
    break;
  case '}':
    ret.type = token_type_t::rbrace;
    break;
  case ',':
    ret.type = token_type_t::comma;
    break;
  case ':':
    ret.type = token_type_t::colon;
    break;
  case 't':
    read_literal("true", token_type_t::boolean, ret);
    return ret;
  case 'f':
    read_literal("false", token_type_t::boolean, ret);
    return ret;
  case 'n':
    read_literal("null", token_type_t::null, ret);
    return ret;
  case '"':
    read_string(ret);
    return ret;
  default:
    if (c == '-' || is_digit(c)) {
      read_number(ret);
      return ret;
    }
    error(FMT::format("Unexpected character '{}'", c));
  }
  // single char punctuation
  ret.value = std::string(1, c);
  m_pos++;
  return ret;
}

token_t tokenizer_t::peek_token() {
  auto saved = *this;
  auto token = next_token();
  m_pos = saved.m_pos;
  m_line = saved.m_line;
  m_line_start_pos = saved.m_line_start_pos;
  m_token_pos = saved.m_token_pos;
  m_token_line = saved.m_token_line;
  m_token_line_start_pos = saved.m_token_line_start_pos;
  return token;
}

static json_t parse_tokenizer(tokenizer_t &tokenizer, int depth) {
  if (depth > MAX_DEPTH) {
    tokenizer.token_error("Too deeply nested");
  }
  token_t token = tokenizer.next_token();
  switch (token.type) {
  case token_type_t::string:
    return json_t::from_string(token.value);
  case token_type_t::number_int: {
    errno = 0;
    auto value = std::strtoll(token.value.c_str(), nullptr, 10);
    if (errno == ERANGE) {
      tokenizer.token_error(
          FMT::format("Integer out of range: {}", token.value));
    }
    return json_t::from_int(value);
  }
  case token_type_t::number_double:
    return json_t::from_float(std::strtod(token.value.c_str(), nullptr));
  case token_type_t::boolean:
    return json_t::from_bool(token.value == "true");
  case token_type_t::null:
    return json_t();
  case token_type_t::lbracket: {
    auto ret = json_t::from_array();
    if (tokenizer.peek_token().type == token_type_t::rbracket) {
      tokenizer.next_token();
      return ret;
    }
    while (true) {
      ret.push_back(parse_tokenizer(tokenizer, depth + 1));

      token = tokenizer.next_token();
      if (token.type == token_type_t::rbracket) {
        return ret;
      }
      if (token.type != token_type_t::comma) {
        tokenizer.token_error("Expected ',' or ']'");
      }
    }
  }
  case token_type_t::lbrace: {
    auto ret = json_t::from_object();
    token = tokenizer.next_token();
    if (token.type == token_type_t::rbrace) {
      return ret;
    }
    while (true) {
      if (token.type != token_type_t::string) {
        tokenizer.token_error("Expected a string as object key");
      }
      std::string key = std::move(token.value);
      token = tokenizer.next_token();
      if (token.type != token_type_t::colon) {
        tokenizer.token_error("Expected ':'");
      }
      ret.insert(key, parse_tokenizer(tokenizer, depth + 1));

      token = tokenizer.next_token();
      if (token.type == token_type_t::rbrace) {
        return ret;
      }
      if (token.type != token_type_t::comma) {
        tokenizer.token_error("Expected ',' or '}'");
      }
      token = tokenizer.next_token();
    }
  }
  case token_type_t::eof:
    tokenizer.token_error("Unexpected end of data");
  default:
    tokenizer.token_error(FMT::format("Unexpected '{}'", token.value));
  }
}

json_t json_t::parse(const std::string &json) {
  tokenizer_t tokenizer(json);
  auto ret = parse_tokenizer(tokenizer, 0);
  if (tokenizer.next_token().type != token_type_t::eof) {
    tokenizer.token_error("Unexpected data after the end of the document");
  }
  return ret;
}

json_t json_t::from_bool(bool value) {
  json_t v;
  v.m_type = BOOL;
  v.m_bool = value;
  return v;
}

json_t json_t::from_int(int64_t value) {
  json_t v;
  v.m_type = INT;
  v.m_int = value;
  return v;
}

json_t json_t::from_float(double value) {
  json_t v;
  v.m_type = FLOAT;
  v.m_float = value;
  return v;
}

json_t json_t::from_string(const std::string &value) {
  json_t v;
  v.m_type = STRING;
  v.m_string = value;
  return v;
}

json_t json_t::from_array() {
  json_t v;
  v.m_type = ARRAY;
  return v;
}

json_t json_t::from_object() {
  json_t v;
  v.m_type = OBJECT;
  return v;
}

json_t json_t::dup() const {
  json_t v;
  v.m_type = m_type;
  v.m_bool = m_bool;
  v.m_int = m_int;
  v.m_float = m_float;
  v.m_string = m_string;
  for (auto &item : m_array) {
    v.m_array.push_back(item.dup());
  }
  for (auto &[key, value] : m_object) {
    v.m_object.emplace_back(key, value.dup());
  }
  return v;
}

const char *json_t::type_name() const {
  switch (m_type) {
  case NULL_:
    return "null";
  case BOOL:
    return "boolean";
  case INT:
    return "integer";
  case FLOAT:
    return "float";
  case STRING:
    return "string";
  case ARRAY:
    return "array";
  case OBJECT:
    return "object";
  }
  return "unknown";
}

static json_exception wrong_type(const json_t &value, const char *expected) {
  return json_exception(0, 0,
                        FMT::format("Expected {}, got {}", expected,
                                    value.type_name()));
}

bool json_t::as_bool() const {
  if (!is_bool())
    throw wrong_type(*this, "boolean");
  return m_bool;
}

int64_t json_t::as_int() const {
  if (!is_int())
    throw wrong_type(*this, "integer");
  return m_int;
}

double json_t::as_float() const {
  if (!is_float())
    throw wrong_type(*this, "float");
  return m_float;
}

double json_t::as_number() const {
  if (is_int())
    return double(m_int);
  if (is_float())
    return m_float;
  throw wrong_type(*this, "number");
}

const std::string &json_t::as_string() const {
  if (!is_string())
    throw wrong_type(*this, "string");
  return m_string;
}

const json_t::array_t &json_t::as_array() const {
  if (!is_array())
    throw wrong_type(*this, "array");
  return m_array;
}

json_t::array_t &json_t::as_array() {
  if (!is_array())
    throw wrong_type(*this, "array");
  return m_array;
}

const json_t::object_t &json_t::as_object() const {
  if (!is_object())
    throw wrong_type(*this, "object");
  return m_object;
}

json_t::object_t &json_t::as_object() {
  if (!is_object())
    throw wrong_type(*this, "object");
  return m_object;
}

void json_t::push_back(json_t &&value) {
  as_array().push_back(std::move(value));
}

void json_t::insert(const std::string &key, json_t &&value) {
  auto &object = as_object();
  for (auto &item : object) {
    if (item.first == key) {
      item.second = std::move(value);
      return;
    }
  }
  object.emplace_back(key, std::move(value));
}

const json_t *json_t::find(const std::string &key) const {
  if (!is_object()) {
    return nullptr;
  }
  for (auto &item : m_object) {
    if (item.first == key) {
      return &item.second;
    }
  }
  return nullptr;
}

const json_t &json_t::operator[](const std::string &key) const {
  auto *value = find(key);
  if (value == nullptr) {
    throw json_exception(0, 0, FMT::format("Missing key \"{}\"", key));
  }
  return *value;
}

const json_t &json_t::operator[](size_t index) const {
  auto &array = as_array();
  if (index >= array.size()) {
    throw json_exception(0, 0,
                         FMT::format("Index {} out of range, size {}", index,
                                     array.size()));
  }
  return array[index];
}

static std::string quote(const std::string &str) {
  std::string ret = "\"";
  for (char c : str) {
    switch (c) {
    case '"':
      ret += "\\\"";
      break;
    case '\\':
      ret += "\\\\";
      break;
    case '\n':
      ret += "\\n";
      break;
    case '\r':
      ret += "\\r";
      break;
    case '\t':
      ret += "\\t";
      break;
    default:
      if ((unsigned char)c < 0x20) {
        ret += FMT::format("\\u{:04x}", int(c));
      } else {
        ret += c;
      }
    }
  }
  ret += '"';
  return ret;
}

std::string json_t::to_string() const {
  switch (m_type) {
  case NULL_:
    return "null";
  case BOOL:
    return m_bool ? "true" : "false";
  case INT:
    return std::to_string(m_int);
  case FLOAT:
    return FMT::format("{}", m_float);
  case STRING:
    return quote(m_string);
  case ARRAY: {
    std::string s = "[";
    for (auto &v : m_array) {
      if (&v != &m_array.front())
        s += ", ";
      s += v.to_string();
    }
    return s + "]";
  }
  case OBJECT: {
    std::string s = "{";
    for (auto &v : m_object) {
      if (&v != &m_object.front())
        s += ", ";
      s += quote(v.first) + ": " + v.second.to_string();
    }
    return s + "}";
  }
  }
  return "unknown";
}

} // namespace zeroconfd
