#include "auton/jsonlite.hpp"

// Recursive-descent parser over a string_view. Errors are recorded once in
// Parser::err together with the byte offset; every parse_* routine checks
// err after each sub-parse and unwinds without throwing.

#include <cctype>
#include <cerrno>
#include <cstdio>
#include <cstdlib>
#include <string>

namespace auton::jsonlite {

namespace {

struct Parser {
  std::string_view s;
  size_t i{0};
  size_t depth{0};
  std::optional<JsonError> err;

  void fail(const char* code, const std::string& message) {
    if (!err) err = JsonError{code, message, i};
  }

  void ws() {
    while (i < s.size() && (s[i] == ' ' || s[i] == '\t' || s[i] == '\n' || s[i] == '\r')) ++i;
  }
  bool eat(char c) {
    ws();
    if (i < s.size() && s[i] == c) {
      ++i;
      return true;
    }
    return false;
  }

  static int hex_value(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
  }

  bool parse_hex4(unsigned& out) {
    if (i + 4 > s.size()) {
      fail("json_parse_error", "truncated \\u escape");
      return false;
    }
    out = 0;
    for (int k = 0; k < 4; ++k) {
      const int h = hex_value(s[i++]);
      if (h < 0) {
        fail("json_parse_error", "invalid \\u escape");
        return false;
      }
      out = (out << 4) | static_cast<unsigned>(h);
    }
    return true;
  }

  static void append_utf8(std::string& o, unsigned cp) {
    if (cp < 0x80) {
      o += static_cast<char>(cp);
    } else if (cp < 0x800) {
      o += static_cast<char>(0xC0 | (cp >> 6));
      o += static_cast<char>(0x80 | (cp & 0x3F));
    } else if (cp < 0x10000) {
      o += static_cast<char>(0xE0 | (cp >> 12));
      o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      o += static_cast<char>(0x80 | (cp & 0x3F));
    } else {
      o += static_cast<char>(0xF0 | (cp >> 18));
      o += static_cast<char>(0x80 | ((cp >> 12) & 0x3F));
      o += static_cast<char>(0x80 | ((cp >> 6) & 0x3F));
      o += static_cast<char>(0x80 | (cp & 0x3F));
    }
  }

  std::string parse_string() {
    if (!eat('"')) {
      fail("json_parse_error", "expected string");
      return {};
    }
    std::string o;
    while (i < s.size()) {
      const char c = s[i++];
      if (c == '"') return o;
      if (static_cast<unsigned char>(c) < 0x20) {
        fail("json_parse_error", "raw control character in string");
        return {};
      }
      if (c != '\\') {
        o += c;
        continue;
      }
      if (i >= s.size()) break;
      const char n = s[i++];
      switch (n) {
        case '"': o += '"'; break;
        case '\\': o += '\\'; break;
        case '/': o += '/'; break;
        case 'n': o += '\n'; break;
        case 't': o += '\t'; break;
        case 'r': o += '\r'; break;
        case 'b': o += '\b'; break;
        case 'f': o += '\f'; break;
        case 'u': {
          unsigned cp = 0;
          if (!parse_hex4(cp)) return {};
          if (cp >= 0xD800 && cp <= 0xDBFF) {
            unsigned lo = 0;
            if (i + 2 <= s.size() && s[i] == '\\' && s[i + 1] == 'u') {
              i += 2;
              if (!parse_hex4(lo)) return {};
            }
            if (lo < 0xDC00 || lo > 0xDFFF) {
              fail("json_parse_error", "unpaired surrogate");
              return {};
            }
            cp = 0x10000 + ((cp - 0xD800) << 10) + (lo - 0xDC00);
          }
          append_utf8(o, cp);
          break;
        }
        default:
          fail("json_parse_error", std::string("invalid escape \\") + n);
          return {};
      }
    }
    fail("json_parse_error", "unterminated string");
    return {};
  }

  bool parse_number(Value& out_val) {
    ws();
    const size_t start = i;
    if (s.compare(i, 3, "NaN") == 0 || s.compare(i, 8, "Infinity") == 0 ||
        s.compare(i, 9, "-Infinity") == 0) {
      fail("json_parse_error", "NaN/Infinity unsupported");
      return false;
    }
    bool negative = false;
    if (i < s.size() && s[i] == '-') {
      negative = true;
      ++i;
    }
    if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) return false;
    while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;

    bool integral = true;
    if (i < s.size() && s[i] == '.') {
      integral = false;
      ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("json_parse_error", "invalid number format");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }
    if (i < s.size() && (s[i] == 'e' || s[i] == 'E')) {
      integral = false;
      ++i;
      if (i < s.size() && (s[i] == '+' || s[i] == '-')) ++i;
      if (i >= s.size() || !std::isdigit(static_cast<unsigned char>(s[i]))) {
        fail("json_parse_error", "invalid exponent");
        return false;
      }
      while (i < s.size() && std::isdigit(static_cast<unsigned char>(s[i]))) ++i;
    }

    const std::string num(s.substr(start, i - start));
    errno = 0;
    if (integral && !negative) {
      char* end = nullptr;
      const unsigned long long u = std::strtoull(num.c_str(), &end, 10);
      if (errno == 0) {
        out_val = Value{static_cast<std::uint64_t>(u)};
        return true;
      }
      errno = 0;
    }
    // Negative integers, fractions and integers beyond u64 become double.
    char* end = nullptr;
    const double d = std::strtod(num.c_str(), &end);
    if (errno == ERANGE || end != num.c_str() + num.size()) {
      fail("json_parse_error", "number out of range");
      return false;
    }
    out_val = Value{d};
    return true;
  }

  Value parse_value() {
    ws();
    if (i >= s.size()) {
      fail("json_parse_error", "unexpected eof");
      return {};
    }
    if (s[i] == '{' || s[i] == '[') {
      if (++depth > kMaxDepth) {
        fail("json_parse_error", "nesting too deep");
        return {};
      }
      Value out = s[i] == '{' ? Value{parse_object()} : Value{parse_array()};
      --depth;
      return out;
    }
    if (s[i] == '"') return Value{parse_string()};
    if (s.compare(i, 4, "true") == 0) { i += 4; return Value{true}; }
    if (s.compare(i, 5, "false") == 0) { i += 5; return Value{false}; }
    if (s.compare(i, 4, "null") == 0) { i += 4; return Value{nullptr}; }
    Value num_val;
    if (parse_number(num_val)) return num_val;
    fail("json_parse_error", "unexpected token");
    return {};
  }

  Object parse_object() {
    Object out;
    eat('{');
    if (eat('}')) return out;
    while (!err) {
      auto k = parse_string();
      if (err) break;
      if (out.contains(k)) {
        fail("json_duplicate_key", "duplicate key: " + k);
        break;
      }
      if (!eat(':')) {
        fail("json_parse_error", "expected :");
        break;
      }
      out[k] = parse_value();
      if (err) break;
      if (eat('}')) break;
      if (!eat(',')) {
        fail("json_parse_error", "expected ,");
        break;
      }
    }
    return out;
  }

  Array parse_array() {
    Array out;
    eat('[');
    if (eat(']')) return out;
    while (!err) {
      out.push_back(parse_value());
      if (err) break;
      if (eat(']')) break;
      if (!eat(',')) {
        fail("json_parse_error", "expected ,");
        break;
      }
    }
    return out;
  }

  Value parse_document() {
    Value v = parse_value();
    ws();
    if (!err && i != s.size()) fail("json_parse_error", "trailing data");
    return v;
  }
};

constexpr char kHexChars[] = "0123456789abcdef";

}  // namespace

std::string escape(std::string_view s) {
  bool needs_escape = false;
  for (unsigned char c : s) {
    if (c == '"' || c == '\\' || c < 0x20) {
      needs_escape = true;
      break;
    }
  }
  if (!needs_escape) return std::string(s);

  std::string o;
  o.reserve(s.size() + s.size() / 4 + 4);
  for (char c : s) {
    const auto uc = static_cast<unsigned char>(c);
    if (c == '"') o += "\\\"";
    else if (c == '\\') o += "\\\\";
    else if (c == '\b') o += "\\b";
    else if (c == '\f') o += "\\f";
    else if (c == '\n') o += "\\n";
    else if (c == '\r') o += "\\r";
    else if (c == '\t') o += "\\t";
    else if (uc < 0x20) {
      o += "\\u00";
      o += kHexChars[uc >> 4];
      o += kHexChars[uc & 0x0f];
    } else {
      o += c;
    }
  }
  return o;
}

std::string format_double(double d) {
  char buf[64];
  int n = std::snprintf(buf, sizeof(buf), "%.6f", d);
  if (n <= 0 || n >= static_cast<int>(sizeof(buf))) return "0.0";
  std::string result(buf, static_cast<size_t>(n));
  while (!result.empty() && result.back() == '0') result.pop_back();
  if (!result.empty() && result.back() == '.') result.push_back('0');
  return result;
}

std::string to_json(const Value& v) {
  if (std::holds_alternative<std::nullptr_t>(v.v)) return "null";
  if (std::holds_alternative<bool>(v.v)) return std::get<bool>(v.v) ? "true" : "false";
  if (std::holds_alternative<std::string>(v.v)) return "\"" + escape(std::get<std::string>(v.v)) + "\"";
  if (std::holds_alternative<std::uint64_t>(v.v)) return std::to_string(std::get<std::uint64_t>(v.v));
  if (std::holds_alternative<double>(v.v)) return format_double(std::get<double>(v.v));
  std::string out;
  if (std::holds_alternative<Object>(v.v)) {
    out += '{';
    bool first = true;
    for (const auto& [k, vv] : std::get<Object>(v.v)) {
      if (!first) out += ',';
      first = false;
      out += '"';
      out += escape(k);
      out += "\":";
      out += to_json(vv);
    }
    out += '}';
    return out;
  }
  out += '[';
  bool first = true;
  for (const auto& vv : std::get<Array>(v.v)) {
    if (!first) out += ',';
    first = false;
    out += to_json(vv);
  }
  out += ']';
  return out;
}

std::optional<Value> parse_value(std::string_view text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.parse_document();
  if (error) *error = p.err;
  if (p.err) return std::nullopt;
  return v;
}

Object parse(std::string_view text, std::optional<JsonError>* error) {
  Parser p{text};
  Value v = p.parse_document();
  if (!p.err && !std::holds_alternative<Object>(v.v)) {
    p.err = JsonError{"json_parse_error", "top level is not an object", 0};
  }
  if (error) *error = p.err;
  if (p.err) return {};
  return std::get<Object>(std::move(v.v));
}

std::optional<JsonError> validate_strict(std::string_view text) {
  Parser p{text};
  (void)p.parse_document();
  return p.err;
}

std::string canonicalize_json(std::string_view text, std::optional<JsonError>* error) {
  auto v = parse_value(text, error);
  if (!v) return {};
  return to_json(*v);
}

bool has_key(const Object& obj, const std::string& key) {
  return obj.find(key) != obj.end();
}

std::string get_string(const Object& obj, const std::string& key, const std::string& def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::string>(it->second.v)) return def;
  return std::get<std::string>(it->second.v);
}

bool get_bool(const Object& obj, const std::string& key, bool def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<bool>(it->second.v)) return def;
  return std::get<bool>(it->second.v);
}

std::uint64_t get_u64(const Object& obj, const std::string& key, std::uint64_t def) {
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<std::uint64_t>(it->second.v)) return def;
  return std::get<std::uint64_t>(it->second.v);
}

std::int64_t get_i64(const Object& obj, const std::string& key, std::int64_t def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<std::uint64_t>(it->second.v)) {
    return static_cast<std::int64_t>(std::get<std::uint64_t>(it->second.v));
  }
  if (std::holds_alternative<double>(it->second.v)) {
    return static_cast<std::int64_t>(std::get<double>(it->second.v));
  }
  return def;
}

double get_double(const Object& obj, const std::string& key, double def) {
  auto it = obj.find(key);
  if (it == obj.end()) return def;
  if (std::holds_alternative<double>(it->second.v)) return std::get<double>(it->second.v);
  if (std::holds_alternative<std::uint64_t>(it->second.v)) {
    return static_cast<double>(std::get<std::uint64_t>(it->second.v));
  }
  return def;
}

std::vector<std::string> get_string_array(const Object& obj, const std::string& key) {
  std::vector<std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Array>(it->second.v)) return out;
  for (const auto& item : std::get<Array>(it->second.v)) {
    if (std::holds_alternative<std::string>(item.v)) {
      out.push_back(std::get<std::string>(item.v));
    }
  }
  return out;
}

std::map<std::string, std::string> get_string_map(const Object& obj, const std::string& key) {
  std::map<std::string, std::string> out;
  auto it = obj.find(key);
  if (it == obj.end() || !std::holds_alternative<Object>(it->second.v)) return out;
  for (const auto& [k, v] : std::get<Object>(it->second.v)) {
    if (std::holds_alternative<std::string>(v.v)) out[k] = std::get<std::string>(v.v);
  }
  return out;
}

const Object* get_object(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<Object>(&it->second.v);
}

const Array* get_array(const Object& obj, const std::string& key) {
  auto it = obj.find(key);
  if (it == obj.end()) return nullptr;
  return std::get_if<Array>(&it->second.v);
}

Array to_array(const std::vector<std::string>& items) {
  Array out;
  out.reserve(items.size());
  for (const auto& s : items) out.emplace_back(s);
  return out;
}

Object to_object(const std::map<std::string, std::string>& items) {
  Object out;
  for (const auto& [k, v] : items) out[k] = Value{v};
  return out;
}

}  // namespace auton::jsonlite
